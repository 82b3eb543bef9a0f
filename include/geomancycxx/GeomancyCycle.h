// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// One polling cycle
//
// Pipeline: wait for report start → assemble → table → classify → select → render

#pragma once

#include "CandidateSelector.h"
#include "DirectionClassifier.h"
#include "GSVAssembler.h"
#include "GeomancyRenderer.h"
#include "LineSource.h"
#include "NMEASentence.h"
#include "SatelliteTable.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace geomancy
{

struct CycleResult
{
    enum class Status { OK, MISSING_DIRECTION, CANCELLED, CLOSED, TRANSPORT_ERROR };

    Status status = Status::OK;
    SatelliteTable table;
    std::vector<ClassifiedSatellite> classified;
    ChosenFour chosen;
    std::string diagram;    // set only when status is OK
};

class GeomancyCycle
{
public:
    using diagnostic_t = std::function<void(const std::string&)>;

    explicit GeomancyCycle(std::string talker = default_talker, diagnostic_t diagnostic = nullptr)
    : talker_(std::move(talker)), diagnostic_(std::move(diagnostic)), assembler_(talker_, diagnostic_)
    {}

    /**
     * Read until a complete satellite-view report has been assembled.
     *
     * Frame errors and broken reports are logged and skipped. Timeouts
     * are waited through. A report start that interrupted the previous
     * group is assembled next. Returns OK with the group filled, or the reader
     * status (CANCELLED, CLOSED, ERROR) that ended the wait.
     */
    ReadResult wait_for_report(const line_reader_t& reader, SatelliteGroup& group)
    {
        const std::string prefix = sentence_prefix(talker_, gsv_type);
        std::string line;

        for (;;)
        {
            RawSentence first;
            if (auto restart = assembler_.take_restart())
            {
                first = std::move(*restart);
            }
            else
            {
                auto status = reader(line);
                if (status == ReadResult::TIMEOUT) continue;
                if (status != ReadResult::OK) return status;

                if (!has_prefix(line, prefix)) continue;

                auto decoded = decoder_(line, first);
                if (decoded != SentenceDecoder::DecodeResult::OK)
                {
                    log(std::string("frame error: ") + SentenceDecoder::result_name(decoded));
                    continue;
                }
            }

            auto header = read_gsv_header(first);
            if (!header || header->index != 1) continue;    // joined mid-report

            auto assembled = assembler_(first, reader, group);
            switch (assembled)
            {
            case GSVAssembler::AssembleResult::OK:
                if (assembler_.placeholders())
                {
                    log(std::to_string(assembler_.placeholders()) + " of "
                        + std::to_string(header->total) + " GSV sentences lost");
                }
                return ReadResult::OK;
            case GSVAssembler::AssembleResult::CANCELLED:
                return ReadResult::CANCELLED;
            case GSVAssembler::AssembleResult::TRANSPORT_ERROR:
                return ReadResult::ERROR;
            case GSVAssembler::AssembleResult::INCOMPLETE:
                log("report discarded: " + std::string(GSVAssembler::result_name(assembled)));
                return ReadResult::CLOSED;
            default:
                log("report discarded: " + std::string(GSVAssembler::result_name(assembled)));
                break;
            }
        }
    }

    /// Everything after assembly; pure.
    static CycleResult process(const SatelliteGroup& group)
    {
        CycleResult result;
        result.table = build_satellite_table(group);
        result.classified = classify(result.table);
        result.chosen = select_candidates(result.classified);

        GeomancyRenderer renderer;
        if (renderer(result.chosen, result.diagram) != GeomancyRenderer::RenderResult::OK)
        {
            result.status = CycleResult::Status::MISSING_DIRECTION;
        }
        return result;
    }

    CycleResult operator()(const line_reader_t& reader)
    {
        SatelliteGroup group;
        auto status = wait_for_report(reader, group);
        if (status != ReadResult::OK)
        {
            CycleResult result;
            switch (status)
            {
            case ReadResult::CANCELLED: result.status = CycleResult::Status::CANCELLED; break;
            case ReadResult::CLOSED:    result.status = CycleResult::Status::CLOSED; break;
            default:                    result.status = CycleResult::Status::TRANSPORT_ERROR; break;
            }
            return result;
        }

        auto result = process(group);
        log("satellites: " + std::to_string(result.table.size()) + " of "
            + std::to_string(result.table.in_view) + " in view, "
            + std::to_string(result.table.skipped_chunks) + " malformed");
        return result;
    }

private:
    void log(const std::string& message) const
    {
        if (diagnostic_) diagnostic_(message);
    }

    std::string talker_;
    diagnostic_t diagnostic_;
    SentenceDecoder decoder_;
    GSVAssembler assembler_;
};

} // namespace geomancy
