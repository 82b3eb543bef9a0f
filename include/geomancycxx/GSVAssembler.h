// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Satellite-view report assembler
//
// A GSV report is split over 1..N sentences, each repeating the total and
// its own index:
//
//   $GPGSV,3,1,12,01,80,283,20,32,77,227,18,11,72,175,19,20,42,247,25*79
//   $GPGSV,3,2,12,14,35,055,15,19,23,174,28,17,19,318,26,28,15,281,15*7C
//   $GPGSV,3,3,12,22,11,068,17,23,05,194,,31,04,113,,36,,,*4A

#pragma once

#include "LineSource.h"
#include "NMEASentence.h"
#include "Numerology.h"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace geomancy
{

/// Members in report order; an empty slot stands for a sentence that failed decode.
using SatelliteGroup = std::vector<std::optional<RawSentence>>;

struct GSVHeader
{
    int total;      // sentences in the report
    int index;      // 1-based position of this sentence
    int in_view;    // satellites in view
};

inline std::optional<GSVHeader> read_gsv_header(const RawSentence& sentence)
{
    auto total = parse_field(sentence.field(0));
    auto index = parse_field(sentence.field(1));
    auto in_view = parse_field(sentence.field(2));
    if (!total || !index || *total < 1 || *total > gsv_max_sentences) return std::nullopt;
    if (*index < 1 || *index > *total) return std::nullopt;
    return GSVHeader{*total, *index, in_view.value_or(0)};
}

struct GSVAssembler
{
    enum class AssembleResult { OK, BAD_HEADER, INCONSISTENT, INCOMPLETE, TIMEOUT, CANCELLED, TRANSPORT_ERROR };

    using diagnostic_t = std::function<void(const std::string&)>;

    std::string talker_;
    diagnostic_t diagnostic_;
    SentenceDecoder decoder_;
    size_t placeholders_ = 0;
    size_t skipped_lines_ = 0;
    std::optional<RawSentence> restart_;

    explicit GSVAssembler(std::string talker = default_talker, diagnostic_t diagnostic = nullptr)
    : talker_(std::move(talker)), diagnostic_(std::move(diagnostic))
    {}

    static const char* result_name(AssembleResult result)
    {
        switch (result)
        {
        case AssembleResult::OK:              return "ok";
        case AssembleResult::BAD_HEADER:      return "bad report header";
        case AssembleResult::INCONSISTENT:    return "inconsistent report";
        case AssembleResult::INCOMPLETE:      return "incomplete report";
        case AssembleResult::TIMEOUT:         return "read timeout";
        case AssembleResult::CANCELLED:       return "cancelled";
        case AssembleResult::TRANSPORT_ERROR: return "transport error";
        }
        return "unknown";
    }

    static AssembleResult from_read_result(ReadResult result)
    {
        switch (result)
        {
        case ReadResult::TIMEOUT:   return AssembleResult::TIMEOUT;
        case ReadResult::CANCELLED: return AssembleResult::CANCELLED;
        case ReadResult::ERROR:     return AssembleResult::TRANSPORT_ERROR;
        default:                    return AssembleResult::INCOMPLETE;
        }
    }

    /// Number of failed-decode slots in the last assembled group.
    size_t placeholders() const { return placeholders_; }

    /// Lines of other sentence types passed over while assembling.
    size_t skipped_lines() const { return skipped_lines_; }

    /**
     * First sentence of a new report that cut the last one short, if any.
     * Taking it clears it.
     */
    std::optional<RawSentence> take_restart()
    {
        std::optional<RawSentence> result;
        result.swap(restart_);
        return result;
    }

    /**
     * Collect the rest of the report that starts with first.
     *
     * Reads until (total - 1) further "$<talker>GSV" lines have arrived.
     * Other sentences are passed over. A line that fails decode keeps its
     * position as an empty slot. The group is only valid on OK.
     *
     * A member with index 1 starts a new report: INCONSISTENT is returned
     * and the member is kept for take_restart().
     */
    AssembleResult operator()(const RawSentence& first, const line_reader_t& reader, SatelliteGroup& group)
    {
        group.clear();
        placeholders_ = 0;
        skipped_lines_ = 0;
        restart_.reset();

        auto header = read_gsv_header(first);
        if (!header || header->index != 1) return AssembleResult::BAD_HEADER;

        group.reserve(header->total);
        group.push_back(first);

        const std::string prefix = sentence_prefix(talker_, gsv_type);
        std::string line;

        while (static_cast<int>(group.size()) < header->total)
        {
            auto status = reader(line);
            if (status != ReadResult::OK) return from_read_result(status);

            if (!has_prefix(line, prefix))
            {
                ++skipped_lines_;
                continue;
            }

            RawSentence sentence;
            auto decoded = decoder_(line, sentence);
            if (decoded != SentenceDecoder::DecodeResult::OK)
            {
                log(std::string("GSV ") + std::to_string(group.size() + 1) + "/"
                    + std::to_string(header->total) + " dropped: " + SentenceDecoder::result_name(decoded));
                ++placeholders_;
                group.emplace_back(std::nullopt);
                continue;
            }

            auto member = read_gsv_header(sentence);
            if (!member)
            {
                log("GSV member with unreadable header dropped");
                ++placeholders_;
                group.emplace_back(std::nullopt);
                continue;
            }

            if (member->total != header->total || member->in_view != header->in_view
                || member->index != static_cast<int>(group.size()) + 1)
            {
                log("GSV " + std::to_string(member->index) + "/" + std::to_string(member->total)
                    + " does not continue report of " + std::to_string(header->total));
                if (member->index == 1) restart_ = std::move(sentence);
                return AssembleResult::INCONSISTENT;
            }

            group.push_back(std::move(sentence));
        }

        return AssembleResult::OK;
    }

private:
    void log(const std::string& message) const
    {
        if (diagnostic_) diagnostic_(message);
    }
};

} // namespace geomancy
