// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "LineSource.h"
#include "NMEASentence.h"
#include "Numerology.h"

#include <functional>
#include <string>

namespace geomancy
{

enum class FixStatus { UNKNOWN, ACTIVE, VOID };

/// Status flag of an RMC sentence from any talker; UNKNOWN for anything else.
inline FixStatus fix_status(const RawSentence& sentence)
{
    if (sentence.type != rmc_type) return FixStatus::UNKNOWN;

    const auto& status = sentence.field(rmc_status_field);
    if (status.size() != 1) return FixStatus::UNKNOWN;
    if (status[0] == rmc_status_active) return FixStatus::ACTIVE;
    if (status[0] == rmc_status_void) return FixStatus::VOID;
    return FixStatus::UNKNOWN;
}

/**
 * Read until an RMC sentence reports an active fix.
 *
 * Timeouts are waited through; OK means a fix was seen, anything else is
 * the reader status that ended the wait.
 */
inline ReadResult wait_for_fix(const line_reader_t& reader,
    const std::function<void(const std::string&)>& diagnostic = nullptr)
{
    SentenceDecoder decoder;
    std::string line;
    bool reported_void = false;

    for (;;)
    {
        auto status = reader(line);
        if (status == ReadResult::TIMEOUT) continue;
        if (status != ReadResult::OK) return status;

        auto sentence = decoder.decode(line);
        if (!sentence) continue;

        switch (fix_status(*sentence))
        {
        case FixStatus::ACTIVE:
            return ReadResult::OK;
        case FixStatus::VOID:
            if (!reported_void && diagnostic) diagnostic("waiting for fix");
            reported_void = true;
            break;
        case FixStatus::UNKNOWN:
            break;
        }
    }
}

} // namespace geomancy
