// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "GSVAssembler.h"
#include "Numerology.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace geomancy
{

struct SatelliteRecord
{
    int prn = 0;
    int elevation = 0;  // [deg] 0..90
    int azimuth = 0;    // [deg] 0..359
    int snr = 0;        // [dB-Hz] 0 when not tracked
};

inline bool operator==(const SatelliteRecord& a, const SatelliteRecord& b)
{
    return a.prn == b.prn && a.elevation == b.elevation && a.azimuth == b.azimuth && a.snr == b.snr;
}

inline bool operator!=(const SatelliteRecord& a, const SatelliteRecord& b)
{
    return !(a == b);
}

/**
 * Satellites of one report keyed by PRN, plus what was lost on the way.
 */
struct SatelliteTable
{
    std::map<int, SatelliteRecord> satellites;
    size_t skipped_chunks = 0;      // malformed or out of range (prn, ele, azi, snr) groups
    int in_view = 0;                // as announced by the report header

    size_t size() const { return satellites.size(); }
    bool empty() const { return satellites.empty(); }
};

/**
 * Data fields of one GSV member with the report header removed.
 *
 * NMEA 4.10 receivers append a signal-ID after the last satellite,
 * leaving one field over a multiple of four; it is dropped here.
 */
inline std::vector<std::string> gsv_satellite_fields(const RawSentence& sentence)
{
    if (sentence.fields.size() <= gsv_header_fields) return {};

    std::vector<std::string> fields(sentence.fields.begin() + gsv_header_fields, sentence.fields.end());
    if (fields.size() % gsv_fields_per_satellite == 1) fields.pop_back();
    return fields;
}

/**
 * Flatten a report into one (prn, elevation, azimuth, snr) sequence.
 * Empty fields read as "0"; placeholder slots contribute nothing.
 */
inline std::vector<std::string> flatten_group(const SatelliteGroup& group)
{
    std::vector<std::string> flat;
    for (const auto& member : group)
    {
        if (!member) continue;
        for (auto& field : gsv_satellite_fields(*member))
        {
            flat.push_back(field.empty() ? "0" : field);
        }
    }
    return flat;
}

inline SatelliteTable build_satellite_table(const SatelliteGroup& group)
{
    SatelliteTable table;

    for (const auto& member : group)
    {
        if (!member) continue;
        if (auto header = read_gsv_header(*member))
        {
            table.in_view = header->in_view;
            break;
        }
    }

    auto flat = flatten_group(group);

    size_t i = 0;
    for (; i + gsv_fields_per_satellite <= flat.size(); i += gsv_fields_per_satellite)
    {
        auto prn = parse_field(flat[i]);
        auto elevation = parse_field(flat[i + 1]);
        auto azimuth = parse_field(flat[i + 2]);
        auto snr = parse_field(flat[i + 3]);

        if (!prn || !elevation || !azimuth || !snr || *elevation > max_elevation || *azimuth > max_azimuth)
        {
            ++table.skipped_chunks;
            continue;
        }

        table.satellites[*prn] = SatelliteRecord{*prn, *elevation, *azimuth, *snr};
    }

    if (i < flat.size()) ++table.skipped_chunks;   // trailing partial group

    return table;
}

} // namespace geomancy
