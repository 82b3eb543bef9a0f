// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "DirectionClassifier.h"

#include <array>
#include <optional>
#include <vector>

namespace geomancy
{

/**
 * At most one satellite per direction, indexed by direction_index().
 */
struct ChosenFour
{
    std::array<std::optional<ClassifiedSatellite>, 4> chosen;

    const std::optional<ClassifiedSatellite>& operator[](Direction direction) const
    {
        return chosen[direction_index(direction)];
    }

    std::optional<ClassifiedSatellite>& operator[](Direction direction)
    {
        return chosen[direction_index(direction)];
    }

    bool complete() const
    {
        for (const auto& c : chosen)
        {
            if (!c) return false;
        }
        return true;
    }

    std::vector<Direction> missing() const
    {
        std::vector<Direction> result;
        for (auto direction : all_directions)
        {
            if (!(*this)[direction]) result.push_back(direction);
        }
        return result;
    }
};

/**
 * True when candidate should replace best.
 *
 * Lower deviation wins, then higher SNR. On a full tie the candidate
 * wins, so the last one seen in iteration order is kept. Iteration is in
 * PRN order here but the receiver's ordering carries no meaning, so a
 * full tie is effectively arbitrary.
 */
inline bool better_candidate(const ClassifiedSatellite& candidate, const ClassifiedSatellite& best)
{
    if (candidate.deviation != best.deviation) return candidate.deviation < best.deviation;
    return candidate.record.snr >= best.record.snr;
}

inline ChosenFour select_candidates(const std::vector<ClassifiedSatellite>& satellites)
{
    ChosenFour result;
    for (const auto& sat : satellites)
    {
        if (!sat.direction) continue;

        auto& best = result[*sat.direction];
        if (!best || better_candidate(sat, *best))
        {
            best = sat;
        }
    }
    return result;
}

} // namespace geomancy
