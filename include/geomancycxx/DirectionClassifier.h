// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Numerology.h"
#include "SatelliteTable.h"

#include <array>
#include <cstdlib>
#include <optional>
#include <vector>

namespace geomancy
{

enum class Direction { NORTH, EAST, SOUTH, WEST };

const std::array<Direction, 4> all_directions = {
    Direction::NORTH, Direction::EAST, Direction::SOUTH, Direction::WEST
};

inline const char* direction_name(Direction direction)
{
    switch (direction)
    {
    case Direction::NORTH: return "North";
    case Direction::EAST:  return "East";
    case Direction::SOUTH: return "South";
    case Direction::WEST:  return "West";
    }
    return "?";
}

inline size_t direction_index(Direction direction)
{
    return static_cast<size_t>(direction);
}

struct ClassifiedSatellite
{
    SatelliteRecord record;
    std::optional<Direction> direction;     // empty on a 45/135/225/315 boundary
    int deviation = 0;                      // [deg] from the ideal bearing, 0..45
};

/**
 * Assign a compass direction by azimuth.
 *
 * The four intervals are open, so 45, 135, 225 and 315 fall in none of
 * them and the satellite stays unclassified. The azimuth is expected in
 * 0..359, as build_satellite_table() guarantees.
 */
inline ClassifiedSatellite classify(const SatelliteRecord& record)
{
    ClassifiedSatellite result;
    result.record = record;

    const int azi = record.azimuth;

    if (azi > north_west_boundary || azi < north_east_boundary)
    {
        result.direction = Direction::NORTH;
        result.deviation = azi > south_bearing ? full_circle - azi : azi - north_bearing;
    }
    else if (azi > north_east_boundary && azi < south_east_boundary)
    {
        result.direction = Direction::EAST;
        result.deviation = std::abs(azi - east_bearing);
    }
    else if (azi > south_east_boundary && azi < south_west_boundary)
    {
        result.direction = Direction::SOUTH;
        result.deviation = std::abs(azi - south_bearing);
    }
    else if (azi > south_west_boundary && azi < north_west_boundary)
    {
        result.direction = Direction::WEST;
        result.deviation = std::abs(azi - west_bearing);
    }

    return result;
}

/// Classify every satellite of the table, in table (PRN) order.
inline std::vector<ClassifiedSatellite> classify(const SatelliteTable& table)
{
    std::vector<ClassifiedSatellite> result;
    result.reserve(table.size());
    for (const auto& entry : table.satellites)
    {
        result.push_back(classify(entry.second));
    }
    return result;
}

} // namespace geomancy
