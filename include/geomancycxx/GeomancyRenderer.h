// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Geomantic figure renderer
//
// Layout after Stephen Skinner, "Terrestrial Astronomy - Divination by
// Geomancy". Each value reads as two marks when even and one when odd:
//
//         Earth    Water    Air      Fire
//         IV       III      II       I
//     prn **       *        **       *
//     ele **       *        **       *
//     azi *        *        *        **
//     snr *        **       **       **
//         West     North    East     South

#pragma once

#include "CandidateSelector.h"
#include "Numerology.h"

#include <array>
#include <iomanip>
#include <sstream>
#include <string>

namespace geomancy
{

struct GeomancyRenderer
{
    enum class RenderResult { OK, MISSING_DIRECTION };

    // Columns left to right
    static constexpr std::array<Direction, diagram_columns> column_order = {
        Direction::WEST, Direction::NORTH, Direction::EAST, Direction::SOUTH
    };

    static constexpr std::array<const char*, diagram_columns> elements = {"Earth", "Water", "Air", "Fire"};
    static constexpr std::array<const char*, diagram_columns> ordinals = {"IV", "III", "II", "I"};
    static constexpr std::array<const char*, diagram_rows> row_labels = {"prn", "ele", "azi", "snr"};

    using parity_t = std::array<std::array<bool, diagram_columns>, diagram_rows>;

    static int attribute(const SatelliteRecord& record, size_t row)
    {
        switch (row)
        {
        case 0:  return record.prn;
        case 1:  return record.elevation;
        case 2:  return record.azimuth;
        default: return record.snr;
        }
    }

    /// "**" for an even value (zero included), "* " for odd.
    static const char* glyph(int value)
    {
        return value % 2 == 0 ? "**" : "* ";
    }

    /**
     * Odd flags of the figure, [row][column], rows prn/ele/azi/snr and
     * columns in column_order. Only meaningful for a complete selection.
     */
    static parity_t figure_parity(const ChosenFour& chosen)
    {
        parity_t odd{};
        for (size_t row = 0; row < diagram_rows; ++row)
        {
            for (size_t col = 0; col < diagram_columns; ++col)
            {
                const auto& sat = chosen[column_order[col]];
                odd[row][col] = sat && attribute(sat->record, row) % 2 != 0;
            }
        }
        return odd;
    }

    /**
     * Render the figure. Every direction must have a satellite; otherwise
     * MISSING_DIRECTION is returned and text is left untouched.
     */
    RenderResult operator()(const ChosenFour& chosen, std::string& text) const
    {
        if (!chosen.complete()) return RenderResult::MISSING_DIRECTION;

        std::ostringstream out;
        out << std::left;

        out << std::setw(diagram_label_width) << "";
        for (auto element : elements) out << std::setw(diagram_column_width) << element;
        out << '\n';

        out << std::setw(diagram_label_width) << "";
        for (auto ordinal : ordinals) out << std::setw(diagram_column_width) << ordinal;
        out << '\n';

        for (size_t row = 0; row < diagram_rows; ++row)
        {
            out << std::setw(diagram_label_width) << row_labels[row];
            for (auto direction : column_order)
            {
                out << std::setw(diagram_column_width) << glyph(attribute(chosen[direction]->record, row));
            }
            out << '\n';
        }

        out << std::setw(diagram_label_width) << "";
        for (auto direction : column_order) out << std::setw(diagram_column_width) << direction_name(direction);
        out << '\n';

        text = out.str();
        return RenderResult::OK;
    }
};

} // namespace geomancy
