// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>

namespace geomancy
{
    // =========================================================================
    // NMEA 0183 FRAMING
    // =========================================================================

    const char nmea_start = '$';                    // start of sentence
    const char nmea_checksum_marker = '*';          // precedes the two hex digits
    const char nmea_field_separator = ',';
    const size_t nmea_talker_chars = 2;             // GP, GL, GA, GB, GN ...
    const size_t nmea_type_chars = 3;               // GSV, RMC ...
    const size_t nmea_header_chars = nmea_talker_chars + nmea_type_chars;
    const size_t nmea_checksum_chars = 2;
    const size_t nmea_max_line_chars = 256;         // 82 by the standard, some receivers exceed it

    // --- Satellite-view (GSV) sentence ---
    const char gsv_type[] = "GSV";
    const size_t gsv_header_fields = 3;             // sentence total, sentence index, satellites in view
    const size_t gsv_fields_per_satellite = 4;      // prn, elevation, azimuth, snr
    const int gsv_max_sentences = 9;                // total is a single digit on the wire

    // --- Fix status (RMC) sentence ---
    const char rmc_type[] = "RMC";
    const size_t rmc_status_field = 1;              // after the UTC time field
    const char rmc_status_active = 'A';
    const char rmc_status_void = 'V';

    static_assert(nmea_header_chars == 5, "Header is 2 talker + 3 type characters");

    // =========================================================================
    // COMPASS
    // =========================================================================

    const int north_bearing = 0;
    const int east_bearing = 90;
    const int south_bearing = 180;
    const int west_bearing = 270;
    const int full_circle = 360;

    // Azimuths exactly on a boundary belong to no direction.
    const int north_east_boundary = 45;
    const int south_east_boundary = 135;
    const int south_west_boundary = 225;
    const int north_west_boundary = 315;

    const int max_deviation = 45;
    const int max_azimuth = 359;
    const int max_elevation = 90;

    // =========================================================================
    // DIAGRAM LAYOUT
    // =========================================================================

    const size_t diagram_columns = 4;               // West, North, East, South
    const size_t diagram_rows = 4;                  // prn, ele, azi, snr
    const size_t diagram_label_width = 4;
    const size_t diagram_column_width = 9;
    const size_t diagram_line_width = diagram_label_width + diagram_columns * diagram_column_width;

    static_assert(diagram_line_width == 40, "Diagram lines are 40 characters wide");

    // =========================================================================
    // TRANSPORT DEFAULTS
    // =========================================================================

    const char default_port[] = "/dev/ttyUSB0";     // Garmin eTrex and similar USB-serial adapters
    const int default_baud = 4800;                  // NMEA 0183 standard rate
    const int read_timeout_ms = 1000;               // per line
    const char default_talker[] = "GP";
}
