// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Shared helpers for the standalone test programs. Each program prints
// one line per check and exits non-zero if any check failed.

#pragma once

#include "geomancycxx/LineSource.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                  \
        if (!(cond)) {                                                    \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';   \
            ++failures;                                                   \
        } else {                                                          \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                 \
    } while (0)

inline int test_result()
{
    std::cout << (failures ? "\nFAILED: " : "\nPASSED") ;
    if (failures) std::cout << failures << " check(s)";
    std::cout << std::endl;
    return failures ? EXIT_FAILURE : EXIT_SUCCESS;
}

/**
 * Reader over a fixed list of lines; CLOSED once they run out, or the
 * given status in place of CLOSED.
 */
struct ScriptedReader
{
    std::vector<std::string> lines;
    geomancy::ReadResult at_end = geomancy::ReadResult::CLOSED;
    size_t next = 0;

    geomancy::ReadResult operator()(std::string& line)
    {
        if (next >= lines.size()) return at_end;
        line = lines[next++];
        return geomancy::ReadResult::OK;
    }
};
