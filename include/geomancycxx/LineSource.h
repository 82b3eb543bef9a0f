// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <istream>
#include <string>

namespace geomancy
{

enum class ReadResult { OK, TIMEOUT, CLOSED, CANCELLED, ERROR };

inline const char* read_result_name(ReadResult result)
{
    switch (result)
    {
    case ReadResult::OK:        return "ok";
    case ReadResult::TIMEOUT:   return "read timeout";
    case ReadResult::CLOSED:    return "end of input";
    case ReadResult::CANCELLED: return "cancelled";
    case ReadResult::ERROR:     return "transport error";
    }
    return "unknown";
}

/**
 * Reads one newline-terminated line into the argument.
 * The line is only valid when OK is returned.
 */
using line_reader_t = std::function<ReadResult(std::string&)>;

/**
 * Line source over a captured NMEA log (file or stdin).
 *
 * The log needs no CR before the LF; the decoder strips either.
 */
class IStreamLineReader
{
public:
    explicit IStreamLineReader(std::istream& input)
    : input_(input)
    {}

    ReadResult operator()(std::string& line)
    {
        if (!std::getline(input_, line))
        {
            return input_.eof() ? ReadResult::CLOSED : ReadResult::ERROR;
        }
        return ReadResult::OK;
    }

private:
    std::istream& input_;
};

} // namespace geomancy
