// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// NMEA 0183 sentence decoder
//
// Pipeline: strip CR/LF → locate '*' → XOR checksum → drop header → split fields

#pragma once

#include "Numerology.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace geomancy
{

/**
 * One validated, checksum-stripped sentence.
 *
 * For "$GPGSV,3,1,12,01,80,283,20*79" talker is "GP", type is "GSV" and
 * fields are {"3", "1", "12", "01", "80", "283", "20"}.
 */
struct RawSentence
{
    std::string talker;
    std::string type;
    std::vector<std::string> fields;

    const std::string& field(size_t index) const
    {
        static const std::string empty;
        return index < fields.size() ? fields[index] : empty;
    }
};

/// Decimal field value; empty or non-numeric text has none.
inline std::optional<int> parse_field(const std::string& text)
{
    if (text.empty() || text.size() > 9) return std::nullopt;
    int value = 0;
    for (char c : text)
    {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

/// The "$GPGSV" style prefix every line of a given sentence starts with.
inline std::string sentence_prefix(const std::string& talker, const char* sentence_type)
{
    return std::string(1, nmea_start) + talker + sentence_type;
}

inline bool has_prefix(const std::string& line, const std::string& prefix)
{
    return line.compare(0, prefix.size(), prefix) == 0;
}

/// XOR of all bytes in the payload (the text between '$' and '*').
inline uint8_t nmea_checksum(const std::string& payload)
{
    uint8_t checksum = 0;
    for (char c : payload)
    {
        checksum ^= static_cast<uint8_t>(c);
    }
    return checksum;
}

/// Two uppercase hex digits, as sent on the wire.
inline std::string format_checksum(uint8_t checksum)
{
    static const char digits[] = "0123456789ABCDEF";
    std::string result(nmea_checksum_chars, '0');
    result[0] = digits[(checksum >> 4) & 0x0F];
    result[1] = digits[checksum & 0x0F];
    return result;
}

/// Frame a payload into a complete line, used by tests and log tools.
inline std::string make_sentence(const std::string& payload)
{
    return std::string(1, nmea_start) + payload + nmea_checksum_marker
        + format_checksum(nmea_checksum(payload)) + "\r\n";
}

struct SentenceDecoder
{
    enum class DecodeResult { OK, NO_START, NO_CHECKSUM, CHECKSUM_MISMATCH, SHORT_HEADER };

    static const char* result_name(DecodeResult result)
    {
        switch (result)
        {
        case DecodeResult::OK:                return "ok";
        case DecodeResult::NO_START:          return "no start delimiter";
        case DecodeResult::NO_CHECKSUM:       return "no checksum marker";
        case DecodeResult::CHECKSUM_MISMATCH: return "checksum mismatch";
        case DecodeResult::SHORT_HEADER:      return "short header";
        }
        return "unknown";
    }

    /**
     * Decode one line into a RawSentence.
     *
     * The sentence is only written when the result is OK.
     */
    DecodeResult operator()(const std::string& line, RawSentence& sentence) const
    {
        std::string text = line;
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
        {
            text.pop_back();
        }

        auto star = text.rfind(nmea_checksum_marker);
        if (star == std::string::npos) return DecodeResult::NO_CHECKSUM;
        if (text.empty() || text.front() != nmea_start) return DecodeResult::NO_START;

        std::string payload = text.substr(1, star - 1);
        std::string received = text.substr(star + 1);
        for (auto& c : received)
        {
            if (c >= 'a' && c <= 'f') c = c - 'a' + 'A';
        }

        if (received != format_checksum(nmea_checksum(payload)))
        {
            return DecodeResult::CHECKSUM_MISMATCH;
        }

        if (payload.size() < nmea_header_chars) return DecodeResult::SHORT_HEADER;

        sentence.talker = payload.substr(0, nmea_talker_chars);
        sentence.type = payload.substr(nmea_talker_chars, nmea_type_chars);
        sentence.fields = split_fields(payload.substr(nmea_header_chars));
        return DecodeResult::OK;
    }

    std::optional<RawSentence> decode(const std::string& line) const
    {
        RawSentence sentence;
        if (operator()(line, sentence) != DecodeResult::OK) return std::nullopt;
        return sentence;
    }

    /**
     * Split the text following the header. It starts with the separator
     * that ends the header, so ",3,1" yields {"3", "1"} and a trailing
     * empty field is kept.
     */
    static std::vector<std::string> split_fields(const std::string& body)
    {
        std::vector<std::string> fields;
        if (body.empty()) return fields;

        size_t start = body.front() == nmea_field_separator ? 1 : 0;
        for (;;)
        {
            auto comma = body.find(nmea_field_separator, start);
            if (comma == std::string::npos)
            {
                fields.push_back(body.substr(start));
                break;
            }
            fields.push_back(body.substr(start, comma - start));
            start = comma + 1;
        }
        return fields;
    }
};

} // namespace geomancy
