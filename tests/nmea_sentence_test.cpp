// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Sentence framing and checksum tests.

#include "TestUtil.h"

#include "geomancycxx/FixMonitor.h"
#include "geomancycxx/NMEASentence.h"

#include <cctype>
#include <string>

using namespace geomancy;

using DecodeResult = SentenceDecoder::DecodeResult;

static const std::string GSV_1 = "$GPGSV,3,1,12,01,80,283,20,32,77,227,18,11,72,175,19,20,42,247,25*79\r\n";
static const std::string GSV_3 = "$GPGSV,3,3,12,22,11,068,17,23,05,194,,31,04,113,,36,,,*4A\r\n";

static void test_checksum()
{
    std::cout << "\n=== Test: checksum ===\n";

    CHECK(nmea_checksum("") == 0, "empty payload XORs to zero");
    CHECK(nmea_checksum("A") == 0x41, "single byte is its own checksum");
    CHECK(nmea_checksum("AA") == 0, "a byte twice cancels out");
    CHECK(format_checksum(0x4A) == "4A", "two uppercase hex digits");
    CHECK(format_checksum(0x07) == "07", "leading zero kept");

    std::string payload = "GPGSV,3,1,12,01,80,283,20,32,77,227,18,11,72,175,19,20,42,247,25";
    CHECK(format_checksum(nmea_checksum(payload)) == "79", "checksum of a receiver sentence");

    bool all_changed = true;
    for (size_t i = 0; i < payload.size(); ++i)
    {
        for (int bit = 0; bit < 8; ++bit)
        {
            std::string corrupted = payload;
            corrupted[i] = static_cast<char>(corrupted[i] ^ (1 << bit));
            if (nmea_checksum(corrupted) == nmea_checksum(payload)) all_changed = false;
        }
    }
    CHECK(all_changed, "every single-bit corruption changes the checksum");
}

static void test_decode()
{
    std::cout << "\n=== Test: decode ===\n";

    SentenceDecoder decoder;
    RawSentence sentence;

    CHECK(decoder(GSV_1, sentence) == DecodeResult::OK, "valid GSV decodes");
    CHECK(sentence.talker == "GP", "talker is GP");
    CHECK(sentence.type == "GSV", "type is GSV");
    CHECK(sentence.fields.size() == 19, "3 header fields + 4 satellites");
    CHECK(sentence.field(0) == "3" && sentence.field(1) == "1" && sentence.field(2) == "12",
        "header fields come first");
    CHECK(sentence.field(18) == "25", "last field precedes the checksum");
    CHECK(sentence.field(19).empty(), "out of range field is empty");

    CHECK(decoder(GSV_3, sentence) == DecodeResult::OK, "sentence with empty fields decodes");
    CHECK(sentence.fields.size() == 19, "empty trailing fields are kept");
    CHECK(sentence.field(10).empty() && sentence.field(14).empty() && sentence.field(18).empty(),
        "empty fields stay empty");

    std::string bare = GSV_1.substr(0, GSV_1.size() - 2);
    CHECK(decoder(bare, sentence) == DecodeResult::OK, "terminator is optional");
    CHECK(decoder(bare + "\n", sentence) == DecodeResult::OK, "bare line feed accepted");

    std::string payload = "GPGSV,1,1,01,43,62,288,23";
    std::string hex = format_checksum(nmea_checksum(payload));
    for (auto& c : hex) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    CHECK(decoder("$" + payload + "*" + hex, sentence) == DecodeResult::OK, "lowercase checksum accepted");
}

static void test_failures()
{
    std::cout << "\n=== Test: decode failures ===\n";

    SentenceDecoder decoder;
    RawSentence sentence;
    sentence.talker = "XX";

    CHECK(decoder("$GPGSV,3,1,12,01,80,283,20", sentence) == DecodeResult::NO_CHECKSUM,
        "missing '*' reported");

    std::string corrupted = GSV_1;
    corrupted[20] = corrupted[20] == '1' ? '2' : '1';
    CHECK(decoder(corrupted, sentence) == DecodeResult::CHECKSUM_MISMATCH, "corrupted payload byte rejected");

    std::string wrong_sum = GSV_1;
    wrong_sum[wrong_sum.find('*') + 2] = '8';
    CHECK(decoder(wrong_sum, sentence) == DecodeResult::CHECKSUM_MISMATCH, "corrupted checksum digit rejected");

    CHECK(decoder("GPGSV,1,1,00*00", sentence) == DecodeResult::NO_START, "missing '$' reported");
    CHECK(decoder(make_sentence("GPG"), sentence) == DecodeResult::SHORT_HEADER, "short header reported");
    CHECK(sentence.talker == "XX", "sentence untouched on failure");
    CHECK(!decoder.decode(corrupted), "optional form is empty on failure");

    CHECK(std::string(SentenceDecoder::result_name(DecodeResult::CHECKSUM_MISMATCH)) == "checksum mismatch",
        "failure kinds are named");
}

static void test_round_trip()
{
    std::cout << "\n=== Test: re-derive checksum ===\n";

    SentenceDecoder decoder;
    std::string payload = "GPGSV,2,2,07,23,08,041,15,27,41,136,14,32,23,106,17,1";
    std::string line = make_sentence(payload);
    CHECK(line == "$" + payload + "*5B\r\n", "framed line carries the receiver checksum");

    auto sentence = decoder.decode(line);
    CHECK(sentence.has_value(), "framed line decodes");
    if (!sentence) return;

    std::string rebuilt = sentence->talker + sentence->type;
    for (const auto& field : sentence->fields) rebuilt += "," + field;
    CHECK(rebuilt == payload, "fields rebuild the payload");
    CHECK(format_checksum(nmea_checksum(rebuilt)) == "5B", "re-derived checksum matches");
}

static void test_fields()
{
    std::cout << "\n=== Test: field helpers ===\n";

    CHECK(parse_field("068") == 68, "leading zero");
    CHECK(!parse_field(""), "empty has no value");
    CHECK(!parse_field("1.5"), "decimal rejected");
    CHECK(!parse_field("-3"), "sign rejected");
    CHECK(sentence_prefix("GN", gsv_type) == "$GNGSV", "prefix built from talker");
    CHECK(has_prefix(GSV_1, "$GPGSV") && !has_prefix(GSV_1, "$GLGSV"), "prefix match");
    CHECK(!has_prefix("$GP", "$GPGSV"), "short line has no prefix");

    auto fields = SentenceDecoder::split_fields(",a,,b,");
    CHECK(fields.size() == 4 && fields[1].empty() && fields[3].empty(), "empty fields split out");
}

static void test_fix_status()
{
    std::cout << "\n=== Test: fix status ===\n";

    SentenceDecoder decoder;
    auto active = decoder.decode("$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6A");
    auto inactive = decoder.decode("$GPRMC,123519,V,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*7D");
    auto gga = decoder.decode("$GNGGA,130831.00,5145.95529,N,00111.50572,W,1,11,0.98,87.4,M,47.0,M,,*62");

    CHECK(active && fix_status(*active) == FixStatus::ACTIVE, "RMC status A is an active fix");
    CHECK(inactive && fix_status(*inactive) == FixStatus::VOID, "RMC status V is void");
    CHECK(gga && fix_status(*gga) == FixStatus::UNKNOWN, "other sentences say nothing");

    ScriptedReader script;
    script.lines = {
        "$GPRMC,123519,V,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*7D\r\n",
        "$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6B\r\n",
        "$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6A\r\n",
    };
    line_reader_t reader = script;
    CHECK(wait_for_fix(reader) == ReadResult::OK, "wait ends on the first valid active fix");

    ScriptedReader never;
    never.lines = { "$GPRMC,123519,V,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*7D\r\n" };
    CHECK(wait_for_fix(never) == ReadResult::CLOSED, "end of input ends the wait");

    ScriptedReader interrupted;
    interrupted.at_end = ReadResult::CANCELLED;
    CHECK(wait_for_fix(interrupted) == ReadResult::CANCELLED, "cancellation ends the wait");
}

int main()
{
    test_checksum();
    test_decode();
    test_failures();
    test_round_trip();
    test_fields();
    test_fix_status();
    return test_result();
}
