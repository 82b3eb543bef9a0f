// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Geomancy with GPS satellite positions
//
// Reads NMEA from a GPS receiver, picks the satellite closest to each
// cardinal direction and prints the geomantic figure their data spells.
//
// Pipeline: serial line → checksum → GSV report → table → classify → select → figure

#include "geomancycxx/CandidateSelector.h"
#include "geomancycxx/DirectionClassifier.h"
#include "geomancycxx/FixMonitor.h"
#include "geomancycxx/GeomancyCycle.h"
#include "geomancycxx/LineSource.h"
#include "geomancycxx/Numerology.h"
#include "geomancycxx/SerialPort.h"

#include <boost/program_options.hpp>

#include <atomic>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <cstdlib>

#include <signal.h>

const char VERSION[] = "0.2";

const int EXIT_TRANSPORT = 2;

using namespace geomancy;

struct Config
{
    std::string port;
    int baud = default_baud;
    std::string replay;
    std::string talker;
    uint32_t count = 1;
    bool no_fix = false;
    bool verbose = false;
    bool debug = false;
    bool quiet = false;

    /**
     * Returns nullopt when help or version was printed. Invalid options
     * throw.
     */
    static std::optional<Config> parse(int argc, char* argv[])
    {
        namespace po = boost::program_options;

        Config result;

        po::options_description desc("Program options");
        desc.add_options()
            ("help,h", "Print this help message and exit.")
            ("version,V", "Print the application version and exit.")
            ("port,p", po::value<std::string>(&result.port)->default_value(default_port),
                "address of the GPS.")
            ("baud,b", po::value<int>(&result.baud)->default_value(default_baud),
                "baud rate of the GPS (4800 for Garmin eTrex, 115200 for most dataloggers).")
            ("replay,r", po::value<std::string>(&result.replay),
                "read a captured NMEA log instead of the GPS ('-' for stdin).")
            ("talker,t", po::value<std::string>(&result.talker)->default_value(default_talker),
                "talker ID of the satellite-view sentences (GP, GL, GA, GB, GN).")
            ("count,c", po::value<uint32_t>(&result.count)->default_value(1),
                "number of figures to produce, 0 to run until interrupted.")
            ("no-fix,n", po::bool_switch(&result.no_fix), "do not wait for a position fix")
            ("verbose,v", po::bool_switch(&result.verbose), "verbose output")
            ("debug,d", po::bool_switch(&result.debug), "debug-level output")
            ("quiet,q", po::bool_switch(&result.quiet), "silence all output but the figure")
            ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << "Read GSV satellite data from a GPS and print a geomantic figure\n"
                << desc << std::endl;
            return std::nullopt;
        }

        if (vm.count("version"))
        {
            std::cout << argv[0] << ": " << VERSION << std::endl;
            return std::nullopt;
        }

        po::notify(vm);

        if (result.debug + result.verbose + result.quiet > 1)
        {
            throw std::invalid_argument("Only one of quiet, verbose or debug may be chosen.");
        }

        if (result.talker.size() != nmea_talker_chars)
        {
            throw std::invalid_argument("Talker ID must be two characters.");
        }

        speed_t speed;
        if (result.replay.empty() && !SerialPort::baud_to_speed(result.baud, speed))
        {
            throw std::invalid_argument("Unsupported baud rate " + std::to_string(result.baud) + ".");
        }

        // Debug implies verbose diagnostics.
        if (result.debug) result.verbose = true;

        return result;
    }
};

std::optional<Config> config;

std::atomic<bool> running{false};


// =============================================================================
// SIGNAL HANDLER
// =============================================================================

void signal_handler(int)
{
    running = false;
}


// =============================================================================
// DIAGNOSTIC OUTPUT
// =============================================================================

void diagnostic(const std::string& message)
{
    if (config->verbose) std::cerr << message << std::endl;
}

/**
 * One line per satellite; '<' marks the one chosen for its direction.
 */
void dump_satellites(const CycleResult& result)
{
    std::cerr << "prn  ele  azi  snr  direction  dev" << std::endl;
    for (const auto& sat : result.classified)
    {
        bool chosen = false;
        if (sat.direction)
        {
            const auto& best = result.chosen[*sat.direction];
            chosen = best && best->record == sat.record;
        }

        std::cerr << std::setw(3) << sat.record.prn
            << std::setw(5) << sat.record.elevation
            << std::setw(5) << sat.record.azimuth
            << std::setw(5) << sat.record.snr << "  "
            << std::left << std::setw(9) << (sat.direction ? direction_name(*sat.direction) : "-")
            << std::right << std::setw(5) << sat.deviation
            << (chosen ? " <" : "") << std::endl;
    }
}

void report_missing(const ChosenFour& chosen)
{
    std::cerr << "No satellite for";
    const char* separator = " ";
    for (auto direction : chosen.missing())
    {
        std::cerr << separator << direction_name(direction);
        separator = ", ";
    }
    std::cerr << ", waiting for the next report." << std::endl;
}


// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[])
{
    try
    {
        config = Config::parse(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (!config) return EXIT_SUCCESS;

    signal(SIGINT, &signal_handler);
    signal(SIGTERM, &signal_handler);
    running = true;

    SerialPort port;
    std::ifstream replay_file;
    line_reader_t reader;
    std::string source = config->replay.empty() ? config->port : config->replay;

    if (config->replay.empty())
    {
        if (!port.open(config->port, config->baud))
        {
            std::cerr << "\nCould not open port " << config->port << " (" << port.last_error() << "),\n"
                << "is the GPS plugged in and turned on?\n" << std::endl;
            return EXIT_TRANSPORT;
        }
        reader = port.reader(running);
    }
    else
    {
        std::istream* input = &std::cin;
        if (config->replay != "-")
        {
            replay_file.open(config->replay);
            if (!replay_file)
            {
                std::cerr << "Cannot open " << config->replay << " for read" << std::endl;
                return EXIT_TRANSPORT;
            }
            input = &replay_file;
        }

        IStreamLineReader stream_reader(*input);
        reader = [stream_reader](std::string& line) mutable {
            if (!running) return ReadResult::CANCELLED;
            return stream_reader(line);
        };
    }

    if (config->debug)
    {
        reader = [inner = reader](std::string& line) {
            auto status = inner(line);
            if (status == ReadResult::OK) std::cerr << "< " << line << (!line.empty() && line.back() == '\n' ? "" : "\n");
            return status;
        };
    }

    auto transport_error = [&]() {
        std::cerr << "Read error on " << source;
        if (config->replay.empty()) std::cerr << ": " << port.last_error();
        std::cerr << std::endl;
        return EXIT_TRANSPORT;
    };

    if (!config->quiet)
    {
        std::cerr << "Reading " << source;
        if (config->replay.empty()) std::cerr << " at " << config->baud << " baud";
        std::cerr << std::endl;
    }

    if (!config->no_fix)
    {
        auto status = wait_for_fix(reader, diagnostic);
        switch (status)
        {
        case ReadResult::OK:
            diagnostic("fix acquired");
            break;
        case ReadResult::CANCELLED:
            if (!config->quiet) std::cerr << "\nuser interrupt, shutting down" << std::endl;
            return EXIT_SUCCESS;
        case ReadResult::CLOSED:
            std::cerr << "Input ended before a position fix." << std::endl;
            return EXIT_FAILURE;
        default:
            return transport_error();
        }
    }

    GeomancyCycle cycle(config->talker, diagnostic);
    uint32_t produced = 0;
    bool cancelled = false;
    bool closed = false;

    while (!cancelled && !closed && (config->count == 0 || produced < config->count))
    {
        auto result = cycle(reader);

        switch (result.status)
        {
        case CycleResult::Status::OK:
            if (config->verbose) dump_satellites(result);
            if (produced) std::cout << '\n';
            std::cout << result.diagram << std::flush;
            ++produced;
            break;
        case CycleResult::Status::MISSING_DIRECTION:
            if (config->verbose) dump_satellites(result);
            if (!config->quiet) report_missing(result.chosen);
            break;
        case CycleResult::Status::CANCELLED:
            cancelled = true;
            break;
        case CycleResult::Status::CLOSED:
            closed = true;
            break;
        case CycleResult::Status::TRANSPORT_ERROR:
            return transport_error();
        }
    }

    port.close();

    if (cancelled && !config->quiet)
    {
        std::cerr << "\nuser interrupt, shutting down" << std::endl;
    }

    if (closed && produced == 0)
    {
        std::cerr << "Input ended before a complete figure." << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
