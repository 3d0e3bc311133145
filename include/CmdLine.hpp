#pragma once

#include <boost/program_options.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

struct CmdOptions {
    std::string host{"127.0.0.1"};
    std::uint16_t port{4002};
    int client_id{100};

    bool positions{false}; // stream positions until PositionEnd
    bool server_time{false};
    bool accounts{false};

    bool debug{false};
    bool raw{false};
    int raw_max{512};
    bool use_async{false}; // coroutine client instead of the threaded one

    std::optional<std::string> recording_dir; // overrides GW_RECORDING_DIR

    bool show_help{false};
};

inline bool parse_cmdline(int argc, char **argv, CmdOptions &out) {
    namespace po = boost::program_options;

    po::options_description desc("Options");
    desc.add_options()
            ("help,h", "Show this help message")
            ("host", po::value<std::string>()->default_value("127.0.0.1"),
             "Gateway host")
            ("port,p", po::value<std::uint16_t>()->default_value(4002),
             "Gateway API port")
            ("client-id,c", po::value<int>()->default_value(100),
             "API client id; one session per id")
            ("positions", po::bool_switch(),
             "Print positions until the gateway sends PositionEnd")
            ("server-time", po::bool_switch(),
             "Print the gateway clock")
            ("accounts", po::bool_switch(),
             "Print the managed accounts")
            ("debug", po::bool_switch(),
             "Debug logging")
            ("raw", po::bool_switch(),
             "Print raw frames (implies --debug)")
            ("raw-max", po::value<int>()->default_value(512),
             "Truncate raw frames to this many characters")
            ("async", po::bool_switch(),
             "Use the coroutine client")
            ("recording-dir", po::value<std::string>(),
             "Record every frame as JSON lines below this directory");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Usage: " << argv[0]
                    << " [--host HOST] [--port PORT] [--client-id ID] "
                    "[--server-time] [--accounts] [--positions] [--async] [--debug] [--raw]\n\n";
            std::cout << desc << "\n";
            out.show_help = true;
            return true;
        }

        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "Error parsing command line: " << e.what() << "\n\n";
        std::cerr << desc << "\n";
        return false;
    }

    out.host = vm["host"].as<std::string>();
    out.port = vm["port"].as<std::uint16_t>();
    out.client_id = vm["client-id"].as<int>();
    out.positions = vm["positions"].as<bool>();
    out.server_time = vm["server-time"].as<bool>();
    out.accounts = vm["accounts"].as<bool>();
    out.debug = vm["debug"].as<bool>();
    out.raw = vm["raw"].as<bool>();
    out.raw_max = vm["raw-max"].as<int>();
    out.use_async = vm["async"].as<bool>();
    if (vm.contains("recording-dir")) out.recording_dir = vm["recording-dir"].as<std::string>();

    // Nothing asked for: show the clock, the cheapest round trip.
    if (!out.positions && !out.server_time && !out.accounts) out.server_time = true;
    return true;
}
