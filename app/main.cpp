#include "CmdLine.hpp"                 // CmdOptions, parse_cmdline
#include "async/Client.hpp"            // gw::async::Client
#include "client/Client.hpp"           // gw::Client, ClientConfig
#include "utils/DebugConfigUtils.hpp"  // gw::debug switches

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <exception>
#include <iostream>
#include <variant>

namespace {
    std::string format_time(std::chrono::system_clock::time_point tp) {
        return boost::posix_time::to_simple_string(
                   boost::posix_time::from_time_t(std::chrono::system_clock::to_time_t(tp))) + " UTC";
    }

    void print_position(const gw::PositionUpdate &update) {
        if (std::holds_alternative<gw::PositionEnd>(update)) {
            std::cout << "-- end of positions\n";
            return;
        }
        const auto &p = std::get<gw::Position>(update);
        std::cout << p.account << "  " << p.symbol << " " << p.security_type << " " << p.currency
                  << "  pos=" << p.position << " avg=" << p.average_cost << "\n";
    }

    void print_accounts(const std::vector<std::string> &accounts) {
        std::cout << "managed accounts:";
        for (const auto &a: accounts) std::cout << " " << a;
        std::cout << "\n";
    }

    void print_session(const gw::ConnectionMetadata &meta) {
        std::cout << "[gwlink] connected\n"
                  << "  server_version = " << meta.server_version << "\n"
                  << "  client_id      = " << meta.client_id << "\n"
                  << "  next_order_id  = " << meta.next_order_id << "\n"
                  << "  time_zone      = " << (meta.time_zone ? meta.time_zone->name : "<unresolved>") << "\n";
    }

    int run_threaded(const CmdOptions &options, const gw::ClientConfig &cfg) {
        auto client = gw::Client::connect(cfg);
        print_session(client.connection_metadata());

        if (options.server_time) std::cout << "server time: " << format_time(client.server_time()) << "\n";
        if (options.accounts) print_accounts(client.managed_accounts());
        if (options.positions) {
            auto positions = client.positions();
            for (const auto &update: positions) print_position(update);
            if (const auto ec = positions.error()) std::cerr << "positions: " << ec->message() << "\n";
        }

        client.disconnect();
        return 0;
    }

    boost::asio::awaitable<void> run_tasks(CmdOptions options, gw::ClientConfig cfg, boost::asio::io_context &ioc) {
        auto client = co_await gw::async::Client::connect(ioc, cfg);
        print_session(client.connection_metadata());

        if (options.server_time) std::cout << "server time: " << format_time(co_await client.server_time()) << "\n";
        if (options.accounts) print_accounts(co_await client.managed_accounts());
        if (options.positions) {
            auto positions = co_await client.positions();
            boost::system::error_code ec;
            while (auto update = co_await positions.next(ec)) print_position(*update);
            if (ec) std::cerr << "positions: " << ec.message() << "\n";
        }

        client.disconnect();
    }

    int run_async(const CmdOptions &options, const gw::ClientConfig &cfg) {
        boost::asio::io_context ioc;
        int rc = 0;
        boost::asio::co_spawn(ioc, run_tasks(options, cfg, ioc), [&rc](std::exception_ptr e) {
            if (!e) return;
            try {
                std::rethrow_exception(e);
            } catch (const std::exception &ex) {
                std::cerr << "Error: " << ex.what() << "\n";
                rc = 1;
            }
        });
        ioc.run();
        return rc;
    }
} // namespace

int main(int argc, char **argv) {
    CmdOptions options;
    if (!parse_cmdline(argc, argv, options)) {
        // parse_cmdline already printed error/help on failure
        return 1;
    }

    if (options.show_help) {
        return 0;
    }

    gw::debug::enabled = options.debug || options.raw;
    gw::debug::raw = options.raw;
    gw::debug::raw_max = options.raw_max;

    gw::ClientConfig cfg;
    cfg.host = options.host;
    cfg.port = options.port;
    cfg.client_id = options.client_id;
    cfg.recording_dir = options.recording_dir;

    std::cout << "[gwlink] connecting\n"
              << "  host      = " << cfg.host << "\n"
              << "  port      = " << cfg.port << "\n"
              << "  client_id = " << cfg.client_id << "\n"
              << "  model     = " << (options.use_async ? "tasks" : "threads") << "\n";

    try {
        return options.use_async ? run_async(options, cfg) : run_threaded(options, cfg);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
