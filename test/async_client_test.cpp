#include <gtest/gtest.h>

#include <utility>  // must precede boost/asio (boost 1.74 awaitable.hpp)
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "async/Client.hpp"
#include "common/Errors.hpp"
#include "protocol/WireCodec.hpp"

namespace asio = boost::asio;
using asio::awaitable;
using asio::use_awaitable;
using asio::ip::tcp;
using namespace std::chrono_literals;

namespace {
    constexpr std::int64_t kGatewayClock = 1704450600;
    constexpr const char *kApplePosition = "61|3|DU111|265598|AAPL|STK||0|||NASDAQ|USD|AAPL|NMS|100|150.25|";

    // Gateway on a loopback port, speaking the real framing.
    class LoopbackGateway {
    public:
        explicit LoopbackGateway(asio::io_context &ioc)
            : acceptor_(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
        }

        [[nodiscard]] std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

        // Accepts `sessions` connections in turn, then stops listening so later connects are refused.
        awaitable<void> serve() {
            for (int i = 0; i < sessions; ++i) {
                boost::system::error_code ec;
                auto socket = co_await acceptor_.async_accept(asio::redirect_error(use_awaitable, ec));
                if (ec) break;
                ++accepted;
                co_await session_(socket);
            }
            boost::system::error_code ignored;
            acceptor_.close(ignored);
        }

        int positions{3};
        bool end_positions{true};
        int sessions{1};
        std::string drop_on; ///< first session closes the socket when this request kind arrives
        int accepted{0};

        std::string handshake_preamble;
        std::string handshake_versions;
        std::string start_api_frame;
        std::vector<std::string> requests;
        int cancels{0};
        bool session_closed{false};

    private:
        awaitable<void> session_(tcp::socket &socket) {
            boost::system::error_code ec;

            std::string preamble(4, '\0');
            co_await asio::async_read(socket, asio::buffer(preamble), asio::redirect_error(use_awaitable, ec));
            if (ec) co_return;
            handshake_preamble = preamble;
            const auto versions = co_await read_frame_(socket, ec);
            if (ec) co_return;
            handshake_versions = versions.peek_string(0);

            co_await write_frame_(socket, "150|20240105 10:30:00 EST|");
            const auto start_api = co_await read_frame_(socket, ec);
            if (ec) co_return;
            start_api_frame = start_api.encode_simple();
            co_await write_frame_(socket, "9|1|1000|");
            co_await write_frame_(socket, "15|1|DU111,DU222|");

            for (;;) {
                const auto request = co_await read_frame_(socket, ec);
                if (ec) break;
                const auto kind = request.peek_string(0);
                requests.push_back(request.encode_simple());
                if (accepted == 1 && kind == drop_on) {
                    socket.close(ec);
                    co_return;
                }
                if (kind == "49") {
                    co_await write_frame_(socket, "49|1|" + std::to_string(kGatewayClock) + "|");
                } else if (kind == "61") {
                    for (int i = 0; i < positions; ++i) co_await write_frame_(socket, kApplePosition);
                    if (end_positions) co_await write_frame_(socket, "62|1|");
                } else if (kind == "64") {
                    ++cancels;
                }
            }
            session_closed = true;
        }

        static awaitable<gw::protocol::ResponseMessage> read_frame_(tcp::socket &socket,
                                                                     boost::system::error_code &ec) {
            unsigned char header[4]{};
            co_await asio::async_read(socket, asio::buffer(header), asio::redirect_error(use_awaitable, ec));
            if (ec) co_return gw::protocol::ResponseMessage{};
            std::string body(gw::protocol::decode_length(header), '\0');
            co_await asio::async_read(socket, asio::buffer(body), asio::redirect_error(use_awaitable, ec));
            if (ec) co_return gw::protocol::ResponseMessage{};
            co_return gw::protocol::ResponseMessage::from(body);
        }

        static awaitable<void> write_frame_(tcp::socket &socket, const std::string &simple) {
            const auto bytes = gw::protocol::encode_frame(gw::protocol::RequestMessage::from_simple(simple));
            co_await asio::async_write(socket, asio::buffer(bytes), use_awaitable);
        }

        tcp::acceptor acceptor_;
    };

    class AsyncClientTest : public ::testing::Test {
    protected:
        gw::ClientConfig config() const {
            gw::ClientConfig cfg;
            cfg.host = "127.0.0.1";
            cfg.port = gateway.port();
            cfg.log = [](gw::LogLevel, std::string_view) {};
            cfg.recording_dir = std::string();
            cfg.request_timeout = 2s;
            cfg.reconnect.delay_unit = 1ms;
            cfg.reconnect.max_retries = max_retries;
            return cfg;
        }

        // Runs the gateway and one client task to completion.
        void run(std::function<awaitable<void>(gw::async::Client &)> body) {
            std::exception_ptr failure;
            bool finished = false;

            asio::co_spawn(ioc, gateway.serve(), asio::detached);
            asio::co_spawn(
                ioc,
                [&]() -> awaitable<void> {
                    auto client = co_await gw::async::Client::connect(ioc, config());
                    try {
                        co_await body(client);
                    } catch (...) {
                        failure = std::current_exception();
                    }
                    client.disconnect();
                },
                [&](std::exception_ptr e) {
                    if (e) failure = e;
                    finished = true;
                });

            ioc.run_for(10s);
            EXPECT_TRUE(finished);
            if (failure) std::rethrow_exception(failure);
        }

        asio::io_context ioc;
        LoopbackGateway gateway{ioc};
        int max_retries{20};
    };

    using Positions = gw::async::Subscription<gw::PositionsDecoder>;

    awaitable<std::vector<gw::PositionUpdate> > read_until_end(Positions &sub) {
        std::vector<gw::PositionUpdate> seen;
        while (auto update = co_await sub.next_timeout(2s)) {
            const bool end = gw::PositionsDecoder::is_end(*update);
            seen.push_back(std::move(*update));
            if (end) break;
        }
        co_return seen;
    }
} // namespace

TEST_F(AsyncClientTest, HandshakeOverLoopback) {
    run([](gw::async::Client &client) -> awaitable<void> {
        const auto &meta = client.connection_metadata();
        EXPECT_EQ(meta.server_version, 150);
        EXPECT_EQ(meta.next_order_id, 1000);
        EXPECT_EQ(meta.managed_accounts, "DU111,DU222");
        EXPECT_TRUE(meta.time_zone.has_value());
        if (meta.time_zone) EXPECT_EQ(meta.time_zone->name, "America/New_York");
        co_return;
    });
    EXPECT_EQ(gateway.handshake_preamble, std::string("API\0", 4));
    EXPECT_EQ(gateway.handshake_versions, "v100..173");
    EXPECT_EQ(gateway.start_api_frame, "71|2|100||");
    EXPECT_TRUE(gateway.session_closed);
}

TEST_F(AsyncClientTest, ServerTime) {
    run([](gw::async::Client &client) -> awaitable<void> {
        const auto now = co_await client.server_time();
        EXPECT_EQ(now, std::chrono::system_clock::time_point{std::chrono::seconds{kGatewayClock}});
        const auto accounts = co_await client.managed_accounts();
        EXPECT_EQ(accounts, (std::vector<std::string>{"DU111", "DU222"}));
    });
}

TEST_F(AsyncClientTest, ClonesEachSeeTheWholeStream) {
    run([](gw::async::Client &client) -> awaitable<void> {
        auto positions = co_await client.positions();
        auto copy = positions.clone();
        EXPECT_EQ(positions.clones(), 2u);

        const auto first = co_await read_until_end(positions);
        const auto second = co_await read_until_end(copy);
        EXPECT_EQ(first.size(), 4u);
        EXPECT_EQ(second.size(), 4u);
        EXPECT_TRUE(positions.ended());
        EXPECT_TRUE(copy.ended());
    });
    // the stream ended on its own
    EXPECT_EQ(gateway.cancels, 0);
}

TEST_F(AsyncClientTest, LastCloneSendsTheOnlyCancel) {
    gateway.positions = 1;
    gateway.end_positions = false;
    run([this](gw::async::Client &client) -> awaitable<void> {
        auto positions = co_await client.positions();
        auto copy = positions.clone();

        const auto a = co_await positions.next_timeout(2s);
        const auto b = co_await copy.next_timeout(2s);
        EXPECT_TRUE(a.has_value());
        EXPECT_TRUE(b.has_value());

        positions.cancel();
        positions.cancel();
        EXPECT_EQ(positions.state(), Positions::State::CANCELLED);
        EXPECT_EQ(copy.clones(), 1u);
        (void) co_await client.server_time(); // the gateway has seen everything sent before this
        EXPECT_EQ(gateway.cancels, 0);

        copy.cancel();
        (void) co_await client.server_time();
        EXPECT_EQ(gateway.cancels, 1);
    });
}

TEST_F(AsyncClientTest, DisconnectEndsStreams) {
    gateway.positions = 0;
    gateway.end_positions = false;
    run([](gw::async::Client &client) -> awaitable<void> {
        auto positions = co_await client.positions();
        client.disconnect();

        boost::system::error_code ec;
        const auto update = co_await positions.next_timeout(2s, ec);
        EXPECT_FALSE(update.has_value());
        bool rejected = false;
        try {
            (void) co_await client.server_time();
        } catch (const boost::system::system_error &e) {
            rejected = true;
            EXPECT_EQ(e.code(), gw::error::errc::not_connected);
        }
        EXPECT_TRUE(rejected);
    });
    EXPECT_EQ(gateway.cancels, 0);
}

TEST_F(AsyncClientTest, DroppedSessionResetsStreamThenRecovers) {
    gateway.sessions = 2;
    gateway.drop_on = "61";
    run([this](gw::async::Client &client) -> awaitable<void> {
        auto positions = co_await client.positions();

        boost::system::error_code ec;
        const auto update = co_await positions.next_timeout(2s, ec);
        EXPECT_FALSE(update.has_value());
        EXPECT_EQ(ec, gw::error::errc::connection_reset);
        EXPECT_EQ(positions.state(), Positions::State::ERRORED);

        // waits out the re-handshake
        const auto now = co_await client.server_time();
        EXPECT_EQ(now, std::chrono::system_clock::time_point{std::chrono::seconds{kGatewayClock}});
        EXPECT_TRUE(client.is_connected());
        EXPECT_EQ(client.connection_metadata().next_order_id, 1000);
    });
    EXPECT_EQ(gateway.accepted, 2);
    // the session that knew the subscription is gone
    EXPECT_EQ(gateway.cancels, 0);
    EXPECT_TRUE(gateway.session_closed);
}

TEST_F(AsyncClientTest, RefusedReconnectsEndInNotConnected) {
    gateway.sessions = 1;
    gateway.drop_on = "61";
    max_retries = 2;
    run([](gw::async::Client &client) -> awaitable<void> {
        auto positions = co_await client.positions();

        boost::system::error_code ec;
        (void) co_await positions.next_timeout(2s, ec);
        EXPECT_EQ(ec, gw::error::errc::connection_reset);

        bool rejected = false;
        try {
            (void) co_await client.server_time();
        } catch (const boost::system::system_error &e) {
            rejected = true;
            EXPECT_EQ(e.code(), gw::error::errc::not_connected);
        }
        EXPECT_TRUE(rejected);
        EXPECT_FALSE(client.is_connected());

        rejected = false;
        try {
            auto again = co_await client.positions();
            (void) again;
        } catch (const boost::system::system_error &e) {
            rejected = true;
            EXPECT_EQ(e.code(), gw::error::errc::not_connected);
        }
        EXPECT_TRUE(rejected);
    });
    EXPECT_EQ(gateway.accepted, 1);
}
