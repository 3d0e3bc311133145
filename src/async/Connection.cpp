#include "async/Connection.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include "common/Errors.hpp"
#include "utils/DebugConfigUtils.hpp"

namespace gw::async {
    namespace asio = boost::asio;
    using asio::awaitable;
    using asio::use_awaitable;

    Connection::Connection(asio::any_io_executor ex, std::string host, std::uint16_t port, int client_id,
                           connection::ConnectionOptions options)
        : ex_(std::move(ex)),
          host_(std::move(host)),
          port_(port),
          client_id_(client_id),
          options_(std::move(options)),
          handler_(options_.min_version, options_.max_version),
          backoff_timer_(ex_),
          log_("AsyncConnection", options_.log) {
        metadata_.client_id = client_id_;
    }

    awaitable<Connection::tcp::socket> Connection::connect() {
        boost::system::error_code ec;
        tcp::resolver resolver(ex_);
        const auto endpoints = co_await resolver.async_resolve(host_, std::to_string(port_),
                                                               asio::redirect_error(use_awaitable, ec));
        if (ec) {
            throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                              host_ + ":" + std::to_string(port_) + ": " + ec.message());
        }

        tcp::socket socket(ex_);
        co_await asio::async_connect(socket, endpoints, asio::redirect_error(use_awaitable, ec));
        if (ec) {
            throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                              host_ + ":" + std::to_string(port_) + ": " + ec.message());
        }
        socket.set_option(tcp::no_delay(true), ec);
        if (ec) log_.warn("no_delay: " + ec.message());

        auto fresh = co_await handshake_(socket);
        if (!established_) {
            metadata_ = std::move(fresh);
            established_ = true;
        } else {
            connection::log_metadata_changes(metadata_, fresh, log_);
        }
        co_return socket;
    }

    awaitable<Connection::tcp::socket> Connection::reconnect() {
        auto backoff = options_.reconnect.make_backoff();
        const int max_retries = options_.reconnect.max_retries;
        for (int attempt = 1; attempt <= max_retries && !stopped_; ++attempt) {
            const auto delay = backoff.next_delay();
            log_.info("next reconnection attempt in " + std::to_string(delay.count()) + "ms");

            boost::system::error_code ec;
            backoff_timer_.expires_after(delay);
            co_await backoff_timer_.async_wait(asio::redirect_error(use_awaitable, ec));
            if (stopped_) break;

            try {
                auto socket = co_await connect();
                if (stopped_) break;
                log_.info("reconnected");
                co_return socket;
            } catch (const boost::system::system_error &e) {
                log_.info("reconnection attempt " + std::to_string(attempt) + "/" + std::to_string(max_retries) +
                          " failed: " + e.what());
            }
        }
        throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                          stopped_ ? "shut down while reconnecting" : "reconnection attempts exhausted");
    }

    void Connection::cancel_wait() noexcept {
        stopped_ = true;
        backoff_timer_.cancel();
    }

    awaitable<ConnectionMetadata> Connection::handshake_(tcp::socket &socket) {
        ConnectionMetadata meta;
        meta.client_id = client_id_;

        boost::system::error_code ec;
        log_.debug("-> handshake v" + std::to_string(handler_.min_version()) + ".." +
                   std::to_string(handler_.max_version()));
        co_await write_bytes_(socket, handler_.format_handshake(), ec);
        if (ec) throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                                  "handshake write: " + ec.message());

        auto ack = co_await read_message_(socket, ec);
        if (ec == asio::error::eof) {
            throw boost::system::system_error(error::make_error_code(error::errc::handshake_incomplete),
                                              "the gateway may be rejecting connections from this host");
        }
        if (ec) throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                                  "handshake read: " + ec.message());

        const auto data = handler_.parse_handshake_response(ack);
        meta.server_version = data.server_version;
        std::tie(meta.connection_time, meta.time_zone) = connection::parse_connection_time(data.server_time, log_);
        log_.info("server version " + std::to_string(meta.server_version) + ", connection time " + data.server_time);

        const auto start_api = handler_.format_start_api(client_id_, meta.server_version);
        record_request(start_api);
        co_await write_bytes_(socket, protocol::encode_frame(start_api), ec);
        if (ec) throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                                  "start api: " + ec.message());

        bool saw_order_id = false;
        bool saw_accounts = false;
        for (int frames = 0; frames < connection::kMaxAccountInfoFrames; ++frames) {
            auto message = co_await read_message_(socket, ec);
            if (ec == asio::error::eof) {
                throw boost::system::system_error(error::make_error_code(error::errc::handshake_incomplete),
                                                  "stream ended while reading account info");
            }
            if (ec) throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                                      "account info: " + ec.message());

            const auto info = handler_.parse_account_info(message, options_.startup, log_);
            if (connection::apply_account_info(info, meta, saw_order_id, saw_accounts)) co_return meta;
        }
        log_.warn("account info incomplete after " + std::to_string(connection::kMaxAccountInfoFrames) + " frames");
        co_return meta;
    }

    awaitable<protocol::ResponseMessage> Connection::read_message_(tcp::socket &socket,
                                                                   boost::system::error_code &ec) {
        unsigned char prefix[4];
        co_await asio::async_read(socket, asio::buffer(prefix), asio::redirect_error(use_awaitable, ec));
        if (ec) co_return protocol::ResponseMessage{};

        const auto len = protocol::decode_length(prefix);
        if (len > protocol::kMaxFrameSize) {
            ec = error::make_error_code(error::errc::connection_reset);
            co_return protocol::ResponseMessage{};
        }
        std::string payload(len, '\0');
        if (len > 0) {
            co_await asio::async_read(socket, asio::buffer(payload), asio::redirect_error(use_awaitable, ec));
            if (ec) co_return protocol::ResponseMessage{};
        }
        auto message = protocol::ResponseMessage::from(payload);
        record_response(message);
        co_return message;
    }

    awaitable<void> Connection::write_bytes_(tcp::socket &socket, std::string bytes, boost::system::error_code &ec) {
        co_await asio::async_write(socket, asio::buffer(bytes), asio::redirect_error(use_awaitable, ec));
    }

    void Connection::record_request(const protocol::RequestMessage &message) const {
        if (options_.recorder) options_.recorder->record_request(message);
        if (debug::dbg_on()) debug::dbg_raw("->", message.encode_simple());
    }

    void Connection::record_response(const protocol::ResponseMessage &message) const {
        if (debug::dbg_on()) debug::dbg_raw("<-", message.encode_simple());
        if (options_.recorder) options_.recorder->record_response(message);
    }
} // namespace gw::async
