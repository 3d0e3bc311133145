#include "connection/Connection.hpp"

#include <boost/asio/error.hpp>

#include "common/Errors.hpp"
#include "utils/DebugConfigUtils.hpp"

namespace gw::connection {
    Connection::Connection(std::unique_ptr<IStream> stream, int client_id, ConnectionOptions options)
        : stream_(std::move(stream)),
          client_id_(client_id),
          options_(std::move(options)),
          handler_(options_.min_version, options_.max_version),
          log_("Connection", options_.log) {
        metadata_.client_id = client_id_;
    }

    void Connection::establish_connection() {
        auto fresh = handshake_();
        if (!established_) {
            metadata_ = std::move(fresh);
            established_ = true;
            return;
        }
        log_metadata_changes(metadata_, fresh, log_);
    }

    ConnectionMetadata Connection::handshake_() {
        ConnectionMetadata meta;
        meta.client_id = client_id_;

        boost::system::error_code ec;
        const auto preamble = handler_.format_handshake();
        log_.debug("-> handshake v" + std::to_string(handler_.min_version()) + ".." +
                   std::to_string(handler_.max_version()));
        stream_->write_all(preamble, ec);
        if (ec) throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                                  "handshake write: " + ec.message());

        auto ack = read_message(ec);
        if (ec == boost::asio::error::eof) {
            throw boost::system::system_error(error::make_error_code(error::errc::handshake_incomplete),
                                              "the gateway may be rejecting connections from this host");
        }
        if (ec) throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                                  "handshake read: " + ec.message());

        const auto data = handler_.parse_handshake_response(ack);
        meta.server_version = data.server_version;
        std::tie(meta.connection_time, meta.time_zone) = parse_connection_time(data.server_time, log_);
        log_.info("server version " + std::to_string(meta.server_version) + ", connection time " + data.server_time);

        write_message(handler_.format_start_api(client_id_, meta.server_version), ec);
        if (ec) throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                                  "start api: " + ec.message());

        bool saw_order_id = false;
        bool saw_accounts = false;
        for (int frames = 0; frames < kMaxAccountInfoFrames; ++frames) {
            auto message = read_message(ec);
            if (ec == boost::asio::error::eof) {
                throw boost::system::system_error(error::make_error_code(error::errc::handshake_incomplete),
                                                  "stream ended while reading account info");
            }
            if (ec) throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                                      "account info: " + ec.message());

            const auto info = handler_.parse_account_info(message, options_.startup, log_);
            if (apply_account_info(info, meta, saw_order_id, saw_accounts)) return meta;
        }
        log_.warn("account info incomplete after " + std::to_string(kMaxAccountInfoFrames) + " frames");
        return meta;
    }

    void Connection::reconnect() {
        auto backoff = options_.reconnect.make_backoff();
        const int max_retries = options_.reconnect.max_retries;
        for (int attempt = 1; attempt <= max_retries; ++attempt) {
            const auto delay = backoff.next_delay();
            log_.info("next reconnection attempt in " + std::to_string(delay.count()) + "ms");
            stream_->sleep(delay);

            boost::system::error_code ec;
            stream_->reconnect(ec);
            if (ec == boost::asio::error::operation_aborted) break; // shut down while waiting
            if (ec) {
                log_.info("reconnection attempt " + std::to_string(attempt) + "/" + std::to_string(max_retries) +
                          " failed: " + ec.message());
                continue;
            }
            try {
                establish_connection();
                log_.info("reconnected");
                return;
            } catch (const boost::system::system_error &e) {
                log_.warn("re-handshake attempt " + std::to_string(attempt) + " failed: " + e.what());
            }
        }
        throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                          "reconnection attempts exhausted");
    }

    void Connection::write_message(const protocol::RequestMessage &message, boost::system::error_code &ec) {
        if (options_.recorder) options_.recorder->record_request(message);
        if (debug::dbg_on()) debug::dbg_raw("->", message.encode_simple());
        stream_->write_all(protocol::encode_frame(message), ec);
    }

    void Connection::write_message(const protocol::RequestMessage &message) {
        boost::system::error_code ec;
        write_message(message, ec);
        throw_if(ec, "write_message");
    }

    protocol::ResponseMessage Connection::read_message(boost::system::error_code &ec) {
        const auto payload = stream_->read_frame(ec);
        if (ec) return {};
        auto message = protocol::ResponseMessage::from(payload);
        if (debug::dbg_on()) debug::dbg_raw("<-", message.encode_simple());
        if (options_.recorder) options_.recorder->record_response(message);
        return message;
    }
} // namespace gw::connection
