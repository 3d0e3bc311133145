#include "common/Errors.hpp"

#include <boost/asio/error.hpp>

namespace gw {
    namespace {
        class gw_category final : public boost::system::error_category {
        public:
            const char *name() const noexcept override { return "gwlink"; }

            std::string message(int ev) const override {
                switch (static_cast<error::errc>(ev)) {
                    case error::errc::connection_failed: return "connection failed";
                    case error::errc::handshake_incomplete: return "stream ended before the handshake completed";
                    case error::errc::connection_reset: return "connection reset";
                    case error::errc::timeout: return "timed out";
                    case error::errc::decode_error: return "field could not be decoded";
                    case error::errc::truncated_message: return "message truncated";
                    case error::errc::not_connected: return "not connected";
                    case error::errc::cancelled: return "cancelled";
                    case error::errc::shutdown: return "message bus shut down";
                    case error::errc::already_subscribed: return "already subscribed";
                    case error::errc::unexpected_response: return "unexpected response";
                    case error::errc::invalid_request: return "invalid request";
                    case error::errc::end_of_stream: return "end of stream";
                    case error::errc::server_error: return "gateway reported an error";
                }
                return "unknown gwlink error";
            }
        };
    } // namespace

    const boost::system::error_category &error::category() noexcept {
        static const gw_category instance;
        return instance;
    }

    bool is_connection_error(const boost::system::error_code &ec) noexcept {
        namespace ae = boost::asio::error;
        return ec == ae::eof
               || ec == ae::connection_reset
               || ec == ae::connection_aborted
               || ec == ae::broken_pipe
               || ec == ae::not_connected
               || ec == ae::connection_refused
               || ec == error::errc::connection_reset;
    }

    DecodeError::DecodeError(error::errc code, std::size_t field_index, std::string expected_type,
                             const std::string &token)
        : boost::system::system_error(error::make_error_code(code),
                                      "field " + std::to_string(field_index) + " expected " + expected_type +
                                      (code == error::errc::truncated_message ? "" : ", found '" + token + "'")),
          field_index_(field_index),
          expected_type_(std::move(expected_type)) {
    }

    void throw_error(const boost::system::error_code &ec, const char *what) {
        throw boost::system::system_error(ec, what);
    }
} // namespace gw
