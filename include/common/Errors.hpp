#pragma once

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

namespace gw::error {
    /**
     * @brief Error conditions raised by the transport and subscription engine.
     *
     * Semantics:
     *  - connection_failed    : initial connect or reconnect could not establish a session.
     *  - handshake_incomplete : the stream ended before the startup exchange finished.
     *  - connection_reset     : mid-session socket loss; recoverable, drives reconnection.
     *  - timeout              : a caller-specified wait elapsed.
     *  - decode_error         : a field could not be parsed as the requested type.
     *  - truncated_message    : fewer fields remained than were requested.
     *  - not_connected        : the bus gave up reconnecting; every later operation fails fast.
     *  - invalid_request      : a call lacked a required precondition (e.g. missing request id).
     *  - server_error         : the gateway answered a request with an error frame (see ServerError).
     */
    enum class errc {
        connection_failed = 1,
        handshake_incomplete,
        connection_reset,
        timeout,
        decode_error,
        truncated_message,
        not_connected,
        cancelled,
        shutdown,
        already_subscribed,
        unexpected_response,
        invalid_request,
        end_of_stream,
        server_error
    };

    const boost::system::error_category &category() noexcept;

    inline boost::system::error_code make_error_code(errc e) noexcept {
        return {static_cast<int>(e), category()};
    }
} // namespace gw::error

namespace boost::system {
    template<>
    struct is_error_code_enum<gw::error::errc> : std::true_type {
    };
} // namespace boost::system

namespace gw {
    /// True for socket failures the message bus recovers from by reconnecting.
    [[nodiscard]] bool is_connection_error(const boost::system::error_code &ec) noexcept;

    /**
     * @brief Raised by the field reader when a token cannot be read as the requested type.
     *
     * code() is either error::errc::decode_error or error::errc::truncated_message.
     */
    class DecodeError : public boost::system::system_error {
    public:
        DecodeError(error::errc code, std::size_t field_index, std::string expected_type, const std::string &token);

        [[nodiscard]] std::size_t field_index() const noexcept { return field_index_; }
        [[nodiscard]] const std::string &expected_type() const noexcept { return expected_type_; }

    private:
        std::size_t field_index_;
        std::string expected_type_;
    };

    /// Gateway error frame addressed to one request: [4, version, request_id, code, message].
    struct Notice {
        int code{-1};
        std::string message;

        [[nodiscard]] std::string to_string() const { return "[" + std::to_string(code) + "] " + message; }
    };

    /// Raised by decoders when a request's reply is an error frame.
    class ServerError : public boost::system::system_error {
    public:
        explicit ServerError(Notice notice)
            : boost::system::system_error(error::make_error_code(error::errc::server_error), notice.to_string()),
              notice_(std::move(notice)) {
        }

        [[nodiscard]] const Notice &notice() const noexcept { return notice_; }

    private:
        Notice notice_;
    };

    [[noreturn]] void throw_error(const boost::system::error_code &ec, const char *what);

    /// Asio-style helper: throws when ec is set.
    inline void throw_if(const boost::system::error_code &ec, const char *what) {
        if (ec) throw_error(ec, what);
    }
} // namespace gw
