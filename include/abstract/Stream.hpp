#pragma once

#include <boost/system/error_code.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace gw {
    /**
     * @brief Byte stream under the blocking message bus.
     *
     * Threading:
     *   - read_frame() is only ever called from one thread (the dispatcher, or the
     *     connection during the startup exchange).
     *   - write_all() may be called from any thread; implementations serialize writers.
     *   - shutdown() may be called from any thread and must unblock a pending read_frame().
     *
     * Contract:
     *   - read_frame() returns one payload without its length prefix. End of stream is
     *     reported as boost::asio::error::eof.
     *   - reconnect() replaces the underlying socket with a fresh connection to the same
     *     endpoint; the handshake is the caller's job.
     */
    struct IStream {
        virtual ~IStream() = default;

        /// Block until one whole frame arrived.
        virtual std::string read_frame(boost::system::error_code &ec) = 0;

        /// Write raw bytes (already framed). All or nothing.
        virtual void write_all(std::string_view bytes, boost::system::error_code &ec) = 0;

        /// Open a new connection to the original endpoint.
        virtual void reconnect(boost::system::error_code &ec) = 0;

        /// Backoff hook; tests override it to avoid real sleeps.
        virtual void sleep(std::chrono::milliseconds d) = 0;

        /// Close both halves. Idempotent, never throws.
        virtual void shutdown() noexcept = 0;
    };
} // namespace gw
