#pragma once

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include "utils/Logger.hpp"

namespace gw {
    /**
     * @brief Framed TCP session for the task model.
     *
     * Takes an already handshaken socket via start(). All socket state lives on one strand:
     * one read loop (4-byte prefix, then payload) and an outbox with at most one write in
     * flight. A failure closes the socket, fails every queued write, and reports once
     * through on_close. start() with a fresh socket begins a new session.
     */
    class AsyncTcpClient : public std::enable_shared_from_this<AsyncTcpClient> {
    public:
        using FrameHandler = std::function<void(std::string payload)>;
        using CloseHandler = std::function<void(const boost::system::error_code &)>;
        using WriteHandler = std::function<void(const boost::system::error_code &)>;

        static std::shared_ptr<AsyncTcpClient> create(boost::asio::io_context &ioc) {
            return std::shared_ptr<AsyncTcpClient>(new AsyncTcpClient(ioc));
        }

        AsyncTcpClient(const AsyncTcpClient &) = delete;

        AsyncTcpClient &operator=(const AsyncTcpClient &) = delete;

        void set_on_frame(FrameHandler h) { on_frame_ = std::move(h); }
        void set_on_close(CloseHandler h) { on_close_ = std::move(h); }
        void set_logger(LogFn fn) { log_.set_sink(std::move(fn)); }

        void start(boost::asio::ip::tcp::socket socket);

        /// Queues already framed bytes; `done` runs once the bytes left or the session failed.
        void send(std::string bytes, WriteHandler done = {});

        template<typename CompletionToken>
        auto async_send(std::string bytes, CompletionToken &&token) {
            return boost::asio::async_initiate<CompletionToken, void(boost::system::error_code)>(
                [self = shared_from_this(), bytes = std::move(bytes)](auto handler) mutable {
                    using Handler = std::decay_t<decltype(handler)>;
                    auto ex = boost::asio::get_associated_executor(handler);
                    auto h = std::make_shared<Handler>(std::move(handler));
                    self->send(std::move(bytes), [h, ex](const boost::system::error_code &ec) {
                        boost::asio::post(ex, [h, ec]() mutable { std::move(*h)(ec); });
                    });
                },
                token);
        }

        /// Closes without reporting through on_close.
        void close();

        [[nodiscard]] bool is_open() const noexcept { return open_.load(); }

    private:
        explicit AsyncTcpClient(boost::asio::io_context &ioc);

        struct Outgoing {
            std::string bytes;
            WriteHandler done;
        };

        void do_read_header_();

        void do_read_body_(std::uint32_t len);

        void start_write_();

        void do_write_();

        void fail_(boost::system::error_code ec, std::string_view where);

        void fail_outbox_(const boost::system::error_code &ec);

        void close_socket_hard_() noexcept;

    private:
        using tcp = boost::asio::ip::tcp;

        boost::asio::io_context &ioc_;
        boost::asio::strand<boost::asio::io_context::executor_type> strand_;
        tcp::socket socket_;

        unsigned char header_[4]{};
        std::string body_;

        std::uint64_t session_{0}; // bumped by start(); stale completions are ignored
        bool closing_{true};
        std::atomic<bool> open_{false};

        std::deque<Outgoing> outbox_;
        bool write_in_flight_{false};

        FrameHandler on_frame_;
        CloseHandler on_close_;
        Logger log_{"AsyncTcpClient"};
    };
} // namespace gw
