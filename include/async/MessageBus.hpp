#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "async/Connection.hpp"
#include "async/InternalSubscription.hpp"
#include "client_connection_handlers/AsyncTcpClient.hpp"
#include "transport/ChannelRouter.hpp"
#include "transport/IdManager.hpp"
#include "utils/Logger.hpp"

namespace gw::async {
    /**
     * @brief Task-model twin of transport::MessageBus.
     *
     * Reading is the AsyncTcpClient read loop; each frame is routed as it arrives. Sends are
     * awaitable and complete once the bytes left the socket. When the socket drops, every
     * live channel gets connection_reset and a reconnect task runs on the connection's strand;
     * when it gives up, channels get not_connected and close.
     */
    class MessageBus : public std::enable_shared_from_this<MessageBus> {
    public:
        MessageBus(boost::asio::io_context &ioc, std::unique_ptr<Connection> connection, LogFn log = {});

        ~MessageBus();

        MessageBus(const MessageBus &) = delete;

        MessageBus &operator=(const MessageBus &) = delete;

        /// Starts the read loop over a handshaken socket.
        void start(boost::asio::ip::tcp::socket socket);

        /// Idempotent. Ends every channel.
        void shutdown();

        boost::asio::awaitable<InternalSubscription> send_request(int request_id, protocol::RequestMessage message);

        boost::asio::awaitable<InternalSubscription> send_order(int order_id, protocol::RequestMessage message);

        boost::asio::awaitable<InternalSubscription> send_shared_request(protocol::OutgoingMessage kind,
                                                                         protocol::RequestMessage message);

        boost::asio::awaitable<void> send_message(protocol::RequestMessage message);

        boost::asio::awaitable<protocol::ResponseMessage> send_one_shot(int request_id,
                                                                        protocol::RequestMessage message,
                                                                        std::chrono::milliseconds timeout);

        boost::asio::awaitable<protocol::ResponseMessage> send_shared_one_shot(protocol::OutgoingMessage kind,
                                                                               protocol::RequestMessage message,
                                                                               std::chrono::milliseconds timeout);

        InternalSubscription create_order_update_subscription();

        /// Release first, then queue the cancel frame. Safe from any task or thread.
        void cancel_subscription(int request_id, const std::optional<protocol::RequestMessage> &message);

        void cancel_order_subscription(int order_id, const std::optional<protocol::RequestMessage> &message);

        void cancel_shared_subscription(protocol::OutgoingMessage kind,
                                        const std::optional<protocol::RequestMessage> &message);

        void release_request(int request_id) noexcept;

        void release_order(int order_id) noexcept;

        void detach_shared(protocol::OutgoingMessage kind) noexcept;

        void release_order_updates() noexcept;

        /// Waits out a reconnection. True when connected at return.
        boost::asio::awaitable<bool> wait_until_connected(std::chrono::milliseconds timeout);

        [[nodiscard]] bool is_connected() const noexcept { return state_.load() == State::CONNECTED; }
        [[nodiscard]] bool has_failed() const noexcept { return state_.load() == State::FAILED; }
        [[nodiscard]] const ConnectionMetadata &metadata() const noexcept { return connection_->metadata(); }
        [[nodiscard]] int server_version() const noexcept { return connection_->server_version(); }
        [[nodiscard]] transport::IdManager &ids() noexcept { return ids_; }
        [[nodiscard]] boost::asio::any_io_executor get_executor() const noexcept { return ioc_.get_executor(); }

        [[nodiscard]] std::size_t active_requests() const { return router_.active_requests(); }
        [[nodiscard]] std::size_t active_orders() const { return router_.active_orders(); }
        [[nodiscard]] int shared_subscribers(protocol::OutgoingMessage kind) const {
            return router_.shared_subscribers(kind);
        }

    private:
        enum class State : std::uint8_t { CONNECTED, RECONNECTING, FAILED, SHUTDOWN };

        void check_writable_() const;

        boost::asio::awaitable<void> write_(protocol::RequestMessage message);

        void post_(const protocol::RequestMessage &message);

        void on_frame_(std::string payload);

        void on_close_(const boost::system::error_code &ec);

        void fail_(const std::string &why);

        static boost::asio::awaitable<void> recover_(std::shared_ptr<MessageBus> self);

        static boost::asio::awaitable<protocol::ResponseMessage> await_reply_(std::shared_ptr<ResponseQueue> queue,
                                                                              std::chrono::milliseconds timeout);

    private:
        boost::asio::io_context &ioc_;
        std::unique_ptr<Connection> connection_;
        std::shared_ptr<AsyncTcpClient> tcp_;
        transport::IdManager ids_;
        Logger log_;

        std::atomic<State> state_{State::CONNECTED};
        std::atomic<bool> stop_{false};

        transport::ChannelRouter<ResponseQueue> router_;
    };
} // namespace gw::async
