#pragma once

#include <atomic>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "connection/Connection.hpp"
#include "transport/Channel.hpp"
#include "transport/ChannelRouter.hpp"
#include "transport/IdManager.hpp"
#include "transport/InternalSubscription.hpp"
#include "utils/Logger.hpp"

namespace gw::transport {
    /**
     * @brief Threaded message bus: one dispatcher thread reads and routes, callers write.
     *
     * Routing follows ChannelRouter.
     *
     * Reconnection: on socket loss every live channel receives connection_reset, then the
     * connection retries with Fibonacci backoff. Channels stay registered. When retries run
     * out the bus fails permanently and every later call throws not_connected.
     *
     * Must be owned by a shared_ptr; subscriptions hold weak references.
     */
    class MessageBus : public std::enable_shared_from_this<MessageBus> {
    public:
        explicit MessageBus(std::unique_ptr<connection::Connection> connection, LogFn log = {});

        MessageBus(const MessageBus &) = delete;

        MessageBus &operator=(const MessageBus &) = delete;

        ~MessageBus();

        /// Spawns the dispatcher thread. Called once after construction.
        void start();

        /// Stops the dispatcher and closes every channel. Idempotent.
        void shutdown();

        /// Blocks until the dispatcher exited (shutdown, gateway close, or reconnect exhaustion).
        void join();

        /// Persistent channel keyed by a request id the caller allocated.
        InternalSubscription send_request(int request_id, const protocol::RequestMessage &message);

        /// Persistent channel keyed by order id (placement, modification).
        InternalSubscription send_order(int order_id, const protocol::RequestMessage &message);

        /// Joins the shared channel for `kind` before the request is written.
        InternalSubscription send_shared_request(protocol::OutgoingMessage kind, const protocol::RequestMessage &message);

        /// Fire-and-forget write.
        void send_message(const protocol::RequestMessage &message);

        /// First reply on a request channel. Throws system_error(timeout) or the channel's error.
        protocol::ResponseMessage send_one_shot(int request_id, const protocol::RequestMessage &message,
                                                std::chrono::milliseconds timeout);

        /// First reply on a shared channel.
        protocol::ResponseMessage send_shared_one_shot(protocol::OutgoingMessage kind,
                                                       const protocol::RequestMessage &message,
                                                       std::chrono::milliseconds timeout);

        /// Copy of every order related frame. Only one at a time (already_subscribed).
        InternalSubscription create_order_update_subscription();

        void cancel_subscription(int request_id, const std::optional<protocol::RequestMessage> &message);

        void cancel_order_subscription(int order_id, const std::optional<protocol::RequestMessage> &message);

        void cancel_shared_subscription(protocol::OutgoingMessage kind,
                                        const std::optional<protocol::RequestMessage> &message);

        void release_request(int request_id) noexcept;

        void release_order(int order_id) noexcept;

        void detach_shared(protocol::OutgoingMessage kind) noexcept;

        void release_order_updates() noexcept;

        /// Waits out a reconnection. False on timeout, or when the bus failed or shut down.
        bool wait_until_connected(std::chrono::milliseconds timeout);

        [[nodiscard]] bool is_connected() const noexcept { return state_.load() == State::CONNECTED; }
        [[nodiscard]] bool has_failed() const noexcept { return state_.load() == State::FAILED; }
        [[nodiscard]] const ConnectionMetadata &metadata() const noexcept { return connection_->metadata(); }
        [[nodiscard]] int server_version() const noexcept { return connection_->server_version(); }
        [[nodiscard]] IdManager &ids() noexcept { return ids_; }

        /// Live request/order channels (diagnostics, tests).
        [[nodiscard]] std::size_t active_requests() const { return router_.active_requests(); }
        [[nodiscard]] std::size_t active_orders() const { return router_.active_orders(); }
        [[nodiscard]] int shared_subscribers(protocol::OutgoingMessage kind) const {
            return router_.shared_subscribers(kind);
        }

    private:
        enum class State : std::uint8_t { CONNECTED, RECONNECTING, FAILED, SHUTDOWN };

        void write_(const protocol::RequestMessage &message);

        void set_state_(State state); // write_mu_ held

        void dispatch_loop_();

        bool recover_(const boost::system::error_code &ec);

        void close_all_();

        static protocol::ResponseMessage await_reply_(BlockingChannel &channel, std::chrono::milliseconds timeout);

    private:
        std::unique_ptr<connection::Connection> connection_;
        IdManager ids_;
        Logger log_;

        std::atomic<State> state_{State::CONNECTED};
        std::atomic<bool> stop_{false};
        std::mutex write_mu_; // serializes frames, guards state changes seen by writers
        std::condition_variable state_cv_;
        std::thread reader_;

        ChannelRouter<BlockingChannel> router_;
    };
} // namespace gw::transport
