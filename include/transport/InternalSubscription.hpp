#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "protocol/Messages.hpp"
#include "protocol/WireCodec.hpp"
#include "transport/Channel.hpp"

namespace gw::transport {
    class MessageBus;

    /**
     * @brief Consuming end of one bus channel, before decoding.
     *
     * Move-only. Destruction releases the channel from the bus without sending anything;
     * the typed Subscription decides whether a cancel frame goes out first.
     */
    class InternalSubscription {
    public:
        enum class Kind { Request, Order, Shared, OrderUpdates };

        InternalSubscription() = default;

        InternalSubscription(Kind kind,
                             std::shared_ptr<BlockingChannel> channel,
                             std::weak_ptr<MessageBus> bus,
                             int id,
                             std::optional<protocol::OutgoingMessage> shared_kind = std::nullopt);

        InternalSubscription(InternalSubscription &&other) noexcept;

        InternalSubscription &operator=(InternalSubscription &&other) noexcept;

        InternalSubscription(const InternalSubscription &) = delete;

        InternalSubscription &operator=(const InternalSubscription &) = delete;

        ~InternalSubscription();

        /// Blocks; nullopt once the channel is closed and empty, or this handle is released.
        std::optional<Response> next();

        std::optional<Response> try_next();

        std::optional<Response> next_timeout(std::chrono::milliseconds timeout);

        /**
         * Detaches from the bus, writing `cancel_message` first when given.
         * Throws system_error when the write fails; the channel is released either way.
         */
        void cancel(const std::optional<protocol::RequestMessage> &cancel_message);

        /// Detaches without writing. Idempotent.
        void release() noexcept;

        [[nodiscard]] Kind kind() const noexcept { return kind_; }
        [[nodiscard]] int id() const noexcept { return id_; }
        [[nodiscard]] std::optional<protocol::OutgoingMessage> shared_kind() const noexcept { return shared_kind_; }
        [[nodiscard]] bool valid() const noexcept { return channel_ != nullptr; }
        [[nodiscard]] bool closed() const { return !channel_ || channel_->closed(); }

    private:
        Kind kind_{Kind::Request};
        std::shared_ptr<BlockingChannel> channel_;
        std::weak_ptr<MessageBus> bus_;
        int id_{-1};
        std::optional<protocol::OutgoingMessage> shared_kind_;
        std::atomic<bool> released_{true};
    };
} // namespace gw::transport
