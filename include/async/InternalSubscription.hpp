#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "async/AsyncQueue.hpp"
#include "protocol/Messages.hpp"
#include "protocol/WireCodec.hpp"
#include "transport/Channel.hpp"
#include "transport/InternalSubscription.hpp"

namespace gw::async {
    class MessageBus;

    using ResponseQueue = AsyncQueue<transport::Response>;

    /**
     * @brief Consuming end of one task-model channel, before decoding.
     *
     * Same contract as transport::InternalSubscription, with awaitable reads.
     * Releasing wakes a read parked on this handle; it then reports the end.
     */
    class InternalSubscription {
    public:
        using Kind = transport::InternalSubscription::Kind;

        InternalSubscription() = default;

        InternalSubscription(Kind kind,
                             std::shared_ptr<ResponseQueue> queue,
                             std::weak_ptr<MessageBus> bus,
                             int id,
                             std::optional<protocol::OutgoingMessage> shared_kind = std::nullopt);

        InternalSubscription(InternalSubscription &&other) noexcept;

        InternalSubscription &operator=(InternalSubscription &&other) noexcept;

        InternalSubscription(const InternalSubscription &) = delete;

        InternalSubscription &operator=(const InternalSubscription &) = delete;

        ~InternalSubscription();

        /// nullopt once the channel is closed and empty, or this handle was released.
        boost::asio::awaitable<std::optional<transport::Response> > next();

        std::optional<transport::Response> try_next();

        boost::asio::awaitable<std::optional<transport::Response> > next_timeout(std::chrono::milliseconds timeout);

        /// Detaches from the bus, queueing `cancel_message` first when given. Throws while the session is down.
        void cancel(const std::optional<protocol::RequestMessage> &cancel_message);

        /// Detaches without writing. Idempotent.
        void release() noexcept;

        [[nodiscard]] Kind kind() const noexcept { return kind_; }
        [[nodiscard]] int id() const noexcept { return id_; }
        [[nodiscard]] std::optional<protocol::OutgoingMessage> shared_kind() const noexcept { return shared_kind_; }
        [[nodiscard]] bool valid() const noexcept { return queue_ != nullptr; }
        [[nodiscard]] bool released() const noexcept { return released_.load(); }
        [[nodiscard]] bool closed() const { return !queue_ || released_.load() || queue_->closed(); }

    private:
        Kind kind_{Kind::Request};
        std::shared_ptr<ResponseQueue> queue_;
        std::weak_ptr<MessageBus> bus_;
        int id_{-1};
        std::optional<protocol::OutgoingMessage> shared_kind_;
        std::atomic<bool> released_{true};
    };
} // namespace gw::async
