#include "async/InternalSubscription.hpp"

#include <boost/asio/use_awaitable.hpp>

#include <utility>

#include "async/MessageBus.hpp"

namespace gw::async {
    using boost::asio::awaitable;
    using boost::asio::use_awaitable;
    using transport::Response;

    InternalSubscription::InternalSubscription(Kind kind,
                                               std::shared_ptr<ResponseQueue> queue,
                                               std::weak_ptr<MessageBus> bus,
                                               int id,
                                               std::optional<protocol::OutgoingMessage> shared_kind)
        : kind_(kind),
          queue_(std::move(queue)),
          bus_(std::move(bus)),
          id_(id),
          shared_kind_(shared_kind),
          released_(false) {
    }

    InternalSubscription::InternalSubscription(InternalSubscription &&other) noexcept
        : kind_(other.kind_),
          queue_(std::move(other.queue_)),
          bus_(std::move(other.bus_)),
          id_(other.id_),
          shared_kind_(other.shared_kind_),
          released_(other.released_.exchange(true)) {
    }

    InternalSubscription &InternalSubscription::operator=(InternalSubscription &&other) noexcept {
        if (this != &other) {
            release();
            kind_ = other.kind_;
            queue_ = std::move(other.queue_);
            bus_ = std::move(other.bus_);
            id_ = other.id_;
            shared_kind_ = other.shared_kind_;
            released_ = other.released_.exchange(true);
        }
        return *this;
    }

    InternalSubscription::~InternalSubscription() {
        release();
    }

    // A shared queue outlives this handle, so a wake-up without an item is only an
    // end once the queue closed or this handle let go.
    awaitable<std::optional<Response> > InternalSubscription::next() {
        auto queue = queue_;
        if (!queue) co_return std::nullopt;
        for (;;) {
            auto item = co_await queue->async_pop(use_awaitable);
            if (item || released_.load() || queue->closed()) co_return item;
        }
    }

    std::optional<Response> InternalSubscription::try_next() {
        if (!queue_ || released_.load()) return std::nullopt;
        return queue_->try_pop();
    }

    awaitable<std::optional<Response> > InternalSubscription::next_timeout(std::chrono::milliseconds timeout) {
        auto queue = queue_;
        if (!queue) co_return std::nullopt;
        co_return co_await queue->async_pop_for(timeout, use_awaitable);
    }

    void InternalSubscription::cancel(const std::optional<protocol::RequestMessage> &cancel_message) {
        if (released_.exchange(true)) return;
        if (queue_) queue_->interrupt();

        auto bus = bus_.lock();
        if (!bus) return;
        switch (kind_) {
            case Kind::Request:
                bus->cancel_subscription(id_, cancel_message);
                break;
            case Kind::Order:
                bus->cancel_order_subscription(id_, cancel_message);
                break;
            case Kind::Shared:
                if (shared_kind_) bus->cancel_shared_subscription(*shared_kind_, cancel_message);
                break;
            case Kind::OrderUpdates:
                bus->release_order_updates();
                break;
        }
    }

    void InternalSubscription::release() noexcept {
        if (released_.exchange(true)) return;
        if (queue_) queue_->interrupt();

        auto bus = bus_.lock();
        if (!bus) return;
        switch (kind_) {
            case Kind::Request:
                bus->release_request(id_);
                break;
            case Kind::Order:
                bus->release_order(id_);
                break;
            case Kind::Shared:
                if (shared_kind_) bus->detach_shared(*shared_kind_);
                break;
            case Kind::OrderUpdates:
                bus->release_order_updates();
                break;
        }
    }
} // namespace gw::async
