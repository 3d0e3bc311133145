#include "transport/InternalSubscription.hpp"

#include <utility>

#include "transport/MessageBus.hpp"

namespace gw::transport {
    InternalSubscription::InternalSubscription(Kind kind,
                                               std::shared_ptr<BlockingChannel> channel,
                                               std::weak_ptr<MessageBus> bus,
                                               int id,
                                               std::optional<protocol::OutgoingMessage> shared_kind)
        : kind_(kind),
          channel_(std::move(channel)),
          bus_(std::move(bus)),
          id_(id),
          shared_kind_(shared_kind),
          released_(false) {
    }

    InternalSubscription::InternalSubscription(InternalSubscription &&other) noexcept
        : kind_(other.kind_),
          channel_(std::move(other.channel_)),
          bus_(std::move(other.bus_)),
          id_(other.id_),
          shared_kind_(other.shared_kind_),
          released_(other.released_.exchange(true)) {
    }

    InternalSubscription &InternalSubscription::operator=(InternalSubscription &&other) noexcept {
        if (this != &other) {
            release();
            kind_ = other.kind_;
            channel_ = std::move(other.channel_);
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

    // A shared channel stays open after this handle lets go, so waits also end on released_.
    std::optional<Response> InternalSubscription::next() {
        if (!channel_ || released_.load()) return std::nullopt;
        return channel_->pop(&released_);
    }

    std::optional<Response> InternalSubscription::try_next() {
        if (!channel_ || released_.load()) return std::nullopt;
        return channel_->try_pop();
    }

    std::optional<Response> InternalSubscription::next_timeout(std::chrono::milliseconds timeout) {
        if (!channel_ || released_.load()) return std::nullopt;
        return channel_->pop_for(timeout, &released_);
    }

    void InternalSubscription::cancel(const std::optional<protocol::RequestMessage> &cancel_message) {
        if (released_.exchange(true)) return;
        if (channel_) channel_->interrupt();

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
        if (channel_) channel_->interrupt();

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
} // namespace gw::transport
