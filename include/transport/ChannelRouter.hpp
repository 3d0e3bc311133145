#pragma once

#include <boost/system/error_code.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "common/Errors.hpp"
#include "protocol/ChannelTable.hpp"
#include "transport/Channel.hpp"
#include "utils/Logger.hpp"

namespace gw::transport {
    /// Key -> channel map behind one mutex.
    template<typename Key, typename Channel>
    class ChannelMap {
    public:
        using ChannelPtr = std::shared_ptr<Channel>;

        /// False when the key is taken.
        bool insert(const Key &key, ChannelPtr channel) {
            std::lock_guard lk(mu_);
            return map_.emplace(key, std::move(channel)).second;
        }

        ChannelPtr find(const Key &key) const {
            std::lock_guard lk(mu_);
            auto it = map_.find(key);
            return it == map_.end() ? nullptr : it->second;
        }

        ChannelPtr erase(const Key &key) {
            std::lock_guard lk(mu_);
            auto it = map_.find(key);
            if (it == map_.end()) return nullptr;
            auto channel = std::move(it->second);
            map_.erase(it);
            return channel;
        }

        void for_each(const std::function<void(const ChannelPtr &)> &fn) const {
            std::lock_guard lk(mu_);
            for (const auto &[key, channel]: map_) fn(channel);
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard lk(mu_);
            return map_.size();
        }

    private:
        mutable std::mutex mu_;
        std::unordered_map<Key, ChannelPtr> map_;
    };

    /**
     * @brief Correlation state of one session and the routing of incoming frames.
     *
     * Shared by both bus flavours; Channel is BlockingChannel (threads) or
     * async::AsyncQueue<Response> (coroutines). Needs push(Response), close(), clear(), closed().
     *
     * Routing of an incoming frame:
     *   - Error frames: request id -1 or warning codes (2100..2169) are logged. The rest go
     *     to the order-update stream and to the request or order channel with that id.
     *   - Order families: OpenOrder/OrderStatus by order id, else the shared open-orders
     *     channel. ExecutionData by order id, then request id; its execution id is remembered
     *     so the CommissionsReport follows it. Completed orders and the end markers are shared.
     *   - Frames carrying a request id: request channel, then order channel, then shared.
     *   - Everything else: shared channels by message type.
     * Frames with no recipient are logged and dropped.
     */
    template<typename Channel>
    class ChannelRouter {
    public:
        using ChannelPtr = std::shared_ptr<Channel>;

        explicit ChannelRouter(Logger log) : log_(std::move(log)) {
            for (const auto &mapping: protocol::channel_mappings()) {
                shared_.emplace(mapping.request, SharedEntry{std::make_shared<Channel>(), 0});
            }
        }

        ChannelRouter(const ChannelRouter &) = delete;

        ChannelRouter &operator=(const ChannelRouter &) = delete;

        ChannelPtr add_request(int request_id) {
            ensure_open_();
            auto channel = std::make_shared<Channel>();
            if (!requests_.insert(request_id, channel)) {
                throw boost::system::system_error(error::make_error_code(error::errc::invalid_request),
                                                  "request id " + std::to_string(request_id) + " is in use");
            }
            return channel;
        }

        ChannelPtr add_order(int order_id) {
            ensure_open_();
            auto channel = std::make_shared<Channel>();
            if (!orders_.insert(order_id, channel)) {
                throw boost::system::system_error(error::make_error_code(error::errc::already_subscribed),
                                                  "order id " + std::to_string(order_id) + " is in use");
            }
            return channel;
        }

        /// Joins the shared channel; the first subscriber drops frames left by earlier ones.
        ChannelPtr attach_shared(protocol::OutgoingMessage kind) {
            std::lock_guard lk(shared_mu_);
            auto it = shared_.find(kind);
            if (it == shared_.end()) {
                throw boost::system::system_error(error::make_error_code(error::errc::invalid_request),
                                                  "no shared channel for request " +
                                                  std::to_string(protocol::to_int(kind)));
            }
            auto &entry = it->second;
            if (entry.channel->closed()) {
                throw boost::system::system_error(error::make_error_code(error::errc::not_connected));
            }
            if (entry.subscribers++ == 0) entry.channel->clear();
            return entry.channel;
        }

        ChannelPtr open_order_updates() {
            std::lock_guard lk(order_updates_mu_);
            if (order_updates_) {
                throw boost::system::system_error(error::make_error_code(error::errc::already_subscribed),
                                                  "order update stream");
            }
            ensure_open_();
            order_updates_ = std::make_shared<Channel>();
            return order_updates_;
        }

        [[nodiscard]] ChannelPtr find_request(int request_id) const { return requests_.find(request_id); }

        void release_request(int request_id) noexcept {
            if (auto channel = requests_.erase(request_id)) {
                channel->close();
                forget_executions_(channel);
            }
        }

        void release_order(int order_id) noexcept {
            if (auto channel = orders_.erase(order_id)) {
                channel->close();
                forget_executions_(channel);
            }
        }

        void detach_shared(protocol::OutgoingMessage kind) noexcept {
            std::lock_guard lk(shared_mu_);
            auto it = shared_.find(kind);
            if (it != shared_.end() && it->second.subscribers > 0) --it->second.subscribers;
        }

        void release_order_updates() noexcept {
            std::lock_guard lk(order_updates_mu_);
            if (order_updates_) {
                order_updates_->close();
                order_updates_.reset();
            }
        }

        void dispatch(protocol::ResponseMessage message) {
            const auto d = protocol::determine_routing(message);
            switch (d.kind) {
                case protocol::RoutingDecision::Kind::Error:
                    route_error_(std::move(message), d);
                    break;
                case protocol::RoutingDecision::Kind::Order:
                    route_order_(std::move(message), d);
                    break;
                case protocol::RoutingDecision::Kind::RequestId:
                    route_by_id_(std::move(message), d.request_id);
                    break;
                case protocol::RoutingDecision::Kind::Shared:
                    route_shared_(std::move(message), d.message_type);
                    break;
            }
        }

        /// Pushes `ec` to every live channel; registrations stay.
        void notify_all(const boost::system::error_code &ec) {
            const auto push = [&ec](const ChannelPtr &channel) { channel->push(Response::fail(ec)); };
            requests_.for_each(push);
            orders_.for_each(push);
            {
                std::lock_guard lk(shared_mu_);
                for (auto &[kind, entry]: shared_) {
                    if (entry.subscribers > 0) entry.channel->push(Response::fail(ec));
                }
            }
            std::lock_guard lk(order_updates_mu_);
            if (order_updates_) order_updates_->push(Response::fail(ec));
        }

        /// Ends every stream. Later registrations throw not_connected.
        void close_all() {
            {
                std::lock_guard lk(state_mu_);
                closed_ = true;
            }
            const auto close = [](const ChannelPtr &channel) { channel->close(); };
            requests_.for_each(close);
            orders_.for_each(close);
            {
                std::lock_guard lk(shared_mu_);
                for (auto &[kind, entry]: shared_) entry.channel->close();
            }
            {
                std::lock_guard lk(order_updates_mu_);
                if (order_updates_) order_updates_->close();
            }
            std::lock_guard lk(executions_mu_);
            executions_.clear();
        }

        [[nodiscard]] std::size_t active_requests() const { return requests_.size(); }
        [[nodiscard]] std::size_t active_orders() const { return orders_.size(); }

        /// Executions still waiting for their commission report.
        [[nodiscard]] std::size_t tracked_executions() const {
            std::lock_guard lk(executions_mu_);
            return executions_.size();
        }

        [[nodiscard]] int shared_subscribers(protocol::OutgoingMessage kind) const {
            std::lock_guard lk(shared_mu_);
            auto it = shared_.find(kind);
            return it == shared_.end() ? 0 : it->second.subscribers;
        }

    private:
        struct SharedEntry {
            ChannelPtr channel;
            int subscribers{0};
        };

        void ensure_open_() const {
            std::lock_guard lk(state_mu_);
            if (closed_) throw boost::system::system_error(error::make_error_code(error::errc::not_connected));
        }

        // Drops links to `channel` and to channels already gone.
        void forget_executions_(const ChannelPtr &channel) noexcept {
            std::lock_guard lk(executions_mu_);
            std::erase_if(executions_, [&channel](const auto &entry) {
                const auto target = entry.second.lock();
                return !target || target == channel;
            });
        }

        void route_error_(protocol::ResponseMessage message, const protocol::RoutingDecision &d) {
            if (d.request_id == protocol::kUnspecifiedRequestId || protocol::is_warning_code(d.error_code)) {
                std::string text;
                if (message.size() > protocol::kErrorMessageIndex) {
                    text = message.fields()[protocol::kErrorMessageIndex];
                }
                const auto line = "[" + std::to_string(d.error_code) + "] " + text;
                if (protocol::is_warning_code(d.error_code)) log_.info(line);
                else log_.error(line);
                return;
            }
            publish_order_update_(message);
            route_by_id_(std::move(message), d.request_id);
        }

        void route_order_(protocol::ResponseMessage message, const protocol::RoutingDecision &d) {
            using protocol::IncomingMessage;
            switch (d.message_type) {
                case IncomingMessage::OpenOrder:
                case IncomingMessage::OrderStatus: {
                    publish_order_update_(message);
                    const auto order_id = message.order_id();
                    if (auto channel = order_id ? orders_.find(*order_id) : nullptr) {
                        channel->push(Response::ok(std::move(message)));
                        return;
                    }
                    route_shared_(std::move(message), d.message_type);
                    return;
                }
                case IncomingMessage::ExecutionData: {
                    publish_order_update_(message);
                    const auto order_id = message.order_id();
                    auto channel = order_id ? orders_.find(*order_id) : nullptr;
                    if (!channel && d.request_id != protocol::kUnspecifiedRequestId) {
                        channel = requests_.find(d.request_id);
                    }
                    if (!channel) {
                        log_.warn("no recipient for execution of order " + std::to_string(order_id.value_or(-1)));
                        return;
                    }
                    try {
                        if (const auto exec_id = message.execution_id()) {
                            std::lock_guard lk(executions_mu_);
                            executions_[*exec_id] = channel;
                        }
                    } catch (const DecodeError &e) {
                        log_.warn(std::string("execution without id: ") + e.what());
                    }
                    channel->push(Response::ok(std::move(message)));
                    return;
                }
                case IncomingMessage::CommissionsReport: {
                    publish_order_update_(message);
                    ChannelPtr channel;
                    try {
                        if (const auto exec_id = message.execution_id()) {
                            std::lock_guard lk(executions_mu_);
                            auto it = executions_.find(*exec_id);
                            if (it != executions_.end()) {
                                channel = it->second.lock();
                                executions_.erase(it);
                            }
                        }
                    } catch (const DecodeError &e) {
                        log_.warn(std::string("commission report without execution id: ") + e.what());
                    }
                    if (!channel || !channel->push(Response::ok(std::move(message)))) {
                        log_.warn("no recipient for commission report");
                    }
                    return;
                }
                case IncomingMessage::ExecutionDataEnd:
                    route_by_id_(std::move(message), d.request_id);
                    return;
                default: // CompletedOrder, OpenOrderEnd, CompletedOrdersEnd
                    route_shared_(std::move(message), d.message_type);
                    return;
            }
        }

        void route_by_id_(protocol::ResponseMessage message, int request_id) {
            if (auto channel = requests_.find(request_id)) {
                channel->push(Response::ok(std::move(message)));
                return;
            }
            if (auto channel = orders_.find(request_id)) {
                channel->push(Response::ok(std::move(message)));
                return;
            }
            const auto kind = message.message_type();
            if (!protocol::shared_requests_for(kind).empty()) {
                route_shared_(std::move(message), kind);
                return;
            }
            log_.debug("no recipient for request " + std::to_string(request_id) + ": " + message.encode_simple());
        }

        void route_shared_(protocol::ResponseMessage message, protocol::IncomingMessage kind) {
            std::vector<ChannelPtr> targets;
            {
                std::lock_guard lk(shared_mu_);
                for (const auto request: protocol::shared_requests_for(kind)) {
                    auto it = shared_.find(request);
                    if (it != shared_.end() && it->second.subscribers > 0) targets.push_back(it->second.channel);
                }
            }
            if (targets.empty()) {
                log_.debug("no shared recipient: " + message.encode_simple());
                return;
            }
            for (std::size_t i = 0; i + 1 < targets.size(); ++i) targets[i]->push(Response::ok(message));
            targets.back()->push(Response::ok(std::move(message)));
        }

        void publish_order_update_(const protocol::ResponseMessage &message) {
            std::lock_guard lk(order_updates_mu_);
            if (order_updates_) order_updates_->push(Response::ok(message));
        }

    private:
        Logger log_;

        mutable std::mutex state_mu_;
        bool closed_{false};

        ChannelMap<int, Channel> requests_;
        ChannelMap<int, Channel> orders_;

        mutable std::mutex executions_mu_;
        std::unordered_map<std::string, std::weak_ptr<Channel> > executions_;

        mutable std::mutex shared_mu_;
        std::map<protocol::OutgoingMessage, SharedEntry> shared_;

        std::mutex order_updates_mu_;
        ChannelPtr order_updates_;
    };
} // namespace gw::transport
