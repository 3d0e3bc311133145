#include "transport/MessageBus.hpp"

#include <boost/asio/error.hpp>

#include "common/Errors.hpp"

namespace gw::transport {
    using protocol::OutgoingMessage;
    using protocol::ResponseMessage;

    MessageBus::MessageBus(std::unique_ptr<connection::Connection> connection, LogFn log)
        : connection_(std::move(connection)),
          ids_(connection_->metadata().next_order_id),
          log_("MessageBus", log),
          router_(Logger("MessageBus", std::move(log))) {
    }

    MessageBus::~MessageBus() {
        shutdown();
        join();
    }

    void MessageBus::start() {
        if (reader_.joinable()) return;
        reader_ = std::thread([this] { dispatch_loop_(); });
    }

    void MessageBus::shutdown() {
        if (stop_.exchange(true)) return;
        {
            std::lock_guard lk(write_mu_);
            if (state_.load() != State::FAILED) set_state_(State::SHUTDOWN);
        }
        log_.debug("shutdown requested");
        connection_->shutdown();
        if (!reader_.joinable()) router_.close_all(); // never started
    }

    void MessageBus::join() {
        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) reader_.join();
    }

    void MessageBus::set_state_(State state) {
        state_ = state;
        state_cv_.notify_all();
    }

    bool MessageBus::wait_until_connected(std::chrono::milliseconds timeout) {
        std::unique_lock lk(write_mu_);
        state_cv_.wait_for(lk, timeout, [this] { return state_.load() != State::RECONNECTING; });
        return state_.load() == State::CONNECTED;
    }

    /// Write path:
    void MessageBus::write_(const protocol::RequestMessage &message) {
        std::lock_guard lk(write_mu_);
        switch (state_.load()) {
            case State::CONNECTED:
                break;
            case State::RECONNECTING:
                throw boost::system::system_error(error::make_error_code(error::errc::connection_reset),
                                                  "reconnecting");
            case State::FAILED:
            case State::SHUTDOWN:
                throw boost::system::system_error(error::make_error_code(error::errc::not_connected));
        }

        boost::system::error_code ec;
        connection_->write_message(message, ec);
        if (!ec) return;
        if (is_connection_error(ec)) {
            throw boost::system::system_error(error::make_error_code(error::errc::connection_reset), ec.message());
        }
        throw boost::system::system_error(ec, "write");
    }

    InternalSubscription MessageBus::send_request(int request_id, const protocol::RequestMessage &message) {
        auto channel = router_.add_request(request_id);
        InternalSubscription sub(InternalSubscription::Kind::Request, channel, weak_from_this(), request_id);
        write_(message); // on throw, sub releases the channel
        return sub;
    }

    InternalSubscription MessageBus::send_order(int order_id, const protocol::RequestMessage &message) {
        auto channel = router_.add_order(order_id);
        InternalSubscription sub(InternalSubscription::Kind::Order, channel, weak_from_this(), order_id);
        write_(message);
        return sub;
    }

    InternalSubscription MessageBus::send_shared_request(OutgoingMessage kind, const protocol::RequestMessage &message) {
        auto channel = router_.attach_shared(kind);
        InternalSubscription sub(InternalSubscription::Kind::Shared, channel, weak_from_this(), protocol::to_int(kind),
                                 kind);
        write_(message);
        return sub;
    }

    void MessageBus::send_message(const protocol::RequestMessage &message) {
        write_(message);
    }

    ResponseMessage MessageBus::await_reply_(BlockingChannel &channel, std::chrono::milliseconds timeout) {
        auto reply = channel.pop_for(timeout);
        if (!reply) {
            if (channel.closed()) throw boost::system::system_error(error::make_error_code(error::errc::not_connected));
            throw boost::system::system_error(error::make_error_code(error::errc::timeout));
        }
        if (reply->ec) throw boost::system::system_error(reply->ec);
        return std::move(reply->message);
    }

    ResponseMessage MessageBus::send_one_shot(int request_id, const protocol::RequestMessage &message,
                                              std::chrono::milliseconds timeout) {
        auto channel = router_.add_request(request_id);
        InternalSubscription sub(InternalSubscription::Kind::Request, channel, weak_from_this(), request_id);
        write_(message);
        return await_reply_(*channel, timeout);
    }

    ResponseMessage MessageBus::send_shared_one_shot(OutgoingMessage kind, const protocol::RequestMessage &message,
                                                     std::chrono::milliseconds timeout) {
        auto channel = router_.attach_shared(kind);
        InternalSubscription sub(InternalSubscription::Kind::Shared, channel, weak_from_this(), protocol::to_int(kind),
                                 kind);
        write_(message);
        return await_reply_(*channel, timeout);
    }

    InternalSubscription MessageBus::create_order_update_subscription() {
        if (stop_.load() || has_failed()) {
            throw boost::system::system_error(error::make_error_code(error::errc::not_connected));
        }
        return {InternalSubscription::Kind::OrderUpdates, router_.open_order_updates(), weak_from_this(), -1};
    }

    /// Cancellation and release:
    void MessageBus::cancel_subscription(int request_id, const std::optional<protocol::RequestMessage> &message) {
        release_request(request_id);
        if (message) write_(*message);
    }

    void MessageBus::cancel_order_subscription(int order_id, const std::optional<protocol::RequestMessage> &message) {
        release_order(order_id);
        if (message) write_(*message);
    }

    void MessageBus::cancel_shared_subscription(OutgoingMessage kind,
                                                const std::optional<protocol::RequestMessage> &message) {
        detach_shared(kind);
        if (message) write_(*message);
    }

    void MessageBus::release_request(int request_id) noexcept {
        router_.release_request(request_id);
    }

    void MessageBus::release_order(int order_id) noexcept {
        router_.release_order(order_id);
    }

    void MessageBus::detach_shared(OutgoingMessage kind) noexcept {
        router_.detach_shared(kind);
    }

    void MessageBus::release_order_updates() noexcept {
        router_.release_order_updates();
    }

    /// Dispatcher:
    void MessageBus::dispatch_loop_() {
        log_.debug("dispatcher started");
        while (!stop_.load()) {
            boost::system::error_code ec;
            auto message = connection_->read_message(ec);
            if (ec) {
                if (stop_.load()) break;
                if (is_connection_error(ec)) {
                    if (!recover_(ec)) break;
                    continue;
                }
                log_.error("read failed: " + ec.message());
                {
                    std::lock_guard lk(write_mu_);
                    set_state_(State::FAILED);
                }
                router_.notify_all(error::make_error_code(error::errc::not_connected));
                break;
            }
            if (message.is_shutdown()) {
                log_.info("shutdown frame received");
                break;
            }
            router_.dispatch(std::move(message));
        }
        close_all_();
        log_.debug("dispatcher stopped");
    }

    bool MessageBus::recover_(const boost::system::error_code &ec) {
        {
            std::lock_guard lk(write_mu_);
            set_state_(State::RECONNECTING);
        }
        log_.warn("connection lost: " + ec.message());
        router_.notify_all(error::make_error_code(error::errc::connection_reset));

        try {
            connection_->reconnect();
        } catch (const boost::system::system_error &e) {
            if (stop_.load()) return false;
            log_.error(std::string("giving up: ") + e.what());
            {
                std::lock_guard lk(write_mu_);
                set_state_(State::FAILED);
            }
            router_.notify_all(error::make_error_code(error::errc::not_connected));
            return false;
        }

        std::lock_guard lk(write_mu_);
        if (stop_.load()) return false;
        set_state_(State::CONNECTED);
        return true;
    }

    void MessageBus::close_all_() {
        {
            std::lock_guard lk(write_mu_);
            if (state_.load() == State::CONNECTED || state_.load() == State::RECONNECTING) set_state_(State::SHUTDOWN);
        }
        router_.close_all();
    }
} // namespace gw::transport
