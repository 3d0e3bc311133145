#include "async/MessageBus.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>

#include "common/Errors.hpp"

namespace gw::async {
    namespace asio = boost::asio;
    using asio::awaitable;
    using asio::use_awaitable;
    using protocol::OutgoingMessage;
    using protocol::ResponseMessage;

    namespace {
        constexpr std::chrono::milliseconds kReconnectPoll{50};
    }

    MessageBus::MessageBus(asio::io_context &ioc, std::unique_ptr<Connection> connection, LogFn log)
        : ioc_(ioc),
          connection_(std::move(connection)),
          tcp_(AsyncTcpClient::create(ioc)),
          ids_(connection_->metadata().next_order_id),
          log_("AsyncMessageBus", log),
          router_(Logger("AsyncMessageBus", log)) {
        tcp_->set_logger(std::move(log));
    }

    MessageBus::~MessageBus() {
        stop_ = true;
        tcp_->close();
        router_.close_all();
    }

    void MessageBus::start(asio::ip::tcp::socket socket) {
        std::weak_ptr<MessageBus> weak = weak_from_this();
        tcp_->set_on_frame([weak](std::string payload) {
            if (auto self = weak.lock()) self->on_frame_(std::move(payload));
        });
        tcp_->set_on_close([weak](const boost::system::error_code &ec) {
            if (auto self = weak.lock()) self->on_close_(ec);
        });
        tcp_->start(std::move(socket));
        log_.debug("read loop started");
    }

    void MessageBus::shutdown() {
        if (stop_.exchange(true)) return;
        if (state_.load() != State::FAILED) state_ = State::SHUTDOWN;
        log_.debug("shutdown requested");

        tcp_->close();
        asio::dispatch(connection_->get_executor(), [self = shared_from_this()] { self->connection_->cancel_wait(); });
        router_.close_all();
    }

    /// Write path:
    void MessageBus::check_writable_() const {
        switch (state_.load()) {
            case State::CONNECTED:
                return;
            case State::RECONNECTING:
                throw boost::system::system_error(error::make_error_code(error::errc::connection_reset),
                                                  "reconnecting");
            case State::FAILED:
            case State::SHUTDOWN:
                throw boost::system::system_error(error::make_error_code(error::errc::not_connected));
        }
    }

    awaitable<void> MessageBus::write_(protocol::RequestMessage message) {
        check_writable_();
        connection_->record_request(message);

        boost::system::error_code ec;
        co_await tcp_->async_send(protocol::encode_frame(message), asio::redirect_error(use_awaitable, ec));
        if (!ec) co_return;
        if (ec == error::make_error_code(error::errc::shutdown)) {
            throw boost::system::system_error(error::make_error_code(error::errc::not_connected));
        }
        if (is_connection_error(ec)) {
            throw boost::system::system_error(error::make_error_code(error::errc::connection_reset), ec.message());
        }
        throw boost::system::system_error(ec, "write");
    }

    // Fire-and-forget: cancel frames go out from destructors and other non-awaiting code.
    void MessageBus::post_(const protocol::RequestMessage &message) {
        check_writable_();
        connection_->record_request(message);
        tcp_->send(protocol::encode_frame(message), [weak = weak_from_this()](const boost::system::error_code &ec) {
            if (!ec) return;
            if (auto self = weak.lock()) self->log_.warn("cancel frame not sent: " + ec.message());
        });
    }

    awaitable<InternalSubscription> MessageBus::send_request(int request_id, protocol::RequestMessage message) {
        InternalSubscription sub(InternalSubscription::Kind::Request, router_.add_request(request_id), weak_from_this(),
                                 request_id);
        co_await write_(std::move(message)); // on throw, sub releases the channel
        co_return sub;
    }

    awaitable<InternalSubscription> MessageBus::send_order(int order_id, protocol::RequestMessage message) {
        InternalSubscription sub(InternalSubscription::Kind::Order, router_.add_order(order_id), weak_from_this(),
                                 order_id);
        co_await write_(std::move(message));
        co_return sub;
    }

    awaitable<InternalSubscription> MessageBus::send_shared_request(OutgoingMessage kind,
                                                                    protocol::RequestMessage message) {
        InternalSubscription sub(InternalSubscription::Kind::Shared, router_.attach_shared(kind), weak_from_this(),
                                 protocol::to_int(kind), kind);
        co_await write_(std::move(message));
        co_return sub;
    }

    awaitable<void> MessageBus::send_message(protocol::RequestMessage message) {
        co_await write_(std::move(message));
    }

    awaitable<ResponseMessage> MessageBus::await_reply_(std::shared_ptr<ResponseQueue> queue,
                                                        std::chrono::milliseconds timeout) {
        auto reply = co_await queue->async_pop_for(timeout, use_awaitable);
        if (!reply) {
            if (queue->closed()) throw boost::system::system_error(error::make_error_code(error::errc::not_connected));
            throw boost::system::system_error(error::make_error_code(error::errc::timeout));
        }
        if (reply->ec) throw boost::system::system_error(reply->ec);
        co_return std::move(reply->message);
    }

    awaitable<ResponseMessage> MessageBus::send_one_shot(int request_id, protocol::RequestMessage message,
                                                         std::chrono::milliseconds timeout) {
        auto queue = router_.add_request(request_id);
        InternalSubscription sub(InternalSubscription::Kind::Request, queue, weak_from_this(), request_id);
        co_await write_(std::move(message));
        co_return co_await await_reply_(queue, timeout);
    }

    awaitable<ResponseMessage> MessageBus::send_shared_one_shot(OutgoingMessage kind, protocol::RequestMessage message,
                                                                std::chrono::milliseconds timeout) {
        auto queue = router_.attach_shared(kind);
        InternalSubscription sub(InternalSubscription::Kind::Shared, queue, weak_from_this(), protocol::to_int(kind),
                                 kind);
        co_await write_(std::move(message));
        co_return co_await await_reply_(queue, timeout);
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
        if (message) post_(*message);
    }

    void MessageBus::cancel_order_subscription(int order_id, const std::optional<protocol::RequestMessage> &message) {
        release_order(order_id);
        if (message) post_(*message);
    }

    void MessageBus::cancel_shared_subscription(OutgoingMessage kind,
                                                const std::optional<protocol::RequestMessage> &message) {
        detach_shared(kind);
        if (message) post_(*message);
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

    awaitable<bool> MessageBus::wait_until_connected(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        asio::steady_timer timer(co_await asio::this_coro::executor);
        while (state_.load() == State::RECONNECTING) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) break;
            timer.expires_after(std::min(left, kReconnectPoll));
            boost::system::error_code ec;
            co_await timer.async_wait(asio::redirect_error(use_awaitable, ec));
        }
        co_return is_connected();
    }

    /// Read side (AsyncTcpClient strand):
    void MessageBus::on_frame_(std::string payload) {
        auto message = ResponseMessage::from(payload);
        connection_->record_response(message);
        if (message.is_shutdown()) {
            log_.info("shutdown frame received");
            shutdown();
            return;
        }
        router_.dispatch(std::move(message));
    }

    void MessageBus::on_close_(const boost::system::error_code &ec) {
        if (stop_.load()) return;
        if (!is_connection_error(ec)) {
            fail_("read failed: " + ec.message());
            return;
        }

        state_ = State::RECONNECTING;
        log_.warn("connection lost: " + ec.message());
        router_.notify_all(error::make_error_code(error::errc::connection_reset));
        asio::co_spawn(connection_->get_executor(), recover_(shared_from_this()), asio::detached);
    }

    awaitable<void> MessageBus::recover_(std::shared_ptr<MessageBus> self) {
        std::optional<asio::ip::tcp::socket> socket;
        std::string failure;
        try {
            socket.emplace(co_await self->connection_->reconnect());
        } catch (const boost::system::system_error &e) {
            failure = e.what();
        }
        if (self->stop_.load()) co_return;
        if (!socket) {
            self->fail_("giving up: " + failure);
            co_return;
        }

        self->tcp_->start(std::move(*socket));
        auto expected = State::RECONNECTING;
        self->state_.compare_exchange_strong(expected, State::CONNECTED);
    }

    void MessageBus::fail_(const std::string &why) {
        log_.error(why);
        state_ = State::FAILED;
        router_.notify_all(error::make_error_code(error::errc::not_connected));
        router_.close_all();
    }
} // namespace gw::async
