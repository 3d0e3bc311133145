#pragma once

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace gw::async {
    /**
     * @brief Unbounded multi-producer queue with awaitable pops.
     *
     * Producers push from any thread. Consumers complete on their own executor:
     *   auto item = co_await queue->async_pop(boost::asio::use_awaitable);
     * Parked consumers are served first come, first served; several of them compete for items.
     * nullopt means closed and drained, timed out (async_pop_for) or interrupted.
     *
     * Always owned by a shared_ptr; timed waits keep a weak reference.
     */
    template<typename T>
    class AsyncQueue : public std::enable_shared_from_this<AsyncQueue<T> > {
    public:
        /// Returns false when it declined the item (a timed wait already gave up).
        /// Runs under the queue lock; it must only post.
        using Waiter = std::function<bool(std::optional<T> &)>;

        static std::shared_ptr<AsyncQueue> create() { return std::make_shared<AsyncQueue>(); }

        /// False when closed; the item is dropped.
        bool push(T item) {
            std::lock_guard lk(mu_);
            if (closed_) return false;
            std::optional<T> value(std::move(item));
            while (!waiters_.empty()) {
                auto waiter = std::move(waiters_.front().second);
                waiters_.pop_front();
                if (waiter(value)) return true;
            }
            items_.push_back(std::move(*value));
            return true;
        }

        void close() {
            std::lock_guard lk(mu_);
            closed_ = true;
            wake_all_locked_();
        }

        /// Completes every parked consumer with nullopt. The queue stays open.
        void interrupt() {
            std::lock_guard lk(mu_);
            wake_all_locked_();
        }

        void clear() {
            std::lock_guard lk(mu_);
            items_.clear();
        }

        std::optional<T> try_pop() {
            std::lock_guard lk(mu_);
            return take_locked_();
        }

        [[nodiscard]] bool closed() const {
            std::lock_guard lk(mu_);
            return closed_;
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard lk(mu_);
            return items_.size();
        }

        template<typename CompletionToken>
        auto async_pop(CompletionToken &&token) {
            return boost::asio::async_initiate<CompletionToken, void(std::optional<T>)>(
                [self = this->shared_from_this()](auto handler) {
                    using Handler = std::decay_t<decltype(handler)>;
                    auto ex = boost::asio::get_associated_executor(handler);
                    auto h = std::make_shared<Handler>(std::move(handler));
                    Waiter waiter = [h, ex](std::optional<T> &value) {
                        boost::asio::post(ex, [h, v = std::move(value)]() mutable { std::move(*h)(std::move(v)); });
                        return true;
                    };
                    self->wait_(std::move(waiter));
                },
                token);
        }

        template<typename CompletionToken>
        auto async_pop_for(std::chrono::milliseconds timeout, CompletionToken &&token) {
            return boost::asio::async_initiate<CompletionToken, void(std::optional<T>)>(
                [self = this->shared_from_this(), timeout](auto handler) {
                    using Handler = std::decay_t<decltype(handler)>;
                    using Executor = boost::asio::associated_executor_t<Handler>;
                    Executor ex = boost::asio::get_associated_executor(handler);

                    struct Op {
                        Op(Handler h, const Executor &e) : handler(std::move(h)), timer(e) {
                        }

                        Handler handler;
                        std::atomic<bool> done{false};
                        boost::asio::steady_timer timer;
                    };
                    auto op = std::make_shared<Op>(std::move(handler), ex);

                    Waiter waiter = [op, ex](std::optional<T> &value) {
                        if (op->done.exchange(true)) return false;
                        boost::asio::post(ex, [op, v = std::move(value)]() mutable {
                            op->timer.cancel();
                            std::move(op->handler)(std::move(v));
                        });
                        return true;
                    };

                    op->timer.expires_after(timeout);
                    const auto id = self->wait_(waiter);
                    if (!id) return; // served immediately

                    op->timer.async_wait([op, weak = self->weak_from_this(), id](const boost::system::error_code &ec) {
                        if (ec) return; // served, timer cancelled
                        if (op->done.exchange(true)) return;
                        if (auto queue = weak.lock()) queue->drop_waiter_(*id);
                        std::move(op->handler)(std::nullopt);
                    });
                },
                token);
        }

    private:
        // Serves now, or parks the waiter and returns its id.
        std::optional<std::uint64_t> wait_(Waiter waiter) {
            std::lock_guard lk(mu_);
            if (!items_.empty() || closed_) {
                auto value = take_locked_();
                waiter(value);
                return std::nullopt;
            }
            waiters_.emplace_back(++waiter_id_, std::move(waiter));
            return waiter_id_;
        }

        void drop_waiter_(std::uint64_t id) {
            std::lock_guard lk(mu_);
            for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
                if (it->first == id) {
                    waiters_.erase(it);
                    return;
                }
            }
        }

        void wake_all_locked_() {
            auto waiters = std::move(waiters_);
            waiters_.clear();
            for (auto &[id, waiter]: waiters) {
                std::optional<T> none;
                waiter(none);
            }
        }

        std::optional<T> take_locked_() {
            if (items_.empty()) return std::nullopt;
            T item = std::move(items_.front());
            items_.pop_front();
            return item;
        }

        mutable std::mutex mu_;
        std::deque<T> items_;
        std::deque<std::pair<std::uint64_t, Waiter> > waiters_;
        std::uint64_t waiter_id_{0};
        bool closed_{false};
    };
} // namespace gw::async
