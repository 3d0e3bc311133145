#pragma once

#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "protocol/WireCodec.hpp"

namespace gw::transport {
    /// One item delivered to a channel: a frame, or an error for that channel's consumer.
    struct Response {
        boost::system::error_code ec;
        protocol::ResponseMessage message;

        static Response ok(protocol::ResponseMessage m) { return {{}, std::move(m)}; }
        static Response fail(boost::system::error_code e) { return {e, {}}; }

        [[nodiscard]] explicit operator bool() const noexcept { return !ec; }
    };

    /**
     * @brief Unbounded multi-producer queue with blocking, polling and timed pops.
     *
     * close() wakes every waiter; pops drain what is left and then report end (nullopt).
     * A waiter passing a `stop` flag also returns nullopt, without taking an item, once the
     * flag is set and interrupt() is called. The channel stays open for other consumers.
     * A slow consumer lets the queue grow without bound.
     */
    class BlockingChannel {
    public:
        /// Returns false when the channel is closed and the item was dropped.
        bool push(Response r) {
            {
                std::lock_guard lk(mu_);
                if (closed_) return false;
                items_.push_back(std::move(r));
            }
            cv_.notify_one();
            return true;
        }

        std::optional<Response> pop(const std::atomic<bool> *stop = nullptr) {
            std::unique_lock lk(mu_);
            cv_.wait(lk, [this, stop] { return ready_locked_(stop); });
            if (stopped_(stop)) return std::nullopt;
            return take_locked_();
        }

        std::optional<Response> try_pop() {
            std::lock_guard lk(mu_);
            return take_locked_();
        }

        std::optional<Response> pop_for(std::chrono::milliseconds timeout, const std::atomic<bool> *stop = nullptr) {
            std::unique_lock lk(mu_);
            cv_.wait_for(lk, timeout, [this, stop] { return ready_locked_(stop); });
            if (stopped_(stop)) return std::nullopt;
            return take_locked_();
        }

        /// Wakes every waiter so it re-checks its stop flag. Set the flag first.
        void interrupt() {
            {
                std::lock_guard lk(mu_);
            }
            cv_.notify_all();
        }

        void close() {
            {
                std::lock_guard lk(mu_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        void clear() {
            std::lock_guard lk(mu_);
            items_.clear();
        }

        [[nodiscard]] bool closed() const {
            std::lock_guard lk(mu_);
            return closed_;
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard lk(mu_);
            return items_.size();
        }

    private:
        static bool stopped_(const std::atomic<bool> *stop) noexcept { return stop && stop->load(); }

        bool ready_locked_(const std::atomic<bool> *stop) const noexcept {
            return !items_.empty() || closed_ || stopped_(stop);
        }

        std::optional<Response> take_locked_() {
            if (items_.empty()) return std::nullopt;
            Response r = std::move(items_.front());
            items_.pop_front();
            return r;
        }

        mutable std::mutex mu_;
        std::condition_variable cv_;
        std::deque<Response> items_;
        bool closed_{false};
    };
} // namespace gw::transport
