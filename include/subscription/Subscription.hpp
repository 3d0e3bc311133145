#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Errors.hpp"
#include "subscription/Decoder.hpp"
#include "transport/InternalSubscription.hpp"
#include "utils/Logger.hpp"

namespace gw {
    /**
     * @brief Typed, cancellable stream over one bus channel (threaded model).
     *
     * States: ACTIVE -> CANCELLING -> CANCELLED, or ACTIVE -> ERRORED when the channel
     * reports a terminal error. The cancel frame is written at most once per subscription,
     * whether cancel() is called repeatedly, concurrently, or only by the destructor.
     *
     * A decode failure on a shared channel is logged and the frame dropped; the stream stays
     * ACTIVE and error() reports it until the next good item. On any other channel it is terminal.
     * Once the decoder reports a terminal item (is_end) the stream ends after yielding it.
     */
    template<ResponseDecoder Decoder>
    class Subscription {
    public:
        using value_type = typename Decoder::value_type;

        enum class State : std::uint8_t { ACTIVE, CANCELLING, CANCELLED, ERRORED };

        Subscription(transport::InternalSubscription internal, DecoderContext ctx, LogFn log = {})
            : internal_(std::move(internal)), ctx_(ctx), log_("Subscription", std::move(log)) {
        }

        Subscription(Subscription &&other) noexcept
            : internal_(std::move(other.internal_)),
              ctx_(other.ctx_),
              log_(std::move(other.log_)),
              state_(other.state_.load()),
              ended_(other.ended_.load()),
              released_(other.released_.exchange(true)),
              last_error_(other.error()) {
        }

        Subscription &operator=(Subscription &&) = delete;

        Subscription(const Subscription &) = delete;

        Subscription &operator=(const Subscription &) = delete;

        ~Subscription() { cancel(); }

        /// Blocks until an item, an error (ec set) or the end of the stream (nullopt, ec clear).
        std::optional<value_type> next(boost::system::error_code &ec) {
            return pump_([this] { return internal_.next(); }, ec);
        }

        std::optional<value_type> next() {
            boost::system::error_code ec;
            auto value = next(ec);
            throw_if(ec, "Subscription::next");
            return value;
        }

        /// Never blocks. nullopt when nothing is queued.
        std::optional<value_type> try_next(boost::system::error_code &ec) {
            return pump_([this] { return internal_.try_next(); }, ec);
        }

        std::optional<value_type> try_next() {
            boost::system::error_code ec;
            auto value = try_next(ec);
            throw_if(ec, "Subscription::try_next");
            return value;
        }

        /// Waits at most `timeout` overall, skipped frames included.
        std::optional<value_type> next_timeout(std::chrono::milliseconds timeout, boost::system::error_code &ec) {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            return pump_([this, deadline] {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                return internal_.next_timeout(left.count() > 0 ? left : std::chrono::milliseconds(0));
            }, ec);
        }

        std::optional<value_type> next_timeout(std::chrono::milliseconds timeout) {
            boost::system::error_code ec;
            auto value = next_timeout(timeout, ec);
            throw_if(ec, "Subscription::next_timeout");
            return value;
        }

        /**
         * Idempotent. Writes the decoder's cancel frame only while ACTIVE and not ended.
         * Safe from any thread: a reader blocked in next() or next_timeout() returns nullopt.
         */
        void cancel() noexcept {
            auto expected = State::ACTIVE;
            if (state_.compare_exchange_strong(expected, State::CANCELLING)) {
                release_(!ended_.load());
                state_ = State::CANCELLED;
                return;
            }
            release_(false);
        }

        /// Last terminal (or, on shared channels, last dropped-frame) error.
        [[nodiscard]] std::optional<boost::system::error_code> error() const {
            std::lock_guard lk(error_mu_);
            return last_error_;
        }

        [[nodiscard]] State state() const noexcept { return state_.load(); }
        [[nodiscard]] bool ended() const noexcept { return ended_.load(); }
        [[nodiscard]] const DecoderContext &context() const noexcept { return ctx_; }
        [[nodiscard]] std::optional<int> request_id() const noexcept { return ctx_.request_id; }

        /// Everything queued right now, without blocking.
        std::vector<value_type> drain() {
            std::vector<value_type> items;
            boost::system::error_code ec;
            while (auto item = try_next(ec)) items.push_back(std::move(*item));
            return items;
        }

        /// Calls fn for each item until `timeout` passes without one, or the stream ends.
        template<typename Fn>
        void for_each_timeout(std::chrono::milliseconds timeout, Fn &&fn) {
            boost::system::error_code ec;
            while (auto item = next_timeout(timeout, ec)) fn(std::move(*item));
        }

        /**
         * Blocking input iteration; stops at the end of the stream or at the first error.
         * The loop cannot tell the two apart: check error() (or state()) once it exits.
         */
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = typename Decoder::value_type;
            using difference_type = std::ptrdiff_t;
            using pointer = value_type *;
            using reference = value_type &;

            iterator() = default;

            explicit iterator(Subscription *sub) : sub_(sub) { advance_(); }

            reference operator*() { return *current_; }
            pointer operator->() { return &*current_; }

            iterator &operator++() {
                advance_();
                return *this;
            }

            void operator++(int) { advance_(); }

            friend bool operator==(const iterator &it, std::default_sentinel_t) noexcept { return !it.current_; }

        private:
            void advance_() {
                boost::system::error_code ec;
                current_ = sub_->next(ec);
            }

            Subscription *sub_{nullptr};
            std::optional<value_type> current_;
        };

        iterator begin() { return iterator(this); }
        std::default_sentinel_t end() const noexcept { return {}; }

    private:
        template<typename Pop>
        std::optional<value_type> pump_(Pop &&pop, boost::system::error_code &ec) {
            ec.clear();
            while (state_.load() == State::ACTIVE && !ended_.load()) {
                auto response = pop();
                if (!response) {
                    if (internal_.closed()) ended_ = true;
                    return std::nullopt;
                }
                if (state_.load() != State::ACTIVE) return std::nullopt; // cancelled while waiting
                if (response->ec) {
                    fail_(response->ec);
                    ec = response->ec;
                    return std::nullopt;
                }

                try {
                    value_type value = Decoder::decode(ctx_, response->message);
                    if (shared_()) set_error_(std::nullopt);
                    if constexpr (HasEndMarker<Decoder>) {
                        if (Decoder::is_end(value)) {
                            ended_ = true;
                            release_(false);
                        }
                    }
                    return value;
                } catch (const DecodeError &e) {
                    if (shared_()) {
                        log_.warn(std::string("dropping undecodable frame: ") + e.what());
                        set_error_(e.code());
                        continue;
                    }
                    fail_(e.code());
                    ec = e.code();
                    return std::nullopt;
                } catch (const boost::system::system_error &e) {
                    if (e.code() == error::make_error_code(error::errc::unexpected_response)) continue;
                    fail_(e.code());
                    ec = e.code();
                    return std::nullopt;
                }
            }
            return std::nullopt;
        }

        [[nodiscard]] bool shared_() const noexcept {
            return internal_.kind() == transport::InternalSubscription::Kind::Shared;
        }

        void set_error_(std::optional<boost::system::error_code> ec) {
            std::lock_guard lk(error_mu_);
            last_error_ = ec;
        }

        // Connection-level failures leave nothing to cancel on the gateway side.
        void fail_(const boost::system::error_code &ec) {
            set_error_(ec);
            auto expected = State::ACTIVE;
            if (!state_.compare_exchange_strong(expected, State::ERRORED)) return;
            const bool session_lost = is_connection_error(ec) || ec == error::make_error_code(error::errc::not_connected);
            release_(!session_lost);
        }

        void release_(bool send_cancel) noexcept {
            if (released_.exchange(true)) return;
            try {
                std::optional<protocol::RequestMessage> message;
                if constexpr (HasCancelMessage<Decoder>) {
                    if (send_cancel) message = Decoder::cancel_message(ctx_);
                }
                internal_.cancel(message);
            } catch (const std::exception &e) {
                log_.warn(std::string("cancel failed: ") + e.what());
            }
        }

    private:
        transport::InternalSubscription internal_;
        DecoderContext ctx_;
        Logger log_;

        std::atomic<State> state_{State::ACTIVE};
        std::atomic<bool> ended_{false};
        std::atomic<bool> released_{false};

        mutable std::mutex error_mu_;
        std::optional<boost::system::error_code> last_error_;
    };
} // namespace gw
