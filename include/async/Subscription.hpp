#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "async/InternalSubscription.hpp"
#include "common/Errors.hpp"
#include "subscription/Decoder.hpp"
#include "utils/Logger.hpp"

namespace gw::async {
    /**
     * @brief Typed, cancellable stream over one task-model channel, with clones.
     *
     * One upstream reader copies every raw frame into a queue per clone, so each clone sees
     * the whole stream and a slow clone never holds back the others. Clones made before the
     * first read get everything; a later clone starts with what arrives after it was made.
     *
     * Each clone decodes on its own and runs the same state machine as gw::Subscription.
     * cancel() (or destruction) detaches one clone; the upstream cancel frame goes out once,
     * when the last clone detaches, and only if no clone saw the stream end or the session drop.
     */
    template<ResponseDecoder Decoder>
    class Subscription {
    public:
        using value_type = typename Decoder::value_type;

        enum class State : std::uint8_t { ACTIVE, CANCELLING, CANCELLED, ERRORED };

        Subscription(InternalSubscription internal, DecoderContext ctx, boost::asio::any_io_executor ex,
                     LogFn log = {})
            : up_(std::make_shared<Upstream>(std::move(internal), ctx, std::move(ex), Logger("Subscription", log))),
              queue_(up_->attach()),
              ctx_(ctx),
              log_("Subscription", std::move(log)) {
        }

        Subscription(Subscription &&other) noexcept
            : up_(std::move(other.up_)),
              queue_(std::move(other.queue_)),
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

        /// Another consumer of the same upstream. A clone of a finished stream is already ended.
        [[nodiscard]] Subscription clone() const {
            if (!up_) {
                throw boost::system::system_error(error::make_error_code(error::errc::invalid_request),
                                                  "clone of a moved-from subscription");
            }
            return Subscription(up_, up_->attach(), ctx_, log_);
        }

        /// An item, an error (ec set) or the end of the stream (nullopt, ec clear).
        boost::asio::awaitable<std::optional<value_type> > next(boost::system::error_code &ec) {
            ec.clear();
            if (!up_) co_return std::nullopt;
            up_->start();
            while (live_()) {
                auto response = co_await queue_->async_pop(boost::asio::use_awaitable);
                auto step = handle_(std::move(response), ec);
                if (!step.skip) co_return std::move(step.value);
            }
            co_return std::nullopt;
        }

        boost::asio::awaitable<std::optional<value_type> > next() {
            boost::system::error_code ec;
            auto value = co_await next(ec);
            throw_if(ec, "Subscription::next");
            co_return value;
        }

        /// Never suspends. nullopt when nothing is queued.
        std::optional<value_type> try_next(boost::system::error_code &ec) {
            ec.clear();
            if (!up_) return std::nullopt;
            up_->start();
            while (live_()) {
                auto step = handle_(queue_->try_pop(), ec);
                if (!step.skip) return std::move(step.value);
            }
            return std::nullopt;
        }

        std::optional<value_type> try_next() {
            boost::system::error_code ec;
            auto value = try_next(ec);
            throw_if(ec, "Subscription::try_next");
            return value;
        }

        /// Waits at most `timeout` overall, skipped frames included.
        boost::asio::awaitable<std::optional<value_type> > next_timeout(std::chrono::milliseconds timeout,
                                                                         boost::system::error_code &ec) {
            ec.clear();
            if (!up_) co_return std::nullopt;
            up_->start();
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (live_()) {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                auto response = co_await queue_->async_pop_for(
                    left.count() > 0 ? left : std::chrono::milliseconds(0), boost::asio::use_awaitable);
                auto step = handle_(std::move(response), ec);
                if (!step.skip) co_return std::move(step.value);
            }
            co_return std::nullopt;
        }

        boost::asio::awaitable<std::optional<value_type> > next_timeout(std::chrono::milliseconds timeout) {
            boost::system::error_code ec;
            auto value = co_await next_timeout(timeout, ec);
            throw_if(ec, "Subscription::next_timeout");
            co_return value;
        }

        /// Idempotent and safe from several tasks at once. Detaches this clone only.
        void cancel() noexcept {
            auto expected = State::ACTIVE;
            if (state_.compare_exchange_strong(expected, State::CANCELLING)) {
                release_(!ended_.load());
                state_ = State::CANCELLED;
                return;
            }
            release_(false);
        }

        [[nodiscard]] std::optional<boost::system::error_code> error() const {
            std::lock_guard lk(error_mu_);
            return last_error_;
        }

        [[nodiscard]] State state() const noexcept { return state_.load(); }
        [[nodiscard]] bool ended() const noexcept { return ended_.load(); }
        [[nodiscard]] const DecoderContext &context() const noexcept { return ctx_; }
        [[nodiscard]] std::optional<int> request_id() const noexcept { return ctx_.request_id; }
        [[nodiscard]] std::size_t clones() const { return up_ ? up_->receivers() : 0; }

        /// Everything queued for this clone right now.
        std::vector<value_type> drain() {
            std::vector<value_type> items;
            boost::system::error_code ec;
            while (auto item = try_next(ec)) items.push_back(std::move(*item));
            return items;
        }

        /// Calls fn for each item until `timeout` passes without one, or the stream ends.
        template<typename Fn>
        boost::asio::awaitable<void> for_each_timeout(std::chrono::milliseconds timeout, Fn fn) {
            boost::system::error_code ec;
            while (auto item = co_await next_timeout(timeout, ec)) fn(std::move(*item));
        }

    private:
        // The single reader of the bus channel, shared by every clone.
        struct Upstream : std::enable_shared_from_this<Upstream> {
            Upstream(InternalSubscription in, const DecoderContext &c, boost::asio::any_io_executor e, Logger l)
                : internal(std::move(in)), ctx(c), ex(std::move(e)), log(std::move(l)) {
            }

            std::shared_ptr<ResponseQueue> attach() {
                auto queue = ResponseQueue::create();
                std::lock_guard lk(mu);
                if (released.load()) queue->close();
                else {
                    queues.push_back(queue);
                    if (finished) queue->close();
                }
                return queue;
            }

            void detach(const std::shared_ptr<ResponseQueue> &queue, bool send_cancel) noexcept {
                bool last = false;
                {
                    std::lock_guard lk(mu);
                    auto it = std::find(queues.begin(), queues.end(), queue);
                    if (it == queues.end()) return;
                    queues.erase(it);
                    last = queues.empty();
                }
                queue->close();
                if (last) release(send_cancel && !ended.load());
            }

            void release(bool send_cancel) noexcept {
                if (released.exchange(true)) return;
                try {
                    std::optional<protocol::RequestMessage> message;
                    if constexpr (HasCancelMessage<Decoder>) {
                        if (send_cancel) message = Decoder::cancel_message(ctx);
                    }
                    internal.cancel(message);
                } catch (const std::exception &e) {
                    log.warn(std::string("cancel failed: ") + e.what());
                }
            }

            void start() {
                {
                    std::lock_guard lk(mu);
                    if (pumping) return;
                    pumping = true;
                }
                boost::asio::co_spawn(ex, pump(this->shared_from_this()), boost::asio::detached);
            }

            [[nodiscard]] std::size_t receivers() const {
                std::lock_guard lk(mu);
                return queues.size();
            }

            static boost::asio::awaitable<void> pump(std::shared_ptr<Upstream> self) {
                try {
                    while (auto response = co_await self->internal.next()) {
                        std::vector<std::shared_ptr<ResponseQueue> > targets;
                        {
                            std::lock_guard lk(self->mu);
                            targets = self->queues;
                        }
                        for (auto &queue: targets) queue->push(*response);
                    }
                } catch (const std::exception &e) {
                    self->log.error(std::string("upstream reader: ") + e.what());
                }

                std::vector<std::shared_ptr<ResponseQueue> > targets;
                {
                    std::lock_guard lk(self->mu);
                    self->finished = true;
                    targets = self->queues;
                }
                for (auto &queue: targets) queue->close();
            }

            InternalSubscription internal;
            DecoderContext ctx;
            boost::asio::any_io_executor ex;
            Logger log;

            mutable std::mutex mu;
            std::vector<std::shared_ptr<ResponseQueue> > queues;
            bool pumping{false};
            bool finished{false};

            std::atomic<bool> ended{false}; ///< a clone saw the end, or the session dropped
            std::atomic<bool> released{false};
        };

        struct Step {
            bool skip{false};
            std::optional<value_type> value;
        };

        Subscription(std::shared_ptr<Upstream> up, std::shared_ptr<ResponseQueue> queue, const DecoderContext &ctx,
                     Logger log)
            : up_(std::move(up)), queue_(std::move(queue)), ctx_(ctx), log_(std::move(log)) {
        }

        [[nodiscard]] bool live_() const noexcept { return state_.load() == State::ACTIVE && !ended_.load(); }

        Step handle_(std::optional<transport::Response> response, boost::system::error_code &ec) {
            if (!response) {
                if (queue_->closed()) ended_ = true;
                return {};
            }
            if (response->ec) {
                fail_(response->ec);
                ec = response->ec;
                return {};
            }

            try {
                value_type value = Decoder::decode(ctx_, response->message);
                if (shared_()) set_error_(std::nullopt);
                if constexpr (HasEndMarker<Decoder>) {
                    if (Decoder::is_end(value)) {
                        ended_ = true;
                        up_->ended = true;
                        release_(false);
                    }
                }
                return {false, std::move(value)};
            } catch (const DecodeError &e) {
                if (shared_()) {
                    log_.warn(std::string("dropping undecodable frame: ") + e.what());
                    set_error_(e.code());
                    return {true, std::nullopt};
                }
                fail_(e.code());
                ec = e.code();
                return {};
            } catch (const boost::system::system_error &e) {
                if (e.code() == error::make_error_code(error::errc::unexpected_response)) return {true, std::nullopt};
                fail_(e.code());
                ec = e.code();
                return {};
            }
        }

        [[nodiscard]] bool shared_() const noexcept {
            return up_->internal.kind() == InternalSubscription::Kind::Shared;
        }

        void set_error_(std::optional<boost::system::error_code> ec) {
            std::lock_guard lk(error_mu_);
            last_error_ = ec;
        }

        void fail_(const boost::system::error_code &ec) {
            set_error_(ec);
            auto expected = State::ACTIVE;
            if (!state_.compare_exchange_strong(expected, State::ERRORED)) return;
            const bool session_lost = is_connection_error(ec) || ec == error::make_error_code(error::errc::not_connected);
            if (session_lost) up_->ended = true;
            release_(!session_lost);
        }

        void release_(bool send_cancel) noexcept {
            if (released_.exchange(true)) return;
            if (up_) up_->detach(queue_, send_cancel);
        }

    private:
        std::shared_ptr<Upstream> up_;
        std::shared_ptr<ResponseQueue> queue_;
        DecoderContext ctx_;
        Logger log_;

        std::atomic<State> state_{State::ACTIVE};
        std::atomic<bool> ended_{false};
        std::atomic<bool> released_{false};

        mutable std::mutex error_mu_;
        std::optional<boost::system::error_code> last_error_;
    };
} // namespace gw::async
