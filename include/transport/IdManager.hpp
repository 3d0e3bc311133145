#pragma once

#include <atomic>

namespace gw::transport {
    /**
     * @brief Per-connection id sequences.
     *
     * Request ids start at 9000 so they never collide with order ids handed out by
     * the gateway. Both counters survive reconnects; nothing is reissued.
     */
    class IdManager {
    public:
        static constexpr int kFirstRequestId = 9000;

        explicit IdManager(int next_order_id) noexcept : order_id_(next_order_id) {
        }

        IdManager(const IdManager &) = delete;

        IdManager &operator=(const IdManager &) = delete;

        [[nodiscard]] int next_request_id() noexcept { return request_id_.fetch_add(1, std::memory_order_relaxed); }
        [[nodiscard]] int next_order_id() noexcept { return order_id_.fetch_add(1, std::memory_order_relaxed); }

        /// Re-seeds from a NextValidId reply; never moves backwards.
        void update_order_id(int next_valid) noexcept;

        [[nodiscard]] int peek_order_id() const noexcept { return order_id_.load(std::memory_order_relaxed); }

    private:
        std::atomic<int> request_id_{kFirstRequestId};
        std::atomic<int> order_id_;
    };
} // namespace gw::transport
