#include "transport/IdManager.hpp"

namespace gw::transport {
    void IdManager::update_order_id(int next_valid) noexcept {
        int cur = order_id_.load(std::memory_order_relaxed);
        while (cur < next_valid
               && !order_id_.compare_exchange_weak(cur, next_valid, std::memory_order_relaxed)) {
        }
    }
} // namespace gw::transport
