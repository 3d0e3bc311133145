#include "transport/Backoff.hpp"

namespace gw::transport {
    std::chrono::milliseconds FibonacciBackoff::next_delay() noexcept {
        const std::uint64_t next = previous_ + current_;
        if (next <= max_) {
            previous_ = current_;
            current_ = next;
        }
        const std::uint64_t units = next > max_ ? max_ : next;
        return unit_ * static_cast<std::chrono::milliseconds::rep>(units);
    }
} // namespace gw::transport
