#pragma once

#include <chrono>
#include <cstdint>

namespace gw::transport {
    /// Attempts allowed per outage before the bus reports the connection as lost.
    constexpr int kMaxRetries = 20;

    /**
     * @brief Fibonacci delays (1, 2, 3, 5, 8, ... units) capped at max_units.
     *
     * One instance covers one outage; a successful reconnect starts the next
     * outage from a fresh instance.
     */
    class FibonacciBackoff {
    public:
        explicit FibonacciBackoff(std::uint64_t max_units,
                                  std::chrono::milliseconds unit = std::chrono::seconds(1)) noexcept
            : max_(max_units), unit_(unit) {
        }

        [[nodiscard]] std::chrono::milliseconds next_delay() noexcept;

    private:
        std::uint64_t previous_{0};
        std::uint64_t current_{1};
        std::uint64_t max_;
        std::chrono::milliseconds unit_;
    };

    struct ReconnectPolicy {
        int max_retries{kMaxRetries};
        std::uint64_t max_delay{30}; ///< ceiling, in delay units
        std::chrono::milliseconds delay_unit{std::chrono::seconds(1)};

        [[nodiscard]] FibonacciBackoff make_backoff() const noexcept { return FibonacciBackoff(max_delay, delay_unit); }
    };
} // namespace gw::transport
