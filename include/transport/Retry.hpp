#pragma once

#include <boost/system/system_error.hpp>

#include <string>
#include <utility>

#include "common/Errors.hpp"
#include "utils/Logger.hpp"

namespace gw::transport {
    /// Re-issues made by retry_on_connection_reset after the first attempt.
    constexpr int kMaxConnectionResetRetries = 3;

    /**
     * Runs `op` again while it fails with connection_reset, up to `max_retries` more times.
     * Meant for stateless one-shot queries (server time, managed accounts); stateful
     * subscriptions are never re-issued behind the caller's back.
     */
    template<typename Op>
    auto retry_on_connection_reset(Op &&op, const Logger &log, int max_retries = kMaxConnectionResetRetries)
        -> decltype(op()) {
        for (int attempt = 0;; ++attempt) {
            try {
                return op();
            } catch (const boost::system::system_error &e) {
                if (e.code() != error::make_error_code(error::errc::connection_reset) || attempt >= max_retries) throw;
                log.info("connection reset, retrying (" + std::to_string(attempt + 1) + "/" +
                         std::to_string(max_retries) + ")");
            }
        }
    }
} // namespace gw::transport
