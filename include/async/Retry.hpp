#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <string>
#include <utility>

#include "common/Errors.hpp"
#include "transport/Retry.hpp"
#include "utils/Logger.hpp"

namespace gw::async {
    /// Coroutine twin of transport::retry_on_connection_reset; `op` returns an awaitable.
    template<typename Op>
    auto retry_on_connection_reset(Op op, Logger log, int max_retries = transport::kMaxConnectionResetRetries)
        -> decltype(op()) {
        for (int attempt = 0;; ++attempt) {
            try {
                co_return co_await op();
            } catch (const boost::system::system_error &e) {
                if (e.code() != error::make_error_code(error::errc::connection_reset) || attempt >= max_retries) throw;
                log.info("connection reset, retrying (" + std::to_string(attempt + 1) + "/" +
                         std::to_string(max_retries) + ")");
            }
        }
    }
} // namespace gw::async
