#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "utils/TimeZone.hpp"

namespace gw {
    /// Session facts learned during the startup exchange. Fixed once the bus owns the connection.
    struct ConnectionMetadata {
        int server_version{0};
        int client_id{0};
        int next_order_id{0};
        std::string managed_accounts; ///< comma separated, as sent
        std::optional<std::chrono::system_clock::time_point> connection_time; ///< absolute instant
        std::optional<utils::TimeZone> time_zone; ///< gateway's zone, when recognized
    };
} // namespace gw
