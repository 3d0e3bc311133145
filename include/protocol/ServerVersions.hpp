#pragma once

namespace gw::server_versions {
    /// Start-API carries an (empty) optional capabilities field above this version.
    constexpr int OPTIONAL_CAPABILITIES = 72;
    constexpr int ADVANCED_ORDER_REJECT = 166;
    constexpr int WSH_EVENT_DATA_FILTERS_DATE = 173;

    /// Range the client offers during the handshake.
    constexpr int MIN_CLIENT_VERSION = 100;
    constexpr int MAX_CLIENT_VERSION = WSH_EVENT_DATA_FILTERS_DATE;
} // namespace gw::server_versions
