#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "connection/ConnectionMetadata.hpp"
#include "protocol/ServerVersions.hpp"
#include "protocol/WireCodec.hpp"
#include "utils/Logger.hpp"
#include "utils/TimeZone.hpp"

namespace gw::connection {
    /// Receives frames the gateway pushes before the bus starts (open orders, order status...).
    using StartupCallback = std::function<void(const protocol::ResponseMessage &)>;

    struct HandshakeData {
        int min_version{0};
        int max_version{0};
        int server_version{0};
        std::string server_time;
    };

    struct AccountInfo {
        std::optional<int> next_order_id;
        std::optional<std::string> managed_accounts;
    };

    /// The startup exchange gives up after this many frames without NextValidId + ManagedAccounts.
    constexpr int kMaxAccountInfoFrames = 100;

    /**
     * @brief Stateless pieces of the startup exchange, shared by the blocking and coroutine connections.
     *
     * Sequence:
     *   1) send format_handshake()
     *   2) read one frame -> parse_handshake_response()
     *   3) send format_start_api()
     *   4) read frames through parse_account_info() until both ids are known
     */
    class ConnectionHandler {
    public:
        ConnectionHandler() = default;

        ConnectionHandler(int min_version, int max_version)
            : min_version_(min_version), max_version_(max_version) {
        }

        /// "API\0" followed by the length-prefixed "v<min>..<max>".
        [[nodiscard]] std::string format_handshake() const;

        HandshakeData parse_handshake_response(protocol::ResponseMessage &response) const;

        [[nodiscard]] protocol::RequestMessage format_start_api(int client_id, int server_version) const;

        /**
         * 'parse_account_info' pulls next_order_id / managed_accounts out of one frame.
         * Error frames are logged. Anything else goes to the callback or is logged as lost.
         */
        AccountInfo parse_account_info(protocol::ResponseMessage &message,
                                       const StartupCallback &callback,
                                       const Logger &log) const;

        [[nodiscard]] int min_version() const noexcept { return min_version_; }
        [[nodiscard]] int max_version() const noexcept { return max_version_; }

    private:
        int min_version_{server_versions::MIN_CLIENT_VERSION};
        int max_version_{server_versions::MAX_CLIENT_VERSION};
    };

    /**
     * Parses "YYYYMMDD HH:MM:SS <zone>" where <zone> may contain spaces.
     * Unknown zone: both unresolved. Bad date/time: time unresolved, zone kept.
     */
    std::pair<std::optional<std::chrono::system_clock::time_point>, std::optional<utils::TimeZone> >
    parse_connection_time(std::string_view text, const Logger &log);

    /// Folds one parsed frame into metadata; true once both ids were seen.
    bool apply_account_info(const AccountInfo &info, ConnectionMetadata &meta, bool &saw_order_id,
                            bool &saw_accounts);

    /// Metadata stays as first learned; a re-handshake that disagrees is only reported.
    void log_metadata_changes(const ConnectionMetadata &current, const ConnectionMetadata &fresh, const Logger &log);
} // namespace gw::connection
