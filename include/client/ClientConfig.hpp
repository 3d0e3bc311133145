#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "connection/Connection.hpp"
#include "postprocess/MessageRecorder.hpp"
#include "protocol/ServerVersions.hpp"
#include "transport/Backoff.hpp"
#include "utils/Logger.hpp"

namespace gw {
    /// Everything needed to open a session. Read once at connect().
    struct ClientConfig {
        std::string host{"127.0.0.1"};
        std::uint16_t port{4002};
        int client_id{100};

        transport::ReconnectPolicy reconnect{};

        int min_version{server_versions::MIN_CLIENT_VERSION};
        int max_version{server_versions::MAX_CLIENT_VERSION};

        /// Upper bound for one-shot queries (server time, managed accounts, next id).
        std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};

        connection::StartupCallback startup{}; ///< frames seen before dispatch starts
        LogFn log{}; ///< empty = stderr

        /// Overrides GW_RECORDING_DIR. An empty string disables recording.
        std::optional<std::string> recording_dir{};
    };

    /// Recorder for a config: explicit directory first, then the environment.
    inline std::shared_ptr<MessageRecorder> make_recorder(const ClientConfig &cfg) {
        if (cfg.recording_dir) return std::make_shared<MessageRecorder>(*cfg.recording_dir, cfg.log);
        return MessageRecorder::from_env(cfg.log);
    }

    inline connection::ConnectionOptions connection_options(const ClientConfig &cfg) {
        connection::ConnectionOptions opts;
        opts.min_version = cfg.min_version;
        opts.max_version = cfg.max_version;
        opts.reconnect = cfg.reconnect;
        opts.startup = cfg.startup;
        opts.recorder = make_recorder(cfg);
        opts.log = cfg.log;
        return opts;
    }
} // namespace gw
