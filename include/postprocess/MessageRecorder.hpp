#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "protocol/WireCodec.hpp"
#include "utils/Logger.hpp"

namespace gw {
    /**
     * @brief Optional capture of every frame crossing the socket, one JSON object per line.
     *
     * Enabled by GW_RECORDING_DIR (or ClientConfig::recording_dir). Each recorder writes
     * <dir>/<YYYY-MM-DD-HH-MM>-<instance>/messages.jsonl with lines
     *   {"seq":N,"direction":"request"|"response","ts_ns":...,"message":"f0|f1|"}
     *
     * Writes are best-effort: a failing file disables the recorder, never the transport.
     */
    class MessageRecorder {
    public:
        static constexpr const char *kEnvVar = "GW_RECORDING_DIR";

        /// Disabled recorder.
        MessageRecorder() = default;

        /// Records under a fresh session directory below base_dir. Empty base_dir disables.
        explicit MessageRecorder(const std::string &base_dir, LogFn log = {});

        MessageRecorder(const MessageRecorder &) = delete;

        MessageRecorder &operator=(const MessageRecorder &) = delete;

        static std::shared_ptr<MessageRecorder> from_env(LogFn log = {});

        [[nodiscard]] bool enabled() const noexcept;
        [[nodiscard]] const std::string &directory() const noexcept { return session_dir_; }
        [[nodiscard]] std::string file_path() const { return session_dir_ + "/messages.jsonl"; }

        void record_request(const protocol::RequestMessage &message) noexcept;
        void record_response(const protocol::ResponseMessage &message) noexcept;

    private:
        static std::int64_t now_ns_() noexcept;
        void write_line_(std::string_view direction, const std::string &simple) noexcept;

    private:
        mutable std::mutex mu_;
        std::ofstream out_;
        std::string session_dir_;
        std::uint64_t seq_{0};
        Logger log_{"Recorder"};
    };
} // namespace gw
