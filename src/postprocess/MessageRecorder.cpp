#include "postprocess/MessageRecorder.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>

namespace gw {
    namespace {
        std::atomic<std::uint64_t> g_recorder_instance{0};

        std::string session_stamp() {
            const std::time_t now = std::time(nullptr);
            std::tm tm{};
            gmtime_r(&now, &tm);
            char buf[32];
            const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d-%H-%M", &tm);
            return {buf, n};
        }
    } // namespace

    MessageRecorder::MessageRecorder(const std::string &base_dir, LogFn log) {
        log_.set_sink(std::move(log));
        if (base_dir.empty()) return;

        const auto instance = g_recorder_instance.fetch_add(1, std::memory_order_relaxed);
        session_dir_ = base_dir + "/" + session_stamp() + "-" + std::to_string(instance);

        std::error_code ec;
        std::filesystem::create_directories(session_dir_, ec);
        if (ec) {
            log_.error("cannot create " + session_dir_ + ": " + ec.message());
            session_dir_.clear();
            return;
        }
        out_.open(file_path(), std::ios::out | std::ios::app);
        if (!out_.is_open()) {
            log_.error("cannot open " + file_path());
            session_dir_.clear();
            return;
        }
        log_.info("recording to " + file_path());
    }

    std::shared_ptr<MessageRecorder> MessageRecorder::from_env(LogFn log) {
        const char *dir = std::getenv(kEnvVar);
        return std::make_shared<MessageRecorder>(dir ? std::string(dir) : std::string(), std::move(log));
    }

    bool MessageRecorder::enabled() const noexcept {
        std::lock_guard lk(mu_);
        return out_.is_open();
    }

    std::int64_t MessageRecorder::now_ns_() noexcept {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    }

    void MessageRecorder::record_request(const protocol::RequestMessage &message) noexcept {
        if (!enabled()) return;
        try {
            write_line_("request", message.encode_simple());
        } catch (const std::exception &e) {
            log_.warn(std::string("request not recorded: ") + e.what());
        }
    }

    void MessageRecorder::record_response(const protocol::ResponseMessage &message) noexcept {
        if (!enabled()) return;
        try {
            write_line_("response", message.encode_simple());
        } catch (const std::exception &e) {
            log_.warn(std::string("response not recorded: ") + e.what());
        }
    }

    void MessageRecorder::write_line_(std::string_view direction, const std::string &simple) noexcept {
        std::lock_guard lk(mu_);
        if (!out_.is_open()) return;
        try {
            nlohmann::json j;
            j["seq"] = ++seq_;
            j["direction"] = direction;
            j["ts_ns"] = now_ns_();
            j["message"] = simple;
            // Gateway text may not be UTF-8; replace instead of throwing.
            out_ << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
            out_.flush();
            if (!out_) {
                out_.close();
                log_.error("write failed, recording disabled");
            }
        } catch (const std::exception &e) {
            out_.close();
            log_.error(std::string("recording disabled: ") + e.what());
        }
    }
} // namespace gw
