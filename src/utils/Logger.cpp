#include "utils/Logger.hpp"

#include "utils/DebugConfigUtils.hpp"

#include <iostream>
#include <mutex>

namespace gw {
    std::string_view to_string(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::debug: return "debug";
            case LogLevel::info: return "info";
            case LogLevel::warn: return "warn";
            case LogLevel::error: return "error";
        }
        return "?";
    }

    LogFn default_logger() {
        return [](LogLevel level, std::string_view line) {
            if (level == LogLevel::debug && !debug::dbg_on()) return;
            static std::mutex mu;
            std::lock_guard lk(mu);
            std::cerr << to_string(level) << ' ' << line << '\n';
        };
    }

    void Logger::log(LogLevel level, std::string_view msg) const {
        if (!sink_) return;
        std::string line;
        line.reserve(component_.size() + msg.size() + 3);
        line += '[';
        line += component_;
        line += "] ";
        line += msg;
        sink_(level, line);
    }
} // namespace gw
