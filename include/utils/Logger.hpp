#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace gw {
    enum class LogLevel { debug, info, warn, error };

    [[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

    /// Sink receiving already formatted "[Component] message" lines.
    using LogFn = std::function<void(LogLevel, std::string_view)>;

    /// Writes to std::cerr; debug lines only when debug::enabled is on.
    LogFn default_logger();

    /**
     * @brief Per-component front end over a LogFn.
     *
     * Each component owns one and prefixes its lines with its name, so a single
     * sink can be shared by the connection, the bus and the recorder.
     */
    class Logger {
    public:
        explicit Logger(std::string component, LogFn sink = {})
            : component_(std::move(component)), sink_(sink ? std::move(sink) : default_logger()) {
        }

        void set_sink(LogFn sink) { sink_ = sink ? std::move(sink) : default_logger(); }
        [[nodiscard]] const LogFn &sink() const noexcept { return sink_; }

        void log(LogLevel level, std::string_view msg) const;

        void debug(std::string_view msg) const { log(LogLevel::debug, msg); }
        void info(std::string_view msg) const { log(LogLevel::info, msg); }
        void warn(std::string_view msg) const { log(LogLevel::warn, msg); }
        void error(std::string_view msg) const { log(LogLevel::error, msg); }

    private:
        std::string component_;
        LogFn sink_;
    };
} // namespace gw
