#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "protocol/Messages.hpp"

namespace gw::protocol {
    /// Frames larger than this are rejected as corrupt.
    constexpr std::uint32_t kMaxFrameSize = 16u * 1024u * 1024u;

    /**
     * @brief Ordered list of textual fields making up one outgoing frame.
     *
     * Scalars are written as text: bools as "1"/"0", integers in decimal,
     * doubles in shortest round-trip form, empty optionals as "".
     */
    class RequestMessage {
    public:
        RequestMessage() = default;

        RequestMessage &push(OutgoingMessage kind);
        RequestMessage &push(int value);
        RequestMessage &push(std::int64_t value);
        RequestMessage &push(double value);
        RequestMessage &push(bool value);
        RequestMessage &push(std::string_view value);
        RequestMessage &push(const char *value) { return push(std::string_view(value)); }
        RequestMessage &push(const std::string &value) { return push(std::string_view(value)); }

        template<typename T>
        RequestMessage &push(const std::optional<T> &value) {
            if (value) return push(*value);
            fields_.emplace_back();
            return *this;
        }

        /// Payload bytes: every field followed by a NUL.
        [[nodiscard]] std::string encode() const;

        /// Same as encode() with '|' as separator (logs, recorder, tests).
        [[nodiscard]] std::string encode_simple() const;

        static RequestMessage from_simple(std::string_view text);

        [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
        [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
        [[nodiscard]] const std::string &operator[](std::size_t i) const { return fields_.at(i); }
        [[nodiscard]] const std::vector<std::string> &fields() const noexcept { return fields_; }

    private:
        std::vector<std::string> fields_;
    };

    /**
     * @brief Sequential typed reader over one incoming frame.
     *
     * Every next_* call consumes one field. A token that cannot be read as the
     * requested type raises DecodeError(decode_error); reading past the last
     * field raises DecodeError(truncated_message). The cursor still advances
     * past a malformed token.
     */
    class ResponseMessage {
    public:
        ResponseMessage() = default;

        explicit ResponseMessage(std::vector<std::string> fields) : fields_(std::move(fields)) {
        }

        /// Splits a NUL-terminated payload into fields.
        static ResponseMessage from(std::string_view payload);

        /// Splits a '|' separated rendering into fields.
        static ResponseMessage from_simple(std::string_view text);

        [[nodiscard]] IncomingMessage message_type() const noexcept;
        [[nodiscard]] bool is_shutdown() const noexcept { return message_type() == IncomingMessage::Shutdown; }

        [[nodiscard]] std::optional<int> request_id() const noexcept;
        [[nodiscard]] std::optional<int> order_id() const noexcept;
        [[nodiscard]] std::optional<std::string> execution_id() const;

        [[nodiscard]] int peek_int(std::size_t i) const;
        [[nodiscard]] std::string peek_string(std::size_t i) const;

        int next_int();
        std::int64_t next_long();
        double next_double();
        bool next_bool();
        std::string next_string();
        std::optional<int> next_optional_int();
        std::optional<std::int64_t> next_optional_long();
        std::optional<double> next_optional_double();
        /// "YYYYMMDD"
        boost::gregorian::date next_date();
        /// Unix seconds.
        std::chrono::system_clock::time_point next_date_time();

        void skip() noexcept { ++cursor_; }

        [[nodiscard]] std::size_t position() const noexcept { return cursor_; }
        void rewind() noexcept { cursor_ = 0; }

        [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
        [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
        [[nodiscard]] const std::vector<std::string> &fields() const noexcept { return fields_; }

        [[nodiscard]] std::string encode() const;
        [[nodiscard]] std::string encode_simple() const;

    private:
        const std::string &take_(const char *expected);

        std::vector<std::string> fields_;
        std::size_t cursor_{0};
    };

    /// Prefixes a payload with its big-endian u32 length.
    [[nodiscard]] std::string encode_length(std::string_view payload);

    /// Full wire frame for a request.
    [[nodiscard]] inline std::string encode_frame(const RequestMessage &msg) {
        return encode_length(msg.encode());
    }

    /// Reads the 4-byte big-endian length prefix.
    [[nodiscard]] std::uint32_t decode_length(const unsigned char *prefix) noexcept;
} // namespace gw::protocol
