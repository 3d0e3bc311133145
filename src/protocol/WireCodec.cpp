#include "protocol/WireCodec.hpp"

#include "common/Errors.hpp"

#include <array>
#include <charconv>
#include <limits>

namespace gw::protocol {
    namespace {
        constexpr std::string_view kInfinity = "Infinity";
        constexpr std::string_view kUnsetDouble = "1.7976931348623157E308";
        constexpr std::string_view kUnsetInteger = "2147483647";
        constexpr std::string_view kUnsetLong = "9223372036854775807";

        std::vector<std::string> split_terminated(std::string_view text, char sep) {
            std::vector<std::string> out;
            std::size_t start = 0;
            while (start < text.size()) {
                const auto pos = text.find(sep, start);
                if (pos == std::string_view::npos) {
                    out.emplace_back(text.substr(start));
                    break;
                }
                out.emplace_back(text.substr(start, pos - start));
                start = pos + 1;
            }
            return out;
        }

        std::string join_terminated(const std::vector<std::string> &fields, char sep) {
            std::size_t total = 0;
            for (const auto &f: fields) total += f.size() + 1;
            std::string out;
            out.reserve(total);
            for (const auto &f: fields) {
                out += f;
                out.push_back(sep);
            }
            return out;
        }

        template<typename T>
        bool parse_number(std::string_view token, T &out) noexcept {
            if (token.empty()) return false;
            const char *first = token.data();
            const char *last = token.data() + token.size();
            if (*first == '+') ++first;
            const auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc{} && ptr == last;
        }

        [[noreturn]] void throw_parse(std::size_t index, const char *expected, const std::string &token) {
            throw DecodeError(error::errc::decode_error, index, expected, token);
        }
    } // namespace

    // ---------------- RequestMessage ----------------

    RequestMessage &RequestMessage::push(OutgoingMessage kind) {
        return push(to_int(kind));
    }

    RequestMessage &RequestMessage::push(int value) {
        fields_.push_back(std::to_string(value));
        return *this;
    }

    RequestMessage &RequestMessage::push(std::int64_t value) {
        fields_.push_back(std::to_string(value));
        return *this;
    }

    RequestMessage &RequestMessage::push(double value) {
        std::array<char, 64> buf{};
        const auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
        fields_.emplace_back(buf.data(), ec == std::errc{} ? ptr : buf.data());
        return *this;
    }

    RequestMessage &RequestMessage::push(bool value) {
        fields_.emplace_back(value ? "1" : "0");
        return *this;
    }

    RequestMessage &RequestMessage::push(std::string_view value) {
        fields_.emplace_back(value);
        return *this;
    }

    std::string RequestMessage::encode() const {
        return join_terminated(fields_, '\0');
    }

    std::string RequestMessage::encode_simple() const {
        return join_terminated(fields_, '|');
    }

    RequestMessage RequestMessage::from_simple(std::string_view text) {
        RequestMessage msg;
        msg.fields_ = split_terminated(text, '|');
        return msg;
    }

    // ---------------- ResponseMessage ----------------

    ResponseMessage ResponseMessage::from(std::string_view payload) {
        return ResponseMessage(split_terminated(payload, '\0'));
    }

    ResponseMessage ResponseMessage::from_simple(std::string_view text) {
        return ResponseMessage(split_terminated(text, '|'));
    }

    IncomingMessage ResponseMessage::message_type() const noexcept {
        if (fields_.empty()) return IncomingMessage::NotValid;
        int id = -1;
        if (!parse_number(fields_.front(), id)) return IncomingMessage::NotValid;
        return incoming_from_int(id);
    }

    std::optional<int> ResponseMessage::request_id() const noexcept {
        const auto idx = request_id_index(message_type());
        if (!idx || *idx >= fields_.size()) return std::nullopt;
        int id = 0;
        if (!parse_number(fields_[*idx], id)) return std::nullopt;
        return id;
    }

    std::optional<int> ResponseMessage::order_id() const noexcept {
        const auto idx = order_id_index(message_type());
        if (!idx || *idx >= fields_.size()) return std::nullopt;
        int id = 0;
        if (!parse_number(fields_[*idx], id)) return std::nullopt;
        return id;
    }

    std::optional<std::string> ResponseMessage::execution_id() const {
        std::size_t idx;
        switch (message_type()) {
            case IncomingMessage::ExecutionData: idx = 14;
                break;
            case IncomingMessage::CommissionsReport: idx = 2;
                break;
            default: return std::nullopt;
        }
        if (idx >= fields_.size()) return std::nullopt;
        return fields_[idx];
    }

    int ResponseMessage::peek_int(std::size_t i) const {
        if (i >= fields_.size()) throw DecodeError(error::errc::truncated_message, i, "int", {});
        int value = 0;
        if (!parse_number(fields_[i], value)) throw_parse(i, "int", fields_[i]);
        return value;
    }

    std::string ResponseMessage::peek_string(std::size_t i) const {
        if (i >= fields_.size()) throw DecodeError(error::errc::truncated_message, i, "string", {});
        return fields_[i];
    }

    const std::string &ResponseMessage::take_(const char *expected) {
        if (cursor_ >= fields_.size()) {
            throw DecodeError(error::errc::truncated_message, cursor_, expected, {});
        }
        return fields_[cursor_++];
    }

    int ResponseMessage::next_int() {
        const auto &field = take_("int");
        int value = 0;
        if (!parse_number(field, value)) throw_parse(cursor_ - 1, "int", field);
        return value;
    }

    std::int64_t ResponseMessage::next_long() {
        const auto &field = take_("long");
        std::int64_t value = 0;
        if (!parse_number(field, value)) throw_parse(cursor_ - 1, "long", field);
        return value;
    }

    double ResponseMessage::next_double() {
        const auto &field = take_("double");
        if (field.empty() || field == "0" || field == "0.0") return 0.0;
        double value = 0.0;
        if (!parse_number(field, value)) throw_parse(cursor_ - 1, "double", field);
        return value;
    }

    bool ResponseMessage::next_bool() {
        return take_("bool") == "1";
    }

    std::string ResponseMessage::next_string() {
        return take_("string");
    }

    std::optional<int> ResponseMessage::next_optional_int() {
        const auto &field = take_("optional int");
        if (field.empty() || field == kUnsetInteger) return std::nullopt;
        int value = 0;
        if (!parse_number(field, value)) throw_parse(cursor_ - 1, "optional int", field);
        return value;
    }

    std::optional<std::int64_t> ResponseMessage::next_optional_long() {
        const auto &field = take_("optional long");
        if (field.empty() || field == kUnsetLong) return std::nullopt;
        std::int64_t value = 0;
        if (!parse_number(field, value)) throw_parse(cursor_ - 1, "optional long", field);
        return value;
    }

    std::optional<double> ResponseMessage::next_optional_double() {
        const auto &field = take_("optional double");
        if (field.empty() || field == kUnsetDouble) return std::nullopt;
        if (field == kInfinity) return std::numeric_limits<double>::infinity();
        double value = 0.0;
        if (!parse_number(field, value)) throw_parse(cursor_ - 1, "optional double", field);
        return value;
    }

    boost::gregorian::date ResponseMessage::next_date() {
        const auto &field = take_("date");
        int ymd = 0;
        if (field.size() != 8 || !parse_number(field, ymd)) throw_parse(cursor_ - 1, "date", field);
        try {
            return {
                static_cast<unsigned short>(ymd / 10000),
                static_cast<unsigned short>(ymd / 100 % 100),
                static_cast<unsigned short>(ymd % 100)
            };
        } catch (const std::out_of_range &) {
            throw_parse(cursor_ - 1, "date", field);
        }
    }

    std::chrono::system_clock::time_point ResponseMessage::next_date_time() {
        const auto &field = take_("timestamp");
        std::int64_t seconds = 0;
        if (!parse_number(field, seconds)) throw_parse(cursor_ - 1, "timestamp", field);
        return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
    }

    std::string ResponseMessage::encode() const {
        return join_terminated(fields_, '\0');
    }

    std::string ResponseMessage::encode_simple() const {
        return join_terminated(fields_, '|');
    }

    // ---------------- framing ----------------

    std::string encode_length(std::string_view payload) {
        const auto n = static_cast<std::uint32_t>(payload.size());
        std::string out;
        out.reserve(payload.size() + 4);
        out.push_back(static_cast<char>((n >> 24) & 0xFF));
        out.push_back(static_cast<char>((n >> 16) & 0xFF));
        out.push_back(static_cast<char>((n >> 8) & 0xFF));
        out.push_back(static_cast<char>(n & 0xFF));
        out.append(payload);
        return out;
    }

    std::uint32_t decode_length(const unsigned char *prefix) noexcept {
        return (static_cast<std::uint32_t>(prefix[0]) << 24)
               | (static_cast<std::uint32_t>(prefix[1]) << 16)
               | (static_cast<std::uint32_t>(prefix[2]) << 8)
               | static_cast<std::uint32_t>(prefix[3]);
    }
} // namespace gw::protocol
