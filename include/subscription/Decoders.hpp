#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/Errors.hpp"
#include "subscription/Decoder.hpp"

namespace gw {
    /// Reads [4, version, request_id, code, message] without moving the cursor.
    [[nodiscard]] Notice notice_from(const protocol::ResponseMessage &message);

    /// Frames as received. Collaborators bring their own field layouts.
    struct RawDecoder {
        using value_type = protocol::ResponseMessage;

        static value_type decode(const DecoderContext &, protocol::ResponseMessage &message) { return message; }
    };

    /// Error frames addressed to a request; anything else is skipped.
    struct NoticeDecoder {
        using value_type = Notice;

        static value_type decode(const DecoderContext &ctx, protocol::ResponseMessage &message);
    };

    /// [49, version, unix_seconds]
    struct CurrentTimeDecoder {
        using value_type = std::chrono::system_clock::time_point;

        static value_type decode(const DecoderContext &ctx, protocol::ResponseMessage &message);
    };

    /// [15, version, "DU1,DU2"]
    struct ManagedAccountsDecoder {
        using value_type = std::vector<std::string>;

        static value_type decode(const DecoderContext &ctx, protocol::ResponseMessage &message);
    };

    /// [9, version, order_id]
    struct NextValidIdDecoder {
        using value_type = int;

        static value_type decode(const DecoderContext &ctx, protocol::ResponseMessage &message);
    };

    struct Position {
        std::string account;
        int contract_id{0};
        std::string symbol;
        std::string security_type;
        std::string last_trade_date;
        double strike{0.0};
        std::string right;
        std::string multiplier;
        std::string exchange;
        std::string currency;
        std::string local_symbol;
        std::string trading_class;
        double position{0.0};
        double average_cost{0.0};
    };

    struct PositionEnd {
    };

    using PositionUpdate = std::variant<Position, PositionEnd>;

    /// Position (61) frames until PositionEnd (62). Cancelled with CancelPositions.
    struct PositionsDecoder {
        using value_type = PositionUpdate;

        static value_type decode(const DecoderContext &ctx, protocol::ResponseMessage &message);

        static std::optional<protocol::RequestMessage> cancel_message(const DecoderContext &ctx);

        static bool is_end(const value_type &value) noexcept { return std::holds_alternative<PositionEnd>(value); }

        static Position decode_position(protocol::ResponseMessage &message);
    };

    /// Request builders for the operations the clients expose directly.
    namespace requests {
        [[nodiscard]] protocol::RequestMessage current_time();

        [[nodiscard]] protocol::RequestMessage managed_accounts();

        [[nodiscard]] protocol::RequestMessage next_valid_order_id();

        [[nodiscard]] protocol::RequestMessage positions();

        [[nodiscard]] protocol::RequestMessage cancel_positions();
    } // namespace requests
} // namespace gw
