#include "subscription/Decoders.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace gw {
    using protocol::IncomingMessage;
    using protocol::OutgoingMessage;
    using protocol::RequestMessage;
    using protocol::ResponseMessage;

    namespace {
        [[noreturn]] void unexpected(const ResponseMessage &message) {
            throw boost::system::system_error(error::make_error_code(error::errc::unexpected_response),
                                              message.encode_simple());
        }

        // Error frames become ServerError, foreign frames are skipped.
        void expect(const ResponseMessage &message, IncomingMessage kind) {
            const auto actual = message.message_type();
            if (actual == kind) return;
            if (actual == IncomingMessage::Error) throw ServerError(notice_from(message));
            unexpected(message);
        }
    } // namespace

    Notice notice_from(const ResponseMessage &message) {
        Notice notice;
        notice.code = message.peek_int(protocol::kErrorCodeIndex);
        notice.message = message.peek_string(protocol::kErrorMessageIndex);
        return notice;
    }

    Notice NoticeDecoder::decode(const DecoderContext &, ResponseMessage &message) {
        if (message.message_type() != IncomingMessage::Error) unexpected(message);
        return notice_from(message);
    }

    std::chrono::system_clock::time_point CurrentTimeDecoder::decode(const DecoderContext &, ResponseMessage &message) {
        expect(message, IncomingMessage::CurrentTime);
        message.skip(); // message type
        message.skip(); // version
        return message.next_date_time();
    }

    std::vector<std::string> ManagedAccountsDecoder::decode(const DecoderContext &, ResponseMessage &message) {
        expect(message, IncomingMessage::ManagedAccounts);
        message.skip();
        message.skip();
        const auto text = message.next_string();

        std::vector<std::string> parts;
        boost::split(parts, text, boost::is_any_of(","));
        std::vector<std::string> accounts;
        for (auto &p: parts) {
            if (!p.empty()) accounts.push_back(std::move(p));
        }
        return accounts;
    }

    int NextValidIdDecoder::decode(const DecoderContext &, ResponseMessage &message) {
        expect(message, IncomingMessage::NextValidId);
        message.skip();
        message.skip();
        return message.next_int();
    }

    Position PositionsDecoder::decode_position(ResponseMessage &message) {
        message.skip(); // message type
        const int version = message.next_int();

        Position p;
        p.account = message.next_string();
        p.contract_id = message.next_int();
        p.symbol = message.next_string();
        p.security_type = message.next_string();
        p.last_trade_date = message.next_string();
        p.strike = message.next_double();
        p.right = message.next_string();
        p.multiplier = message.next_string();
        p.exchange = message.next_string();
        p.currency = message.next_string();
        p.local_symbol = message.next_string();
        if (version >= 2) p.trading_class = message.next_string();
        p.position = message.next_double();
        if (version >= 3) p.average_cost = message.next_double();
        return p;
    }

    PositionUpdate PositionsDecoder::decode(const DecoderContext &, ResponseMessage &message) {
        switch (message.message_type()) {
            case IncomingMessage::Position:
                return decode_position(message);
            case IncomingMessage::PositionEnd:
                return PositionEnd{};
            case IncomingMessage::Error:
                throw ServerError(notice_from(message));
            default:
                unexpected(message);
        }
    }

    std::optional<RequestMessage> PositionsDecoder::cancel_message(const DecoderContext &) {
        return requests::cancel_positions();
    }

    namespace requests {
        constexpr int kVersion = 1;

        RequestMessage current_time() {
            RequestMessage m;
            m.push(OutgoingMessage::RequestCurrentTime).push(kVersion);
            return m;
        }

        RequestMessage managed_accounts() {
            RequestMessage m;
            m.push(OutgoingMessage::RequestManagedAccounts).push(kVersion);
            return m;
        }

        RequestMessage next_valid_order_id() {
            RequestMessage m;
            m.push(OutgoingMessage::RequestIds).push(kVersion).push(0);
            return m;
        }

        RequestMessage positions() {
            RequestMessage m;
            m.push(OutgoingMessage::RequestPositions).push(kVersion);
            return m;
        }

        RequestMessage cancel_positions() {
            RequestMessage m;
            m.push(OutgoingMessage::CancelPositions).push(kVersion);
            return m;
        }
    } // namespace requests
} // namespace gw
