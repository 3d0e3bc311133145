#pragma once

#include <concepts>
#include <optional>

#include "protocol/Messages.hpp"
#include "protocol/WireCodec.hpp"
#include "utils/TimeZone.hpp"

namespace gw {
    /// What a decoder may know about the request that produced a frame.
    struct DecoderContext {
        int server_version{0};
        std::optional<int> request_id;
        std::optional<int> order_id;
        std::optional<protocol::OutgoingMessage> request_type; ///< shared subscriptions
        const utils::TimeZone *time_zone{nullptr}; ///< gateway zone, null when unresolved
    };

    /**
     * A decoder turns one frame into one item:
     *
     *   struct MyDecoder {
     *       using value_type = ...;
     *       static value_type decode(const DecoderContext &, protocol::ResponseMessage &);
     *       // optional:
     *       static std::optional<protocol::RequestMessage> cancel_message(const DecoderContext &);
     *       static bool is_end(const value_type &);
     *   };
     *
     * decode() throws DecodeError for malformed frames, ServerError for error frames, and
     * system_error(unexpected_response) for frames the subscription should skip.
     */
    template<typename D>
    concept ResponseDecoder = requires(const DecoderContext &ctx, protocol::ResponseMessage &message) {
        typename D::value_type;
        { D::decode(ctx, message) } -> std::convertible_to<typename D::value_type>;
    };

    template<typename D>
    concept HasCancelMessage = requires(const DecoderContext &ctx) {
        { D::cancel_message(ctx) } -> std::convertible_to<std::optional<protocol::RequestMessage> >;
    };

    template<typename D>
    concept HasEndMarker = requires(const typename D::value_type &value) {
        { D::is_end(value) } -> std::convertible_to<bool>;
    };
} // namespace gw
