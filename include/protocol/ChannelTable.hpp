#pragma once

#include <optional>
#include <vector>

#include "protocol/Messages.hpp"
#include "protocol/WireCodec.hpp"

namespace gw::protocol {
    /// A request family without a request id, and the response families it produces.
    struct ChannelMapping {
        OutgoingMessage request;
        std::vector<IncomingMessage> responses;
    };

    /// Static shared-channel table, built once.
    [[nodiscard]] const std::vector<ChannelMapping> &channel_mappings();

    /// Requests whose shared channel receives `kind` (OpenOrder feeds three of them).
    [[nodiscard]] std::vector<OutgoingMessage> shared_requests_for(IncomingMessage kind);

    [[nodiscard]] bool has_shared_channel(OutgoingMessage request) noexcept;

    /// Families handled by the order path (order-id routing, executions, commissions).
    [[nodiscard]] bool is_order_message(IncomingMessage kind) noexcept;

    /// Request id carried by Error frames that concern no particular request.
    constexpr int kUnspecifiedRequestId = -1;

    /**
     * @brief Where an incoming frame goes.
     *
     *  - Error      : error frame; request_id/error_code are filled (-1/0 when absent).
     *  - Order      : order-path family, see is_order_message().
     *  - RequestId  : frame carries a request id at request_id_index().
     *  - Shared     : no id; delivered by message type to shared channels.
     */
    struct RoutingDecision {
        enum class Kind { Error, Order, RequestId, Shared };

        Kind kind{Kind::Shared};
        IncomingMessage message_type{IncomingMessage::NotValid};
        int request_id{kUnspecifiedRequestId};
        int error_code{0};
    };

    [[nodiscard]] RoutingDecision determine_routing(const ResponseMessage &message) noexcept;
} // namespace gw::protocol
