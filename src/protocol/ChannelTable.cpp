#include "protocol/ChannelTable.hpp"

#include <algorithm>

#include "common/Errors.hpp"

namespace gw::protocol {
    using I = IncomingMessage;
    using O = OutgoingMessage;

    const std::vector<ChannelMapping> &channel_mappings() {
        static const std::vector<ChannelMapping> table{
            {O::RequestIds, {I::NextValidId}},
            {O::RequestFamilyCodes, {I::FamilyCodes}},
            {O::RequestMarketRule, {I::MarketRule}},
            {O::RequestPositions, {I::Position, I::PositionEnd}},
            {O::RequestPositionsMulti, {I::PositionMulti, I::PositionMultiEnd}},
            {O::RequestOpenOrders, {I::OpenOrder, I::OrderStatus, I::OpenOrderEnd}},
            {O::RequestAllOpenOrders, {I::OpenOrder, I::OrderStatus, I::OpenOrderEnd}},
            {O::RequestAutoOpenOrders, {I::OpenOrder, I::OrderStatus, I::OpenOrderEnd}},
            {O::RequestCompletedOrders, {I::CompletedOrder, I::CompletedOrdersEnd}},
            {O::RequestManagedAccounts, {I::ManagedAccounts}},
            {O::RequestAccountData, {I::AccountValue, I::PortfolioValue, I::AccountDownloadEnd, I::AccountUpdateTime}},
            {O::RequestMarketDataType, {I::MarketDataType}},
            {O::RequestMktDepthExchanges, {I::MktDepthExchanges}},
            {O::RequestCurrentTime, {I::CurrentTime}},
            {O::RequestNewsProviders, {I::NewsProviders}},
            {O::RequestNewsBulletins, {I::NewsBulletins}},
            {O::RequestScannerParameters, {I::ScannerParameters}},
        };
        return table;
    }

    std::vector<OutgoingMessage> shared_requests_for(IncomingMessage kind) {
        std::vector<OutgoingMessage> out;
        for (const auto &m: channel_mappings()) {
            if (std::ranges::find(m.responses, kind) != m.responses.end()) out.push_back(m.request);
        }
        return out;
    }

    bool has_shared_channel(OutgoingMessage request) noexcept {
        return std::ranges::any_of(channel_mappings(), [request](const ChannelMapping &m) {
            return m.request == request;
        });
    }

    bool is_order_message(IncomingMessage kind) noexcept {
        switch (kind) {
            case I::OpenOrder:
            case I::OrderStatus:
            case I::ExecutionData:
            case I::ExecutionDataEnd:
            case I::CommissionsReport:
            case I::CompletedOrder:
            case I::OpenOrderEnd:
            case I::CompletedOrdersEnd:
                return true;
            default:
                return false;
        }
    }

    RoutingDecision determine_routing(const ResponseMessage &message) noexcept {
        RoutingDecision d;
        d.message_type = message.message_type();

        if (d.message_type == I::Error) {
            d.kind = RoutingDecision::Kind::Error;
            try {
                d.request_id = message.peek_int(2);
            } catch (const DecodeError &) {
                d.request_id = kUnspecifiedRequestId;
            }
            try {
                d.error_code = message.peek_int(kErrorCodeIndex);
            } catch (const DecodeError &) {
                d.error_code = 0;
            }
            return d;
        }

        if (is_order_message(d.message_type)) {
            d.kind = RoutingDecision::Kind::Order;
            d.request_id = message.request_id().value_or(kUnspecifiedRequestId);
            return d;
        }

        if (const auto rid = message.request_id()) {
            d.kind = RoutingDecision::Kind::RequestId;
            d.request_id = *rid;
            return d;
        }

        d.kind = RoutingDecision::Kind::Shared;
        return d;
    }
} // namespace gw::protocol
