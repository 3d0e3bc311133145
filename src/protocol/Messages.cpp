#include "protocol/Messages.hpp"

namespace gw::protocol {
    IncomingMessage incoming_from_int(int value) noexcept {
        if (value == -2) return IncomingMessage::Shutdown;
        if ((value >= 1 && value <= 21)
            || (value >= 45 && value <= 47)
            || (value >= 49 && value <= 59)
            || (value >= 61 && value <= 107)) {
            return static_cast<IncomingMessage>(value);
        }
        return IncomingMessage::NotValid;
    }

    std::optional<OutgoingMessage> outgoing_from_int(int value) noexcept {
        if ((value >= 1 && value <= 25)
            || (value >= 49 && value <= 59)
            || (value >= 61 && value <= 104)) {
            return static_cast<OutgoingMessage>(value);
        }
        return std::nullopt;
    }

    std::optional<std::size_t> request_id_index(IncomingMessage kind) noexcept {
        using M = IncomingMessage;
        switch (kind) {
            case M::AccountSummary:
            case M::AccountSummaryEnd:
            case M::AccountUpdateMulti:
            case M::AccountUpdateMultiEnd:
            case M::ContractDataEnd:
            case M::Error:
            case M::ExecutionDataEnd:
            case M::MarketDepth:
            case M::MarketDepthL2:
            case M::PositionMulti:
            case M::PositionMultiEnd:
            case M::RealTimeBars:
            case M::ScannerData:
            case M::TickEFP:
            case M::TickGeneric:
            case M::TickPrice:
            case M::TickSize:
            case M::TickSnapshotEnd:
            case M::TickString:
                return 2;

            case M::ContractData:
            case M::ExecutionData:
            case M::HeadTimestamp:
            case M::HistogramData:
            case M::HistoricalData:
            case M::HistoricalNews:
            case M::HistoricalNewsEnd:
            case M::HistoricalSchedule:
            case M::HistoricalTick:
            case M::HistoricalTickBidAsk:
            case M::HistoricalTickLast:
            case M::NewsArticle:
            case M::OpenOrder:
            case M::PnL:
            case M::PnLSingle:
            case M::SecurityDefinitionOptionParameter:
            case M::SecurityDefinitionOptionParameterEnd:
            case M::SymbolSamples:
            case M::TickByTick:
            case M::TickNews:
            case M::TickOptionComputation:
            case M::TickReqParams:
            case M::WshEventData:
            case M::WshMetaData:
                return 1;

            default:
                return std::nullopt;
        }
    }

    std::optional<std::size_t> order_id_index(IncomingMessage kind) noexcept {
        switch (kind) {
            case IncomingMessage::OpenOrder:
            case IncomingMessage::OrderStatus:
                return 1;
            case IncomingMessage::ExecutionData:
            case IncomingMessage::ExecutionDataEnd:
                return 2;
            default:
                return std::nullopt;
        }
    }
} // namespace gw::protocol
