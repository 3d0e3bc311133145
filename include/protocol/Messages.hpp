#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace gw::protocol {
    /// Message families sent by the gateway. Value is the first field of every frame.
    enum class IncomingMessage : int {
        Shutdown = -2,
        NotValid = -1,
        TickPrice = 1,
        TickSize = 2,
        OrderStatus = 3,
        Error = 4,
        OpenOrder = 5,
        AccountValue = 6,
        PortfolioValue = 7,
        AccountUpdateTime = 8,
        NextValidId = 9,
        ContractData = 10,
        ExecutionData = 11,
        MarketDepth = 12,
        MarketDepthL2 = 13,
        NewsBulletins = 14,
        ManagedAccounts = 15,
        ReceiveFA = 16,
        HistoricalData = 17,
        BondContractData = 18,
        ScannerParameters = 19,
        ScannerData = 20,
        TickOptionComputation = 21,
        TickGeneric = 45,
        TickString = 46,
        TickEFP = 47,
        CurrentTime = 49,
        RealTimeBars = 50,
        FundamentalData = 51,
        ContractDataEnd = 52,
        OpenOrderEnd = 53,
        AccountDownloadEnd = 54,
        ExecutionDataEnd = 55,
        DeltaNeutralValidation = 56,
        TickSnapshotEnd = 57,
        MarketDataType = 58,
        CommissionsReport = 59,
        Position = 61,
        PositionEnd = 62,
        AccountSummary = 63,
        AccountSummaryEnd = 64,
        VerifyMessageApi = 65,
        VerifyCompleted = 66,
        DisplayGroupList = 67,
        DisplayGroupUpdated = 68,
        VerifyAndAuthMessageApi = 69,
        VerifyAndAuthCompleted = 70,
        PositionMulti = 71,
        PositionMultiEnd = 72,
        AccountUpdateMulti = 73,
        AccountUpdateMultiEnd = 74,
        SecurityDefinitionOptionParameter = 75,
        SecurityDefinitionOptionParameterEnd = 76,
        SoftDollarTier = 77,
        FamilyCodes = 78,
        SymbolSamples = 79,
        MktDepthExchanges = 80,
        TickReqParams = 81,
        SmartComponents = 82,
        NewsArticle = 83,
        TickNews = 84,
        NewsProviders = 85,
        HistoricalNews = 86,
        HistoricalNewsEnd = 87,
        HeadTimestamp = 88,
        HistogramData = 89,
        HistoricalDataUpdate = 90,
        RerouteMktDataReq = 91,
        RerouteMktDepthReq = 92,
        MarketRule = 93,
        PnL = 94,
        PnLSingle = 95,
        HistoricalTick = 96,
        HistoricalTickBidAsk = 97,
        HistoricalTickLast = 98,
        TickByTick = 99,
        OrderBound = 100,
        CompletedOrder = 101,
        CompletedOrdersEnd = 102,
        ReplaceFAEnd = 103,
        WshMetaData = 104,
        WshEventData = 105,
        HistoricalSchedule = 106,
        UserInfo = 107
    };

    /// Message families sent by the client.
    enum class OutgoingMessage : int {
        RequestMarketData = 1,
        CancelMarketData = 2,
        PlaceOrder = 3,
        CancelOrder = 4,
        RequestOpenOrders = 5,
        RequestAccountData = 6,
        RequestExecutions = 7,
        RequestIds = 8,
        RequestContractData = 9,
        RequestMarketDepth = 10,
        CancelMarketDepth = 11,
        RequestNewsBulletins = 12,
        CancelNewsBulletin = 13,
        ChangeServerLog = 14,
        RequestAutoOpenOrders = 15,
        RequestAllOpenOrders = 16,
        RequestManagedAccounts = 17,
        RequestFA = 18,
        ReplaceFA = 19,
        RequestHistoricalData = 20,
        ExerciseOptions = 21,
        RequestScannerSubscription = 22,
        CancelScannerSubscription = 23,
        RequestScannerParameters = 24,
        CancelHistoricalData = 25,
        RequestCurrentTime = 49,
        RequestRealTimeBars = 50,
        CancelRealTimeBars = 51,
        RequestFundamentalData = 52,
        CancelFundamentalData = 53,
        ReqCalcImpliedVolat = 54,
        ReqCalcOptionPrice = 55,
        CancelImpliedVolatility = 56,
        CancelOptionPrice = 57,
        RequestGlobalCancel = 58,
        RequestMarketDataType = 59,
        RequestPositions = 61,
        RequestAccountSummary = 62,
        CancelAccountSummary = 63,
        CancelPositions = 64,
        VerifyRequest = 65,
        VerifyMessage = 66,
        QueryDisplayGroups = 67,
        SubscribeToGroupEvents = 68,
        UpdateDisplayGroup = 69,
        UnsubscribeFromGroupEvents = 70,
        StartApi = 71,
        VerifyAndAuthRequest = 72,
        VerifyAndAuthMessage = 73,
        RequestPositionsMulti = 74,
        CancelPositionsMulti = 75,
        RequestAccountUpdatesMulti = 76,
        CancelAccountUpdatesMulti = 77,
        RequestSecurityDefinitionOptionalParameters = 78,
        RequestSoftDollarTiers = 79,
        RequestFamilyCodes = 80,
        RequestMatchingSymbols = 81,
        RequestMktDepthExchanges = 82,
        RequestSmartComponents = 83,
        RequestNewsArticle = 84,
        RequestNewsProviders = 85,
        RequestHistoricalNews = 86,
        RequestHeadTimestamp = 87,
        RequestHistogramData = 88,
        CancelHistogramData = 89,
        CancelHeadTimestamp = 90,
        RequestMarketRule = 91,
        RequestPnL = 92,
        CancelPnL = 93,
        RequestPnLSingle = 94,
        CancelPnLSingle = 95,
        RequestHistoricalTicks = 96,
        RequestTickByTickData = 97,
        CancelTickByTickData = 98,
        RequestCompletedOrders = 99,
        RequestWshMetaData = 100,
        CancelWshMetaData = 101,
        RequestWshEventData = 102,
        CancelWshEventData = 103,
        RequestUserInfo = 104
    };

    /// Maps a raw message id to its family; unknown ids become NotValid.
    [[nodiscard]] IncomingMessage incoming_from_int(int value) noexcept;

    /// Maps a raw message id to an outgoing family, or nullopt when the id is not one.
    [[nodiscard]] std::optional<OutgoingMessage> outgoing_from_int(int value) noexcept;

    /// Field position of the request id, for families that carry one.
    [[nodiscard]] std::optional<std::size_t> request_id_index(IncomingMessage kind) noexcept;

    /// Field position of the order id (OpenOrder/OrderStatus: 1, ExecutionData/ExecutionDataEnd: 2).
    [[nodiscard]] std::optional<std::size_t> order_id_index(IncomingMessage kind) noexcept;

    /// Error frame layout: [4, version, request_id, code, message, ...]
    constexpr std::size_t kErrorCodeIndex = 3;
    constexpr std::size_t kErrorMessageIndex = 4;

    /// Codes 2100..2169 are informational warnings (market data farm status and the like).
    [[nodiscard]] constexpr bool is_warning_code(int code) noexcept {
        return code >= 2100 && code < 2170;
    }

    [[nodiscard]] constexpr int to_int(IncomingMessage m) noexcept { return static_cast<int>(m); }
    [[nodiscard]] constexpr int to_int(OutgoingMessage m) noexcept { return static_cast<int>(m); }
} // namespace gw::protocol
