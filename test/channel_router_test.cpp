#include <gtest/gtest.h>

#include <boost/system/system_error.hpp>

#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "protocol/WireCodec.hpp"
#include "transport/Channel.hpp"
#include "transport/ChannelRouter.hpp"

using gw::protocol::OutgoingMessage;
using gw::protocol::ResponseMessage;
using gw::transport::BlockingChannel;

namespace {
    struct CapturedLog {
        std::vector<std::pair<gw::LogLevel, std::string> > lines;

        gw::LogFn sink() {
            return [this](gw::LogLevel level, std::string_view line) { lines.emplace_back(level, std::string(line)); };
        }
    };

    class ChannelRouterTest : public ::testing::Test {
    protected:
        CapturedLog log;
        gw::transport::ChannelRouter<BlockingChannel> router{gw::Logger("Router", log.sink())};

        void dispatch(std::string_view simple) { router.dispatch(ResponseMessage::from_simple(simple)); }

        static std::string next_simple(BlockingChannel &channel) {
            auto r = channel.try_pop();
            if (!r) return "<empty>";
            if (r->ec) return "<error " + r->ec.message() + ">";
            return r->message.encode_simple();
        }
    };
} // namespace

TEST_F(ChannelRouterTest, RoutesByRequestId) {
    auto a = router.add_request(9000);
    auto b = router.add_request(9001);
    dispatch("1|6|9001|1|150.0|");
    dispatch("1|6|9000|2|151.0|");
    EXPECT_EQ(next_simple(*a), "1|6|9000|2|151.0|");
    EXPECT_EQ(next_simple(*b), "1|6|9001|1|150.0|");
    EXPECT_EQ(router.active_requests(), 2u);
}

TEST_F(ChannelRouterTest, DuplicateRequestIdIsInvalid) {
    auto a = router.add_request(9000);
    try {
        (void) router.add_request(9000);
        FAIL() << "expected system_error";
    } catch (const boost::system::system_error &e) {
        EXPECT_EQ(e.code(), gw::error::errc::invalid_request);
    }
}

TEST_F(ChannelRouterTest, ReleaseClosesChannel) {
    auto a = router.add_request(9000);
    router.release_request(9000);
    EXPECT_TRUE(a->closed());
    EXPECT_EQ(router.active_requests(), 0u);
    // later frames for the id are dropped
    dispatch("1|6|9000|2|151.0|");
    EXPECT_EQ(a->size(), 0u);
}

TEST_F(ChannelRouterTest, SharedOnlyWithSubscribers) {
    dispatch("49|1|1704450600|");
    auto shared = router.attach_shared(OutgoingMessage::RequestCurrentTime);
    EXPECT_EQ(router.shared_subscribers(OutgoingMessage::RequestCurrentTime), 1);
    EXPECT_EQ(shared->size(), 0u);

    dispatch("49|1|1704450601|");
    EXPECT_EQ(next_simple(*shared), "49|1|1704450601|");

    router.detach_shared(OutgoingMessage::RequestCurrentTime);
    EXPECT_EQ(router.shared_subscribers(OutgoingMessage::RequestCurrentTime), 0);
    dispatch("49|1|1704450602|");
    EXPECT_EQ(shared->size(), 0u);
}

TEST_F(ChannelRouterTest, SharedChannelIsOnePerKind) {
    auto first = router.attach_shared(OutgoingMessage::RequestPositions);
    auto second = router.attach_shared(OutgoingMessage::RequestPositions);
    EXPECT_EQ(first, second);
    EXPECT_EQ(router.shared_subscribers(OutgoingMessage::RequestPositions), 2);
    EXPECT_THROW((void) router.attach_shared(OutgoingMessage::RequestMarketData), boost::system::system_error);
}

TEST_F(ChannelRouterTest, WarningsAndUnaddressedErrorsAreLogged) {
    auto a = router.add_request(9000);
    auto updates = router.open_order_updates();
    dispatch("4|2|9000|2104|Market data farm connection is OK|");
    dispatch("4|2|-1|1100|Connectivity lost|");
    EXPECT_EQ(a->size(), 0u);
    EXPECT_EQ(updates->size(), 0u);
    ASSERT_EQ(log.lines.size(), 2u);
    EXPECT_EQ(log.lines[0].first, gw::LogLevel::info);
    EXPECT_NE(log.lines[0].second.find("2104"), std::string::npos);
    EXPECT_EQ(log.lines[1].first, gw::LogLevel::error);
}

TEST_F(ChannelRouterTest, RequestErrorsReachRequestAndOrderUpdates) {
    auto a = router.add_request(9000);
    auto updates = router.open_order_updates();
    dispatch("4|2|9000|200|No security definition|");
    EXPECT_EQ(next_simple(*a), "4|2|9000|200|No security definition|");
    EXPECT_EQ(next_simple(*updates), "4|2|9000|200|No security definition|");
}

TEST_F(ChannelRouterTest, OrderUpdatesSeeOrderTraffic) {
    auto order = router.add_order(1001);
    auto updates = router.open_order_updates();
    EXPECT_THROW((void) router.open_order_updates(), boost::system::system_error);

    dispatch("3|1001|Filled|");
    EXPECT_EQ(next_simple(*order), "3|1001|Filled|");
    EXPECT_EQ(next_simple(*updates), "3|1001|Filled|");

    // unknown order id: falls back to the open-orders channels, nobody listening there
    dispatch("3|2002|Submitted|");
    EXPECT_EQ(order->size(), 0u);
    EXPECT_EQ(next_simple(*updates), "3|2002|Submitted|");

    router.release_order_updates();
    EXPECT_TRUE(updates->closed());
    auto again = router.open_order_updates();
    EXPECT_NE(again, updates);
}

TEST_F(ChannelRouterTest, CommissionFollowsExecution) {
    auto order = router.add_order(1001);
    // [11, req id, order id, contract fields..., exec id at 14]
    const std::string execution = "11|9005|1001|265598|AAPL|STK||0|||NASDAQ|USD|AAPL|NMS|0001f4e8.65.01.01|";
    dispatch(execution);
    dispatch("59|1|0001f4e8.65.01.01|1.0|USD|");
    dispatch("59|1|unknown-exec|1.0|USD|");

    EXPECT_EQ(next_simple(*order), execution);
    EXPECT_EQ(next_simple(*order), "59|1|0001f4e8.65.01.01|1.0|USD|");
    EXPECT_EQ(next_simple(*order), "<empty>");
}

TEST_F(ChannelRouterTest, ReleasedChannelForgetsItsExecutions) {
    auto order = router.add_order(1001);
    auto request = router.add_request(9005);
    dispatch("11|9005|1001|265598|AAPL|STK||0|||NASDAQ|USD|AAPL|NMS|exec-a|");
    dispatch("11|9005|2002|265598|AAPL|STK||0|||NASDAQ|USD|AAPL|NMS|exec-b|");
    EXPECT_EQ(router.tracked_executions(), 2u);

    router.release_order(1001);
    EXPECT_EQ(router.tracked_executions(), 1u);
    router.release_request(9005);
    EXPECT_EQ(router.tracked_executions(), 0u);

    dispatch("59|1|exec-a|1.0|USD|");
    ASSERT_FALSE(log.lines.empty());
    EXPECT_NE(log.lines.back().second.find("no recipient for commission report"), std::string::npos);
}

TEST_F(ChannelRouterTest, ExecutionFallsBackToRequestId) {
    auto request = router.add_request(9005);
    dispatch("11|9005|1001|265598|AAPL|STK||0|||NASDAQ|USD|AAPL|NMS|exec-1|");
    dispatch("55|1|9005|");
    EXPECT_NE(next_simple(*request).find("exec-1"), std::string::npos);
    EXPECT_EQ(next_simple(*request), "55|1|9005|");
}

TEST_F(ChannelRouterTest, NotifyAllKeepsRegistrations) {
    auto a = router.add_request(9000);
    auto shared = router.attach_shared(OutgoingMessage::RequestCurrentTime);
    auto idle = router.attach_shared(OutgoingMessage::RequestManagedAccounts);
    router.detach_shared(OutgoingMessage::RequestManagedAccounts);

    router.notify_all(gw::error::make_error_code(gw::error::errc::connection_reset));
    EXPECT_EQ(next_simple(*a), "<error connection reset>");
    EXPECT_EQ(next_simple(*shared), "<error connection reset>");
    EXPECT_EQ(idle->size(), 0u);
    EXPECT_EQ(router.active_requests(), 1u);
    EXPECT_FALSE(a->closed());
}

TEST_F(ChannelRouterTest, CloseAllEndsEverything) {
    auto a = router.add_request(9000);
    auto shared = router.attach_shared(OutgoingMessage::RequestPositions);
    auto updates = router.open_order_updates();
    router.close_all();

    EXPECT_TRUE(a->closed());
    EXPECT_TRUE(shared->closed());
    EXPECT_TRUE(updates->closed());
    try {
        (void) router.add_request(9001);
        FAIL() << "expected system_error";
    } catch (const boost::system::system_error &e) {
        EXPECT_EQ(e.code(), gw::error::errc::not_connected);
    }
    EXPECT_THROW((void) router.attach_shared(OutgoingMessage::RequestPositions), boost::system::system_error);
}
