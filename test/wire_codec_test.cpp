#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "common/Errors.hpp"
#include "protocol/ChannelTable.hpp"
#include "protocol/WireCodec.hpp"

using gw::protocol::IncomingMessage;
using gw::protocol::OutgoingMessage;
using gw::protocol::RequestMessage;
using gw::protocol::ResponseMessage;

// Every field is followed by a NUL, the frame by nothing else.
TEST(RequestMessageTest, EncodesFieldsNulTerminated) {
    RequestMessage msg;
    msg.push(OutgoingMessage::RequestCurrentTime).push(1);
    EXPECT_EQ(msg.encode(), std::string("49\0" "1\0", 5));
    EXPECT_EQ(msg.encode_simple(), "49|1|");
}

TEST(RequestMessageTest, EncodesScalars) {
    RequestMessage msg;
    msg.push(true).push(false).push(std::int64_t{9223372036854775807}).push(1.5).push("AAPL")
            .push(std::optional<int>{}).push(std::optional<int>{7});
    EXPECT_EQ(msg.encode_simple(), "1|0|9223372036854775807|1.5|AAPL||7|");
}

TEST(RequestMessageTest, FromSimpleKeepsEmptyFields) {
    auto msg = RequestMessage::from_simple("61|1||x|");
    ASSERT_EQ(msg.size(), 4u);
    EXPECT_EQ(msg[0], "61");
    EXPECT_EQ(msg[2], "");
    EXPECT_EQ(msg[3], "x");
}

TEST(FramingTest, LengthPrefixIsBigEndian) {
    RequestMessage msg;
    msg.push(OutgoingMessage::RequestPositions).push(1);
    const auto frame = gw::protocol::encode_frame(msg);
    ASSERT_EQ(frame.size(), 4u + 5u);
    EXPECT_EQ(frame.substr(0, 4), std::string("\0\0\0\x05", 4));
    EXPECT_EQ(gw::protocol::decode_length(reinterpret_cast<const unsigned char *>(frame.data())), 5u);

    const unsigned char big[4] = {0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(gw::protocol::decode_length(big), 0x01020304u);
}

TEST(ResponseMessageTest, SplitsPayload) {
    auto msg = ResponseMessage::from(std::string("49\0" "1\0" "1704450600\0", 16));
    EXPECT_EQ(msg.message_type(), IncomingMessage::CurrentTime);
    ASSERT_EQ(msg.size(), 3u);
    EXPECT_EQ(msg.next_int(), 49);
    msg.skip();
    EXPECT_EQ(msg.next_date_time(), std::chrono::system_clock::time_point{std::chrono::seconds{1704450600}});
}

TEST(ResponseMessageTest, ReadsTypedFields) {
    auto msg = ResponseMessage::from_simple("1|0|-12|9000000000|2.25|abc|20240105|");
    EXPECT_TRUE(msg.next_bool());
    EXPECT_FALSE(msg.next_bool());
    EXPECT_EQ(msg.next_int(), -12);
    EXPECT_EQ(msg.next_long(), 9000000000LL);
    EXPECT_DOUBLE_EQ(msg.next_double(), 2.25);
    EXPECT_EQ(msg.next_string(), "abc");
    EXPECT_EQ(msg.next_date(), boost::gregorian::date(2024, 1, 5));
    EXPECT_EQ(msg.position(), 7u);
}

// Unset sentinels and empty tokens read as absent; "Infinity" is a value.
TEST(ResponseMessageTest, OptionalSentinels) {
    auto msg = ResponseMessage::from_simple(
        "2147483647||9223372036854775807|1.7976931348623157E308|Infinity||5|");
    EXPECT_FALSE(msg.next_optional_int().has_value());
    EXPECT_FALSE(msg.next_optional_int().has_value());
    EXPECT_FALSE(msg.next_optional_long().has_value());
    EXPECT_FALSE(msg.next_optional_double().has_value());
    const auto inf = msg.next_optional_double();
    ASSERT_TRUE(inf.has_value());
    EXPECT_TRUE(std::isinf(*inf));
    EXPECT_FALSE(msg.next_optional_double().has_value());
    EXPECT_EQ(msg.next_optional_int(), 5);
}

TEST(ResponseMessageTest, EmptyDoubleIsZero) {
    auto msg = ResponseMessage::from_simple("|0|");
    EXPECT_EQ(msg.next_double(), 0.0);
    EXPECT_EQ(msg.next_double(), 0.0);
}

TEST(ResponseMessageTest, MalformedTokenReportsFieldIndex) {
    auto msg = ResponseMessage::from_simple("61|x|");
    msg.skip();
    try {
        (void) msg.next_int();
        FAIL() << "expected DecodeError";
    } catch (const gw::DecodeError &e) {
        EXPECT_EQ(e.code(), gw::error::errc::decode_error);
        EXPECT_EQ(e.field_index(), 1u);
        EXPECT_EQ(e.expected_type(), "int");
    }
    // the cursor moved past the bad token
    EXPECT_EQ(msg.position(), 2u);
}

TEST(ResponseMessageTest, ReadingPastEndIsTruncated) {
    auto msg = ResponseMessage::from_simple("49|");
    msg.skip();
    try {
        (void) msg.next_string();
        FAIL() << "expected DecodeError";
    } catch (const gw::DecodeError &e) {
        EXPECT_EQ(e.code(), gw::error::errc::truncated_message);
        EXPECT_EQ(e.field_index(), 1u);
    }
}

TEST(ResponseMessageTest, BadDateIsDecodeError) {
    auto msg = ResponseMessage::from_simple("20241399|");
    EXPECT_THROW((void) msg.next_date(), gw::DecodeError);
}

TEST(ResponseMessageTest, UnknownAndShutdownKinds) {
    EXPECT_EQ(ResponseMessage::from_simple("9999|").message_type(), IncomingMessage::NotValid);
    EXPECT_EQ(ResponseMessage::from_simple("abc|").message_type(), IncomingMessage::NotValid);
    EXPECT_EQ(ResponseMessage().message_type(), IncomingMessage::NotValid);
    EXPECT_TRUE(ResponseMessage::from_simple("-2|").is_shutdown());
}

TEST(ResponseMessageTest, RequestAndOrderIds) {
    EXPECT_EQ(ResponseMessage::from_simple("1|6|9001|1|150.0|").request_id(), 9001);
    EXPECT_EQ(ResponseMessage::from_simple("17|9002|x|").request_id(), 9002);
    EXPECT_EQ(ResponseMessage::from_simple("4|2|9003|200|no security|").request_id(), 9003);
    EXPECT_FALSE(ResponseMessage::from_simple("49|1|1704450600|").request_id().has_value());

    EXPECT_EQ(ResponseMessage::from_simple("3|1001|Filled|").order_id(), 1001);
    EXPECT_EQ(ResponseMessage::from_simple("11|9004|1002|").order_id(), 1002);
    EXPECT_FALSE(ResponseMessage::from_simple("61|3|DU111|").order_id().has_value());
}

TEST(RoutingTest, ClassifiesFrames) {
    using gw::protocol::RoutingDecision;
    using gw::protocol::determine_routing;

    auto d = determine_routing(ResponseMessage::from_simple("4|2|-1|2104|farm ok|"));
    EXPECT_EQ(d.kind, RoutingDecision::Kind::Error);
    EXPECT_EQ(d.request_id, gw::protocol::kUnspecifiedRequestId);
    EXPECT_EQ(d.error_code, 2104);

    d = determine_routing(ResponseMessage::from_simple("3|1001|Filled|"));
    EXPECT_EQ(d.kind, RoutingDecision::Kind::Order);

    d = determine_routing(ResponseMessage::from_simple("1|6|9001|1|150.0|"));
    EXPECT_EQ(d.kind, RoutingDecision::Kind::RequestId);
    EXPECT_EQ(d.request_id, 9001);

    d = determine_routing(ResponseMessage::from_simple("62|1|"));
    EXPECT_EQ(d.kind, RoutingDecision::Kind::Shared);
    EXPECT_EQ(d.message_type, IncomingMessage::PositionEnd);
}

TEST(ChannelTableTest, SharedRequests) {
    using gw::protocol::shared_requests_for;
    EXPECT_EQ(shared_requests_for(IncomingMessage::CurrentTime),
              std::vector<OutgoingMessage>{OutgoingMessage::RequestCurrentTime});
    EXPECT_EQ(shared_requests_for(IncomingMessage::OpenOrder).size(), 3u);
    EXPECT_TRUE(shared_requests_for(IncomingMessage::TickPrice).empty());
    EXPECT_TRUE(gw::protocol::has_shared_channel(OutgoingMessage::RequestPositions));
    EXPECT_FALSE(gw::protocol::has_shared_channel(OutgoingMessage::RequestMarketData));
}

TEST(ChannelTableTest, WarningCodes) {
    EXPECT_TRUE(gw::protocol::is_warning_code(2104));
    EXPECT_TRUE(gw::protocol::is_warning_code(2100));
    EXPECT_FALSE(gw::protocol::is_warning_code(2170));
    EXPECT_FALSE(gw::protocol::is_warning_code(200));
}
