#include <gtest/gtest.h>

#include "connection/Handshake.hpp"
#include "utils/TimeZone.hpp"

using gw::utils::find_timezone;
using gw::utils::map_timezone_name;

namespace {
    const gw::Logger &quiet_log() {
        static const gw::Logger log("TimeZoneTest", [](gw::LogLevel, std::string_view) {});
        return log;
    }

    std::chrono::system_clock::time_point unix_seconds(std::int64_t s) {
        return std::chrono::system_clock::time_point{std::chrono::seconds{s}};
    }
} // namespace

TEST(TimeZoneTest, ChineseNamesMapToShanghai) {
    EXPECT_EQ(map_timezone_name("中国标准时间"), "Asia/Shanghai");
    EXPECT_EQ(map_timezone_name("北京时间"), "Asia/Shanghai");
    EXPECT_EQ(map_timezone_name("China Standard Time"), "Asia/Shanghai");
    // lossy decode of a GB2312 name
    EXPECT_EQ(map_timezone_name("\xEF\xBF\xBD\xEF\xBF\xBD"), "Asia/Shanghai");
    // raw GB2312 bytes for the same name
    EXPECT_EQ(map_timezone_name("\xD6\xD0\xB9\xFA\xB1\xEA\xD7\xBC\xCA\xB1\xBC\xE4"), "Asia/Shanghai");
}

TEST(TimeZoneTest, OtherNamesPassThrough) {
    EXPECT_EQ(map_timezone_name("EST"), "EST");
    EXPECT_EQ(map_timezone_name("Europe/London"), "Europe/London");
}

TEST(TimeZoneTest, Utf8Validation) {
    EXPECT_TRUE(gw::utils::is_valid_utf8("plain ascii"));
    EXPECT_TRUE(gw::utils::is_valid_utf8("中国"));
    EXPECT_FALSE(gw::utils::is_valid_utf8("\xC0\xAF"));
    EXPECT_FALSE(gw::utils::is_valid_utf8("\xE4\xB8"));
}

TEST(TimeZoneTest, FindsAliasesAndWindowsNames) {
    auto ny = find_timezone("EST");
    ASSERT_TRUE(ny.has_value());
    EXPECT_EQ(ny->name, "America/New_York");
    ASSERT_TRUE(ny->rules);

    EXPECT_EQ(find_timezone("Pacific Standard Time")->name, "America/Los_Angeles");
    EXPECT_EQ(find_timezone("Asia/Tokyo")->name, "Asia/Tokyo");
    EXPECT_EQ(find_timezone("中国标准时间")->name, "Asia/Shanghai");
    EXPECT_FALSE(find_timezone("Mars/Olympus_Mons").has_value());
}

TEST(ConnectionTimeTest, ParsesZoneWithSpaces) {
    const auto [time, zone] = gw::connection::parse_connection_time("20240105 10:30:00 China Standard Time",
                                                                    quiet_log());
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->name, "Asia/Shanghai");
    ASSERT_TRUE(time.has_value());
    // 10:30 in Shanghai is 02:30 UTC
    EXPECT_EQ(*time, unix_seconds(1704421800));
}

TEST(ConnectionTimeTest, SummerTimeApplies) {
    const auto [time, zone] = gw::connection::parse_connection_time("20240701 12:00:00 US/Eastern", quiet_log());
    ASSERT_TRUE(time.has_value());
    // EDT is UTC-4
    EXPECT_EQ(*time, unix_seconds(1719849600));
}

TEST(ConnectionTimeTest, UnknownZoneLeavesBothUnresolved) {
    const auto [time, zone] = gw::connection::parse_connection_time("20240105 10:30:00 Nowhere", quiet_log());
    EXPECT_FALSE(time.has_value());
    EXPECT_FALSE(zone.has_value());
}

TEST(ConnectionTimeTest, BadTimeKeepsZone) {
    const auto [time, zone] = gw::connection::parse_connection_time("20240105 25:30:00 EST", quiet_log());
    EXPECT_FALSE(time.has_value());
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->name, "America/New_York");
}

TEST(ConnectionTimeTest, MissingPartsAreInvalid) {
    const auto [time, zone] = gw::connection::parse_connection_time("20240105", quiet_log());
    EXPECT_FALSE(time.has_value());
    EXPECT_FALSE(zone.has_value());
}
