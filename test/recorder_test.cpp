#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "connection/Connection.hpp"
#include "postprocess/MessageRecorder.hpp"
#include "subscription/Decoders.hpp"

#include "mocks/fake_gateway.h"

namespace fs = std::filesystem;

namespace {
    gw::LogFn quiet() {
        return [](gw::LogLevel, std::string_view) {};
    }

    class RecorderTest : public ::testing::Test {
    protected:
        void SetUp() override {
            base_ = fs::temp_directory_path() /
                    ("gwlink-recorder-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::remove_all(base_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(base_, ec);
        }

        static std::vector<nlohmann::json> read_lines(const std::string &path) {
            std::vector<nlohmann::json> out;
            std::ifstream in(path);
            std::string line;
            while (std::getline(in, line)) {
                if (!line.empty()) out.push_back(nlohmann::json::parse(line));
            }
            return out;
        }

        fs::path base_;
    };
} // namespace

TEST_F(RecorderTest, WritesOneJsonObjectPerFrame) {
    gw::MessageRecorder recorder(base_.string(), quiet());
    ASSERT_TRUE(recorder.enabled());
    EXPECT_EQ(fs::path(recorder.directory()).parent_path(), base_);

    recorder.record_request(gw::requests::current_time());
    recorder.record_response(gw::protocol::ResponseMessage::from_simple("49|1|1704450600|"));

    const auto lines = read_lines(recorder.file_path());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["seq"], 1);
    EXPECT_EQ(lines[0]["direction"], "request");
    EXPECT_EQ(lines[0]["message"], "49|1|");
    EXPECT_EQ(lines[1]["seq"], 2);
    EXPECT_EQ(lines[1]["direction"], "response");
    EXPECT_EQ(lines[1]["message"], "49|1|1704450600|");
    EXPECT_LE(lines[0]["ts_ns"].get<std::int64_t>(), lines[1]["ts_ns"].get<std::int64_t>());
}

TEST_F(RecorderTest, EachRecorderGetsItsOwnDirectory) {
    gw::MessageRecorder first(base_.string(), quiet());
    gw::MessageRecorder second(base_.string(), quiet());
    EXPECT_NE(first.directory(), second.directory());
}

TEST_F(RecorderTest, EmptyDirectoryDisables) {
    gw::MessageRecorder recorder(std::string(), quiet());
    EXPECT_FALSE(recorder.enabled());
    // no-ops
    recorder.record_request(gw::requests::current_time());
    EXPECT_FALSE(gw::MessageRecorder().enabled());
}

TEST_F(RecorderTest, FromEnvironment) {
    ::setenv(gw::MessageRecorder::kEnvVar, base_.c_str(), 1);
    const auto recorder = gw::MessageRecorder::from_env(quiet());
    ::unsetenv(gw::MessageRecorder::kEnvVar);
    EXPECT_TRUE(recorder->enabled());

    const auto disabled = gw::MessageRecorder::from_env(quiet());
    EXPECT_FALSE(disabled->enabled());
}

TEST_F(RecorderTest, ConnectionRecordsStartupExchange) {
    auto recorder = std::make_shared<gw::MessageRecorder>(base_.string(), quiet());
    gw::connection::ConnectionOptions options;
    options.recorder = recorder;
    options.log = quiet();
    gw::connection::Connection conn(std::make_unique<gw::test::FakeGatewayStream>(), 100, options);
    conn.establish_connection();

    const auto lines = read_lines(recorder->file_path());
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0]["direction"], "response"); // handshake ack
    EXPECT_EQ(lines[1]["direction"], "request");
    EXPECT_EQ(lines[1]["message"], "71|2|100||");
    EXPECT_EQ(lines[2]["message"], "9|1|1000|");
    EXPECT_EQ(lines[3]["message"], "15|1|DU111,DU222|");
}

TEST_F(RecorderTest, NonUtf8TextIsReplaced) {
    gw::MessageRecorder recorder(base_.string(), quiet());
    recorder.record_response(gw::protocol::ResponseMessage::from_simple("4|2|-1|2104|\xD6\xD0\xB9\xFA|"));
    const auto lines = read_lines(recorder.file_path());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(recorder.enabled());
}
