#include <gtest/gtest.h>

#include <utility>  // must precede boost/asio (boost 1.74 awaitable.hpp)
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "async/AsyncQueue.hpp"
#include "common/Errors.hpp"
#include "transport/Backoff.hpp"
#include "transport/Channel.hpp"
#include "transport/IdManager.hpp"
#include "transport/Retry.hpp"

using namespace std::chrono_literals;
using gw::transport::BlockingChannel;
using gw::transport::Response;

TEST(BackoffTest, FibonacciThenCapped) {
    gw::transport::FibonacciBackoff backoff(30);
    std::vector<long> seconds;
    for (int i = 0; i < 10; ++i) {
        seconds.push_back(std::chrono::duration_cast<std::chrono::seconds>(backoff.next_delay()).count());
    }
    EXPECT_EQ(seconds, (std::vector<long>{1, 2, 3, 5, 8, 13, 21, 30, 30, 30}));
}

TEST(BackoffTest, PolicyUnit) {
    gw::transport::ReconnectPolicy policy;
    policy.delay_unit = 10ms;
    policy.max_delay = 3;
    auto backoff = policy.make_backoff();
    EXPECT_EQ(backoff.next_delay(), 10ms);
    EXPECT_EQ(backoff.next_delay(), 20ms);
    EXPECT_EQ(backoff.next_delay(), 30ms);
    EXPECT_EQ(backoff.next_delay(), 30ms);
}

TEST(IdManagerTest, RequestIdsStartAt9000) {
    gw::transport::IdManager ids(1000);
    EXPECT_EQ(ids.next_request_id(), 9000);
    EXPECT_EQ(ids.next_request_id(), 9001);
    EXPECT_EQ(ids.next_order_id(), 1000);
    EXPECT_EQ(ids.next_order_id(), 1001);
}

TEST(IdManagerTest, UpdateOrderIdNeverMovesBack) {
    gw::transport::IdManager ids(1000);
    ids.update_order_id(1500);
    EXPECT_EQ(ids.peek_order_id(), 1500);
    ids.update_order_id(1200);
    EXPECT_EQ(ids.next_order_id(), 1500);
}

TEST(IdManagerTest, UniqueAcrossThreads) {
    gw::transport::IdManager ids(1);
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::vector<std::vector<int> > seen(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) seen[t].push_back(ids.next_request_id());
        });
    }
    for (auto &w: workers) w.join();

    std::set<int> all;
    for (const auto &v: seen) {
        // strictly increasing within one caller
        for (std::size_t i = 1; i < v.size(); ++i) EXPECT_LT(v[i - 1], v[i]);
        all.insert(v.begin(), v.end());
    }
    EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(BlockingChannelTest, DrainsThenEndsAfterClose) {
    BlockingChannel channel;
    EXPECT_TRUE(channel.push(Response::fail(gw::error::errc::timeout)));
    channel.close();
    EXPECT_FALSE(channel.push(Response::fail(gw::error::errc::timeout)));

    auto first = channel.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->ec, gw::error::errc::timeout);
    EXPECT_FALSE(channel.pop().has_value());
}

TEST(BlockingChannelTest, PopForTimesOut) {
    BlockingChannel channel;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop_for(30ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
    EXPECT_FALSE(channel.closed());
    EXPECT_FALSE(channel.try_pop().has_value());
}

TEST(BlockingChannelTest, CloseWakesBlockedReader) {
    BlockingChannel channel;
    std::thread closer([&] {
        std::this_thread::sleep_for(20ms);
        channel.close();
    });
    EXPECT_FALSE(channel.pop().has_value());
    closer.join();
}

TEST(BlockingChannelTest, InterruptWakesOnlyStoppedReader) {
    BlockingChannel channel;
    std::atomic<bool> stop{false};
    std::thread stopper([&] {
        std::this_thread::sleep_for(20ms);
        stop = true;
        channel.interrupt();
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop_for(5s, &stop).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    stopper.join();

    // still open; a stopped reader leaves queued items to the others
    EXPECT_FALSE(channel.closed());
    EXPECT_TRUE(channel.push(Response::fail(gw::error::errc::timeout)));
    EXPECT_FALSE(channel.pop(&stop).has_value());
    EXPECT_EQ(channel.size(), 1u);
    EXPECT_TRUE(channel.pop().has_value());
}

TEST(AsyncQueueTest, PopsInOrderAndEndsOnClose) {
    boost::asio::io_context ioc;
    auto queue = gw::async::AsyncQueue<int>::create();
    std::vector<int> got;
    bool ended = false;

    boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
        while (auto v = co_await queue->async_pop(boost::asio::use_awaitable)) got.push_back(*v);
        ended = true;
    }, boost::asio::detached);

    boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
        queue->push(1);
        queue->push(2);
        queue->push(3);
        queue->close();
        co_return;
    }, boost::asio::detached);

    ioc.run();
    EXPECT_EQ(got, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(ended);
    EXPECT_FALSE(queue->push(4));
}

TEST(AsyncQueueTest, TimedPopTimesOutThenStillDelivers) {
    boost::asio::io_context ioc;
    auto queue = gw::async::AsyncQueue<int>::create();
    std::optional<int> timed_out{-1};
    std::optional<int> later;

    boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
        timed_out = co_await queue->async_pop_for(20ms, boost::asio::use_awaitable);
        queue->push(7);
        later = co_await queue->async_pop_for(1s, boost::asio::use_awaitable);
    }, boost::asio::detached);

    ioc.run();
    EXPECT_FALSE(timed_out.has_value());
    EXPECT_EQ(later, 7);
}

TEST(AsyncQueueTest, InterruptWakesWaitersWithoutClosing) {
    boost::asio::io_context ioc;
    auto queue = gw::async::AsyncQueue<int>::create();
    int woken = 0;

    for (int i = 0; i < 2; ++i) {
        boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
            if (!co_await queue->async_pop(boost::asio::use_awaitable)) ++woken;
        }, boost::asio::detached);
    }
    boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
        queue->interrupt();
        co_return;
    }, boost::asio::detached);

    ioc.run();
    EXPECT_EQ(woken, 2);
    EXPECT_FALSE(queue->closed());
    EXPECT_TRUE(queue->push(1));
    EXPECT_EQ(queue->try_pop(), 1);
}

TEST(RetryTest, RetriesConnectionResetOnly) {
    gw::Logger log("RetryTest", [](gw::LogLevel, std::string_view) {});
    int calls = 0;
    const auto result = gw::transport::retry_on_connection_reset([&] {
        if (++calls < 3) {
            throw boost::system::system_error(gw::error::make_error_code(gw::error::errc::connection_reset));
        }
        return 42;
    }, log);
    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);

    calls = 0;
    EXPECT_THROW(gw::transport::retry_on_connection_reset([&]() -> int {
        ++calls;
        throw boost::system::system_error(gw::error::make_error_code(gw::error::errc::timeout));
    }, log), boost::system::system_error);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, GivesUpAfterMaxRetries) {
    gw::Logger log("RetryTest", [](gw::LogLevel, std::string_view) {});
    int calls = 0;
    try {
        gw::transport::retry_on_connection_reset([&]() -> int {
            ++calls;
            throw boost::system::system_error(gw::error::make_error_code(gw::error::errc::connection_reset));
        }, log, 2);
        FAIL() << "expected system_error";
    } catch (const boost::system::system_error &e) {
        EXPECT_EQ(e.code(), gw::error::errc::connection_reset);
    }
    EXPECT_EQ(calls, 3);
}
