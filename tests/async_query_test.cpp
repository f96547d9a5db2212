#include "store/store.hpp"

#include "common/clock.hpp"

#include <gtest/gtest.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <utility>

namespace {

using namespace mockdb;
namespace asio = boost::asio;

const Clock::time_point kStart{std::chrono::seconds{1709284500}};

// ════════════════════════════════════════════════════════════════════════════
//  Awaitable query tests
// ════════════════════════════════════════════════════════════════════════════

class AsyncQueryTest : public ::testing::Test {
protected:
    asio::io_context ioc_;
    std::shared_ptr<MockClock> clock_ = std::make_shared<MockClock>(kStart);
};

// Without latency the awaitable completes with the same envelope as execute().
TEST_F(AsyncQueryTest, ExecuteMatchesSyncResult) {
    Store store(StoreConfig{}, clock_);
    std::optional<query::QueryResult> result;

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        const Record row{{"name", "A"}};
        co_await store.from("leads").insert(row).async_execute();
        result = co_await store.from("leads").select().eq("name", "A").async_execute();
    }, asio::detached);

    ioc_.run();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->ok());
    ASSERT_EQ(result->data.size(), 1u);
    EXPECT_EQ(result->data[0].at("created_at"), Value("2024-03-01T09:15:00.000Z"));
}

// The simulated delay is applied before the query runs.
TEST_F(AsyncQueryTest, LatencyIsAtLeastConfiguredMinimum) {
    StoreConfig cfg;
    cfg.latency_min_ms = 20;
    cfg.latency_max_ms = 30;
    Store store(cfg, clock_);

    std::chrono::steady_clock::duration elapsed{};
    bool done = false;

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        const auto t0 = std::chrono::steady_clock::now();
        auto res = co_await store.from("leads").select().async_execute();
        elapsed = std::chrono::steady_clock::now() - t0;
        done = res.ok();
    }, asio::detached);

    ioc_.run();
    EXPECT_TRUE(done);
    EXPECT_GE(elapsed, std::chrono::milliseconds{20});
}

TEST_F(AsyncQueryTest, SingleReturnsFirstRowOrNothing) {
    Store store(StoreConfig{}, clock_);
    std::optional<Record> found;
    bool missing_is_empty = false;

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        const Record row{{"id", "x"}, {"name", "X"}};
        co_await store.from("leads").insert(row).async_execute();

        auto hit = co_await store.from("leads").select().eq("id", "x").async_single();
        found = hit.data;

        auto miss = co_await store.from("leads").select().eq("id", "y").async_maybe_single();
        missing_is_empty = miss.ok() && !miss.data.has_value();
    }, asio::detached);

    ioc_.run();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->at("name"), Value("X"));
    EXPECT_TRUE(missing_is_empty);
}

// The awaitable owns its query; the builder may be gone before it runs.
TEST_F(AsyncQueryTest, AwaitableOutlivesBuilder) {
    StoreConfig cfg;
    cfg.latency_min_ms = 1;
    cfg.latency_max_ms = 5;
    Store store(cfg, clock_);
    ASSERT_TRUE(store.from("leads").insert(Record{{"name", "A"}}).execute().ok());

    auto pending = store.from("leads").select().eq("name", "A").async_execute();

    std::size_t rows = 0;
    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        auto res = co_await std::move(pending);
        rows = res.data.size();
    }, asio::detached);

    ioc_.run();
    EXPECT_EQ(rows, 1u);
}

// Awaiting the same builder twice runs the insert twice.
TEST_F(AsyncQueryTest, ReawaitingBuilderRepeatsMutation) {
    Store store(StoreConfig{}, clock_);
    auto builder = store.from("leads").insert(Record{{"name", "A"}});

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        co_await builder.async_execute();
        co_await builder.async_execute();
    }, asio::detached);

    ioc_.run();
    EXPECT_EQ(store.data().size("leads"), 2u);
}

// Errors surface in the envelope on the async path too.
TEST_F(AsyncQueryTest, ErrorsAreReturnedNotThrown) {
    Store store(StoreConfig{}, clock_);
    std::optional<query::QueryResult> result;

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        const Record row{{"id", 7}};
        result = co_await store.from("leads").insert(row).async_execute();
    }, asio::detached);

    ioc_.run();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->ok());
    EXPECT_EQ(store.data().size("leads"), 0u);
}

} // namespace
