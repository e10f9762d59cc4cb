#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "histshard/data/shard_pool.hpp"
#include "../core/test_base.hpp"
#include "mock_shard_store.hpp"

using namespace histshard;
using namespace histshard::testing;
using ::testing::Invoke;
using ::testing::NiceMock;

namespace {

struct StoreCounters {
    std::atomic<int> created{0};
    std::atomic<int> closed{0};
    std::atomic<bool> fail_open{false};
};

StoreFactory counting_factory(std::shared_ptr<StoreCounters> counters) {
    return [counters](const ShardDescriptor& descriptor) -> std::unique_ptr<ShardStore> {
        counters->created++;
        auto store = std::make_unique<NiceMock<MockShardStore>>(descriptor);
        auto open_flag = std::make_shared<bool>(false);
        ON_CALL(*store, open()).WillByDefault(Invoke([counters, open_flag]() {
            if (counters->fail_open) {
                return make_error<void>(ErrorCode::DATABASE_ERROR, "file is locked", "Mock");
            }
            *open_flag = true;
            return Result<void>();
        }));
        ON_CALL(*store, is_open()).WillByDefault(Invoke([open_flag]() { return *open_flag; }));
        ON_CALL(*store, close()).WillByDefault(Invoke([counters, open_flag]() {
            if (*open_flag) {
                counters->closed++;
            }
            *open_flag = false;
        }));
        return store;
    };
}

ShardDescriptor shard(const std::string& id) {
    ShardDescriptor descriptor;
    descriptor.id = id;
    descriptor.symbol = "SPX";
    return descriptor;
}

}  // namespace

class ShardPoolTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        counters_ = std::make_shared<StoreCounters>();
        config_.acquire_timeout = std::chrono::milliseconds(200);
        config_.degraded_cooldown = std::chrono::milliseconds(100);
    }

    std::unique_ptr<ShardPool> make_pool() {
        return std::make_unique<ShardPool>(config_, counting_factory(counters_));
    }

    PoolConfig config_;
    std::shared_ptr<StoreCounters> counters_;
};

TEST_F(ShardPoolTest, ReleasedConnectionIsReused) {
    auto pool = make_pool();
    auto desc = shard("indices/spx_1m_2024.db");

    {
        auto guard = pool->acquire(desc);
        ASSERT_TRUE(guard.is_ok()) << guard.error()->what();
        EXPECT_TRUE(guard.value()->is_open());
        EXPECT_EQ(pool->live_connections(desc.id), 1u);
    }
    EXPECT_EQ(pool->idle_connections(desc.id), 1u);

    auto again = pool->acquire(desc);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(counters_->created.load(), 1);
    EXPECT_EQ(pool->live_connections(desc.id), 1u);
}

TEST_F(ShardPoolTest, SecondBorrowerTimesOutWhileConnectionHeld) {
    auto pool = make_pool();
    auto desc = shard("indices/spx_1m_2024.db");

    auto held = pool->acquire(desc);
    ASSERT_TRUE(held.is_ok());

    auto start = std::chrono::steady_clock::now();
    auto blocked = pool->acquire(desc);
    ASSERT_TRUE(blocked.is_error());
    EXPECT_EQ(blocked.error()->code(), ErrorCode::TIMEOUT_ERROR);
    EXPECT_GE(std::chrono::steady_clock::now() - start, config_.acquire_timeout);
    EXPECT_EQ(pool->live_connections(desc.id), 1u);
}

TEST_F(ShardPoolTest, WaiterReceivesConnectionOnRelease) {
    config_.acquire_timeout = std::chrono::seconds(2);
    auto pool = make_pool();
    auto desc = shard("indices/spx_1m_2024.db");

    auto held = pool->acquire(desc);
    ASSERT_TRUE(held.is_ok());

    std::thread releaser([&held]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        held.value().release();
    });

    auto waited = pool->acquire(desc);
    releaser.join();
    ASSERT_TRUE(waited.is_ok());
    EXPECT_EQ(counters_->created.load(), 1);
}

TEST_F(ShardPoolTest, CancelledWaiterGivesUp) {
    config_.acquire_timeout = std::chrono::seconds(5);
    auto pool = make_pool();
    auto desc = shard("indices/spx_1m_2024.db");

    auto held = pool->acquire(desc);
    ASSERT_TRUE(held.is_ok());

    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        token.cancel();
    });

    auto cancelled = pool->acquire(desc, &token);
    canceller.join();
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error()->code(), ErrorCode::CANCELLED);
}

TEST_F(ShardPoolTest, FailedOpenDegradesUntilCooldown) {
    auto pool = make_pool();
    auto desc = shard("indices/spx_1m_2023.db");
    counters_->fail_open = true;

    auto first = pool->acquire(desc);
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error()->code(), ErrorCode::SHARD_UNAVAILABLE);
    EXPECT_TRUE(pool->is_degraded(desc.id));
    EXPECT_EQ(pool->live_connections(desc.id), 0u);

    // Fails fast without touching the file again
    auto second = pool->acquire(desc);
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error()->code(), ErrorCode::SHARD_UNAVAILABLE);
    EXPECT_EQ(counters_->created.load(), 1);

    counters_->fail_open = false;
    std::this_thread::sleep_for(config_.degraded_cooldown + std::chrono::milliseconds(50));
    auto retried = pool->acquire(desc);
    ASSERT_TRUE(retried.is_ok());
    EXPECT_EQ(counters_->created.load(), 2);
    EXPECT_FALSE(pool->is_degraded(desc.id));
}

TEST_F(ShardPoolTest, InvalidatedConnectionIsClosed) {
    auto pool = make_pool();
    auto desc = shard("indices/spx_1m_2024.db");

    auto guard = pool->acquire(desc);
    ASSERT_TRUE(guard.is_ok());
    guard.value().invalidate();
    guard.value().release();

    EXPECT_EQ(pool->live_connections(desc.id), 0u);
    EXPECT_EQ(pool->idle_connections(desc.id), 0u);
    EXPECT_EQ(counters_->closed.load(), 1);
}

TEST_F(ShardPoolTest, RaisedLimitAllowsConcurrentBorrowers) {
    auto pool = make_pool();
    auto desc = shard("indices/spx_1m_2024.db");
    pool->set_max_connections(desc.id, 2);

    auto a = pool->acquire(desc);
    auto b = pool->acquire(desc);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(pool->live_connections(desc.id), 2u);
    EXPECT_EQ(pool->total_live_connections(), 2u);
}

TEST_F(ShardPoolTest, IdleConnectionsEvictedAfterTimeout) {
    config_.idle_timeout = std::chrono::milliseconds(20);
    auto pool = make_pool();
    auto desc = shard("indices/spx_1m_2024.db");

    {
        auto guard = pool->acquire(desc);
        ASSERT_TRUE(guard.is_ok());
    }
    EXPECT_EQ(pool->idle_connections(desc.id), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(pool->evict_idle(), 1u);
    EXPECT_EQ(pool->live_connections(desc.id), 0u);
    EXPECT_EQ(counters_->closed.load(), 1);
}

TEST_F(ShardPoolTest, ShutdownClosesIdleAndRejectsAcquire) {
    auto pool = make_pool();
    auto desc = shard("indices/spx_1m_2024.db");

    auto borrowed = pool->acquire(shard("indices/spx_1m_2023.db"));
    ASSERT_TRUE(borrowed.is_ok());
    {
        auto guard = pool->acquire(desc);
        ASSERT_TRUE(guard.is_ok());
    }

    pool->shutdown();
    EXPECT_EQ(counters_->closed.load(), 1);

    auto rejected = pool->acquire(desc);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::NOT_INITIALIZED);

    // Connections borrowed before shutdown are closed on return
    borrowed.value().release();
    EXPECT_EQ(counters_->closed.load(), 2);
    EXPECT_EQ(pool->total_live_connections(), 0u);
}

TEST_F(ShardPoolTest, ConfigRoundTrip) {
    PoolConfig config;
    config.max_connections_per_shard = 3;
    config.idle_timeout = std::chrono::milliseconds(1234);

    PoolConfig restored;
    restored.from_json(config.to_json());
    EXPECT_EQ(restored.max_connections_per_shard, 3u);
    EXPECT_EQ(restored.idle_timeout.count(), 1234);
    EXPECT_EQ(restored.acquire_timeout, config.acquire_timeout);
}
