#include <gtest/gtest.h>
#include <fstream>
#include "histshard/catalog/shard_catalog.hpp"
#include "histshard/core/time_utils.hpp"
#include "histshard/query/query_planner.hpp"
#include "../core/test_base.hpp"
#include "../data/shard_fixture.hpp"

using namespace histshard;
using namespace histshard::testing;

class QueryPlannerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        PoolConfig config;
        config.acquire_timeout = std::chrono::milliseconds(200);
        pool_ = std::make_unique<ShardPool>(config, ShardPool::sqlite_factory(""));
        catalog_ = std::make_unique<ShardCatalog>(scratch_dir());
    }

    void TearDown() override {
        pool_.reset();
        TestBase::TearDown();
    }

    std::filesystem::path shard_path(const std::string& relative) {
        return scratch_dir() / relative;
    }

    std::vector<ShardDescriptor> resolve(const TimeRange& range) {
        EXPECT_TRUE(catalog_->refresh().is_ok());
        auto shards =
            catalog_->resolve(ShardCategory::INDICES, "SPX", Granularity::minutes(1), range);
        EXPECT_TRUE(shards.is_ok());
        return shards.is_ok() ? shards.value() : std::vector<ShardDescriptor>{};
    }

    std::unique_ptr<ShardPool> pool_;
    std::unique_ptr<ShardCatalog> catalog_;
};

TEST_F(QueryPlannerTest, PlanClipsEachShardAndExplainsAsUnion) {
    ShardWriter(shard_path("indices/spx_1m_2023.db")).finish();
    ShardWriter(shard_path("indices/spx_1m_2024.db")).finish();

    TimeRange range(core::make_date(2023, 12, 1), core::make_date(2024, 1, 31));
    QueryPlanner planner(*pool_);
    auto plan = planner.plan(resolve(range), "SPX", range);
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().shards.size(), 2u);

    EXPECT_EQ(plan.value().primary().shard.id, "indices/spx_1m_2023.db");
    EXPECT_EQ(plan.value().shards[0].range.start, range.start);
    EXPECT_EQ(plan.value().shards[0].range.end,
              core::make_date(2024, 1, 1) - std::chrono::milliseconds(1));
    EXPECT_EQ(plan.value().shards[1].range.start, core::make_date(2024, 1, 1));
    EXPECT_EQ(plan.value().shards[1].range.end, range.end);

    std::string sql = plan.value().explain();
    EXPECT_NE(sql.find("FROM s0.bars_eq"), std::string::npos);
    EXPECT_NE(sql.find("UNION ALL"), std::string::npos);
    EXPECT_NE(sql.find("FROM s1.bars_eq"), std::string::npos);
    EXPECT_EQ(plan.value().to_json()["shards"].size(), 2u);
}

TEST_F(QueryPlannerTest, PlanRejectsEmptyShardListAndBadRange) {
    QueryPlanner planner(*pool_);
    TimeRange range(core::make_date(2024, 1, 1), core::make_date(2024, 1, 2));

    auto empty = planner.plan({}, "SPX", range);
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::NOT_FOUND);

    auto inverted = planner.plan({}, "SPX", TimeRange(range.end, range.start));
    ASSERT_TRUE(inverted.is_error());
    EXPECT_EQ(inverted.error()->code(), ErrorCode::INVALID_RANGE);
}

TEST_F(QueryPlannerTest, MergeAcrossYearBoundaryHasNoGapOrDuplicate) {
    auto late_2023 = make_bars("SPX", core::make_timestamp(2023, 12, 29, 20, 55),
                               std::chrono::minutes(1), 5, 4760.0);
    auto early_2024 = make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30),
                                std::chrono::minutes(1), 5, 4745.0);
    {
        ShardWriter writer(shard_path("indices/spx_1m_2023.db"));
        writer.add_bars("SPX", late_2023);
        writer.finish();
    }
    {
        ShardWriter writer(shard_path("indices/spx_1m_2024.db"));
        writer.add_bars("SPX", early_2024);
        writer.finish();
    }

    TimeRange range(core::make_date(2023, 12, 29), core::make_date(2024, 1, 3));
    QueryPlanner planner(*pool_);
    auto plan = planner.plan(resolve(range), "SPX", range);
    ASSERT_TRUE(plan.is_ok());

    auto stream = planner.execute(plan.value());
    ASSERT_TRUE(stream.is_ok()) << stream.error()->what();
    auto bars = collect_bars(*stream.value());
    ASSERT_TRUE(bars.is_ok());

    ASSERT_EQ(bars.value().size(), 10u);
    for (size_t i = 1; i < bars.value().size(); ++i) {
        EXPECT_LT(bars.value()[i - 1].timestamp, bars.value()[i].timestamp);
    }
    EXPECT_EQ(bars.value()[4].timestamp, late_2023.back().timestamp);
    EXPECT_EQ(bars.value()[5].timestamp, early_2024.front().timestamp);

    auto metadata = stream.value()->metadata();
    EXPECT_FALSE(metadata->partial);
    EXPECT_EQ(metadata->contributing_shards.size(), 2u);
    EXPECT_EQ(metadata->seam_duplicates, 0u);
}

TEST_F(QueryPlannerTest, OverlappingShardsKeepLaterCoverageAtSeam) {
    Timestamp start = core::make_timestamp(2024, 1, 2, 14, 30);
    auto archive = make_bars("SPX", start, std::chrono::minutes(1), 4, 4700.0);
    auto current = make_bars("SPX", start + std::chrono::minutes(2), std::chrono::minutes(1), 4,
                             4800.0);
    {
        ShardWriter writer(shard_path("indices/spx_1m_2020_2024.db"));
        writer.add_bars("SPX", archive);
        writer.finish();
    }
    {
        ShardWriter writer(shard_path("indices/spx_1m_2024.db"));
        writer.add_bars("SPX", current);
        writer.finish();
    }

    TimeRange range(core::make_date(2024, 1, 2), core::make_date(2024, 1, 3));
    QueryPlanner planner(*pool_);
    auto plan = planner.plan(resolve(range), "SPX", range);
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().shards.size(), 2u);

    auto stream = planner.execute(plan.value());
    ASSERT_TRUE(stream.is_ok());
    auto bars = collect_bars(*stream.value());
    ASSERT_TRUE(bars.is_ok());

    // 14:30..14:35, each timestamp exactly once
    ASSERT_EQ(bars.value().size(), 6u);
    EXPECT_DOUBLE_EQ(bars.value()[1].open, archive[1].open);
    EXPECT_DOUBLE_EQ(bars.value()[2].open, current[0].open);
    EXPECT_DOUBLE_EQ(bars.value()[3].open, current[1].open);
    EXPECT_EQ(stream.value()->metadata()->seam_duplicates, 2u);
}

TEST_F(QueryPlannerTest, InconsistentLaterRowAtSeamFallsBackToEarlierShard) {
    Timestamp start = core::make_timestamp(2024, 1, 2, 14, 30);
    auto archive = make_bars("SPX", start, std::chrono::minutes(1), 4, 4700.0);
    auto current = make_bars("SPX", start + std::chrono::minutes(2), std::chrono::minutes(1), 4,
                             4800.0);
    current[0].high = current[0].low - 1.0;
    {
        ShardWriter writer(shard_path("indices/spx_1m_2020_2024.db"));
        writer.add_bars("SPX", archive);
        writer.finish();
    }
    {
        ShardWriter writer(shard_path("indices/spx_1m_2024.db"));
        writer.add_bars("SPX", current);
        writer.finish();
    }

    TimeRange range(core::make_date(2024, 1, 2), core::make_date(2024, 1, 3));
    QueryPlanner planner(*pool_);
    auto plan = planner.plan(resolve(range), "SPX", range);
    ASSERT_TRUE(plan.is_ok());
    auto stream = planner.execute(plan.value());
    ASSERT_TRUE(stream.is_ok());
    auto bars = collect_bars(*stream.value());
    ASSERT_TRUE(bars.is_ok());

    // 14:32 still appears once, taken from the archive
    ASSERT_EQ(bars.value().size(), 6u);
    EXPECT_EQ(bars.value()[2].timestamp, start + std::chrono::minutes(2));
    EXPECT_DOUBLE_EQ(bars.value()[2].open, archive[2].open);
    EXPECT_DOUBLE_EQ(bars.value()[3].open, current[1].open);

    auto metadata = stream.value()->metadata();
    EXPECT_EQ(metadata->rejected_rows, 1u);
    EXPECT_EQ(metadata->seam_duplicates, 1u);
}

TEST_F(QueryPlannerTest, UnreadableShardYieldsPartialResult) {
    {
        std::filesystem::create_directories(shard_path("indices"));
        std::ofstream(shard_path("indices/spx_1m_2023.db")) << std::string(4096, 'x');
    }
    {
        ShardWriter writer(shard_path("indices/spx_1m_2024.db"));
        writer.add_bars("SPX", make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30),
                                         std::chrono::minutes(1), 3, 4745.0));
        writer.finish();
    }

    TimeRange range(core::make_date(2023, 12, 1), core::make_date(2024, 1, 3));
    QueryPlanner planner(*pool_);
    auto plan = planner.plan(resolve(range), "SPX", range);
    ASSERT_TRUE(plan.is_ok());

    auto stream = planner.execute(plan.value());
    ASSERT_TRUE(stream.is_ok()) << stream.error()->what();
    auto bars = collect_bars(*stream.value());
    ASSERT_TRUE(bars.is_ok());
    EXPECT_EQ(bars.value().size(), 3u);

    auto metadata = stream.value()->metadata();
    EXPECT_TRUE(metadata->partial);
    ASSERT_EQ(metadata->unavailable_shards.size(), 1u);
    EXPECT_EQ(metadata->unavailable_shards[0], "indices/spx_1m_2023.db");
    EXPECT_TRUE(pool_->is_degraded("indices/spx_1m_2023.db"));
}

TEST_F(QueryPlannerTest, NoReadableShardIsAnError) {
    std::filesystem::create_directories(shard_path("indices"));
    std::ofstream(shard_path("indices/spx_1m_2024.db")) << std::string(4096, 'x');

    TimeRange range(core::make_date(2024, 1, 1), core::make_date(2024, 1, 3));
    QueryPlanner planner(*pool_);
    auto plan = planner.plan(resolve(range), "SPX", range);
    ASSERT_TRUE(plan.is_ok());

    auto stream = planner.execute(plan.value());
    ASSERT_TRUE(stream.is_error());
    EXPECT_EQ(stream.error()->code(), ErrorCode::NO_DATA_SOURCE);
}

TEST_F(QueryPlannerTest, InconsistentRowsAreRejectedAndCounted) {
    auto bars = make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30), std::chrono::minutes(1),
                          3, 4745.0);
    bars[1].high = bars[1].low - 1.0;
    {
        ShardWriter writer(shard_path("indices/spx_1m_2024.db"));
        writer.add_bars("SPX", bars);
        writer.finish();
    }

    TimeRange range(core::make_date(2024, 1, 2), core::make_date(2024, 1, 3));
    QueryPlanner planner(*pool_);
    auto plan = planner.plan(resolve(range), "SPX", range);
    ASSERT_TRUE(plan.is_ok());
    auto stream = planner.execute(plan.value());
    ASSERT_TRUE(stream.is_ok());

    auto merged = collect_bars(*stream.value());
    ASSERT_TRUE(merged.is_ok());
    EXPECT_EQ(merged.value().size(), 2u);
    EXPECT_EQ(stream.value()->metadata()->rejected_rows, 1u);
}

TEST_F(QueryPlannerTest, CancellationReleasesConnections) {
    {
        ShardWriter writer(shard_path("indices/spx_1m_2024.db"));
        writer.add_bars("SPX", make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30),
                                         std::chrono::minutes(1), 100, 4745.0));
        writer.finish();
    }

    TimeRange range(core::make_date(2024, 1, 2), core::make_date(2024, 1, 3));
    QueryPlanner planner(*pool_);
    auto plan = planner.plan(resolve(range), "SPX", range);
    ASSERT_TRUE(plan.is_ok());

    CancellationToken token;
    auto stream = planner.execute(plan.value(), &token);
    ASSERT_TRUE(stream.is_ok());

    Bar bar;
    ASSERT_TRUE(stream.value()->next(bar).is_ok());
    EXPECT_EQ(pool_->idle_connections("indices/spx_1m_2024.db"), 0u);

    token.cancel();
    auto step = stream.value()->next(bar);
    ASSERT_TRUE(step.is_error());
    EXPECT_EQ(step.error()->code(), ErrorCode::CANCELLED);
    EXPECT_EQ(pool_->idle_connections("indices/spx_1m_2024.db"), 1u);

    // The connection is usable by the next query
    auto again = planner.execute(plan.value());
    ASSERT_TRUE(again.is_ok());
}

TEST_F(QueryPlannerTest, ExhaustedSourceReturnsConnectionEarly) {
    {
        ShardWriter writer(shard_path("indices/spx_1m_2024.db"));
        writer.add_bars("SPX", make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30),
                                         std::chrono::minutes(1), 2, 4745.0));
        writer.finish();
    }

    TimeRange range(core::make_date(2024, 1, 2), core::make_date(2024, 1, 3));
    QueryPlanner planner(*pool_);
    auto plan = planner.plan(resolve(range), "SPX", range);
    ASSERT_TRUE(plan.is_ok());
    auto stream = planner.execute(plan.value());
    ASSERT_TRUE(stream.is_ok());

    auto bars = collect_bars(*stream.value());
    ASSERT_TRUE(bars.is_ok());
    EXPECT_EQ(pool_->idle_connections("indices/spx_1m_2024.db"), 1u);
}
