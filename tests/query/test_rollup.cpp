#include <gtest/gtest.h>
#include "histshard/core/time_utils.hpp"
#include "histshard/query/rollup.hpp"
#include "../core/test_base.hpp"
#include "../data/shard_fixture.hpp"

using namespace histshard;
using namespace histshard::testing;

namespace {

std::vector<Bar> roll(std::vector<Bar> bars, const Granularity& target) {
    auto stream =
        RollupResolver::rollup(std::make_unique<VectorBarStream>(std::move(bars)), target);
    auto result = collect_bars(*stream);
    EXPECT_TRUE(result.is_ok());
    return result.is_ok() ? result.value() : std::vector<Bar>{};
}

}  // anonymous namespace

class RollupTest : public TestBase {};

TEST_F(RollupTest, MinuteBarsAggregateIntoFiveMinuteBuckets) {
    auto minutes = make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30),
                             std::chrono::minutes(1), 10, 4745.0);
    auto buckets = roll(minutes, Granularity::minutes(5));

    ASSERT_EQ(buckets.size(), 2u);
    const Bar& first = buckets[0];
    EXPECT_EQ(first.timestamp, core::make_timestamp(2024, 1, 2, 14, 30));
    EXPECT_DOUBLE_EQ(first.open, minutes[0].open);
    EXPECT_DOUBLE_EQ(first.close, minutes[4].close);
    EXPECT_DOUBLE_EQ(first.high, minutes[4].high);
    EXPECT_DOUBLE_EQ(first.low, minutes[0].low);
    EXPECT_EQ(first.volume, 100 + 101 + 102 + 103 + 104);
    EXPECT_EQ(first.symbol, "SPX");
    EXPECT_EQ(buckets[1].timestamp, core::make_timestamp(2024, 1, 2, 14, 35));

    for (const auto& bar : buckets) {
        EXPECT_TRUE(bar.is_consistent());
    }
}

TEST_F(RollupTest, BucketsAlignToEpochNotFirstRow) {
    auto minutes = make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 32),
                             std::chrono::minutes(1), 5, 4745.0);
    auto buckets = roll(minutes, Granularity::minutes(5));

    ASSERT_EQ(buckets.size(), 2u);
    EXPECT_EQ(buckets[0].timestamp, core::make_timestamp(2024, 1, 2, 14, 30));
    EXPECT_EQ(buckets[0].volume, 100 + 101 + 102);
    EXPECT_EQ(buckets[1].timestamp, core::make_timestamp(2024, 1, 2, 14, 35));
    EXPECT_EQ(buckets[1].volume, 103 + 104);
}

TEST_F(RollupTest, EmptyBucketsAreNotEmitted) {
    std::vector<Bar> bars;
    bars.push_back(Bar(core::make_timestamp(2024, 1, 2, 14, 30), 10, 11, 9, 10.5, 100, "SPX"));
    bars.push_back(Bar(core::make_timestamp(2024, 1, 2, 15, 10), 12, 13, 11, 12.5, 200, "SPX"));

    auto buckets = roll(bars, Granularity::minutes(5));
    ASSERT_EQ(buckets.size(), 2u);
    EXPECT_EQ(buckets[1].timestamp, core::make_timestamp(2024, 1, 2, 15, 10));
}

TEST_F(RollupTest, RollupAtSameWidthIsIdentity) {
    auto minutes = make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30),
                             std::chrono::minutes(1), 5, 4745.0);
    minutes[2].trade_count = 17;
    minutes[2].vwap = 4745.6;

    auto same = roll(minutes, Granularity::minutes(1));
    ASSERT_EQ(same.size(), minutes.size());
    for (size_t i = 0; i < same.size(); ++i) {
        EXPECT_EQ(same[i].timestamp, minutes[i].timestamp);
        EXPECT_DOUBLE_EQ(same[i].open, minutes[i].open);
        EXPECT_DOUBLE_EQ(same[i].close, minutes[i].close);
        EXPECT_EQ(same[i].volume, minutes[i].volume);
        EXPECT_EQ(same[i].trade_count, minutes[i].trade_count);
        EXPECT_EQ(same[i].vwap, minutes[i].vwap);
    }
}

TEST_F(RollupTest, RollingTwiceMatchesRollingOnce) {
    auto minutes = make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30),
                             std::chrono::minutes(1), 60, 4745.0);
    auto direct = roll(minutes, Granularity::minutes(30));
    auto staged = roll(roll(minutes, Granularity::minutes(5)), Granularity::minutes(30));

    ASSERT_EQ(direct.size(), staged.size());
    for (size_t i = 0; i < direct.size(); ++i) {
        EXPECT_EQ(direct[i].timestamp, staged[i].timestamp);
        EXPECT_DOUBLE_EQ(direct[i].open, staged[i].open);
        EXPECT_DOUBLE_EQ(direct[i].high, staged[i].high);
        EXPECT_DOUBLE_EQ(direct[i].low, staged[i].low);
        EXPECT_DOUBLE_EQ(direct[i].close, staged[i].close);
        EXPECT_EQ(direct[i].volume, staged[i].volume);
    }
}

TEST_F(RollupTest, TradeCountAndVwapCombineWhenPresent) {
    auto minutes = make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30),
                             std::chrono::minutes(1), 3, 100.0);
    minutes[0].trade_count = 5;
    minutes[0].vwap = 100.0;
    minutes[1].trade_count = 7;
    minutes[1].vwap = 101.0;

    auto buckets = roll(minutes, Granularity::minutes(5));
    ASSERT_EQ(buckets.size(), 1u);
    ASSERT_TRUE(buckets[0].trade_count.has_value());
    EXPECT_EQ(*buckets[0].trade_count, 12);

    // Volume-weighted over the bars that carry a VWAP: 100 and 101 shares
    ASSERT_TRUE(buckets[0].vwap.has_value());
    double expected = (100.0 * 100 + 101.0 * 101) / (100 + 101);
    EXPECT_NEAR(*buckets[0].vwap, expected, 1e-9);
}

TEST_F(RollupTest, MissingTradeCountAndVwapStayAbsent) {
    auto minutes = make_bars("SPX", core::make_timestamp(2024, 1, 2, 14, 30),
                             std::chrono::minutes(1), 3, 100.0);
    auto buckets = roll(minutes, Granularity::minutes(5));
    ASSERT_EQ(buckets.size(), 1u);
    EXPECT_FALSE(buckets[0].trade_count.has_value());
    EXPECT_FALSE(buckets[0].vwap.has_value());
}

TEST_F(RollupTest, DailyRollupFromSessionMinutes) {
    auto day1 = session_minute_bars("SPX", 2024, 1, 2, 4745.0);
    auto day2 = session_minute_bars("SPX", 2024, 1, 3, 4700.0);
    std::vector<Bar> minutes = day1;
    minutes.insert(minutes.end(), day2.begin(), day2.end());

    auto days = roll(minutes, Granularity::days(1));
    ASSERT_EQ(days.size(), 2u);
    EXPECT_EQ(days[0].timestamp, core::make_date(2024, 1, 2));
    EXPECT_EQ(days[1].timestamp, core::make_date(2024, 1, 3));
    EXPECT_DOUBLE_EQ(days[0].open, day1.front().open);
    EXPECT_DOUBLE_EQ(days[0].close, day1.back().close);
    EXPECT_DOUBLE_EQ(days[1].open, day2.front().open);
}

TEST_F(RollupTest, SourceErrorPropagates) {
    class FailingStream : public BarStream {
    public:
        Result<bool> next(Bar&) override {
            return make_error<bool>(ErrorCode::DATABASE_ERROR, "disk gone", "FailingStream");
        }
    };

    auto stream =
        RollupResolver::rollup(std::make_unique<FailingStream>(), Granularity::minutes(5));
    Bar bar;
    auto step = stream->next(bar);
    ASSERT_TRUE(step.is_error());
    EXPECT_EQ(step.error()->code(), ErrorCode::DATABASE_ERROR);
}

TEST_F(RollupTest, SelectSourcePrefersNativeGranularity) {
    std::vector<Granularity> stored{Granularity::minutes(1), Granularity::days(1)};
    auto source = RollupResolver::select_source(Granularity::days(1), stored);
    ASSERT_TRUE(source.is_ok());
    EXPECT_EQ(source.value(), Granularity::days(1));
}

TEST_F(RollupTest, SelectSourcePicksFinestDivisor) {
    std::vector<Granularity> stored{Granularity::minutes(5), Granularity::minutes(1),
                                    Granularity::minutes(7)};
    auto source = RollupResolver::select_source(Granularity::hours(1), stored);
    ASSERT_TRUE(source.is_ok());
    EXPECT_EQ(source.value(), Granularity::minutes(1));

    auto only_seven = RollupResolver::select_source(Granularity::minutes(14),
                                                    {Granularity::minutes(7)});
    ASSERT_TRUE(only_seven.is_ok());
    EXPECT_EQ(only_seven.value(), Granularity::minutes(7));
}

TEST_F(RollupTest, SelectSourceRejectsNonDivisibleTarget) {
    auto coarse = RollupResolver::select_source(Granularity::minutes(1), {Granularity::days(1)});
    ASSERT_TRUE(coarse.is_error());
    EXPECT_EQ(coarse.error()->code(), ErrorCode::UNSUPPORTED_GRANULARITY);

    auto uneven = RollupResolver::select_source(Granularity::minutes(7), {Granularity::minutes(5)});
    ASSERT_TRUE(uneven.is_error());
    EXPECT_EQ(uneven.error()->code(), ErrorCode::UNSUPPORTED_GRANULARITY);

    auto nothing = RollupResolver::select_source(Granularity::minutes(5), {});
    ASSERT_TRUE(nothing.is_error());
    EXPECT_EQ(nothing.error()->code(), ErrorCode::UNSUPPORTED_GRANULARITY);
}
