#include <gtest/gtest.h>
#include <fstream>
#include "histshard/catalog/shard_catalog.hpp"
#include "histshard/core/time_utils.hpp"
#include "../core/test_base.hpp"

using namespace histshard;
using namespace histshard::testing;

class ShardCatalogTest : public TestBase {
protected:
    void touch(const std::string& relative, size_t bytes = 16) {
        std::filesystem::path file = scratch_dir() / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << std::string(bytes, 'x');
    }

    TimeRange days(int y1, unsigned m1, unsigned d1, int y2, unsigned m2, unsigned d2) {
        return TimeRange(core::make_date(y1, m1, d1), core::make_date(y2, m2, d2));
    }
};

TEST_F(ShardCatalogTest, ParsesYearSpanAndMonthPeriods) {
    auto year = ShardCatalog::parse_shard_file(ShardCategory::INDICES, "/d/spx_1m_2024.db",
                                               "indices/spx_1m_2024.db");
    ASSERT_TRUE(year.has_value());
    EXPECT_EQ(year->symbol, "SPX");
    EXPECT_EQ(year->granularity, Granularity::minutes(1));
    EXPECT_EQ(year->coverage.start, core::make_date(2024, 1, 1));
    EXPECT_EQ(year->coverage.end, core::make_date(2025, 1, 1) - std::chrono::milliseconds(1));

    auto span = ShardCatalog::parse_shard_file(ShardCategory::ETFS, "/d/spy_1d_2010_2019.db",
                                               "etfs/spy_1d_2010_2019.db");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->coverage.start, core::make_date(2010, 1, 1));
    EXPECT_EQ(span->coverage.end, core::make_date(2020, 1, 1) - std::chrono::milliseconds(1));

    auto month = ShardCatalog::parse_shard_file(ShardCategory::OPTIONS, "/d/spx_1m_2024_12.db",
                                                "options/spx_1m_2024_12.db");
    ASSERT_TRUE(month.has_value());
    EXPECT_EQ(month->coverage.start, core::make_date(2024, 12, 1));
    EXPECT_EQ(month->coverage.end, core::make_date(2025, 1, 1) - std::chrono::milliseconds(1));
}

TEST_F(ShardCatalogTest, SymbolsMayContainUnderscores) {
    auto shard = ShardCatalog::parse_shard_file(ShardCategory::STOCKS, "/d/brk_b_5m_2023.db",
                                                "stocks/brk_b_5m_2023.db");
    ASSERT_TRUE(shard.has_value());
    EXPECT_EQ(shard->symbol, "BRK_B");
    EXPECT_EQ(shard->granularity, Granularity::minutes(5));
}

TEST_F(ShardCatalogTest, RejectsNamesOutsideTheLayout) {
    for (const std::string name : {"spx_1m_2024.csv", "spx_2024.db", "spx_1x_2024.db",
                                   "spx_1m_2024_13.db", "spx_1m_2025_2024.db", "readme.db"}) {
        EXPECT_FALSE(ShardCatalog::parse_shard_file(ShardCategory::INDICES, "/d/" + name,
                                                    "indices/" + name)
                         .has_value())
            << name;
    }
}

TEST_F(ShardCatalogTest, RefreshFailsForMissingRoot) {
    ShardCatalog catalog(scratch_dir() / "absent");
    auto result = catalog.refresh();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(catalog.size(), 0u);
}

TEST_F(ShardCatalogTest, RefreshSkipsUnrecognisedFiles) {
    touch("indices/spx_1m_2024.db");
    touch("indices/notes.txt");
    touch("futures/es_1m_2024.db");

    ShardCatalog catalog(scratch_dir());
    ASSERT_TRUE(catalog.refresh().is_ok());
    ASSERT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.shards()[0].id, "indices/spx_1m_2024.db");
}

TEST_F(ShardCatalogTest, ResolveReturnsOverlappingShardsInCoverageOrder) {
    touch("indices/spx_1m_2024.db");
    touch("indices/spx_1m_2022.db");
    touch("indices/spx_1m_2023.db");
    touch("indices/spx_1d_2000_2024.db");

    ShardCatalog catalog(scratch_dir());
    ASSERT_TRUE(catalog.refresh().is_ok());

    auto shards = catalog.resolve(ShardCategory::INDICES, "spx", Granularity::minutes(1),
                                  days(2023, 6, 1, 2024, 2, 1));
    ASSERT_TRUE(shards.is_ok()) << shards.error()->what();
    ASSERT_EQ(shards.value().size(), 2u);
    EXPECT_EQ(shards.value()[0].id, "indices/spx_1m_2023.db");
    EXPECT_EQ(shards.value()[1].id, "indices/spx_1m_2024.db");

    // The union of returned coverage contains the requested range
    EXPECT_LE(shards.value().front().coverage.start, core::make_date(2023, 6, 1));
    EXPECT_GE(shards.value().back().coverage.end, core::make_date(2024, 2, 1));
}

TEST_F(ShardCatalogTest, ResolveDistinguishesNotFoundFromInvalidRange) {
    touch("indices/spx_1m_2024.db");
    ShardCatalog catalog(scratch_dir());
    ASSERT_TRUE(catalog.refresh().is_ok());

    auto unknown = catalog.resolve(ShardCategory::INDICES, "NDX", Granularity::minutes(1),
                                   days(2024, 1, 1, 2024, 1, 2));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::NOT_FOUND);

    auto wrong_category = catalog.resolve(ShardCategory::ETFS, "SPX", Granularity::minutes(1),
                                          days(2024, 1, 1, 2024, 1, 2));
    ASSERT_TRUE(wrong_category.is_error());
    EXPECT_EQ(wrong_category.error()->code(), ErrorCode::NOT_FOUND);

    auto uncovered = catalog.resolve(ShardCategory::INDICES, "SPX", Granularity::minutes(1),
                                     days(2019, 1, 1, 2019, 2, 1));
    ASSERT_TRUE(uncovered.is_error());
    EXPECT_EQ(uncovered.error()->code(), ErrorCode::INVALID_RANGE);

    auto inverted = catalog.resolve(ShardCategory::INDICES, "SPX", Granularity::minutes(1),
                                    days(2024, 2, 1, 2024, 1, 1));
    ASSERT_TRUE(inverted.is_error());
    EXPECT_EQ(inverted.error()->code(), ErrorCode::INVALID_RANGE);
}

TEST_F(ShardCatalogTest, OptionRangeAcrossMonthsYieldsOneShardPerMonth) {
    touch("options/spx_1m_2024_07.db");
    touch("options/spx_1m_2024_08.db");
    touch("options/spx_1m_2024_09.db");

    ShardCatalog catalog(scratch_dir());
    ASSERT_TRUE(catalog.refresh().is_ok());

    auto shards = catalog.resolve_options("SPX", days(2024, 7, 29, 2024, 8, 2));
    ASSERT_TRUE(shards.is_ok());
    ASSERT_EQ(shards.value().size(), 2u);
    EXPECT_EQ(shards.value()[0].id, "options/spx_1m_2024_07.db");
    EXPECT_EQ(shards.value()[1].id, "options/spx_1m_2024_08.db");

    auto missing = catalog.resolve_options("NDX", days(2024, 7, 29, 2024, 8, 2));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::NOT_FOUND);
}

TEST_F(ShardCatalogTest, GranularitiesAndCategories) {
    touch("indices/spx_1d_2000_2024.db");
    touch("indices/spx_1m_2024.db");
    touch("indices/spx_5m_2024.db");
    touch("etfs/spy_1m_2024.db");
    touch("stocks/spy_1m_2024.db");

    ShardCatalog catalog(scratch_dir());
    ASSERT_TRUE(catalog.refresh().is_ok());

    auto widths = catalog.granularities(ShardCategory::INDICES, "spx");
    ASSERT_EQ(widths.size(), 3u);
    EXPECT_EQ(widths[0], Granularity::minutes(1));
    EXPECT_EQ(widths[1], Granularity::minutes(5));
    EXPECT_EQ(widths[2], Granularity::days(1));

    auto categories = catalog.categories_for("SPY");
    ASSERT_EQ(categories.size(), 2u);
    EXPECT_EQ(categories[0], ShardCategory::ETFS);
    EXPECT_EQ(categories[1], ShardCategory::STOCKS);
}

TEST_F(ShardCatalogTest, GranularitiesCoveringARange) {
    touch("indices/spx_1d_2000_2020.db");
    touch("indices/spx_1m_2024.db");

    ShardCatalog catalog(scratch_dir());
    ASSERT_TRUE(catalog.refresh().is_ok());

    auto recent =
        catalog.granularities(ShardCategory::INDICES, "SPX", days(2024, 3, 1, 2024, 3, 2));
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0], Granularity::minutes(1));

    auto older =
        catalog.granularities(ShardCategory::INDICES, "SPX", days(2010, 6, 1, 2010, 6, 2));
    ASSERT_EQ(older.size(), 1u);
    EXPECT_EQ(older[0], Granularity::days(1));

    EXPECT_TRUE(
        catalog.granularities(ShardCategory::INDICES, "SPX", days(2022, 1, 1, 2022, 2, 1)).empty());
    EXPECT_EQ(
        catalog.granularities(ShardCategory::INDICES, "SPX", days(2020, 6, 1, 2024, 6, 1)).size(),
        2u);
}

TEST_F(ShardCatalogTest, RefreshPublishesNewSnapshotWithoutDisturbingOldReaders) {
    touch("indices/spx_1m_2024.db");
    ShardCatalog catalog(scratch_dir());
    ASSERT_TRUE(catalog.refresh().is_ok());

    auto before = catalog.shards();
    touch("indices/spx_1m_2023.db");
    ASSERT_TRUE(catalog.refresh().is_ok());

    EXPECT_EQ(before.size(), 1u);
    EXPECT_EQ(catalog.size(), 2u);

    // A failed rescan keeps the last good snapshot
    std::filesystem::remove_all(scratch_dir() / "indices");
    std::filesystem::remove(scratch_dir());
    EXPECT_TRUE(catalog.refresh().is_error());
    EXPECT_EQ(catalog.size(), 2u);
    std::filesystem::create_directories(scratch_dir());
}

TEST_F(ShardCatalogTest, StatisticsSummariseInventory) {
    touch("indices/spx_1m_2023.db", 100);
    touch("indices/spx_1m_2024.db", 200);
    touch("options/spx_1m_2024_08.db", 50);

    ShardCatalog catalog(scratch_dir());
    ASSERT_TRUE(catalog.refresh().is_ok());

    CatalogStatistics stats = catalog.statistics();
    EXPECT_EQ(stats.shard_count, 3u);
    EXPECT_EQ(stats.total_size_bytes, 350u);
    EXPECT_EQ(stats.shards_per_category["indices"], 2u);
    EXPECT_EQ(stats.shards_per_category["options"], 1u);

    const TimeRange& spx = stats.coverage_per_symbol.at("indices/SPX");
    EXPECT_EQ(spx.start, core::make_date(2023, 1, 1));
    EXPECT_EQ(spx.end, core::make_date(2025, 1, 1) - std::chrono::milliseconds(1));

    nlohmann::json j = stats.to_json();
    EXPECT_EQ(j["shard_count"], 3);
    EXPECT_TRUE(j["coverage"].contains("options/SPX"));
}
