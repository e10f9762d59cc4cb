// include/histshard/catalog/shard_catalog.hpp
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "histshard/catalog/shard_descriptor.hpp"
#include "histshard/core/error.hpp"
#include "histshard/core/types.hpp"

namespace histshard {

/**
 * @brief Inventory summary of a catalog snapshot
 */
struct CatalogStatistics {
    size_t shard_count{0};
    uint64_t total_size_bytes{0};
    std::map<std::string, size_t> shards_per_category;
    std::map<std::string, TimeRange> coverage_per_symbol;  // Keyed "<category>/<SYMBOL>"
    Timestamp built_at;

    nlohmann::json to_json() const;
};

/**
 * @brief Discovers shard files under a data root and routes logical queries to them
 *
 * Layout: <root>/<category>/<symbol>_<granularity>_<period>.db where period is
 * YYYY, YYYY_YYYY (inclusive span of years) or YYYY_MM (one month).
 *
 * Readers work on an immutable snapshot; refresh() builds a new one and
 * swaps it in atomically, so resolution never blocks on a rescan.
 */
class ShardCatalog {
public:
    explicit ShardCatalog(std::filesystem::path root);

    /**
     * @brief Rescan the data root and publish a new snapshot
     * @return FILE_NOT_FOUND if the root is missing; the previous snapshot stays live
     */
    Result<void> refresh();

    /**
     * @brief Shards holding bars for a symbol at one native granularity
     * @param category Shard category
     * @param symbol Ticker, case-insensitive
     * @param granularity Native granularity to match
     * @param range Requested inclusive range
     * @return Overlapping shards in ascending coverage order.
     *         INVALID_RANGE if the range is inverted or nothing overlaps it,
     *         NOT_FOUND if the catalog has no shard for symbol/category/granularity.
     */
    Result<std::vector<ShardDescriptor>> resolve(ShardCategory category,
                                                 const std::string& symbol,
                                                 const Granularity& granularity,
                                                 const TimeRange& range) const;

    /**
     * @brief Monthly option shards for an underlying overlapping the range
     *
     * A range that crosses a month boundary yields one descriptor per month.
     */
    Result<std::vector<ShardDescriptor>> resolve_options(const std::string& underlying,
                                                         const TimeRange& range) const;

    /**
     * @brief Native granularities stored for a symbol, finest first
     */
    std::vector<Granularity> granularities(ShardCategory category,
                                           const std::string& symbol) const;

    /**
     * @brief Native granularities with at least one shard overlapping the range, finest first
     */
    std::vector<Granularity> granularities(ShardCategory category, const std::string& symbol,
                                           const TimeRange& range) const;

    /**
     * @brief Bar categories (indices, etfs, stocks in that order) that hold the symbol
     */
    std::vector<ShardCategory> categories_for(const std::string& symbol) const;

    std::vector<ShardDescriptor> shards() const;
    size_t size() const;
    CatalogStatistics statistics() const;

    const std::filesystem::path& root() const {
        return root_;
    }

    /**
     * @brief Parse a shard file name into a descriptor
     * @param category Category of the directory the file sits in
     * @param file Absolute file path
     * @param relative_id Path relative to the data root
     * @return Descriptor, or std::nullopt if the name does not follow the layout
     */
    static std::optional<ShardDescriptor> parse_shard_file(ShardCategory category,
                                                           const std::filesystem::path& file,
                                                           const std::string& relative_id);

private:
    struct Snapshot {
        std::vector<ShardDescriptor> shards;  // Sorted by category, symbol, coverage
        Timestamp built_at;
    };

    std::shared_ptr<const Snapshot> snapshot() const;

    std::filesystem::path root_;
    std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace histshard
