// include/histshard/query/query_plan.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "histshard/catalog/shard_descriptor.hpp"
#include "histshard/core/types.hpp"

namespace histshard {

/**
 * @brief One shard's part of a cross-shard query
 */
struct ShardQuery {
    ShardDescriptor shard;
    TimeRange range;  // Requested range clipped to the shard's coverage
    std::string sql;  // Statement as the shard sees it, for diagnostics
};

/**
 * @brief Cross-shard bar query: the first shard is primary, the rest auxiliary
 *
 * Plans are cheap, disposable and never cached.
 */
struct QueryPlan {
    std::string symbol;
    TimeRange range;
    std::vector<ShardQuery> shards;

    const ShardQuery& primary() const {
        return shards.front();
    }

    /**
     * @brief Logical UNION ALL over all shards, each attached as s0, s1, ...
     */
    std::string explain() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Metadata attached to every query result
 */
struct QueryMetadata {
    bool partial{false};                         // Some required shard could not be read
    std::vector<std::string> contributing_shards;
    std::vector<std::string> unavailable_shards;
    std::string source_granularity;
    bool rolled_up{false};
    size_t rejected_rows{0};                     // Rows failing OHLC invariants
    size_t seam_duplicates{0};                   // Rows dropped at shard seams

    nlohmann::json to_json() const;
};

}  // namespace histshard
