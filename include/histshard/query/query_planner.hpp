// include/histshard/query/query_planner.hpp

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "histshard/catalog/shard_descriptor.hpp"
#include "histshard/core/bar_stream.hpp"
#include "histshard/core/cancellation.hpp"
#include "histshard/core/error.hpp"
#include "histshard/data/shard_pool.hpp"
#include "histshard/query/query_plan.hpp"

namespace histshard {

/**
 * @brief Streaming k-way merge over per-shard cursors
 *
 * Emits bars in non-decreasing timestamp order. When several shards hold a
 * row for the same timestamp, the consistent row from the shard with the
 * latest coverage start is kept and the others are dropped. Each source keeps its
 * borrowed connection until its cursor is exhausted, fails, or the stream is
 * cancelled or destroyed.
 */
class MergedBarStream : public BarStream {
    struct Source {
        ShardDescriptor shard;
        PooledConnection connection;  // Declared before cursor so the cursor dies first
        std::unique_ptr<BarStream> cursor;
        Bar head;
        bool has_head{false};
    };

public:
    /**
     * @brief Only QueryPlanner can create one
     */
    class ConstructionKey {
        friend class QueryPlanner;
        ConstructionKey() {}
    };

    MergedBarStream(ConstructionKey, std::vector<Source> sources,
                    std::shared_ptr<QueryMetadata> metadata, const CancellationToken* cancel);

    Result<bool> next(Bar& out) override;

    /**
     * @brief Coverage metadata; updated as sources fail mid-stream
     */
    std::shared_ptr<const QueryMetadata> metadata() const {
        return metadata_;
    }

    /**
     * @brief Release all borrowed connections; subsequent next() calls return false
     */
    void close();

private:
    friend class QueryPlanner;

    void advance(Source& source);
    void drop_source(Source& source, const QueryError& error);

    std::vector<Source> sources_;  // Ascending precedence
    std::shared_ptr<QueryMetadata> metadata_;
    const CancellationToken* cancel_;
};

/**
 * @brief Builds and executes cross-shard bar queries
 */
class QueryPlanner {
public:
    explicit QueryPlanner(ShardPool& pool) : pool_(pool) {}

    /**
     * @brief Build a plan over the given shards
     * @param shards Shards returned by catalog resolution
     * @param symbol Ticker to read
     * @param range Requested inclusive range
     * @return Plan with one predicate-clipped query per overlapping shard, or
     *         NOT_FOUND for an empty shard list and INVALID_RANGE for a bad range
     */
    Result<QueryPlan> plan(const std::vector<ShardDescriptor>& shards, const std::string& symbol,
                           const TimeRange& range) const;

    /**
     * @brief Open every shard in the plan and merge their rows lazily
     * @param plan Plan from plan()
     * @param cancel Optional cancellation token
     * @return Merged stream; NO_DATA_SOURCE if no shard could be read, CANCELLED if cancelled
     */
    Result<std::unique_ptr<MergedBarStream>> execute(const QueryPlan& plan,
                                                     const CancellationToken* cancel = nullptr);

private:
    ShardPool& pool_;
};

}  // namespace histshard
