// include/histshard/engine/query_engine.hpp

#pragma once

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "histshard/cache/result_cache.hpp"
#include "histshard/catalog/shard_catalog.hpp"
#include "histshard/core/bar_stream.hpp"
#include "histshard/core/cancellation.hpp"
#include "histshard/core/error.hpp"
#include "histshard/data/shard_pool.hpp"
#include "histshard/engine/engine_config.hpp"
#include "histshard/options/chain_resolver.hpp"
#include "histshard/query/query_plan.hpp"
#include "histshard/query/query_planner.hpp"

namespace histshard {

/**
 * @brief Logical bar request
 */
struct BarQuery {
    ShardCategory category{ShardCategory::INDICES};
    std::string symbol;
    TimeRange range;
    std::string granularity{"1m"};
};

/**
 * @brief Materialized bar result, shared immutably through the cache
 */
struct BarQueryResult {
    std::string symbol;
    Granularity granularity;
    std::vector<Bar> bars;
    QueryMetadata metadata;
};

/**
 * @brief Uncached lazy bar result for ranges too large to materialize
 *
 * metadata is updated while the stream is consumed; read it after the
 * stream reports its end. The stream must be destroyed before the engine.
 */
struct BarStreamHandle {
    std::unique_ptr<BarStream> stream;
    std::shared_ptr<const QueryMetadata> metadata;
    Granularity source_granularity;
    bool rolled_up{false};
};

/**
 * @brief Logical option chain request
 */
struct ChainQuery {
    std::string underlying;
    Timestamp as_of;
    std::optional<int> strike_window;  // Defaults to ChainConfig::default_strike_window
    std::optional<Timestamp> expiry;
};

/**
 * @brief Facade over catalog, pool, planner, rollup, chain resolution and caching
 *
 * Control flow for every query: result cache -> catalog -> pool -> planner ->
 * rollup or chain resolver -> result cache. Independent queries run
 * concurrently; there is no engine-wide lock.
 */
class QueryEngine {
public:
    /**
     * @brief Constructor
     * @param config Engine configuration
     * @param credential Pre-resolved passphrase for encrypted shards, empty for none
     */
    explicit QueryEngine(EngineConfig config, std::string credential = "");

    /**
     * @brief Constructor with a custom shard store factory
     */
    QueryEngine(EngineConfig config, StoreFactory factory);

    ~QueryEngine();

    QueryEngine(const QueryEngine&) = delete;
    QueryEngine& operator=(const QueryEngine&) = delete;

    /**
     * @brief Initialize logging (if nobody has) and build the shard catalog
     * @return Result indicating success or failure
     */
    Result<void> initialize();

    /**
     * @brief Bars for a symbol, rolled up when the granularity is not stored natively
     * @param query Category, symbol, inclusive range and granularity
     * @param cancel Optional cancellation token
     * @return Shared result; repeated identical queries within the TTL hit the cache
     */
    Result<std::shared_ptr<const BarQueryResult>> query_bars(
        const BarQuery& query, const CancellationToken* cancel = nullptr);

    /**
     * @brief Lazily stream bars without caching
     */
    Result<BarStreamHandle> stream_bars(const BarQuery& query,
                                        const CancellationToken* cancel = nullptr);

    /**
     * @brief Option chain around the money
     * @param query Underlying, as-of time, optional strike window and expiry
     * @param cancel Optional cancellation token
     */
    Result<std::shared_ptr<const ChainResult>> query_chain(
        const ChainQuery& query, const CancellationToken* cancel = nullptr);

    /**
     * @brief Plan a bar query without executing it
     */
    Result<QueryPlan> explain(const BarQuery& query) const;

    /**
     * @brief Rescan the data root and drop cached results
     */
    Result<void> refresh_catalog();

    void clear_cache();

    size_t evict_idle_connections();

    const ShardCatalog& catalog() const {
        return *catalog_;
    }

    ShardPool& pool() {
        return *pool_;
    }

    const EngineConfig& config() const {
        return config_;
    }

    const ResultCache<BarQueryResult>& bar_cache() const {
        return bar_cache_;
    }

    const ResultCache<ChainResult>& chain_cache() const {
        return chain_cache_;
    }

private:
    struct ResolvedBarQuery {
        ShardCategory category;
        std::string symbol;
        TimeRange range;
        Granularity target;
    };

    Result<ResolvedBarQuery> validate(const BarQuery& query) const;
    Result<std::vector<ShardDescriptor>> route(const ResolvedBarQuery& query,
                                               Granularity& source) const;
    Result<BarStreamHandle> open_stream(const ResolvedBarQuery& query,
                                        const CancellationToken* cancel);
    Result<std::shared_ptr<const BarQueryResult>> compute_bars(const ResolvedBarQuery& query,
                                                               const CancellationToken* cancel);
    Result<void> check_initialized() const;

    EngineConfig config_;
    std::unique_ptr<ShardCatalog> catalog_;
    std::unique_ptr<ShardPool> pool_;
    std::unique_ptr<ChainResolver> chain_resolver_;
    ResultCache<BarQueryResult> bar_cache_;
    ResultCache<ChainResult> chain_cache_;
    std::atomic<bool> initialized_{false};
};

}  // namespace histshard
