// src/engine/query_engine.cpp

#include "histshard/engine/query_engine.hpp"
#include <algorithm>
#include <cctype>
#include "histshard/cache/query_fingerprint.hpp"
#include "histshard/core/logger.hpp"
#include "histshard/core/time_utils.hpp"
#include "histshard/query/rollup.hpp"

namespace histshard {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

template <typename V>
typename ResultCache<V>::TtlPolicy partial_ttl_policy(std::chrono::milliseconds partial_ttl) {
    return [partial_ttl](const V& value, std::chrono::milliseconds ttl) {
        return value.metadata.partial ? std::min(ttl, partial_ttl) : ttl;
    };
}

}  // anonymous namespace

QueryEngine::QueryEngine(EngineConfig config, std::string credential)
    : QueryEngine(config, ShardPool::sqlite_factory(std::move(credential))) {}

QueryEngine::QueryEngine(EngineConfig config, StoreFactory factory)
    : config_(std::move(config)),
      catalog_(std::make_unique<ShardCatalog>(config_.data_root)),
      pool_(std::make_unique<ShardPool>(config_.pool, std::move(factory))),
      chain_resolver_(std::make_unique<ChainResolver>(*catalog_, *pool_, config_.chain)),
      bar_cache_(config_.cache.capacity),
      chain_cache_(config_.cache.capacity) {
    bar_cache_.set_ttl_policy(partial_ttl_policy<BarQueryResult>(config_.cache.partial_ttl));
    chain_cache_.set_ttl_policy(partial_ttl_policy<ChainResult>(config_.cache.partial_ttl));
}

QueryEngine::~QueryEngine() {
    pool_->shutdown();
}

Result<void> QueryEngine::initialize() {
    if (!Logger::instance().is_initialized()) {
        try {
            Logger::instance().initialize(config_.logger);
        } catch (const std::exception& e) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    std::string("Failed to initialize logger: ") + e.what(),
                                    "QueryEngine");
        }
    }
    Logger::register_component("QueryEngine");

    if (config_.data_root.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "data_root is not configured",
                                "QueryEngine");
    }

    auto refreshed = catalog_->refresh();
    if (refreshed.is_error()) {
        return refreshed;
    }

    initialized_.store(true, std::memory_order_release);
    INFO("Query engine ready: " << catalog_->size() << " shards under " << config_.data_root);
    return Result<void>();
}

Result<void> QueryEngine::check_initialized() const {
    if (!initialized_.load(std::memory_order_acquire)) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Query engine is not initialized",
                                "QueryEngine");
    }
    return Result<void>();
}

Result<QueryEngine::ResolvedBarQuery> QueryEngine::validate(const BarQuery& query) const {
    if (query.symbol.empty()) {
        return make_error<ResolvedBarQuery>(ErrorCode::INVALID_ARGUMENT, "Symbol is required",
                                            "QueryEngine");
    }
    if (!query.range.is_valid()) {
        return make_error<ResolvedBarQuery>(
            ErrorCode::INVALID_RANGE,
            "Range end " + core::format_timestamp(query.range.end) + " precedes start " +
                core::format_timestamp(query.range.start),
            "QueryEngine");
    }
    if (query.category == ShardCategory::OPTIONS) {
        return make_error<ResolvedBarQuery>(ErrorCode::INVALID_ARGUMENT,
                                            "Option shards are queried through query_chain",
                                            "QueryEngine");
    }

    auto granularity = Granularity::parse(query.granularity);
    if (granularity.is_error()) {
        return forward_error<ResolvedBarQuery>(granularity.error());
    }

    ResolvedBarQuery resolved;
    resolved.category = query.category;
    resolved.symbol = to_upper(query.symbol);
    resolved.range = query.range;
    resolved.target = granularity.value();
    return Result<ResolvedBarQuery>(std::move(resolved));
}

Result<std::vector<ShardDescriptor>> QueryEngine::route(const ResolvedBarQuery& query,
                                                        Granularity& source) const {
    auto natives = catalog_->granularities(query.category, query.symbol);
    if (natives.empty()) {
        return make_error<std::vector<ShardDescriptor>>(
            ErrorCode::NOT_FOUND,
            "No shards for " + category_to_string(query.category) + "/" + query.symbol,
            "QueryEngine");
    }

    // Candidates are the granularities with shards in the range
    auto covering = catalog_->granularities(query.category, query.symbol, query.range);
    auto selected = RollupResolver::select_source(query.target, covering);
    if (covering.empty() || selected.is_error()) {
        selected = RollupResolver::select_source(query.target, natives);
    }
    if (selected.is_error()) {
        return forward_error<std::vector<ShardDescriptor>>(selected.error());
    }
    source = selected.value();

    return catalog_->resolve(query.category, query.symbol, source, query.range);
}

Result<BarStreamHandle> QueryEngine::open_stream(const ResolvedBarQuery& query,
                                                 const CancellationToken* cancel) {
    Granularity source;
    auto shards = route(query, source);
    if (shards.is_error()) {
        return forward_error<BarStreamHandle>(shards.error());
    }

    QueryPlanner planner(*pool_);
    auto plan = planner.plan(shards.value(), query.symbol, query.range);
    if (plan.is_error()) {
        return forward_error<BarStreamHandle>(plan.error());
    }
    DEBUG("Plan for " << query.symbol << ":\n" << plan.value().explain());

    auto merged = planner.execute(plan.value(), cancel);
    if (merged.is_error()) {
        return forward_error<BarStreamHandle>(merged.error());
    }

    BarStreamHandle handle;
    handle.metadata = merged.value()->metadata();
    handle.source_granularity = source;
    handle.rolled_up = source != query.target;
    if (handle.rolled_up) {
        handle.stream = RollupResolver::rollup(std::move(merged.value()), query.target);
    } else {
        handle.stream = std::move(merged.value());
    }
    return Result<BarStreamHandle>(std::move(handle));
}

Result<std::shared_ptr<const BarQueryResult>> QueryEngine::compute_bars(
    const ResolvedBarQuery& query, const CancellationToken* cancel) {
    using BarResult = Result<std::shared_ptr<const BarQueryResult>>;

    auto handle = open_stream(query, cancel);
    if (handle.is_error()) {
        return forward_error<std::shared_ptr<const BarQueryResult>>(handle.error());
    }

    auto bars = collect_bars(*handle.value().stream);
    if (bars.is_error()) {
        return forward_error<std::shared_ptr<const BarQueryResult>>(bars.error());
    }
    // Drop the stream first so every borrowed connection is back in the pool
    handle.value().stream.reset();

    auto result = std::make_shared<BarQueryResult>();
    result->symbol = query.symbol;
    result->granularity = query.target;
    result->bars = std::move(bars.value());
    result->metadata = *handle.value().metadata;
    result->metadata.source_granularity = handle.value().source_granularity.to_string();
    result->metadata.rolled_up = handle.value().rolled_up;

    if (result->metadata.rejected_rows > 0) {
        WARN("Rejected " << result->metadata.rejected_rows << " inconsistent " << query.symbol
                         << " rows");
    }
    INFO("Bars " << query.symbol << " " << query.target.to_string() << ": "
                 << result->bars.size() << " rows from "
                 << result->metadata.contributing_shards.size() << " shards"
                 << (result->metadata.partial ? " (partial coverage)" : ""));

    return BarResult(std::shared_ptr<const BarQueryResult>(std::move(result)));
}

Result<std::shared_ptr<const BarQueryResult>> QueryEngine::query_bars(
    const BarQuery& query, const CancellationToken* cancel) {
    Logger::register_component("QueryEngine");

    auto ready = check_initialized();
    if (ready.is_error()) {
        return forward_error<std::shared_ptr<const BarQueryResult>>(ready.error());
    }

    auto resolved = validate(query);
    if (resolved.is_error()) {
        return forward_error<std::shared_ptr<const BarQueryResult>>(resolved.error());
    }

    const ResolvedBarQuery& q = resolved.value();
    std::string fingerprint =
        QueryFingerprint::for_bars(q.category, q.symbol, q.range, q.target);

    bool computed = false;
    auto result = bar_cache_.get_or_compute(fingerprint, config_.cache.bar_ttl, [&]() {
        computed = true;
        DEBUG("Cache miss for " << fingerprint);
        return compute_bars(q, cancel);
    }, cancel);
    if (result.is_error()) {
        ERROR("Bar query " << fingerprint << " failed: " << result.error()->to_string());
    } else if (!computed) {
        DEBUG("Cache hit for " << fingerprint);
    }
    return result;
}

Result<BarStreamHandle> QueryEngine::stream_bars(const BarQuery& query,
                                                 const CancellationToken* cancel) {
    Logger::register_component("QueryEngine");

    auto ready = check_initialized();
    if (ready.is_error()) {
        return forward_error<BarStreamHandle>(ready.error());
    }

    auto resolved = validate(query);
    if (resolved.is_error()) {
        return forward_error<BarStreamHandle>(resolved.error());
    }
    return open_stream(resolved.value(), cancel);
}

Result<std::shared_ptr<const ChainResult>> QueryEngine::query_chain(
    const ChainQuery& query, const CancellationToken* cancel) {
    using ChainPtr = std::shared_ptr<const ChainResult>;
    Logger::register_component("QueryEngine");

    auto ready = check_initialized();
    if (ready.is_error()) {
        return forward_error<ChainPtr>(ready.error());
    }
    if (query.underlying.empty()) {
        return make_error<ChainPtr>(ErrorCode::INVALID_ARGUMENT, "Underlying is required",
                                    "QueryEngine");
    }

    ChainRequest request;
    request.underlying = to_upper(query.underlying);
    request.as_of = query.as_of;
    request.strike_window = query.strike_window.value_or(config_.chain.default_strike_window);
    request.expiry = query.expiry;
    if (request.strike_window < 0) {
        return make_error<ChainPtr>(ErrorCode::INVALID_ARGUMENT,
                                    "Strike window must be non-negative", "QueryEngine");
    }

    std::string fingerprint = QueryFingerprint::for_chain(request.underlying, request.as_of,
                                                          request.strike_window, request.expiry);

    bool computed = false;
    auto result = chain_cache_.get_or_compute(
        fingerprint, config_.cache.chain_ttl, [&]() -> Result<ChainPtr> {
            computed = true;
            DEBUG("Cache miss for " << fingerprint);
            auto chain = chain_resolver_->resolve_chain(request, cancel);
            if (chain.is_error()) {
                return forward_error<ChainPtr>(chain.error());
            }
            return Result<ChainPtr>(
                ChainPtr(std::make_shared<ChainResult>(std::move(chain.value()))));
        }, cancel);
    if (result.is_error()) {
        ERROR("Chain query " << fingerprint << " failed: " << result.error()->to_string());
    } else if (!computed) {
        DEBUG("Cache hit for " << fingerprint);
    }
    return result;
}

Result<QueryPlan> QueryEngine::explain(const BarQuery& query) const {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return forward_error<QueryPlan>(ready.error());
    }

    auto resolved = validate(query);
    if (resolved.is_error()) {
        return forward_error<QueryPlan>(resolved.error());
    }

    Granularity source;
    auto shards = route(resolved.value(), source);
    if (shards.is_error()) {
        return forward_error<QueryPlan>(shards.error());
    }

    QueryPlanner planner(*pool_);
    return planner.plan(shards.value(), resolved.value().symbol, resolved.value().range);
}

Result<void> QueryEngine::refresh_catalog() {
    Logger::register_component("QueryEngine");

    auto refreshed = catalog_->refresh();
    if (refreshed.is_error()) {
        return refreshed;
    }
    clear_cache();
    return Result<void>();
}

void QueryEngine::clear_cache() {
    bar_cache_.clear();
    chain_cache_.clear();
}

size_t QueryEngine::evict_idle_connections() {
    return pool_->evict_idle();
}

}  // namespace histshard
