// src/query/query_planner.cpp

#include "histshard/query/query_planner.hpp"
#include <algorithm>
#include "histshard/core/logger.hpp"
#include "histshard/core/query_builder.hpp"
#include "histshard/core/time_utils.hpp"

namespace histshard {

MergedBarStream::MergedBarStream(ConstructionKey, std::vector<Source> sources,
                                 std::shared_ptr<QueryMetadata> metadata,
                                 const CancellationToken* cancel)
    : sources_(std::move(sources)), metadata_(std::move(metadata)), cancel_(cancel) {}

void MergedBarStream::drop_source(Source& source, const QueryError& error) {
    WARN("Dropping shard " << source.shard.id << " from merge: " << error.what());
    source.has_head = false;
    source.cursor.reset();
    source.connection.invalidate();
    source.connection.release();
    metadata_->partial = true;
    metadata_->unavailable_shards.push_back(source.shard.id);
}

void MergedBarStream::advance(Source& source) {
    if (!source.cursor) {
        source.has_head = false;
        return;
    }

    auto step = source.cursor->next(source.head);
    if (step.is_error()) {
        drop_source(source, *step.error());
        return;
    }

    source.has_head = step.value();
    if (!source.has_head) {
        // Exhausted; hand the connection back before the rest of the merge finishes
        source.cursor.reset();
        source.connection.release();
    }
}

void MergedBarStream::close() {
    for (auto& source : sources_) {
        source.has_head = false;
        source.cursor.reset();
        source.connection.release();
    }
}

Result<bool> MergedBarStream::next(Bar& out) {
    while (true) {
        if (is_cancelled(cancel_)) {
            close();
            return make_error<bool>(ErrorCode::CANCELLED, "Query cancelled", "QueryPlanner");
        }

        Source* first = nullptr;
        for (auto& source : sources_) {
            if (source.has_head && (!first || source.head.timestamp < first->head.timestamp)) {
                first = &source;
            }
        }
        if (!first) {
            return Result<bool>(false);
        }
        Timestamp ts = first->head.timestamp;

        // On equal timestamps the later source has precedence, but only a consistent row can win
        Source* chosen = nullptr;
        for (auto it = sources_.rbegin(); it != sources_.rend(); ++it) {
            if (it->has_head && it->head.timestamp == ts && it->head.is_consistent()) {
                chosen = &*it;
                break;
            }
        }

        for (auto& source : sources_) {
            if (!source.has_head || source.head.timestamp != ts) {
                continue;
            }
            if (&source == chosen) {
                out = source.head;
            } else if (!source.head.is_consistent()) {
                metadata_->rejected_rows++;
                DEBUG("Rejected inconsistent bar for " << source.head.symbol << " at "
                                                       << core::format_timestamp(ts) << " from "
                                                       << source.shard.id);
            } else {
                TRACE("Seam duplicate at " << core::format_timestamp(ts) << " dropped from "
                                           << source.shard.id);
                metadata_->seam_duplicates++;
            }
            advance(source);
        }

        if (chosen) {
            return Result<bool>(true);
        }
    }
}

Result<QueryPlan> QueryPlanner::plan(const std::vector<ShardDescriptor>& shards,
                                     const std::string& symbol, const TimeRange& range) const {
    if (!range.is_valid()) {
        return make_error<QueryPlan>(ErrorCode::INVALID_RANGE, "Range end precedes start",
                                     "QueryPlanner");
    }
    if (shards.empty()) {
        return make_error<QueryPlan>(ErrorCode::NOT_FOUND, "No shards to plan over for " + symbol,
                                     "QueryPlanner");
    }

    std::vector<ShardDescriptor> ordered = shards;
    std::sort(ordered.begin(), ordered.end(), coverage_order);

    QueryPlan plan;
    plan.symbol = symbol;
    plan.range = range;
    for (const auto& shard : ordered) {
        if (!shard.coverage.overlaps(range)) {
            continue;
        }
        ShardQuery part;
        part.shard = shard;
        part.range = shard.coverage.intersect(range);
        part.sql = QueryBuilder::select_bars("", symbol, core::to_epoch_ms(part.range.start),
                                             core::to_epoch_ms(part.range.end));
        plan.shards.push_back(std::move(part));
    }

    if (plan.shards.empty()) {
        return make_error<QueryPlan>(ErrorCode::INVALID_RANGE,
                                     "None of the shards overlap the requested range",
                                     "QueryPlanner");
    }
    return Result<QueryPlan>(std::move(plan));
}

Result<std::unique_ptr<MergedBarStream>> QueryPlanner::execute(const QueryPlan& plan,
                                                               const CancellationToken* cancel) {
    using StreamResult = Result<std::unique_ptr<MergedBarStream>>;

    auto metadata = std::make_shared<QueryMetadata>();
    std::vector<MergedBarStream::Source> sources;

    for (const auto& part : plan.shards) {
        if (is_cancelled(cancel)) {
            return make_error<std::unique_ptr<MergedBarStream>>(
                ErrorCode::CANCELLED, "Query cancelled", "QueryPlanner");
        }

        auto connection = pool_.acquire(part.shard, cancel);
        if (connection.is_error()) {
            if (connection.error()->code() == ErrorCode::CANCELLED) {
                return forward_error<std::unique_ptr<MergedBarStream>>(connection.error());
            }
            WARN("Shard " << part.shard.id << " unavailable: " << connection.error()->what());
            metadata->partial = true;
            metadata->unavailable_shards.push_back(part.shard.id);
            continue;
        }

        auto cursor = connection.value()->scan_bars(plan.symbol, part.range);
        if (cursor.is_error()) {
            WARN("Scan of shard " << part.shard.id << " failed: " << cursor.error()->what());
            metadata->partial = true;
            metadata->unavailable_shards.push_back(part.shard.id);
            continue;
        }

        MergedBarStream::Source source;
        source.shard = part.shard;
        source.connection = std::move(connection.value());
        source.cursor = std::move(cursor.value());
        sources.push_back(std::move(source));
        metadata->contributing_shards.push_back(part.shard.id);
    }

    if (sources.empty()) {
        ERROR("No readable shard for " << plan.symbol << " among " << plan.shards.size()
                                       << " planned");
        return make_error<std::unique_ptr<MergedBarStream>>(
            ErrorCode::NO_DATA_SOURCE,
            "None of the " + std::to_string(plan.shards.size()) + " shards for " + plan.symbol +
                " could be read",
            "QueryPlanner");
    }

    if (metadata->partial) {
        WARN("Partial coverage for " << plan.symbol << ": " << metadata->unavailable_shards.size()
                                     << " of " << plan.shards.size() << " shards unavailable");
    }

    auto stream = std::make_unique<MergedBarStream>(MergedBarStream::ConstructionKey(),
                                                    std::move(sources), metadata, cancel);
    for (auto& source : stream->sources_) {
        stream->advance(source);
    }
    return StreamResult(std::move(stream));
}

}  // namespace histshard
