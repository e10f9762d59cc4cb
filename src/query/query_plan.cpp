// src/query/query_plan.cpp

#include "histshard/query/query_plan.hpp"
#include "histshard/core/query_builder.hpp"
#include "histshard/core/time_utils.hpp"

namespace histshard {

std::string QueryPlan::explain() const {
    std::vector<std::string> selects;
    selects.reserve(shards.size());
    for (size_t i = 0; i < shards.size(); ++i) {
        selects.push_back(QueryBuilder::select_bars("s" + std::to_string(i), symbol,
                                                    core::to_epoch_ms(shards[i].range.start),
                                                    core::to_epoch_ms(shards[i].range.end)));
    }
    return QueryBuilder::union_all(selects);
}

nlohmann::json QueryPlan::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["start"] = core::format_timestamp(range.start);
    j["end"] = core::format_timestamp(range.end);

    nlohmann::json parts = nlohmann::json::array();
    for (const auto& part : shards) {
        parts.push_back({{"shard", part.shard.id},
                         {"start", core::format_timestamp(part.range.start)},
                         {"end", core::format_timestamp(part.range.end)}});
    }
    j["shards"] = parts;
    return j;
}

nlohmann::json QueryMetadata::to_json() const {
    nlohmann::json j;
    j["partial"] = partial;
    j["contributing_shards"] = contributing_shards;
    j["unavailable_shards"] = unavailable_shards;
    j["source_granularity"] = source_granularity;
    j["rolled_up"] = rolled_up;
    j["rejected_rows"] = rejected_rows;
    j["seam_duplicates"] = seam_duplicates;
    return j;
}

}  // namespace histshard
