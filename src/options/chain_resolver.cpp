// src/options/chain_resolver.cpp

#include "histshard/options/chain_resolver.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <tuple>
#include "histshard/core/logger.hpp"
#include "histshard/core/time_utils.hpp"
#include "histshard/options/black_scholes.hpp"
#include "histshard/query/query_planner.hpp"

namespace histshard {

namespace {

struct OpenShard {
    ShardDescriptor shard;
    PooledConnection connection;
};

bool chain_order(const ChainEntry& a, const ChainEntry& b) {
    return std::make_tuple(a.contract.expiry, a.contract.type, a.contract.strike,
                           a.contract.contract_id) <
           std::make_tuple(b.contract.expiry, b.contract.type, b.contract.strike,
                           b.contract.contract_id);
}

}  // anonymous namespace

nlohmann::json ChainConfig::to_json() const {
    nlohmann::json j;
    j["risk_free_rate"] = risk_free_rate;
    j["default_strike_window"] = default_strike_window;
    j["quote_lookback_ms"] = quote_lookback.count();
    j["spot_lookback_ms"] = spot_lookback.count();
    j["iv_tolerance"] = iv_tolerance;
    return j;
}

void ChainConfig::from_json(const nlohmann::json& j) {
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("default_strike_window"))
        default_strike_window = j.at("default_strike_window").get<int>();
    if (j.contains("quote_lookback_ms"))
        quote_lookback = std::chrono::milliseconds(j.at("quote_lookback_ms").get<int64_t>());
    if (j.contains("spot_lookback_ms"))
        spot_lookback = std::chrono::milliseconds(j.at("spot_lookback_ms").get<int64_t>());
    if (j.contains("iv_tolerance"))
        iv_tolerance = j.at("iv_tolerance").get<double>();
}

nlohmann::json ChainResult::metadata_to_json() const {
    nlohmann::json j = metadata.to_json();
    j["underlying"] = underlying;
    j["as_of"] = core::format_timestamp(as_of);
    j["spot"] = spot;
    j["spot_timestamp"] = core::format_timestamp(spot_timestamp);
    j["strike_window"] = strike_window;
    j["contracts"] = entries.size();
    j["iv_failures"] = iv_failures;
    return j;
}

ChainResolver::ChainResolver(const ShardCatalog& catalog, ShardPool& pool, ChainConfig config)
    : catalog_(catalog), pool_(pool), config_(std::move(config)) {}

Result<Bar> ChainResolver::resolve_spot(const std::string& underlying, const Timestamp& as_of,
                                        QueryMetadata& metadata,
                                        const CancellationToken* cancel) {
    auto categories = catalog_.categories_for(underlying);
    if (categories.empty()) {
        return make_error<Bar>(ErrorCode::NOT_FOUND, "No bar shards hold " + underlying,
                               "ChainResolver");
    }

    ShardCategory category = categories.front();
    TimeRange window(as_of - config_.spot_lookback, as_of);

    // Finest granularity first; coarser shards serve dates the fine ones do not reach
    auto granularities = catalog_.granularities(category, underlying, window);
    for (const auto& granularity : granularities) {
        auto latest = latest_bar(category, underlying, granularity, window, metadata, cancel);
        if (latest.is_error()) {
            return forward_error<Bar>(latest.error());
        }
        if (latest.value()) {
            return Result<Bar>(std::move(*latest.value()));
        }
    }

    return make_error<Bar>(ErrorCode::NOT_FOUND,
                           "No " + underlying + " bar at or before " +
                               core::format_timestamp(as_of),
                           "ChainResolver");
}

Result<std::optional<Bar>> ChainResolver::latest_bar(ShardCategory category,
                                                     const std::string& underlying,
                                                     const Granularity& granularity,
                                                     const TimeRange& window,
                                                     QueryMetadata& metadata,
                                                     const CancellationToken* cancel) {
    using LatestResult = Result<std::optional<Bar>>;

    auto shards = catalog_.resolve(category, underlying, granularity, window);
    if (shards.is_error()) {
        return forward_error<std::optional<Bar>>(shards.error());
    }

    QueryPlanner planner(pool_);
    auto plan = planner.plan(shards.value(), underlying, window);
    if (plan.is_error()) {
        return forward_error<std::optional<Bar>>(plan.error());
    }

    auto stream = planner.execute(plan.value(), cancel);
    if (stream.is_error()) {
        return forward_error<std::optional<Bar>>(stream.error());
    }

    std::optional<Bar> latest;
    Bar bar;
    while (true) {
        auto step = stream.value()->next(bar);
        if (step.is_error()) {
            return forward_error<std::optional<Bar>>(step.error());
        }
        if (!step.value()) {
            break;
        }
        latest = bar;
    }

    auto spot_metadata = stream.value()->metadata();
    metadata.partial = metadata.partial || spot_metadata->partial;
    for (const auto& id : spot_metadata->contributing_shards) {
        metadata.contributing_shards.push_back(id);
    }
    for (const auto& id : spot_metadata->unavailable_shards) {
        metadata.unavailable_shards.push_back(id);
    }
    return LatestResult(std::move(latest));
}

std::vector<OptionContract> ChainResolver::select_strike_window(
    const std::vector<OptionContract>& contracts, double spot, int window) {
    using GroupKey = std::pair<int64_t, OptionType>;
    std::map<GroupKey, std::set<double>> strikes;
    for (const auto& contract : contracts) {
        strikes[{core::to_epoch_ms(contract.expiry), contract.type}].insert(contract.strike);
    }

    std::map<GroupKey, std::pair<double, double>> bounds;
    for (const auto& [key, group] : strikes) {
        std::vector<double> ordered(group.begin(), group.end());

        size_t atm = 0;
        for (size_t i = 1; i < ordered.size(); ++i) {
            if (std::abs(ordered[i] - spot) < std::abs(ordered[atm] - spot)) {
                atm = i;
            }
        }

        size_t w = static_cast<size_t>(std::max(window, 0));
        size_t low = atm >= w ? atm - w : 0;
        size_t high = std::min(atm + w, ordered.size() - 1);
        bounds[key] = {ordered[low], ordered[high]};
    }

    std::vector<OptionContract> selected;
    for (const auto& contract : contracts) {
        const auto& range = bounds[{core::to_epoch_ms(contract.expiry), contract.type}];
        if (contract.strike >= range.first && contract.strike <= range.second) {
            selected.push_back(contract);
        }
    }
    return selected;
}

void ChainResolver::price_entry(ChainEntry& entry, const std::optional<Greeks>& stored,
                                double spot, const Timestamp& as_of) const {
    const OptionContract& contract = entry.contract;
    double years = BlackScholes::year_fraction(core::days_between(as_of, contract.expiry));

    std::optional<double> volatility;
    bool from_store = false;
    if (stored && stored->implied_volatility > 0.0) {
        volatility = stored->implied_volatility;
        from_store = true;
    } else if (entry.quote) {
        std::optional<Price> observed = entry.quote->mid ? entry.quote->mid : entry.quote->last;
        if (!observed) {
            return;
        }

        auto iv = BlackScholes::implied_volatility(contract.type, *observed, spot, contract.strike,
                                                   years, config_.risk_free_rate,
                                                   config_.iv_tolerance);
        if (iv.is_error()) {
            entry.error_code = iv.error()->code();
            entry.error_message = iv.error()->what();
            DEBUG("IV inversion failed for " << contract.contract_id << ": "
                                             << iv.error()->what());
            return;
        }
        volatility = iv.value();
    }

    if (!volatility) {
        return;
    }

    Greeks greeks = BlackScholes::greeks(contract.type, spot, contract.strike, years, *volatility,
                                         config_.risk_free_rate);
    greeks.timestamp = as_of;
    greeks.from_store = from_store;
    entry.greeks = greeks;
}

Result<ChainResult> ChainResolver::resolve_chain(const ChainRequest& request,
                                                 const CancellationToken* cancel) {
    Logger::register_component("ChainResolver");

    if (request.underlying.empty()) {
        return make_error<ChainResult>(ErrorCode::INVALID_ARGUMENT, "Underlying is required",
                                       "ChainResolver");
    }
    if (request.strike_window < 0) {
        return make_error<ChainResult>(ErrorCode::INVALID_ARGUMENT,
                                       "Strike window must be non-negative", "ChainResolver");
    }

    ChainResult result;
    result.underlying = request.underlying;
    result.as_of = request.as_of;
    result.strike_window = request.strike_window;

    auto spot_bar = resolve_spot(request.underlying, request.as_of, result.metadata, cancel);
    if (spot_bar.is_error()) {
        return forward_error<ChainResult>(spot_bar.error());
    }
    result.spot = spot_bar.value().close;
    result.spot_timestamp = spot_bar.value().timestamp;

    TimeRange quote_window(request.as_of - config_.quote_lookback, request.as_of);
    auto option_shards = catalog_.resolve_options(request.underlying, quote_window);
    if (option_shards.is_error()) {
        return make_error<ChainResult>(ErrorCode::NOT_FOUND,
                                       "No option data for " + request.underlying + ": " +
                                           option_shards.error()->what(),
                                       "ChainResolver");
    }

    // All option shards stay borrowed until pricing is done
    std::vector<OpenShard> open_shards;
    for (const auto& shard : option_shards.value()) {
        auto connection = pool_.acquire(shard, cancel);
        if (connection.is_error()) {
            if (connection.error()->code() == ErrorCode::CANCELLED) {
                return forward_error<ChainResult>(connection.error());
            }
            result.metadata.partial = true;
            result.metadata.unavailable_shards.push_back(shard.id);
            continue;
        }
        open_shards.push_back(OpenShard{shard, std::move(connection.value())});
    }

    if (open_shards.empty()) {
        return make_error<ChainResult>(ErrorCode::NO_DATA_SOURCE,
                                       "No option shard for " + request.underlying +
                                           " could be opened",
                                       "ChainResolver");
    }

    // Later-coverage shards overwrite earlier listings of the same contract
    Timestamp min_expiry = core::floor_to_day(request.as_of);
    std::map<std::string, std::pair<OptionContract, size_t>> listed;
    for (size_t i = 0; i < open_shards.size(); ++i) {
        auto contracts = open_shards[i].connection->list_contracts(request.underlying, min_expiry);
        if (contracts.is_error()) {
            WARN("Contract listing failed on " << open_shards[i].shard.id << ": "
                                               << contracts.error()->what());
            result.metadata.partial = true;
            result.metadata.unavailable_shards.push_back(open_shards[i].shard.id);
            open_shards[i].connection.invalidate();
            open_shards[i].connection.release();
            continue;
        }
        result.metadata.contributing_shards.push_back(open_shards[i].shard.id);
        for (auto& contract : contracts.value()) {
            if (request.expiry && contract.expiry != core::floor_to_day(*request.expiry)) {
                continue;
            }
            std::string id = contract.contract_id;
            listed[id] = {std::move(contract), i};
        }
    }

    std::vector<OptionContract> candidates;
    for (const auto& [id, entry] : listed) {
        candidates.push_back(entry.first);
    }
    if (candidates.empty()) {
        return make_error<ChainResult>(ErrorCode::NOT_FOUND,
                                       "No live contracts for " + request.underlying + " as of " +
                                           core::format_date(request.as_of),
                                       "ChainResolver");
    }

    auto selected = select_strike_window(candidates, result.spot, request.strike_window);

    for (const auto& contract : selected) {
        if (is_cancelled(cancel)) {
            return make_error<ChainResult>(ErrorCode::CANCELLED, "Chain resolution cancelled",
                                           "ChainResolver");
        }

        ChainEntry entry;
        entry.contract = contract;
        entry.source_shard = open_shards[listed[contract.contract_id].second].shard.id;
        entry.intrinsic_value =
            BlackScholes::intrinsic_value(contract.type, result.spot, contract.strike);

        std::optional<Greeks> stored;
        for (auto& open : open_shards) {
            if (!open.connection) {
                continue;
            }

            auto quote = open.connection->latest_quote(contract.contract_id, quote_window);
            if (quote.is_error()) {
                WARN("Quote lookup for " << contract.contract_id << " failed on "
                                         << open.shard.id << ": " << quote.error()->what());
                result.metadata.partial = true;
                continue;
            }
            if (quote.value() &&
                (!entry.quote || quote.value()->timestamp >= entry.quote->timestamp)) {
                entry.quote = quote.value();
            }

            auto greeks = open.connection->latest_greeks(contract.contract_id, quote_window);
            if (greeks.is_error()) {
                WARN("Greeks lookup for " << contract.contract_id << " failed on "
                                          << open.shard.id << ": " << greeks.error()->what());
                continue;
            }
            if (greeks.value() && (!stored || greeks.value()->timestamp >= stored->timestamp)) {
                stored = greeks.value();
            }
        }

        entry.missing_quote = !entry.quote;
        entry.crossed_quote = entry.quote && entry.quote->crossed;
        if (entry.quote && entry.quote->mid && *entry.quote->mid < entry.intrinsic_value) {
            entry.below_intrinsic = true;
        }

        price_entry(entry, stored, result.spot, request.as_of);
        if (entry.error_code && *entry.error_code == ErrorCode::IV_CONVERGENCE_FAILED) {
            result.iv_failures++;
        }
        result.entries.push_back(std::move(entry));
    }

    std::sort(result.entries.begin(), result.entries.end(), chain_order);

    if (result.iv_failures > 0) {
        WARN("Implied volatility failed for " << result.iv_failures << " of "
                                              << result.entries.size() << " "
                                              << request.underlying << " contracts");
    }
    INFO("Resolved " << request.underlying << " chain as of "
                     << core::format_timestamp(request.as_of) << ": " << result.entries.size()
                     << " contracts around spot " << result.spot);

    return Result<ChainResult>(std::move(result));
}

}  // namespace histshard
