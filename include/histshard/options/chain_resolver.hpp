// include/histshard/options/chain_resolver.hpp

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "histshard/catalog/shard_catalog.hpp"
#include "histshard/core/cancellation.hpp"
#include "histshard/core/config_base.hpp"
#include "histshard/core/error.hpp"
#include "histshard/data/shard_pool.hpp"
#include "histshard/options/option_contract.hpp"
#include "histshard/query/query_plan.hpp"

namespace histshard {

/**
 * @brief Pricing inputs and look-back windows for chain resolution
 */
struct ChainConfig : public ConfigBase {
    double risk_free_rate{0.05};
    int default_strike_window{10};
    std::chrono::milliseconds quote_lookback{std::chrono::hours(24 * 3)};
    std::chrono::milliseconds spot_lookback{std::chrono::hours(24 * 5)};
    double iv_tolerance{1e-6};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief One contract of a resolved chain
 */
struct ChainEntry {
    OptionContract contract;
    std::optional<OptionQuote> quote;
    std::optional<Greeks> greeks;
    double intrinsic_value{0.0};
    bool below_intrinsic{false};  // mid < intrinsic value
    bool crossed_quote{false};
    bool missing_quote{false};
    std::optional<ErrorCode> error_code;  // Per-contract failure, e.g. IV_CONVERGENCE_FAILED
    std::string error_message;
    std::string source_shard;
};

/**
 * @brief Chain around the money for one underlying at one point in time
 * Entries are ordered by expiry, calls before puts, then strike.
 */
struct ChainResult {
    std::string underlying;
    Timestamp as_of;
    double spot{0.0};
    Timestamp spot_timestamp;
    int strike_window{0};
    std::vector<ChainEntry> entries;
    QueryMetadata metadata;
    size_t iv_failures{0};

    nlohmann::json metadata_to_json() const;
};

/**
 * @brief Chain query parameters
 */
struct ChainRequest {
    std::string underlying;
    Timestamp as_of;
    int strike_window{10};
    std::optional<Timestamp> expiry;  // Restrict to one expiration date
};

/**
 * @brief Resolves option chains from monthly option shards
 *
 * Spot comes from the latest bar at or before the as-of time on the bar
 * path; contracts come from the option shards covering the quote look-back
 * window; Greeks come from Black-Scholes with implied volatility either read
 * from the shard or inverted from the mid (or last) price.
 */
class ChainResolver {
public:
    ChainResolver(const ShardCatalog& catalog, ShardPool& pool, ChainConfig config);

    /**
     * @brief Resolve a chain
     * @param request Underlying, as-of time, strike window and optional expiry
     * @param cancel Optional cancellation token
     * @return Chain, or NOT_FOUND (no spot or no contracts), NO_DATA_SOURCE, CANCELLED
     */
    Result<ChainResult> resolve_chain(const ChainRequest& request,
                                      const CancellationToken* cancel = nullptr);

    /**
     * @brief Close of the latest bar at or before as_of within the spot look-back
     * @param metadata Receives shard coverage of the spot lookup
     */
    Result<Bar> resolve_spot(const std::string& underlying, const Timestamp& as_of,
                             QueryMetadata& metadata, const CancellationToken* cancel = nullptr);

    /**
     * @brief Keep strikes within +/- window positions of at-the-money, per expiry and type
     *
     * At-the-money is the listed strike closest to spot, the lower one on ties.
     */
    static std::vector<OptionContract> select_strike_window(
        const std::vector<OptionContract>& contracts, double spot, int window);

    const ChainConfig& config() const {
        return config_;
    }

private:
    Result<std::optional<Bar>> latest_bar(ShardCategory category, const std::string& underlying,
                                          const Granularity& granularity,
                                          const TimeRange& window, QueryMetadata& metadata,
                                          const CancellationToken* cancel);

    void price_entry(ChainEntry& entry, const std::optional<Greeks>& stored, double spot,
                     const Timestamp& as_of) const;

    const ShardCatalog& catalog_;
    ShardPool& pool_;
    ChainConfig config_;
};

}  // namespace histshard
