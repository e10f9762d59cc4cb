// include/histshard/cache/query_fingerprint.hpp

#pragma once

#include <optional>
#include <string>
#include "histshard/core/types.hpp"

namespace histshard {

/**
 * @brief Canonical cache keys for logical queries
 *
 * Keys are compact JSON with sorted member names, upper-case symbols,
 * epoch-millisecond ranges and canonical granularity strings, so equivalent
 * spellings of a query ("5min" vs "5m", "spx" vs "SPX") share an entry.
 */
class QueryFingerprint {
public:
    static std::string for_bars(ShardCategory category, const std::string& symbol,
                                const TimeRange& range, const Granularity& granularity);

    static std::string for_chain(const std::string& underlying, const Timestamp& as_of,
                                 int strike_window, const std::optional<Timestamp>& expiry);
};

}  // namespace histshard
