// src/cache/query_fingerprint.cpp

#include "histshard/cache/query_fingerprint.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include "histshard/core/time_utils.hpp"

namespace histshard {

namespace {
std::string canonical_symbol(std::string symbol) {
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}
}  // anonymous namespace

std::string QueryFingerprint::for_bars(ShardCategory category, const std::string& symbol,
                                       const TimeRange& range, const Granularity& granularity) {
    nlohmann::json key;
    key["kind"] = "bars";
    key["category"] = category_to_string(category);
    key["symbol"] = canonical_symbol(symbol);
    key["start"] = core::to_epoch_ms(range.start);
    key["end"] = core::to_epoch_ms(range.end);
    key["granularity"] = granularity.to_string();
    return key.dump();
}

std::string QueryFingerprint::for_chain(const std::string& underlying, const Timestamp& as_of,
                                        int strike_window,
                                        const std::optional<Timestamp>& expiry) {
    nlohmann::json key;
    key["kind"] = "chain";
    key["category"] = category_to_string(ShardCategory::OPTIONS);
    key["symbol"] = canonical_symbol(underlying);
    key["as_of"] = core::to_epoch_ms(as_of);
    key["strike_window"] = strike_window;
    key["expiry"] = expiry ? nlohmann::json(core::format_date(*expiry)) : nlohmann::json(nullptr);
    return key.dump();
}

}  // namespace histshard
