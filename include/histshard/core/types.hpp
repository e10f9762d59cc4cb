// include/histshard/core/types.hpp

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "histshard/core/error.hpp"

namespace histshard {

/**
 * @brief Timestamp type for consistent time representation
 * Shards store timestamps as UTC epoch milliseconds
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Inclusive time interval [start, end]
 */
struct TimeRange {
    Timestamp start;
    Timestamp end;

    TimeRange() = default;
    TimeRange(Timestamp s, Timestamp e) : start(s), end(e) {}

    bool is_valid() const {
        return start <= end;
    }

    bool contains(const Timestamp& ts) const {
        return ts >= start && ts <= end;
    }

    bool overlaps(const TimeRange& other) const {
        return start <= other.end && other.start <= end;
    }

    /**
     * @brief Intersection of two ranges; only meaningful when they overlap
     */
    TimeRange intersect(const TimeRange& other) const {
        return TimeRange(std::max(start, other.start), std::min(end, other.end));
    }

    bool operator==(const TimeRange& other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * @brief Bar width, stored as a number of milliseconds
 *
 * Accepted spellings are "<N>m", "<N>min", "<N>h", "<N>d", "d", "day" and
 * "daily". The canonical form uses the largest whole unit: "1m", "5m",
 * "1h", "1d".
 */
class Granularity {
public:
    Granularity() = default;
    explicit Granularity(int64_t millis) : millis_(millis) {}

    static Granularity minutes(int64_t n) {
        return Granularity(n * 60 * 1000);
    }
    static Granularity hours(int64_t n) {
        return Granularity(n * 60 * 60 * 1000);
    }
    static Granularity days(int64_t n) {
        return Granularity(n * 24 * 60 * 60 * 1000);
    }

    /**
     * @brief Parse a granularity string
     * @param text Granularity such as "1m", "5min" or "1d"
     * @return Parsed granularity or INVALID_ARGUMENT
     */
    static Result<Granularity> parse(const std::string& text);

    int64_t millis() const {
        return millis_;
    }

    std::chrono::milliseconds duration() const {
        return std::chrono::milliseconds(millis_);
    }

    /**
     * @brief Canonical string representation
     */
    std::string to_string() const;

    /**
     * @brief True if bars of this width tile the target width exactly
     */
    bool divides(const Granularity& target) const {
        return millis_ > 0 && millis_ <= target.millis_ && target.millis_ % millis_ == 0;
    }

    bool operator==(const Granularity& other) const {
        return millis_ == other.millis_;
    }
    bool operator!=(const Granularity& other) const {
        return millis_ != other.millis_;
    }
    bool operator<(const Granularity& other) const {
        return millis_ < other.millis_;
    }

private:
    int64_t millis_{60 * 1000};
};

/**
 * @brief Category a shard belongs to, mirrors the top-level directories
 */
enum class ShardCategory {
    INDICES,
    OPTIONS,
    ETFS,
    STOCKS
};

inline std::string category_to_string(ShardCategory category) {
    switch (category) {
        case ShardCategory::INDICES:
            return "indices";
        case ShardCategory::OPTIONS:
            return "options";
        case ShardCategory::ETFS:
            return "etfs";
        case ShardCategory::STOCKS:
            return "stocks";
        default:
            return "unknown";
    }
}

inline std::optional<ShardCategory> category_from_string(const std::string& name) {
    if (name == "indices")
        return ShardCategory::INDICES;
    if (name == "options")
        return ShardCategory::OPTIONS;
    if (name == "etfs")
        return ShardCategory::ETFS;
    if (name == "stocks")
        return ShardCategory::STOCKS;
    return std::nullopt;
}

/**
 * @brief Market data bar structure
 * Represents OHLCV data for any timeframe
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    int64_t volume{0};
    std::string symbol;
    std::optional<int64_t> trade_count;
    std::optional<Price> vwap;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, int64_t v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}

    /**
     * @brief OHLC ordering and non-negative volume
     */
    bool is_consistent() const {
        return low <= open && open <= high && low <= close && close <= high && volume >= 0;
    }
};

}  // namespace histshard
