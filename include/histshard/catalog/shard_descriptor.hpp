// include/histshard/catalog/shard_descriptor.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "histshard/core/types.hpp"

namespace histshard {

/**
 * @brief Immutable description of one shard file
 *
 * Built by the catalog scan and replaced wholesale when the catalog is
 * refreshed; nothing mutates a descriptor after construction.
 */
struct ShardDescriptor {
    std::string id;  // Path relative to the data root, e.g. "indices/spx_1m_2024.db"
    ShardCategory category{ShardCategory::INDICES};
    std::string symbol;                   // Upper case ticker or option underlying
    TimeRange coverage;                   // Inclusive
    Granularity granularity;              // Native bar width
    std::filesystem::path path;           // Absolute file location
    uint64_t size_hint{0};                // File size in bytes at scan time

    /**
     * @brief Precedence at shard seams: later coverage start wins, then id
     * @return true if this shard's rows are preferred over the other's
     */
    bool takes_precedence_over(const ShardDescriptor& other) const {
        if (coverage.start != other.coverage.start) {
            return coverage.start > other.coverage.start;
        }
        return id > other.id;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Ascending coverage start, ties by id
 */
inline bool coverage_order(const ShardDescriptor& a, const ShardDescriptor& b) {
    if (a.coverage.start != b.coverage.start) {
        return a.coverage.start < b.coverage.start;
    }
    return a.id < b.id;
}

}  // namespace histshard
