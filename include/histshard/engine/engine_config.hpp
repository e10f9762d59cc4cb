// include/histshard/engine/engine_config.hpp

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include "histshard/core/config_base.hpp"
#include "histshard/core/logger.hpp"
#include "histshard/data/shard_pool.hpp"
#include "histshard/options/chain_resolver.hpp"

namespace histshard {

/**
 * @brief Result cache sizing and lifetimes
 */
struct CacheConfig : public ConfigBase {
    size_t capacity{256};
    std::chrono::milliseconds bar_ttl{std::chrono::seconds(30)};
    std::chrono::milliseconds chain_ttl{std::chrono::seconds(30)};
    std::chrono::milliseconds partial_ttl{std::chrono::seconds(5)};  // Cap for partial results

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Complete engine configuration
 *
 * Secrets are not part of the configuration; the shard credential is passed
 * to the engine directly by whoever resolved it.
 */
struct EngineConfig : public ConfigBase {
    std::string data_root;
    PoolConfig pool;
    CacheConfig cache;
    ChainConfig chain;
    LoggerConfig logger;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace histshard
