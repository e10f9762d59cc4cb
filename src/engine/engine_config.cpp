// src/engine/engine_config.cpp

#include "histshard/engine/engine_config.hpp"

namespace histshard {

nlohmann::json CacheConfig::to_json() const {
    nlohmann::json j;
    j["capacity"] = capacity;
    j["bar_ttl_ms"] = bar_ttl.count();
    j["chain_ttl_ms"] = chain_ttl.count();
    j["partial_ttl_ms"] = partial_ttl.count();
    return j;
}

void CacheConfig::from_json(const nlohmann::json& j) {
    if (j.contains("capacity"))
        capacity = j.at("capacity").get<size_t>();
    if (j.contains("bar_ttl_ms"))
        bar_ttl = std::chrono::milliseconds(j.at("bar_ttl_ms").get<int64_t>());
    if (j.contains("chain_ttl_ms"))
        chain_ttl = std::chrono::milliseconds(j.at("chain_ttl_ms").get<int64_t>());
    if (j.contains("partial_ttl_ms"))
        partial_ttl = std::chrono::milliseconds(j.at("partial_ttl_ms").get<int64_t>());
}

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["data_root"] = data_root;
    j["pool"] = pool.to_json();
    j["cache"] = cache.to_json();
    j["chain"] = chain.to_json();
    j["logger"] = logger.to_json();
    return j;
}

void EngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("data_root"))
        data_root = j.at("data_root").get<std::string>();
    if (j.contains("pool"))
        pool.from_json(j.at("pool"));
    if (j.contains("cache"))
        cache.from_json(j.at("cache"));
    if (j.contains("chain"))
        chain.from_json(j.at("chain"));
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
}

}  // namespace histshard
