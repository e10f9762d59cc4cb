// src/data/shard_pool.cpp

#include "histshard/data/shard_pool.hpp"
#include <algorithm>
#include "histshard/core/logger.hpp"
#include "histshard/data/sqlite_shard_store.hpp"

namespace histshard {

namespace {
// Upper bound on one wait so cancellation is noticed promptly
constexpr std::chrono::milliseconds WAIT_SLICE{50};

void close_all(std::vector<std::unique_ptr<ShardStore>>& stores) {
    for (auto& store : stores) {
        if (store) {
            store->close();
        }
    }
    stores.clear();
}
}  // anonymous namespace

nlohmann::json PoolConfig::to_json() const {
    nlohmann::json j;
    j["max_connections_per_shard"] = max_connections_per_shard;
    j["idle_timeout_ms"] = idle_timeout.count();
    j["degraded_cooldown_ms"] = degraded_cooldown.count();
    j["acquire_timeout_ms"] = acquire_timeout.count();
    return j;
}

void PoolConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_connections_per_shard"))
        max_connections_per_shard = j.at("max_connections_per_shard").get<size_t>();
    if (j.contains("idle_timeout_ms"))
        idle_timeout = std::chrono::milliseconds(j.at("idle_timeout_ms").get<int64_t>());
    if (j.contains("degraded_cooldown_ms"))
        degraded_cooldown =
            std::chrono::milliseconds(j.at("degraded_cooldown_ms").get<int64_t>());
    if (j.contains("acquire_timeout_ms"))
        acquire_timeout = std::chrono::milliseconds(j.at("acquire_timeout_ms").get<int64_t>());
}

void ShardPool::ConnectionGuard::release() noexcept {
    if (pool_ && store_) {
        pool_->return_connection(shard_id_, std::move(store_), !invalidated_);
    }
    pool_ = nullptr;
    store_.reset();
}

ShardPool::ShardPool(PoolConfig config, StoreFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
    if (config_.max_connections_per_shard == 0) {
        config_.max_connections_per_shard = 1;
    }
}

ShardPool::~ShardPool() {
    shutdown();
}

StoreFactory ShardPool::sqlite_factory(std::string credential) {
    return [credential = std::move(credential)](const ShardDescriptor& descriptor) {
        return std::unique_ptr<ShardStore>(
            std::make_unique<SqliteShardStore>(descriptor, credential));
    };
}

ShardPool::ShardSlot& ShardPool::slot_locked(const std::string& shard_id) {
    auto it = slots_.find(shard_id);
    if (it == slots_.end()) {
        ShardSlot slot;
        slot.max_connections = config_.max_connections_per_shard;
        it = slots_.emplace(shard_id, std::move(slot)).first;
    }
    return it->second;
}

Result<ShardPool::ConnectionGuard> ShardPool::acquire(const ShardDescriptor& descriptor,
                                                      const CancellationToken* cancel) {
    Logger::register_component("ShardPool");

    const std::string& id = descriptor.id;
    auto deadline = Clock::now() + config_.acquire_timeout;
    std::vector<std::unique_ptr<ShardStore>> stale;

    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            if (shut_down_) {
                return make_error<ConnectionGuard>(ErrorCode::NOT_INITIALIZED,
                                                   "Pool has been shut down", "ShardPool");
            }
            if (is_cancelled(cancel)) {
                return make_error<ConnectionGuard>(ErrorCode::CANCELLED,
                                                   "Acquire of " + id + " cancelled", "ShardPool");
            }

            ShardSlot& slot = slot_locked(id);
            auto now = Clock::now();

            if (slot.degraded_until && now < *slot.degraded_until) {
                DEBUG("Shard " << id << " is degraded, failing fast");
                return make_error<ConnectionGuard>(
                    ErrorCode::SHARD_UNAVAILABLE, "Shard " + id + " is degraded after a failed open",
                    "ShardPool");
            }

            while (!slot.idle.empty()) {
                IdleConnection connection = std::move(slot.idle.back());
                slot.idle.pop_back();
                if (connection.store && connection.store->is_open()) {
                    lock.unlock();
                    return Result<ConnectionGuard>(
                        ConnectionGuard(this, id, std::move(connection.store)));
                }
                slot.live--;
                stale.push_back(std::move(connection.store));
            }

            if (slot.live < slot.max_connections) {
                // Reserve the slot; the open happens outside the lock
                slot.live++;
                break;
            }

            if (now >= deadline) {
                return make_error<ConnectionGuard>(
                    ErrorCode::TIMEOUT_ERROR,
                    "Timed out waiting for a connection to " + id + " (" +
                        std::to_string(slot.max_connections) + " in use)",
                    "ShardPool");
            }
            cv_.wait_until(lock, std::min(deadline, now + WAIT_SLICE));
        }
    }

    close_all(stale);

    std::unique_ptr<ShardStore> store = factory_(descriptor);
    Result<void> opened = store ? store->open()
                                : make_error<void>(ErrorCode::NOT_INITIALIZED,
                                                   "Store factory returned no store", "ShardPool");

    if (opened.is_error()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ShardSlot& slot = slot_locked(id);
            slot.live--;
            slot.degraded_until = Clock::now() + config_.degraded_cooldown;
        }
        cv_.notify_all();

        WARN("Failed to open shard " << id << ": " << opened.error()->what()
                                     << "; degraded for " << config_.degraded_cooldown.count()
                                     << "ms");
        return make_error<ConnectionGuard>(
            ErrorCode::SHARD_UNAVAILABLE,
            "Shard " + id + " unavailable: " + opened.error()->what(), "ShardPool");
    }

    size_t live = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ShardSlot& slot = slot_locked(id);
        slot.degraded_until.reset();
        live = slot.live;
    }

    DEBUG("Opened shard " << id << " (" << live << " live)");
    return Result<ConnectionGuard>(ConnectionGuard(this, id, std::move(store)));
}

void ShardPool::return_connection(const std::string& shard_id, std::unique_ptr<ShardStore> store,
                                  bool reusable) {
    std::vector<std::unique_ptr<ShardStore>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ShardSlot& slot = slot_locked(shard_id);
        auto now = Clock::now();

        if (!reusable || shut_down_ || !store->is_open() || slot.live > slot.max_connections) {
            slot.live--;
            to_close.push_back(std::move(store));
        } else {
            slot.idle.push_back(IdleConnection{std::move(store), now});
        }

        auto expired = collect_expired_locked(now);
        for (auto& e : expired) {
            to_close.push_back(std::move(e));
        }
    }
    cv_.notify_all();

    close_all(to_close);
}

std::vector<std::unique_ptr<ShardStore>> ShardPool::collect_expired_locked(Clock::time_point now) {
    std::vector<std::unique_ptr<ShardStore>> expired;
    for (auto& [id, slot] : slots_) {
        while (!slot.idle.empty() && now - slot.idle.front().last_used >= config_.idle_timeout) {
            expired.push_back(std::move(slot.idle.front().store));
            slot.idle.pop_front();
            slot.live--;
        }
    }
    return expired;
}

void ShardPool::set_max_connections(const std::string& shard_id, size_t max_connections) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_locked(shard_id).max_connections = std::max<size_t>(max_connections, 1);
    }
    cv_.notify_all();
}

size_t ShardPool::evict_idle() {
    std::vector<std::unique_ptr<ShardStore>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        expired = collect_expired_locked(Clock::now());
    }

    size_t count = expired.size();
    close_all(expired);
    if (count > 0) {
        Logger::register_component("ShardPool");
        INFO("Evicted " << count << " idle shard connections");
    }
    return count;
}

void ShardPool::shutdown() {
    std::vector<std::unique_ptr<ShardStore>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        for (auto& [id, slot] : slots_) {
            for (auto& connection : slot.idle) {
                idle.push_back(std::move(connection.store));
                slot.live--;
            }
            slot.idle.clear();
        }
    }
    cv_.notify_all();
    close_all(idle);
}

size_t ShardPool::live_connections(const std::string& shard_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(shard_id);
    return it == slots_.end() ? 0 : it->second.live;
}

size_t ShardPool::idle_connections(const std::string& shard_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(shard_id);
    return it == slots_.end() ? 0 : it->second.idle.size();
}

size_t ShardPool::total_live_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [id, slot] : slots_) {
        total += slot.live;
    }
    return total;
}

bool ShardPool::is_degraded(const std::string& shard_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(shard_id);
    return it != slots_.end() && it->second.degraded_until &&
           Clock::now() < *it->second.degraded_until;
}

}  // namespace histshard
