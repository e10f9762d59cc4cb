// include/histshard/data/shard_pool.hpp

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "histshard/catalog/shard_descriptor.hpp"
#include "histshard/core/cancellation.hpp"
#include "histshard/core/config_base.hpp"
#include "histshard/core/error.hpp"
#include "histshard/data/shard_store.hpp"

namespace histshard {

/**
 * @brief Connection pool limits and timeouts
 */
struct PoolConfig : public ConfigBase {
    size_t max_connections_per_shard{1};
    std::chrono::milliseconds idle_timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds degraded_cooldown{std::chrono::seconds(30)};
    std::chrono::milliseconds acquire_timeout{std::chrono::seconds(5)};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Creates an unopened store for a shard
 */
using StoreFactory = std::function<std::unique_ptr<ShardStore>(const ShardDescriptor&)>;

/**
 * @brief Per-shard pool of open shard stores
 *
 * Each shard has its own live-connection limit (default 1). A connection is
 * owned by the pool while idle and by exactly one ConnectionGuard while
 * borrowed. Bookkeeping happens under a single mutex; opening and closing
 * files always happen after the mutex is released.
 *
 * A shard whose open fails is marked degraded: acquires fail immediately
 * with SHARD_UNAVAILABLE until the cool-down elapses, then one retry is made.
 */
class ShardPool {
public:
    /**
     * @brief Scoped borrow of one connection
     *
     * Returns the connection to the pool exactly once, on destruction or on
     * an explicit release(). Guards must not outlive their pool.
     */
    class ConnectionGuard {
    public:
        ConnectionGuard() = default;

        ConnectionGuard(ShardPool* pool, std::string shard_id, std::unique_ptr<ShardStore> store)
            : pool_(pool), shard_id_(std::move(shard_id)), store_(std::move(store)) {}

        ~ConnectionGuard() {
            release();
        }

        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;

        ConnectionGuard(ConnectionGuard&& other) noexcept
            : pool_(other.pool_),
              shard_id_(std::move(other.shard_id_)),
              store_(std::move(other.store_)),
              invalidated_(other.invalidated_) {
            other.pool_ = nullptr;
        }

        ConnectionGuard& operator=(ConnectionGuard&& other) noexcept {
            if (this != &other) {
                release();
                pool_ = other.pool_;
                shard_id_ = std::move(other.shard_id_);
                store_ = std::move(other.store_);
                invalidated_ = other.invalidated_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        ShardStore* operator->() const {
            return store_.get();
        }

        ShardStore& store() const {
            return *store_;
        }

        explicit operator bool() const {
            return store_ != nullptr;
        }

        const std::string& shard_id() const {
            return shard_id_;
        }

        /**
         * @brief Close the connection on release instead of reusing it
         * Used after I/O errors that may have left the store unusable.
         */
        void invalidate() {
            invalidated_ = true;
        }

        /**
         * @brief Return the connection now; later calls are no-ops
         */
        void release() noexcept;

    private:
        ShardPool* pool_{nullptr};
        std::string shard_id_;
        std::unique_ptr<ShardStore> store_;
        bool invalidated_{false};
    };

    /**
     * @brief Constructor
     * @param config Pool limits
     * @param factory Store factory; see sqlite_factory()
     */
    ShardPool(PoolConfig config, StoreFactory factory);
    ~ShardPool();

    ShardPool(const ShardPool&) = delete;
    ShardPool& operator=(const ShardPool&) = delete;

    /**
     * @brief Factory that opens shards with SqliteShardStore
     * @param credential Passphrase for encrypted shards, empty for none
     */
    static StoreFactory sqlite_factory(std::string credential);

    /**
     * @brief Borrow a connection to a shard
     * @param descriptor Shard to connect to
     * @param cancel Optional cancellation token checked while waiting
     * @return Guard, or SHARD_UNAVAILABLE, TIMEOUT_ERROR, CANCELLED, NOT_INITIALIZED
     */
    Result<ConnectionGuard> acquire(const ShardDescriptor& descriptor,
                                    const CancellationToken* cancel = nullptr);

    /**
     * @brief Raise or lower the live-connection limit for a hot shard
     */
    void set_max_connections(const std::string& shard_id, size_t max_connections);

    /**
     * @brief Close idle connections unused for longer than the idle timeout
     * @return Number of connections closed
     */
    size_t evict_idle();

    /**
     * @brief Close all idle connections and reject further acquires
     */
    void shutdown();

    size_t live_connections(const std::string& shard_id) const;
    size_t idle_connections(const std::string& shard_id) const;
    size_t total_live_connections() const;
    bool is_degraded(const std::string& shard_id) const;

    const PoolConfig& config() const {
        return config_;
    }

private:
    using Clock = std::chrono::steady_clock;

    struct IdleConnection {
        std::unique_ptr<ShardStore> store;
        Clock::time_point last_used;
    };

    struct ShardSlot {
        std::deque<IdleConnection> idle;  // Oldest at the front
        size_t live{0};                   // Idle + borrowed + being opened
        size_t max_connections{1};
        std::optional<Clock::time_point> degraded_until;
    };

    void return_connection(const std::string& shard_id, std::unique_ptr<ShardStore> store,
                           bool reusable);
    ShardSlot& slot_locked(const std::string& shard_id);
    std::vector<std::unique_ptr<ShardStore>> collect_expired_locked(Clock::time_point now);

    PoolConfig config_;
    StoreFactory factory_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, ShardSlot> slots_;
    bool shut_down_{false};
};

using PooledConnection = ShardPool::ConnectionGuard;

}  // namespace histshard
