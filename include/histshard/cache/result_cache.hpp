// include/histshard/cache/result_cache.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "histshard/core/cancellation.hpp"
#include "histshard/core/error.hpp"

namespace histshard {

/**
 * @brief Bounded TTL + LRU cache of immutable query results with single-flight computation
 *
 * At most one computation per fingerprint runs at a time; concurrent callers
 * for the same fingerprint wait for that computation's outcome. Computation
 * runs outside the cache lock, and so does the TTL policy. Failed computations
 * are handed to the callers that waited on them but are never stored.
 *
 * @tparam V Result type; values are shared as std::shared_ptr<const V>
 */
template <typename V>
class ResultCache {
public:
    using Clock = std::chrono::steady_clock;
    using ValuePtr = std::shared_ptr<const V>;
    using ComputeFn = std::function<Result<ValuePtr>()>;
    using NowFn = std::function<Clock::time_point()>;
    /**
     * @brief Adjusts the TTL of a freshly computed value, e.g. shorter for partial results
     */
    using TtlPolicy =
        std::function<std::chrono::milliseconds(const V&, std::chrono::milliseconds)>;

    /**
     * @brief Constructor
     * @param capacity Maximum number of entries; 0 disables storage
     * @param now Clock source, replaceable in tests
     */
    explicit ResultCache(size_t capacity, NowFn now = [] { return Clock::now(); })
        : capacity_(capacity), now_(std::move(now)) {}

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    void set_ttl_policy(TtlPolicy policy) {
        std::lock_guard<std::mutex> lock(mutex_);
        ttl_policy_ = std::move(policy);
    }

    /**
     * @brief Return the cached value or compute it once
     *
     * The leader's computation sees only the leader's cancellation. When the leader is
     * cancelled its waiters are not failed; one of them takes over the computation.
     * A waiter whose own token is cancelled stops waiting and gets CANCELLED.
     *
     * @param fingerprint Canonical query key
     * @param ttl Time to live for a newly computed value
     * @param compute Invoked at most once per fingerprint at a time
     * @param cancel This caller's cancellation token, may be nullptr
     * @return Shared value, or the computation's error
     */
    Result<ValuePtr> get_or_compute(const std::string& fingerprint, std::chrono::milliseconds ttl,
                                    const ComputeFn& compute,
                                    const CancellationToken* cancel = nullptr) {
        while (true) {
            std::promise<Outcome> promise;
            std::shared_future<Outcome> pending;
            bool leader = false;

            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = entries_.find(fingerprint);
                if (it != entries_.end()) {
                    if (now_() < it->second.expires_at) {
                        lru_.splice(lru_.begin(), lru_, it->second.lru_position);
                        hits_++;
                        return Result<ValuePtr>(it->second.value);
                    }
                    erase_locked(it);
                }

                auto flight = in_flight_.find(fingerprint);
                if (flight != in_flight_.end()) {
                    pending = flight->second;
                    shared_waits_++;
                } else {
                    leader = true;
                    pending = promise.get_future().share();
                    in_flight_.emplace(fingerprint, pending);
                    misses_++;
                }
            }

            if (!leader) {
                while (pending.wait_for(WAIT_POLL) != std::future_status::ready) {
                    if (is_cancelled(cancel)) {
                        return make_error<ValuePtr>(ErrorCode::CANCELLED,
                                                    "Cancelled while waiting for " + fingerprint,
                                                    "ResultCache");
                    }
                }
                const Outcome& shared = pending.get();
                if (shared.abandoned) {
                    continue;
                }
                return to_result(shared);
            }

            return lead(fingerprint, ttl, compute, cancel, promise);
        }
    }

    /**
     * @brief Cached value if present and fresh, without computing
     */
    std::optional<ValuePtr> lookup(const std::string& fingerprint) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(fingerprint);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (now_() >= it->second.expires_at) {
            erase_locked(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void invalidate(const std::string& fingerprint) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(fingerprint);
        if (it != entries_.end()) {
            erase_locked(it);
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        lru_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    uint64_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    uint64_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

    uint64_t shared_waits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shared_waits_;
    }

private:
    static constexpr std::chrono::milliseconds WAIT_POLL{10};

    struct Outcome {
        ValuePtr value;
        std::shared_ptr<const QueryError> error;
        bool abandoned{false};  // Leader was cancelled; waiters must retry
    };

    Result<ValuePtr> lead(const std::string& fingerprint, std::chrono::milliseconds ttl,
                          const ComputeFn& compute, const CancellationToken* cancel,
                          std::promise<Outcome>& promise) {
        Outcome outcome;
        try {
            auto computed = compute();
            if (computed.is_ok()) {
                outcome.value = computed.value();
            } else {
                outcome.error = std::make_shared<QueryError>(*computed.error());
            }
        } catch (const std::exception& e) {
            outcome.error = std::make_shared<QueryError>(
                ErrorCode::UNKNOWN_ERROR, std::string("Computation threw: ") + e.what(),
                "ResultCache");
        }

        outcome.abandoned = outcome.error && outcome.error->code() == ErrorCode::CANCELLED &&
                            is_cancelled(cancel);

        TtlPolicy policy;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            policy = ttl_policy_;
        }
        std::chrono::milliseconds effective = ttl;
        if (!outcome.error && outcome.value && policy) {
            effective = policy(*outcome.value, ttl);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(fingerprint);
            if (!outcome.error && outcome.value) {
                insert_locked(fingerprint, outcome.value, effective);
            }
        }

        promise.set_value(outcome);
        return to_result(outcome);
    }

    struct Entry {
        ValuePtr value;
        Clock::time_point expires_at;
        std::list<std::string>::iterator lru_position;
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    static Result<ValuePtr> to_result(const Outcome& outcome) {
        if (outcome.error) {
            return Result<ValuePtr>(std::make_unique<QueryError>(*outcome.error));
        }
        return Result<ValuePtr>(outcome.value);
    }

    void erase_locked(typename EntryMap::iterator it) {
        lru_.erase(it->second.lru_position);
        entries_.erase(it);
    }

    void insert_locked(const std::string& fingerprint, ValuePtr value,
                       std::chrono::milliseconds ttl) {
        if (capacity_ == 0 || ttl.count() <= 0) {
            return;
        }

        auto existing = entries_.find(fingerprint);
        if (existing != entries_.end()) {
            erase_locked(existing);
        }

        while (entries_.size() >= capacity_ && !lru_.empty()) {
            auto victim = entries_.find(lru_.back());
            if (victim != entries_.end()) {
                entries_.erase(victim);
            }
            lru_.pop_back();
        }

        lru_.push_front(fingerprint);
        entries_.emplace(fingerprint, Entry{std::move(value), now_() + ttl, lru_.begin()});
    }

    size_t capacity_;
    NowFn now_;
    TtlPolicy ttl_policy_;
    mutable std::mutex mutex_;
    EntryMap entries_;
    std::list<std::string> lru_;  // Most recently used at the front
    std::unordered_map<std::string, std::shared_future<Outcome>> in_flight_;
    uint64_t hits_{0};
    uint64_t misses_{0};
    uint64_t shared_waits_{0};
};

}  // namespace histshard
