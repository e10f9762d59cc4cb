// include/histshard/data/sqlite_shard_store.hpp

#pragma once

#include <sqlite3.h>
#include <memory>
#include <optional>
#include <string>
#include "histshard/data/shard_store.hpp"

namespace histshard {

/**
 * @brief Finalizes a prepared statement on scope exit
 */
class StatementGuard {
public:
    explicit StatementGuard(sqlite3_stmt* stmt = nullptr) : stmt_(stmt) {}
    ~StatementGuard() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;

    StatementGuard(StatementGuard&& other) noexcept : stmt_(other.stmt_) {
        other.stmt_ = nullptr;
    }

    StatementGuard& operator=(StatementGuard&& other) noexcept {
        if (this != &other) {
            if (stmt_) {
                sqlite3_finalize(stmt_);
            }
            stmt_ = other.stmt_;
            other.stmt_ = nullptr;
        }
        return *this;
    }

    sqlite3_stmt* get() const {
        return stmt_;
    }

    sqlite3_stmt* release() {
        sqlite3_stmt* stmt = stmt_;
        stmt_ = nullptr;
        return stmt;
    }

private:
    sqlite3_stmt* stmt_;
};

/**
 * @brief Read-only SQLite implementation of ShardStore
 *
 * Tables:
 *   bars_eq(ticker, ts, o, h, l, c, v, trades, vwap)                    PK (ticker, ts)
 *   option_contracts(contract, underlying, expiration, strike, option_type, multiplier, style)
 *   option_quotes(contract, ts, bid, ask, last, v, oi)                  PK (contract, ts)
 *   op_iv_greeks(contract, ts, iv, delta, gamma, theta, vega, rho, ref_px)   optional
 * ts columns hold UTC epoch milliseconds.
 */
class SqliteShardStore : public ShardStore {
public:
    /**
     * @brief Constructor
     * @param descriptor Shard to open
     * @param credential Passphrase for encrypted shards, empty for plain files
     */
    SqliteShardStore(ShardDescriptor descriptor, std::string credential = "");
    ~SqliteShardStore() override;

    SqliteShardStore(const SqliteShardStore&) = delete;
    SqliteShardStore& operator=(const SqliteShardStore&) = delete;

    Result<void> open() override;
    void close() override;
    bool is_open() const override;

    const ShardDescriptor& descriptor() const override {
        return descriptor_;
    }

    Result<std::unique_ptr<BarStream>> scan_bars(const std::string& symbol,
                                                 const TimeRange& range) override;

    Result<std::vector<OptionContract>> list_contracts(const std::string& underlying,
                                                       const Timestamp& min_expiry) override;

    Result<std::optional<OptionQuote>> latest_quote(const std::string& contract_id,
                                                    const TimeRange& window) override;

    Result<std::optional<Greeks>> latest_greeks(const std::string& contract_id,
                                                const TimeRange& window) override;

private:
    Result<StatementGuard> prepare(const std::string& sql, const std::string& operation);
    bool has_table(const std::string& table);
    std::string last_error() const;

    ShardDescriptor descriptor_;
    std::string credential_;
    sqlite3* db_{nullptr};
    std::optional<bool> has_greeks_table_;
};

}  // namespace histshard
