// src/data/sqlite_shard_store.cpp

#include "histshard/data/sqlite_shard_store.hpp"
#include <filesystem>
#include "histshard/core/logger.hpp"
#include "histshard/core/query_builder.hpp"
#include "histshard/core/time_utils.hpp"

namespace histshard {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

std::optional<double> column_optional_double(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, column);
}

std::optional<int64_t> column_optional_int64(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return static_cast<int64_t>(sqlite3_column_int64(stmt, column));
}

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

/**
 * @brief Cursor over a prepared bars_eq statement
 */
class SqliteBarCursor : public BarStream {
public:
    SqliteBarCursor(StatementGuard stmt, std::string symbol, std::string shard_id)
        : stmt_(std::move(stmt)), symbol_(std::move(symbol)), shard_id_(std::move(shard_id)) {}

    Result<bool> next(Bar& out) override {
        if (done_) {
            return Result<bool>(false);
        }

        int rc = sqlite3_step(stmt_.get());
        if (rc == SQLITE_DONE) {
            done_ = true;
            return Result<bool>(false);
        }
        if (rc != SQLITE_ROW) {
            done_ = true;
            return make_error<bool>(ErrorCode::DATABASE_ERROR,
                                    "Read from shard " + shard_id_ + " failed: " +
                                        sqlite3_errmsg(sqlite3_db_handle(stmt_.get())),
                                    "SqliteShardStore");
        }

        sqlite3_stmt* stmt = stmt_.get();
        out.timestamp = core::from_epoch_ms(sqlite3_column_int64(stmt, 0));
        out.open = sqlite3_column_double(stmt, 1);
        out.high = sqlite3_column_double(stmt, 2);
        out.low = sqlite3_column_double(stmt, 3);
        out.close = sqlite3_column_double(stmt, 4);
        out.volume = static_cast<int64_t>(sqlite3_column_int64(stmt, 5));
        out.trade_count = column_optional_int64(stmt, 6);
        out.vwap = column_optional_double(stmt, 7);
        out.symbol = symbol_;
        return Result<bool>(true);
    }

private:
    StatementGuard stmt_;
    std::string symbol_;
    std::string shard_id_;
    bool done_{false};
};

}  // anonymous namespace

SqliteShardStore::SqliteShardStore(ShardDescriptor descriptor, std::string credential)
    : descriptor_(std::move(descriptor)), credential_(std::move(credential)) {}

SqliteShardStore::~SqliteShardStore() {
    close();
}

Result<void> SqliteShardStore::open() {
    if (db_) {
        return Result<void>();
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(descriptor_.path, ec)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Shard file missing: " + descriptor_.path.string(),
                                "SqliteShardStore");
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(descriptor_.path.string().c_str(), &db,
                             SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to open shard " + descriptor_.id + ": " + message,
                                "SqliteShardStore");
    }
    sqlite3_busy_timeout(db, BUSY_TIMEOUT_MS);

    if (!credential_.empty()) {
        char* err_msg = nullptr;
        rc = sqlite3_exec(db, QueryBuilder::pragma_key(credential_).c_str(), nullptr, nullptr,
                          &err_msg);
        if (rc != SQLITE_OK) {
            std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
            sqlite3_free(err_msg);
            sqlite3_close_v2(db);
            return make_error<void>(ErrorCode::DECRYPTION_ERROR,
                                    "Failed to key shard " + descriptor_.id + ": " + message,
                                    "SqliteShardStore");
        }
    }

    // A wrong key or a corrupt file only surfaces on first read
    char* err_msg = nullptr;
    rc = sqlite3_exec(db, "SELECT COUNT(*) FROM sqlite_master;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        sqlite3_close_v2(db);
        ErrorCode code = (!credential_.empty() && rc == SQLITE_NOTADB)
                             ? ErrorCode::DECRYPTION_ERROR
                             : ErrorCode::DATABASE_ERROR;
        return make_error<void>(code,
                                "Shard " + descriptor_.id + " failed verification: " + message,
                                "SqliteShardStore");
    }

    db_ = db;
    has_greeks_table_.reset();
    return Result<void>();
}

void SqliteShardStore::close() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool SqliteShardStore::is_open() const {
    return db_ != nullptr;
}

std::string SqliteShardStore::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "shard not open";
}

Result<StatementGuard> SqliteShardStore::prepare(const std::string& sql,
                                                 const std::string& operation) {
    if (!db_) {
        return make_error<StatementGuard>(ErrorCode::NOT_INITIALIZED,
                                          "Shard " + descriptor_.id + " is not open",
                                          "SqliteShardStore");
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return make_error<StatementGuard>(
            ErrorCode::DATABASE_ERROR,
            operation + " failed on shard " + descriptor_.id + ": " + last_error(),
            "SqliteShardStore");
    }
    return Result<StatementGuard>(StatementGuard(stmt));
}

bool SqliteShardStore::has_table(const std::string& table) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1",
                        "Schema lookup");
    if (stmt.is_error()) {
        return false;
    }
    sqlite3_bind_text(stmt.value().get(), 1, table.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(stmt.value().get()) == SQLITE_ROW;
}

Result<std::unique_ptr<BarStream>> SqliteShardStore::scan_bars(const std::string& symbol,
                                                               const TimeRange& range) {
    auto stmt = prepare(
        "SELECT ts, o, h, l, c, v, trades, vwap FROM bars_eq "
        "WHERE ticker = ?1 AND ts BETWEEN ?2 AND ?3 ORDER BY ts",
        "Bar scan");
    if (stmt.is_error()) {
        return forward_error<std::unique_ptr<BarStream>>(stmt.error());
    }

    sqlite3_stmt* raw = stmt.value().get();
    if (sqlite3_bind_text(raw, 1, symbol.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
        sqlite3_bind_int64(raw, 2, core::to_epoch_ms(range.start)) != SQLITE_OK ||
        sqlite3_bind_int64(raw, 3, core::to_epoch_ms(range.end)) != SQLITE_OK) {
        return make_error<std::unique_ptr<BarStream>>(
            ErrorCode::DATABASE_ERROR, "Failed to bind bar scan parameters: " + last_error(),
            "SqliteShardStore");
    }

    TRACE("Scanning " << descriptor_.id << " for " << symbol << " ["
                      << core::format_timestamp(range.start) << ", "
                      << core::format_timestamp(range.end) << "]");

    std::unique_ptr<BarStream> cursor =
        std::make_unique<SqliteBarCursor>(std::move(stmt.value()), symbol, descriptor_.id);
    return Result<std::unique_ptr<BarStream>>(std::move(cursor));
}

Result<std::vector<OptionContract>> SqliteShardStore::list_contracts(
    const std::string& underlying, const Timestamp& min_expiry) {
    auto stmt = prepare(
        "SELECT contract, underlying, expiration, strike, option_type, multiplier, style "
        "FROM option_contracts WHERE underlying = ?1 AND expiration >= ?2 "
        "ORDER BY expiration, option_type, strike",
        "Contract listing");
    if (stmt.is_error()) {
        return forward_error<std::vector<OptionContract>>(stmt.error());
    }

    sqlite3_stmt* raw = stmt.value().get();
    std::string min_date = core::format_date(min_expiry);
    sqlite3_bind_text(raw, 1, underlying.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(raw, 2, min_date.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<OptionContract> contracts;
    int rc;
    while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
        OptionContract contract;
        contract.contract_id = column_text(raw, 0);
        contract.underlying = column_text(raw, 1);

        auto expiry = core::parse_date(column_text(raw, 2));
        std::string type = column_text(raw, 4);
        if (expiry.is_error() || (type != "C" && type != "P")) {
            WARN("Skipping malformed contract row " << contract.contract_id << " in "
                                                    << descriptor_.id);
            continue;
        }

        contract.expiry = expiry.value();
        contract.strike = sqlite3_column_double(raw, 3);
        contract.type = type == "C" ? OptionType::CALL : OptionType::PUT;
        if (sqlite3_column_type(raw, 5) != SQLITE_NULL) {
            contract.multiplier = sqlite3_column_double(raw, 5);
        }
        contract.style =
            column_text(raw, 6) == "american" ? ExerciseStyle::AMERICAN : ExerciseStyle::EUROPEAN;
        contracts.push_back(std::move(contract));
    }

    if (rc != SQLITE_DONE) {
        return make_error<std::vector<OptionContract>>(
            ErrorCode::DATABASE_ERROR, "Contract listing failed on " + descriptor_.id + ": " +
                                           last_error(),
            "SqliteShardStore");
    }
    return Result<std::vector<OptionContract>>(std::move(contracts));
}

Result<std::optional<OptionQuote>> SqliteShardStore::latest_quote(const std::string& contract_id,
                                                                  const TimeRange& window) {
    auto stmt = prepare(
        "SELECT ts, bid, ask, last, v, oi FROM option_quotes "
        "WHERE contract = ?1 AND ts BETWEEN ?2 AND ?3 ORDER BY ts DESC LIMIT 1",
        "Quote lookup");
    if (stmt.is_error()) {
        return forward_error<std::optional<OptionQuote>>(stmt.error());
    }

    sqlite3_stmt* raw = stmt.value().get();
    sqlite3_bind_text(raw, 1, contract_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(raw, 2, core::to_epoch_ms(window.start));
    sqlite3_bind_int64(raw, 3, core::to_epoch_ms(window.end));

    int rc = sqlite3_step(raw);
    if (rc == SQLITE_DONE) {
        return Result<std::optional<OptionQuote>>(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        return make_error<std::optional<OptionQuote>>(
            ErrorCode::DATABASE_ERROR,
            "Quote lookup failed on " + descriptor_.id + ": " + last_error(), "SqliteShardStore");
    }

    auto volume = column_optional_int64(raw, 4);
    OptionQuote quote = OptionQuote::from_raw(
        contract_id, core::from_epoch_ms(sqlite3_column_int64(raw, 0)),
        column_optional_double(raw, 1), column_optional_double(raw, 2),
        column_optional_double(raw, 3), volume.value_or(0), column_optional_int64(raw, 5));
    return Result<std::optional<OptionQuote>>(std::move(quote));
}

Result<std::optional<Greeks>> SqliteShardStore::latest_greeks(const std::string& contract_id,
                                                              const TimeRange& window) {
    if (!has_greeks_table_) {
        has_greeks_table_ = has_table("op_iv_greeks");
    }
    if (!*has_greeks_table_) {
        return Result<std::optional<Greeks>>(std::nullopt);
    }

    auto stmt = prepare(
        "SELECT ts, iv, delta, gamma, theta, vega, rho, ref_px FROM op_iv_greeks "
        "WHERE contract = ?1 AND ts BETWEEN ?2 AND ?3 AND iv IS NOT NULL "
        "ORDER BY ts DESC LIMIT 1",
        "Greeks lookup");
    if (stmt.is_error()) {
        return forward_error<std::optional<Greeks>>(stmt.error());
    }

    sqlite3_stmt* raw = stmt.value().get();
    sqlite3_bind_text(raw, 1, contract_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(raw, 2, core::to_epoch_ms(window.start));
    sqlite3_bind_int64(raw, 3, core::to_epoch_ms(window.end));

    int rc = sqlite3_step(raw);
    if (rc == SQLITE_DONE) {
        return Result<std::optional<Greeks>>(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        return make_error<std::optional<Greeks>>(
            ErrorCode::DATABASE_ERROR,
            "Greeks lookup failed on " + descriptor_.id + ": " + last_error(),
            "SqliteShardStore");
    }

    Greeks greeks;
    greeks.timestamp = core::from_epoch_ms(sqlite3_column_int64(raw, 0));
    greeks.implied_volatility = sqlite3_column_double(raw, 1);
    greeks.delta = sqlite3_column_double(raw, 2);
    greeks.gamma = sqlite3_column_double(raw, 3);
    greeks.theta = sqlite3_column_double(raw, 4);
    greeks.vega = sqlite3_column_double(raw, 5);
    greeks.rho = sqlite3_column_double(raw, 6);
    greeks.reference_price = sqlite3_column_double(raw, 7);
    greeks.from_store = true;
    return Result<std::optional<Greeks>>(std::move(greeks));
}

}  // namespace histshard
