// include/histshard/core/query_builder.hpp
#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace histshard {

/**
 * @brief Helper class for building SQLite statements
 *
 * Values that cannot be bound as statement parameters (PRAGMA arguments,
 * diagnostic SQL text) go through escape_string.
 */
class QueryBuilder {
public:
    /**
     * @brief Quote a string literal for SQLite
     * @param value The string to escape
     * @return Single-quoted literal with embedded quotes doubled
     */
    static std::string escape_string(const std::string& value) {
        std::string result = "'";
        for (char c : value) {
            if (c == '\'') {
                result += "''";
            } else {
                result += c;
            }
        }
        result += "'";
        return result;
    }

    /**
     * @brief Format a numeric value for SQL
     */
    template <typename T>
    static std::string format_number(T value) {
        return std::to_string(value);
    }

    /**
     * @brief PRAGMA statement that keys an encrypted database
     * @param credential Passphrase
     */
    static std::string pragma_key(const std::string& credential) {
        return "PRAGMA key = " + escape_string(credential) + ";";
    }

    /**
     * @brief Bar SELECT against one (optionally attached) schema
     * @param schema Schema alias, empty for the main database
     * @param symbol Ticker
     * @param start_ms Inclusive lower bound in epoch milliseconds
     * @param end_ms Inclusive upper bound in epoch milliseconds
     */
    static std::string select_bars(const std::string& schema, const std::string& symbol,
                                   int64_t start_ms, int64_t end_ms) {
        std::ostringstream sql;
        sql << "SELECT ticker, ts, o, h, l, c, v, trades, vwap FROM "
            << (schema.empty() ? "" : schema + ".") << "bars_eq WHERE ticker = "
            << escape_string(symbol) << " AND ts BETWEEN " << format_number(start_ms) << " AND "
            << format_number(end_ms);
        return sql.str();
    }

    /**
     * @brief Join SELECT statements with UNION ALL and order the result by ts
     */
    static std::string union_all(const std::vector<std::string>& selects) {
        std::ostringstream sql;
        for (size_t i = 0; i < selects.size(); ++i) {
            if (i > 0) {
                sql << "\nUNION ALL\n";
            }
            sql << selects[i];
        }
        if (!selects.empty()) {
            sql << "\nORDER BY ts";
        }
        return sql.str();
    }
};

}  // namespace histshard
