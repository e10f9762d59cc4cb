// tests/data/shard_fixture.hpp
#pragma once

#include <sqlite3.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "histshard/core/types.hpp"
#include "histshard/options/option_contract.hpp"

namespace histshard {
namespace testing {

/**
 * @brief Writes shard files with the production schema for tests
 *
 * Everything is written in a single transaction that commits in finish()
 * or on destruction. SQLite failures throw std::runtime_error.
 */
class ShardWriter {
public:
    explicit ShardWriter(const std::filesystem::path& file);
    ~ShardWriter();

    ShardWriter(const ShardWriter&) = delete;
    ShardWriter& operator=(const ShardWriter&) = delete;

    void add_bar(const std::string& ticker, const Bar& bar);
    void add_bars(const std::string& ticker, const std::vector<Bar>& bars);

    void add_contract(const OptionContract& contract);

    void add_quote(const std::string& contract_id, const Timestamp& ts, std::optional<double> bid,
                   std::optional<double> ask, std::optional<double> last, int64_t volume,
                   std::optional<int64_t> open_interest = std::nullopt);

    /**
     * @brief Store precomputed Greeks; creates op_iv_greeks on first use
     */
    void add_greeks(const std::string& contract_id, const Timestamp& ts, double iv, double delta,
                    double gamma, double theta, double vega, double rho, double reference_price);

    /**
     * @brief Commit and close; later calls are no-ops
     */
    void finish();

private:
    void exec(const std::string& sql);

    sqlite3* db_{nullptr};
    bool greeks_table_created_{false};
};

/**
 * @brief Consistent bars at a fixed step, prices drifting upwards from base
 */
std::vector<Bar> make_bars(const std::string& symbol, const Timestamp& start,
                           std::chrono::milliseconds step, size_t count, double base);

/**
 * @brief Regular trading-session minute bars (14:30 to 21:00 UTC) for one day
 */
std::vector<Bar> session_minute_bars(const std::string& symbol, int year, unsigned month,
                                     unsigned day, double base);

/**
 * @brief Contract with an OCC id built from its fields
 */
OptionContract make_contract(const std::string& root, const Timestamp& expiry, OptionType type,
                             double strike);

}  // namespace testing
}  // namespace histshard
