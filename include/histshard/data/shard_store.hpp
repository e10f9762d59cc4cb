// include/histshard/data/shard_store.hpp

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "histshard/catalog/shard_descriptor.hpp"
#include "histshard/core/bar_stream.hpp"
#include "histshard/core/error.hpp"
#include "histshard/core/types.hpp"
#include "histshard/options/option_contract.hpp"

namespace histshard {

/**
 * @brief Abstract interface to one open shard file
 * Defines the read operations the planner and chain resolver need
 */
class ShardStore {
public:
    virtual ~ShardStore() = default;

    /**
     * @brief Open and verify the shard
     * @return FILE_NOT_FOUND, DECRYPTION_ERROR or DATABASE_ERROR on failure
     */
    virtual Result<void> open() = 0;

    /**
     * @brief Close the shard; safe to call when already closed
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    virtual const ShardDescriptor& descriptor() const = 0;

    /**
     * @brief Lazily scan bars for a symbol within a range
     * @param symbol Ticker
     * @param range Inclusive predicate pushed down into the shard query
     * @return Cursor ordered by timestamp. The cursor must not outlive the store.
     */
    virtual Result<std::unique_ptr<BarStream>> scan_bars(const std::string& symbol,
                                                         const TimeRange& range) = 0;

    /**
     * @brief Contracts on an underlying expiring on or after a date
     * @param underlying Underlying symbol
     * @param min_expiry Earliest expiration to include
     */
    virtual Result<std::vector<OptionContract>> list_contracts(const std::string& underlying,
                                                               const Timestamp& min_expiry) = 0;

    /**
     * @brief Latest quote for a contract inside the window
     * @return std::nullopt if the contract has no quote in the window
     */
    virtual Result<std::optional<OptionQuote>> latest_quote(const std::string& contract_id,
                                                            const TimeRange& window) = 0;

    /**
     * @brief Latest precomputed Greeks for a contract inside the window
     * @return std::nullopt if none are stored
     */
    virtual Result<std::optional<Greeks>> latest_greeks(const std::string& contract_id,
                                                        const TimeRange& window) = 0;
};

}  // namespace histshard
