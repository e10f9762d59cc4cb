// include/histshard/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "histshard/core/error.hpp"
#include "histshard/core/types.hpp"
#include "histshard/options/chain_resolver.hpp"

namespace histshard {

/**
 * @brief Columnar export and import of query results
 *
 * Bar tables use the columns time (timestamp[ms, UTC]), symbol, open, high,
 * low, close, volume (int64), trades (nullable int64) and vwap (nullable
 * double).
 */
class DataConversionUtils {
public:
    /**
     * @brief Convert bars to an Arrow table
     * @param bars Bars in output order
     * @return Result containing the table
     */
    static Result<std::shared_ptr<arrow::Table>> bars_to_arrow_table(const std::vector<Bar>& bars);

    /**
     * @brief Convert Arrow Table to vector of Bars
     * @param table Arrow table containing OHLCV data
     * @return Result containing vector of Bars
     */
    static Result<std::vector<Bar>> arrow_table_to_bars(const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Flatten a resolved chain into one row per contract
     *
     * Quote and Greek columns are null where the entry has no quote or the
     * pricing failed.
     */
    static Result<std::shared_ptr<arrow::Table>> chain_to_arrow_table(const ChainResult& chain);

private:
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<int64_t> extract_int64(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);

    /**
     * @brief Value of a nullable column; absent column or null cell yields nullopt
     */
    template <typename ArrayType, typename V>
    static std::optional<V> extract_optional(const std::shared_ptr<arrow::Array>& array,
                                             int64_t index);
};

}  // namespace histshard
