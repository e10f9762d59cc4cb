// src/data/conversion_utils.cpp
#include "histshard/data/conversion_utils.hpp"
#include "histshard/core/time_utils.hpp"

namespace histshard {

namespace {

constexpr const char* COMPONENT = "DataConversionUtils";

template <typename T>
Result<T> status_error(const arrow::Status& status, const std::string& context) {
    return make_error<T>(ErrorCode::CONVERSION_ERROR, context + ": " + status.ToString(),
                         COMPONENT);
}

std::shared_ptr<arrow::DataType> utc_millis_type() {
    return arrow::timestamp(arrow::TimeUnit::MILLI, "UTC");
}

// Appends an optional value, or a null when absent
template <typename Builder, typename V>
arrow::Status append_optional(Builder& builder, const std::optional<V>& value) {
    if (value) {
        return builder.Append(*value);
    }
    return builder.AppendNull();
}

int64_t unit_per_second(arrow::TimeUnit::type unit) {
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return 1;
        case arrow::TimeUnit::MILLI:
            return 1000;
        case arrow::TimeUnit::MICRO:
            return 1000 * 1000;
        case arrow::TimeUnit::NANO:
            return 1000 * 1000 * 1000;
        default:
            return 1000;
    }
}

}  // anonymous namespace

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::bars_to_arrow_table(
    const std::vector<Bar>& bars) {
    using TableResult = Result<std::shared_ptr<arrow::Table>>;

    arrow::MemoryPool* pool = arrow::default_memory_pool();
    arrow::TimestampBuilder time_builder(utc_millis_type(), pool);
    arrow::StringBuilder symbol_builder(pool);
    arrow::DoubleBuilder open_builder(pool);
    arrow::DoubleBuilder high_builder(pool);
    arrow::DoubleBuilder low_builder(pool);
    arrow::DoubleBuilder close_builder(pool);
    arrow::Int64Builder volume_builder(pool);
    arrow::Int64Builder trades_builder(pool);
    arrow::DoubleBuilder vwap_builder(pool);

    for (const auto& bar : bars) {
        arrow::Status status = time_builder.Append(core::to_epoch_ms(bar.timestamp));
        if (status.ok())
            status = symbol_builder.Append(bar.symbol);
        if (status.ok())
            status = open_builder.Append(bar.open);
        if (status.ok())
            status = high_builder.Append(bar.high);
        if (status.ok())
            status = low_builder.Append(bar.low);
        if (status.ok())
            status = close_builder.Append(bar.close);
        if (status.ok())
            status = volume_builder.Append(bar.volume);
        if (status.ok())
            status = append_optional(trades_builder, bar.trade_count);
        if (status.ok())
            status = append_optional(vwap_builder, bar.vwap);
        if (!status.ok()) {
            return status_error<std::shared_ptr<arrow::Table>>(status, "Failed to append bar");
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> columns(9);
    arrow::Status status = time_builder.Finish(&columns[0]);
    if (status.ok())
        status = symbol_builder.Finish(&columns[1]);
    if (status.ok())
        status = open_builder.Finish(&columns[2]);
    if (status.ok())
        status = high_builder.Finish(&columns[3]);
    if (status.ok())
        status = low_builder.Finish(&columns[4]);
    if (status.ok())
        status = close_builder.Finish(&columns[5]);
    if (status.ok())
        status = volume_builder.Finish(&columns[6]);
    if (status.ok())
        status = trades_builder.Finish(&columns[7]);
    if (status.ok())
        status = vwap_builder.Finish(&columns[8]);
    if (!status.ok()) {
        return status_error<std::shared_ptr<arrow::Table>>(status, "Failed to build bar columns");
    }

    auto schema = arrow::schema({
        arrow::field("time", utc_millis_type(), false),
        arrow::field("symbol", arrow::utf8(), false),
        arrow::field("open", arrow::float64(), false),
        arrow::field("high", arrow::float64(), false),
        arrow::field("low", arrow::float64(), false),
        arrow::field("close", arrow::float64(), false),
        arrow::field("volume", arrow::int64(), false),
        arrow::field("trades", arrow::int64(), true),
        arrow::field("vwap", arrow::float64(), true),
    });

    return TableResult(arrow::Table::Make(schema, columns));
}

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            COMPONENT);
    }

    // Verify required columns exist
    std::vector<std::string> required_columns = {"time", "symbol", "open", "high",
                                                 "low",  "close",  "volume"};

    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<Bar>>(ErrorCode::INVALID_DATA,
                                                "Missing required column: " + col, COMPONENT);
        }
    }

    std::vector<Bar> bars;
    if (table->num_rows() == 0) {
        return Result<std::vector<Bar>>(std::move(bars));
    }

    try {
        auto combined = table->CombineChunks(arrow::default_memory_pool());
        if (!combined.ok()) {
            return status_error<std::vector<Bar>>(combined.status(), "Failed to combine chunks");
        }
        std::shared_ptr<arrow::Table> flat = *combined;

        auto column = [&flat](const std::string& name) -> std::shared_ptr<arrow::Array> {
            auto chunked = flat->GetColumnByName(name);
            if (!chunked || chunked->num_chunks() == 0) {
                return nullptr;
            }
            return chunked->chunk(0);
        };

        auto time_array = column("time");
        auto symbol_array = column("symbol");
        auto open_array = column("open");
        auto high_array = column("high");
        auto low_array = column("low");
        auto close_array = column("close");
        auto volume_array = column("volume");
        auto trades_array = column("trades");
        auto vwap_array = column("vwap");

        bars.reserve(flat->num_rows());

        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto ts_result = extract_timestamp(time_array, i);
            if (ts_result.is_error()) {
                return forward_error<std::vector<Bar>>(ts_result.error());
            }

            auto symbol_result = extract_string(symbol_array, i);
            if (symbol_result.is_error()) {
                return forward_error<std::vector<Bar>>(symbol_result.error());
            }

            auto open_result = extract_double(open_array, i);
            auto high_result = extract_double(high_array, i);
            auto low_result = extract_double(low_array, i);
            auto close_result = extract_double(close_array, i);
            auto volume_result = extract_int64(volume_array, i);

            if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
                close_result.is_error() || volume_result.is_error()) {
                return make_error<std::vector<Bar>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting OHLCV values at row " + std::to_string(i), COMPONENT);
            }

            Bar bar(ts_result.value(), open_result.value(), high_result.value(),
                    low_result.value(), close_result.value(), volume_result.value(),
                    symbol_result.value());
            bar.trade_count = extract_optional<arrow::Int64Array, int64_t>(trades_array, i);
            bar.vwap = extract_optional<arrow::DoubleArray, double>(vwap_array, i);

            bars.push_back(std::move(bar));
        }

        return Result<std::vector<Bar>>(std::move(bars));

    } catch (const std::exception& e) {
        return make_error<std::vector<Bar>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to bars: ") + e.what(), COMPONENT);
    }
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::chain_to_arrow_table(
    const ChainResult& chain) {
    using TableResult = Result<std::shared_ptr<arrow::Table>>;

    arrow::MemoryPool* pool = arrow::default_memory_pool();
    arrow::StringBuilder contract_builder(pool);
    arrow::StringBuilder underlying_builder(pool);
    arrow::TimestampBuilder expiry_builder(utc_millis_type(), pool);
    arrow::DoubleBuilder strike_builder(pool);
    arrow::StringBuilder type_builder(pool);
    arrow::DoubleBuilder bid_builder(pool);
    arrow::DoubleBuilder ask_builder(pool);
    arrow::DoubleBuilder mid_builder(pool);
    arrow::DoubleBuilder last_builder(pool);
    arrow::Int64Builder volume_builder(pool);
    arrow::Int64Builder oi_builder(pool);
    arrow::DoubleBuilder iv_builder(pool);
    arrow::DoubleBuilder delta_builder(pool);
    arrow::DoubleBuilder gamma_builder(pool);
    arrow::DoubleBuilder theta_builder(pool);
    arrow::DoubleBuilder vega_builder(pool);
    arrow::DoubleBuilder rho_builder(pool);
    arrow::DoubleBuilder intrinsic_builder(pool);
    arrow::BooleanBuilder below_builder(pool);
    arrow::StringBuilder error_builder(pool);

    for (const auto& entry : chain.entries) {
        const OptionQuote* quote = entry.quote ? &*entry.quote : nullptr;
        const Greeks* greeks = entry.greeks ? &*entry.greeks : nullptr;
        auto quote_field = [quote](std::optional<Price> OptionQuote::*member) {
            return quote ? quote->*member : std::optional<Price>();
        };
        auto greek_field = [greeks](double Greeks::*member) {
            return greeks ? std::optional<double>(greeks->*member) : std::optional<double>();
        };

        arrow::Status status = contract_builder.Append(entry.contract.contract_id);
        if (status.ok())
            status = underlying_builder.Append(entry.contract.underlying);
        if (status.ok())
            status = expiry_builder.Append(core::to_epoch_ms(entry.contract.expiry));
        if (status.ok())
            status = strike_builder.Append(entry.contract.strike);
        if (status.ok())
            status = type_builder.Append(option_type_to_string(entry.contract.type));
        if (status.ok())
            status = append_optional(bid_builder, quote_field(&OptionQuote::bid));
        if (status.ok())
            status = append_optional(ask_builder, quote_field(&OptionQuote::ask));
        if (status.ok())
            status = append_optional(mid_builder, quote_field(&OptionQuote::mid));
        if (status.ok())
            status = append_optional(last_builder, quote_field(&OptionQuote::last));
        if (status.ok())
            status = append_optional(volume_builder,
                                     quote ? std::optional<int64_t>(quote->volume)
                                           : std::optional<int64_t>());
        if (status.ok())
            status = append_optional(oi_builder, quote ? quote->open_interest
                                                       : std::optional<int64_t>());
        if (status.ok())
            status = append_optional(iv_builder, greek_field(&Greeks::implied_volatility));
        if (status.ok())
            status = append_optional(delta_builder, greek_field(&Greeks::delta));
        if (status.ok())
            status = append_optional(gamma_builder, greek_field(&Greeks::gamma));
        if (status.ok())
            status = append_optional(theta_builder, greek_field(&Greeks::theta));
        if (status.ok())
            status = append_optional(vega_builder, greek_field(&Greeks::vega));
        if (status.ok())
            status = append_optional(rho_builder, greek_field(&Greeks::rho));
        if (status.ok())
            status = intrinsic_builder.Append(entry.intrinsic_value);
        if (status.ok())
            status = below_builder.Append(entry.below_intrinsic);
        if (status.ok()) {
            status = entry.error_code ? error_builder.Append(error_code_to_string(*entry.error_code))
                                      : error_builder.AppendNull();
        }
        if (!status.ok()) {
            return status_error<std::shared_ptr<arrow::Table>>(
                status, "Failed to append chain entry " + entry.contract.contract_id);
        }
    }

    std::vector<arrow::ArrayBuilder*> builders = {
        &contract_builder, &underlying_builder, &expiry_builder, &strike_builder,
        &type_builder,     &bid_builder,        &ask_builder,    &mid_builder,
        &last_builder,     &volume_builder,     &oi_builder,     &iv_builder,
        &delta_builder,    &gamma_builder,      &theta_builder,  &vega_builder,
        &rho_builder,      &intrinsic_builder,  &below_builder,  &error_builder};

    std::vector<std::shared_ptr<arrow::Array>> columns(builders.size());
    for (size_t i = 0; i < builders.size(); ++i) {
        arrow::Status status = builders[i]->Finish(&columns[i]);
        if (!status.ok()) {
            return status_error<std::shared_ptr<arrow::Table>>(status,
                                                               "Failed to build chain columns");
        }
    }

    auto schema = arrow::schema({
        arrow::field("contract_id", arrow::utf8(), false),
        arrow::field("underlying", arrow::utf8(), false),
        arrow::field("expiry", utc_millis_type(), false),
        arrow::field("strike", arrow::float64(), false),
        arrow::field("type", arrow::utf8(), false),
        arrow::field("bid", arrow::float64(), true),
        arrow::field("ask", arrow::float64(), true),
        arrow::field("mid", arrow::float64(), true),
        arrow::field("last", arrow::float64(), true),
        arrow::field("volume", arrow::int64(), true),
        arrow::field("open_interest", arrow::int64(), true),
        arrow::field("implied_volatility", arrow::float64(), true),
        arrow::field("delta", arrow::float64(), true),
        arrow::field("gamma", arrow::float64(), true),
        arrow::field("theta", arrow::float64(), true),
        arrow::field("vega", arrow::float64(), true),
        arrow::field("rho", arrow::float64(), true),
        arrow::field("intrinsic_value", arrow::float64(), false),
        arrow::field("below_intrinsic", arrow::boolean(), false),
        arrow::field("error", arrow::utf8(), true),
    });

    return TableResult(arrow::Table::Make(schema, columns));
}

Result<Timestamp> DataConversionUtils::extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                                         int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     COMPONENT);
    }
    if (array->type_id() != arrow::Type::TIMESTAMP) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Expected timestamp column, found " + array->type()->ToString(),
                                     COMPONENT);
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    if (ts_array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     COMPONENT);
    }

    // Normalize whatever unit the column carries to milliseconds
    const auto& ts_type = static_cast<const arrow::TimestampType&>(*ts_array->type());
    int64_t per_second = unit_per_second(ts_type.unit());
    int64_t raw = ts_array->Value(index);
    int64_t millis = per_second >= 1000 ? raw / (per_second / 1000) : raw * 1000;
    return Result<Timestamp>(core::from_epoch_ms(millis));
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  COMPONENT);
    }
    if (array->type_id() != arrow::Type::DOUBLE) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                  "Expected double column, found " + array->type()->ToString(),
                                  COMPONENT);
    }

    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (double_array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null double value at index " + std::to_string(index),
                                  COMPONENT);
    }
    return Result<double>(double_array->Value(index));
}

Result<int64_t> DataConversionUtils::extract_int64(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<int64_t>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                   COMPONENT);
    }
    if (array->type_id() != arrow::Type::INT64) {
        return make_error<int64_t>(ErrorCode::CONVERSION_ERROR,
                                   "Expected int64 column, found " + array->type()->ToString(),
                                   COMPONENT);
    }

    auto int_array = std::static_pointer_cast<arrow::Int64Array>(array);
    if (int_array->IsNull(index)) {
        return make_error<int64_t>(ErrorCode::INVALID_DATA,
                                   "Null int64 value at index " + std::to_string(index),
                                   COMPONENT);
    }
    return Result<int64_t>(int_array->Value(index));
}

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       COMPONENT);
    }
    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Expected string column, found " + array->type()->ToString(),
                                       COMPONENT);
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null string value at index " + std::to_string(index),
                                       COMPONENT);
    }
    return Result<std::string>(string_array->GetString(index));
}

template <typename ArrayType, typename V>
std::optional<V> DataConversionUtils::extract_optional(const std::shared_ptr<arrow::Array>& array,
                                                       int64_t index) {
    if (!array || index < 0 || index >= array->length() ||
        array->type_id() != ArrayType::TypeClass::type_id ||
        array->IsNull(index)) {
        return std::nullopt;
    }
    return static_cast<V>(std::static_pointer_cast<ArrayType>(array)->Value(index));
}

}  // namespace histshard
