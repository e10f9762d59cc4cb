// include/histshard/options/option_contract.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "histshard/core/error.hpp"
#include "histshard/core/types.hpp"

namespace histshard {

/**
 * @brief Option type enumeration
 */
enum class OptionType {
    CALL,
    PUT
};

/**
 * @brief Option exercise style enumeration
 */
enum class ExerciseStyle {
    EUROPEAN,
    AMERICAN
};

inline std::string option_type_to_string(OptionType type) {
    return type == OptionType::CALL ? "C" : "P";
}

inline std::string exercise_style_to_string(ExerciseStyle style) {
    return style == ExerciseStyle::EUROPEAN ? "european" : "american";
}

/**
 * @brief Listed option contract
 *
 * Contract ids follow the OCC layout "O:<ROOT><YYMMDD><C|P><strike x 1000, 8 digits>",
 * e.g. "O:SPXW240830C05500000" is the SPXW 2024-08-30 5500 call.
 */
struct OptionContract {
    std::string contract_id;
    std::string underlying;
    Timestamp expiry;  // 00:00 UTC of the expiration date
    double strike{0.0};
    OptionType type{OptionType::CALL};
    double multiplier{100.0};
    ExerciseStyle style{ExerciseStyle::EUROPEAN};

    /**
     * @brief Build a contract from its OCC id
     * @param contract_id OCC-style id, with or without the "O:" prefix
     * @return Contract with underlying set to the OCC root, or INVALID_ARGUMENT
     */
    static Result<OptionContract> from_occ(const std::string& contract_id);

    /**
     * @brief Format an OCC id
     */
    static std::string format_occ(const std::string& root, const Timestamp& expiry,
                                  OptionType type, double strike);
};

/**
 * @brief Latest top-of-book snapshot for one contract
 *
 * bid/ask are present only when strictly positive and not crossed. mid is
 * present only when both sides are, so bid <= mid <= ask always holds.
 */
struct OptionQuote {
    std::string contract_id;
    Timestamp timestamp;
    std::optional<Price> bid;
    std::optional<Price> ask;
    std::optional<Price> last;
    std::optional<Price> mid;
    int64_t volume{0};
    std::optional<int64_t> open_interest;
    bool crossed{false};  // Raw bid exceeded raw ask; both sides were discarded

    /**
     * @brief Build a quote from raw shard values, enforcing the bid/mid/ask invariants
     */
    static OptionQuote from_raw(std::string contract_id, Timestamp timestamp,
                                std::optional<Price> raw_bid, std::optional<Price> raw_ask,
                                std::optional<Price> raw_last, int64_t volume,
                                std::optional<int64_t> open_interest);

    std::optional<Price> spread() const {
        if (bid && ask) {
            return *ask - *bid;
        }
        return std::nullopt;
    }
};

/**
 * @brief Option sensitivities
 * theta is per calendar day, vega per 1 vol point, rho per 1 rate point
 */
struct Greeks {
    double implied_volatility{0.0};
    double delta{0.0};
    double gamma{0.0};
    double theta{0.0};
    double vega{0.0};
    double rho{0.0};
    double reference_price{0.0};  // Spot used for the computation
    std::optional<double> model_price;
    Timestamp timestamp;
    bool from_store{false};  // Read from the shard rather than computed
};

}  // namespace histshard
