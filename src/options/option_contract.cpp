// src/options/option_contract.cpp

#include "histshard/options/option_contract.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include "histshard/core/time_utils.hpp"

namespace histshard {

namespace {
constexpr size_t DATE_DIGITS = 6;
constexpr size_t STRIKE_DIGITS = 8;
constexpr double STRIKE_SCALE = 1000.0;

std::optional<Price> positive(std::optional<Price> value) {
    if (value && *value > 0.0 && std::isfinite(*value)) {
        return value;
    }
    return std::nullopt;
}
}  // anonymous namespace

Result<OptionContract> OptionContract::from_occ(const std::string& contract_id) {
    std::string body = contract_id;
    if (body.rfind("O:", 0) == 0) {
        body = body.substr(2);
    }

    const size_t tail = DATE_DIGITS + 1 + STRIKE_DIGITS;
    if (body.size() <= tail) {
        return make_error<OptionContract>(ErrorCode::INVALID_ARGUMENT,
                                          "Contract id too short: '" + contract_id + "'",
                                          "OptionContract");
    }

    std::string root = body.substr(0, body.size() - tail);
    std::string date = body.substr(root.size(), DATE_DIGITS);
    char type_char = body[root.size() + DATE_DIGITS];
    std::string strike_digits = body.substr(root.size() + DATE_DIGITS + 1);

    for (char c : root) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            return make_error<OptionContract>(ErrorCode::INVALID_ARGUMENT,
                                              "Invalid root in contract id '" + contract_id + "'",
                                              "OptionContract");
        }
    }
    for (char c : date + strike_digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return make_error<OptionContract>(ErrorCode::INVALID_ARGUMENT,
                                              "Non-numeric field in contract id '" + contract_id +
                                                  "'",
                                              "OptionContract");
        }
    }
    if (type_char != 'C' && type_char != 'P') {
        return make_error<OptionContract>(ErrorCode::INVALID_ARGUMENT,
                                          "Option type must be C or P in '" + contract_id + "'",
                                          "OptionContract");
    }

    std::string iso = "20" + date.substr(0, 2) + "-" + date.substr(2, 2) + "-" + date.substr(4, 2);
    auto expiry = core::parse_date(iso);
    if (expiry.is_error()) {
        return make_error<OptionContract>(ErrorCode::INVALID_ARGUMENT,
                                          "Invalid expiry in contract id '" + contract_id + "'",
                                          "OptionContract");
    }

    OptionContract contract;
    contract.contract_id = "O:" + body;
    contract.underlying = root;
    contract.expiry = expiry.value();
    contract.type = type_char == 'C' ? OptionType::CALL : OptionType::PUT;
    contract.strike = static_cast<double>(std::stoll(strike_digits)) / STRIKE_SCALE;
    return Result<OptionContract>(std::move(contract));
}

std::string OptionContract::format_occ(const std::string& root, const Timestamp& expiry,
                                       OptionType type, double strike) {
    std::string date = core::format_date(expiry);  // YYYY-MM-DD
    std::string yymmdd = date.substr(2, 2) + date.substr(5, 2) + date.substr(8, 2);

    char strike_buffer[16];
    std::snprintf(strike_buffer, sizeof(strike_buffer), "%08lld",
                  static_cast<long long>(std::llround(strike * STRIKE_SCALE)));

    return "O:" + root + yymmdd + option_type_to_string(type) + strike_buffer;
}

OptionQuote OptionQuote::from_raw(std::string contract_id, Timestamp timestamp,
                                  std::optional<Price> raw_bid, std::optional<Price> raw_ask,
                                  std::optional<Price> raw_last, int64_t volume,
                                  std::optional<int64_t> open_interest) {
    OptionQuote quote;
    quote.contract_id = std::move(contract_id);
    quote.timestamp = timestamp;
    quote.bid = positive(raw_bid);
    quote.ask = positive(raw_ask);
    quote.last = positive(raw_last);
    quote.volume = volume;
    quote.open_interest = open_interest;

    if (quote.bid && quote.ask) {
        if (*quote.bid > *quote.ask) {
            quote.crossed = true;
            quote.bid.reset();
            quote.ask.reset();
        } else {
            quote.mid = (*quote.bid + *quote.ask) / 2.0;
        }
    }
    return quote;
}

}  // namespace histshard
