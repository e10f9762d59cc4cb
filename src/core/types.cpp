// src/core/types.cpp

#include "histshard/core/types.hpp"
#include <algorithm>
#include <cctype>

namespace histshard {

namespace {
constexpr int64_t MILLIS_PER_MINUTE = 60 * 1000;
constexpr int64_t MILLIS_PER_HOUR = 60 * MILLIS_PER_MINUTE;
constexpr int64_t MILLIS_PER_DAY = 24 * MILLIS_PER_HOUR;
}  // anonymous namespace

Result<Granularity> Granularity::parse(const std::string& text) {
    std::string s;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    if (s == "d" || s == "day" || s == "daily") {
        return Result<Granularity>(Granularity(MILLIS_PER_DAY));
    }

    size_t digits = 0;
    while (digits < s.size() && std::isdigit(static_cast<unsigned char>(s[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits > 6 || digits == s.size()) {
        return make_error<Granularity>(ErrorCode::INVALID_ARGUMENT,
                                       "Invalid granularity: '" + text + "'", "Granularity");
    }

    int64_t count = std::stoll(s.substr(0, digits));
    std::string unit = s.substr(digits);
    if (count <= 0) {
        return make_error<Granularity>(ErrorCode::INVALID_ARGUMENT,
                                       "Granularity must be positive: '" + text + "'",
                                       "Granularity");
    }

    if (unit == "m" || unit == "min") {
        return Result<Granularity>(Granularity(count * MILLIS_PER_MINUTE));
    }
    if (unit == "h") {
        return Result<Granularity>(Granularity(count * MILLIS_PER_HOUR));
    }
    if (unit == "d") {
        return Result<Granularity>(Granularity(count * MILLIS_PER_DAY));
    }

    return make_error<Granularity>(ErrorCode::INVALID_ARGUMENT,
                                   "Unknown granularity unit in '" + text + "'", "Granularity");
}

std::string Granularity::to_string() const {
    if (millis_ > 0 && millis_ % MILLIS_PER_DAY == 0) {
        return std::to_string(millis_ / MILLIS_PER_DAY) + "d";
    }
    if (millis_ > 0 && millis_ % MILLIS_PER_HOUR == 0) {
        return std::to_string(millis_ / MILLIS_PER_HOUR) + "h";
    }
    if (millis_ > 0 && millis_ % MILLIS_PER_MINUTE == 0) {
        return std::to_string(millis_ / MILLIS_PER_MINUTE) + "m";
    }
    return std::to_string(millis_) + "ms";
}

}  // namespace histshard
