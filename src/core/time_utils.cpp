// src/core/time_utils.cpp

#include "histshard/core/time_utils.hpp"
#include <cctype>
#include <cstdio>

namespace histshard {
namespace core {

namespace {
constexpr int64_t MILLIS_PER_DAY = 86400000;

// Floor division for negative epoch values
int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}
}  // anonymous namespace

int64_t days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

Timestamp make_date(int year, unsigned month, unsigned day) {
    return from_epoch_ms(days_from_civil(year, month, day) * MILLIS_PER_DAY);
}

Timestamp make_timestamp(int year, unsigned month, unsigned day, int hour, int minute,
                         int second, int millis) {
    int64_t ms = days_from_civil(year, month, day) * MILLIS_PER_DAY;
    ms += static_cast<int64_t>(hour) * 3600000 + static_cast<int64_t>(minute) * 60000 +
          static_cast<int64_t>(second) * 1000 + millis;
    return from_epoch_ms(ms);
}

Result<Timestamp> parse_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Expected date as YYYY-MM-DD, got '" + text + "'",
                                     "TimeUtils");
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7)
            continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                         "Non-numeric date component in '" + text + "'",
                                         "TimeUtils");
        }
    }

    int year = std::stoi(text.substr(0, 4));
    unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Date out of range: '" + text + "'", "TimeUtils");
    }

    return Result<Timestamp>(make_date(year, month, day));
}

Timestamp floor_to_day(const Timestamp& ts) {
    return from_epoch_ms(floor_div(to_epoch_ms(ts), MILLIS_PER_DAY) * MILLIS_PER_DAY);
}

int64_t days_between(const Timestamp& from, const Timestamp& to) {
    return floor_div(to_epoch_ms(to), MILLIS_PER_DAY) - floor_div(to_epoch_ms(from), MILLIS_PER_DAY);
}

std::string format_date(const Timestamp& ts) {
    std::time_t seconds =
        static_cast<std::time_t>(floor_div(to_epoch_ms(ts), 1000));
    std::tm time_info;
    if (!safe_gmtime(&seconds, &time_info)) {
        return "";
    }
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &time_info);
    return std::string(buffer);
}

std::string format_timestamp(const Timestamp& ts) {
    int64_t ms = to_epoch_ms(ts);
    std::time_t seconds = static_cast<std::time_t>(floor_div(ms, 1000));
    int millis = static_cast<int>(ms - static_cast<int64_t>(seconds) * 1000);

    std::tm time_info;
    if (!safe_gmtime(&seconds, &time_info)) {
        return "";
    }
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &time_info);

    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, millis);
    return std::string(result);
}

}  // namespace core
}  // namespace histshard
