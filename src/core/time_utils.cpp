// src/core/time_utils.cpp

#include "chain_risk/core/time_utils.hpp"
#include <cstdio>

namespace chain_risk {
namespace core {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
long long days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<long long>(era) * 146097 + static_cast<long long>(doe) - 719468;
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

}  // anonymous namespace

Result<std::chrono::system_clock::time_point> parse_date_utc(const std::string& date) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char trailing = '\0';

    if (date.size() != 10 ||
        std::sscanf(date.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &trailing) != 3) {
        return make_error<std::chrono::system_clock::time_point>(
            ErrorCode::INVALID_ARGUMENT, "Expected YYYY-MM-DD date, got '" + date + "'",
            "TimeUtils");
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return make_error<std::chrono::system_clock::time_point>(
            ErrorCode::INVALID_ARGUMENT, "Date out of range: '" + date + "'", "TimeUtils");
    }

    const auto days = days_from_civil(year, month, day);
    return std::chrono::system_clock::time_point(std::chrono::hours(24 * days));
}

Result<int> days_until(const std::string& expiry_date,
                       std::chrono::system_clock::time_point from) {
    auto expiry = parse_date_utc(expiry_date);
    if (expiry.is_error()) {
        return forward_error<int>(*expiry.error(), "TimeUtils");
    }
    const auto hours = std::chrono::duration_cast<std::chrono::hours>(expiry.value() - from);
    return static_cast<int>(hours.count() / 24);
}

}  // namespace core
}  // namespace chain_risk
