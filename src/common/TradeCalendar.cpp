#include "common/TradeCalendar.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace daypick {
namespace utils {

namespace {
// civil ↔ days conversions after H. Hinnant's chrono algorithms
long long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + static_cast<int>(era * 400) + (m <= 2);
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}
}

std::optional<long long> TradeCalendar::toDays(const std::string& iso_date) {
    if (iso_date.size() != 10 || iso_date[4] != '-' || iso_date[7] != '-') {
        return std::nullopt;
    }
    for (size_t i = 0; i < iso_date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (iso_date[i] < '0' || iso_date[i] > '9') return std::nullopt;
    }
    const int y = std::stoi(iso_date.substr(0, 4));
    const unsigned m = static_cast<unsigned>(std::stoi(iso_date.substr(5, 2)));
    const unsigned d = static_cast<unsigned>(std::stoi(iso_date.substr(8, 2)));
    
    static const unsigned kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12 || d < 1) {
        return std::nullopt;
    }
    const unsigned limit = (m == 2 && isLeap(y)) ? 29 : kDaysInMonth[m - 1];
    if (d > limit) {
        return std::nullopt;
    }
    return daysFromCivil(y, m, d);
}

TradeDate TradeCalendar::fromDays(long long days) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(days, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

int TradeCalendar::weekday(long long days) {
    return static_cast<int>(days >= -4 ? (days + 4) % 7 : (days + 5) % 7 + 6);
}

std::vector<TradeDate> TradeCalendar::businessDaysEnding(const TradeDate& asof, int count) {
    auto start = toDays(asof);
    if (!start) {
        throw std::invalid_argument("invalid date: " + asof);
    }
    std::vector<TradeDate> out;
    for (long long day = *start; static_cast<int>(out.size()) < count; --day) {
        const int wd = weekday(day);
        if (wd != 0 && wd != 6) {
            out.push_back(fromDays(day));
        }
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace utils
} // namespace daypick
