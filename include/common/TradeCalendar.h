#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace daypick {
namespace utils {

// ISO date helpers (proleptic Gregorian, no time zone)
class TradeCalendar {
public:
    // "YYYY-MM-DD" → days since 1970-01-01
    static std::optional<long long> toDays(const std::string& iso_date);
    static TradeDate fromDays(long long days);
    
    static bool isValid(const std::string& iso_date) { return toDays(iso_date).has_value(); }
    
    // 0 = Sunday ... 6 = Saturday
    static int weekday(long long days);
    
    // The last `count` Monday–Friday dates ending at (and including,
    // if it is a weekday) `asof`, ascending
    static std::vector<TradeDate> businessDaysEnding(const TradeDate& asof, int count);
};

} // namespace utils
} // namespace daypick
