#include "strategy/StrategyConfig.h"

#include <algorithm>
#include <cctype>

namespace daypick {
namespace strategy {

const char* toString(FallbackMode mode) {
    switch (mode) {
        case FallbackMode::STRICT: return "strict";
        case FallbackMode::PERCENTILE: return "percentile";
        case FallbackMode::PERMISSIVE: return "permissive";
    }
    return "strict";
}

std::optional<FallbackMode> parseFallbackMode(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "strict") return FallbackMode::STRICT;
    if (s == "percentile") return FallbackMode::PERCENTILE;
    // "demo" is the legacy name of the permissive switch
    if (s == "permissive" || s == "demo") return FallbackMode::PERMISSIVE;
    return std::nullopt;
}

} // namespace strategy
} // namespace daypick
