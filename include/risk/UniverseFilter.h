#pragma once

#include <map>
#include <vector>
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace daypick {
namespace risk {

// Eligibility predicates applied before any ranking.
// Price/turnover rules fail closed on missing values; risk flags are
// optional and an absent flag never restricts a stock.
class UniverseFilter {
public:
    enum class Rejection {
        NONE,
        TURNOVER,
        MIN_PRICE,
        MAX_PRICE,
        DISPOSED,
        FULL_MARGIN,
        BLACKLIST
    };

    explicit UniverseFilter(const engine::UniverseConfig& config,
                            const std::vector<RiskFlags>& risk_flags = {});

    // First failing predicate in evaluation order, NONE when eligible
    Rejection check(const DailyBar& bar) const;
    bool isEligible(const DailyBar& bar) const { return check(bar) == Rejection::NONE; }

    // Order-preserving; idempotent
    std::vector<DailyBar> apply(const std::vector<DailyBar>& rows) const;

    static const char* toString(Rejection reason);

private:
    engine::UniverseConfig config_;
    std::map<StockId, RiskFlags> risk_flags_;
};

} // namespace risk
} // namespace daypick
