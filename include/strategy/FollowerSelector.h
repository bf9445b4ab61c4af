#pragma once

#include <vector>
#include "strategy/StockSnapshot.h"
#include "strategy/StrategyConfig.h"

namespace daypick {
namespace strategy {

// 주도주를 뒤따르는 추종주 선정 및 점수화
class FollowerSelector {
public:
    FollowerSelector(const FollowerConfig& config, FallbackMode mode);

    // pct_change band, vol ratio band, close above MA5 and MA20,
    // distance to the 20-day high under the ceiling
    bool isFollower(const StockSnapshot& s) const;

    // pct_change band only (permissive relaxation)
    bool isRelaxedFollower(const StockSnapshot& s) const;

    double score(const StockSnapshot& s) const;

    // Strict followers in input order; when none exist at all and the
    // mode is PERMISSIVE, the relaxed predicate is used instead.
    std::vector<FollowerPick> select(const std::vector<StockSnapshot>& universe) const;

private:
    FollowerConfig config_;
    FallbackMode mode_;
};

} // namespace strategy
} // namespace daypick
