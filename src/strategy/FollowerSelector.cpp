#include "strategy/FollowerSelector.h"
#include "common/FailClosed.h"
#include "common/Logger.h"

namespace daypick {
namespace strategy {

FollowerSelector::FollowerSelector(const FollowerConfig& config, FallbackMode mode)
    : config_(config)
    , mode_(mode)
{
}

bool FollowerSelector::isRelaxedFollower(const StockSnapshot& s) const {
    return closed::between(s.bar.pct_change, config_.pct_change_min, config_.pct_change_max);
}

bool FollowerSelector::isFollower(const StockSnapshot& s) const {
    return isRelaxedFollower(s)
        && closed::between(s.features.vol_ratio_20d, config_.vol_ratio_min, config_.vol_ratio_max)
        && closed::above(s.bar.close, s.features.ma_5)
        && closed::above(s.bar.close, s.features.ma_20)
        && closed::atMost(s.features.distance_to_20d_high, config_.thresh_dist_20d_high);
}

double FollowerSelector::score(const StockSnapshot& s) const {
    const auto& w = config_.weights;
    // missing distance counts as a full 100% below the high
    const double one_minus_dist = 1.0 - closed::orDefault(s.features.distance_to_20d_high, 1.0);
    return w.pct_change_z * closed::orDefault(s.pct_change_z, 0.0)
         + w.vol_ratio_z * closed::orDefault(s.vol_ratio_z, 0.0)
         + w.one_minus_dist_20d_high * one_minus_dist
         + w.pos_in_day * closed::orDefault(s.features.pos_in_day, 0.0);
}

std::vector<FollowerPick> FollowerSelector::select(const std::vector<StockSnapshot>& universe) const {
    std::vector<size_t> rows;
    for (size_t i = 0; i < universe.size(); ++i) {
        if (isFollower(universe[i])) {
            rows.push_back(i);
        }
    }
    
    bool from_fallback = false;
    if (rows.empty() && mode_ == FallbackMode::PERMISSIVE) {
        for (size_t i = 0; i < universe.size(); ++i) {
            if (isRelaxedFollower(universe[i])) {
                rows.push_back(i);
            }
        }
        from_fallback = !rows.empty();
        if (from_fallback) {
            LOG_WARN("No strict follower, permissive fallback relaxed MA/distance rules ({} stocks)", rows.size());
        }
    }
    
    std::vector<FollowerPick> followers;
    followers.reserve(rows.size());
    for (size_t row : rows) {
        FollowerPick pick;
        pick.row = row;
        pick.stock_id = universe[row].bar.stock_id;
        pick.sector_id = universe[row].sector_id;
        pick.score_follow = score(universe[row]);
        pick.from_fallback = from_fallback;
        followers.push_back(std::move(pick));
    }
    return followers;
}

} // namespace strategy
} // namespace daypick
