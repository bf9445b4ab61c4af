#pragma once

#include "common/Types.h"

namespace daypick {
namespace strategy {

// One eligible stock on the evaluation date inside a strong sector,
// joined with its features and sector-relative z-scores.
struct StockSnapshot {
    DailyBar bar;
    DailyFeatures features;
    SectorId sector_id;
    double sector_score = 0.0;
    Nullable pct_change_z;      // z within the sector's candidate set
    Nullable vol_ratio_z;
};

struct LeaderPick {
    size_t row = 0;             // index into the snapshot set
    StockId stock_id;
    SectorId sector_id;
    double score_leader = 0.0;
    bool from_fallback = false;
};

struct FollowerPick {
    size_t row = 0;
    StockId stock_id;
    SectorId sector_id;
    double score_follow = 0.0;
    bool from_fallback = false;
};

} // namespace strategy
} // namespace daypick
