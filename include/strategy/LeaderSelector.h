#pragma once

#include <map>
#include <vector>
#include "strategy/StockSnapshot.h"
#include "strategy/StrategyConfig.h"

namespace daypick {
namespace strategy {

// 강세 섹터 내 주도주 선정
class LeaderSelector {
public:
    LeaderSelector(const LeaderConfig& config, FallbackMode mode);

    // pct_change, vol ratio, 20-day high and intraday position all pass
    bool isLeader(const StockSnapshot& s) const;

    double score(const StockSnapshot& s) const;

    // Per sector: strict leaders, or a fallback tier when the sector has
    // none and the mode allows it. Ranked by score and cut to
    // top_n_per_sector. Output grouped by sector_id, best first.
    std::vector<LeaderPick> select(const std::vector<StockSnapshot>& universe) const;

    // First (best) leader of each sector
    static std::map<SectorId, LeaderPick> bestLeaderBySector(const std::vector<LeaderPick>& leaders);

private:
    std::vector<size_t> fallbackCandidates(const std::vector<StockSnapshot>& universe,
                                           const std::vector<size_t>& sector_rows) const;

    LeaderConfig config_;
    FallbackMode mode_;
};

} // namespace strategy
} // namespace daypick
