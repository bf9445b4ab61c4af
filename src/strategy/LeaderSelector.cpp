#include "strategy/LeaderSelector.h"
#include "common/FailClosed.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace daypick {
namespace strategy {

namespace {
// pct_change descending, undefined or non-finite last, ties in input order
std::vector<size_t> rankByPctChange(const std::vector<StockSnapshot>& universe,
                                    std::vector<size_t> rows) {
    std::stable_sort(rows.begin(), rows.end(), [&](size_t a, size_t b) {
        const Nullable& pa = universe[a].bar.pct_change;
        const Nullable& pb = universe[b].bar.pct_change;
        const bool da = pa && std::isfinite(*pa);
        const bool db = pb && std::isfinite(*pb);
        if (da && db) return *pa > *pb;
        return da && !db;
    });
    return rows;
}
}

LeaderSelector::LeaderSelector(const LeaderConfig& config, FallbackMode mode)
    : config_(config)
    , mode_(mode)
{
}

bool LeaderSelector::isLeader(const StockSnapshot& s) const {
    return closed::atLeast(s.bar.pct_change, config_.thresh_leader_pct)
        && closed::atLeast(s.features.vol_ratio_20d, config_.thresh_leader_vol_ratio)
        && closed::isSet(s.features.is_20d_high)
        && closed::atLeast(s.features.pos_in_day, config_.thresh_leader_pos);
}

double LeaderSelector::score(const StockSnapshot& s) const {
    const auto& w = config_.weights;
    return w.pct_change_z * closed::orDefault(s.pct_change_z, 0.0)
         + w.vol_ratio_z * closed::orDefault(s.vol_ratio_z, 0.0)
         + w.pos_in_day * closed::orDefault(s.features.pos_in_day, 0.0);
}

std::vector<size_t> LeaderSelector::fallbackCandidates(const std::vector<StockSnapshot>& universe,
                                                       const std::vector<size_t>& sector_rows) const {
    if (mode_ == FallbackMode::STRICT) {
        return {};
    }
    
    auto ranked = rankByPctChange(universe, sector_rows);
    
    // Tier (a): top percentile of the sector, at least one stock
    if (config_.top_pct_in_sector && *config_.top_pct_in_sector > 0.0) {
        const double raw = std::nearbyint(static_cast<double>(ranked.size()) * *config_.top_pct_in_sector);
        const size_t cut = std::max<size_t>(1, static_cast<size_t>(raw));
        ranked.resize(std::min(cut, ranked.size()));
        return ranked;
    }
    
    // Tier (b): whole sector, permissive only
    if (mode_ == FallbackMode::PERMISSIVE) {
        return ranked;
    }
    return {};
}

std::vector<LeaderPick> LeaderSelector::select(const std::vector<StockSnapshot>& universe) const {
    std::map<SectorId, std::vector<size_t>> by_sector;
    for (size_t i = 0; i < universe.size(); ++i) {
        by_sector[universe[i].sector_id].push_back(i);
    }
    
    std::vector<LeaderPick> leaders;
    for (const auto& [sector, rows] : by_sector) {
        std::vector<size_t> picked;
        for (size_t row : rows) {
            if (isLeader(universe[row])) {
                picked.push_back(row);
            }
        }
        
        bool from_fallback = false;
        if (picked.empty()) {
            picked = fallbackCandidates(universe, rows);
            from_fallback = !picked.empty();
            if (from_fallback) {
                LOG_WARN("Sector {} has no strict leader, {} fallback kept {} stocks",
                         sector, toString(mode_), picked.size());
            }
        }
        
        std::vector<LeaderPick> sector_leaders;
        sector_leaders.reserve(picked.size());
        for (size_t row : picked) {
            LeaderPick pick;
            pick.row = row;
            pick.stock_id = universe[row].bar.stock_id;
            pick.sector_id = sector;
            pick.score_leader = score(universe[row]);
            pick.from_fallback = from_fallback;
            sector_leaders.push_back(std::move(pick));
        }
        
        std::stable_sort(sector_leaders.begin(), sector_leaders.end(),
                         [](const LeaderPick& a, const LeaderPick& b) {
                             return a.score_leader > b.score_leader;
                         });
        if (sector_leaders.size() > static_cast<size_t>(config_.top_n_per_sector)) {
            sector_leaders.resize(static_cast<size_t>(config_.top_n_per_sector));
        }
        
        LOG_DEBUG("Sector {}: {} leader(s)", sector, sector_leaders.size());
        leaders.insert(leaders.end(), sector_leaders.begin(), sector_leaders.end());
    }
    return leaders;
}

std::map<SectorId, LeaderPick> LeaderSelector::bestLeaderBySector(const std::vector<LeaderPick>& leaders) {
    std::map<SectorId, LeaderPick> best;
    for (const auto& pick : leaders) {
        auto it = best.find(pick.sector_id);
        if (it == best.end() || pick.score_leader > it->second.score_leader) {
            best[pick.sector_id] = pick;
        }
    }
    return best;
}

} // namespace strategy
} // namespace daypick
