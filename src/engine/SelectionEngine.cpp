#include "engine/SelectionEngine.h"
#include "analytics/CrossSectional.h"
#include "analytics/FeatureCalculator.h"
#include "analytics/SectorAggregator.h"
#include "common/Logger.h"
#include "risk/PositionSizer.h"
#include "risk/UniverseFilter.h"
#include "strategy/FollowerSelector.h"
#include "strategy/LeaderSelector.h"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>

namespace daypick {
namespace engine {

SelectionEngine::SelectionEngine(const EngineConfig& config)
    : config_(config)
{
}

std::optional<TradeDate> SelectionEngine::previousTradeDate(const std::vector<DailyBar>& history,
                                                            const TradeDate& trade_date) {
    std::set<TradeDate> dates;
    for (const auto& bar : history) {
        dates.insert(bar.trade_date);
    }
    auto it = dates.find(trade_date);
    if (it == dates.end() || it == dates.begin()) {
        return std::nullopt;
    }
    return *std::prev(it);
}

std::vector<strategy::StockSnapshot> SelectionEngine::buildSnapshots(
    const TradeDate& trade_date,
    const std::vector<DailyBar>& eligible_history,
    const std::vector<DailyFeatures>& features,
    const std::map<StockId, StockMeta>& meta,
    const std::vector<SectorScore>& strong_sectors) const {
    
    std::map<SectorId, double> sector_scores;
    for (const auto& s : strong_sectors) {
        sector_scores[s.sector_id] = s.sector_score;
    }
    const auto features_today = analytics::FeatureCalculator::featuresOn(features, trade_date);
    
    std::vector<strategy::StockSnapshot> snapshots;
    for (const auto& bar : eligible_history) {
        if (bar.trade_date != trade_date) {
            continue;
        }
        auto meta_it = meta.find(bar.stock_id);
        const SectorId sector = (meta_it != meta.end()) ? meta_it->second.sector_id : UNKNOWN_SECTOR;
        auto score_it = sector_scores.find(sector);
        if (score_it == sector_scores.end()) {
            continue;
        }
        
        strategy::StockSnapshot s;
        s.bar = bar;
        s.sector_id = sector;
        s.sector_score = score_it->second;
        auto f_it = features_today.find(bar.stock_id);
        if (f_it != features_today.end()) {
            s.features = f_it->second;
        } else {
            s.features.trade_date = trade_date;
            s.features.stock_id = bar.stock_id;
        }
        snapshots.push_back(std::move(s));
    }
    
    // 섹터 내부 상대 비교용 z-score
    std::vector<std::string> keys;
    std::vector<Nullable> pct, vol_ratio;
    keys.reserve(snapshots.size());
    pct.reserve(snapshots.size());
    vol_ratio.reserve(snapshots.size());
    for (const auto& s : snapshots) {
        keys.push_back(s.sector_id);
        pct.push_back(s.bar.pct_change);
        vol_ratio.push_back(s.features.vol_ratio_20d);
    }
    const auto pct_z = analytics::CrossSectional::groupwiseZScore(keys, pct);
    const auto vol_z = analytics::CrossSectional::groupwiseZScore(keys, vol_ratio);
    for (size_t i = 0; i < snapshots.size(); ++i) {
        snapshots[i].pct_change_z = pct_z[i];
        snapshots[i].vol_ratio_z = vol_z[i];
    }
    return snapshots;
}

SelectionResult SelectionEngine::run(const TradeDate& trade_date, const MarketInputs& inputs) const {
    SelectionResult result;
    result.trade_date = trade_date;
    
    std::map<StockId, StockMeta> meta;
    for (const auto& m : inputs.stock_meta) {
        meta[m.stock_id] = m;
    }
    
    // 1. 피처 / 유니버스 / 섹터 집계
    result.features = analytics::FeatureCalculator::computeDailyFeatures(inputs.history);
    
    const risk::UniverseFilter universe(config_.universe, inputs.risk_flags);
    const auto eligible = universe.apply(inputs.history);
    
    const analytics::SectorAggregator aggregator(config_.sector);
    result.sector_daily = aggregator.computeSectorDaily(eligible, meta);
    
    const auto scored = aggregator.scoreSectors(result.sector_daily, trade_date);
    result.strong_sectors = aggregator.selectStrongSectors(scored, config_.fallback_mode);
    
    LOG_INFO("[{}] universe {} / {} rows, sectors {} scored, {} strong",
             trade_date, eligible.size(), inputs.history.size(), scored.size(), result.strong_sectors.size());
    
    if (result.strong_sectors.empty()) {
        LOG_INFO("[{}] no strong sector, empty candidate table", trade_date);
        return result;
    }
    
    // 2. 주도주 / 추종주
    const auto snapshots = buildSnapshots(trade_date, eligible, result.features, meta, result.strong_sectors);
    
    const strategy::LeaderSelector leader_selector(config_.leader, config_.fallback_mode);
    const auto leaders = leader_selector.select(snapshots);
    
    const strategy::FollowerSelector follower_selector(config_.follower, config_.fallback_mode);
    const auto followers = follower_selector.select(snapshots);
    
    LOG_INFO("[{}] {} stocks in strong sectors, {} leaders, {} followers",
             trade_date, snapshots.size(), leaders.size(), followers.size());
    
    if (leaders.empty() || followers.empty()) {
        LOG_INFO("[{}] empty leader or follower set, empty candidate table", trade_date);
        return result;
    }
    
    // 3. 섹터별 최상위 주도주 1개와 매칭 (1:N)
    const auto best_leader = strategy::LeaderSelector::bestLeaderBySector(leaders);
    
    std::map<StockId, Nullable> prev_low;
    const auto prev_date = previousTradeDate(inputs.history, trade_date);
    if (prev_date) {
        for (const auto& bar : inputs.history) {
            if (bar.trade_date == *prev_date) {
                prev_low[bar.stock_id] = bar.low;
            }
        }
    }
    
    const risk::PositionSizer sizer(config_.position_sizing);
    const auto& tw = config_.total_score_weights;
    
    for (const auto& follower : followers) {
        auto leader_it = best_leader.find(follower.sector_id);
        if (leader_it == best_leader.end()) {
            continue;
        }
        const strategy::StockSnapshot& s = snapshots[follower.row];
        
        CandidateRow row;
        row.trade_date = trade_date;
        row.stock_id = follower.stock_id;
        row.leader_id = leader_it->second.stock_id;
        row.sector_id = follower.sector_id;
        row.score_sector = s.sector_score;
        row.score_leader = leader_it->second.score_leader;
        row.score_follow = follower.score_follow;
        row.score_total = tw.score_sector * row.score_sector
                        + tw.score_leader * row.score_leader
                        + tw.score_follow * row.score_follow;
        
        row.suggest_entry = s.bar.close;
        auto low_it = prev_low.find(follower.stock_id);
        if (low_it != prev_low.end()) {
            row.suggest_stop = sizer.suggestStop(low_it->second);
        }
        
        const auto sizing = sizer.size(row.suggest_entry, row.suggest_stop);
        row.position_value = sizing.position_value;
        row.shares = sizing.shares;
        row.lots = sizing.lots;
        
        result.candidates.push_back(std::move(row));
    }
    
    // Equal scores keep follower order (stable)
    std::stable_sort(result.candidates.begin(), result.candidates.end(),
                     [](const CandidateRow& a, const CandidateRow& b) {
                         return a.score_total > b.score_total;
                     });
    
    LOG_INFO("[{}] {} candidates", trade_date, result.candidates.size());
    return result;
}

} // namespace engine
} // namespace daypick
