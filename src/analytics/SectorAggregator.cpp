#include "analytics/SectorAggregator.h"
#include "analytics/CrossSectional.h"
#include "analytics/TechnicalIndicators.h"
#include "common/FailClosed.h"
#include "common/Logger.h"

#include <algorithm>

namespace daypick {
namespace analytics {

namespace {
constexpr double STRONG_MOVE_PCT = 3.0;
}

SectorAggregator::SectorAggregator(const strategy::SectorConfig& config)
    : config_(config)
{
}

std::vector<SectorDailyAggregate> SectorAggregator::computeSectorDaily(
    const std::vector<DailyBar>& eligible_history,
    const std::map<StockId, StockMeta>& stock_meta) const {
    
    // 1. (date, sector) 그룹핑
    std::map<std::pair<TradeDate, SectorId>, std::vector<Nullable>> groups;
    for (const auto& bar : eligible_history) {
        auto it = stock_meta.find(bar.stock_id);
        const SectorId sector = (it != stock_meta.end()) ? it->second.sector_id : UNKNOWN_SECTOR;
        groups[{bar.trade_date, sector}].push_back(bar.pct_change);
    }
    
    std::vector<SectorDailyAggregate> out;
    out.reserve(groups.size());
    for (const auto& [key, pct] : groups) {
        SectorDailyAggregate agg;
        agg.trade_date = key.first;
        agg.sector_id = key.second;
        agg.num_stocks = static_cast<int>(pct.size());
        agg.avg_pct_change = TechnicalIndicators::calculateMean(pct);
        agg.median_pct_change = TechnicalIndicators::calculateMedian(pct);
        
        int up = 0;
        for (const auto& v : pct) {
            if (v && *v > 0.0) ++up;
            if (closed::atLeast(v, STRONG_MOVE_PCT)) ++agg.num_up_3;
        }
        agg.up_ratio = static_cast<double>(up) / static_cast<double>(pct.size());
        out.push_back(std::move(agg));
    }
    
    // 2. 섹터별 모멘텀 (최근 N일 평균 등락률)
    std::map<SectorId, std::vector<size_t>> by_sector;
    for (size_t i = 0; i < out.size(); ++i) {
        by_sector[out[i].sector_id].push_back(i);
    }
    for (const auto& [sector, rows] : by_sector) {
        // rows are already in date order (map key order)
        std::vector<Nullable> series;
        series.reserve(rows.size());
        for (size_t idx : rows) {
            series.push_back(out[idx].avg_pct_change);
        }
        const auto mtm = TechnicalIndicators::rollingMean(series, config_.mtm_lookback);
        for (size_t k = 0; k < rows.size(); ++k) {
            out[rows[k]].sector_mtm = mtm[k];
        }
    }
    
    // 3. 날짜별 섹터 간 모멘텀 z-score
    std::map<TradeDate, std::vector<size_t>> by_date;
    for (size_t i = 0; i < out.size(); ++i) {
        by_date[out[i].trade_date].push_back(i);
    }
    for (const auto& [date, rows] : by_date) {
        std::vector<Nullable> mtm;
        mtm.reserve(rows.size());
        for (size_t idx : rows) {
            mtm.push_back(out[idx].sector_mtm);
        }
        const auto z = CrossSectional::zscore(mtm);
        for (size_t k = 0; k < rows.size(); ++k) {
            out[rows[k]].sector_mtm_z = z[k];
        }
    }
    
    return out;
}

std::vector<SectorScore> SectorAggregator::scoreSectors(
    const std::vector<SectorDailyAggregate>& sector_daily,
    const TradeDate& trade_date) const {
    
    std::vector<const SectorDailyAggregate*> today;
    for (const auto& agg : sector_daily) {
        if (agg.trade_date == trade_date) {
            today.push_back(&agg);
        }
    }
    
    std::vector<Nullable> avg_pct;
    avg_pct.reserve(today.size());
    for (const auto* agg : today) {
        avg_pct.push_back(agg->avg_pct_change);
    }
    const auto avg_pct_z = CrossSectional::zscore(avg_pct);
    
    const auto& w = config_.weights;
    std::vector<SectorScore> scored;
    scored.reserve(today.size());
    for (size_t i = 0; i < today.size(); ++i) {
        SectorScore s;
        s.sector_id = today[i]->sector_id;
        s.avg_pct_change = today[i]->avg_pct_change;
        s.up_ratio = today[i]->up_ratio;
        s.sector_mtm_z = today[i]->sector_mtm_z;
        s.sector_score = w.avg_pct_change_z * closed::orDefault(avg_pct_z[i], 0.0)
                       + w.sector_mtm_z * closed::orDefault(s.sector_mtm_z, 0.0)
                       + w.up_ratio * s.up_ratio;
        scored.push_back(std::move(s));
    }
    return scored;
}

bool SectorAggregator::passesThresholds(const SectorScore& sector) const {
    return closed::atLeast(sector.avg_pct_change, config_.thresh_avg_pct)
        && sector.up_ratio >= config_.thresh_up_ratio
        && closed::atLeast(sector.sector_mtm_z, config_.thresh_mtm_z);
}

std::vector<SectorScore> SectorAggregator::selectStrongSectors(
    const std::vector<SectorScore>& scored,
    strategy::FallbackMode mode) const {
    
    std::vector<SectorScore> strong;
    for (const auto& s : scored) {
        if (passesThresholds(s)) {
            strong.push_back(s);
        }
    }
    
    if (strong.empty() && mode == strategy::FallbackMode::PERMISSIVE && !scored.empty()) {
        std::vector<SectorScore> ranked = scored;
        std::stable_sort(ranked.begin(), ranked.end(), [](const SectorScore& a, const SectorScore& b) {
            return a.sector_score > b.sector_score;
        });
        const size_t k = std::min(ranked.size(), static_cast<size_t>(config_.fallback_top_k));
        strong.assign(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(k));
        LOG_WARN("No sector passed thresholds, permissive fallback took top {} by sector score", k);
    }
    
    return strong;
}

} // namespace analytics
} // namespace daypick
