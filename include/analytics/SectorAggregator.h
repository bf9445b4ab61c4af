#pragma once

#include <map>
#include <vector>
#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace daypick {
namespace analytics {

// 섹터 모멘텀 집계 및 강세 섹터 선정
class SectorAggregator {
public:
    explicit SectorAggregator(const strategy::SectorConfig& config);

    // Per (trade_date, sector) aggregates over the eligible universe.
    // Stocks without metadata land in UNKNOWN_SECTOR. Sorted by
    // (trade_date, sector_id).
    std::vector<SectorDailyAggregate> computeSectorDaily(
        const std::vector<DailyBar>& eligible_history,
        const std::map<StockId, StockMeta>& stock_meta) const;

    // Composite score of every sector present on the date
    std::vector<SectorScore> scoreSectors(
        const std::vector<SectorDailyAggregate>& sector_daily,
        const TradeDate& trade_date) const;

    // Threshold filter; when nothing passes and the mode is PERMISSIVE,
    // the top fallback_top_k sectors by composite score are taken instead.
    std::vector<SectorScore> selectStrongSectors(
        const std::vector<SectorScore>& scored,
        strategy::FallbackMode mode) const;

    bool passesThresholds(const SectorScore& sector) const;

private:
    strategy::SectorConfig config_;
};

} // namespace analytics
} // namespace daypick
