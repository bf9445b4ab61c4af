#pragma once

#include <map>
#include <optional>
#include <vector>
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "strategy/StockSnapshot.h"

namespace daypick {
namespace engine {

// Flat inputs supplied by the data collaborators
struct MarketInputs {
    std::vector<DailyBar> history;        // multi-day window ending at the evaluation date
    std::vector<StockMeta> stock_meta;
    std::vector<RiskFlags> risk_flags;    // empty == no restriction
};

struct SelectionResult {
    TradeDate trade_date;
    std::vector<CandidateRow> candidates;           // score_total descending
    std::vector<DailyFeatures> features;
    std::vector<SectorDailyAggregate> sector_daily;
    std::vector<SectorScore> strong_sectors;
};

// 섹터 모멘텀 → 주도주 → 추종주 → 수량 산정 파이프라인
// Stateless across calls: each evaluation date is a pure function of
// its inputs and the configuration.
class SelectionEngine {
public:
    explicit SelectionEngine(const EngineConfig& config);
    
    SelectionResult run(const TradeDate& trade_date, const MarketInputs& inputs) const;
    
    // Previous distinct trade_date present in the history
    static std::optional<TradeDate> previousTradeDate(const std::vector<DailyBar>& history,
                                                      const TradeDate& trade_date);
    
    const EngineConfig& config() const { return config_; }
    
private:
    std::vector<strategy::StockSnapshot> buildSnapshots(
        const TradeDate& trade_date,
        const std::vector<DailyBar>& eligible_history,
        const std::vector<DailyFeatures>& features,
        const std::map<StockId, StockMeta>& meta,
        const std::vector<SectorScore>& strong_sectors) const;
    
    EngineConfig config_;
};

} // namespace engine
} // namespace daypick
