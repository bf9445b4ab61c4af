#pragma once

#include <map>
#include <vector>
#include "common/Types.h"

namespace daypick {
namespace analytics {

// 종목별 일봉 기반 롤링 피처 계산
class FeatureCalculator {
public:
    static constexpr int MA_SHORT = 5;
    static constexpr int MA_MID = 10;
    static constexpr int MA_LONG = 20;
    static constexpr int VOLUME_WINDOW = 20;
    static constexpr int HIGH_WINDOW = 20;

    // Every stock is processed independently, ordered by trade_date.
    // Output is sorted by (stock_id, trade_date). Insufficient history
    // leaves the window features undefined; nothing is raised.
    static std::vector<DailyFeatures> computeDailyFeatures(const std::vector<DailyBar>& history);

    // Features of one evaluation date keyed by stock
    static std::map<StockId, DailyFeatures> featuresOn(const std::vector<DailyFeatures>& features,
                                                      const TradeDate& trade_date);

    // (close - low) / (high - low); undefined on a flat or incomplete bar
    static Nullable intradayPosition(const DailyBar& bar);
};

} // namespace analytics
} // namespace daypick
