#include "analytics/FeatureCalculator.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace daypick {
namespace analytics {

Nullable FeatureCalculator::intradayPosition(const DailyBar& bar) {
    if (!bar.close || !bar.high || !bar.low) {
        return std::nullopt;
    }
    const double range = *bar.high - *bar.low;
    if (range == 0.0 || !std::isfinite(range)) {
        return std::nullopt;
    }
    return (*bar.close - *bar.low) / range;
}

std::vector<DailyFeatures> FeatureCalculator::computeDailyFeatures(const std::vector<DailyBar>& history) {
    std::map<StockId, std::vector<const DailyBar*>> by_stock;
    for (const auto& bar : history) {
        by_stock[bar.stock_id].push_back(&bar);
    }

    std::vector<DailyFeatures> out;
    out.reserve(history.size());

    for (auto& [stock_id, bars] : by_stock) {
        std::stable_sort(bars.begin(), bars.end(), [](const DailyBar* a, const DailyBar* b) {
            return a->trade_date < b->trade_date;
        });

        std::vector<Nullable> closes, highs, volumes;
        closes.reserve(bars.size());
        highs.reserve(bars.size());
        volumes.reserve(bars.size());
        for (const DailyBar* bar : bars) {
            closes.push_back(bar->close);
            highs.push_back(bar->high);
            volumes.push_back(bar->volume);
        }

        const auto ma5 = TechnicalIndicators::rollingMean(closes, MA_SHORT);
        const auto ma10 = TechnicalIndicators::rollingMean(closes, MA_MID);
        const auto ma20 = TechnicalIndicators::rollingMean(closes, MA_LONG);
        const auto vol_avg = TechnicalIndicators::rollingMean(volumes, VOLUME_WINDOW);
        const auto high_20d = TechnicalIndicators::rollingMax(highs, HIGH_WINDOW);

        for (size_t i = 0; i < bars.size(); ++i) {
            const DailyBar& bar = *bars[i];

            DailyFeatures f;
            f.trade_date = bar.trade_date;
            f.stock_id = stock_id;
            f.ma_5 = ma5[i];
            f.ma_10 = ma10[i];
            f.ma_20 = ma20[i];
            f.vol_20d_avg = vol_avg[i];
            f.high_20d = high_20d[i];

            if (bar.volume && vol_avg[i] && *vol_avg[i] > 0.0) {
                f.vol_ratio_20d = *bar.volume / *vol_avg[i];
            }

            if (bar.close && high_20d[i]) {
                f.is_20d_high = *bar.close >= *high_20d[i];
                if (*high_20d[i] != 0.0) {
                    f.distance_to_20d_high = (*high_20d[i] - *bar.close) / *high_20d[i];
                }
            }

            f.pos_in_day = intradayPosition(bar);
            out.push_back(std::move(f));
        }
    }
    return out;
}

std::map<StockId, DailyFeatures> FeatureCalculator::featuresOn(const std::vector<DailyFeatures>& features,
                                                              const TradeDate& trade_date) {
    std::map<StockId, DailyFeatures> out;
    for (const auto& f : features) {
        if (f.trade_date == trade_date) {
            out[f.stock_id] = f;
        }
    }
    return out;
}

} // namespace analytics
} // namespace daypick
