#pragma once

#include <vector>
#include "common/Types.h"

namespace daypick {
namespace backtest {

struct SyntheticMarketConfig {
    int num_stocks = 220;
    int num_sectors = 12;
    int history_days = 40;
    unsigned int seed = 7;
};

struct SyntheticMarket {
    std::vector<StockMeta> stock_meta;
    std::vector<DailyBar> daily_price;
};

// 데모용 가상 시장 데이터 (seed 고정 시 결정적)
class SyntheticMarketGenerator {
public:
    // Business-day calendar ending at `asof`; sector drift plus stock
    // noise drives each close, OHLC/volume/turnover follow the return.
    static SyntheticMarket generate(const TradeDate& asof, const SyntheticMarketConfig& config);
};

} // namespace backtest
} // namespace daypick
