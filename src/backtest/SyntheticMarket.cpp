#include "backtest/SyntheticMarket.h"
#include "common/Logger.h"
#include "common/TradeCalendar.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <random>

namespace daypick {
namespace backtest {

SyntheticMarket SyntheticMarketGenerator::generate(const TradeDate& asof, const SyntheticMarketConfig& config) {
    std::mt19937 rng(config.seed);
    std::uniform_int_distribution<int> sector_pick(0, config.num_sectors - 1);
    std::bernoulli_distribution is_twse(0.7);
    std::uniform_real_distribution<double> base_price_dist(18.0, 220.0);
    std::uniform_real_distribution<double> base_turnover_dist(1.5e7, 2.5e8);
    std::normal_distribution<double> sector_drift(0.001, 0.02);
    std::normal_distribution<double> stock_noise(0.0, 0.025);
    std::normal_distribution<double> bar_noise(0.0, 0.01);
    std::uniform_real_distribution<double> volume_dist(2000.0, 80000.0);
    std::uniform_real_distribution<double> turnover_jitter(0.7, 1.3);
    
    SyntheticMarket market;
    std::vector<double> base_prices;
    std::vector<double> base_turnover;
    
    for (int i = 0; i < config.num_stocks; ++i) {
        StockMeta meta;
        meta.stock_id = std::to_string(1000 + i);
        meta.stock_name = "Stock" + meta.stock_id;
        meta.market = is_twse(rng) ? "TWSE" : "TPEX";
        
        char sector_buf[8];
        std::snprintf(sector_buf, sizeof(sector_buf), "S%02d", sector_pick(rng));
        meta.sector_id = sector_buf;
        
        market.stock_meta.push_back(std::move(meta));
        base_prices.push_back(base_price_dist(rng));
        base_turnover.push_back(base_turnover_dist(rng));
    }
    
    const auto dates = utils::TradeCalendar::businessDaysEnding(asof, config.history_days);
    
    // 섹터별 일간 드리프트
    std::map<SectorId, std::vector<double>> drift;
    for (int s = 0; s < config.num_sectors; ++s) {
        char sector_buf[8];
        std::snprintf(sector_buf, sizeof(sector_buf), "S%02d", s);
        auto& series = drift[sector_buf];
        series.reserve(dates.size());
        for (size_t t = 0; t < dates.size(); ++t) {
            series.push_back(sector_drift(rng));
        }
    }
    
    std::vector<double> prev_close = base_prices;
    market.daily_price.reserve(dates.size() * static_cast<size_t>(config.num_stocks));
    
    for (size_t t = 0; t < dates.size(); ++t) {
        for (int i = 0; i < config.num_stocks; ++i) {
            const auto& meta = market.stock_meta[static_cast<size_t>(i)];
            const double ret = drift[meta.sector_id][t] + stock_noise(rng);
            const double prev = prev_close[static_cast<size_t>(i)];
            
            const double close = std::max(2.0, prev * (1.0 + ret));
            const double open = close * (1.0 + bar_noise(rng));
            const double high = std::max(open, close) * (1.0 + std::abs(bar_noise(rng)));
            const double low = std::min(open, close) * (1.0 - std::abs(bar_noise(rng)));
            const double volume = std::floor(volume_dist(rng) * (1.0 + std::abs(ret) * 10.0));
            const double turnover = base_turnover[static_cast<size_t>(i)] * (0.4 + std::abs(ret) * 8.0)
                                  * turnover_jitter(rng);
            
            DailyBar bar;
            bar.trade_date = dates[t];
            bar.stock_id = meta.stock_id;
            bar.open = open;
            bar.high = high;
            bar.low = low;
            bar.close = close;
            bar.pct_change = (prev > 0.0) ? (close / prev - 1.0) * 100.0 : 0.0;
            bar.volume = volume;
            bar.turnover = turnover;
            market.daily_price.push_back(std::move(bar));
            
            prev_close[static_cast<size_t>(i)] = close;
        }
    }
    
    LOG_INFO("Synthetic market: {} stocks, {} sectors, {} days ending {}",
             config.num_stocks, config.num_sectors, dates.size(), asof);
    return market;
}

} // namespace backtest
} // namespace daypick
