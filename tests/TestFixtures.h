#pragma once

#include "common/Config.h"
#include "common/TradeCalendar.h"
#include "common/Types.h"
#include "engine/SelectionEngine.h"

#include <cmath>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace daypick {
namespace testing {

inline bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

inline nlohmann::json baseConfigJson() {
    return nlohmann::json::parse(R"({
        "universe": {"min_turnover": 1.0e7, "min_price": 10.0, "max_price": 2000.0},
        "sector": {
            "mtm_lookback": 5,
            "thresh_avg_pct": 3.0,
            "thresh_up_ratio": 0.6,
            "thresh_mtm_z": 1.0,
            "weights": {"avg_pct_change_z": 1.0, "sector_mtm_z": 1.0, "up_ratio": 1.0}
        },
        "leader": {
            "thresh_leader_pct": 7.0,
            "thresh_leader_vol_ratio": 2.0,
            "thresh_leader_pos": 0.9,
            "top_n_per_sector": 2,
            "weights": {"pct_change_z": 1.0, "vol_ratio_z": 1.0, "pos_in_day": 1.0}
        },
        "follower": {
            "pct_change_min": 2.0,
            "pct_change_max": 6.0,
            "vol_ratio_min": 1.2,
            "vol_ratio_max": 2.0,
            "thresh_dist_20d_high": 0.05,
            "weights": {"pct_change_z": 1.0, "vol_ratio_z": 1.0,
                        "one_minus_dist_20d_high": 1.0, "pos_in_day": 1.0}
        },
        "total_score_weights": {"score_sector": 1.0, "score_leader": 1.0, "score_follow": 1.0},
        "position_sizing": {
            "capital": 1000000.0,
            "risk_per_trade": 0.01,
            "max_position_pct": 0.2,
            "stop_buffer_pct": 0.01
        }
    })");
}

inline engine::EngineConfig baseConfig() {
    return Config::parseEngineConfig(baseConfigJson());
}

inline DailyBar makeBar(const TradeDate& date, const StockId& id,
                        double open, double high, double low, double close,
                        double pct, double volume, double turnover = 1.0e8) {
    DailyBar bar;
    bar.trade_date = date;
    bar.stock_id = id;
    bar.open = open;
    bar.high = high;
    bar.low = low;
    bar.close = close;
    bar.pct_change = pct;
    bar.volume = volume;
    bar.turnover = turnover;
    return bar;
}

inline std::string stockId(char sector, int i) {
    return std::string(1, sector) + (i < 10 ? "0" : "") + std::to_string(i);
}

inline std::vector<TradeDate> scenarioDates() {
    return utils::TradeCalendar::businessDaysEnding("2026-03-13", 25);
}

// Three sectors (A, B, C) of ten stocks, 25 flat days except the last one:
//  - A00 breaks out (+9%, 2.3x volume, closes on the high) -> leader
//  - A01..A03 rise 4/5/3% on 1.55x volume near their high -> followers
//  - A04 flat, A05..A09 +3.8% on normal volume
//  - B and C stay flat
// Sector A: avg pct 4.0, up ratio 0.9, momentum z 2/sqrt(3).
inline engine::MarketInputs buildScenario() {
    const auto dates = scenarioDates();
    engine::MarketInputs inputs;
    
    for (char sector : {'A', 'B', 'C'}) {
        for (int i = 0; i < 10; ++i) {
            StockMeta meta;
            meta.stock_id = stockId(sector, i);
            meta.stock_name = "Name" + meta.stock_id;
            meta.market = "TWSE";
            meta.sector_id = std::string("SEC_") + sector;
            inputs.stock_meta.push_back(meta);
        }
    }
    
    for (size_t t = 0; t < dates.size(); ++t) {
        const bool last = (t + 1 == dates.size());
        for (const auto& meta : inputs.stock_meta) {
            const auto& id = meta.stock_id;
            if (!last || id[0] != 'A') {
                inputs.history.push_back(makeBar(dates[t], id, 100, 101, 99, 100, 0.0, 1000));
                continue;
            }
            if (id == "A00") {
                inputs.history.push_back(makeBar(dates[t], id, 100, 109, 100, 109, 9.0, 2500));
            } else if (id == "A01") {
                inputs.history.push_back(makeBar(dates[t], id, 100, 104.5, 100, 104, 4.0, 1600));
            } else if (id == "A02") {
                inputs.history.push_back(makeBar(dates[t], id, 100, 105.5, 100, 105, 5.0, 1600));
            } else if (id == "A03") {
                inputs.history.push_back(makeBar(dates[t], id, 100, 103.5, 100, 103, 3.0, 1600));
            } else if (id == "A04") {
                inputs.history.push_back(makeBar(dates[t], id, 100, 101, 99, 100, 0.0, 1000));
            } else {
                inputs.history.push_back(makeBar(dates[t], id, 100, 104, 99, 103.8, 3.8, 1000));
            }
        }
    }
    return inputs;
}

} // namespace testing
} // namespace daypick
