#pragma once

#include <vector>
#include <string>
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/SelectionEngine.h"

namespace daypick {
namespace backtest {

struct BacktestConfig {
    int max_positions = 5;
    int hold_days = 2;
};

// Re-runs the selection engine once per simulated day.
// Entry at the next day's open, exit at the close hold_days later.
class BacktestEngine {
public:
    BacktestEngine(const engine::EngineConfig& engine_config, const BacktestConfig& config);

    struct EquityPoint {
        TradeDate trade_date;
        double equity = 0.0;
        int num_trades = 0;
        double pnl = 0.0;
    };

    struct Result {
        std::vector<EquityPoint> curve;
        double initial_capital = 0.0;
        double final_equity = 0.0;
        double total_pnl = 0.0;
        double max_drawdown = 0.0;      // fraction of the running peak
        int total_trades = 0;
        int days_without_candidates = 0;
    };

    Result run(const TradeDate& start_date,
               const TradeDate& end_date,
               const engine::MarketInputs& inputs) const;

private:
    engine::EngineConfig engine_config_;
    BacktestConfig config_;
};

} // namespace backtest
} // namespace daypick
