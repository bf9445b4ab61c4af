#include "backtest/BacktestEngine.h"
#include "common/Logger.h"

#include <algorithm>
#include <map>
#include <set>

namespace daypick {
namespace backtest {

namespace {
using PriceKey = std::pair<TradeDate, StockId>;

Nullable priceOf(const std::map<PriceKey, const DailyBar*>& index,
                 const TradeDate& date, const StockId& stock_id, bool use_open) {
    auto it = index.find({date, stock_id});
    if (it == index.end()) {
        return std::nullopt;
    }
    return use_open ? it->second->open : it->second->close;
}
}

BacktestEngine::BacktestEngine(const engine::EngineConfig& engine_config, const BacktestConfig& config)
    : engine_config_(engine_config)
    , config_(config)
{
}

BacktestEngine::Result BacktestEngine::run(const TradeDate& start_date,
                                           const TradeDate& end_date,
                                           const engine::MarketInputs& inputs) const {
    std::set<TradeDate> all_dates;
    std::map<PriceKey, const DailyBar*> price_index;
    for (const auto& bar : inputs.history) {
        all_dates.insert(bar.trade_date);
        price_index[{bar.trade_date, bar.stock_id}] = &bar;
    }
    
    std::vector<TradeDate> dates;
    for (const auto& d : all_dates) {
        if (d >= start_date && d <= end_date) {
            dates.push_back(d);
        }
    }
    
    Result result;
    result.initial_capital = engine_config_.position_sizing.capital;
    double equity = result.initial_capital;
    double peak = equity;
    
    LOG_INFO("Backtest {} ~ {}: {} trading days, capital {:.0f}",
             start_date, end_date, dates.size(), equity);
    
    for (size_t i = 0; i + 1 < dates.size(); ++i) {
        const TradeDate& d = dates[i];
        const TradeDate& next_d = dates[i + 1];
        
        // 당일까지의 이력만 사용, 자본은 현재 평가금으로 교체
        engine::EngineConfig day_config = engine_config_;
        day_config.position_sizing.capital = equity;
        
        engine::MarketInputs day_inputs;
        day_inputs.stock_meta = inputs.stock_meta;
        day_inputs.risk_flags = inputs.risk_flags;
        for (const auto& bar : inputs.history) {
            if (bar.trade_date <= d) {
                day_inputs.history.push_back(bar);
            }
        }
        
        const engine::SelectionEngine selector(day_config);
        const auto selection = selector.run(d, day_inputs);
        
        EquityPoint point;
        point.trade_date = next_d;
        
        const size_t pick_count = std::min(selection.candidates.size(),
                                           static_cast<size_t>(config_.max_positions));
        if (pick_count == 0) {
            ++result.days_without_candidates;
        }
        
        const TradeDate& exit_date = dates[std::min(i + 1 + static_cast<size_t>(config_.hold_days), dates.size() - 1)];
        
        for (size_t k = 0; k < pick_count; ++k) {
            const CandidateRow& row = selection.candidates[k];
            if (!row.shares || *row.shares <= 0) {
                continue;
            }
            const Nullable entry_px = priceOf(price_index, next_d, row.stock_id, true);
            const Nullable exit_px = priceOf(price_index, exit_date, row.stock_id, false);
            if (!entry_px || !exit_px) {
                continue;
            }
            point.pnl += (*exit_px - *entry_px) * static_cast<double>(*row.shares);
            ++point.num_trades;
        }
        
        equity += point.pnl;
        point.equity = equity;
        result.total_trades += point.num_trades;
        result.curve.push_back(point);
        
        peak = std::max(peak, equity);
        if (peak > 0.0) {
            result.max_drawdown = std::max(result.max_drawdown, (peak - equity) / peak);
        }
    }
    
    result.final_equity = equity;
    result.total_pnl = equity - result.initial_capital;
    
    LOG_INFO("Backtest done: final equity {:.0f}, trades {}, MDD {:.2f}%",
             result.final_equity, result.total_trades, result.max_drawdown * 100.0);
    return result;
}

} // namespace backtest
} // namespace daypick
