#pragma once

#include <string>
#include <vector>
#include <map>
#include "common/Types.h"

namespace daypick {
namespace backtest {

// CSV loaders/writers around the selection engine
class DataHistory {
public:
    struct MarketHistory {
        std::vector<StockMeta> stock_meta;   // from the latest file
        std::vector<DailyBar> daily_price;
    };

    // One exchange daily report. Header-addressed columns; "date" is
    // accepted for trade_date and missing cells become undefined.
    static std::vector<DailyBar> loadDailyBarsCSV(const std::string& file_path);

    // market_YYYY-MM-DD.csv files up to end_date, last history_days kept.
    // Throws std::runtime_error when nothing qualifies.
    static MarketHistory loadMarketHistory(const std::string& market_dir,
                                           const TradeDate& end_date,
                                           int history_days);

    // stock_id,themes → first ';'-separated theme
    static std::map<StockId, SectorId> loadThemesMapping(const std::string& file_path);

    // Overwrites sector_id; unmapped stocks become UNKNOWN
    static void applySectorMapping(std::vector<StockMeta>& stock_meta,
                                   const std::map<StockId, SectorId>& mapping);

    // stock_id, stock_name|name, market, <sector_column>
    static std::vector<StockMeta> loadStockMeta(const std::string& file_path,
                                                const std::string& sector_column);

    static std::vector<RiskFlags> loadRiskFlags(const std::string& file_path);

    // Header is always written, also for an empty table
    static void writeCandidatesCSV(const std::string& file_path,
                                   const std::vector<CandidateRow>& rows,
                                   const std::vector<StockMeta>& stock_meta);

    static void writeStrongSectorsCSV(const std::string& file_path,
                                      const std::vector<SectorScore>& sectors);

    static const std::vector<std::string>& candidateColumns();
};

} // namespace backtest
} // namespace daypick
