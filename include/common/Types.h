#pragma once

#include <string>
#include <vector>
#include <optional>

namespace daypick {

using TradeDate = std::string;   // ISO "YYYY-MM-DD", lexicographic == chronological
using StockId = std::string;
using SectorId = std::string;
using Nullable = std::optional<double>;
using NullableFlag = std::optional<bool>;

inline const SectorId UNKNOWN_SECTOR = "UNKNOWN";

// 일봉 스냅샷 (거래소 일일 리포트 1행)
struct DailyBar {
    TradeDate trade_date;
    StockId stock_id;
    Nullable open;
    Nullable high;
    Nullable low;
    Nullable close;
    Nullable pct_change;     // percent, 4.0 == +4%
    Nullable volume;
    Nullable turnover;
    bool is_limit_up = false;
    bool is_limit_down = false;
};

struct StockMeta {
    StockId stock_id;
    std::string stock_name;
    std::string market;          // TWSE / TPEX
    SectorId sector_id = UNKNOWN_SECTOR;
};

// Missing flag == no restriction
struct RiskFlags {
    StockId stock_id;
    NullableFlag is_disposed;
    NullableFlag is_full_margin;
    Nullable liquidity_score;
    NullableFlag is_blacklist;
};

// Rolling-window features, undefined until the window is full
struct DailyFeatures {
    TradeDate trade_date;
    StockId stock_id;
    Nullable ma_5;
    Nullable ma_10;
    Nullable ma_20;
    Nullable vol_20d_avg;
    Nullable vol_ratio_20d;
    Nullable high_20d;
    NullableFlag is_20d_high;
    Nullable distance_to_20d_high;
    Nullable pos_in_day;
};

struct SectorDailyAggregate {
    TradeDate trade_date;
    SectorId sector_id;
    Nullable avg_pct_change;
    Nullable median_pct_change;
    double up_ratio = 0.0;
    int num_up_3 = 0;
    int num_stocks = 0;
    Nullable sector_mtm;       // trailing mean of avg_pct_change
    Nullable sector_mtm_z;     // cross-sectional z of sector_mtm on the date
};

// 강세 섹터 (평가일 기준)
struct SectorScore {
    SectorId sector_id;
    double sector_score = 0.0;
    Nullable avg_pct_change;
    double up_ratio = 0.0;
    Nullable sector_mtm_z;
};

struct CandidateRow {
    TradeDate trade_date;
    StockId stock_id;
    StockId leader_id;
    SectorId sector_id;
    double score_sector = 0.0;
    double score_leader = 0.0;
    double score_follow = 0.0;
    double score_total = 0.0;
    Nullable suggest_entry;
    Nullable suggest_stop;
    Nullable position_value;
    std::optional<long long> shares;
    std::optional<long long> lots;
};

} // namespace daypick
