#pragma once

#include <optional>
#include <string>

namespace daypick {
namespace strategy {

// Fallback policy for empty intermediate sets
enum class FallbackMode {
    STRICT,         // 폴백 없음 (운영 기본값)
    PERCENTILE,     // 리더 상위 퍼센타일 폴백만 허용
    PERMISSIVE      // 데모/드라이런: 모든 폴백 허용
};

const char* toString(FallbackMode mode);
std::optional<FallbackMode> parseFallbackMode(const std::string& text);

struct SectorWeights {
    double avg_pct_change_z = 0.0;
    double sector_mtm_z = 0.0;
    double up_ratio = 0.0;
};

struct SectorConfig {
    int mtm_lookback = 5;
    
    // Strong sector thresholds
    double thresh_avg_pct = 0.0;     // percent
    double thresh_up_ratio = 0.0;    // 0~1
    double thresh_mtm_z = 0.0;
    
    SectorWeights weights;
    
    // PERMISSIVE 모드에서만 사용 (강세 섹터 0개일 때 상위 K개)
    int fallback_top_k = 3;
};

struct LeaderWeights {
    double pct_change_z = 0.0;
    double vol_ratio_z = 0.0;
    double pos_in_day = 0.0;
};

struct LeaderConfig {
    double thresh_leader_pct = 0.0;
    double thresh_leader_vol_ratio = 0.0;
    double thresh_leader_pos = 0.0;
    int top_n_per_sector = 1;
    
    // Percentile fallback tier, explicit opt-in only
    std::optional<double> top_pct_in_sector;
    
    LeaderWeights weights;
};

struct FollowerWeights {
    double pct_change_z = 0.0;
    double vol_ratio_z = 0.0;
    double one_minus_dist_20d_high = 0.0;
    double pos_in_day = 0.0;
};

struct FollowerConfig {
    // "still moving but not yet a blow-off top"
    double pct_change_min = 0.0;
    double pct_change_max = 0.0;
    double vol_ratio_min = 0.0;
    double vol_ratio_max = 0.0;
    double thresh_dist_20d_high = 0.0;
    
    FollowerWeights weights;
};

struct TotalScoreWeights {
    double score_sector = 0.0;
    double score_leader = 0.0;
    double score_follow = 0.0;
};

} // namespace strategy
} // namespace daypick
