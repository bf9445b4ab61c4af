#pragma once

#include <optional>

#include "strategy/StrategyConfig.h"

namespace daypick {
namespace engine {

// Absent threshold == rule not applied
struct UniverseConfig {
    std::optional<double> min_turnover;
    std::optional<double> min_price;
    std::optional<double> max_price;
};

struct PositionSizingConfig {
    double capital = 0.0;
    double risk_per_trade = 0.0;       // fraction of capital at risk per trade
    double max_position_pct = 0.0;     // fraction of capital per position
    double stop_buffer_pct = 0.0;      // stop = prev_low * (1 - buffer)
    long long lot_size = 1000;         // 1張 = 1000股
};

// 엔진 설정 (로드 시점에 검증 완료, 이후 불변)
struct EngineConfig {
    UniverseConfig universe;
    strategy::SectorConfig sector;
    strategy::LeaderConfig leader;
    strategy::FollowerConfig follower;
    strategy::TotalScoreWeights total_score_weights;
    PositionSizingConfig position_sizing;
    strategy::FallbackMode fallback_mode = strategy::FallbackMode::STRICT;
};

} // namespace engine
} // namespace daypick
