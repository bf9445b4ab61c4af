#include "risk/PositionSizer.h"

#include <algorithm>
#include <cmath>

namespace daypick {
namespace risk {

PositionSizer::PositionSizer(const engine::PositionSizingConfig& config)
    : config_(config)
{
}

Nullable PositionSizer::suggestStop(const Nullable& prev_low) const {
    if (!prev_low || !std::isfinite(*prev_low)) {
        return std::nullopt;
    }
    return *prev_low * (1.0 - config_.stop_buffer_pct);
}

SizingResult PositionSizer::size(const Nullable& entry, const Nullable& stop) const {
    SizingResult result;
    if (!entry || !stop) {
        return result;
    }
    const double e = *entry;
    const double s = *stop;
    if (!std::isfinite(e) || !std::isfinite(s) || e <= 0.0 || s <= 0.0 || s >= e) {
        return result;
    }
    
    const double risk_budget = config_.capital * config_.risk_per_trade;
    const double risk_per_share = e - s;
    const double shares_by_risk = std::floor(risk_budget / risk_per_share);
    
    const double max_position_value = config_.capital * config_.max_position_pct;
    const double shares_by_cap = std::floor(max_position_value / e);
    
    const long long shares = static_cast<long long>(std::max(0.0, std::min(shares_by_risk, shares_by_cap)));
    
    result.shares = shares;
    result.lots = shares / config_.lot_size;
    result.position_value = static_cast<double>(shares) * e;
    return result;
}

} // namespace risk
} // namespace daypick
