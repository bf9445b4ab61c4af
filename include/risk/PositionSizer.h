#pragma once

#include <optional>
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace daypick {
namespace risk {

struct SizingResult {
    Nullable position_value;
    std::optional<long long> shares;
    std::optional<long long> lots;
    
    bool isDefined() const { return shares.has_value(); }
};

// 리스크 기반 수량 산정
class PositionSizer {
public:
    explicit PositionSizer(const engine::PositionSizingConfig& config);
    
    // prev_low * (1 - stop_buffer_pct); undefined without a finite prev_low
    Nullable suggestStop(const Nullable& prev_low) const;
    
    // shares = max(0, min(floor(capital*risk / (entry-stop)), floor(capital*max_pos / entry)))
    // Undefined unless 0 < stop < entry and both are finite.
    SizingResult size(const Nullable& entry, const Nullable& stop) const;
    
    const engine::PositionSizingConfig& config() const { return config_; }
    
private:
    engine::PositionSizingConfig config_;
};

} // namespace risk
} // namespace daypick
