#include "risk/UniverseFilter.h"
#include "common/FailClosed.h"
#include "common/Logger.h"

namespace daypick {
namespace risk {

UniverseFilter::UniverseFilter(const engine::UniverseConfig& config,
                               const std::vector<RiskFlags>& risk_flags)
    : config_(config)
{
    for (const auto& flags : risk_flags) {
        risk_flags_[flags.stock_id] = flags;
    }
}

UniverseFilter::Rejection UniverseFilter::check(const DailyBar& bar) const {
    if (config_.min_turnover && !closed::atLeast(bar.turnover, *config_.min_turnover)) {
        return Rejection::TURNOVER;
    }
    if (config_.min_price && !closed::atLeast(bar.close, *config_.min_price)) {
        return Rejection::MIN_PRICE;
    }
    if (config_.max_price && !closed::atMost(bar.close, *config_.max_price)) {
        return Rejection::MAX_PRICE;
    }
    
    auto it = risk_flags_.find(bar.stock_id);
    if (it != risk_flags_.end()) {
        const RiskFlags& flags = it->second;
        if (closed::isSet(flags.is_disposed)) return Rejection::DISPOSED;
        if (closed::isSet(flags.is_full_margin)) return Rejection::FULL_MARGIN;
        if (closed::isSet(flags.is_blacklist)) return Rejection::BLACKLIST;
    }
    return Rejection::NONE;
}

std::vector<DailyBar> UniverseFilter::apply(const std::vector<DailyBar>& rows) const {
    std::vector<DailyBar> out;
    out.reserve(rows.size());
    std::map<Rejection, int> rejected;
    
    for (const auto& bar : rows) {
        const Rejection reason = check(bar);
        if (reason == Rejection::NONE) {
            out.push_back(bar);
        } else {
            ++rejected[reason];
        }
    }
    
    for (const auto& [reason, count] : rejected) {
        LOG_DEBUG("Universe filter rejected {} rows ({})", count, toString(reason));
    }
    return out;
}

const char* UniverseFilter::toString(Rejection reason) {
    switch (reason) {
        case Rejection::NONE: return "none";
        case Rejection::TURNOVER: return "turnover";
        case Rejection::MIN_PRICE: return "min_price";
        case Rejection::MAX_PRICE: return "max_price";
        case Rejection::DISPOSED: return "disposed";
        case Rejection::FULL_MARGIN: return "full_margin";
        case Rejection::BLACKLIST: return "blacklist";
    }
    return "unknown";
}

} // namespace risk
} // namespace daypick
