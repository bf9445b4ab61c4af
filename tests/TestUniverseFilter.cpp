#include "risk/UniverseFilter.h"
#include "TestFixtures.h"

#include <cassert>
#include <iostream>

using namespace daypick;
using risk::UniverseFilter;

static void testPriceAndTurnover() {
    const auto cfg = testing::baseConfig();
    UniverseFilter filter(cfg.universe);

    auto ok = testing::makeBar("2026-01-05", "OK", 50, 51, 49, 50, 1.0, 1000, 5.0e7);
    assert(filter.check(ok) == UniverseFilter::Rejection::NONE);

    auto thin = ok;
    thin.turnover = 1.0e6;
    assert(filter.check(thin) == UniverseFilter::Rejection::TURNOVER);

    auto cheap = ok;
    cheap.close = 9.99;
    assert(filter.check(cheap) == UniverseFilter::Rejection::MIN_PRICE);

    auto pricey = ok;
    pricey.close = 2000.01;
    assert(filter.check(pricey) == UniverseFilter::Rejection::MAX_PRICE);

    // bounds are inclusive
    auto edge = ok;
    edge.close = 2000.0;
    edge.turnover = 1.0e7;
    assert(filter.isEligible(edge));

    // missing values fail closed
    auto no_close = ok;
    no_close.close = std::nullopt;
    assert(!filter.isEligible(no_close));
    auto no_turnover = ok;
    no_turnover.turnover = std::nullopt;
    assert(filter.check(no_turnover) == UniverseFilter::Rejection::TURNOVER);

    // rules switched off entirely
    UniverseFilter open_filter(engine::UniverseConfig{});
    assert(open_filter.isEligible(no_close));
    std::cout << "  price/turnover rules OK" << std::endl;
}

static void testRiskFlags() {
    const auto cfg = testing::baseConfig();
    std::vector<RiskFlags> flags(4);
    flags[0].stock_id = "DISP";
    flags[0].is_disposed = true;
    flags[1].stock_id = "MARGIN";
    flags[1].is_full_margin = true;
    flags[2].stock_id = "BLACK";
    flags[2].is_blacklist = true;
    flags[3].stock_id = "CLEAN";
    flags[3].is_disposed = false;      // other flags missing: no restriction

    UniverseFilter filter(cfg.universe, flags);
    auto bar = testing::makeBar("2026-01-05", "DISP", 50, 51, 49, 50, 1.0, 1000);
    assert(filter.check(bar) == UniverseFilter::Rejection::DISPOSED);
    bar.stock_id = "MARGIN";
    assert(filter.check(bar) == UniverseFilter::Rejection::FULL_MARGIN);
    bar.stock_id = "BLACK";
    assert(filter.check(bar) == UniverseFilter::Rejection::BLACKLIST);
    bar.stock_id = "CLEAN";
    assert(filter.isEligible(bar));
    bar.stock_id = "NOFLAGS";
    assert(filter.isEligible(bar));
    assert(std::string(UniverseFilter::toString(UniverseFilter::Rejection::BLACKLIST)) == "blacklist");
    std::cout << "  risk flags OK" << std::endl;
}

static void testApplyIdempotent() {
    const auto cfg = testing::baseConfig();
    auto inputs = testing::buildScenario();
    inputs.history[3].close = 5.0;
    inputs.history[7].turnover = std::nullopt;
    inputs.history[11].close = std::nullopt;

    UniverseFilter filter(cfg.universe);
    const auto once = filter.apply(inputs.history);
    const auto twice = filter.apply(once);
    assert(once.size() == inputs.history.size() - 3);
    assert(twice.size() == once.size());
    for (size_t i = 0; i < once.size(); ++i) {
        assert(once[i].stock_id == twice[i].stock_id);
        assert(once[i].trade_date == twice[i].trade_date);
    }
    // order preserved
    assert(once[3].stock_id == inputs.history[4].stock_id);
    std::cout << "  apply idempotent OK" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting UniverseFilter Test..." << std::endl;
    testPriceAndTurnover();
    testRiskFlags();
    testApplyIdempotent();
    std::cout << "[TEST] UniverseFilter Test PASSED!" << std::endl;
    return 0;
}
