#include "analytics/SectorAggregator.h"
#include "TestFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace daypick;
using analytics::SectorAggregator;
using strategy::FallbackMode;
using testing::near;

static std::map<StockId, StockMeta> metaMap(const engine::MarketInputs& inputs) {
    std::map<StockId, StockMeta> meta;
    for (const auto& m : inputs.stock_meta) meta[m.stock_id] = m;
    return meta;
}

static const SectorDailyAggregate& findRow(const std::vector<SectorDailyAggregate>& rows,
                                        const TradeDate& date, const SectorId& sector) {
    for (const auto& r : rows) {
        if (r.trade_date == date && r.sector_id == sector) return r;
    }
    assert(false && "sector row not found");
    return rows.front();
}

static void testSectorDaily() {
    const auto cfg = testing::baseConfig();
    const auto inputs = testing::buildScenario();
    const auto dates = testing::scenarioDates();
    SectorAggregator aggregator(cfg.sector);

    const auto daily = aggregator.computeSectorDaily(inputs.history, metaMap(inputs));
    assert(daily.size() == dates.size() * 3);

    const auto& a = findRow(daily, dates.back(), "SEC_A");
    assert(a.num_stocks == 10);
    assert(near(*a.avg_pct_change, 4.0));
    assert(near(*a.median_pct_change, 3.8));
    assert(near(a.up_ratio, 0.9));
    assert(a.num_up_3 == 9);
    assert(near(*a.sector_mtm, 0.8));
    assert(near(*a.sector_mtm_z, 2.0 / std::sqrt(3.0)));

    const auto& b = findRow(daily, dates.back(), "SEC_B");
    assert(near(*b.avg_pct_change, 0.0));
    assert(b.up_ratio == 0.0);
    assert(near(*b.sector_mtm_z, -1.0 / std::sqrt(3.0)));

    // before the lookback is full momentum and its z are both undefined
    const auto& early = findRow(daily, dates[2], "SEC_A");
    assert(!early.sector_mtm);
    assert(!early.sector_mtm_z);

    // flat days: all momenta equal -> zero variance -> z == 0
    const auto& flat = findRow(daily, dates[10], "SEC_C");
    assert(*flat.sector_mtm_z == 0.0);
    std::cout << "  sector daily OK" << std::endl;
}

static void testUnknownSectorAndUndefined() {
    const auto cfg = testing::baseConfig();
    SectorAggregator aggregator(cfg.sector);
    std::vector<DailyBar> rows{
        testing::makeBar("2026-01-05", "X1", 10, 11, 9, 10, 4.0, 100),
        testing::makeBar("2026-01-05", "X2", 10, 11, 9, 10, 0.0, 100),
    };
    rows.push_back(rows[1]);
    rows[2].stock_id = "X3";
    rows[2].pct_change = std::nullopt;

    const auto daily = aggregator.computeSectorDaily(rows, {});
    assert(daily.size() == 1);
    assert(daily[0].sector_id == UNKNOWN_SECTOR);
    assert(daily[0].num_stocks == 3);
    // mean over defined values; up ratio over all stocks
    assert(near(*daily[0].avg_pct_change, 2.0));
    assert(near(daily[0].up_ratio, 1.0 / 3.0));
    assert(daily[0].num_up_3 == 1);
    std::cout << "  unknown sector OK" << std::endl;
}

static void testStrongSectors() {
    auto cfg = testing::baseConfig();
    const auto inputs = testing::buildScenario();
    const auto dates = testing::scenarioDates();
    SectorAggregator aggregator(cfg.sector);
    const auto daily = aggregator.computeSectorDaily(inputs.history, metaMap(inputs));

    const auto scored = aggregator.scoreSectors(daily, dates.back());
    assert(scored.size() == 3);
    const double z = 2.0 / std::sqrt(3.0);
    for (const auto& s : scored) {
        if (s.sector_id == "SEC_A") {
            assert(near(s.sector_score, z + z + 0.9));
        } else {
            assert(near(s.sector_score, -0.5 * z - 0.5 * z));
        }
    }

    auto strong = aggregator.selectStrongSectors(scored, FallbackMode::STRICT);
    assert(strong.size() == 1);
    assert(strong[0].sector_id == "SEC_A");

    // nothing passes: strict stays empty, permissive takes top K by score
    cfg.sector.thresh_avg_pct = 1.0e9;
    cfg.sector.fallback_top_k = 2;
    SectorAggregator strict(cfg.sector);
    assert(strict.selectStrongSectors(scored, FallbackMode::STRICT).empty());
    assert(strict.selectStrongSectors(scored, FallbackMode::PERCENTILE).empty());
    const auto fallback = strict.selectStrongSectors(scored, FallbackMode::PERMISSIVE);
    assert(fallback.size() == 2);
    assert(fallback[0].sector_id == "SEC_A");
    assert(fallback[1].sector_id == "SEC_B");   // tie with C keeps input order

    // missing average fails closed
    SectorScore missing;
    missing.sector_id = "M";
    missing.up_ratio = 1.0;
    missing.sector_mtm_z = 10.0;
    assert(!aggregator.passesThresholds(missing));
    std::cout << "  strong sectors OK" << std::endl;
}

static void testUndefinedMomentumFailsClosed() {
    auto cfg = testing::baseConfig();
    cfg.sector.mtm_lookback = 30;       // longer than the 25-day history
    cfg.sector.thresh_mtm_z = 0.0;
    const auto inputs = testing::buildScenario();
    const auto dates = testing::scenarioDates();

    SectorAggregator aggregator(cfg.sector);
    const auto daily = aggregator.computeSectorDaily(inputs.history, metaMap(inputs));
    for (const auto& row : daily) {
        assert(!row.sector_mtm);
        assert(!row.sector_mtm_z);
    }

    const auto scored = aggregator.scoreSectors(daily, dates.back());
    assert(scored.size() == 3);
    assert(aggregator.selectStrongSectors(scored, FallbackMode::STRICT).empty());

    // the composite score still counts a missing momentum as 0
    const double z = 2.0 / std::sqrt(3.0);
    for (const auto& s : scored) {
        if (s.sector_id == "SEC_A") assert(near(s.sector_score, z + 0.9));
    }

    const auto result = engine::SelectionEngine(cfg).run(dates.back(), inputs);
    assert(result.strong_sectors.empty());
    assert(result.candidates.empty());
    std::cout << "  undefined momentum fails closed OK" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting SectorAggregator Test..." << std::endl;
    testSectorDaily();
    testUnknownSectorAndUndefined();
    testStrongSectors();
    testUndefinedMomentumFailsClosed();
    std::cout << "[TEST] SectorAggregator Test PASSED!" << std::endl;
    return 0;
}
