#include "analytics/FeatureCalculator.h"
#include "TestFixtures.h"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace daypick;
using analytics::FeatureCalculator;
using testing::near;

static void testScenarioFeatures() {
    const auto inputs = testing::buildScenario();
    const auto dates = testing::scenarioDates();
    const auto features = FeatureCalculator::computeDailyFeatures(inputs.history);
    assert(features.size() == inputs.history.size());

    // sorted by (stock_id, trade_date)
    for (size_t i = 1; i < features.size(); ++i) {
        const auto& a = features[i - 1];
        const auto& b = features[i];
        assert(a.stock_id < b.stock_id || (a.stock_id == b.stock_id && a.trade_date < b.trade_date));
    }

    const auto today = FeatureCalculator::featuresOn(features, dates.back());
    assert(today.size() == 30);

    const auto& leader = today.at("A00");
    assert(near(*leader.ma_5, (400.0 + 109.0) / 5.0));
    assert(near(*leader.ma_20, (1900.0 + 109.0) / 20.0));
    assert(near(*leader.vol_20d_avg, 1075.0));
    assert(near(*leader.vol_ratio_20d, 2500.0 / 1075.0));
    assert(near(*leader.high_20d, 109.0));
    assert(leader.is_20d_high.has_value() && *leader.is_20d_high);
    assert(near(*leader.distance_to_20d_high, 0.0));
    assert(near(*leader.pos_in_day, 1.0));

    const auto& follower = today.at("A01");
    assert(near(*follower.vol_ratio_20d, 1600.0 / 1030.0));
    assert(!*follower.is_20d_high);
    assert(near(*follower.distance_to_20d_high, 0.5 / 104.5));

    const auto& flat = today.at("B00");
    assert(near(*flat.ma_20, 100.0));
    assert(near(*flat.vol_ratio_20d, 1.0));
    assert(near(*flat.pos_in_day, 0.5));

    // the first four days lack a 5-day window
    const auto day4 = FeatureCalculator::featuresOn(features, dates[3]);
    assert(!day4.at("A00").ma_5);
    assert(!day4.at("A00").ma_20);
    assert(!day4.at("A00").is_20d_high);
    assert(!day4.at("A00").distance_to_20d_high);
    const auto day5 = FeatureCalculator::featuresOn(features, dates[4]);
    assert(day5.at("A00").ma_5.has_value());
    assert(!day5.at("A00").ma_10);
    std::cout << "  scenario features OK" << std::endl;
}

static void testUnorderedInput() {
    auto inputs = testing::buildScenario();
    auto reversed = inputs.history;
    std::reverse(reversed.begin(), reversed.end());
    const auto a = FeatureCalculator::computeDailyFeatures(inputs.history);
    const auto b = FeatureCalculator::computeDailyFeatures(reversed);
    assert(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        assert(a[i].stock_id == b[i].stock_id);
        assert(a[i].trade_date == b[i].trade_date);
        assert(a[i].ma_20 == b[i].ma_20);
        assert(a[i].vol_ratio_20d == b[i].vol_ratio_20d);
    }
    std::cout << "  input order independence OK" << std::endl;
}

static void testEdgeBars() {
    // flat bar: position undefined
    auto flat = testing::makeBar("2026-01-05", "X", 10, 10, 10, 10, 0.0, 100);
    assert(!FeatureCalculator::intradayPosition(flat));

    DailyBar partial = flat;
    partial.high = std::nullopt;
    assert(!FeatureCalculator::intradayPosition(partial));

    // zero average volume leaves the ratio undefined
    std::vector<DailyBar> history;
    const auto dates = testing::scenarioDates();
    for (const auto& d : dates) {
        history.push_back(testing::makeBar(d, "Z", 10, 11, 9, 10, 0.0, 0.0));
    }
    const auto features = FeatureCalculator::computeDailyFeatures(history);
    assert(features.back().vol_20d_avg.has_value());
    assert(!features.back().vol_ratio_20d);

    // missing close: no 20-day-high flag, no distance
    history.back().close = std::nullopt;
    const auto features2 = FeatureCalculator::computeDailyFeatures(history);
    assert(!features2.back().is_20d_high);
    assert(!features2.back().distance_to_20d_high);
    assert(!features2.back().ma_5);
    std::cout << "  edge bars OK" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting FeatureCalculator Test..." << std::endl;
    testScenarioFeatures();
    testUnorderedInput();
    testEdgeBars();
    std::cout << "[TEST] FeatureCalculator Test PASSED!" << std::endl;
    return 0;
}
