#include "analytics/CrossSectional.h"
#include "analytics/TechnicalIndicators.h"
#include "TestFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace daypick;
using analytics::CrossSectional;
using analytics::TechnicalIndicators;
using testing::near;

static void testRollingWindows() {
    std::vector<Nullable> v{1.0, 2.0, 3.0, 4.0, 5.0};
    auto ma3 = TechnicalIndicators::rollingMean(v, 3);
    assert(!ma3[0] && !ma3[1]);
    assert(near(*ma3[2], 2.0));
    assert(near(*ma3[4], 4.0));

    // an undefined value poisons every window that contains it
    std::vector<Nullable> gap{1.0, std::nullopt, 3.0, 4.0, 5.0};
    auto ma2 = TechnicalIndicators::rollingMean(gap, 2);
    assert(!ma2[1] && !ma2[2]);
    assert(near(*ma2[3], 3.5));

    auto mx = TechnicalIndicators::rollingMax(v, 2);
    assert(!mx[0]);
    assert(near(*mx[1], 2.0));
    assert(near(*mx[4], 5.0));

    // window longer than the series
    auto ma10 = TechnicalIndicators::rollingMean(v, 10);
    for (const auto& x : ma10) assert(!x);
    std::cout << "  rolling windows OK" << std::endl;
}

static void testDescriptive() {
    std::vector<Nullable> v{4.0, std::nullopt, 1.0, 3.0, 2.0};
    assert(near(*TechnicalIndicators::calculateMean(v), 2.5));
    assert(near(*TechnicalIndicators::calculateMedian(v), 2.5));
    // sample std of {1,2,3,4}
    assert(near(*TechnicalIndicators::calculateStandardDeviation(v), std::sqrt(5.0 / 3.0)));

    std::vector<Nullable> empty{std::nullopt, std::nullopt};
    assert(!TechnicalIndicators::calculateMean(empty));
    assert(!TechnicalIndicators::calculateMedian(empty));
    assert(!TechnicalIndicators::calculateStandardDeviation({Nullable(1.0)}));
    std::cout << "  descriptive stats OK" << std::endl;
}

static void testZScore() {
    auto z = CrossSectional::zscore({1.0, 2.0, 3.0});
    assert(near(*z[0], -1.0));
    assert(near(*z[1], 0.0));
    assert(near(*z[2], 1.0));

    // undefined stays undefined when std is usable
    auto z2 = CrossSectional::zscore({1.0, std::nullopt, 3.0});
    assert(!z2[1]);
    assert(near(*z2[0], -1.0 / std::sqrt(2.0)));

    // zero variance: defined entries become 0, undefined stay undefined
    auto flat = CrossSectional::zscore({5.0, 5.0, std::nullopt, 5.0});
    assert(*flat[0] == 0.0 && *flat[1] == 0.0 && *flat[3] == 0.0);
    assert(!flat[2]);

    // single defined value: std undefined -> 0 for it only
    auto single = CrossSectional::zscore({7.0, std::nullopt});
    assert(single[0].has_value() && *single[0] == 0.0);
    assert(!single[1]);

    // nothing defined: nothing to standardize
    auto none = CrossSectional::zscore({std::nullopt, std::nullopt});
    assert(!none[0] && !none[1]);

    // non-finite input is treated as undefined
    auto nan = CrossSectional::zscore({std::numeric_limits<double>::quiet_NaN(), 1.0});
    assert(!nan[0]);
    assert(*nan[1] == 0.0);

    // rounding-level std on equal values
    auto big = CrossSectional::zscore({0.1 + 0.2, 0.3, 0.30000000000000004});
    for (const auto& x : big) assert(*x == 0.0);
    std::cout << "  zscore OK" << std::endl;
}

static void testGroupwise() {
    std::vector<std::string> keys{"A", "B", "A", "B", "A"};
    std::vector<Nullable> vals{1.0, 10.0, 2.0, 10.0, 3.0};
    auto z = CrossSectional::groupwiseZScore(keys, vals);
    assert(near(*z[0], -1.0));
    assert(near(*z[2], 0.0));
    assert(near(*z[4], 1.0));
    assert(*z[1] == 0.0 && *z[3] == 0.0);

    bool threw = false;
    try {
        CrossSectional::groupwiseZScore({"A"}, {1.0, 2.0});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  groupwise zscore OK" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting CrossSectional Test..." << std::endl;
    testRollingWindows();
    testDescriptive();
    testZScore();
    testGroupwise();
    std::cout << "[TEST] CrossSectional Test PASSED!" << std::endl;
    return 0;
}
