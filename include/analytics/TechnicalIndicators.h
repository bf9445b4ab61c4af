#pragma once

#include <vector>
#include "common/Types.h"

namespace daypick {
namespace analytics {

// Rolling-window and descriptive statistics over nullable series.
// Window statistics follow min_periods == window: a window containing
// any undefined value, or a window that is not yet full, is undefined.
class TechnicalIndicators {
public:
    // SMA 시계열 (window 미충족 구간은 undefined)
    static std::vector<Nullable> rollingMean(const std::vector<Nullable>& values, int window);
    
    // 구간 최고값 시계열
    static std::vector<Nullable> rollingMax(const std::vector<Nullable>& values, int window);
    
    // Skips undefined values; undefined when nothing is defined
    static Nullable calculateMean(const std::vector<Nullable>& values);
    static Nullable calculateMedian(const std::vector<Nullable>& values);
    
    // Sample standard deviation (n - 1); undefined below two values
    static Nullable calculateStandardDeviation(const std::vector<Nullable>& values);
    
    // Helper: 정의된 값만 추출
    static std::vector<double> definedValues(const std::vector<Nullable>& values);
};

} // namespace analytics
} // namespace daypick
