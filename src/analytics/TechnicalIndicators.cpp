#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace daypick {
namespace analytics {

std::vector<Nullable> TechnicalIndicators::rollingMean(const std::vector<Nullable>& values, int window) {
    std::vector<Nullable> out(values.size());
    if (window <= 0) {
        return out;
    }
    const size_t w = static_cast<size_t>(window);
    
    for (size_t i = w - 1; i < values.size(); ++i) {
        double sum = 0.0;
        bool complete = true;
        for (size_t k = i + 1 - w; k <= i; ++k) {
            if (!values[k]) {
                complete = false;
                break;
            }
            sum += *values[k];
        }
        if (complete) {
            out[i] = sum / static_cast<double>(w);
        }
    }
    return out;
}

std::vector<Nullable> TechnicalIndicators::rollingMax(const std::vector<Nullable>& values, int window) {
    std::vector<Nullable> out(values.size());
    if (window <= 0) {
        return out;
    }
    const size_t w = static_cast<size_t>(window);
    
    for (size_t i = w - 1; i < values.size(); ++i) {
        bool complete = true;
        double best = 0.0;
        for (size_t k = i + 1 - w; k <= i; ++k) {
            if (!values[k]) {
                complete = false;
                break;
            }
            best = (k == i + 1 - w) ? *values[k] : std::max(best, *values[k]);
        }
        if (complete) {
            out[i] = best;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::definedValues(const std::vector<Nullable>& values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (v && std::isfinite(*v)) {
            out.push_back(*v);
        }
    }
    return out;
}

Nullable TechnicalIndicators::calculateMean(const std::vector<Nullable>& values) {
    const auto defined = definedValues(values);
    if (defined.empty()) {
        return std::nullopt;
    }
    return std::accumulate(defined.begin(), defined.end(), 0.0) / static_cast<double>(defined.size());
}

Nullable TechnicalIndicators::calculateMedian(const std::vector<Nullable>& values) {
    auto defined = definedValues(values);
    if (defined.empty()) {
        return std::nullopt;
    }
    std::sort(defined.begin(), defined.end());
    const size_t n = defined.size();
    if (n % 2 == 1) {
        return defined[n / 2];
    }
    return (defined[n / 2 - 1] + defined[n / 2]) / 2.0;
}

Nullable TechnicalIndicators::calculateStandardDeviation(const std::vector<Nullable>& values) {
    const auto defined = definedValues(values);
    if (defined.size() < 2) {
        return std::nullopt;
    }
    const double mean = std::accumulate(defined.begin(), defined.end(), 0.0) / static_cast<double>(defined.size());
    double sq_sum = 0.0;
    for (double v : defined) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(defined.size() - 1));
}

} // namespace analytics
} // namespace daypick
