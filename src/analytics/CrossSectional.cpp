#include "analytics/CrossSectional.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace daypick {
namespace analytics {

std::vector<Nullable> CrossSectional::zscore(const std::vector<Nullable>& values) {
    const Nullable mean = TechnicalIndicators::calculateMean(values);
    const Nullable sd = TechnicalIndicators::calculateStandardDeviation(values);
    
    std::vector<Nullable> out(values.size());
    
    // identical values can leave a rounding-level std behind
    if (!mean || !sd || !std::isfinite(*sd) ||
        *sd <= ZERO_STD_EPS * std::max(1.0, std::abs(*mean))) {
        for (size_t i = 0; i < values.size(); ++i) {
            if (values[i] && std::isfinite(*values[i])) {
                out[i] = 0.0;
            }
        }
        return out;
    }
    
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] && std::isfinite(*values[i])) {
            out[i] = (*values[i] - *mean) / *sd;
        }
    }
    return out;
}

std::vector<Nullable> CrossSectional::groupwiseZScore(const std::vector<std::string>& keys,
                                                      const std::vector<Nullable>& values) {
    if (keys.size() != values.size()) {
        throw std::invalid_argument("groupwiseZScore: keys and values differ in length");
    }
    
    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < keys.size(); ++i) {
        groups[keys[i]].push_back(i);
    }
    
    std::vector<Nullable> out(values.size());
    for (const auto& [key, positions] : groups) {
        std::vector<Nullable> slice;
        slice.reserve(positions.size());
        for (size_t pos : positions) {
            slice.push_back(values[pos]);
        }
        const auto z = zscore(slice);
        for (size_t k = 0; k < positions.size(); ++k) {
            out[positions[k]] = z[k];
        }
    }
    return out;
}

} // namespace analytics
} // namespace daypick
