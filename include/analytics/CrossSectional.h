#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace daypick {
namespace analytics {

// Cross-sectional standardization shared by the sector, leader and
// follower stages so that zero-variance handling is identical everywhere.
class CrossSectional {
public:
    // (v - mean) / sample_std over the defined values.
    // Zero or undefined std: every defined entry becomes 0.0, undefined
    // entries stay undefined.
    static std::vector<Nullable> zscore(const std::vector<Nullable>& values);
    
    // zscore() applied independently within each key group; output is
    // aligned with the input positions.
    static std::vector<Nullable> groupwiseZScore(const std::vector<std::string>& keys,
                                                 const std::vector<Nullable>& values);
    
    // Relative tolerance under which a standard deviation counts as zero
    static constexpr double ZERO_STD_EPS = 1e-12;
};

} // namespace analytics
} // namespace daypick
