#pragma once

#include "common/Types.h"

// Uniform resolution of undefined values at filter time.
// A missing value fails every threshold comparison it takes part in.
namespace daypick {
namespace closed {

inline bool atLeast(const Nullable& v, double threshold) {
    return v.has_value() && *v >= threshold;
}

inline bool atMost(const Nullable& v, double threshold) {
    return v.has_value() && *v <= threshold;
}

inline bool between(const Nullable& v, double lo, double hi) {
    return atLeast(v, lo) && atMost(v, hi);
}

inline bool above(const Nullable& v, const Nullable& reference) {
    return v.has_value() && reference.has_value() && *v > *reference;
}

inline bool isSet(const NullableFlag& flag) {
    return flag.has_value() && *flag;
}

// Score terms only: the neutral value a missing input contributes
inline double orDefault(const Nullable& v, double fallback) {
    return v.has_value() ? *v : fallback;
}

} // namespace closed
} // namespace daypick
