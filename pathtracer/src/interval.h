#pragma once
#include "core.h"

/**
 * @brief Closed numeric range [min, max] bounding ray parameters and color values.
 * An interval with min > max is empty. Default construction yields the empty interval.
 */
struct Interval {
    /// Lower bound.
    double min{kINF};
    /// Upper bound.
    double max{-kINF};

    /// Empty interval.
    Interval() = default;
    /// From bounds.
    Interval(double lo, double hi): min(lo), max(hi) {}

    /// max - min; negative when empty, +inf for the universe.
    double size() const { return max - min; }
    /// Inclusive test min <= x <= max.
    bool contains(double x) const { return min <= x && x <= max; }
    /// Strict test min < x < max.
    bool surrounds(double x) const { return min < x && x < max; }

    /**
     * @brief Project x into [min, max].
     * Against the empty interval this returns min (+inf); callers must guard.
     */
    double clamp(double x) const {
        if (x < min) return min;
        if (x > max) return max;
        return x;
    }

    static const Interval EMPTY;
    static const Interval UNIVERSE;
};

inline const Interval Interval::EMPTY    = Interval(kINF, -kINF);
inline const Interval Interval::UNIVERSE = Interval(-kINF, kINF);
