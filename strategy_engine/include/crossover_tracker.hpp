#pragma once

#include "common_types.hpp"

namespace strategy_engine {

    // --- CrossoverTracker ---
    // Detects whether a line crossed a reference between the previous bar and
    // the current one. Retains exactly one bar of state, so a full pass is O(n).
    class CrossoverTracker {
    public:
        CrossoverTracker() = default;

        // Feed the values of the current bar. The first update after
        // construction or reset() has no previous bar and returns None.
        CrossType update(double line, double reference);

        void reset();
        bool hasPrevious() const { return has_previous_; }

    private:
        bool has_previous_ = false;
        double previous_line_ = 0.0;
        double previous_reference_ = 0.0;
    };

} // namespace strategy_engine
