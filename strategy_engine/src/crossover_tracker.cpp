#include "crossover_tracker.hpp"

namespace strategy_engine {

CrossType CrossoverTracker::update(double line, double reference) {
    CrossType cross = CrossType::None;

    if (has_previous_) {
        if (previous_line_ <= previous_reference_ && line > reference) {
            // Was below or equal previously, AND is above now
            cross = CrossType::CrossesAbove;
        } else if (previous_line_ >= previous_reference_ && line < reference) {
            // Was above or equal previously, AND is below now
            cross = CrossType::CrossesBelow;
        }
    }

    previous_line_ = line;
    previous_reference_ = reference;
    has_previous_ = true;
    return cross;
}

void CrossoverTracker::reset() {
    has_previous_ = false;
    previous_line_ = 0.0;
    previous_reference_ = 0.0;
}

} // namespace strategy_engine
