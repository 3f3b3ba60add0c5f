#pragma once
#include "datatypes.hpp"

namespace strategy_engine {

    // Relation change of a line against a reference between two consecutive bars
    enum class CrossType {
        None,
        CrossesAbove,  // was <= reference, now > reference
        CrossesBelow   // was >= reference, now < reference
    };

    // Exits take priority when both directions fire on the same bar
    inline core::SignalAction resolveSignal(bool buy_triggered, bool sell_triggered) {
        if (sell_triggered) return core::SignalAction::Sell;
        if (buy_triggered) return core::SignalAction::Buy;
        return core::SignalAction::Hold;
    }

} // namespace strategy_engine
