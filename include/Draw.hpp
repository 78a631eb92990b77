#pragma once

#include "Position.hpp"
#include "Outcome.hpp"

#include <vector>


namespace Draw {

    using Predicate = bool(*)(const Position&);

    // A drawing condition checked after every move, in configured order.
    struct Rule {
        OutcomeReason reason;
        Predicate applies;
    };

    // 100 half moves without a capture or pawn move.
    bool fifty_move_rule(const Position& pos);

    // Neither side can mate: K v K, K+minor v K, or bishops only, all on one square colour.
    bool insufficient_material(const Position& pos);

    std::vector<Rule> standard_rules();
}

using DrawRule = Draw::Rule;
