#pragma once

#include "Types.hpp"

#include <string_view>


enum class OutcomeReason : uint8_t { Checkmate, Stalemate, FiftyMoveRule, InsufficientMaterial };

// A finished game's result. `winner` is Colour::None for every draw.
struct Outcome {
    OutcomeReason reason;
    Colour winner = Colour::None;

    static constexpr Outcome checkmate(Colour winner) { return Outcome{OutcomeReason::Checkmate, winner}; }
    static constexpr Outcome draw(OutcomeReason reason) { return Outcome{reason, Colour::None}; }

    [[nodiscard]] constexpr bool is_win() const { return winner != Colour::None; }
    [[nodiscard]] constexpr bool is_draw() const { return winner == Colour::None; }

    // "1-0", "0-1" or "1/2-1/2".
    [[nodiscard]] std::string_view to_string() const;

    // Points scored by `player`: 1 for a win, 0 for a loss, 0.5 for a draw.
    [[nodiscard]] double value_for(Colour player) const;

    bool operator==(const Outcome& other) const = default;
};

std::string_view reason_name(OutcomeReason reason);
