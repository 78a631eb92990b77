#include "Outcome.hpp"

std::string_view Outcome::to_string() const {
    if (winner == Colour::White) return "1-0";
    if (winner == Colour::Black) return "0-1";
    return "1/2-1/2";
}

double Outcome::value_for(Colour player) const {
    if (is_draw()) return 0.5;
    return winner == player ? 1.0 : 0.0;
}

std::string_view reason_name(OutcomeReason reason) {
    switch (reason) {
        case OutcomeReason::Checkmate:            return "checkmate";
        case OutcomeReason::Stalemate:            return "stalemate";
        case OutcomeReason::FiftyMoveRule:        return "fifty move rule";
        case OutcomeReason::InsufficientMaterial: return "insufficient material";
    }
    return "unknown";
}
