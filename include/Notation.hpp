#pragma once

#include "Types.hpp"

#include <optional>
#include <string>
#include <string_view>


// Coordinate move text: "e2e4", "e7e8q".
namespace Notation {

    struct ParsedMove {
        Move move;
        PieceType promotion = PieceType::None;
    };

    // Promotion suffix n, b, r or q in either case.
    std::optional<ParsedMove> parse_move(std::string_view text);

    // A promotion kind carried in the move's flag is used when `promotion` is None.
    std::string format_move(Move move, PieceType promotion = PieceType::None);
}
