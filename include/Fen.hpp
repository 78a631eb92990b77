#pragma once

#include "Position.hpp"

#include <optional>
#include <string>
#include <string_view>


// Forsyth-Edwards Notation. Text stays here; Position only sees PositionRecord.
namespace Fen {

    inline constexpr std::string_view START = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

    // Syntax only. Accepts the six standard fields, or the first four with
    // the clocks defaulting to 0 and 1.
    std::optional<PositionRecord> parse(std::string_view fen);

    // parse() followed by Position::from_record().
    std::optional<Position> to_position(std::string_view fen);

    std::string format(const Position& pos);
    std::string placement(const Board& board);
    std::string castling(uint8_t rights);

    char piece_char(Piece piece);
    std::optional<Piece> piece_from_char(char c);
}
