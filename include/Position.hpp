#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include "Errors.hpp"

#include <cstdint>


namespace CastleRights {
    inline constexpr uint8_t None = 0;
    inline constexpr uint8_t WhiteKingside = 1;
    inline constexpr uint8_t WhiteQueenside = 2;
    inline constexpr uint8_t BlackKingside = 4;
    inline constexpr uint8_t BlackQueenside = 8;
    inline constexpr uint8_t All = 15;

    constexpr uint8_t of(Colour c) {
        return c == Colour::White ? (WhiteKingside | WhiteQueenside)
                                  : (BlackKingside | BlackQueenside);
    }

    constexpr uint8_t side_bit(Colour c, CastleSide side) {
        if (c == Colour::White) return side == CastleSide::Kingside ? WhiteKingside : WhiteQueenside;
        return side == CastleSide::Kingside ? BlackKingside : BlackQueenside;
    }

    constexpr bool has(uint8_t rights, uint8_t bit) { return (rights & bit) != 0; }
}

// Fields handed over by a text parser (or any other source) before validation.
struct PositionRecord {
    Board board{std::nullopt};
    Colour to_move = Colour::White;
    uint8_t castle_rights = CastleRights::None;
    Square en_passant_sq = Square::None;
    uint16_t half_move_clock = 0;
    uint16_t full_move_number = 1;
};

// One ply's snapshot. Transitions return a new Position; nothing here is
// modified after construction.
struct Position {
    Board board;
    Colour to_move;
    Square en_passant_sq;
    uint8_t castle_rights;
    uint16_t half_move_clock;
    uint16_t full_move_number;

    // The standard opening position.
    Position();

    static Position standard() { return Position(); }

    // Structural checks only (kings, back-rank pawns, rights, en passant, clocks).
    [[nodiscard]] static SetupError from_record(const PositionRecord& record, Position& out);
    [[nodiscard]] PositionRecord to_record() const;

    // Matches `move` by start/end against the legal moves and picks the
    // generated move, honouring `promotion`. Flags on `move` are ignored
    // except a promotion kind, which stands in for a missing `promotion`.
    [[nodiscard]] MoveError resolve(Move move, PieceType promotion, Move& out) const;

    // resolve() followed by apply().
    [[nodiscard]] MoveError successor(Move move, PieceType promotion, Position& out) const;

    // Unchecked transition for a generated move; no legality test.
    [[nodiscard]] Position apply(Move move) const;

    [[nodiscard]] Square king_square(Colour c) const { return board.square_for_king(c); }
    [[nodiscard]] bool is_attacked(Square sq, Colour by) const;

    // Side to move's king is attacked. False when that king is missing.
    [[nodiscard]] bool is_check() const;

    bool operator==(const Position& other) const = default;
};
