#pragma once

#include "Types.hpp"

#include <array>
#include <optional>
#include <vector>


enum class Variant : uint8_t { Standard };

// 64 cells, each empty or holding one piece. Stored as one bitboard per
// (colour, piece type) plus cached occupancy for White, Black and both.
struct Board {
    std::array<Bitboard, 12> pieces;
    std::array<Bitboard, 3> occupancy;

    struct Space {
        Square square;
        std::optional<Piece> piece;

        bool operator==(const Space& other) const = default;
    };

    // Variant::Standard gives the opening arrangement, std::nullopt an empty board.
    explicit Board(std::optional<Variant> variant = Variant::Standard);

    static constexpr size_t get_piece_index(Colour c, PieceType t) {
        return static_cast<size_t>(c) * 6 + static_cast<size_t>(t);
    }

    [[nodiscard]] std::optional<Piece> at(Square sq) const;
    void set(Square sq, std::optional<Piece> piece);
    std::optional<Piece> remove(Square sq);
    void swap(Square a, Square b);
    void clear();

    // All 64 cells, rank-major: a1, b1, ..., h1, a2, ..., h8.
    [[nodiscard]] std::vector<Space> spaces() const;

    [[nodiscard]] std::vector<Piece> all_pieces() const;
    [[nodiscard]] std::vector<Piece> white_pieces() const { return pieces_of(Colour::White); }
    [[nodiscard]] std::vector<Piece> black_pieces() const { return pieces_of(Colour::Black); }
    [[nodiscard]] std::vector<Piece> pieces_of(Colour c) const;

    [[nodiscard]] int piece_count(Colour c = Colour::None) const;
    [[nodiscard]] int count(Piece piece) const;
    [[nodiscard]] bool contains(Piece piece) const { return count(piece) > 0; }

    [[nodiscard]] std::vector<Square> squares_of(Piece piece) const;
    [[nodiscard]] std::vector<Square> squares_of(Colour c) const;

    [[nodiscard]] Bitboard bitboard(Piece piece) const { return pieces[piece.index()]; }
    [[nodiscard]] Bitboard bitboard(Colour c) const { return occupancy[static_cast<int>(c)]; }

    // Square::None when `c` has no king on the board.
    [[nodiscard]] Square square_for_king(Colour c) const;

    [[nodiscard]] Bitboard attackers_to(Square sq, Colour attacker) const;
    [[nodiscard]] bool king_is_checked(Colour c) const;

    [[nodiscard]] Board flipped_vertically() const;
    [[nodiscard]] Board flipped_horizontally() const;

    // Content equality: same piece on every square.
    bool operator==(const Board& other) const = default;

private:
    void refresh_occupancy();
};
