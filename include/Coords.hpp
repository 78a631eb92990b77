#pragma once

#include "Types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace Coords {

inline constexpr std::array<File, 8> ALL_FILES{
    File::A, File::B, File::C, File::D, File::E, File::F, File::G, File::H};
inline constexpr std::array<Rank, 8> ALL_RANKS{
    Rank::R1, Rank::R2, Rank::R3, Rank::R4, Rank::R5, Rank::R6, Rank::R7, Rank::R8};

constexpr Colour inverse(Colour c) {
    if (c == Colour::None) return Colour::None;
    return (c == Colour::White) ? Colour::Black : Colour::White;
}

constexpr File file_of(Square sq) { return static_cast<File>(static_cast<int>(sq) & 7); }
constexpr Rank rank_of(Square sq) { return static_cast<Rank>(static_cast<int>(sq) >> 3); }

constexpr Square make_square(File f, Rank r) {
    return static_cast<Square>(static_cast<int>(r) * 8 + static_cast<int>(f));
}

constexpr bool is_valid(Square sq) {
    return static_cast<int>(sq) >= 0 && static_cast<int>(sq) < 64;
}

constexpr File opposite(File f) { return static_cast<File>(7 - static_cast<int>(f)); }
constexpr Rank opposite(Rank r) { return static_cast<Rank>(7 - static_cast<int>(r)); }

// Square::None when the step leaves the board.
constexpr Square offset(Square sq, int file_delta, int rank_delta) {
    if (!is_valid(sq)) return Square::None;
    const int f = static_cast<int>(file_of(sq)) + file_delta;
    const int r = static_cast<int>(rank_of(sq)) + rank_delta;
    if (f < 0 || f > 7 || r < 0 || r > 7) return Square::None;
    return static_cast<Square>(r * 8 + f);
}

// n ranks towards the far side for `colour`.
constexpr Square forward(Square sq, Colour colour, int n = 1) {
    return offset(sq, 0, colour == Colour::White ? n : -n);
}

constexpr Square rotate(Square sq) {
    return is_valid(sq) ? static_cast<Square>(63 - static_cast<int>(sq)) : Square::None;
}

// a1 is dark.
constexpr bool square_is_light(Square sq) {
    return ((static_cast<int>(file_of(sq)) + static_cast<int>(rank_of(sq))) & 1) != 0;
}

constexpr Rank back_rank(Colour c) { return c == Colour::White ? Rank::R1 : Rank::R8; }
constexpr Rank pawn_rank(Colour c) { return c == Colour::White ? Rank::R2 : Rank::R7; }
constexpr Rank promotion_rank(Colour c) { return c == Colour::White ? Rank::R8 : Rank::R1; }

namespace detail {
    template <typename E>
    std::vector<E> walk(E from, E to, bool inclusive) {
        std::vector<E> out;
        const int a = static_cast<int>(from);
        const int b = static_cast<int>(to);
        const int step = (b >= a) ? 1 : -1;
        if (inclusive) {
            for (int i = a; ; i += step) {
                out.push_back(static_cast<E>(i));
                if (i == b) break;
            }
        } else {
            for (int i = a + step; i != b && a != b; i += step) {
                out.push_back(static_cast<E>(i));
            }
        }
        return out;
    }
}

// Inclusive, ordered from `from` to `to` (descending when to < from).
inline std::vector<File> to(File from, File to) { return detail::walk(from, to, true); }
inline std::vector<Rank> to(Rank from, Rank to) { return detail::walk(from, to, true); }

// Exclusive of both ends.
inline std::vector<File> between(File from, File to) { return detail::walk(from, to, false); }
inline std::vector<Rank> between(Rank from, Rank to) { return detail::walk(from, to, false); }

std::optional<File> file_from_char(char c);
std::optional<Rank> rank_from_char(char c);
std::optional<Rank> rank_from_number(int n);

char file_char(File f);
char rank_char(Rank r);

Square square_from_name(std::string_view name);
std::string square_name(Square sq);

}
