#pragma once

#include "Types.hpp"
#include "BitUtil.hpp"

#include <array>


namespace Attacks {

enum Direction : int { North, South, East, West, NorthEast, NorthWest, SouthEast, SouthWest };

namespace detail {
    static constexpr Bitboard FILE_A{0x0101010101010101ULL};
    static constexpr Bitboard FILE_B{FILE_A << 1};
    static constexpr Bitboard FILE_G{FILE_A << 6};
    static constexpr Bitboard FILE_H{FILE_A << 7};

    static constexpr Bitboard NOT_A{~FILE_A};
    static constexpr Bitboard NOT_AB{~(FILE_A | FILE_B)};
    static constexpr Bitboard NOT_H{~FILE_H};
    static constexpr Bitboard NOT_GH{~(FILE_G | FILE_H)};

    static constexpr Bitboard RANK_1{0x00000000000000FFULL};
    static constexpr Bitboard RANK_2{RANK_1 << 8};
    static constexpr Bitboard RANK_3{RANK_1 << 16};
    static constexpr Bitboard RANK_6{RANK_1 << 40};
    static constexpr Bitboard RANK_7{RANK_1 << 48};
    static constexpr Bitboard RANK_8{RANK_1 << 56};

    constexpr Bitboard gen_knight_mask(int sq) {
        Bitboard b{1ULL << sq};
        Bitboard knight{0};
        knight |= (b << 17) & NOT_A;  knight |= (b << 15) & NOT_H;
        knight |= (b >> 15) & NOT_A;  knight |= (b >> 17) & NOT_H;
        knight |= (b << 10) & NOT_AB; knight |= (b << 6)  & NOT_GH;
        knight |= (b >> 6)  & NOT_AB; knight |= (b >> 10) & NOT_GH;
        return knight;
    }

    constexpr Bitboard gen_king_mask(int sq) {
        Bitboard b{1ULL << sq};
        Bitboard king{0};
        king |= (b << 8) | (b >> 8);
        king |= ((b << 1) | (b << 9) | (b >> 7)) & NOT_A;
        king |= ((b >> 1) | (b >> 9) | (b << 7)) & NOT_H;
        return king;
    }

    // Squares strictly beyond `sq` in direction `dir`, up to the board edge.
    constexpr Bitboard gen_ray(int sq, int dir) {
        constexpr int df[8] = {0, 0, 1, -1, 1, -1, 1, -1};
        constexpr int dr[8] = {1, -1, 0, 0, 1, 1, -1, -1};
        Bitboard ray{0};
        int f = (sq & 7) + df[dir];
        int r = (sq >> 3) + dr[dir];
        while (f >= 0 && f <= 7 && r >= 0 && r <= 7) {
            ray |= 1ULL << (r * 8 + f);
            f += df[dir];
            r += dr[dir];
        }
        return ray;
    }

    constexpr std::array<Bitboard, 64> init_knights() {
        std::array<Bitboard, 64> arr{};
        for (int i = 0; i < 64; ++i) arr[i] = gen_knight_mask(i);
        return arr;
    }

    constexpr std::array<Bitboard, 64> init_kings() {
        std::array<Bitboard, 64> arr{};
        for (int i = 0; i < 64; ++i) arr[i] = gen_king_mask(i);
        return arr;
    }

    constexpr std::array<std::array<Bitboard, 64>, 2> init_pawns() {
        std::array<std::array<Bitboard, 64>, 2> arr{};
        for (int i = 0; i < 64; ++i) {
            Bitboard b{1ULL << i};
            arr[0][i] = ((b << 7) & NOT_H) | ((b << 9) & NOT_A); // White
            arr[1][i] = ((b >> 7) & NOT_A) | ((b >> 9) & NOT_H); // Black
        }
        return arr;
    }

    constexpr std::array<std::array<Bitboard, 64>, 8> init_rays() {
        std::array<std::array<Bitboard, 64>, 8> arr{};
        for (int d = 0; d < 8; ++d) {
            for (int i = 0; i < 64; ++i) arr[d][i] = gen_ray(i, d);
        }
        return arr;
    }

    // Directions whose squares have increasing indices.
    constexpr bool is_positive(int dir) {
        return dir == North || dir == East || dir == NorthEast || dir == NorthWest;
    }
} // namespace detail


// Global Tables
inline constexpr std::array<Bitboard, 64> KnightAttacks = detail::init_knights();
inline constexpr std::array<Bitboard, 64> KingAttacks = detail::init_kings();
inline constexpr std::array<std::array<Bitboard, 64>, 2> PawnAttacks = detail::init_pawns();
inline constexpr std::array<std::array<Bitboard, 64>, 8> Rays = detail::init_rays();


// Ray from `sq` in `dir`, cut after the first occupied square (which is included).
constexpr Bitboard ray_attacks(int sq, int dir, Bitboard occ) {
    Bitboard attacks = Rays[dir][sq];
    Bitboard blockers = attacks & occ;
    if (blockers) {
        int first = detail::is_positive(dir) ? BitUtil::lsb(blockers) : BitUtil::msb(blockers);
        attacks ^= Rays[dir][first];
    }
    return attacks;
}

constexpr Bitboard get_rook_attacks(int sq, Bitboard occ) {
    return ray_attacks(sq, North, occ) | ray_attacks(sq, South, occ)
         | ray_attacks(sq, East, occ) | ray_attacks(sq, West, occ);
}

constexpr Bitboard get_bishop_attacks(int sq, Bitboard occ) {
    return ray_attacks(sq, NorthEast, occ) | ray_attacks(sq, NorthWest, occ)
         | ray_attacks(sq, SouthEast, occ) | ray_attacks(sq, SouthWest, occ);
}

constexpr Bitboard get_queen_attacks(int sq, Bitboard occ) {
    return get_rook_attacks(sq, occ) | get_bishop_attacks(sq, occ);
}


// Public API

// Pieces of `attacker` (from the 12 piece boards) that attack `sq` given `all_occ`.
Bitboard attackers_to(Square sq, Colour attacker,
                      const std::array<Bitboard, 12>& pieces,
                      Bitboard all_occ);

bool is_square_attacked(Square sq, Colour attacker,
                        const std::array<Bitboard, 12>& pieces,
                        Bitboard all_occ);

}
