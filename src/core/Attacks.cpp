#include "Attacks.hpp"
#include "BitUtil.hpp"

namespace Attacks {

Bitboard attackers_to(Square sq, Colour attacker,
                      const std::array<Bitboard, 12>& pieces,
                      Bitboard all_occ) {
    if (sq == Square::None || attacker == Colour::None) return 0;

    int s = static_cast<int>(sq);
    int us = static_cast<int>(attacker);
    int them = us ^ 1;

    // A pawn of `attacker` hits `sq` from the squares a pawn of the other colour would hit.
    Bitboard attackers = PawnAttacks[them][s] & pieces[us * 6];
    attackers |= KnightAttacks[s] & pieces[us * 6 + 1];
    attackers |= KingAttacks[s] & pieces[us * 6 + 5];

    Bitboard bishops = pieces[us * 6 + 2] | pieces[us * 6 + 4];
    if (bishops) attackers |= get_bishop_attacks(s, all_occ) & bishops;

    Bitboard rooks = pieces[us * 6 + 3] | pieces[us * 6 + 4];
    if (rooks) attackers |= get_rook_attacks(s, all_occ) & rooks;

    return attackers;
}

bool is_square_attacked(Square sq, Colour attacker,
                        const std::array<Bitboard, 12>& pieces,
                        Bitboard all_occ) {
    return attackers_to(sq, attacker, pieces, all_occ) != 0;
}

}
