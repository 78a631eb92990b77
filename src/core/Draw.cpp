#include "Draw.hpp"
#include "BitUtil.hpp"
#include "Coords.hpp"


namespace Draw {

bool fifty_move_rule(const Position& pos) {
    return pos.half_move_clock >= 100;
}

bool insufficient_material(const Position& pos) {
    const Board& b = pos.board;
    auto bb = [&b](Colour c, PieceType t) { return b.bitboard(Piece(t, c)); };

    // Any pawn, rook or queen can still force mate.
    for (Colour c : {Colour::White, Colour::Black}) {
        if (bb(c, PieceType::Pawn) | bb(c, PieceType::Rook) | bb(c, PieceType::Queen)) return false;
    }

    const int knights = BitUtil::count_bits(bb(Colour::White, PieceType::Knight) | bb(Colour::Black, PieceType::Knight));
    const Bitboard bishops = bb(Colour::White, PieceType::Bishop) | bb(Colour::Black, PieceType::Bishop);
    const int bishop_count = BitUtil::count_bits(bishops);

    if (knights + bishop_count <= 1) return true;
    if (knights > 0) return false;

    // Bishops only: drawn when every bishop stands on the same square colour.
    Bitboard rest = bishops;
    const bool first_light = Coords::square_is_light(BitUtil::pop_lsb(rest));
    while (rest) {
        if (Coords::square_is_light(BitUtil::pop_lsb(rest)) != first_light) return false;
    }
    return true;
}

std::vector<Rule> standard_rules() {
    return {
        {OutcomeReason::FiftyMoveRule, &fifty_move_rule},
        {OutcomeReason::InsufficientMaterial, &insufficient_material},
    };
}

}
