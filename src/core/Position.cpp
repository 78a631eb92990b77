#include "Position.hpp"
#include "Attacks.hpp"
#include "Coords.hpp"
#include "MoveGen.hpp"

#include <cstdint>
#include <vector>

namespace {
    struct CastleCorner {
        uint8_t right;
        Square king;
        Square rook;
    };

    constexpr CastleCorner CORNERS[4] = {
        {CastleRights::WhiteKingside,  Square::E1, Square::H1},
        {CastleRights::WhiteQueenside, Square::E1, Square::A1},
        {CastleRights::BlackKingside,  Square::E8, Square::H8},
        {CastleRights::BlackQueenside, Square::E8, Square::A8},
    };

    bool is_valid_promotion(PieceType t) {
        return t == PieceType::Knight || t == PieceType::Bishop
            || t == PieceType::Rook || t == PieceType::Queen;
    }
}

Position::Position()
    : board(Variant::Standard),
      to_move(Colour::White),
      en_passant_sq(Square::None),
      castle_rights(CastleRights::All),
      half_move_clock(0),
      full_move_number(1) {}

SetupError Position::from_record(const PositionRecord& record, Position& out) {
    const Board& b = record.board;

    if (record.to_move != Colour::White && record.to_move != Colour::Black) {
        return SetupError::BadSideToMove;
    }

    for (Colour c : {Colour::White, Colour::Black}) {
        int kings = b.count(Piece(PieceType::King, c));
        if (kings == 0) return SetupError::MissingKing;
        if (kings > 1) return SetupError::ExtraKing;
    }

    Bitboard pawns = b.pieces[Board::get_piece_index(Colour::White, PieceType::Pawn)]
                   | b.pieces[Board::get_piece_index(Colour::Black, PieceType::Pawn)];
    if (pawns & (Attacks::detail::RANK_1 | Attacks::detail::RANK_8)) {
        return SetupError::PawnOnBackRank;
    }

    for (const auto& corner : CORNERS) {
        if (!CastleRights::has(record.castle_rights, corner.right)) continue;
        Colour c = Coords::rank_of(corner.king) == Rank::R1 ? Colour::White : Colour::Black;
        if (b.at(corner.king) != Piece(PieceType::King, c)
            || b.at(corner.rook) != Piece(PieceType::Rook, c)) {
            return SetupError::BadCastlingRights;
        }
    }
    if (record.castle_rights & ~CastleRights::All) return SetupError::BadCastlingRights;

    if (record.en_passant_sq != Square::None) {
        const Square ep = record.en_passant_sq;
        const Colour us = record.to_move;
        const Colour them = Coords::inverse(us);
        // The pushed pawn sits one rank past the target, its origin one rank before.
        const Square pushed = Coords::forward(ep, them);
        const Square origin = Coords::forward(ep, us);
        if (!Coords::is_valid(ep)
            || Coords::rank_of(origin) != Coords::pawn_rank(them)
            || b.at(ep).has_value()
            || b.at(origin).has_value()
            || b.at(pushed) != Piece(PieceType::Pawn, them)) {
            return SetupError::BadEnPassant;
        }
    }

    if (record.full_move_number == 0) return SetupError::BadMoveNumber;

    if (b.king_is_checked(Coords::inverse(record.to_move))) return SetupError::OpponentInCheck;

    out.board = record.board;
    out.to_move = record.to_move;
    out.castle_rights = record.castle_rights;
    out.en_passant_sq = record.en_passant_sq;
    out.half_move_clock = record.half_move_clock;
    out.full_move_number = record.full_move_number;
    return SetupError::None;
}

PositionRecord Position::to_record() const {
    PositionRecord record;
    record.board = board;
    record.to_move = to_move;
    record.castle_rights = castle_rights;
    record.en_passant_sq = en_passant_sq;
    record.half_move_clock = half_move_clock;
    record.full_move_number = full_move_number;
    return record;
}

MoveError Position::resolve(Move move, PieceType promotion, Move& out) const {
    if (king_square(to_move) == Square::None) return MoveError::NoKing;

    if (promotion == PieceType::None && move.is_promotion()) {
        promotion = move.promotion_type();
    }

    std::vector<Move> legal;
    MoveGen::generate_legal(*this, legal);

    bool found = false;
    for (const Move& m : legal) {
        if (!m.same_squares(move)) continue;
        found = true;

        if (!m.is_promotion()) {
            if (promotion != PieceType::None) return MoveError::InvalidPromotion;
            out = m;
            return MoveError::None;
        }

        if (promotion == PieceType::None) return MoveError::MissingPromotion;
        if (!is_valid_promotion(promotion)) return MoveError::InvalidPromotion;
        if (m.promotion_type() == promotion) {
            out = m;
            return MoveError::None;
        }
    }

    return found ? MoveError::InvalidPromotion : MoveError::IllegalMove;
}

MoveError Position::successor(Move move, PieceType promotion, Position& out) const {
    Move resolved;
    MoveError err = resolve(move, promotion, resolved);
    if (err != MoveError::None) return err;
    out = apply(resolved);
    return MoveError::None;
}

Position Position::apply(Move m) const {
    Position next = *this;

    const Square from = m.from();
    const Square to = m.to();
    const Colour us = to_move;
    const Colour them = Coords::inverse(us);

    std::optional<Piece> moving = board.at(from);
    if (!moving) return next;

    bool capture = false;
    if (m.is_en_passant()) {
        // The captured pawn stands behind the target square, not on it.
        next.board.set(Coords::forward(to, them), std::nullopt);
        capture = true;
    } else if (board.at(to)) {
        capture = true;
    }

    Piece placed = *moving;
    if (m.is_promotion()) placed = Piece(m.promotion_type(), us);
    next.board.set(from, std::nullopt);
    next.board.set(to, placed);

    if (m.flags() == MoveFlag::KingCastle) {
        const Square r_from = (us == Colour::White) ? Square::H1 : Square::H8;
        const Square r_to = (us == Colour::White) ? Square::F1 : Square::F8;
        next.board.swap(r_from, r_to);
    } else if (m.flags() == MoveFlag::QueenCastle) {
        const Square r_from = (us == Colour::White) ? Square::A1 : Square::A8;
        const Square r_to = (us == Colour::White) ? Square::D1 : Square::D8;
        next.board.swap(r_from, r_to);
    }

    // Update Rights
    if (moving->is_king()) next.castle_rights &= ~CastleRights::of(us);
    for (const auto& corner : CORNERS) {
        if (from == corner.rook || to == corner.rook) next.castle_rights &= ~corner.right;
    }

    // Update En Passant
    next.en_passant_sq = Square::None;
    if (m.is_double_push()) next.en_passant_sq = Coords::forward(from, us);

    // Counters saturate at their maximum rather than wrapping.
    if (capture || moving->is_pawn()) next.half_move_clock = 0;
    else if (next.half_move_clock < UINT16_MAX) next.half_move_clock++;

    next.to_move = them;
    if (us == Colour::Black && next.full_move_number < UINT16_MAX) next.full_move_number++;

    return next;
}

bool Position::is_attacked(Square sq, Colour by) const {
    return Attacks::is_square_attacked(sq, by, board.pieces, board.occupancy[2]);
}

bool Position::is_check() const {
    Square king = king_square(to_move);
    if (king == Square::None) return false;
    return is_attacked(king, Coords::inverse(to_move));
}
