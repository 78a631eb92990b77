#include "Attacks.hpp"
#include "MoveGen.hpp"
#include "BitUtil.hpp"
#include "Coords.hpp"

#include <vector>


namespace MoveGen {

namespace {
    void serialize_moves(Square from, Bitboard targets, std::vector<Move>& list, MoveFlag flag = MoveFlag::Quiet) {
        while (targets) {
            Square to = BitUtil::pop_lsb(targets);
            list.emplace_back(from, to, flag);
        }
    }

    // A pawn landing on the last rank must promote: one move per kind.
    void add_pawn_move(Square from, Square to, bool capture, Colour us, std::vector<Move>& list) {
        if (Coords::rank_of(to) == Coords::promotion_rank(us)) {
            for (PieceType t : {PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight}) {
                list.emplace_back(from, to, promotion_flag(t, capture));
            }
            return;
        }
        list.emplace_back(from, to, capture ? MoveFlag::Capture : MoveFlag::Quiet);
    }

    void generate_pawn_moves(const Position& pos, std::vector<Move>& move_list) {
        const Colour us = pos.to_move;
        const Colour them = Coords::inverse(us);

        const Bitboard them_occ = pos.board.bitboard(them);
        const Bitboard all_occ = pos.board.occupancy[2];

        Bitboard pawns = pos.board.pieces[Board::get_piece_index(us, PieceType::Pawn)];

        Bitboard single_push;
        Bitboard double_push;
        int step;
        if (us == Colour::White) {
            single_push = (pawns << 8) & ~all_occ;
            double_push = ((single_push & Attacks::detail::RANK_3) << 8) & ~all_occ;
            step = 8;
        } else { // Black Logic (Shift Down)
            single_push = (pawns >> 8) & ~all_occ;
            double_push = ((single_push & Attacks::detail::RANK_6) >> 8) & ~all_occ;
            step = -8;
        }

        while (single_push) {
            Square to = BitUtil::pop_lsb(single_push);
            add_pawn_move(static_cast<Square>(static_cast<int>(to) - step), to, false, us, move_list);
        }
        while (double_push) {
            Square to = BitUtil::pop_lsb(double_push);
            move_list.emplace_back(static_cast<Square>(static_cast<int>(to) - 2 * step), to, MoveFlag::DoublePawnPush);
        }

        while (pawns) {
            Square from = BitUtil::pop_lsb(pawns);
            const Bitboard attacks = Attacks::PawnAttacks[static_cast<int>(us)][static_cast<int>(from)];

            Bitboard captures = attacks & them_occ;
            while (captures) {
                add_pawn_move(from, BitUtil::pop_lsb(captures), true, us, move_list);
            }

            // En passant lands on an empty square.
            if (pos.en_passant_sq != Square::None
                && (attacks & BitUtil::from_square(pos.en_passant_sq))) {
                move_list.emplace_back(from, pos.en_passant_sq, MoveFlag::EnPassant);
            }
        }
    }

    void generate_piece_moves(const Position& pos, std::vector<Move>& move_list) {
        const Colour us = pos.to_move;
        const Colour them = Coords::inverse(us);

        const Bitboard us_occ = pos.board.bitboard(us);
        const Bitboard them_occ = pos.board.bitboard(them);
        const Bitboard all_occ = pos.board.occupancy[2];

        for (int pt = 1; pt <= 5; ++pt) {
            PieceType type = static_cast<PieceType>(pt);
            Bitboard pieces = pos.board.pieces[Board::get_piece_index(us, type)];

            while (pieces) {
                Square from = BitUtil::pop_lsb(pieces);
                const int s = static_cast<int>(from);
                Bitboard attacks = 0;

                switch (type) {
                    case PieceType::Knight: attacks = Attacks::KnightAttacks[s]; break;
                    case PieceType::Bishop: attacks = Attacks::get_bishop_attacks(s, all_occ); break;
                    case PieceType::Rook:   attacks = Attacks::get_rook_attacks(s, all_occ); break;
                    case PieceType::Queen:  attacks = Attacks::get_queen_attacks(s, all_occ); break;
                    case PieceType::King:   attacks = Attacks::KingAttacks[s]; break;
                    default: break;
                }

                // Mask out our own pieces (can't capture self)
                attacks &= ~us_occ;

                serialize_moves(from, attacks & them_occ, move_list, MoveFlag::Capture);
                serialize_moves(from, attacks & ~them_occ, move_list, MoveFlag::Quiet);
            }
        }
    }

    void generate_castles(const Position& pos, std::vector<Move>& move_list) {
        const Colour us = pos.to_move;
        const Colour them = Coords::inverse(us);
        const Board& board = pos.board;
        const Bitboard all_occ = board.occupancy[2];

        const Rank home = Coords::back_rank(us);
        auto sq = [home](int file) { return Coords::make_square(static_cast<File>(file), home); };

        const Piece king(PieceType::King, us);
        const Piece rook(PieceType::Rook, us);
        if (board.at(sq(4)) != king) return;

        // King side: F and G empty, E F G not attacked.
        if (CastleRights::has(pos.castle_rights, CastleRights::side_bit(us, CastleSide::Kingside))
            && board.at(sq(7)) == rook
            && !BitUtil::get_bit(all_occ, sq(5))
            && !BitUtil::get_bit(all_occ, sq(6))
            && !pos.is_attacked(sq(4), them)
            && !pos.is_attacked(sq(5), them)
            && !pos.is_attacked(sq(6), them)) {
            move_list.push_back(Move::castle(us, CastleSide::Kingside));
        }

        // Queen side: B C D empty, E D C not attacked. B may be attacked.
        if (CastleRights::has(pos.castle_rights, CastleRights::side_bit(us, CastleSide::Queenside))
            && board.at(sq(0)) == rook
            && !BitUtil::get_bit(all_occ, sq(1))
            && !BitUtil::get_bit(all_occ, sq(2))
            && !BitUtil::get_bit(all_occ, sq(3))
            && !pos.is_attacked(sq(4), them)
            && !pos.is_attacked(sq(3), them)
            && !pos.is_attacked(sq(2), them)) {
            move_list.push_back(Move::castle(us, CastleSide::Queenside));
        }
    }

    bool leaves_king_safe(const Position& pos, Move m) {
        const Colour us = pos.to_move;
        Position next = pos.apply(m);
        Square king = next.king_square(us);
        return king != Square::None && !next.is_attacked(king, Coords::inverse(us));
    }
}

void generate_pseudo_legal(const Position& pos, std::vector<Move>& move_list) {
    if (pos.to_move == Colour::None) return;
    generate_pawn_moves(pos, move_list);
    generate_piece_moves(pos, move_list);
    generate_castles(pos, move_list);
}

void generate_legal(const Position& pos, std::vector<Move>& move_list) {
    if (pos.to_move == Colour::None || pos.king_square(pos.to_move) == Square::None) return;

    std::vector<Move> pseudo;
    pseudo.reserve(64);
    generate_pseudo_legal(pos, pseudo);

    for (const auto& m : pseudo) {
        if (leaves_king_safe(pos, m)) move_list.push_back(m);
    }
}

void generate_for_square(const Position& pos, Square from, std::vector<Move>& move_list) {
    std::vector<Move> legal;
    generate_legal(pos, legal);
    for (const auto& m : legal) {
        if (m.from() == from) move_list.push_back(m);
    }
}

bool is_legal(const Position& pos, Move move) {
    std::vector<Move> legal;
    generate_legal(pos, legal);
    for (const auto& m : legal) {
        if (!m.same_squares(move)) continue;
        if (!move.is_promotion() || m.promotion_type() == move.promotion_type()) return true;
    }
    return false;
}

uint64_t perft(const Position& pos, int depth) {
    if (depth <= 0) return 1ULL;

    std::vector<Move> moves;
    moves.reserve(64);
    generate_legal(pos, moves);

    if (depth == 1) return moves.size();

    uint64_t nodes = 0;
    for (const auto& move : moves) {
        nodes += perft(pos.apply(move), depth - 1);
    }
    return nodes;
}

}
