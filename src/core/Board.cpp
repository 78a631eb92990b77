#include "Board.hpp"
#include "Attacks.hpp"
#include "BitUtil.hpp"

namespace {
    // Mirror every set bit through `mask` (56 = ranks, 7 = files).
    Bitboard mirrored(Bitboard bb, int mask) {
        Bitboard out = 0;
        while (bb) {
            int sq = static_cast<int>(BitUtil::pop_lsb(bb));
            out |= 1ULL << (sq ^ mask);
        }
        return out;
    }
}

Board::Board(std::optional<Variant> variant) {
    clear();
    if (!variant) return;

    pieces[0] = 0x000000000000FF00ULL; pieces[6] = 0x00FF000000000000ULL;  // Pawns
    pieces[1] = 0x0000000000000042ULL; pieces[7] = 0x4200000000000000ULL;  // Knights
    pieces[2] = 0x0000000000000024ULL; pieces[8] = 0x2400000000000000ULL;  // Bishops
    pieces[3] = 0x0000000000000081ULL; pieces[9] = 0x8100000000000000ULL;  // Rooks
    pieces[4] = 0x0000000000000008ULL; pieces[10] = 0x0800000000000000ULL; // Queen
    pieces[5] = 0x0000000000000010ULL; pieces[11] = 0x1000000000000000ULL; // King
    refresh_occupancy();
}

void Board::refresh_occupancy() {
    occupancy[0] = 0;
    occupancy[1] = 0;
    for (int i = 0; i < 6; ++i) occupancy[0] |= pieces[i];
    for (int i = 6; i < 12; ++i) occupancy[1] |= pieces[i];
    occupancy[2] = occupancy[0] | occupancy[1];
}

std::optional<Piece> Board::at(Square sq) const {
    if (sq == Square::None || !BitUtil::get_bit(occupancy[2], sq)) return std::nullopt;
    for (size_t i = 0; i < 12; ++i) {
        if (BitUtil::get_bit(pieces[i], sq)) {
            return Piece(static_cast<PieceType>(i % 6), static_cast<Colour>(i / 6));
        }
    }
    return std::nullopt;
}

void Board::set(Square sq, std::optional<Piece> piece) {
    if (sq == Square::None) return;
    for (auto& bb : pieces) BitUtil::clear_bit(bb, sq);
    for (auto& bb : occupancy) BitUtil::clear_bit(bb, sq);
    if (!piece || piece->type == PieceType::None || piece->colour == Colour::None) return;

    BitUtil::set_bit(pieces[piece->index()], sq);
    BitUtil::set_bit(occupancy[static_cast<int>(piece->colour)], sq);
    BitUtil::set_bit(occupancy[2], sq);
}

std::optional<Piece> Board::remove(Square sq) {
    std::optional<Piece> removed = at(sq);
    if (removed) set(sq, std::nullopt);
    return removed;
}

void Board::swap(Square a, Square b) {
    if (a == b) return;
    std::optional<Piece> first = at(a);
    std::optional<Piece> second = at(b);
    set(a, second);
    set(b, first);
}

void Board::clear() {
    pieces.fill(0);
    occupancy.fill(0);
}

std::vector<Board::Space> Board::spaces() const {
    std::vector<Space> out;
    out.reserve(64);
    for (int sq = 0; sq < 64; ++sq) {
        out.push_back({static_cast<Square>(sq), at(static_cast<Square>(sq))});
    }
    return out;
}

std::vector<Piece> Board::all_pieces() const {
    std::vector<Piece> out;
    Bitboard occ = occupancy[2];
    while (occ) {
        Square sq = BitUtil::pop_lsb(occ);
        out.push_back(*at(sq));
    }
    return out;
}

std::vector<Piece> Board::pieces_of(Colour c) const {
    std::vector<Piece> out;
    if (c == Colour::None) return out;
    Bitboard occ = occupancy[static_cast<int>(c)];
    while (occ) {
        Square sq = BitUtil::pop_lsb(occ);
        out.push_back(*at(sq));
    }
    return out;
}

int Board::piece_count(Colour c) const {
    if (c == Colour::None) return BitUtil::count_bits(occupancy[2]);
    return BitUtil::count_bits(occupancy[static_cast<int>(c)]);
}

int Board::count(Piece piece) const {
    if (piece.type == PieceType::None || piece.colour == Colour::None) return 0;
    return BitUtil::count_bits(pieces[piece.index()]);
}

std::vector<Square> Board::squares_of(Piece piece) const {
    std::vector<Square> out;
    if (piece.type == PieceType::None || piece.colour == Colour::None) return out;
    Bitboard bb = pieces[piece.index()];
    while (bb) out.push_back(BitUtil::pop_lsb(bb));
    return out;
}

std::vector<Square> Board::squares_of(Colour c) const {
    std::vector<Square> out;
    if (c == Colour::None) return out;
    Bitboard bb = occupancy[static_cast<int>(c)];
    while (bb) out.push_back(BitUtil::pop_lsb(bb));
    return out;
}

Square Board::square_for_king(Colour c) const {
    if (c == Colour::None) return Square::None;
    Bitboard kings = pieces[get_piece_index(c, PieceType::King)];
    if (!kings) return Square::None;
    return static_cast<Square>(BitUtil::lsb(kings));
}

Bitboard Board::attackers_to(Square sq, Colour attacker) const {
    return Attacks::attackers_to(sq, attacker, pieces, occupancy[2]);
}

bool Board::king_is_checked(Colour c) const {
    Square king = square_for_king(c);
    if (king == Square::None) return false;
    Colour them = (c == Colour::White) ? Colour::Black : Colour::White;
    return attackers_to(king, them) != 0;
}

Board Board::flipped_vertically() const {
    Board out(std::nullopt);
    for (size_t i = 0; i < 12; ++i) out.pieces[i] = mirrored(pieces[i], 56);
    out.refresh_occupancy();
    return out;
}

Board Board::flipped_horizontally() const {
    Board out(std::nullopt);
    for (size_t i = 0; i < 12; ++i) out.pieces[i] = mirrored(pieces[i], 7);
    out.refresh_occupancy();
    return out;
}
