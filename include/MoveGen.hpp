#pragma once
#include "Position.hpp"
#include <cstdint>
#include <vector>

namespace MoveGen {
    // Geometry only: the mover's king may be left in check.
    void generate_pseudo_legal(const Position& pos, std::vector<Move>& move_list);

    // Pseudo-legal moves that do not leave the mover's king attacked.
    // Empty when the side to move has no king.
    void generate_legal(const Position& pos, std::vector<Move>& move_list);

    void generate_for_square(const Position& pos, Square from, std::vector<Move>& move_list);

    // True when some legal move has the same start and end (and, for a
    // flagged promotion, the same promotion kind).
    bool is_legal(const Position& pos, Move move);

    // Leaf count of the legal move tree to `depth` plies.
    uint64_t perft(const Position& pos, int depth);
}
