#pragma once

#include <gtest/gtest.h>
#include "Fen.hpp"
#include "Game.hpp"
#include "MoveGen.hpp"
#include "Notation.hpp"

#include <optional>
#include <random>
#include <string_view>
#include <vector>

// --- TEST HELPERS ---

inline Position position_from_fen(std::string_view fen) {
    std::optional<Position> pos = Fen::to_position(fen);
    EXPECT_TRUE(pos.has_value()) << "Test FEN rejected: " << fen;
    return pos.value_or(Position());
}

inline Move mv(std::string_view text) {
    std::optional<Notation::ParsedMove> parsed = Notation::parse_move(text);
    EXPECT_TRUE(parsed.has_value()) << "Bad move text: " << text;
    return parsed ? parsed->move : Move();
}

// Plays a coordinate move such as "e7e8q".
inline MoveError play(Game& game, std::string_view text) {
    std::optional<Notation::ParsedMove> parsed = Notation::parse_move(text);
    if (!parsed) return MoveError::IllegalMove;
    return game.execute(parsed->move, parsed->promotion);
}

inline bool contains_squares(const std::vector<Move>& moves, Square from, Square to) {
    for (const auto& m : moves) {
        if (m.from() == from && m.to() == to) return true;
    }
    return false;
}

// Random legal moves until the game completes. Returns false if it never does.
inline bool play_random_game(Game& game, std::mt19937& rng, int max_plies = 20000) {
    for (int ply = 0; ply < max_plies; ++ply) {
        if (game.get_game_state() == GameState::Complete) return true;
        std::vector<Move> moves = game.legal_moves();
        if (moves.empty()) return false;
        std::uniform_int_distribution<size_t> pick(0, moves.size() - 1);
        if (game.execute(moves[pick(rng)]) != MoveError::None) return false;
    }
    return game.get_game_state() == GameState::Complete;
}
