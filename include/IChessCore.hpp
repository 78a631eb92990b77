#pragma once

#include "Types.hpp"
#include "Position.hpp"
#include "Outcome.hpp"

#include <optional>
#include <vector>
#include <string_view>


enum class GameState : uint8_t { InProgress, Complete };

class IChessCore {
public:
    virtual ~IChessCore() = default;

    // Nothing changes unless the result is MoveError::None.
    [[nodiscard]] virtual MoveError execute(Move move, PieceType promotion = PieceType::None) = 0;
    virtual std::optional<Move> undo_move() = 0;
    virtual std::optional<Move> redo_move() = 0;

    virtual std::vector<Move> legal_moves() const = 0;
    virtual GameState get_game_state() const = 0;
    virtual std::optional<Outcome> outcome() const = 0;
    virtual bool is_check(Colour side) const = 0;
    virtual const Position& get_position() const = 0;
    virtual void reset() = 0;
    virtual bool fen(std::string_view fen) = 0;
};
