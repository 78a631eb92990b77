#pragma once

#include "IChessCore.hpp"
#include "Draw.hpp"

#include <optional>
#include <string>
#include <vector>


struct GameParams {
    // Checked in order after checkmate and stalemate. Empty for the bare rules.
    std::vector<DrawRule> draw_rules = Draw::standard_rules();
};

class Game : public IChessCore {
public:
    struct HistoryEntry {
        Position position;      // before the move
        Move move;              // as generated, flags included
        PieceType promotion;
        std::optional<Piece> captured;
    };

    struct RedoEntry {
        Move move;
        PieceType promotion;
    };

    explicit Game(GameParams params = GameParams());
    explicit Game(const Position& start, GameParams params = GameParams());

    // Replays `moves` from the standard position. On failure `out` holds the
    // game up to the rejected move.
    [[nodiscard]] static MoveError from_moves(const std::vector<Move>& moves, Game& out,
                                              GameParams params = GameParams());

    [[nodiscard]] MoveError execute(Move move, PieceType promotion = PieceType::None) override;
    std::optional<Move> undo_move() override;
    std::optional<Move> redo_move() override;

    std::optional<Move> move_to_undo() const;
    std::optional<Move> move_to_redo() const;

    // Empty once the game is complete.
    std::vector<Move> legal_moves() const override;
    std::vector<Move> legal_moves_from(Square from) const;

    GameState get_game_state() const override { return outcome_ ? GameState::Complete : GameState::InProgress; }
    std::optional<Outcome> outcome() const override { return outcome_; }

    bool is_check() const { return position_.is_check(); }
    bool is_check(Colour side) const override;

    const Position& get_position() const override { return position_; }
    const Position& start_position() const { return start_; }
    const std::vector<HistoryEntry>& history() const { return history_; }

    std::vector<Move> played_moves() const;
    size_t move_count() const { return history_.size(); }

    // Pieces taken so far, in capture order. Colour::None gives both sides.
    std::vector<Piece> captured_pieces(Colour colour = Colour::None) const;

    void reset() override;
    bool fen(std::string_view fen) override;
    std::string fen() const;

private:
    MoveError play(Move move, PieceType promotion);
    void evaluate_outcome();

    GameParams params_;
    Position start_;
    Position position_;
    std::vector<HistoryEntry> history_;
    std::vector<RedoEntry> redo_;
    std::optional<Outcome> outcome_;
};
