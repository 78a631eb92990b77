#include "Game.hpp"
#include "Coords.hpp"
#include "Fen.hpp"
#include "MoveGen.hpp"

#include <utility>


Game::Game(GameParams params)
    : Game(Position::standard(), std::move(params)) {}

Game::Game(const Position& start, GameParams params)
    : params_(std::move(params)), start_(start), position_(start) {
    evaluate_outcome();
}

MoveError Game::from_moves(const std::vector<Move>& moves, Game& out, GameParams params) {
    out = Game(std::move(params));
    for (const Move& m : moves) {
        MoveError err = out.execute(m);
        if (err != MoveError::None) return err;
    }
    return MoveError::None;
}

MoveError Game::execute(Move move, PieceType promotion) {
    MoveError err = play(move, promotion);
    if (err == MoveError::None) redo_.clear();
    return err;
}

MoveError Game::play(Move move, PieceType promotion) {
    if (outcome_) return MoveError::IllegalMove;

    Move resolved;
    MoveError err = position_.resolve(move, promotion, resolved);
    if (err != MoveError::None) return err;

    std::optional<Piece> captured = position_.board.at(resolved.to());
    if (resolved.is_en_passant()) {
        captured = Piece(PieceType::Pawn, Coords::inverse(position_.to_move));
    }

    history_.push_back({position_, resolved, resolved.promotion_type(), captured});
    position_ = position_.apply(resolved);
    evaluate_outcome();
    return MoveError::None;
}

std::optional<Move> Game::undo_move() {
    if (history_.empty()) return std::nullopt;

    HistoryEntry last = history_.back();
    history_.pop_back();

    position_ = last.position;
    redo_.push_back({last.move, last.promotion});
    evaluate_outcome();
    return last.move;
}

std::optional<Move> Game::redo_move() {
    if (redo_.empty()) return std::nullopt;

    RedoEntry next = redo_.back();
    if (play(next.move, next.promotion) != MoveError::None) return std::nullopt;
    redo_.pop_back();
    return next.move;
}

std::optional<Move> Game::move_to_undo() const {
    if (history_.empty()) return std::nullopt;
    return history_.back().move;
}

std::optional<Move> Game::move_to_redo() const {
    if (redo_.empty()) return std::nullopt;
    return redo_.back().move;
}

std::vector<Move> Game::legal_moves() const {
    std::vector<Move> moves;
    if (outcome_) return moves;
    MoveGen::generate_legal(position_, moves);
    return moves;
}

std::vector<Move> Game::legal_moves_from(Square from) const {
    std::vector<Move> moves;
    if (outcome_) return moves;
    MoveGen::generate_for_square(position_, from, moves);
    return moves;
}

bool Game::is_check(Colour side) const {
    Square king = position_.king_square(side);
    if (king == Square::None) return false;
    return position_.is_attacked(king, Coords::inverse(side));
}

std::vector<Move> Game::played_moves() const {
    std::vector<Move> moves;
    moves.reserve(history_.size());
    for (const auto& h : history_) moves.push_back(h.move);
    return moves;
}

std::vector<Piece> Game::captured_pieces(Colour colour) const {
    std::vector<Piece> pieces;
    for (const auto& h : history_) {
        if (!h.captured) continue;
        if (colour == Colour::None || h.captured->colour == colour) pieces.push_back(*h.captured);
    }
    return pieces;
}

void Game::reset() {
    position_ = start_;
    history_.clear();
    redo_.clear();
    evaluate_outcome();
}

bool Game::fen(std::string_view fen) {
    std::optional<Position> pos = Fen::to_position(fen);
    if (!pos) return false;

    start_ = *pos;
    reset();
    return true;
}

std::string Game::fen() const {
    return Fen::format(position_);
}

void Game::evaluate_outcome() {
    outcome_.reset();

    std::vector<Move> moves;
    MoveGen::generate_legal(position_, moves);
    if (moves.empty()) {
        if (position_.is_check()) outcome_ = Outcome::checkmate(Coords::inverse(position_.to_move));
        else outcome_ = Outcome::draw(OutcomeReason::Stalemate);
        return;
    }

    for (const auto& rule : params_.draw_rules) {
        if (rule.applies && rule.applies(position_)) {
            outcome_ = Outcome::draw(rule.reason);
            return;
        }
    }
}
