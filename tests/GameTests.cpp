#include "TestHelpers.hpp"
#include "Coords.hpp"

// --- TEST CASES ---

TEST(GameTest, UndoRestoresEveryPriorPosition) {
    const Position start;
    std::vector<Move> legal;
    MoveGen::generate_legal(start, legal);

    for (const auto& m : legal) {
        Game game;
        ASSERT_EQ(game.execute(m), MoveError::None);
        const Position after = game.get_position();

        EXPECT_EQ(game.undo_move(), m);
        EXPECT_EQ(game.get_position(), start);

        EXPECT_EQ(game.redo_move(), m);
        EXPECT_EQ(game.get_position(), after);
    }
}

TEST(GameTest, UndoRedoOnEmptyStacks) {
    Game game;
    EXPECT_FALSE(game.undo_move().has_value());
    EXPECT_FALSE(game.redo_move().has_value());
    EXPECT_FALSE(game.move_to_undo().has_value());
    EXPECT_FALSE(game.move_to_redo().has_value());
}

TEST(GameTest, ExecuteClearsRedo) {
    Game game;
    ASSERT_EQ(play(game, "e2e4"), MoveError::None);
    ASSERT_EQ(play(game, "e7e5"), MoveError::None);
    game.undo_move();
    EXPECT_EQ(game.move_to_redo(), Move(Square::E7, Square::E5, MoveFlag::DoublePawnPush));
    EXPECT_EQ(game.move_to_undo(), Move(Square::E2, Square::E4, MoveFlag::DoublePawnPush));

    ASSERT_EQ(play(game, "d7d5"), MoveError::None);
    EXPECT_FALSE(game.move_to_redo().has_value());
    EXPECT_FALSE(game.redo_move().has_value());
}

TEST(GameTest, FailedExecuteChangesNothing) {
    Game game;
    ASSERT_EQ(play(game, "e2e4"), MoveError::None);
    game.undo_move();

    const Position before = game.get_position();
    EXPECT_EQ(play(game, "e2e5"), MoveError::IllegalMove);
    EXPECT_EQ(game.get_position(), before);
    EXPECT_EQ(game.move_count(), 0u);
    EXPECT_TRUE(game.move_to_redo().has_value());
}

// g7 keeps its double step after an en passant window opens and closes.
TEST(GameTest, PawnMovesSurviveUndoRedo) {
    Game game;
    for (auto text : {"e2e4", "f7f5", "e4f5"}) {
        ASSERT_EQ(play(game, text), MoveError::None) << text;
    }

    auto check_g7 = [&game]() {
        std::vector<Move> moves = game.legal_moves_from(Square::G7);
        ASSERT_EQ(moves.size(), 2u);
        EXPECT_TRUE(contains_squares(moves, Square::G7, Square::G6));
        EXPECT_TRUE(contains_squares(moves, Square::G7, Square::G5));
    };
    check_g7();

    ASSERT_TRUE(game.undo_move().has_value());
    ASSERT_TRUE(game.redo_move().has_value());
    check_g7();
}

TEST(GameTest, FoolsMate) {
    Game game;
    for (auto text : {"f2f3", "e7e5", "g2g4", "d8h4"}) {
        ASSERT_EQ(play(game, text), MoveError::None) << text;
    }
    ASSERT_EQ(game.get_game_state(), GameState::Complete);
    ASSERT_TRUE(game.outcome().has_value());
    EXPECT_EQ(game.outcome()->reason, OutcomeReason::Checkmate);
    EXPECT_EQ(game.outcome()->winner, Colour::Black);
    EXPECT_EQ(game.outcome()->to_string(), "0-1");
    EXPECT_EQ(game.outcome()->value_for(Colour::White), 0.0);
    EXPECT_TRUE(game.is_check());
    EXPECT_TRUE(game.legal_moves().empty());

    // A finished game accepts no further moves until undone.
    EXPECT_EQ(play(game, "a2a3"), MoveError::IllegalMove);
    game.undo_move();
    EXPECT_EQ(game.get_game_state(), GameState::InProgress);
    EXPECT_FALSE(game.outcome().has_value());
}

TEST(GameTest, Stalemate) {
    Game game(position_from_fen("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"));
    ASSERT_EQ(game.get_game_state(), GameState::Complete);
    EXPECT_EQ(game.outcome()->reason, OutcomeReason::Stalemate);
    EXPECT_TRUE(game.outcome()->is_draw());
    EXPECT_FALSE(game.is_check());
}

TEST(GameTest, DrawRulesAreConfigurable) {
    const Position bare = position_from_fen("8/8/8/4k3/8/8/8/4K3 w - - 0 1");

    Game standard(bare);
    ASSERT_EQ(standard.get_game_state(), GameState::Complete);
    EXPECT_EQ(standard.outcome()->reason, OutcomeReason::InsufficientMaterial);

    GameParams params;
    params.draw_rules.clear();
    Game unrestricted(bare, params);
    EXPECT_EQ(unrestricted.get_game_state(), GameState::InProgress);
}

TEST(GameTest, FiftyMoveRuleEndsTheGame) {
    Game game(position_from_fen("4k3/8/8/8/8/8/8/R3K3 w - - 99 80"));
    ASSERT_EQ(game.get_game_state(), GameState::InProgress);
    ASSERT_EQ(play(game, "a1a2"), MoveError::None);
    ASSERT_EQ(game.get_game_state(), GameState::Complete);
    EXPECT_EQ(game.outcome()->reason, OutcomeReason::FiftyMoveRule);
    EXPECT_EQ(game.outcome()->to_string(), "1/2-1/2");
}

// Mate on the hundredth half move is still mate.
TEST(GameTest, CheckmateTakesPrecedenceOverDrawRules) {
    Game game(position_from_fen("6k1/5ppp/8/8/8/8/8/R5K1 w - - 99 80"));
    ASSERT_EQ(play(game, "a1a8"), MoveError::None);
    EXPECT_EQ(game.get_position().half_move_clock, 100);
    ASSERT_EQ(game.get_game_state(), GameState::Complete);
    EXPECT_EQ(game.outcome()->reason, OutcomeReason::Checkmate);
    EXPECT_EQ(game.outcome()->winner, Colour::White);
}

TEST(GameTest, CapturedPieces) {
    Game game;
    for (auto text : {"e2e4", "d7d5", "e4d5", "d8d5"}) {
        ASSERT_EQ(play(game, text), MoveError::None) << text;
    }
    EXPECT_EQ(game.captured_pieces().size(), 2u);
    ASSERT_EQ(game.captured_pieces(Colour::Black).size(), 1u);
    EXPECT_EQ(game.captured_pieces(Colour::Black)[0], Piece(PieceType::Pawn, Colour::Black));
    ASSERT_EQ(game.captured_pieces(Colour::White).size(), 1u);
    EXPECT_EQ(game.captured_pieces(Colour::White)[0], Piece(PieceType::Pawn, Colour::White));
}

TEST(DrawTest, InsufficientMaterial) {
    EXPECT_TRUE(Draw::insufficient_material(position_from_fen("8/8/8/4k3/8/8/8/4K3 w - - 0 1")));
    EXPECT_TRUE(Draw::insufficient_material(position_from_fen("8/8/8/4k3/8/8/8/4KN2 w - - 0 1")));
    EXPECT_TRUE(Draw::insufficient_material(position_from_fen("8/8/8/4k3/8/8/8/4KB2 w - - 0 1")));
    // c1 and f8 are both dark.
    EXPECT_TRUE(Draw::insufficient_material(position_from_fen("5b2/8/8/4k3/8/8/8/2B1K3 w - - 0 1")));
    // c1 dark, f1 light.
    EXPECT_FALSE(Draw::insufficient_material(position_from_fen("8/8/8/4k3/8/8/8/2B1KB2 w - - 0 1")));
    EXPECT_FALSE(Draw::insufficient_material(position_from_fen("8/8/8/4k3/8/8/8/4KNN1 w - - 0 1")));
    EXPECT_FALSE(Draw::insufficient_material(position_from_fen("8/8/8/4k3/8/8/8/4KR2 w - - 0 1")));
    EXPECT_FALSE(Draw::insufficient_material(position_from_fen("8/8/8/4k3/8/8/4P3/4K3 w - - 0 1")));
    EXPECT_FALSE(Draw::insufficient_material(Position()));
}

TEST(DrawTest, FiftyMoveRule) {
    EXPECT_FALSE(Draw::fifty_move_rule(position_from_fen("4k3/8/8/8/8/8/8/R3K3 w - - 99 80")));
    EXPECT_TRUE(Draw::fifty_move_rule(position_from_fen("4k3/8/8/8/8/8/8/R3K3 w - - 100 80")));
}

TEST(GameTest, RandomGamesTerminate) {
    for (unsigned seed = 1; seed <= 8; ++seed) {
        std::mt19937 rng(seed);
        Game game;
        ASSERT_TRUE(play_random_game(game, rng)) << "seed " << seed;

        const Outcome outcome = *game.outcome();
        const Position& pos = game.get_position();
        std::vector<Move> remaining;
        MoveGen::generate_legal(pos, remaining);

        if (outcome.is_win()) {
            EXPECT_EQ(outcome.reason, OutcomeReason::Checkmate);
            EXPECT_EQ(Coords::inverse(pos.to_move), outcome.winner);
            EXPECT_TRUE(game.is_check(pos.to_move));
            EXPECT_TRUE(remaining.empty());
        } else if (outcome.reason == OutcomeReason::Stalemate) {
            EXPECT_FALSE(game.is_check());
            EXPECT_TRUE(remaining.empty());
        } else {
            EXPECT_FALSE(remaining.empty());
        }
    }
}

TEST(GameTest, UndoAllThenRedoAll) {
    std::mt19937 rng(42);
    Game game;
    ASSERT_TRUE(play_random_game(game, rng));

    const Position final_position = game.get_position();
    const std::vector<Move> played = game.played_moves();
    ASSERT_EQ(played.size(), game.move_count());

    std::vector<Move> undone;
    while (auto m = game.undo_move()) undone.push_back(*m);
    EXPECT_EQ(game.get_position(), Position::standard());
    EXPECT_EQ(undone.size(), played.size());

    std::vector<Move> redone;
    while (auto m = game.redo_move()) redone.push_back(*m);
    EXPECT_EQ(redone, played);
    EXPECT_EQ(game.get_position(), final_position);
    EXPECT_EQ(game.get_game_state(), GameState::Complete);
}

TEST(GameTest, FromMovesReplaysAGame) {
    std::mt19937 rng(7);
    Game game;
    ASSERT_TRUE(play_random_game(game, rng));

    Game replay;
    ASSERT_EQ(Game::from_moves(game.played_moves(), replay), MoveError::None);
    EXPECT_EQ(replay.get_position().board, game.get_position().board);
    EXPECT_EQ(replay.played_moves(), game.played_moves());
    EXPECT_EQ(replay.outcome(), game.outcome());
}

TEST(GameTest, FromMovesReportsTheFailingMove) {
    Game replay;
    std::vector<Move> moves = {mv("e2e4"), mv("e2e4")};
    EXPECT_EQ(Game::from_moves(moves, replay), MoveError::IllegalMove);
    EXPECT_EQ(replay.move_count(), 1u);
}

TEST(GameTest, LoadFenAndReset) {
    Game game;
    EXPECT_EQ(game.start_position(), Position::standard());
    ASSERT_EQ(play(game, "e2e4"), MoveError::None);

    EXPECT_FALSE(game.fen("not a fen"));
    EXPECT_EQ(game.start_position(), Position::standard());
    EXPECT_EQ(game.move_count(), 1u);

    ASSERT_TRUE(game.fen("4k3/8/8/8/8/8/8/R3K3 w Q - 0 1"));
    EXPECT_EQ(game.move_count(), 0u);
    EXPECT_EQ(game.fen(), "4k3/8/8/8/8/8/8/R3K3 w Q - 0 1");
    EXPECT_EQ(Fen::format(game.start_position()), "4k3/8/8/8/8/8/8/R3K3 w Q - 0 1");

    ASSERT_EQ(play(game, "e1c1"), MoveError::None);
    game.reset();
    EXPECT_EQ(game.fen(), "4k3/8/8/8/8/8/8/R3K3 w Q - 0 1");
    EXPECT_FALSE(game.move_to_redo().has_value());
}
