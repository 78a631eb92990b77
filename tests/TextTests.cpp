#include "TestHelpers.hpp"

// --- TEST CASES ---

TEST(FenTest, FormatOfParseIsIdentity) {
    const std::string_view fens[] = {
        Fen::START,
        "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
        "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1",
        "rnbqkbnr/pp1ppppp/8/2p5/4P3/8/PPPP1PPP/RNBQKBNR w KQkq c6 0 2",
        "4k3/8/8/8/8/8/8/R3K3 b Q - 37 112",
    };
    for (auto fen : fens) {
        std::optional<Position> pos = Fen::to_position(fen);
        ASSERT_TRUE(pos.has_value()) << fen;
        EXPECT_EQ(Fen::format(*pos), fen);
    }
    EXPECT_EQ(Fen::format(Position()), Fen::START);
}

TEST(FenTest, FourFieldsDefaultTheClocks) {
    std::optional<PositionRecord> record = Fen::parse("8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - -");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->half_move_clock, 0);
    EXPECT_EQ(record->full_move_number, 1);
}

TEST(FenTest, RejectsMalformedText) {
    const std::string_view bad[] = {
        "",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1",           // seven ranks
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNRR w KQkq - 0 1", // nine files
        "rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNX w KQkq - 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkx - 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KKq - 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq z9 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - x 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - -1 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1 extra",
    };
    for (auto fen : bad) {
        EXPECT_FALSE(Fen::parse(fen).has_value()) << fen;
    }
}

TEST(FenTest, RejectsStructurallyInvalidPositions) {
    EXPECT_TRUE(Fen::parse("8/8/8/8/8/8/8/8 w - - 0 1").has_value());
    EXPECT_FALSE(Fen::to_position("8/8/8/8/8/8/8/8 w - - 0 1").has_value());
    EXPECT_FALSE(Fen::to_position("4k3/8/8/8/8/8/8/4K3 w KQkq - 0 1").has_value());
}

TEST(FenTest, PieceCharacters) {
    EXPECT_EQ(Fen::piece_char(Piece(PieceType::Knight, Colour::White)), 'N');
    EXPECT_EQ(Fen::piece_char(Piece(PieceType::King, Colour::Black)), 'k');
    EXPECT_EQ(Fen::piece_from_char('q'), Piece(PieceType::Queen, Colour::Black));
    EXPECT_EQ(Fen::piece_from_char('P'), Piece(PieceType::Pawn, Colour::White));
    EXPECT_FALSE(Fen::piece_from_char('x').has_value());
    EXPECT_EQ(Fen::castling(CastleRights::All), "KQkq");
    EXPECT_EQ(Fen::castling(CastleRights::None), "-");
    EXPECT_EQ(Fen::placement(Board(std::nullopt)), "8/8/8/8/8/8/8/8");
}

TEST(NotationTest, ParsesCoordinateMoves) {
    std::optional<Notation::ParsedMove> push = Notation::parse_move("e2e4");
    ASSERT_TRUE(push.has_value());
    EXPECT_EQ(push->move, Move(Square::E2, Square::E4));
    EXPECT_EQ(push->promotion, PieceType::None);

    std::optional<Notation::ParsedMove> promo = Notation::parse_move("e7e8Q");
    ASSERT_TRUE(promo.has_value());
    EXPECT_EQ(promo->promotion, PieceType::Queen);

    EXPECT_FALSE(Notation::parse_move("e2e9").has_value());
    EXPECT_FALSE(Notation::parse_move("e7e8k").has_value());
    EXPECT_FALSE(Notation::parse_move("e2").has_value());
    EXPECT_FALSE(Notation::parse_move("e2e4qq").has_value());
}

TEST(NotationTest, FormatsMoves) {
    EXPECT_EQ(Notation::format_move(Move(Square::G1, Square::F3)), "g1f3");
    EXPECT_EQ(Notation::format_move(Move(Square::A7, Square::A8), PieceType::Knight), "a7a8n");
    EXPECT_EQ(Notation::format_move(Move(Square::B7, Square::A8, MoveFlag::QueenPromoCapture)), "b7a8q");
}
