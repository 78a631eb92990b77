#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>


using Bitboard = std::uint64_t;

enum class Colour : uint8_t { White, Black, None };
enum class PieceType : uint8_t { Pawn, Knight, Bishop, Rook, Queen, King, None };
enum class CastleSide : uint8_t { Kingside, Queenside };

enum class File : uint8_t { A, B, C, D, E, F, G, H };
enum class Rank : uint8_t { R1, R2, R3, R4, R5, R6, R7, R8 };

// Rank-major: index = rank * 8 + file.
enum class Square : int {
    A1 = 0, B1, C1, D1, E1, F1, G1, H1,
    A2 = 8, B2, C2, D2, E2, F2, G2, H2,
    A3 = 16, B3, C3, D3, E3, F3, G3, H3,
    A4 = 24, B4, C4, D4, E4, F4, G4, H4,
    A5 = 32, B5, C5, D5, E5, F5, G5, H5,
    A6 = 40, B6, C6, D6, E6, F6, G6, H6,
    A7 = 48, B7, C7, D7, E7, F7, G7, H7,
    A8 = 56, B8, C8, D8, E8, F8, G8, H8,
    None = 64
};

struct Piece {
    PieceType type{PieceType::None};
    Colour colour{Colour::None};

    constexpr Piece() = default;
    constexpr Piece(PieceType t, Colour c) : type(t), colour(c) {}

    [[nodiscard]] constexpr bool is_pawn() const { return type == PieceType::Pawn; }
    [[nodiscard]] constexpr bool is_knight() const { return type == PieceType::Knight; }
    [[nodiscard]] constexpr bool is_bishop() const { return type == PieceType::Bishop; }
    [[nodiscard]] constexpr bool is_rook() const { return type == PieceType::Rook; }
    [[nodiscard]] constexpr bool is_queen() const { return type == PieceType::Queen; }
    [[nodiscard]] constexpr bool is_king() const { return type == PieceType::King; }

    [[nodiscard]] constexpr bool is_slider() const {
        return type == PieceType::Bishop || type == PieceType::Rook || type == PieceType::Queen;
    }

    // Slot in the 12 piece bitboards: White P..K = 0..5, Black P..K = 6..11.
    [[nodiscard]] constexpr size_t index() const {
        return static_cast<size_t>(colour) * 6 + static_cast<size_t>(type);
    }

    bool operator==(const Piece& other) const = default;
};

enum class MoveFlag : uint16_t {
    Quiet = 0b0000,
    DoublePawnPush = 0b0001,
    KingCastle = 0b0010,
    QueenCastle = 0b0011,
    Capture = 0b0100,
    EnPassant = 0b0101,
    Promotion = 0b1000,
    KnightPromo = 0b1000,
    BishopPromo = 0b1001,
    RookPromo = 0b1010,
    QueenPromo = 0b1011,
    KnightPromoCapture = 0b1100,
    BishopPromoCapture = 0b1101,
    RookPromoCapture = 0b1110,
    QueenPromoCapture = 0b1111
};

// Promotion flag for a promotion kind (Knight..Queen).
constexpr MoveFlag promotion_flag(PieceType type, bool capture) {
    uint16_t flag = static_cast<uint16_t>(MoveFlag::Promotion)
        | static_cast<uint16_t>(static_cast<uint16_t>(type) - 1);
    if (capture) flag |= static_cast<uint16_t>(MoveFlag::Capture);
    return static_cast<MoveFlag>(flag);
}

struct Move {
    uint16_t data;

    static constexpr uint16_t FROM_MASK{0x3F}; // Bits 0-5: From square
    static constexpr uint16_t TO_MASK{0xFC0}; // Bits 6-11: To square
    static constexpr uint16_t FLAG_MASK{0xF000}; // Bits 12-15: Special moves flag

    constexpr Move() : data(0) {}

    constexpr Move(Square from, Square to, MoveFlag flags = MoveFlag::Quiet)
        : data(static_cast<uint16_t>(
            static_cast<uint16_t>(from) |
            (static_cast<uint16_t>(to) << 6) |
            (static_cast<uint16_t>(flags) << 12))) {}

    static constexpr Move castle(Colour colour, CastleSide side) {
        const int base = (colour == Colour::White) ? 0 : 56;
        const int king_to = (side == CastleSide::Kingside) ? base + 6 : base + 2;
        return Move(static_cast<Square>(base + 4), static_cast<Square>(king_to),
                    side == CastleSide::Kingside ? MoveFlag::KingCastle : MoveFlag::QueenCastle);
    }

    [[nodiscard]] constexpr Square from() const {
        return static_cast<Square>(data & FROM_MASK);
    }

    [[nodiscard]] constexpr Square to() const {
        return static_cast<Square>((data & TO_MASK) >> 6);
    }

    [[nodiscard]] constexpr MoveFlag flags() const {
        return static_cast<MoveFlag>((data & FLAG_MASK) >> 12);
    }

    [[nodiscard]] constexpr uint16_t raw() const { return data; }

    [[nodiscard]] constexpr bool is_capture() const {
        return static_cast<uint16_t>(flags())
            & static_cast<uint16_t>(MoveFlag::Capture);
    }

    [[nodiscard]] constexpr bool is_promotion() const {
        return static_cast<uint16_t>(flags())
            & static_cast<uint16_t>(MoveFlag::Promotion);
    }

    [[nodiscard]] constexpr bool is_castle() const {
        return flags() == MoveFlag::KingCastle || flags() == MoveFlag::QueenCastle;
    }

    [[nodiscard]] constexpr bool is_en_passant() const {
        return flags() == MoveFlag::EnPassant;
    }

    [[nodiscard]] constexpr bool is_double_push() const {
        return flags() == MoveFlag::DoublePawnPush;
    }

    [[nodiscard]] constexpr PieceType promotion_type() const {
        if (!is_promotion()) return PieceType::None;
        return static_cast<PieceType>((static_cast<uint16_t>(flags()) & 0b0011) + 1);
    }

    // Start and end only; flags are ignored.
    [[nodiscard]] constexpr bool same_squares(const Move& other) const {
        return (data & (FROM_MASK | TO_MASK)) == (other.data & (FROM_MASK | TO_MASK));
    }

    // 180 degree board rotation of both squares.
    [[nodiscard]] constexpr Move rotated() const {
        return Move(static_cast<Square>(63 - static_cast<int>(from())),
                    static_cast<Square>(63 - static_cast<int>(to())),
                    flags());
    }

    [[nodiscard]] constexpr Move reversed() const {
        return Move(to(), from());
    }

    [[nodiscard]] constexpr int file_change() const {
        return (static_cast<int>(to()) & 7) - (static_cast<int>(from()) & 7);
    }

    [[nodiscard]] constexpr int rank_change() const {
        return (static_cast<int>(to()) >> 3) - (static_cast<int>(from()) >> 3);
    }

    [[nodiscard]] constexpr bool is_diagonal() const {
        const int df = file_change();
        const int dr = rank_change();
        return df != 0 && (df == dr || df == -dr);
    }

    [[nodiscard]] constexpr bool is_orthogonal() const {
        return (file_change() == 0) != (rank_change() == 0);
    }

    bool operator==(const Move& other) const = default;
};

template <>
struct std::hash<Move> {
    size_t operator()(const Move& m) const noexcept {
        return std::hash<uint16_t>{}(m.raw());
    }
};
