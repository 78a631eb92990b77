#pragma once

#include <cstdint>
#include <string_view>


enum class MoveError : uint8_t {
    None,
    IllegalMove,        // not in the legal move set of the position
    MissingPromotion,   // pawn reaches the last rank without a promotion kind
    InvalidPromotion,   // pawn/king kind, or a kind given for a non-promoting move
    NoKing              // side to move has no king
};

enum class SetupError : uint8_t {
    None,
    MissingKing,
    ExtraKing,
    PawnOnBackRank,
    BadSideToMove,
    BadCastlingRights,
    BadEnPassant,
    BadMoveNumber,
    OpponentInCheck
};

std::string_view to_string(MoveError error);
std::string_view to_string(SetupError error);
