#include "Errors.hpp"

std::string_view to_string(MoveError error) {
    switch (error) {
        case MoveError::None:             return "none";
        case MoveError::IllegalMove:      return "illegal move";
        case MoveError::MissingPromotion: return "missing promotion piece";
        case MoveError::InvalidPromotion: return "invalid promotion piece";
        case MoveError::NoKing:           return "no king for side to move";
    }
    return "unknown";
}

std::string_view to_string(SetupError error) {
    switch (error) {
        case SetupError::None:              return "none";
        case SetupError::MissingKing:       return "missing king";
        case SetupError::ExtraKing:         return "more than one king";
        case SetupError::PawnOnBackRank:    return "pawn on first or last rank";
        case SetupError::BadSideToMove:     return "bad side to move";
        case SetupError::BadCastlingRights: return "castling right without king and rook at home";
        case SetupError::BadEnPassant:      return "bad en passant square";
        case SetupError::BadMoveNumber:     return "full move number must be positive";
        case SetupError::OpponentInCheck:   return "side not to move is in check";
    }
    return "unknown";
}
