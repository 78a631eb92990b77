#include "Notation.hpp"
#include "Coords.hpp"


namespace Notation {

std::optional<ParsedMove> parse_move(std::string_view text) {
    if (text.size() != 4 && text.size() != 5) return std::nullopt;

    Square from = Coords::square_from_name(text.substr(0, 2));
    Square to = Coords::square_from_name(text.substr(2, 2));
    if (from == Square::None || to == Square::None) return std::nullopt;

    ParsedMove parsed{Move(from, to), PieceType::None};
    if (text.size() == 5) {
        switch (text[4]) {
            case 'n': case 'N': parsed.promotion = PieceType::Knight; break;
            case 'b': case 'B': parsed.promotion = PieceType::Bishop; break;
            case 'r': case 'R': parsed.promotion = PieceType::Rook; break;
            case 'q': case 'Q': parsed.promotion = PieceType::Queen; break;
            default: return std::nullopt;
        }
    }
    return parsed;
}

std::string format_move(Move move, PieceType promotion) {
    std::string out = Coords::square_name(move.from()) + Coords::square_name(move.to());
    if (promotion == PieceType::None) promotion = move.promotion_type();
    switch (promotion) {
        case PieceType::Knight: out += 'n'; break;
        case PieceType::Bishop: out += 'b'; break;
        case PieceType::Rook:   out += 'r'; break;
        case PieceType::Queen:  out += 'q'; break;
        default: break;
    }
    return out;
}

}
