#include "Fen.hpp"
#include "Coords.hpp"

#include <charconv>
#include <vector>


namespace Fen {

namespace {
    constexpr std::string_view PIECE_CHARS = "PNBRQKpnbrqk";

    std::vector<std::string_view> split_fields(std::string_view text) {
        std::vector<std::string_view> fields;
        size_t pos = 0;
        while (pos < text.size()) {
            while (pos < text.size() && text[pos] == ' ') ++pos;
            if (pos >= text.size()) break;
            size_t end = text.find(' ', pos);
            if (end == std::string_view::npos) end = text.size();
            fields.push_back(text.substr(pos, end - pos));
            pos = end;
        }
        return fields;
    }

    bool parse_placement(std::string_view field, Board& board) {
        int rank = 7;
        int file = 0;

        for (char c : field) {
            if (c == '/') {
                if (file != 8 || rank == 0) return false;
                rank--;
                file = 0;
            } else if (c >= '1' && c <= '8') {
                file += (c - '0');
                if (file > 8) return false;
            } else {
                std::optional<Piece> piece = piece_from_char(c);
                if (!piece || file > 7) return false;
                board.set(static_cast<Square>(rank * 8 + file), *piece);
                file++;
            }
        }
        return rank == 0 && file == 8;
    }

    std::optional<uint8_t> parse_castling(std::string_view field) {
        if (field == "-") return CastleRights::None;
        if (field.empty()) return std::nullopt;

        uint8_t rights = CastleRights::None;
        for (char c : field) {
            uint8_t bit = 0;
            switch (c) {
                case 'K': bit = CastleRights::WhiteKingside; break;
                case 'Q': bit = CastleRights::WhiteQueenside; break;
                case 'k': bit = CastleRights::BlackKingside; break;
                case 'q': bit = CastleRights::BlackQueenside; break;
                default: return std::nullopt;
            }
            if (rights & bit) return std::nullopt;
            rights |= bit;
        }
        return rights;
    }

    template <typename T>
    bool parse_number(std::string_view field, T& out) {
        const char* first = field.data();
        const char* last = field.data() + field.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc() && ptr == last;
    }
}

std::optional<PositionRecord> parse(std::string_view fen) {
    const std::vector<std::string_view> fields = split_fields(fen);
    if (fields.size() != 4 && fields.size() != 6) return std::nullopt;

    PositionRecord record;
    if (!parse_placement(fields[0], record.board)) return std::nullopt;

    if (fields[1] == "w") record.to_move = Colour::White;
    else if (fields[1] == "b") record.to_move = Colour::Black;
    else return std::nullopt;

    std::optional<uint8_t> rights = parse_castling(fields[2]);
    if (!rights) return std::nullopt;
    record.castle_rights = *rights;

    if (fields[3] != "-") {
        record.en_passant_sq = Coords::square_from_name(fields[3]);
        if (record.en_passant_sq == Square::None) return std::nullopt;
    }

    if (fields.size() == 6) {
        if (!parse_number(fields[4], record.half_move_clock)) return std::nullopt;
        if (!parse_number(fields[5], record.full_move_number)) return std::nullopt;
    }

    return record;
}

std::optional<Position> to_position(std::string_view fen) {
    std::optional<PositionRecord> record = parse(fen);
    if (!record) return std::nullopt;

    Position pos;
    if (Position::from_record(*record, pos) != SetupError::None) return std::nullopt;
    return pos;
}

std::string placement(const Board& board) {
    std::string out;
    for (int rank = 7; rank >= 0; --rank) {
        int empty = 0;
        for (int file = 0; file < 8; ++file) {
            std::optional<Piece> piece = board.at(static_cast<Square>(rank * 8 + file));
            if (!piece) {
                empty++;
                continue;
            }
            if (empty) out += static_cast<char>('0' + empty);
            empty = 0;
            out += piece_char(*piece);
        }
        if (empty) out += static_cast<char>('0' + empty);
        if (rank > 0) out += '/';
    }
    return out;
}

std::string castling(uint8_t rights) {
    std::string out;
    if (rights & CastleRights::WhiteKingside) out += 'K';
    if (rights & CastleRights::WhiteQueenside) out += 'Q';
    if (rights & CastleRights::BlackKingside) out += 'k';
    if (rights & CastleRights::BlackQueenside) out += 'q';
    return out.empty() ? "-" : out;
}

std::string format(const Position& pos) {
    std::string out = placement(pos.board);
    out += (pos.to_move == Colour::White) ? " w " : " b ";
    out += castling(pos.castle_rights);
    out += ' ';
    out += Coords::square_name(pos.en_passant_sq);
    out += ' ';
    out += std::to_string(pos.half_move_clock);
    out += ' ';
    out += std::to_string(pos.full_move_number);
    return out;
}

char piece_char(Piece piece) {
    if (piece.type == PieceType::None || piece.colour == Colour::None) return '?';
    return PIECE_CHARS[piece.index()];
}

std::optional<Piece> piece_from_char(char c) {
    size_t idx = PIECE_CHARS.find(c);
    if (idx == std::string_view::npos) return std::nullopt;
    return Piece(static_cast<PieceType>(idx % 6), idx < 6 ? Colour::White : Colour::Black);
}

}
