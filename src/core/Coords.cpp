#include "Coords.hpp"

namespace Coords {

std::optional<File> file_from_char(char c) {
    if (c >= 'a' && c <= 'h') return static_cast<File>(c - 'a');
    if (c >= 'A' && c <= 'H') return static_cast<File>(c - 'A');
    return std::nullopt;
}

std::optional<Rank> rank_from_char(char c) {
    if (c < '1' || c > '8') return std::nullopt;
    return static_cast<Rank>(c - '1');
}

std::optional<Rank> rank_from_number(int n) {
    if (n < 1 || n > 8) return std::nullopt;
    return static_cast<Rank>(n - 1);
}

char file_char(File f) { return static_cast<char>('a' + static_cast<int>(f)); }
char rank_char(Rank r) { return static_cast<char>('1' + static_cast<int>(r)); }

Square square_from_name(std::string_view name) {
    if (name.size() != 2) return Square::None;
    auto f = file_from_char(name[0]);
    auto r = rank_from_char(name[1]);
    if (!f || !r) return Square::None;
    return make_square(*f, *r);
}

std::string square_name(Square sq) {
    if (!is_valid(sq)) return "-";
    return {file_char(file_of(sq)), rank_char(rank_of(sq))};
}

}
