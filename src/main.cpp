#include "Position.hpp"
#include "MoveGen.hpp"
#include "Fen.hpp"
#include "Notation.hpp"

#include <iostream>
#include <chrono>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


// Per root move node counts, then the total.
uint64_t run_divide(const Position& pos, int depth) {
    std::vector<Move> moves;
    moves.reserve(64);
    MoveGen::generate_legal(pos, moves);

    uint64_t nodes = 0;
    for (const auto& move : moves) {
        uint64_t count = MoveGen::perft(pos.apply(move), depth - 1);
        std::cout << Notation::format_move(move) << ": " << count << std::endl;
        nodes += count;
    }
    return nodes;
}

// Usage: chess_perft [depth] [fen]
int main(int argc, char** argv) {
    int depth = 3;
    std::string fen(Fen::START);

    if (argc > 1) {
        std::string_view arg = argv[1];
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), depth);
        if (ec != std::errc() || ptr != arg.data() + arg.size() || depth < 1) {
            std::cerr << "Bad depth: " << arg << std::endl;
            return 1;
        }
    }

    if (argc > 2) {
        fen.clear();
        for (int i = 2; i < argc; ++i) {
            if (i > 2) fen += ' ';
            fen += argv[i];
        }
    }

    std::optional<PositionRecord> record = Fen::parse(fen);
    if (!record) {
        std::cerr << "Bad FEN: " << fen << std::endl;
        return 1;
    }

    Position pos;
    SetupError err = Position::from_record(*record, pos);
    if (err != SetupError::None) {
        std::cerr << "Invalid position: " << to_string(err) << std::endl;
        return 1;
    }

    std::cout << "Starting Perft (Depth " << depth << ")..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    uint64_t nodes = run_divide(pos, depth);

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    std::cout << "Nodes: " << nodes << " | Time: " << elapsed.count() << "s" << std::endl;
    return 0;
}
