#include "BoardState.hpp"
#include "Types.hpp"
#include "Piece.hpp"
#include "MoveGen.hpp"

#include <iostream>
#include <string>
#include <vector>


void list_moves(const BoardState& board, Colour side) {
    for (const Piece& piece : board.pieces_of(side)) {
        std::vector<Coord> moves = piece.possible_moves(board);

        std::cout << to_string(piece.colour) << " " << to_string(piece.type)
                  << " " << square_name(piece.x, piece.y) << ":";
        for (const auto& m : moves) std::cout << " " << square_name(m.x, m.y);
        if (moves.empty()) std::cout << " (none)";
        std::cout << std::endl;
    }
}

void show_piece(const BoardState& board, int x, int y) {
    if (!board.is_valid_position(x, y) || !board.is_occupied(x, y)) {
        std::cout << "No piece on " << square_name(x, y) << std::endl;
        return;
    }
    Piece piece = board.get_piece(x, y);

    std::vector<Coord> captures;
    MoveGen::generate_captures(board, piece, captures);

    std::cout << to_string(piece.type) << " on " << square_name(x, y)
              << " (" << captures.size() << " captures)" << std::endl;
    board.print(std::cout, piece.possible_moves(board));
}

// Usage: piece_rules_demo [fen|startpos] [square]
int main(int argc, char** argv) {
    std::string fen = (argc > 1) ? argv[1] : "startpos";

    BoardState board;
    if (!board.load_fen(fen)) {
        std::cout << "Invalid FEN: " << fen << std::endl;
        return 1;
    }

    board.print(std::cout);
    std::cout << std::endl;

    list_moves(board, Colour::White);
    list_moves(board, Colour::Black);

    if (argc > 2) {
        std::string sq = argv[2];
        if (sq.size() != 2) {
            std::cout << "Invalid square: " << sq << std::endl;
            return 1;
        }
        std::cout << std::endl;
        show_piece(board, sq[0] - 'a', sq[1] - '1');
    }

    return 0;
}
