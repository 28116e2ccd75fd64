#pragma once
#include "BoardQuery.hpp"
#include "Piece.hpp"
#include <vector>

namespace MoveGen {
    void generate_moves(const BoardQuery& board, const Piece& piece, std::vector<Coord>& move_list);

    // Only the destinations that take an opposite-colour piece.
    void generate_captures(const BoardQuery& board, const Piece& piece, std::vector<Coord>& move_list);
}
