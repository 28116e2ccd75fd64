#pragma once

#include "BoardQuery.hpp"
#include "Piece.hpp"


namespace MoveValidator {
    // True if `piece` may move to (x, y) under its own movement rule.
    // Off-board targets, zero displacement and own-colour targets are always
    // rejected. Check, castling, en passant and promotion are not considered.
    bool is_valid_move(const BoardQuery& board, const Piece& piece, int x, int y);

    // Intermediate squares strictly between the piece and (x, y) along a
    // straight or diagonal line are all empty. False for any other shape.
    bool is_path_clear(const BoardQuery& board, const Piece& piece, int x, int y);
}
