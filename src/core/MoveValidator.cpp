#include "MoveValidator.hpp"
#include "Directions.hpp"

#include <cstdlib>


namespace MoveValidator {

namespace {
    bool is_own_piece(const BoardQuery& board, const Piece& piece, int x, int y) {
        return board.is_occupied(x, y) && board.get_piece(x, y).colour == piece.colour;
    }

    bool is_enemy_piece(const BoardQuery& board, const Piece& piece, int x, int y) {
        return board.is_occupied(x, y) && board.get_piece(x, y).colour != piece.colour;
    }

    bool valid_rook(const BoardQuery& board, const Piece& piece, int dx, int dy, int x, int y) {
        if ((dx != 0) == (dy != 0)) return false;
        return is_path_clear(board, piece, x, y);
    }

    bool valid_bishop(const BoardQuery& board, const Piece& piece, int dx, int dy, int x, int y) {
        if (std::abs(dx) != std::abs(dy)) return false;
        return is_path_clear(board, piece, x, y);
    }

    bool valid_queen(const BoardQuery& board, const Piece& piece, int dx, int dy, int x, int y) {
        bool straight = (dx == 0) || (dy == 0);
        bool diagonal = std::abs(dx) == std::abs(dy);
        if (!straight && !diagonal) return false;
        return is_path_clear(board, piece, x, y);
    }

    bool valid_knight(int dx, int dy) {
        int ax = std::abs(dx), ay = std::abs(dy);
        return (ax == 2 && ay == 1) || (ax == 1 && ay == 2);
    }

    bool valid_king(int dx, int dy) {
        return std::abs(dx) <= 1 && std::abs(dy) <= 1;
    }

    bool valid_pawn(const BoardQuery& board, const Piece& piece, int dx, int dy, int x, int y) {
        const int forward = Directions::pawn_forward(piece.colour);

        // Single push or diagonal capture
        if (dy == forward) {
            if (dx == 0) return !board.is_occupied(x, y);
            if (std::abs(dx) == 1) return is_enemy_piece(board, piece, x, y);
            return false;
        }

        // Double push from the start rank, both squares empty
        if (dy == 2 * forward && dx == 0 && piece.y == Directions::pawn_start_rank(piece.colour)) {
            return !board.is_occupied(x, piece.y + forward) && !board.is_occupied(x, y);
        }

        return false;
    }
}

bool is_path_clear(const BoardQuery& board, const Piece& piece, int x, int y) {
    if (!board.is_valid_position(piece.x, piece.y) || !board.is_valid_position(x, y)) return false;

    const int dx = x - piece.x;
    const int dy = y - piece.y;
    if (dx != 0 && dy != 0 && std::abs(dx) != std::abs(dy)) return false;

    const int step_x = Directions::sign(x - piece.x);
    const int step_y = Directions::sign(y - piece.y);

    int cx = piece.x + step_x;
    int cy = piece.y + step_y;
    while (cx != x || cy != y) {
        if (board.is_occupied(cx, cy)) return false;
        cx += step_x;
        cy += step_y;
    }
    return true;
}

bool is_valid_move(const BoardQuery& board, const Piece& piece, int x, int y) {
    if (!board.is_valid_position(piece.x, piece.y)) return false;
    if (!board.is_valid_position(x, y)) return false;

    const int dx = x - piece.x;
    const int dy = y - piece.y;
    if (dx == 0 && dy == 0) return false;
    if (is_own_piece(board, piece, x, y)) return false;

    switch (piece.type) {
        case PieceType::Rook:   return valid_rook(board, piece, dx, dy, x, y);
        case PieceType::Knight: return valid_knight(dx, dy);
        case PieceType::Bishop: return valid_bishop(board, piece, dx, dy, x, y);
        case PieceType::Queen:  return valid_queen(board, piece, dx, dy, x, y);
        case PieceType::King:   return valid_king(dx, dy);
        case PieceType::Pawn:   return valid_pawn(board, piece, dx, dy, x, y);
    }
    return false;
}

} // namespace MoveValidator
