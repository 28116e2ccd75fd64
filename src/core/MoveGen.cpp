#include "MoveGen.hpp"
#include "MoveValidator.hpp"
#include "Directions.hpp"

#include <array>
#include <vector>


namespace MoveGen {

namespace {
    // Walk each direction until the edge, stopping on the first occupied
    // square. That square is kept only if it holds an enemy piece.
    template <std::size_t N>
    void slide(const BoardQuery& board, const Piece& piece,
               const std::array<Directions::Offset, N>& dirs, std::vector<Coord>& list) {
        for (const auto& d : dirs) {
            const int len = Directions::ray_length(piece.x, piece.y, d.dx, d.dy);
            for (int i = 1; i <= len; ++i) {
                const int x = piece.x + i * d.dx;
                const int y = piece.y + i * d.dy;
                if (board.is_occupied(x, y)) {
                    if (board.get_piece(x, y).colour != piece.colour) list.push_back({x, y});
                    break;
                }
                list.push_back({x, y});
            }
        }
    }

    void jump(const BoardQuery& board, const Piece& piece,
              const std::array<Directions::Offset, 8>& offsets, std::vector<Coord>& list) {
        for (const auto& o : offsets) {
            const int x = piece.x + o.dx;
            const int y = piece.y + o.dy;
            if (!board.is_valid_position(x, y)) continue;
            if (!board.is_occupied(x, y) || board.get_piece(x, y).colour != piece.colour) {
                list.push_back({x, y});
            }
        }
    }

    // Pawn rules live in the validator only; every candidate goes through it.
    void pawn_moves(const BoardQuery& board, const Piece& piece, std::vector<Coord>& list) {
        const int forward = Directions::pawn_forward(piece.colour);
        for (const auto& o : Directions::PAWN_CANDIDATES) {
            const int x = piece.x + o.dx;
            const int y = piece.y + o.dy * forward;
            if (MoveValidator::is_valid_move(board, piece, x, y)) list.push_back({x, y});
        }
    }
}

void generate_moves(const BoardQuery& board, const Piece& piece, std::vector<Coord>& move_list) {
    if (!board.is_valid_position(piece.x, piece.y)) return;

    switch (piece.type) {
        case PieceType::Rook:
            slide(board, piece, Directions::ORTHOGONAL, move_list);
            break;
        case PieceType::Bishop:
            slide(board, piece, Directions::DIAGONAL, move_list);
            break;
        case PieceType::Queen:
            slide(board, piece, Directions::ORTHOGONAL, move_list);
            slide(board, piece, Directions::DIAGONAL, move_list);
            break;
        case PieceType::Knight:
            jump(board, piece, Directions::KNIGHT, move_list);
            break;
        case PieceType::King:
            jump(board, piece, Directions::KING, move_list);
            break;
        case PieceType::Pawn:
            pawn_moves(board, piece, move_list);
            break;
    }
}

void generate_captures(const BoardQuery& board, const Piece& piece, std::vector<Coord>& move_list) {
    std::vector<Coord> all;
    all.reserve(32);
    generate_moves(board, piece, all);

    // Own-colour squares are never generated, so any occupant is a capture.
    for (const auto& c : all) {
        if (board.is_occupied(c.x, c.y)) move_list.push_back(c);
    }
}

} // namespace MoveGen
