#pragma once

#include "Types.hpp"

#include <vector>


class BoardQuery;

// A piece is a plain value. The board it stands on is handed to every query
// instead of being stored here.
struct Piece {
    Colour colour;
    PieceType type;
    int x;
    int y;

    constexpr Piece(Colour c, PieceType t, int px, int py)
        : colour(c), type(t), x(px), y(py) {}

    [[nodiscard]] constexpr Coord position() const { return Coord{x, y}; }

    bool is_valid_move(const BoardQuery& board, int target_x, int target_y) const;

    // Recomputed on every call.
    std::vector<Coord> possible_moves(const BoardQuery& board) const;

    // Same colour, type and square; not registered on any board.
    [[nodiscard]] Piece clone() const { return *this; }

    bool operator==(const Piece& other) const = default;
};

// FEN letter: upper case for White, lower case for Black.
char to_char(Colour colour, PieceType type);

// Inverse of to_char. Returns false for anything that is not a piece letter.
bool from_char(char c, Colour& colour, PieceType& type);
