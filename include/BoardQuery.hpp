#pragma once

#include "Piece.hpp"


// Read-only view of piece occupancy. Move rules query a board only through
// this interface and never own or mutate it.
class BoardQuery {
public:
    virtual ~BoardQuery() = default;

    virtual bool is_valid_position(int x, int y) const = 0;

    // (x, y) must be in bounds.
    virtual bool is_occupied(int x, int y) const = 0;

    // (x, y) must be occupied.
    virtual Piece get_piece(int x, int y) const = 0;
};
