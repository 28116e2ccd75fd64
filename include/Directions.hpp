#pragma once

#include "Types.hpp"

#include <array>


namespace Directions {

    struct Offset {
        int dx;
        int dy;
    };

    inline constexpr std::array<Offset, 4> ORTHOGONAL{{
        {-1, 0}, {1, 0}, {0, -1}, {0, 1}
    }};

    inline constexpr std::array<Offset, 4> DIAGONAL{{
        {-1, -1}, {1, 1}, {1, -1}, {-1, 1}
    }};

    inline constexpr std::array<Offset, 8> KNIGHT{{
        {-2, -1}, {-2, 1}, {-1, -2}, {-1, 2},
        {1, -2}, {1, 2}, {2, -1}, {2, 1}
    }};

    inline constexpr std::array<Offset, 8> KING{{
        {-1, -1}, {-1, 0}, {-1, 1}, {0, -1},
        {0, 1}, {1, -1}, {1, 0}, {1, 1}
    }};

    // Candidate pawn offsets relative to a forward direction of +1. The backward
    // entries are listed so the generator covers every square a pawn could be
    // asked about; the validator rejects them.
    inline constexpr std::array<Offset, 8> PAWN_CANDIDATES{{
        {-1, 1}, {-1, -1}, {0, 1}, {0, 2},
        {0, -1}, {0, -2}, {1, 1}, {1, -1}
    }};

    inline constexpr int WHITE_PAWN_START_RANK = 1;
    inline constexpr int BLACK_PAWN_START_RANK = 6;

    constexpr int pawn_forward(Colour c) { return (c == Colour::White) ? 1 : -1; }

    constexpr int pawn_start_rank(Colour c) {
        return (c == Colour::White) ? WHITE_PAWN_START_RANK : BLACK_PAWN_START_RANK;
    }

    constexpr int sign(int v) { return (v > 0) - (v < 0); }

    // Number of squares a ray from (x, y) in direction (dx, dy) can travel before
    // leaving the board. For diagonals this is the smaller of the two edge
    // distances.
    constexpr int ray_length(int x, int y, int dx, int dy) {
        int nx = (dx > 0) ? (BOARD_SIZE - 1 - x) : (dx < 0) ? x : BOARD_SIZE - 1;
        int ny = (dy > 0) ? (BOARD_SIZE - 1 - y) : (dy < 0) ? y : BOARD_SIZE - 1;
        return (nx < ny) ? nx : ny;
    }

    static_assert(ray_length(0, 0, 1, 1) == 7);
    static_assert(ray_length(3, 5, 1, 1) == 2);
    static_assert(ray_length(3, 5, -1, 0) == 3);

} // namespace Directions
