#pragma once

#include "Types.hpp"

#include <bit>


namespace BitUtil {
    constexpr Bitboard from_square(Square sq) {
        return 1ULL << static_cast<int>(sq);
    }

    constexpr Bitboard from_coord(int x, int y) {
        return from_square(to_square(x, y));
    }

    constexpr void set_bit(Bitboard& bb, Square sq) { bb |= from_square(sq); }
    constexpr void clear_bit(Bitboard& bb, Square sq) { bb &= ~from_square(sq); }
    constexpr bool get_bit(Bitboard bb, Square sq) { return (bb & from_square(sq)) != 0; }

    constexpr bool get_bit(Bitboard bb, int x, int y) { return (bb & from_coord(x, y)) != 0; }

    // bb must be non-zero.
    constexpr Square pop_lsb(Bitboard& bb) {
        int index{std::countr_zero(bb)};
        bb &= bb - 1;
        return static_cast<Square>(index);
    }

    constexpr int count_bits(Bitboard bb) {
        return std::popcount(bb);
    }

    // Bitboard of a list of squares, handy for building expected move sets.
    constexpr Bitboard mask_of(const Coord* begin, const Coord* end) {
        Bitboard bb{0};
        for (const Coord* c = begin; c != end; ++c) bb |= from_coord(c->x, c->y);
        return bb;
    }
}
