#pragma once

#include "Types.hpp"
#include "BitUtil.hpp"
#include "BoardQuery.hpp"
#include "Piece.hpp"
#include <array>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

// Bitboard board: one bitboard per (colour, type) pair plus White, Black and
// All occupancy. Keeps every stored piece's coordinate equal to its square.
struct BoardState : public BoardQuery {
    std::array<Bitboard, 12> pieces;
    std::array<Bitboard, 3> occupancy;

    BoardState() {
        pieces.fill(0);
        occupancy.fill(0);
    }

    static constexpr size_t get_piece_index(Colour c, PieceType t) {
        return static_cast<size_t>(c) * PIECE_TYPE_COUNT + static_cast<size_t>(t);
    }

    bool is_valid_position(int x, int y) const override { return on_board(x, y); }

    bool is_occupied(int x, int y) const override {
        return BitUtil::get_bit(occupancy[2], x, y);
    }

    Piece get_piece(int x, int y) const override;

    void clear() {
        pieces.fill(0);
        occupancy.fill(0);
    }

    // Fails if the square is off the board or already taken.
    bool place(const Piece& piece);

    // Fails if the square is off the board or empty.
    bool remove(int x, int y);

    // Relocates the piece on (from_x, from_y), capturing whatever stands on
    // the target. Fails if the source is empty or either square is off the
    // board. Legality is not checked here.
    bool move_piece(int from_x, int from_y, int to_x, int to_y);

    // Accepts a full FEN or only its placement field; "startpos" loads the
    // initial position. The board is left untouched on a malformed string.
    bool load_fen(const std::string& fen);

    void set_startpos();

    std::vector<Piece> pieces_of(Colour side) const;

    // Rank 8 at the top. Squares listed in `marks` are drawn as '*' when empty
    // and 'x' when occupied.
    void print(std::ostream& os, const std::vector<Coord>& marks = {}) const;
};
