#pragma once

#include <cstdint>
#include <string>
#include <string_view>


using Bitboard = std::uint64_t;

inline constexpr int BOARD_SIZE = 8;

enum class Colour : uint8_t { White, Black };
enum class PieceType : uint8_t { Rook, Knight, Bishop, Queen, King, Pawn };

inline constexpr int PIECE_TYPE_COUNT = 6;

enum class Square : int {
    A1 = 0, B1, C1, D1, E1, F1, G1, H1,
    A2 = 8, B2, C2, D2, E2, F2, G2, H2,
    A3 = 16, B3, C3, D3, E3, F3, G3, H3,
    A4 = 24, B4, C4, D4, E4, F4, G4, H4,
    A5 = 32, B5, C5, D5, E5, F5, G5, H5,
    A6 = 40, B6, C6, D6, E6, F6, G6, H6,
    A7 = 48, B7, C7, D7, E7, F7, G7, H7,
    A8 = 56, B8, C8, D8, E8, F8, G8, H8,
    None = 64
};

// File (x) and rank (y), both zero based.
struct Coord {
    int x;
    int y;

    bool operator==(const Coord& other) const = default;
};

constexpr Colour opposite(Colour c) {
    return (c == Colour::White) ? Colour::Black : Colour::White;
}

constexpr bool on_board(int x, int y) {
    return x >= 0 && x < BOARD_SIZE && y >= 0 && y < BOARD_SIZE;
}

constexpr Square to_square(int x, int y) {
    return static_cast<Square>(y * BOARD_SIZE + x);
}

constexpr int square_x(Square sq) { return static_cast<int>(sq) % BOARD_SIZE; }
constexpr int square_y(Square sq) { return static_cast<int>(sq) / BOARD_SIZE; }

constexpr Coord to_coord(Square sq) { return Coord{square_x(sq), square_y(sq)}; }

// "white" / "black"
std::string_view to_string(Colour c);

// "Rook", "Knight", ...
std::string_view to_string(PieceType t);

// Algebraic name, e.g. "e4". Off-board coordinates give "-".
std::string square_name(int x, int y);
