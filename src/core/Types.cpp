#include "Types.hpp"


std::string_view to_string(Colour c) {
    return (c == Colour::White) ? "white" : "black";
}

std::string_view to_string(PieceType t) {
    switch (t) {
        case PieceType::Rook:   return "Rook";
        case PieceType::Knight: return "Knight";
        case PieceType::Bishop: return "Bishop";
        case PieceType::Queen:  return "Queen";
        case PieceType::King:   return "King";
        case PieceType::Pawn:   return "Pawn";
    }
    return "";
}

std::string square_name(int x, int y) {
    if (!on_board(x, y)) return "-";
    std::string name;
    name += static_cast<char>('a' + x);
    name += static_cast<char>('1' + y);
    return name;
}
