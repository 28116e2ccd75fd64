#include "Piece.hpp"
#include "BoardQuery.hpp"
#include "MoveValidator.hpp"
#include "MoveGen.hpp"

#include <cctype>


bool Piece::is_valid_move(const BoardQuery& board, int target_x, int target_y) const {
    return MoveValidator::is_valid_move(board, *this, target_x, target_y);
}

std::vector<Coord> Piece::possible_moves(const BoardQuery& board) const {
    std::vector<Coord> moves;
    moves.reserve(32);
    MoveGen::generate_moves(board, *this, moves);
    return moves;
}

char to_char(Colour colour, PieceType type) {
    char c = '?';
    switch (type) {
        case PieceType::Rook:   c = 'R'; break;
        case PieceType::Knight: c = 'N'; break;
        case PieceType::Bishop: c = 'B'; break;
        case PieceType::Queen:  c = 'Q'; break;
        case PieceType::King:   c = 'K'; break;
        case PieceType::Pawn:   c = 'P'; break;
    }
    return (colour == Colour::White) ? c : static_cast<char>(std::tolower(c));
}

bool from_char(char c, Colour& colour, PieceType& type) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'R': type = PieceType::Rook; break;
        case 'N': type = PieceType::Knight; break;
        case 'B': type = PieceType::Bishop; break;
        case 'Q': type = PieceType::Queen; break;
        case 'K': type = PieceType::King; break;
        case 'P': type = PieceType::Pawn; break;
        default: return false;
    }
    colour = std::isupper(static_cast<unsigned char>(c)) ? Colour::White : Colour::Black;
    return true;
}
