#include "BoardState.hpp"
#include "BitUtil.hpp"

#include <cctype>
#include <ostream>
#include <sstream>

Piece BoardState::get_piece(int x, int y) const {
    const Square sq = to_square(x, y);
    const Colour side = BitUtil::get_bit(occupancy[0], sq) ? Colour::White : Colour::Black;
    for (int t = 0; t < PIECE_TYPE_COUNT; ++t) {
        const PieceType type = static_cast<PieceType>(t);
        if (BitUtil::get_bit(pieces[get_piece_index(side, type)], sq)) {
            return Piece(side, type, x, y);
        }
    }
    // Only reached when (x, y) is empty, which callers must rule out first.
    return Piece(side, PieceType::Pawn, x, y);
}

bool BoardState::place(const Piece& piece) {
    if (!on_board(piece.x, piece.y) || is_occupied(piece.x, piece.y)) return false;

    const Square sq = to_square(piece.x, piece.y);
    BitUtil::set_bit(pieces[get_piece_index(piece.colour, piece.type)], sq);
    BitUtil::set_bit(occupancy[static_cast<int>(piece.colour)], sq);
    BitUtil::set_bit(occupancy[2], sq);
    return true;
}

bool BoardState::remove(int x, int y) {
    if (!on_board(x, y) || !is_occupied(x, y)) return false;

    const Square sq = to_square(x, y);
    for (auto& bb : pieces) BitUtil::clear_bit(bb, sq);
    for (auto& bb : occupancy) BitUtil::clear_bit(bb, sq);
    return true;
}

bool BoardState::move_piece(int from_x, int from_y, int to_x, int to_y) {
    if (!on_board(from_x, from_y) || !on_board(to_x, to_y)) return false;
    if (!is_occupied(from_x, from_y)) return false;
    if (from_x == to_x && from_y == to_y) return true;

    Piece moving = get_piece(from_x, from_y);
    if (!remove(from_x, from_y)) return false;
    if (is_occupied(to_x, to_y) && !remove(to_x, to_y)) return false;

    moving.x = to_x;
    moving.y = to_y;
    return place(moving);
}

bool BoardState::load_fen(const std::string& fen) {
    if (fen.empty() || fen == "startpos") {
        set_startpos();
        return true;
    }

    std::stringstream ss(fen);
    std::string placement;
    ss >> placement;

    BoardState parsed;
    int rank = 7;
    int file = 0;

    for (char c : placement) {
        if (c == '/') {
            if (file != BOARD_SIZE || rank == 0) return false;
            rank--;
            file = 0;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            int run = c - '0';
            if (run < 1 || file + run > BOARD_SIZE) return false;
            file += run;
        } else {
            Colour colour;
            PieceType type;
            if (!from_char(c, colour, type) || file >= BOARD_SIZE) return false;
            if (!parsed.place(Piece(colour, type, file, rank))) return false;
            file++;
        }
    }

    if (rank != 0 || file != BOARD_SIZE) return false;

    *this = parsed;
    return true;
}

void BoardState::set_startpos() {
    clear();
    pieces[get_piece_index(Colour::White, PieceType::Pawn)]   = 0x000000000000FF00ULL;
    pieces[get_piece_index(Colour::Black, PieceType::Pawn)]   = 0x00FF000000000000ULL;
    pieces[get_piece_index(Colour::White, PieceType::Knight)] = 0x0000000000000042ULL;
    pieces[get_piece_index(Colour::Black, PieceType::Knight)] = 0x4200000000000000ULL;
    pieces[get_piece_index(Colour::White, PieceType::Bishop)] = 0x0000000000000024ULL;
    pieces[get_piece_index(Colour::Black, PieceType::Bishop)] = 0x2400000000000000ULL;
    pieces[get_piece_index(Colour::White, PieceType::Rook)]   = 0x0000000000000081ULL;
    pieces[get_piece_index(Colour::Black, PieceType::Rook)]   = 0x8100000000000000ULL;
    pieces[get_piece_index(Colour::White, PieceType::Queen)]  = 0x0000000000000008ULL;
    pieces[get_piece_index(Colour::Black, PieceType::Queen)]  = 0x0800000000000000ULL;
    pieces[get_piece_index(Colour::White, PieceType::King)]   = 0x0000000000000010ULL;
    pieces[get_piece_index(Colour::Black, PieceType::King)]   = 0x1000000000000000ULL;

    for (int i = 0; i < 6; ++i) occupancy[0] |= pieces[i];
    for (int i = 6; i < 12; ++i) occupancy[1] |= pieces[i];
    occupancy[2] = occupancy[0] | occupancy[1];
}

std::vector<Piece> BoardState::pieces_of(Colour side) const {
    std::vector<Piece> list;
    Bitboard bb = occupancy[static_cast<int>(side)];
    while (bb) {
        Square sq = BitUtil::pop_lsb(bb);
        list.push_back(get_piece(square_x(sq), square_y(sq)));
    }
    return list;
}

void BoardState::print(std::ostream& os, const std::vector<Coord>& marks) const {
    const Bitboard marked = BitUtil::mask_of(marks.data(), marks.data() + marks.size());

    for (int y = BOARD_SIZE - 1; y >= 0; --y) {
        os << (y + 1) << "  ";
        for (int x = 0; x < BOARD_SIZE; ++x) {
            const bool mark = BitUtil::get_bit(marked, x, y);
            char c = '.';
            if (is_occupied(x, y)) {
                const Piece p = get_piece(x, y);
                c = mark ? 'x' : to_char(p.colour, p.type);
            } else if (mark) {
                c = '*';
            }
            os << c << ' ';
        }
        os << '\n';
    }
    os << "\n   a b c d e f g h\n";
}
