#include "Board.hpp"
#include "Attacks.hpp"
#include "BitUtil.hpp"
#include "Pieces.hpp"

#include <algorithm>


Board::Board() {
    clear();
}

void Board::clear() {
    squares_.fill(nullptr);
    occupancy_.fill(0);
}

bool Board::is_path_clear(Location start, Location end) const {
    return (Attacks::between(start.square(), end.square()) & occupancy_[2]) == 0;
}

std::vector<Location> Board::squares_between(Location start, Location end) {
    std::vector<Location> path;
    Bitboard mask = Attacks::between(start.square(), end.square());
    while (mask) path.emplace_back(BitUtil::pop_lsb(mask));

    // pop_lsb walks a1 -> h8; callers expect the order seen from `start`
    if (end.index() < start.index()) std::reverse(path.begin(), path.end());
    return path;
}

void Board::set_square(Location loc, Piece* piece) {
    Square sq = loc.square();
    Piece* old = squares_[loc.index()];
    if (old != nullptr) {
        BitUtil::clear_bit(occupancy_[static_cast<int>(old->colour())], sq);
        BitUtil::clear_bit(occupancy_[2], sq);
    }
    squares_[loc.index()] = piece;
    if (piece != nullptr) {
        BitUtil::set_bit(occupancy_[static_cast<int>(piece->colour())], sq);
        BitUtil::set_bit(occupancy_[2], sq);
    }
}

Piece* Board::force_move(Location start, Location end) {
    Piece* moving = squares_[start.index()];
    if (moving == nullptr || start == end) return nullptr;

    Piece* displaced = squares_[end.index()];
    if (displaced != nullptr) displaced->location_.reset();

    set_square(start, nullptr);
    set_square(end, moving);
    moving->location_ = end;
    return displaced;
}

void Board::place(Piece* piece, Location loc) {
    set_square(loc, piece);
    piece->location_ = loc;
}

Piece* Board::lift(Location loc) {
    Piece* piece = squares_[loc.index()];
    if (piece == nullptr) return nullptr;
    set_square(loc, nullptr);
    piece->location_.reset();
    return piece;
}

OccupancyGrid Board::grid() const {
    OccupancyGrid out{};
    for (int i = 0; i < 64; ++i) {
        const Piece* p = squares_[i];
        if (p != nullptr) out[i >> 3][i & 7] = SquareView{p->type(), p->colour()};
    }
    return out;
}

void Board::restore(const State& state) {
    squares_ = state.squares;
    occupancy_ = state.occupancy;
}
