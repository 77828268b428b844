#pragma once

#include "Types.hpp"
#include "Location.hpp"

#include <array>
#include <optional>
#include <vector>

class Piece;

struct SquareView {
    PieceType type;
    Colour colour;

    bool operator==(const SquareView& other) const = default;
};

// [rank][file], rank 0 = rank 1. What the renderers consume.
using OccupancyGrid = std::array<std::array<std::optional<SquareView>, 8>, 8>;


// Square -> piece table. Does not own pieces; the Game does.
class Board {
public:
    struct State {
        std::array<Piece*, 64> squares;
        std::array<Bitboard, 3> occupancy;
    };

    Board();

    Piece* at(Location loc) const { return squares_[loc.index()]; }
    bool is_empty(Location loc) const { return squares_[loc.index()] == nullptr; }

    // Occupancy bitboards: [White, Black, All]
    Bitboard occupancy(Colour side) const { return occupancy_[static_cast<int>(side)]; }
    Bitboard occupancy() const { return occupancy_[2]; }

    bool is_path_clear(Location start, Location end) const;
    static std::vector<Location> squares_between(Location start, Location end);

    // Unconditional relocation. Returns whatever stood on `end` (now detached,
    // its location cleared) or nullptr.
    Piece* force_move(Location start, Location end);

    // Puts a detached piece on an empty square and points it there.
    void place(Piece* piece, Location loc);
    // Detaches the piece on `loc`, clearing its location.
    Piece* lift(Location loc);

    void clear();

    OccupancyGrid grid() const;

    State state() const { return State{squares_, occupancy_}; }
    void restore(const State& state);

private:
    void set_square(Location loc, Piece* piece);

    std::array<Piece*, 64> squares_;
    std::array<Bitboard, 3> occupancy_;
};
