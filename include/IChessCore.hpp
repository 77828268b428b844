#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include "Errors.hpp"
#include "Location.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>


// One entry of the move log and the payload of every successful move.
struct MoveRecord {
    Move move;
    PieceType piece;
    Colour colour;
    std::optional<PieceType> captured;
    std::string notation;  // SAN as played, "O-O", or "e2 e4" for coordinate moves
    bool check = false;      // side now to move is attacked
    bool checkmate = false;  // checkmate detection fired for the side now to move
};


// What the front ends (GUI, replay tooling) are allowed to see of the engine.
class IChessCore {
public:
    virtual ~IChessCore() = default;
    virtual Result<MoveRecord> move(Location from, Location to, std::optional<PieceType> promotion) = 0;
    virtual Result<MoveRecord> castle(CastleSide side) = 0;
    virtual Result<MoveRecord> play(std::string_view notation) = 0;
    virtual std::vector<Location> legal_destinations(Location from) = 0;
    virtual OccupancyGrid grid() const = 0;
    virtual Colour active_player() const = 0;
    virtual bool is_in_check(Colour side) const = 0;
    virtual const std::vector<MoveRecord>& moves() const = 0;
    virtual std::string to_fen() const = 0;
    virtual Status load_fen(std::string_view fen) = 0;
    virtual void reset() = 0;
};
