#pragma once

#include "Types.hpp"
#include "Errors.hpp"
#include "Location.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

class Game;
class Piece;

// Turns SAN-like text ("Nf3", "exd5", "R1e2", "e8=Q+", "O-O") into a concrete move.
namespace MoveResolver {

    struct Notation {
        std::string text;                       // as given, surrounding whitespace trimmed
        PieceType piece = PieceType::Pawn;
        std::optional<int> from_file;           // 0 = a
        std::optional<int> from_rank;           // 0 = rank 1
        bool capture = false;
        std::optional<Location> to;             // empty for castles
        std::optional<PieceType> promotion;
        bool check = false;
        bool mate = false;
        std::optional<CastleSide> castle;
    };

    Result<Notation> parse(std::string_view text);

    // Pieces of the side to move that match the notation's filters and reach
    // the destination, before any self-check filtering.
    std::vector<Piece*> candidates(const Game& game, const Notation& notation);

    Result<Move> resolve(Game& game, const Notation& notation);
    Result<Move> resolve(Game& game, std::string_view text);
}
