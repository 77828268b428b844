#pragma once

#include "Types.hpp"
#include "Location.hpp"

#include <memory>
#include <optional>
#include <string>

class Game;

int piece_value(PieceType type);
const char* piece_name(PieceType type);
char piece_letter(PieceType type); // upper-case SAN/FEN letter, 'P' for pawns
std::optional<PieceType> piece_from_letter(char letter);


// Capability set shared by every piece kind. Geometry and legality queries
// never mutate; on_moved() is the only hook that touches game state.
class Piece {
public:
    Piece(PieceType type, Colour colour, Location location);
    virtual ~Piece() = default;

    Piece(const Piece&) = delete;
    Piece& operator=(const Piece&) = delete;

    PieceType type() const { return type_; }
    Colour colour() const { return colour_; }
    const std::optional<Location>& location() const { return location_; }
    bool has_moved() const { return has_moved_; }
    int value() const { return piece_value(type_); }

    // FEN letter: upper case for White
    char symbol() const;
    std::string name() const;

    // Pure shape check from the current square, no board access.
    virtual bool can_reach(Location dest) const = 0;
    virtual bool can_move_to(Location dest, const Game& game) const = 0;
    // Would this piece capture on `square` if an enemy stood there?
    virtual bool attacks(Location square, const Game& game) const;
    virtual bool can_take(Location dest, const Game& game) const;
    virtual void on_moved(Location from, Location to, Game& game);

protected:
    bool holds_opponent(Location square, const Game& game) const;
    bool path_clear_to(Location dest, const Game& game) const;

private:
    friend class Board;
    friend class Game;

    PieceType type_;
    Colour colour_;
    std::optional<Location> location_;
    bool has_moved_ = false;
};


class Pawn final : public Piece {
public:
    Pawn(Colour colour, Location location) : Piece(PieceType::Pawn, colour, location) {}

    int direction() const { return colour() == Colour::White ? 1 : -1; }
    int start_rank() const { return colour() == Colour::White ? 1 : 6; }
    int last_rank() const { return colour() == Colour::White ? 7 : 0; }

    bool can_reach(Location dest) const override;
    bool can_move_to(Location dest, const Game& game) const override;
    bool attacks(Location square, const Game& game) const override;
    bool can_take(Location dest, const Game& game) const override;
    void on_moved(Location from, Location to, Game& game) override;
};

class Knight final : public Piece {
public:
    Knight(Colour colour, Location location) : Piece(PieceType::Knight, colour, location) {}

    bool can_reach(Location dest) const override;
    bool can_move_to(Location dest, const Game& game) const override;
};

class Bishop final : public Piece {
public:
    Bishop(Colour colour, Location location) : Piece(PieceType::Bishop, colour, location) {}

    bool can_reach(Location dest) const override;
    bool can_move_to(Location dest, const Game& game) const override;
};

class Rook final : public Piece {
public:
    Rook(Colour colour, Location location) : Piece(PieceType::Rook, colour, location) {}

    bool can_reach(Location dest) const override;
    bool can_move_to(Location dest, const Game& game) const override;
};

class Queen final : public Piece {
public:
    Queen(Colour colour, Location location) : Piece(PieceType::Queen, colour, location) {}

    bool can_reach(Location dest) const override;
    bool can_move_to(Location dest, const Game& game) const override;
};

class King final : public Piece {
public:
    King(Colour colour, Location location) : Piece(PieceType::King, colour, location) {}

    bool can_reach(Location dest) const override;
    // Also refuses squares any opposing piece attacks
    bool can_move_to(Location dest, const Game& game) const override;
    bool attacks(Location square, const Game& game) const override;
    bool can_take(Location dest, const Game& game) const override;
};


std::unique_ptr<Piece> make_piece(PieceType type, Colour colour, Location location);
