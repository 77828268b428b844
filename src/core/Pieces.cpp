#include "Pieces.hpp"
#include "Attacks.hpp"
#include "Board.hpp"
#include "Game.hpp"

#include <cctype>
#include <cstdlib>


int piece_value(PieceType type) {
    switch (type) {
        case PieceType::Pawn:   return 1;
        case PieceType::Knight: return 3;
        case PieceType::Bishop: return 3;
        case PieceType::Rook:   return 5;
        case PieceType::Queen:  return 9;
        case PieceType::King:   return 100;
    }
    return 0;
}

const char* piece_name(PieceType type) {
    switch (type) {
        case PieceType::Pawn:   return "Pawn";
        case PieceType::Knight: return "Knight";
        case PieceType::Bishop: return "Bishop";
        case PieceType::Rook:   return "Rook";
        case PieceType::Queen:  return "Queen";
        case PieceType::King:   return "King";
    }
    return "?";
}

char piece_letter(PieceType type) {
    switch (type) {
        case PieceType::Pawn:   return 'P';
        case PieceType::Knight: return 'N';
        case PieceType::Bishop: return 'B';
        case PieceType::Rook:   return 'R';
        case PieceType::Queen:  return 'Q';
        case PieceType::King:   return 'K';
    }
    return '?';
}

std::optional<PieceType> piece_from_letter(char letter) {
    switch (std::toupper(static_cast<unsigned char>(letter))) {
        case 'P': return PieceType::Pawn;
        case 'N': return PieceType::Knight;
        case 'B': return PieceType::Bishop;
        case 'R': return PieceType::Rook;
        case 'Q': return PieceType::Queen;
        case 'K': return PieceType::King;
        default:  return std::nullopt;
    }
}

// --- PIECE (shared behaviour) ---

Piece::Piece(PieceType type, Colour colour, Location location)
    : type_(type), colour_(colour), location_(location) {}

char Piece::symbol() const {
    char c = piece_letter(type_);
    return colour_ == Colour::White ? c : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string Piece::name() const {
    return std::string(colour_name(colour_)) + " " + piece_name(type_);
}

bool Piece::holds_opponent(Location square, const Game& game) const {
    const Piece* occupant = game.board().at(square);
    return occupant != nullptr && occupant->colour() != colour_;
}

bool Piece::path_clear_to(Location dest, const Game& game) const {
    return location_ && game.board().is_path_clear(*location_, dest);
}

bool Piece::attacks(Location square, const Game& game) const {
    return can_move_to(square, game);
}

bool Piece::can_take(Location dest, const Game& game) const {
    return can_move_to(dest, game) && holds_opponent(dest, game);
}

void Piece::on_moved(Location, Location, Game& game) {
    has_moved_ = true;
    game.set_en_passant_target(std::nullopt);
}

// --- PAWN ---

bool Pawn::can_reach(Location dest) const {
    if (!location()) return false;
    Offset d = dest - *location();
    if (d.files == 0) {
        if (d.ranks == direction()) return true;
        return d.ranks == 2 * direction() && !has_moved() && location()->rank() == start_rank();
    }
    return std::abs(d.files) == 1 && d.ranks == direction();
}

bool Pawn::can_move_to(Location dest, const Game& game) const {
    if (!location()) return false;
    Offset d = dest - *location();
    if (d.files != 0) return false;

    const Board& board = game.board();
    if (d.ranks == direction()) return board.is_empty(dest);
    if (d.ranks == 2 * direction() && !has_moved() && location()->rank() == start_rank()) {
        return board.is_empty(dest) && board.is_path_clear(*location(), dest);
    }
    return false;
}

bool Pawn::attacks(Location square, const Game&) const {
    if (!location()) return false;
    return BitUtil::get_bit(Attacks::pawn_attacks(colour(), location()->square()), square.square());
}

bool Pawn::can_take(Location dest, const Game& game) const {
    if (!attacks(dest, game)) return false;
    if (holds_opponent(dest, game)) return true;

    // En passant: the target square is empty and the pawn that just passed
    // over it sits beside us on our own rank.
    if (game.en_passant_target() != dest || !game.board().is_empty(dest)) return false;
    auto passed_square = Location::from_coords(dest.file(), location()->rank());
    const Piece* passed = passed_square ? game.board().at(*passed_square) : nullptr;
    return passed != nullptr && passed->type() == PieceType::Pawn && passed->colour() != colour();
}

void Pawn::on_moved(Location from, Location to, Game& game) {
    Piece::on_moved(from, to, game);
    Offset d = to - from;
    if (d.files == 0 && std::abs(d.ranks) == 2) {
        game.set_en_passant_target(from.try_offset(Offset{0, direction()}));
    }
}

// --- KNIGHT ---

bool Knight::can_reach(Location dest) const {
    if (!location()) return false;
    return BitUtil::get_bit(Attacks::KnightAttacks[location()->index()], dest.square());
}

bool Knight::can_move_to(Location dest, const Game&) const {
    return can_reach(dest);
}

// --- SLIDERS ---

bool Bishop::can_reach(Location dest) const {
    if (!location()) return false;
    Offset d = dest - *location();
    return d.files != 0 && std::abs(d.files) == std::abs(d.ranks);
}

bool Bishop::can_move_to(Location dest, const Game& game) const {
    return can_reach(dest) && path_clear_to(dest, game);
}

bool Rook::can_reach(Location dest) const {
    if (!location()) return false;
    Offset d = dest - *location();
    return (d.files == 0) != (d.ranks == 0);
}

bool Rook::can_move_to(Location dest, const Game& game) const {
    return can_reach(dest) && path_clear_to(dest, game);
}

bool Queen::can_reach(Location dest) const {
    if (!location()) return false;
    Offset d = dest - *location();
    if (d.files == 0 && d.ranks == 0) return false;
    return d.files == 0 || d.ranks == 0 || std::abs(d.files) == std::abs(d.ranks);
}

bool Queen::can_move_to(Location dest, const Game& game) const {
    return can_reach(dest) && path_clear_to(dest, game);
}

// --- KING ---

bool King::can_reach(Location dest) const {
    if (!location()) return false;
    return BitUtil::get_bit(Attacks::KingAttacks[location()->index()], dest.square());
}

bool King::can_move_to(Location dest, const Game& game) const {
    return can_reach(dest) && !game.is_attacked(dest, opposite(colour()), *location());
}

bool King::attacks(Location square, const Game&) const {
    return can_reach(square);
}

bool King::can_take(Location dest, const Game& game) const {
    return can_reach(dest) && holds_opponent(dest, game)
        && !game.is_attacked(dest, opposite(colour()), *location());
}


std::unique_ptr<Piece> make_piece(PieceType type, Colour colour, Location location) {
    switch (type) {
        case PieceType::Pawn:   return std::make_unique<Pawn>(colour, location);
        case PieceType::Knight: return std::make_unique<Knight>(colour, location);
        case PieceType::Bishop: return std::make_unique<Bishop>(colour, location);
        case PieceType::Rook:   return std::make_unique<Rook>(colour, location);
        case PieceType::Queen:  return std::make_unique<Queen>(colour, location);
        case PieceType::King:   return std::make_unique<King>(colour, location);
    }
    return nullptr;
}
