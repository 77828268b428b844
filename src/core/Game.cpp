#include "Game.hpp"
#include "Attacks.hpp"
#include "BitUtil.hpp"
#include "MoveResolver.hpp"
#include "TempMove.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>


namespace {
    NullLogSink& null_sink() {
        static NullLogSink sink;
        return sink;
    }

    std::optional<Square> square_of(std::optional<Location> loc) {
        if (!loc) return std::nullopt;
        return loc->square();
    }

    constexpr std::array<PieceType, 8> BACK_RANK = {
        PieceType::Rook, PieceType::Knight, PieceType::Bishop, PieceType::Queen,
        PieceType::King, PieceType::Bishop, PieceType::Knight, PieceType::Rook
    };

    bool parse_counter(const std::string& text, int& out) {
        if (text.empty()) return false;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc() && ptr == text.data() + text.size() && out >= 0;
    }
}


Game::Game(ILogSink* log) : log_(log ? log : &null_sink()) {
    reset();
}

void Game::set_log_sink(ILogSink* log) {
    log_ = log ? log : &null_sink();
}

void Game::log(LogLevel level, const std::string& message) const {
    if (speculation_depth_ > 0 && level < LogLevel::Warning) level = LogLevel::Trace;
    if (log_->enabled(level)) log_->write(level, message);
}

// --- SETUP ---

void Game::clear() {
    board_.clear();
    arena_.clear();
    for (auto& side : live_) side.clear();
    for (auto& side : captured_) side.clear();
    moves_.clear();
    active_ = Colour::White;
    ply_count_ = 0;
    turn_number_ = 1;
    halfmove_clock_ = 0;
    en_passant_.reset();
}

void Game::reset() {
    clear();
    for (int file = 0; file < 8; ++file) {
        add_piece(BACK_RANK[file], Colour::White, Location(BitUtil::make_square(file, 0)));
        add_piece(PieceType::Pawn, Colour::White, Location(BitUtil::make_square(file, 1)));
        add_piece(PieceType::Pawn, Colour::Black, Location(BitUtil::make_square(file, 6)));
        add_piece(BACK_RANK[file], Colour::Black, Location(BitUtil::make_square(file, 7)));
    }
    log(LogLevel::Debug, "Board reset to the starting position");
}

Piece* Game::adopt(std::unique_ptr<Piece> piece) {
    arena_.push_back(std::move(piece));
    return arena_.back().get();
}

Piece* Game::add_piece(PieceType type, Colour colour, Location loc) {
    if (!board_.is_empty(loc)) {
        log(LogLevel::Warning, "Cannot add " + std::string(colour_name(colour)) + " "
            + piece_name(type) + ": " + loc.to_string() + " is occupied");
        return nullptr;
    }
    Piece* piece = adopt(make_piece(type, colour, loc));
    live_[static_cast<int>(colour)].push_back(piece);
    board_.place(piece, loc);
    return piece;
}

bool Game::remove_piece(Location loc) {
    Piece* piece = board_.lift(loc);
    if (piece == nullptr) return false;
    detach(piece, false);
    return true;
}

void Game::detach(Piece* piece, bool to_captured) {
    auto& side = live_[static_cast<int>(piece->colour())];
    side.erase(std::remove(side.begin(), side.end(), piece), side.end());
    if (to_captured) captured_[static_cast<int>(piece->colour())].push_back(piece);
}

Status Game::load_fen(std::string_view fen) {
    std::istringstream ss{std::string(fen)};
    std::string placement, turn, castling, passant, halfmove, fullmove;
    ss >> placement >> turn >> castling >> passant >> halfmove >> fullmove;

    auto invalid = [&](const std::string& why) -> Status {
        MoveError error = make_error(ErrorKind::InvalidFen, why + " in '" + std::string(fen) + "'");
        error.fen = to_fen();
        return error;
    };

    if (placement.empty() || turn.empty()) return invalid("Missing placement or side to move");

    // Parse everything first so a bad string leaves the current game alone
    struct Entry {
        PieceType type;
        Colour colour;
        Square square;
    };
    std::vector<Entry> entries;
    int rank = 7, file = 0;
    std::array<int, 2> kings{0, 0};

    for (char c : placement) {
        if (c == '/') {
            if (file != 8 || rank == 0) return invalid("Malformed rank");
            --rank;
            file = 0;
        } else if (c >= '1' && c <= '8') {
            file += c - '0';
            if (file > 8) return invalid("Rank overflows eight files");
        } else {
            auto type = piece_from_letter(c);
            if (!type || file > 7) return invalid(std::string("Unexpected '") + c + "'");
            Colour colour = std::isupper(static_cast<unsigned char>(c)) ? Colour::White : Colour::Black;
            if (*type == PieceType::King) ++kings[static_cast<int>(colour)];
            entries.push_back({*type, colour, BitUtil::make_square(file, rank)});
            ++file;
        }
    }
    if (rank != 0 || file != 8) return invalid("Placement does not cover the board");
    if (kings[0] != 1 || kings[1] != 1) return invalid("Each side needs exactly one king");
    if (turn != "w" && turn != "b") return invalid("Side to move must be 'w' or 'b'");
    if (castling.empty()) castling = "-";
    if (castling != "-" && castling.find_first_not_of("KQkq") != std::string::npos) {
        return invalid("Bad castling field");
    }

    std::optional<Location> passant_target;
    if (!passant.empty() && passant != "-") {
        auto parsed = Location::parse(passant);
        if (!parsed) return invalid("Bad en passant square");
        passant_target = parsed.value();
    }

    int clock = 0, turn_no = 1;
    if (!halfmove.empty() && !parse_counter(halfmove, clock)) return invalid("Bad halfmove clock");
    if (!fullmove.empty() && (!parse_counter(fullmove, turn_no) || turn_no < 1)) {
        return invalid("Bad fullmove number");
    }

    clear();
    for (const Entry& e : entries) add_piece(e.type, e.colour, Location(e.square));

    // Kings and rooks count as moved unless the castling field says otherwise
    for (Piece* p : live_[0]) {
        if (p->type() == PieceType::King || p->type() == PieceType::Rook) p->has_moved_ = true;
    }
    for (Piece* p : live_[1]) {
        if (p->type() == PieceType::King || p->type() == PieceType::Rook) p->has_moved_ = true;
    }
    for (char right : castling) {
        if (right == '-') continue;
        Colour side = std::isupper(static_cast<unsigned char>(right)) ? Colour::White : Colour::Black;
        CastleSide which = std::toupper(static_cast<unsigned char>(right)) == 'K' ? CastleSide::King : CastleSide::Queen;
        const CastlePath& path = castle_path(side, which);
        Piece* k = board_.at(path.king_from);
        Piece* r = board_.at(path.rook_from);
        if (k && k->type() == PieceType::King && k->colour() == side
            && r && r->type() == PieceType::Rook && r->colour() == side) {
            k->has_moved_ = false;
            r->has_moved_ = false;
        }
    }

    active_ = turn == "w" ? Colour::White : Colour::Black;
    en_passant_ = passant_target;
    halfmove_clock_ = clock;
    turn_number_ = turn_no;
    ply_count_ = (turn_no - 1) * 2 + (active_ == Colour::Black ? 1 : 0);

    log(LogLevel::Debug, "Loaded position " + to_fen());
    return std::monostate{};
}

// --- MOVES ---

MoveError Game::fail(ErrorKind kind, std::string message,
                     std::optional<Location> from, std::optional<Location> to) const {
    MoveError error = make_error(kind, std::move(message), square_of(from), square_of(to));
    error.fen = to_fen();
    log(LogLevel::Debug, error.describe());
    return error;
}

MoveError Game::classify_failure(const Piece& piece, Location from, Location to) const {
    if (!piece.can_reach(to)) {
        return fail(ErrorKind::IllegalGeometry,
                    piece.name() + " at " + from.to_string() + " cannot reach " + to.to_string(), from, to);
    }
    if (piece.type() != PieceType::Knight && !board_.is_path_clear(from, to)) {
        return fail(ErrorKind::BlockedPath,
                    "Path from " + from.to_string() + " to " + to.to_string() + " is blocked", from, to);
    }
    if (piece.type() == PieceType::King) {
        return fail(ErrorKind::SelfCheck,
                    piece.name() + " cannot step onto attacked square " + to.to_string(), from, to);
    }
    const char* verb = board_.is_empty(to) ? " cannot move to " : " cannot capture on ";
    return fail(ErrorKind::IllegalGeometry, piece.name() + " at " + from.to_string() + verb + to.to_string(),
                from, to);
}

Result<MoveRecord> Game::move(Location from, Location to, std::optional<PieceType> promotion) {
    Piece* piece = board_.at(from);
    if (piece == nullptr) {
        return fail(ErrorKind::EmptySource, "No piece at " + from.to_string(), from, to);
    }
    const Colour mover = piece->colour();
    if (mover != active_) {
        return fail(ErrorKind::WrongTurnOwner,
                    std::string("It is ") + colour_name(active_) + "'s move, cannot move "
                    + piece->name() + " at " + from.to_string(), from, to);
    }
    if (from == to) {
        return fail(ErrorKind::IllegalGeometry, piece->name() + " must leave " + from.to_string(), from, to);
    }

    // A king's two-square step from its home square is a castle request
    if (piece->type() == PieceType::King) {
        for (CastleSide which : {CastleSide::King, CastleSide::Queen}) {
            const CastlePath& path = castle_path(mover, which);
            if (path.king_from == from.square() && path.king_to == to.square()) return castle(which);
        }
    }

    const bool is_pawn = piece->type() == PieceType::Pawn;
    const bool promotes = is_pawn && to.rank() == static_cast<const Pawn*>(piece)->last_rank();
    if (promotion) {
        if (!is_pawn) {
            return fail(ErrorKind::PromotionError, "Only pawns can be promoted, not the " + piece->name(), from, to);
        }
        if (!promotes) {
            return fail(ErrorKind::PromotionError,
                        "Pawn on " + to.to_string() + " has not reached the last rank", from, to);
        }
        if (*promotion == PieceType::Pawn || *promotion == PieceType::King) {
            return fail(ErrorKind::PromotionError,
                        std::string("Cannot promote to ") + piece_name(*promotion), from, to);
        }
    }

    Piece* target = board_.at(to);
    if (target != nullptr && target->colour() == mover) {
        return fail(ErrorKind::IllegalCapture,
                    piece->name() + " cannot capture its own " + piece_name(target->type())
                    + " on " + to.to_string(), from, to);
    }
    const bool en_passant = is_pawn && target == nullptr && en_passant_ == to
        && piece->can_take(to, *this);

    if (target != nullptr || en_passant) {
        if (!piece->can_take(to, *this)) return classify_failure(*piece, from, to);
    } else if (!piece->can_move_to(to, *this)) {
        return classify_failure(*piece, from, to);
    }

    const Snapshot before = snapshot();
    std::optional<PieceType> taken;
    MoveFlag flag = MoveFlag::Quiet;

    if (en_passant) {
        Location passed(BitUtil::make_square(to.file(), from.rank()));
        Piece* victim = board_.lift(passed);
        detach(victim, true);
        board_.force_move(from, to);
        taken = PieceType::Pawn;
        flag = MoveFlag::EnPassant;
        log(LogLevel::Info, piece->name() + " captures " + victim->name() + " en passant on " + passed.to_string());
    } else {
        Piece* victim = board_.force_move(from, to);
        if (victim != nullptr) {
            detach(victim, true);
            taken = victim->type();
            flag = MoveFlag::Capture;
            log(LogLevel::Info, piece->name() + " captures " + victim->name() + " on " + to.to_string());
        } else if (is_pawn && std::abs(to.rank() - from.rank()) == 2) {
            flag = MoveFlag::DoublePawnPush;
        }
    }
    piece->on_moved(from, to, *this);

    if (promotes) {
        const PieceType promote_to = promotion.value_or(PieceType::Queen);
        board_.lift(to);
        detach(piece, false);
        Piece* promoted = adopt(make_piece(promote_to, mover, to));
        promoted->has_moved_ = true;
        live_[static_cast<int>(mover)].push_back(promoted);
        board_.place(promoted, to);
        flag = promotion_flag(promote_to, taken.has_value());
        log(LogLevel::Info, std::string(colour_name(mover)) + " Pawn promoted to " + piece_name(promote_to)
            + " on " + to.to_string());
    }

    if (is_in_check(mover)) {
        restore(before);
        return fail(ErrorKind::SelfCheck,
                    std::string("Moving ") + piece_name(piece->type()) + " from " + from.to_string() + " to "
                    + to.to_string() + " would leave the " + colour_name(mover) + " King in check", from, to);
    }

    std::ostringstream line;
    line << "Turn " << turn_number_ << "-" << colour_name(mover) << ": " << from << " to " << to;
    log(LogLevel::Info, line.str());

    MoveRecord record{Move(from.square(), to.square(), flag), piece->type(), mover, taken,
                      from.to_string() + " " + to.to_string()};
    return finalize(std::move(record), is_pawn || taken.has_value());
}

Result<MoveRecord> Game::move(std::string_view from, std::string_view to) {
    if (from == "O-O" || from == "0-0") return castle(CastleSide::King);
    if (from == "O-O-O" || from == "0-0-0") return castle(CastleSide::Queen);

    auto start = Location::parse(from);
    if (!start) {
        MoveError error = start.error();
        error.fen = to_fen();
        return error;
    }
    auto end = Location::parse(to);
    if (!end) {
        MoveError error = end.error();
        error.fen = to_fen();
        return error;
    }
    return move(start.value(), end.value(), std::nullopt);
}

Result<MoveRecord> Game::castle(CastleSide which) {
    const Colour side = active_;
    const CastlePath& path = castle_path(side, which);
    const char* label = which == CastleSide::King ? "kingside" : "queenside";

    if (!can_castle(side, which)) {
        return fail(ErrorKind::IllegalCastle, std::string(colour_name(side)) + " cannot castle " + label,
                    Location(path.king_from), Location(path.king_to));
    }

    Piece* king_piece = board_.at(path.king_from);
    Piece* rook = board_.at(path.rook_from);
    board_.force_move(path.king_from, path.king_to);
    board_.force_move(path.rook_from, path.rook_to);
    king_piece->has_moved_ = true;
    rook->has_moved_ = true;
    en_passant_.reset();

    std::ostringstream line;
    line << "Turn " << turn_number_ << "-" << colour_name(side) << ": Castles " << label;
    log(LogLevel::Info, line.str());

    const MoveFlag flag = which == CastleSide::King ? MoveFlag::KingCastle : MoveFlag::QueenCastle;
    MoveRecord record{Move(path.king_from, path.king_to, flag), PieceType::King, side, std::nullopt,
                      which == CastleSide::King ? "O-O" : "O-O-O"};
    return finalize(std::move(record), false);
}

Result<MoveRecord> Game::play(std::string_view notation) {
    auto parsed = MoveResolver::parse(notation);
    if (!parsed) {
        MoveError error = parsed.error();
        error.fen = to_fen();
        log(LogLevel::Error, error.describe());
        return error;
    }

    log(LogLevel::Debug, "=== Turn " + std::to_string(turn_number_) + ": expanding " + colour_name(active_)
        + "'s move '" + std::string(notation) + "'");

    auto result = [&]() -> Result<MoveRecord> {
        if (parsed->castle) return castle(*parsed->castle);
        auto resolved = MoveResolver::resolve(*this, parsed.value());
        if (!resolved) return resolved.error();
        return move(Location(resolved->from()), Location(resolved->to()), parsed->promotion);
    }();

    if (!result) {
        log(LogLevel::Error, result.error().describe());
        return result;
    }
    moves_.back().notation = parsed->text;
    result->notation = parsed->text;
    return result;
}

Result<MoveRecord> Game::finalize(MoveRecord record, bool reset_clock) {
    halfmove_clock_ = reset_clock ? 0 : halfmove_clock_ + 1;
    const Colour mover = active_;
    active_ = opposite(active_);
    ++ply_count_;
    if (mover == Colour::Black) ++turn_number_;

    record.check = is_in_check(active_);
    // The side now to move is the one whose King can be mated
    record.checkmate = is_checkmate(active_);
    if (record.checkmate) {
        log(LogLevel::Info, std::string("Checkmate: the ") + colour_name(active_) + " King has no escape square");
    } else if (record.check) {
        log(LogLevel::Info, std::string(colour_name(active_)) + " is in check");
    }

    moves_.push_back(record);
    return record;
}

// --- QUERIES ---

Piece* Game::king(Colour side) const {
    for (Piece* p : live_[static_cast<int>(side)]) {
        if (p->type() == PieceType::King) return p;
    }
    return nullptr;
}

bool Game::is_attacked(Location square, Colour by) const {
    for (const Piece* p : live_[static_cast<int>(by)]) {
        if (!p->location() || *p->location() == square) continue;
        if (p->attacks(square, *this)) return true;
    }
    return false;
}

bool Game::is_attacked(Location square, Colour by, Location vacated) const {
    const Bitboard occupied = board_.occupancy() & ~BitUtil::from_square(vacated.square());
    for (const Piece* p : live_[static_cast<int>(by)]) {
        if (!p->location() || *p->location() == square) continue;
        if (p->attacks(square, *this)) return true;

        const PieceType type = p->type();
        if (type != PieceType::Bishop && type != PieceType::Rook && type != PieceType::Queen) continue;
        if (p->can_reach(square) && (Attacks::between(p->location()->square(), square.square()) & occupied) == 0) {
            return true;
        }
    }
    return false;
}

bool Game::is_in_check(Colour side) const {
    const Piece* k = king(side);
    return k != nullptr && k->location() && is_attacked(*k->location(), opposite(side));
}

// Only the squares around the king are examined: no escape square means mate.
// Blocks and captures of the checking piece are not considered.
bool Game::is_checkmate(Colour defender) const {
    const Piece* k = king(defender);
    if (k == nullptr || !k->location()) return false;

    for (int df = -1; df <= 1; ++df) {
        for (int dr = -1; dr <= 1; ++dr) {
            if (df == 0 && dr == 0) continue;
            auto square = k->location()->try_offset(Offset{df, dr});
            if (!square) continue;
            const Piece* occupant = board_.at(*square);
            if (occupant != nullptr && occupant->colour() == defender) continue;
            if (k->can_move_to(*square, *this)) return false;
        }
    }
    return true;
}

bool Game::castle_rights_intact(Colour side, CastleSide which) const {
    const CastlePath& path = castle_path(side, which);
    const Piece* k = board_.at(path.king_from);
    const Piece* r = board_.at(path.rook_from);
    return k && k->type() == PieceType::King && k->colour() == side && !k->has_moved()
        && r && r->type() == PieceType::Rook && r->colour() == side && !r->has_moved();
}

bool Game::can_castle(Colour side, CastleSide which) const {
    if (!castle_rights_intact(side, which)) return false;

    const CastlePath& path = castle_path(side, which);
    if (!board_.is_path_clear(path.king_from, path.rook_from)) return false;

    const Colour them = opposite(side);
    if (is_attacked(path.king_from, them) || is_attacked(path.king_to, them)) return false;
    for (Location sq : Board::squares_between(path.king_from, path.king_to)) {
        if (is_attacked(sq, them)) return false;
    }
    return true;
}

std::string Game::castling_rights() const {
    std::string rights;
    if (castle_rights_intact(Colour::White, CastleSide::King)) rights += 'K';
    if (castle_rights_intact(Colour::White, CastleSide::Queen)) rights += 'Q';
    if (castle_rights_intact(Colour::Black, CastleSide::King)) rights += 'k';
    if (castle_rights_intact(Colour::Black, CastleSide::Queen)) rights += 'q';
    return rights.empty() ? "-" : rights;
}

std::vector<Location> Game::legal_destinations(Location from) {
    std::vector<Location> out;
    const Piece* piece = board_.at(from);
    if (piece == nullptr || piece->colour() != active_) return out;

    for (int i = 0; i < 64; ++i) {
        Location to(static_cast<Square>(i));
        if (to == from) continue;
        TempMove probe(*this);
        if (move(from, to, std::nullopt).ok()) out.push_back(to);
    }
    return out;
}

std::string Game::to_fen() const {
    std::string fen;
    for (int rank = 7; rank >= 0; --rank) {
        int empty = 0;
        for (int file = 0; file < 8; ++file) {
            const Piece* p = board_.at(Location(BitUtil::make_square(file, rank)));
            if (p == nullptr) {
                ++empty;
                continue;
            }
            if (empty) fen += static_cast<char>('0' + empty);
            empty = 0;
            fen += p->symbol();
        }
        if (empty) fen += static_cast<char>('0' + empty);
        if (rank > 0) fen += '/';
    }

    fen += active_ == Colour::White ? " w " : " b ";
    fen += castling_rights();
    // En passant is never exported
    fen += " - " + std::to_string(halfmove_clock_) + ' ' + std::to_string(turn_number_);
    return fen;
}

// --- ROLLBACK ---

Game::Snapshot Game::snapshot() const {
    Snapshot snap{board_.state(), live_, captured_, {}, moves_.size(),
                  active_, ply_count_, turn_number_, halfmove_clock_, en_passant_};
    snap.pieces.reserve(arena_.size());
    for (const auto& p : arena_) snap.pieces.push_back({p->location_, p->has_moved_});
    return snap;
}

// Pieces created after the snapshot (promotions) are destroyed; every older
// piece gets its square and moved flag back.
void Game::restore(const Snapshot& snap) {
    if (arena_.size() > snap.pieces.size()) {
        arena_.erase(arena_.begin() + static_cast<std::ptrdiff_t>(snap.pieces.size()), arena_.end());
    }
    for (std::size_t i = 0; i < arena_.size(); ++i) {
        arena_[i]->location_ = snap.pieces[i].location;
        arena_[i]->has_moved_ = snap.pieces[i].has_moved;
    }
    board_.restore(snap.board);
    live_ = snap.live;
    captured_ = snap.captured;
    if (moves_.size() > snap.moves_logged) {
        moves_.erase(moves_.begin() + static_cast<std::ptrdiff_t>(snap.moves_logged), moves_.end());
    }
    active_ = snap.active;
    ply_count_ = snap.ply_count;
    turn_number_ = snap.turn_number;
    halfmove_clock_ = snap.halfmove_clock;
    en_passant_ = snap.en_passant;
}
