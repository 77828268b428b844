#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include "Errors.hpp"
#include "IChessCore.hpp"
#include "Location.hpp"
#include "Log.hpp"
#include "Pieces.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


struct CastlePath {
    Square king_from;
    Square king_to;
    Square rook_from;
    Square rook_to;
};

// [colour][side]
inline constexpr std::array<std::array<CastlePath, 2>, 2> CASTLE_PATHS{{
    {{ {Square::E1, Square::G1, Square::H1, Square::F1},
       {Square::E1, Square::C1, Square::A1, Square::D1} }},
    {{ {Square::E8, Square::G8, Square::H8, Square::F8},
       {Square::E8, Square::C8, Square::A8, Square::D8} }},
}};

inline const CastlePath& castle_path(Colour side, CastleSide which) {
    return CASTLE_PATHS[static_cast<int>(side)][static_cast<int>(which)];
}

inline constexpr std::string_view START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";


class Game : public IChessCore {
public:
    // Everything mutable, captured by value. Pieces are addressed by their
    // arena index so the snapshot never holds dangling state.
    struct Snapshot {
        struct PieceState {
            std::optional<Location> location;
            bool has_moved;
        };

        Board::State board;
        std::array<std::vector<Piece*>, 2> live;
        std::array<std::vector<Piece*>, 2> captured;
        std::vector<PieceState> pieces;
        std::size_t moves_logged;
        Colour active;
        int ply_count;
        int turn_number;
        int halfmove_clock;
        std::optional<Location> en_passant;
    };

    explicit Game(ILogSink* log = nullptr);

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    // --- SETUP ---
    void reset() override;   // standard starting position
    void clear();            // empty board, White to move
    Status load_fen(std::string_view fen) override;

    // Setup escape hatches for tests and editors; normal play goes through move().
    Piece* add_piece(PieceType type, Colour colour, Location loc);
    bool remove_piece(Location loc);
    void set_active_player(Colour side) { active_ = side; }

    // --- MOVES ---
    Result<MoveRecord> move(Location from, Location to, std::optional<PieceType> promotion) override;
    Result<MoveRecord> move(Location from, Location to) { return move(from, to, std::nullopt); }
    // Coordinate strings; "O-O" / "O-O-O" in `from` castles.
    Result<MoveRecord> move(std::string_view from, std::string_view to);
    Result<MoveRecord> castle(CastleSide side) override;
    Result<MoveRecord> play(std::string_view notation) override;

    // --- QUERIES ---
    const Board& board() const { return board_; }
    OccupancyGrid grid() const override { return board_.grid(); }
    Colour active_player() const override { return active_; }
    const std::vector<Piece*>& pieces(Colour side) const { return live_[static_cast<int>(side)]; }
    const std::vector<Piece*>& captured(Colour side) const { return captured_[static_cast<int>(side)]; }
    const std::vector<MoveRecord>& moves() const override { return moves_; }
    std::optional<Location> en_passant_target() const { return en_passant_; }
    int halfmove_clock() const { return halfmove_clock_; }
    int turn_number() const { return turn_number_; }
    int ply_count() const { return ply_count_; }
    Piece* king(Colour side) const;

    bool is_attacked(Location square, Colour by) const;
    // Same, with `vacated` counted as empty. A King judges its own step this way.
    bool is_attacked(Location square, Colour by, Location vacated) const;
    bool is_in_check(Colour side) const override;
    bool is_checkmate(Colour defender) const;
    // Checkmate detection for the player who is not to move
    bool check_for_checkmate() const { return is_checkmate(opposite(active_)); }
    bool can_castle(Colour side, CastleSide which) const;
    std::string castling_rights() const;
    std::vector<Location> legal_destinations(Location from) override;
    std::string to_fen() const override;

    // Pieces report double steps and their reset through this.
    void set_en_passant_target(std::optional<Location> target) { en_passant_ = target; }

    // --- ROLLBACK ---
    Snapshot snapshot() const;
    void restore(const Snapshot& snap);
    bool speculating() const { return speculation_depth_ > 0; }

    void set_log_sink(ILogSink* log);
    // Informational levels are demoted to Trace while a rollback scope is open
    void log(LogLevel level, const std::string& message) const;

private:
    friend class TempMove;

    Piece* adopt(std::unique_ptr<Piece> piece);
    void detach(Piece* piece, bool to_captured);
    MoveError fail(ErrorKind kind, std::string message,
                   std::optional<Location> from = std::nullopt,
                   std::optional<Location> to = std::nullopt) const;
    MoveError classify_failure(const Piece& piece, Location from, Location to) const;
    Result<MoveRecord> finalize(MoveRecord record, bool reset_clock);
    bool castle_rights_intact(Colour side, CastleSide which) const;

    Board board_;
    std::vector<std::unique_ptr<Piece>> arena_;
    std::array<std::vector<Piece*>, 2> live_;
    std::array<std::vector<Piece*>, 2> captured_;
    std::vector<MoveRecord> moves_;
    Colour active_ = Colour::White;
    int ply_count_ = 0;
    int turn_number_ = 1;
    int halfmove_clock_ = 0;
    std::optional<Location> en_passant_;
    int speculation_depth_ = 0;
    ILogSink* log_;
};
