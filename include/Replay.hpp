#pragma once

#include "Errors.hpp"
#include "Log.hpp"
#include "PgnReader.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>


namespace Replay {

    struct Options {
        int threads = 1;
        LogLevel log_level = LogLevel::Warning;
        std::optional<std::string> failed_out;  // default: <file>-failed.pgn
        bool print_board = false;
        bool show_help = false;
        std::vector<std::string> files;
    };

    // Returns false and fills `error` on bad input.
    bool parse_options(int argc, const char* const* argv, Options& options, std::string& error);
    std::string usage();

    struct GameReport {
        std::string title;
        bool passed = false;
        std::size_t moves_played = 0;
        std::string failed_move;          // token that stopped the game
        std::optional<MoveError> error;
        std::string final_fen;
        std::string final_board;          // console rendering of the last position
    };

    // Plays every move of the game from its starting position, stopping at the first error.
    GameReport replay(const Pgn::PgnGame& game, ILogSink& log);

    // One Game per worker; reports come back in input order.
    std::vector<GameReport> replay_all(const std::vector<Pgn::PgnGame>& games, int threads, ILogSink& log);

    // Re-emits the failed games as PGN.
    void write_failed(const std::vector<GameReport>& reports, const std::vector<Pgn::PgnGame>& games,
                      std::ostream& out);

    // "games.pgn" -> "games-failed.pgn"; a file that is already a failure list is reused.
    std::string failed_path(const std::string& input);
}
