#include "Game.hpp"
#include "Interface.hpp"
#include "Log.hpp"
#include <iostream>
#include <string>
#include <string_view>

int main(int argc, char** argv) {
    LogLevel level = LogLevel::Info;
    std::string fen;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--log-level") {
            auto parsed = (i + 1 < argc) ? parse_log_level(argv[++i]) : std::nullopt;
            if (!parsed) {
                std::cerr << "usage: chess-gui [--log-level LEVEL] [FEN]" << std::endl;
                return 2;
            }
            level = *parsed;
        } else {
            // An unquoted FEN arrives as several arguments
            if (!fen.empty()) fen += ' ';
            fen += arg;
        }
    }

    StreamLogSink log(std::cout, level);
    Game game(&log);
    if (!fen.empty()) {
        Status loaded = game.load_fen(fen);
        if (!loaded) {
            std::cerr << loaded.error().describe() << std::endl;
            return 2;
        }
    }

    std::cout << "Starting chess board" << std::endl;
    GUI::Launch(game, fen);
    return 0;
}
