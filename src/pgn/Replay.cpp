#include "Replay.hpp"
#include "BoardText.hpp"
#include "Game.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <ostream>
#include <string_view>
#include <thread>


namespace Replay {

    std::string usage() {
        return "usage: chess-replay [--threads N] [--log-level LEVEL] [--failed-out FILE] [--print-board] FILE...\n"
               "  --threads N        replay games on N worker threads (default 1)\n"
               "  --log-level LEVEL  trace, debug, info, warning, error or off (default warning)\n"
               "  --failed-out FILE  where failed games are written (default <file>-failed.pgn)\n"
               "  --print-board      print the final position of every game\n";
    }

    bool parse_options(int argc, const char* const* argv, Options& options, std::string& error) {
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];

            auto value = [&]() -> std::optional<std::string_view> {
                if (i + 1 >= argc) {
                    error = std::string(arg) + " needs a value";
                    return std::nullopt;
                }
                return std::string_view(argv[++i]);
            };

            if (arg == "--help" || arg == "-h") {
                options.show_help = true;
            } else if (arg == "--threads") {
                auto text = value();
                if (!text) return false;
                int n = 0;
                auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), n);
                if (ec != std::errc() || ptr != text->data() + text->size() || n < 1) {
                    error = "--threads expects a positive number, got '" + std::string(*text) + "'";
                    return false;
                }
                options.threads = n;
            } else if (arg == "--log-level") {
                auto text = value();
                if (!text) return false;
                auto level = parse_log_level(*text);
                if (!level) {
                    error = "Unknown log level '" + std::string(*text) + "'";
                    return false;
                }
                options.log_level = *level;
            } else if (arg == "--failed-out") {
                auto text = value();
                if (!text) return false;
                options.failed_out = std::string(*text);
            } else if (arg == "--print-board") {
                options.print_board = true;
            } else if (arg.size() > 1 && arg.front() == '-') {
                error = "Unknown option '" + std::string(arg) + "'";
                return false;
            } else {
                options.files.emplace_back(arg);
            }
        }

        if (options.files.empty() && !options.show_help) {
            error = "No PGN files given";
            return false;
        }
        return true;
    }

    GameReport replay(const Pgn::PgnGame& pgn, ILogSink& log) {
        GameReport report;
        report.title = pgn.title();

        Game game(&log);
        if (auto fen = pgn.tag("fen")) {
            Status loaded = game.load_fen(*fen);
            if (!loaded) {
                report.error = loaded.error();
                report.final_fen = game.to_fen();
                report.final_board = BoardText::render(game.board());
                return report;
            }
        }

        for (const std::string& token : pgn.moves) {
            auto played = game.play(token);
            if (!played) {
                report.failed_move = token;
                report.error = played.error();
                break;
            }
            ++report.moves_played;
        }

        report.passed = !report.error.has_value();
        report.final_fen = game.to_fen();
        report.final_board = BoardText::render(game.board());
        if (report.passed && log.enabled(LogLevel::Debug)) {
            log.write(LogLevel::Debug, report.title + ": " + std::to_string(report.moves_played) + " moves replayed");
        }
        return report;
    }

    std::vector<GameReport> replay_all(const std::vector<Pgn::PgnGame>& games, int threads, ILogSink& log) {
        std::vector<GameReport> reports(games.size());
        if (games.empty()) return reports;

        const std::size_t workers = std::clamp<std::size_t>(static_cast<std::size_t>(std::max(threads, 1)), 1,
                                                            games.size());
        std::atomic<std::size_t> next{0};

        auto work = [&]() {
            for (std::size_t i = next.fetch_add(1); i < games.size(); i = next.fetch_add(1)) {
                reports[i] = replay(games[i], log);
            }
        };

        if (workers == 1) {
            work();
            return reports;
        }

        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (std::size_t t = 0; t < workers; ++t) pool.emplace_back(work);
        for (auto& worker : pool) worker.join();
        return reports;
    }

    void write_failed(const std::vector<GameReport>& reports, const std::vector<Pgn::PgnGame>& games,
                      std::ostream& out) {
        const std::size_t count = std::min(reports.size(), games.size());
        for (std::size_t i = 0; i < count; ++i) {
            if (!reports[i].passed) out << games[i].text << '\n';
        }
    }

    std::string failed_path(const std::string& input) {
        if (input.find("failed") != std::string::npos) return input;
        std::string stem = input;
        if (stem.size() >= 4 && stem.compare(stem.size() - 4, 4, ".pgn") == 0) stem.resize(stem.size() - 4);
        return stem + "-failed.pgn";
    }
}
