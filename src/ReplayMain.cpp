#include "Log.hpp"
#include "PgnReader.hpp"
#include "Replay.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <string>
#include <vector>


int main(int argc, char** argv) {
    Replay::Options options;
    std::string error;
    if (!Replay::parse_options(argc, argv, options, error)) {
        std::cerr << error << "\n" << Replay::usage();
        return 2;
    }
    if (options.show_help) {
        std::cout << Replay::usage();
        return 0;
    }

    StreamLogSink log(std::cerr, options.log_level);
    std::set<std::string> written;
    int exit_code = 0;

    for (const std::string& file : options.files) {
        std::ifstream in(file);
        if (!in) {
            std::cerr << "Cannot open " << file << std::endl;
            exit_code = 2;
            continue;
        }

        const std::vector<Pgn::PgnGame> games = Pgn::read_games(in);
        const std::vector<Replay::GameReport> reports = Replay::replay_all(games, options.threads, log);

        std::size_t passed = 0;
        std::cout << "=== " << file << " ===" << std::endl;
        for (const auto& report : reports) {
            if (report.passed) {
                ++passed;
                std::cout << "  PASS  " << report.title << "\n";
            } else {
                std::cout << "  FAIL  " << report.title;
                if (!report.failed_move.empty()) {
                    std::cout << "  (move " << report.moves_played + 1 << " '" << report.failed_move << "')";
                }
                std::cout << "\n        " << report.error->describe() << "\n";
            }
            if (options.print_board) std::cout << report.final_board << report.final_fen << "\n\n";
        }

        const double percent = reports.empty() ? 100.0 : 100.0 * static_cast<double>(passed) / reports.size();
        std::cout << file << ": " << passed << "/" << reports.size() << " passed ("
                  << std::fixed << std::setprecision(2) << percent << "%)" << std::endl;

        if (passed == reports.size()) continue;
        if (exit_code == 0) exit_code = 1;

        const std::string out_path = options.failed_out.value_or(Replay::failed_path(file));
        const auto mode = written.count(out_path) ? std::ios::app : std::ios::trunc;
        std::ofstream out(out_path, std::ios::out | mode);
        if (!out) {
            std::cerr << "Cannot write " << out_path << std::endl;
            exit_code = 2;
            continue;
        }
        Replay::write_failed(reports, games, out);
        written.insert(out_path);
        std::cout << "Failed games written to " << out_path << std::endl;
    }
    return exit_code;
}
