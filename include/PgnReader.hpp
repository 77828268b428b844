#pragma once

#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace Pgn {

    struct PgnGame {
        std::map<std::string, std::string> tags;  // keys lower-cased
        std::vector<std::string> moves;           // SAN tokens in play order
        std::string text;                         // the game as read

        std::optional<std::string> tag(std::string_view name) const;
        std::string title() const;   // "White v. Black"
        std::string result() const;  // "*" when the tag is missing
    };

    // One string per game: tag block, blank line, movetext.
    std::vector<std::string> split_games(std::istream& in);

    PgnGame parse_game(const std::string& text);

    std::vector<PgnGame> read_games(std::istream& in);
}
