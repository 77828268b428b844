#include "PgnReader.hpp"

#include <algorithm>
#include <cctype>
#include <istream>


namespace {

    enum class TokenType { End, Symbol, String, Punctuation };

    struct Token {
        TokenType type = TokenType::End;
        std::string text;
    };

    bool is_symbol_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '+' || c == '#'
            || c == '=' || c == ':' || c == '-' || c == '/' || c == '$';
    }

    std::string lower(std::string_view text) {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string trim(std::string_view text) {
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) return {};
        const auto last = text.find_last_not_of(" \t\r\n");
        return std::string(text.substr(first, last - first + 1));
    }

    // Comments and variations are consumed here and never surface as tokens.
    class Scanner {
    public:
        explicit Scanner(std::string_view text) : text_(text) {}

        Token next() {
            for (;;) {
                while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
                if (pos_ >= text_.size()) return {};

                const char c = text_[pos_];
                if (c == ';') {
                    skip_past('\n');
                } else if (c == '{') {
                    skip_past('}');
                } else if (c == '(') {
                    skip_variation();
                } else if (c == '"') {
                    return read_string();
                } else if (is_symbol_char(c)) {
                    const std::size_t start = pos_;
                    while (pos_ < text_.size() && is_symbol_char(text_[pos_])) ++pos_;
                    return {TokenType::Symbol, std::string(text_.substr(start, pos_ - start))};
                } else {
                    ++pos_;
                    return {TokenType::Punctuation, std::string(1, c)};
                }
            }
        }

    private:
        void skip_past(char terminator) {
            const auto found = text_.find(terminator, pos_);
            pos_ = found == std::string_view::npos ? text_.size() : found + 1;
        }

        void skip_variation() {
            int nesting = 0;
            do {
                if (text_[pos_] == '(') ++nesting;
                else if (text_[pos_] == ')') --nesting;
                ++pos_;
            } while (nesting > 0 && pos_ < text_.size());
        }

        Token read_string() {
            std::string value;
            bool escaped = false;
            for (++pos_; pos_ < text_.size(); ++pos_) {
                const char c = text_[pos_];
                if (escaped) {
                    value += c;
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    ++pos_;
                    break;
                } else {
                    value += c;
                }
            }
            return {TokenType::String, value};
        }

        std::string_view text_;
        std::size_t pos_ = 0;
    };

    bool is_result(std::string_view token) {
        return token == "1-0" || token == "0-1" || token == "1/2-1/2" || token == "*";
    }

    bool is_move_number(std::string_view token) {
        return !token.empty() && std::all_of(token.begin(), token.end(),
                                             [](unsigned char c) { return std::isdigit(c); });
    }
}


namespace Pgn {

    std::optional<std::string> PgnGame::tag(std::string_view name) const {
        auto it = tags.find(lower(name));
        if (it == tags.end()) return std::nullopt;
        return it->second;
    }

    std::string PgnGame::title() const {
        return tag("white").value_or("?") + " v. " + tag("black").value_or("?");
    }

    std::string PgnGame::result() const {
        return tag("result").value_or("*");
    }

    std::vector<std::string> split_games(std::istream& in) {
        std::vector<std::string> games;
        std::string current;
        bool in_moves = false;

        auto flush = [&]() {
            if (!trim(current).empty()) games.push_back(current);
            current.clear();
            in_moves = false;
        };

        std::string line;
        while (std::getline(in, line)) {
            const std::string trimmed = trim(line);
            if (!trimmed.empty() && trimmed.front() == '[') {
                // A tag after movetext starts the next game even without a blank line
                if (in_moves) flush();
                current += trimmed + '\n';
            } else if (trimmed.empty()) {
                if (in_moves) flush();
                else if (!current.empty()) current += '\n';
            } else {
                in_moves = true;
                current += trimmed + '\n';
            }
        }
        flush();
        return games;
    }

    PgnGame parse_game(const std::string& text) {
        PgnGame game;
        game.text = text;

        Scanner scanner(text);
        for (Token token = scanner.next(); token.type != TokenType::End; token = scanner.next()) {
            if (token.type == TokenType::Punctuation && token.text == "[") {
                Token name = scanner.next();
                Token value = scanner.next();
                if (name.type == TokenType::Symbol && value.type == TokenType::String) {
                    game.tags[lower(name.text)] = value.text;
                }
                // Consume up to the closing bracket
                while (value.type != TokenType::End && !(value.type == TokenType::Punctuation && value.text == "]")) {
                    value = scanner.next();
                }
                continue;
            }
            if (token.type != TokenType::Symbol) continue;
            if (token.text.front() == '$' || is_move_number(token.text) || is_result(token.text)) continue;
            game.moves.push_back(token.text);
        }
        return game;
    }

    std::vector<PgnGame> read_games(std::istream& in) {
        std::vector<PgnGame> games;
        for (const std::string& text : split_games(in)) games.push_back(parse_game(text));
        return games;
    }
}
