#include "MoveResolver.hpp"
#include "Game.hpp"
#include "Pieces.hpp"
#include "TempMove.hpp"

#include <cctype>
#include <cstdlib>


namespace {
    constexpr std::string_view WHITESPACE = " \t\r\n";

    MoveError notation_error(std::string_view text, const std::string& why) {
        return make_error(ErrorKind::InvalidNotation, "Cannot read move '" + std::string(text) + "': " + why);
    }

    MoveError board_error(const Game& game, ErrorKind kind, std::string message,
                          std::optional<Square> to = std::nullopt) {
        MoveError error = make_error(kind, std::move(message), std::nullopt, to);
        error.fen = game.to_fen();
        return error;
    }

    bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }

    int last_rank(Colour side) { return side == Colour::White ? 7 : 0; }

    std::string plural(PieceType type) { return std::string(piece_name(type)) + "s"; }
}


namespace MoveResolver {

    Result<Notation> parse(std::string_view text) {
        const auto first = text.find_first_not_of(WHITESPACE);
        if (first == std::string_view::npos) return notation_error(text, "empty");
        const auto last = text.find_last_not_of(WHITESPACE);

        Notation n;
        n.text = std::string(text.substr(first, last - first + 1));
        std::string s = n.text;

        // Annotations, then check / mate markers
        while (!s.empty() && (s.back() == '!' || s.back() == '?')) s.pop_back();
        while (!s.empty() && (s.back() == '+' || s.back() == '#')) {
            if (s.back() == '#') n.mate = true;
            else n.check = true;
            s.pop_back();
        }

        if (s == "O-O" || s == "0-0") {
            n.castle = CastleSide::King;
            n.piece = PieceType::King;
            return n;
        }
        if (s == "O-O-O" || s == "0-0-0") {
            n.castle = CastleSide::Queen;
            n.piece = PieceType::King;
            return n;
        }
        if (s.empty()) return notation_error(text, "nothing but annotations");

        std::size_t i = 0;
        if (is_upper(s[0])) {
            auto type = piece_from_letter(s[0]);
            if (!type) return notation_error(text, "unknown piece letter");
            n.piece = *type;
            ++i;
        }

        // Promotion suffix: "=Q" or a bare trailing piece letter
        std::size_t stop = s.size();
        if (stop >= i + 4 && s[stop - 2] == '=') {
            n.promotion = piece_from_letter(s[stop - 1]);
            if (!n.promotion) return notation_error(text, "unknown promotion piece");
            stop -= 2;
        } else if (stop >= i + 3 && is_upper(s[stop - 1])) {
            n.promotion = piece_from_letter(s[stop - 1]);
            if (!n.promotion) return notation_error(text, "unknown promotion piece");
            stop -= 1;
        }
        if (n.promotion) {
            if (n.piece != PieceType::Pawn) return notation_error(text, "only pawns promote");
            if (*n.promotion == PieceType::Pawn || *n.promotion == PieceType::King) {
                return make_error(ErrorKind::PromotionError,
                                  std::string("Cannot promote to ") + piece_name(*n.promotion));
            }
        }

        if (stop < i + 2) return notation_error(text, "no destination square");
        auto dest = Location::parse(std::string_view(s).substr(stop - 2, 2));
        if (!dest) return notation_error(text, "bad destination square");
        n.to = dest.value();

        // Whatever sits between the piece letter and the destination
        for (std::size_t k = i; k < stop - 2; ++k) {
            const char c = s[k];
            if (c == 'x' || c == ':') {
                if (n.capture) return notation_error(text, "repeated capture marker");
                n.capture = true;
            } else if (c == '-') {
                continue;
            } else if (n.capture) {
                return notation_error(text, "unexpected text after the capture marker");
            } else if (c >= 'a' && c <= 'h' && !n.from_file && !n.from_rank) {
                n.from_file = c - 'a';
            } else if (c >= '1' && c <= '8' && !n.from_rank) {
                n.from_rank = c - '1';
            } else {
                return notation_error(text, std::string("unexpected '") + c + "'");
            }
        }
        return n;
    }

    std::vector<Piece*> candidates(const Game& game, const Notation& notation) {
        std::vector<Piece*> found;
        if (!notation.to) return found;

        const Colour side = game.active_player();
        const Location dest = *notation.to;
        std::optional<int> file = notation.from_file;
        std::optional<int> rank = notation.from_rank;

        if (notation.piece == PieceType::King && !file && !rank) {
            const Piece* k = game.king(side);
            if (k != nullptr && k->location()) {
                file = k->location()->file();
                rank = k->location()->rank();
            }
        }

        const bool target_empty = game.board().is_empty(dest);
        for (Piece* p : game.pieces(side)) {
            if (p->type() != notation.piece || !p->location()) continue;
            if (file && p->location()->file() != *file) continue;
            if (rank && p->location()->rank() != *rank) continue;

            bool reaches;
            if (!notation.capture) {
                reaches = p->can_move_to(dest, game);
            } else if (target_empty) {
                reaches = p->type() == PieceType::Pawn && game.en_passant_target() == dest
                    && p->can_take(dest, game);
            } else {
                reaches = p->can_take(dest, game);
            }
            if (reaches) found.push_back(p);
        }
        return found;
    }

    Result<Move> resolve(Game& game, const Notation& notation) {
        const Colour side = game.active_player();

        if (notation.castle) {
            const CastlePath& path = castle_path(side, *notation.castle);
            if (!game.can_castle(side, *notation.castle)) {
                return board_error(game, ErrorKind::IllegalCastle,
                                   std::string(colour_name(side)) + " cannot play " + notation.text);
            }
            const MoveFlag flag = *notation.castle == CastleSide::King ? MoveFlag::KingCastle : MoveFlag::QueenCastle;
            return Move(path.king_from, path.king_to, flag);
        }
        if (!notation.to) return notation_error(notation.text, "no destination square");

        const Location dest = *notation.to;
        if (notation.promotion && dest.rank() != last_rank(side)) {
            return board_error(game, ErrorKind::PromotionError,
                               "Pawn cannot promote on " + dest.to_string(), dest.square());
        }

        std::vector<Piece*> found = candidates(game, notation);
        game.log(LogLevel::Debug, "Found " + std::to_string(found.size()) + " possible "
                 + plural(notation.piece) + " for '" + notation.text + "'");
        if (found.empty()) {
            return board_error(game, ErrorKind::NoLegalCandidate,
                               std::string("None of ") + colour_name(side) + "'s " + plural(notation.piece)
                               + " can reach " + dest.to_string(), dest.square());
        }

        // Anything the executor refuses (a pinned piece, in practice) is out
        std::vector<Piece*> survivors;
        for (Piece* p : found) {
            const Location from = *p->location();
            TempMove probe(game);
            auto trial = game.move(from, dest, notation.promotion);
            if (trial) {
                survivors.push_back(p);
            } else {
                game.log(LogLevel::Trace, p->name() + " at " + from.to_string() + " eliminated: "
                         + trial.error().describe());
            }
        }

        if (survivors.empty()) {
            return board_error(game, ErrorKind::NoLegalCandidate,
                               std::string("No ") + colour_name(side) + " " + piece_name(notation.piece)
                               + " can legally move to " + dest.to_string(), dest.square());
        }
        if (survivors.size() > 1) {
            std::string sources;
            for (const Piece* p : survivors) sources += " " + p->location()->to_string();
            return board_error(game, ErrorKind::AmbiguousMove,
                               "'" + notation.text + "' matches " + plural(notation.piece) + " on" + sources,
                               dest.square());
        }

        const Piece* piece = survivors.front();
        const Location from = *piece->location();
        const bool capture = !game.board().is_empty(dest);
        MoveFlag flag = capture ? MoveFlag::Capture : MoveFlag::Quiet;
        if (piece->type() == PieceType::Pawn) {
            if (!capture && from.file() != dest.file()) {
                flag = MoveFlag::EnPassant;
            } else if (dest.rank() == last_rank(side)) {
                flag = promotion_flag(notation.promotion.value_or(PieceType::Queen), capture);
            } else if (std::abs(dest.rank() - from.rank()) == 2) {
                flag = MoveFlag::DoublePawnPush;
            }
        }
        game.log(LogLevel::Debug, "Resolved '" + notation.text + "' to " + from.to_string() + dest.to_string());
        return Move(from.square(), dest.square(), flag);
    }

    Result<Move> resolve(Game& game, std::string_view text) {
        auto notation = parse(text);
        if (!notation) return notation.error();
        return resolve(game, notation.value());
    }
}
