#include "BoardText.hpp"
#include "BitUtil.hpp"
#include "Pieces.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>


namespace BoardText {

    std::string glyph(PieceType type, Colour colour, bool unicode) {
        if (!unicode) {
            char c = piece_letter(type);
            if (colour == Colour::Black) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return std::string(1, c);
        }

        // [colour][type], Pawn..King
        static const char* const GLYPHS[2][6] = {
            {"♙", "♘", "♗", "♖", "♕", "♔"},
            {"♟", "♞", "♝", "♜", "♛", "♚"},
        };
        return GLYPHS[static_cast<int>(colour)][static_cast<int>(type)];
    }

    std::string render(const Board& board, const std::vector<Location>& highlights, bool unicode) {
        const OccupancyGrid grid = board.grid();
        std::string out = "   a  b  c  d  e  f  g  h\n";

        for (int rank = 7; rank >= 0; --rank) {
            out += static_cast<char>('1' + rank);
            out += ' ';
            for (int file = 0; file < 8; ++file) {
                const Location loc(BitUtil::make_square(file, rank));
                const bool lit = std::find(highlights.begin(), highlights.end(), loc) != highlights.end();
                const auto& cell = grid[rank][file];

                out += lit ? '[' : ' ';
                out += cell ? glyph(cell->type, cell->colour, unicode) : std::string(".");
                out += lit ? ']' : ' ';
            }
            out += ' ';
            out += static_cast<char>('1' + rank);
            out += '\n';
        }
        out += "   a  b  c  d  e  f  g  h\n";
        return out;
    }

    void print(const Board& board, std::ostream& out, const std::vector<Location>& highlights) {
        out << render(board, highlights) << std::flush;
    }
}
