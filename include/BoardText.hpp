#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include "Location.hpp"

#include <iosfwd>
#include <string>
#include <vector>


namespace BoardText {
    // Unicode chess glyph, or the FEN letter when `unicode` is false
    std::string glyph(PieceType type, Colour colour, bool unicode = true);

    // Ranks 8 to 1 with file labels; highlighted squares are bracketed.
    std::string render(const Board& board, const std::vector<Location>& highlights = {}, bool unicode = true);

    void print(const Board& board, std::ostream& out, const std::vector<Location>& highlights = {});
}
