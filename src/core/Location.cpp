#include "Location.hpp"

#include <cctype>
#include <ostream>


Result<Location> Location::parse(std::string_view text) {
    if (text.size() != 2) {
        return make_error(ErrorKind::InvalidSquare,
                          "Location must be a file and a rank, not '" + std::string(text) + "'");
    }
    char f = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
    char r = text[1];
    if (f < 'a' || f > 'h' || r < '1' || r > '8') {
        return make_error(ErrorKind::InvalidSquare, "Invalid location: " + std::string(text));
    }
    return Location(BitUtil::make_square(f - 'a', r - '1'));
}

std::optional<Location> Location::from_coords(int file, int rank) {
    if (!BitUtil::on_board(file, rank)) return std::nullopt;
    return Location(BitUtil::make_square(file, rank));
}

std::optional<Location> Location::try_offset(Offset d) const {
    return from_coords(file() + d.files, rank() + d.ranks);
}

Result<Location> Location::offset(Offset d) const {
    if (auto loc = try_offset(d)) return *loc;
    return make_error(ErrorKind::InvalidSquare,
                      to_string() + " offset by (" + std::to_string(d.files) + ", "
                          + std::to_string(d.ranks) + ") leaves the board",
                      sq_);
}

std::string Location::to_string() const {
    return std::string{file_char(), static_cast<char>('1' + rank())};
}

std::ostream& operator<<(std::ostream& out, const Location& loc) {
    return out << loc.to_string();
}
