#pragma once

#include "Types.hpp"
#include "BitUtil.hpp"
#include "Errors.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>


struct Offset {
    int files;
    int ranks;

    bool operator==(const Offset& other) const = default;
};

// A validated board coordinate. Only ever holds a square that exists on the
// board: either built from the Square enum or checked on the way in.
class Location {
public:
    constexpr Location(Square sq) : sq_(sq) {}

    static Result<Location> parse(std::string_view text);
    static std::optional<Location> from_coords(int file, int rank);

    [[nodiscard]] constexpr Square square() const { return sq_; }
    [[nodiscard]] constexpr int index() const { return static_cast<int>(sq_); }
    [[nodiscard]] constexpr int file() const { return BitUtil::file_of(sq_); } // 0 = a
    [[nodiscard]] constexpr int rank() const { return BitUtil::rank_of(sq_); } // 0 = rank 1

    [[nodiscard]] char file_char() const { return static_cast<char>('a' + file()); }
    [[nodiscard]] int rank_number() const { return rank() + 1; }

    Offset operator-(const Location& other) const {
        return Offset{file() - other.file(), rank() - other.rank()};
    }

    Result<Location> offset(Offset d) const;
    std::optional<Location> try_offset(Offset d) const;

    std::string to_string() const;

    bool operator==(const Location& other) const = default;

private:
    Square sq_;
};

std::ostream& operator<<(std::ostream& out, const Location& loc);

namespace std {
    template <>
    struct hash<Location> {
        size_t operator()(const Location& loc) const noexcept {
            return hash<int>{}(loc.index());
        }
    };
}
