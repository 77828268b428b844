#pragma once

#include "Types.hpp"
#include "BitUtil.hpp"

#include <array>


// Constant geometry tables. Occupancy never enters these; the Board applies
// it through the between masks.
namespace Attacks {

namespace detail {
    static constexpr Bitboard FILE_A{0x0101010101010101ULL};
    static constexpr Bitboard FILE_B{FILE_A << 1};
    static constexpr Bitboard FILE_G{FILE_A << 6};
    static constexpr Bitboard FILE_H{FILE_A << 7};

    static constexpr Bitboard NOT_A{~FILE_A};
    static constexpr Bitboard NOT_AB{~(FILE_A | FILE_B)};
    static constexpr Bitboard NOT_H{~FILE_H};
    static constexpr Bitboard NOT_GH{~(FILE_G | FILE_H)};

    constexpr Bitboard gen_knight_mask(int sq) {
        Bitboard b{1ULL << sq};
        Bitboard knight{0};
        knight |= (b << 17) & NOT_A;  knight |= (b << 15) & NOT_H;
        knight |= (b >> 15) & NOT_A;  knight |= (b >> 17) & NOT_H;
        knight |= (b << 10) & NOT_AB; knight |= (b << 6)  & NOT_GH;
        knight |= (b >> 6)  & NOT_AB; knight |= (b >> 10) & NOT_GH;
        return knight;
    }

    constexpr Bitboard gen_king_mask(int sq) {
        Bitboard b{1ULL << sq};
        Bitboard king{0};
        king |= (b << 8) | (b >> 8);
        king |= ((b << 1) | (b << 9) | (b >> 7)) & NOT_A;
        king |= ((b >> 1) | (b >> 9) | (b << 7)) & NOT_H;
        return king;
    }

    // Squares strictly between a and b when they share a rank, file or
    // diagonal; empty otherwise.
    constexpr Bitboard gen_between_mask(int a, int b) {
        int af = a & 7, ar = a >> 3;
        int bf = b & 7, br = b >> 3;
        int df = bf - af, dr = br - ar;
        int adf = df < 0 ? -df : df;
        int adr = dr < 0 ? -dr : dr;
        if (a == b) return 0;
        if (df != 0 && dr != 0 && adf != adr) return 0;

        int sf = (df > 0) - (df < 0);
        int sr = (dr > 0) - (dr < 0);
        Bitboard mask{0};
        for (int f = af + sf, r = ar + sr; f != bf || r != br; f += sf, r += sr) {
            mask |= 1ULL << (r * 8 + f);
        }
        return mask;
    }

    constexpr std::array<Bitboard, 64> init_knights() {
        std::array<Bitboard, 64> arr{};
        for (int i = 0; i < 64; ++i) arr[i] = gen_knight_mask(i);
        return arr;
    }

    constexpr std::array<Bitboard, 64> init_kings() {
        std::array<Bitboard, 64> arr{};
        for (int i = 0; i < 64; ++i) arr[i] = gen_king_mask(i);
        return arr;
    }

    constexpr std::array<std::array<Bitboard, 64>, 2> init_pawns() {
        std::array<std::array<Bitboard, 64>, 2> arr{};
        for (int i = 0; i < 64; ++i) {
            Bitboard b{1ULL << i};
            arr[0][i] = ((b << 7) & NOT_H) | ((b << 9) & NOT_A); // White
            arr[1][i] = ((b >> 7) & NOT_A) | ((b >> 9) & NOT_H); // Black
        }
        return arr;
    }

    constexpr std::array<std::array<Bitboard, 64>, 64> init_between() {
        std::array<std::array<Bitboard, 64>, 64> arr{};
        for (int a = 0; a < 64; ++a)
            for (int b = 0; b < 64; ++b) arr[a][b] = gen_between_mask(a, b);
        return arr;
    }
} // namespace detail


inline constexpr std::array<Bitboard, 64> KnightAttacks = detail::init_knights();
inline constexpr std::array<Bitboard, 64> KingAttacks = detail::init_kings();
inline constexpr std::array<std::array<Bitboard, 64>, 2> PawnAttacks = detail::init_pawns();
inline constexpr std::array<std::array<Bitboard, 64>, 64> Between = detail::init_between();

inline Bitboard between(Square a, Square b) {
    return Between[static_cast<int>(a)][static_cast<int>(b)];
}

inline Bitboard pawn_attacks(Colour side, Square sq) {
    return PawnAttacks[static_cast<int>(side)][static_cast<int>(sq)];
}

}
