#include <gtest/gtest.h>
#include "BitUtil.hpp"
#include "Board.hpp"
#include "BoardText.hpp"
#include "Game.hpp"
#include "Location.hpp"
#include "Pieces.hpp"
#include "TempMove.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_set>

// --- TEST HELPERS ---

void expect_move(Game& game, std::string_view from, std::string_view to) {
    auto result = game.move(from, to);
    ASSERT_TRUE(result.ok()) << result.error().describe();
}

ErrorKind move_error(Game& game, std::string_view from, std::string_view to) {
    auto result = game.move(from, to);
    EXPECT_FALSE(result.ok()) << from << " -> " << to << " was accepted";
    return result.ok() ? ErrorKind::InvalidNotation : result.error().kind;
}

PieceType type_at(const Game& game, Square sq) {
    const Piece* p = game.board().at(sq);
    EXPECT_NE(p, nullptr) << "no piece on " << Location(sq);
    return p ? p->type() : PieceType::Pawn;
}

// Every live piece sits on the square it reports, and nothing else is on the board.
// Each side keeps exactly one King.
void expect_consistent(const Game& game) {
    std::size_t live = 0;
    for (Colour side : {Colour::White, Colour::Black}) {
        const auto& pieces = game.pieces(side);
        EXPECT_EQ(std::count_if(pieces.begin(), pieces.end(),
                                [](const Piece* p) { return p->type() == PieceType::King; }), 1)
            << colour_name(side) << " King count";
        for (const Piece* p : game.pieces(side)) {
            ASSERT_TRUE(p->location().has_value()) << p->name() << " is live but off the board";
            EXPECT_EQ(game.board().at(*p->location()), p);
            ++live;
        }
        for (const Piece* p : game.captured(side)) EXPECT_FALSE(p->location().has_value());
    }
    EXPECT_EQ(static_cast<std::size_t>(BitUtil::count_bits(game.board().occupancy())), live);
}

// Empty board with both kings, White to move.
void kings_only(Game& game, Square white_king = Square::E1, Square black_king = Square::E8) {
    game.clear();
    game.add_piece(PieceType::King, Colour::White, white_king);
    game.add_piece(PieceType::King, Colour::Black, black_king);
}

// --- LOCATION ---

TEST(LocationTest, ParsesValidSquares) {
    auto e4 = Location::parse("e4");
    ASSERT_TRUE(e4.ok());
    EXPECT_EQ(e4.value(), Location(Square::E4));
    EXPECT_EQ(e4->file(), 4);
    EXPECT_EQ(e4->rank(), 3);
    EXPECT_EQ(e4->to_string(), "e4");

    auto upper = Location::parse("H8");
    ASSERT_TRUE(upper.ok());
    EXPECT_EQ(upper.value(), Location(Square::H8));
}

TEST(LocationTest, RejectsMalformedSquares) {
    for (std::string_view bad : {"", "e", "e44", "i1", "a9", "a0", "22", "xx", "knight to queen's bishop"}) {
        auto parsed = Location::parse(bad);
        ASSERT_FALSE(parsed.ok()) << "'" << bad << "' parsed";
        EXPECT_EQ(parsed.error().kind, ErrorKind::InvalidSquare);
    }
}

TEST(LocationTest, OffsetArithmetic) {
    Location b1(Square::B1);
    Location c3(Square::C3);
    EXPECT_EQ(c3 - b1, (Offset{1, 2}));
    EXPECT_EQ(b1 - c3, (Offset{-1, -2}));

    auto moved = b1.offset(Offset{1, 2});
    ASSERT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), c3);

    auto off_board = b1.offset(Offset{-2, 0});
    ASSERT_FALSE(off_board.ok());
    EXPECT_EQ(off_board.error().kind, ErrorKind::InvalidSquare);
    EXPECT_FALSE(Location(Square::H8).try_offset(Offset{0, 1}).has_value());
}

TEST(LocationTest, HashesByCoordinate) {
    std::unordered_set<Location> seen;
    seen.insert(Square::A1);
    seen.insert(Location::parse("a1").value());
    seen.insert(Square::H8);
    EXPECT_EQ(seen.size(), 2u);
}

// --- BOARD ---

TEST(BoardTest, SquaresBetweenInOrderFromStart) {
    auto to_strings = [](const std::vector<Location>& path) {
        std::vector<std::string> out;
        for (const auto& loc : path) out.push_back(loc.to_string());
        return out;
    };
    using V = std::vector<std::string>;
    EXPECT_EQ(to_strings(Board::squares_between(Square::A2, Square::A5)), (V{"a3", "a4"}));
    EXPECT_EQ(to_strings(Board::squares_between(Square::A1, Square::H8)), (V{"b2", "c3", "d4", "e5", "f6", "g7"}));
    EXPECT_EQ(to_strings(Board::squares_between(Square::A1, Square::H1)), (V{"b1", "c1", "d1", "e1", "f1", "g1"}));
    EXPECT_EQ(to_strings(Board::squares_between(Square::A5, Square::A2)), (V{"a4", "a3"}));
    EXPECT_TRUE(Board::squares_between(Square::B1, Square::C3).empty());
}

TEST(BoardTest, PathClearance) {
    Game game;
    EXPECT_FALSE(game.board().is_path_clear(Square::A1, Square::A3));
    EXPECT_TRUE(game.board().is_path_clear(Square::A1, Square::A2));
    EXPECT_TRUE(game.board().is_path_clear(Square::A3, Square::H3));
    // Non-collinear squares have nothing between them
    EXPECT_TRUE(game.board().is_path_clear(Square::B1, Square::C3));
}

TEST(BoardTest, StartingPosition) {
    Game game;
    EXPECT_EQ(type_at(game, Square::A2), PieceType::Pawn);
    EXPECT_EQ(type_at(game, Square::B1), PieceType::Knight);
    EXPECT_EQ(type_at(game, Square::D8), PieceType::Queen);
    EXPECT_EQ(game.board().at(Square::E8)->colour(), Colour::Black);
    EXPECT_EQ(game.pieces(Colour::White).size(), 16u);
    EXPECT_EQ(game.pieces(Colour::Black).size(), 16u);
    EXPECT_EQ(game.active_player(), Colour::White);
    expect_consistent(game);

    auto grid = game.grid();
    ASSERT_TRUE(grid[0][4].has_value());
    EXPECT_EQ(*grid[0][4], (SquareView{PieceType::King, Colour::White}));
    EXPECT_FALSE(grid[3][3].has_value());
}

TEST(BoardTest, TextRenderingHighlightsSquares) {
    Game game;
    std::string ascii = BoardText::render(game.board(), {Location(Square::E4)}, false);
    EXPECT_NE(ascii.find("8  r  n  b  q  k  b  n  r  8"), std::string::npos) << ascii;
    EXPECT_NE(ascii.find("[.]"), std::string::npos);
    EXPECT_NE(BoardText::render(game.board()).find("♔"), std::string::npos);
}

// --- PIECE GEOMETRY ---

TEST(PieceTest, ValuesAndNames) {
    Game game;
    const Piece* pawn = game.board().at(Square::A2);
    EXPECT_EQ(pawn->value(), 1);
    EXPECT_EQ(game.board().at(Square::D1)->value(), 9);
    EXPECT_EQ(game.board().at(Square::E8)->value(), 100);
    EXPECT_EQ(pawn->name(), "White Pawn");
    EXPECT_EQ(game.board().at(Square::G8)->symbol(), 'n');
}

TEST(PieceTest, KnightIgnoresBlockers) {
    Game game;
    const Piece* knight = game.board().at(Square::B1);
    EXPECT_TRUE(knight->can_move_to(Square::C3, game));
    EXPECT_TRUE(knight->can_move_to(Square::A3, game));
    EXPECT_FALSE(knight->can_move_to(Square::B3, game));
}

TEST(PieceTest, SlidersNeedClearPath) {
    Game game;
    kings_only(game, Square::H1, Square::H8);
    Piece* bishop = game.add_piece(PieceType::Bishop, Colour::White, Square::C1);
    Piece* rook = game.add_piece(PieceType::Rook, Colour::White, Square::A4);
    Piece* queen = game.add_piece(PieceType::Queen, Colour::White, Square::D4);
    game.add_piece(PieceType::Pawn, Colour::Black, Square::E3);

    EXPECT_TRUE(bishop->can_reach(Square::H6));
    EXPECT_TRUE(bishop->can_move_to(Square::A3, game));
    EXPECT_TRUE(bishop->can_move_to(Square::D2, game));
    EXPECT_TRUE(bishop->can_move_to(Square::E3, game));   // occupied, but nothing between
    EXPECT_FALSE(bishop->can_move_to(Square::F4, game));  // e3 in the way
    EXPECT_FALSE(bishop->can_reach(Square::C2));

    EXPECT_TRUE(rook->can_move_to(Square::A8, game));
    EXPECT_TRUE(rook->can_move_to(Square::C4, game));
    EXPECT_FALSE(rook->can_move_to(Square::E4, game));    // queen on d4
    EXPECT_FALSE(rook->can_reach(Square::B5));

    EXPECT_TRUE(queen->can_move_to(Square::D8, game));
    EXPECT_TRUE(queen->can_move_to(Square::G7, game));
    EXPECT_FALSE(queen->can_move_to(Square::F2, game));   // e3
    EXPECT_FALSE(queen->can_reach(Square::E6));
}

TEST(PieceTest, PawnForwardAndCaptureRulesDiffer) {
    Game game;
    kings_only(game, Square::H1, Square::H8);
    Piece* pawn = game.add_piece(PieceType::Pawn, Colour::White, Square::E2);
    game.add_piece(PieceType::Knight, Colour::Black, Square::D3);
    game.add_piece(PieceType::Knight, Colour::Black, Square::E3);

    EXPECT_FALSE(pawn->can_move_to(Square::E3, game));  // blocked forward
    EXPECT_FALSE(pawn->can_move_to(Square::E4, game));  // double step through a piece
    EXPECT_TRUE(pawn->can_take(Square::D3, game));
    EXPECT_FALSE(pawn->can_take(Square::E3, game));     // never captures forward
    EXPECT_FALSE(pawn->can_take(Square::F3, game));     // nothing there
    EXPECT_TRUE(pawn->attacks(Square::F3, game));
}

TEST(PieceTest, KingAvoidsAttackedSquares) {
    Game game;
    kings_only(game);
    game.add_piece(PieceType::Rook, Colour::Black, Square::D8);
    const Piece* king = game.king(Colour::White);
    ASSERT_NE(king, nullptr);
    EXPECT_TRUE(king->can_reach(Square::D1));
    EXPECT_FALSE(king->can_move_to(Square::D1, game));
    EXPECT_TRUE(king->can_move_to(Square::F2, game));
    EXPECT_FALSE(king->can_reach(Square::G1));          // castling is not king geometry
}

// --- MOVES ---

TEST(GameTest, ScenarioOpeningMoves) {
    Game game;
    expect_move(game, "e2", "e4");
    expect_move(game, "e7", "e5");
    expect_move(game, "g1", "f3");

    EXPECT_EQ(type_at(game, Square::F3), PieceType::Knight);
    EXPECT_EQ(type_at(game, Square::E4), PieceType::Pawn);
    EXPECT_EQ(type_at(game, Square::E5), PieceType::Pawn);
    EXPECT_EQ(game.board().at(Square::E5)->colour(), Colour::Black);
    EXPECT_TRUE(game.board().is_empty(Square::G1));
    EXPECT_EQ(game.active_player(), Colour::Black);
    EXPECT_EQ(game.ply_count(), 3);
    EXPECT_EQ(game.turn_number(), 2);
    EXPECT_EQ(game.moves().size(), 3u);
    EXPECT_EQ(game.moves().back().piece, PieceType::Knight);
    expect_consistent(game);
}

TEST(GameTest, PieceFollowsItsMoves) {
    Game game;
    Piece* knight = game.board().at(Square::B1);
    const char* route[] = {"c3", "b5", "a3", "b1"};
    std::string from = "b1";
    for (const char* to : route) {
        game.set_active_player(Colour::White);
        expect_move(game, from, to);
        EXPECT_EQ(game.board().at(Location::parse(to).value()), knight);
        EXPECT_TRUE(game.board().is_empty(Location::parse(from).value()));
        from = to;
    }
    EXPECT_TRUE(knight->has_moved());
}

TEST(GameTest, RejectsBasicIllegalMoves) {
    Game game;
    EXPECT_EQ(move_error(game, "e4", "e5"), ErrorKind::EmptySource);
    EXPECT_EQ(move_error(game, "e7", "e5"), ErrorKind::WrongTurnOwner);
    EXPECT_EQ(move_error(game, "a1", "a3"), ErrorKind::BlockedPath);
    EXPECT_EQ(move_error(game, "a1", "a2"), ErrorKind::IllegalCapture);
    EXPECT_EQ(move_error(game, "b1", "b3"), ErrorKind::IllegalGeometry);
    EXPECT_EQ(move_error(game, "e2", "e5"), ErrorKind::IllegalGeometry);
    EXPECT_EQ(move_error(game, "e2", "d3"), ErrorKind::IllegalGeometry);
    EXPECT_EQ(move_error(game, "e2", "e2"), ErrorKind::IllegalGeometry);
    EXPECT_EQ(move_error(game, "a2", "a9"), ErrorKind::InvalidSquare);
    EXPECT_EQ(move_error(game, "b2", "xx"), ErrorKind::InvalidSquare);

    // Nothing changed
    EXPECT_EQ(game.to_fen(), START_FEN);
    EXPECT_TRUE(game.moves().empty());
}

TEST(GameTest, ErrorCarriesSquaresAndPosition) {
    Game game;
    auto result = game.move("a1", "a3");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().from, Square::A1);
    EXPECT_EQ(result.error().to, Square::A3);
    EXPECT_EQ(result.error().fen, START_FEN);
    EXPECT_NE(result.error().describe().find("BlockedPath"), std::string::npos);
}

TEST(GameTest, PawnsCannotMoveBackwards) {
    Game game;
    expect_move(game, "b2", "b4");
    expect_move(game, "h7", "h6");
    EXPECT_EQ(move_error(game, "b4", "b3"), ErrorKind::IllegalGeometry);
    EXPECT_EQ(move_error(game, "b4", "b6"), ErrorKind::IllegalGeometry);  // double step only from the start
    expect_move(game, "b4", "b5");
}

TEST(GameTest, CapturesMoveToCapturedList) {
    Game game;
    game.add_piece(PieceType::Pawn, Colour::Black, Square::B3);
    Piece* white_pawn = game.board().at(Square::A2);

    auto result = game.move("a2", "b3");
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result->captured, PieceType::Pawn);
    EXPECT_TRUE(result->move.is_capture());
    EXPECT_EQ(white_pawn->location(), Location(Square::B3));
    ASSERT_EQ(game.captured(Colour::Black).size(), 1u);
    EXPECT_EQ(game.captured(Colour::Black)[0]->colour(), Colour::Black);
    EXPECT_EQ(game.pieces(Colour::Black).size(), 16u);
    expect_consistent(game);
}

TEST(GameTest, HalfmoveClockAndTurnNumber) {
    Game game;
    expect_move(game, "g1", "f3");
    EXPECT_EQ(game.halfmove_clock(), 1);
    EXPECT_EQ(game.turn_number(), 1);
    expect_move(game, "g8", "f6");
    EXPECT_EQ(game.halfmove_clock(), 2);
    EXPECT_EQ(game.turn_number(), 2);
    expect_move(game, "e2", "e4");
    EXPECT_EQ(game.halfmove_clock(), 0);
    expect_move(game, "f6", "e4");
    EXPECT_EQ(game.halfmove_clock(), 0);
    EXPECT_EQ(game.ply_count(), 4);
}

// --- EN PASSANT ---

TEST(EnPassantTest, CapturesThePassedPawn) {
    Game game;
    kings_only(game);
    game.add_piece(PieceType::Pawn, Colour::White, Square::E5);
    game.add_piece(PieceType::Pawn, Colour::Black, Square::D7);
    game.set_active_player(Colour::Black);

    expect_move(game, "d7", "d5");
    EXPECT_EQ(game.en_passant_target(), Location(Square::D6));

    auto result = game.move("e5", "d6");
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result->move.flags(), MoveFlag::EnPassant);
    EXPECT_EQ(result->captured, PieceType::Pawn);
    EXPECT_TRUE(game.board().is_empty(Square::D5));
    EXPECT_EQ(type_at(game, Square::D6), PieceType::Pawn);
    EXPECT_EQ(game.board().at(Square::D6)->colour(), Colour::White);
    ASSERT_EQ(game.captured(Colour::Black).size(), 1u);
    EXPECT_EQ(game.captured(Colour::Black).back()->type(), PieceType::Pawn);
    EXPECT_FALSE(game.en_passant_target().has_value());
    expect_consistent(game);
}

TEST(EnPassantTest, ExpiresAfterOneMove) {
    Game game;
    kings_only(game);
    game.add_piece(PieceType::Pawn, Colour::White, Square::E5);
    game.add_piece(PieceType::Pawn, Colour::White, Square::H2);
    game.add_piece(PieceType::Pawn, Colour::Black, Square::D7);
    game.set_active_player(Colour::Black);

    expect_move(game, "d7", "d5");
    expect_move(game, "h2", "h3");
    EXPECT_FALSE(game.en_passant_target().has_value());
    expect_move(game, "e8", "f7");
    EXPECT_EQ(move_error(game, "e5", "d6"), ErrorKind::IllegalGeometry);
    EXPECT_EQ(type_at(game, Square::D5), PieceType::Pawn);
}

TEST(EnPassantTest, OnlyTheAdjacentPawnMayTake) {
    Game game;
    kings_only(game);
    game.add_piece(PieceType::Pawn, Colour::White, Square::E5);
    game.add_piece(PieceType::Knight, Colour::White, Square::B5);
    game.add_piece(PieceType::Pawn, Colour::Black, Square::D7);
    game.set_active_player(Colour::Black);

    expect_move(game, "d7", "d5");
    // A knight landing on the target square is a plain move, not a capture
    auto knight = game.move("b5", "d6");
    ASSERT_TRUE(knight.ok()) << knight.error().describe();
    EXPECT_FALSE(knight->captured.has_value());
    EXPECT_EQ(type_at(game, Square::D5), PieceType::Pawn);
}

// --- CASTLING ---

TEST(CastlingTest, KingsideBothColours) {
    Game game;
    for (auto sq : {Square::F1, Square::G1, Square::F8, Square::G8}) ASSERT_TRUE(game.remove_piece(sq));

    auto white = game.castle(CastleSide::King);
    ASSERT_TRUE(white.ok()) << white.error().describe();
    EXPECT_EQ(type_at(game, Square::G1), PieceType::King);
    EXPECT_EQ(type_at(game, Square::F1), PieceType::Rook);
    EXPECT_TRUE(white->move.is_castle());
    EXPECT_EQ(white->notation, "O-O");

    auto black = game.move("O-O", "");
    ASSERT_TRUE(black.ok()) << black.error().describe();
    EXPECT_EQ(type_at(game, Square::G8), PieceType::King);
    EXPECT_EQ(type_at(game, Square::F8), PieceType::Rook);
    EXPECT_EQ(game.castling_rights(), "-");
    expect_consistent(game);
}

TEST(CastlingTest, QueensideBothColours) {
    Game game;
    for (auto sq : {Square::B1, Square::C1, Square::D1, Square::B8, Square::C8, Square::D8}) {
        ASSERT_TRUE(game.remove_piece(sq));
    }
    ASSERT_TRUE(game.castle(CastleSide::Queen).ok());
    EXPECT_EQ(type_at(game, Square::C1), PieceType::King);
    EXPECT_EQ(type_at(game, Square::D1), PieceType::Rook);

    // The king's two-square step is the same request
    auto black = game.move("e8", "c8");
    ASSERT_TRUE(black.ok()) << black.error().describe();
    EXPECT_EQ(black->move.flags(), MoveFlag::QueenCastle);
    EXPECT_EQ(type_at(game, Square::D8), PieceType::Rook);
    expect_consistent(game);
}

TEST(CastlingTest, BlockedPathFails) {
    Game game;
    ASSERT_TRUE(game.remove_piece(Square::G1));
    auto result = game.castle(CastleSide::King);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::IllegalCastle);

    ASSERT_TRUE(game.remove_piece(Square::D1));
    ASSERT_TRUE(game.remove_piece(Square::B1));
    EXPECT_EQ(game.castle(CastleSide::Queen).error().kind, ErrorKind::IllegalCastle);  // c1 bishop
}

TEST(CastlingTest, AttackedTransitSquareFails) {
    Game game;
    kings_only(game);
    game.add_piece(PieceType::Rook, Colour::White, Square::H1);
    game.add_piece(PieceType::Rook, Colour::Black, Square::F8);

    EXPECT_FALSE(game.can_castle(Colour::White, CastleSide::King));
    auto result = game.castle(CastleSide::King);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::IllegalCastle);
    EXPECT_EQ(type_at(game, Square::E1), PieceType::King);
}

TEST(CastlingTest, UnattackedPathSucceeds) {
    Game game;
    kings_only(game);
    game.add_piece(PieceType::Rook, Colour::White, Square::H1);
    game.add_piece(PieceType::Rook, Colour::Black, Square::A8);  // covers nothing on rank 1

    auto result = game.castle(CastleSide::King);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(type_at(game, Square::G1), PieceType::King);
    EXPECT_EQ(type_at(game, Square::F1), PieceType::Rook);
}

TEST(CastlingTest, KingInCheckCannotCastle) {
    Game game;
    game.clear();
    game.add_piece(PieceType::Rook, Colour::Black, Square::A8);
    game.add_piece(PieceType::King, Colour::Black, Square::E8);
    game.add_piece(PieceType::Rook, Colour::Black, Square::H8);
    game.add_piece(PieceType::Queen, Colour::White, Square::B5);
    game.add_piece(PieceType::King, Colour::White, Square::E1);
    game.set_active_player(Colour::Black);

    EXPECT_EQ(game.castle(CastleSide::Queen).error().kind, ErrorKind::IllegalCastle);
    EXPECT_EQ(game.castle(CastleSide::King).error().kind, ErrorKind::IllegalCastle);
}

TEST(CastlingTest, OnlyTheCoveredSideIsRefused) {
    Game game;
    game.clear();
    game.add_piece(PieceType::Rook, Colour::Black, Square::A8);
    game.add_piece(PieceType::King, Colour::Black, Square::E8);
    game.add_piece(PieceType::Rook, Colour::Black, Square::H8);
    game.add_piece(PieceType::Queen, Colour::White, Square::F4);
    game.add_piece(PieceType::King, Colour::White, Square::E1);
    game.set_active_player(Colour::Black);

    EXPECT_EQ(game.castle(CastleSide::King).error().kind, ErrorKind::IllegalCastle);
    auto queenside = game.castle(CastleSide::Queen);
    ASSERT_TRUE(queenside.ok()) << queenside.error().describe();
    EXPECT_EQ(type_at(game, Square::C8), PieceType::King);
}

TEST(CastlingTest, MovedRookLosesTheRight) {
    Game game;
    kings_only(game);
    game.add_piece(PieceType::Rook, Colour::White, Square::H1);
    expect_move(game, "h1", "h2");
    expect_move(game, "e8", "d8");
    expect_move(game, "h2", "h1");
    expect_move(game, "d8", "e8");

    EXPECT_FALSE(game.can_castle(Colour::White, CastleSide::King));
    EXPECT_EQ(game.castle(CastleSide::King).error().kind, ErrorKind::IllegalCastle);
}

// --- PROMOTION ---

TEST(PromotionTest, DefaultsToQueen) {
    Game game;
    kings_only(game, Square::E1, Square::H8);
    Piece* pawn = game.add_piece(PieceType::Pawn, Colour::White, Square::A7);

    auto result = game.move("a7", "a8");
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_TRUE(result->move.is_promotion());
    EXPECT_EQ(result->move.promotion_piece(), PieceType::Queen);
    EXPECT_EQ(type_at(game, Square::A8), PieceType::Queen);
    EXPECT_EQ(game.board().at(Square::A8)->colour(), Colour::White);
    EXPECT_FALSE(pawn->location().has_value());
    // Retired, not captured
    EXPECT_TRUE(game.captured(Colour::White).empty());
    EXPECT_EQ(game.pieces(Colour::White).size(), 2u);
    expect_consistent(game);
}

TEST(PromotionTest, ChosenPieceWithCapture) {
    Game game;
    kings_only(game, Square::E1, Square::H8);
    game.add_piece(PieceType::Pawn, Colour::White, Square::B7);
    game.add_piece(PieceType::Rook, Colour::Black, Square::A8);

    auto result = game.move(Square::B7, Square::A8, PieceType::Knight);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result->move.flags(), MoveFlag::KnightPromoCapture);
    EXPECT_EQ(result->captured, PieceType::Rook);
    EXPECT_EQ(type_at(game, Square::A8), PieceType::Knight);
    expect_consistent(game);
}

TEST(PromotionTest, RejectsBadRequests) {
    Game game;
    auto early = game.move(Square::E2, Square::E4, PieceType::Queen);
    ASSERT_FALSE(early.ok());
    EXPECT_EQ(early.error().kind, ErrorKind::PromotionError);

    auto knight = game.move(Square::G1, Square::F3, PieceType::Queen);
    ASSERT_FALSE(knight.ok());
    EXPECT_EQ(knight.error().kind, ErrorKind::PromotionError);

    kings_only(game, Square::E1, Square::H8);
    game.add_piece(PieceType::Pawn, Colour::White, Square::A7);
    auto king = game.move(Square::A7, Square::A8, PieceType::King);
    ASSERT_FALSE(king.ok());
    EXPECT_EQ(king.error().kind, ErrorKind::PromotionError);
    EXPECT_EQ(type_at(game, Square::A7), PieceType::Pawn);
}

// --- CHECK AND SELF-CHECK ---

TEST(CheckTest, PinnedPieceCannotExposeKing) {
    Game game;
    kings_only(game, Square::E1, Square::A8);
    game.add_piece(PieceType::Bishop, Colour::White, Square::E2);
    game.add_piece(PieceType::Rook, Colour::Black, Square::E8);
    const std::string before = game.to_fen();

    auto result = game.move("e2", "d3");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::SelfCheck);
    EXPECT_EQ(game.to_fen(), before);
    EXPECT_EQ(game.active_player(), Colour::White);
    expect_consistent(game);
}

TEST(CheckTest, KingCannotStepIntoAttack) {
    Game game;
    kings_only(game, Square::E1, Square::H8);
    game.add_piece(PieceType::Rook, Colour::Black, Square::D8);
    EXPECT_EQ(move_error(game, "e1", "d1"), ErrorKind::SelfCheck);
}

TEST(CheckTest, KingCannotRetreatAlongTheCheckingLine) {
    Game game;
    kings_only(game, Square::E1, Square::H8);
    game.add_piece(PieceType::Rook, Colour::Black, Square::A1);
    ASSERT_TRUE(game.is_in_check(Colour::White));

    EXPECT_EQ(move_error(game, "e1", "f1"), ErrorKind::SelfCheck);
    EXPECT_EQ(type_at(game, Square::E1), PieceType::King);
    expect_move(game, "e1", "e2");
}

TEST(CheckTest, KingCaptureNeedsUndefendedTarget) {
    Game game;
    kings_only(game, Square::E1, Square::H8);
    game.add_piece(PieceType::Pawn, Colour::Black, Square::E2);
    game.add_piece(PieceType::Pawn, Colour::Black, Square::D3);  // defends e2
    EXPECT_EQ(move_error(game, "e1", "e2"), ErrorKind::SelfCheck);

    ASSERT_TRUE(game.remove_piece(Square::D3));
    auto result = game.move("e1", "e2");
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result->captured, PieceType::Pawn);
}

TEST(CheckTest, RecordReportsCheck) {
    Game game;
    expect_move(game, "e2", "e4");
    expect_move(game, "e7", "e5");
    expect_move(game, "f1", "c4");
    expect_move(game, "b8", "c6");
    auto result = game.move("c4", "f7");
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_TRUE(result->check);
    EXPECT_FALSE(result->checkmate);
    EXPECT_TRUE(game.is_in_check(Colour::Black));
}

// --- CHECKMATE ---

TEST(CheckmateTest, QueenAndKingCornerTheKing) {
    Game game;
    game.clear();
    game.add_piece(PieceType::King, Colour::Black, Square::A8);
    game.add_piece(PieceType::Queen, Colour::White, Square::B6);
    game.add_piece(PieceType::King, Colour::White, Square::C6);
    game.set_active_player(Colour::White);

    EXPECT_TRUE(game.check_for_checkmate());
    EXPECT_TRUE(game.is_checkmate(Colour::Black));
}

TEST(CheckmateTest, FoolsMateIsReported) {
    Game game;
    expect_move(game, "f2", "f3");
    expect_move(game, "e7", "e5");
    expect_move(game, "g2", "g4");
    auto result = game.move("d8", "h4");
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_TRUE(result->check);
    EXPECT_TRUE(result->checkmate);

    // Reporting never freezes the game
    EXPECT_EQ(game.active_player(), Colour::White);
    EXPECT_EQ(move_error(game, "e1", "f2"), ErrorKind::SelfCheck);
}

// Only the king's own escape squares are examined. A defender able to capture
// the checking piece does not stop the detector from firing.
TEST(CheckmateTest, IgnoresDefendersThatCouldCapture) {
    Game game;
    game.clear();
    game.add_piece(PieceType::King, Colour::Black, Square::H8);
    game.add_piece(PieceType::Pawn, Colour::Black, Square::G7);
    game.add_piece(PieceType::Pawn, Colour::Black, Square::H7);
    game.add_piece(PieceType::Rook, Colour::Black, Square::E1);
    game.add_piece(PieceType::King, Colour::White, Square::A2);
    game.add_piece(PieceType::Rook, Colour::White, Square::E8);
    game.set_active_player(Colour::Black);

    ASSERT_TRUE(game.is_in_check(Colour::Black));
    EXPECT_TRUE(game.is_checkmate(Colour::Black));
    expect_move(game, "e1", "e8");
    EXPECT_FALSE(game.is_in_check(Colour::Black));
}

// The King's own square does not shield the square behind it on the checking line.
TEST(CheckmateTest, BackRankMateAlongTheKingsLine) {
    Game game;
    game.clear();
    game.add_piece(PieceType::King, Colour::Black, Square::D8);
    game.add_piece(PieceType::King, Colour::White, Square::H1);
    game.add_piece(PieceType::Rook, Colour::White, Square::B7);
    game.add_piece(PieceType::Rook, Colour::White, Square::A1);

    auto result = game.move("a1", "a8");
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_TRUE(result->check);
    EXPECT_TRUE(result->checkmate);

    const Piece* king = game.king(Colour::Black);
    EXPECT_FALSE(king->can_move_to(Square::E8, game));
    EXPECT_FALSE(king->can_move_to(Square::C8, game));
    EXPECT_EQ(move_error(game, "d8", "e8"), ErrorKind::SelfCheck);
    expect_consistent(game);
}

TEST(CheckmateTest, KingCannotCaptureBehindItself) {
    Game game;
    kings_only(game, Square::E2, Square::A8);
    game.add_piece(PieceType::Rook, Colour::Black, Square::E5);
    game.add_piece(PieceType::Knight, Colour::Black, Square::E1);
    game.add_piece(PieceType::Knight, Colour::Black, Square::D1);
    ASSERT_TRUE(game.is_in_check(Colour::White));

    // e1 sits on the rook's file behind the King, d1 does not
    const Piece* king = game.king(Colour::White);
    EXPECT_FALSE(king->can_take(Square::E1, game));
    EXPECT_TRUE(king->can_take(Square::D1, game));
    EXPECT_FALSE(game.is_checkmate(Colour::White));
}

TEST(CheckmateTest, KinglessPositionsReportNothing) {
    Game game;
    game.clear();
    game.add_piece(PieceType::Rook, Colour::White, Square::A1);
    EXPECT_FALSE(game.is_in_check(Colour::Black));
    EXPECT_FALSE(game.is_checkmate(Colour::Black));
    EXPECT_EQ(game.king(Colour::Black), nullptr);
}

// --- LEGAL DESTINATIONS ---

TEST(GameTest, LegalDestinations) {
    Game game;
    EXPECT_EQ(game.legal_destinations(Square::B1),
              (std::vector<Location>{Square::A3, Square::C3}));
    EXPECT_EQ(game.legal_destinations(Square::E2),
              (std::vector<Location>{Square::E3, Square::E4}));
    EXPECT_TRUE(game.legal_destinations(Square::E7).empty());
    EXPECT_TRUE(game.legal_destinations(Square::A1).empty());
    EXPECT_EQ(game.to_fen(), START_FEN);
    EXPECT_TRUE(game.moves().empty());

    for (auto sq : {Square::F1, Square::G1}) ASSERT_TRUE(game.remove_piece(sq));
    auto king = game.legal_destinations(Square::E1);
    EXPECT_NE(std::find(king.begin(), king.end(), Location(Square::G1)), king.end());
}

// --- ROLLBACK ---

TEST(RollbackTest, RestoresEverything) {
    Game game;
    expect_move(game, "e2", "e4");
    const std::string before = game.to_fen();
    const auto live_white = game.pieces(Colour::White);
    {
        TempMove scope(game);
        EXPECT_TRUE(game.speculating());
        expect_move(game, "d7", "d5");
        expect_move(game, "e4", "d5");
        EXPECT_EQ(game.captured(Colour::Black).size(), 1u);
    }
    EXPECT_FALSE(game.speculating());
    EXPECT_EQ(game.to_fen(), before);
    EXPECT_EQ(game.pieces(Colour::White), live_white);
    EXPECT_TRUE(game.captured(Colour::Black).empty());
    EXPECT_EQ(game.moves().size(), 1u);
    EXPECT_EQ(game.active_player(), Colour::Black);
    EXPECT_FALSE(game.board().at(Square::D7)->has_moved());
    expect_consistent(game);
}

TEST(RollbackTest, NestedScopesUnwindInOrder) {
    Game game;
    {
        TempMove outer(game);
        expect_move(game, "e2", "e4");
        const std::string after_outer = game.to_fen();
        {
            TempMove inner(game);
            expect_move(game, "e7", "e5");
            expect_move(game, "g1", "f3");
        }
        EXPECT_EQ(game.to_fen(), after_outer);
        EXPECT_EQ(game.moves().size(), 1u);
    }
    EXPECT_EQ(game.to_fen(), START_FEN);
    EXPECT_TRUE(game.moves().empty());
    expect_consistent(game);
}

TEST(RollbackTest, UndoesPromotion) {
    Game game;
    kings_only(game, Square::E1, Square::H8);
    Piece* pawn = game.add_piece(PieceType::Pawn, Colour::White, Square::B7);
    const std::string before = game.to_fen();
    {
        TempMove scope(game);
        expect_move(game, "b7", "b8");
        EXPECT_EQ(type_at(game, Square::B8), PieceType::Queen);
    }
    EXPECT_EQ(game.to_fen(), before);
    EXPECT_EQ(game.board().at(Square::B7), pawn);
    EXPECT_EQ(pawn->location(), Location(Square::B7));
    EXPECT_TRUE(game.board().is_empty(Square::B8));
    expect_consistent(game);
}

TEST(RollbackTest, RestoresEnPassantTarget) {
    Game game;
    expect_move(game, "e2", "e4");
    ASSERT_EQ(game.en_passant_target(), Location(Square::E3));
    {
        TempMove scope(game);
        expect_move(game, "g8", "f6");
        EXPECT_FALSE(game.en_passant_target().has_value());
    }
    EXPECT_EQ(game.en_passant_target(), Location(Square::E3));
}

// --- FEN ---

TEST(FenTest, ExportsStartAndAfterMoves) {
    Game game;
    EXPECT_EQ(game.to_fen(), START_FEN);
    expect_move(game, "e2", "e4");
    // The en passant field is never exported
    EXPECT_EQ(game.to_fen(), "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1");
    expect_move(game, "g8", "f6");
    EXPECT_EQ(game.to_fen(), "rnbqkb1r/pppppppp/5n2/8/4P3/8/PPPP1PPP/RNBQKBNR w KQkq - 1 2");
}

TEST(FenTest, LoadsPosition) {
    Game game;
    Status loaded = game.load_fen("r3k2r/8/8/3pP3/8/8/8/R3K2R w Kq d6 4 20");
    ASSERT_TRUE(loaded.ok()) << loaded.error().describe();

    EXPECT_EQ(game.active_player(), Colour::White);
    EXPECT_EQ(game.castling_rights(), "Kq");
    EXPECT_EQ(game.halfmove_clock(), 4);
    EXPECT_EQ(game.turn_number(), 20);
    EXPECT_EQ(game.en_passant_target(), Location(Square::D6));
    EXPECT_TRUE(game.can_castle(Colour::White, CastleSide::King));
    EXPECT_FALSE(game.can_castle(Colour::White, CastleSide::Queen));
    EXPECT_EQ(game.to_fen(), "r3k2r/8/8/3pP3/8/8/8/R3K2R w Kq - 4 20");

    auto ep = game.move("e5", "d6");
    ASSERT_TRUE(ep.ok()) << ep.error().describe();
    EXPECT_EQ(ep->move.flags(), MoveFlag::EnPassant);
    expect_consistent(game);
}

TEST(FenTest, RejectsMalformedInput) {
    Game game;
    expect_move(game, "e2", "e4");
    const std::string before = game.to_fen();

    for (std::string_view bad : {
             "",
             "8/8/8/8/8/8/8/8 w - - 0 1",                          // no kings
             "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1",    // seven ranks
             "rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w - - 0 1",
             "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1",
             "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQxq - 0 1",
             "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq z9 0 1",
             "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - x 1"}) {
        Status loaded = game.load_fen(bad);
        ASSERT_FALSE(loaded.ok()) << "accepted '" << bad << "'";
        EXPECT_EQ(loaded.error().kind, ErrorKind::InvalidFen);
    }
    EXPECT_EQ(game.to_fen(), before);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
