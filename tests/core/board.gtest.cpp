#include "core/board.hpp"

#include <gtest/gtest.h>

namespace checkers::gtest {

// Every piece is found on the cell it claims and every occupied cell holds a piece that claims it.
static void expectConsistent(const Board& board) {
	std::size_t occupiedCells = 0;
	for (int row = 0; row < BOARD_SIZE; ++row) {
		for (int col = 0; col < BOARD_SIZE; ++col) {
			const auto* piece = board.pieceAt({row, col});
			if (piece) {
				++occupiedCells;
				EXPECT_EQ(piece->position(), (Coord{row, col}));
			}
		}
	}

	for (const auto side: {Side::Local, Side::Remote}) {
		for (const auto& piece: board.pieces(side)) {
			EXPECT_EQ(piece->owner(), side);
			EXPECT_EQ(board.pieceAt(piece->position()), piece.get());
		}
	}
	EXPECT_EQ(occupiedCells, board.pieceCount(Side::Local) + board.pieceCount(Side::Remote));
}

TEST(Board, InitialLayout) {
	const auto board = Board::initial();

	EXPECT_EQ(board.pieceCount(Side::Local), 12u);
	EXPECT_EQ(board.pieceCount(Side::Remote), 12u);
	expectConsistent(board);

	for (int row = 0; row < BOARD_SIZE; ++row) {
		for (int col = 0; col < BOARD_SIZE; ++col) {
			const auto* piece = board.pieceAt({row, col});
			if ((row + col) % 2 == 0 || (row > 2 && row < 5)) {
				EXPECT_EQ(piece, nullptr);
				continue;
			}

			ASSERT_NE(piece, nullptr);
			EXPECT_EQ(piece->owner(), row < 3 ? Side::Remote : Side::Local);
			EXPECT_FALSE(piece->isKing());
		}
	}
}

TEST(Board, OccupiedByOpponent) {
	Board board;
	board.place(Side::Local, {4, 3});
	board.place(Side::Remote, {3, 2});

	EXPECT_TRUE(board.occupied({4, 3}));
	EXPECT_FALSE(board.occupied({4, 5}));

	EXPECT_TRUE(board.occupiedByOpponent({3, 2}, Side::Local));
	EXPECT_FALSE(board.occupiedByOpponent({3, 2}, Side::Remote));
	EXPECT_FALSE(board.occupiedByOpponent({4, 5}, Side::Local));
}

TEST(Board, PlaceMoveRemoveKeepGridInSync) {
	Board board;
	board.place(Side::Local, {5, 0});
	board.place(Side::Remote, {2, 1}, true);
	expectConsistent(board);

	board.move({5, 0}, {4, 1});
	EXPECT_FALSE(board.occupied({5, 0}));
	ASSERT_NE(board.pieceAt({4, 1}), nullptr);
	EXPECT_EQ(board.pieceAt({4, 1})->position(), (Coord{4, 1}));
	expectConsistent(board);

	board.remove({2, 1});
	EXPECT_EQ(board.pieceCount(Side::Remote), 0u);
	EXPECT_FALSE(board.occupied({2, 1}));
	expectConsistent(board);

	board.crown({4, 1});
	EXPECT_TRUE(board.pieceAt({4, 1})->isKing());
}

TEST(Board, CopyIsDeep) {
	auto original = Board::initial();
	auto copy     = original;
	EXPECT_EQ(copy, original);

	copy.move({5, 0}, {4, 1});
	EXPECT_FALSE(copy == original);
	EXPECT_TRUE(original.occupied({5, 0}));
	expectConsistent(original);
	expectConsistent(copy);
}

TEST(Board, MoveLeavesSourceEmpty) {
	auto original = Board::initial();
	Board moved   = std::move(original);

	EXPECT_EQ(moved.pieceCount(Side::Local), 12u);
	expectConsistent(moved);
	expectConsistent(original);
}

TEST(Board, EqualityIgnoresPieceIdentity) {
	Board a;
	Board b;
	a.place(Side::Local, {5, 2});
	b.place(Side::Local, {5, 2});
	EXPECT_EQ(a, b);

	b.crown({5, 2});
	EXPECT_FALSE(a == b);
}

#if GTEST_HAS_DEATH_TEST && !defined(NDEBUG)
TEST(Board, OutOfRangeAccessFailsFast) {
	const Board board;
	EXPECT_DEATH(board.occupied({8, 0}), "");
	EXPECT_DEATH(board.pieceAt({0, -1}), "");
}
#endif

} // namespace checkers::gtest
