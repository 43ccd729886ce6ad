#include "core/game.hpp"
#include "core/moveChecker.hpp"

#include <gtest/gtest.h>

namespace checkers::gtest {

TEST(Game, InitialTurnStatePerRole) {
	const Game host(true);
	EXPECT_EQ(host.phase(), TurnPhase::AwaitingFirstSelection);
	EXPECT_TRUE(host.isLocalTurn());
	EXPECT_EQ(host.board(), Board::initial());

	Game client(false);
	EXPECT_EQ(client.phase(), TurnPhase::OpponentTurn);
	EXPECT_FALSE(client.isLocalTurn());

	// No local input while the opponent moves.
	const auto result = client.select({5, 2});
	EXPECT_FALSE(result.changed);
	EXPECT_EQ(client.phase(), TurnPhase::OpponentTurn);
}

TEST(Game, SelectThenMove) {
	Game game(true);

	auto result = game.select({5, 2});
	EXPECT_TRUE(result.changed);
	EXPECT_FALSE(result.completedTurn);
	EXPECT_EQ(game.phase(), TurnPhase::AwaitingDestination);
	ASSERT_TRUE(game.selected());
	EXPECT_EQ(*game.selected(), (Coord{5, 2}));
	EXPECT_EQ(game.destinations().size(), 2u);

	result = game.select({4, 3});
	EXPECT_TRUE(result.changed);
	ASSERT_TRUE(result.completedTurn);
	ASSERT_EQ(result.completedTurn->size(), 1u);
	EXPECT_EQ(result.completedTurn->front(), (MoveSegment{{5, 2}, {4, 3}}));

	EXPECT_EQ(game.phase(), TurnPhase::OpponentTurn);
	EXPECT_FALSE(game.selected());
	EXPECT_TRUE(game.board().occupied({4, 3}));
	EXPECT_FALSE(game.board().occupied({5, 2}));
}

TEST(Game, SelectionsThatDoNothing) {
	Game game(true);

	EXPECT_FALSE(game.select({6, 1}).changed); // Boxed in.
	EXPECT_FALSE(game.select({2, 1}).changed); // Opponent piece.
	EXPECT_FALSE(game.select({4, 4}).changed); // Empty cell.
	EXPECT_FALSE(game.select({9, 0}).changed); // Off the board.
	EXPECT_EQ(game.phase(), TurnPhase::AwaitingFirstSelection);
}

TEST(Game, IllegalDestinationDeselects) {
	Game game(true);
	const auto before = game.board();

	game.select({5, 2});
	const auto result = game.select({3, 3});
	EXPECT_TRUE(result.changed);
	EXPECT_FALSE(result.completedTurn);
	EXPECT_EQ(game.phase(), TurnPhase::AwaitingFirstSelection);
	EXPECT_TRUE(game.destinations().empty());
	EXPECT_EQ(game.board(), before);
}

TEST(Game, MandatoryCaptureBlocksSimpleMoves) {
	auto board = Board::initial();
	board.place(Side::Remote, {4, 5});
	Game game(board, true);

	ASSERT_EQ(game.phase(), TurnPhase::ForcedCaptureAvailable);
	const auto forced = game.forcedPieces();
	ASSERT_EQ(forced.size(), 2u);

	// Piece without a capture cannot be picked.
	EXPECT_FALSE(game.select({5, 2}).changed);
	EXPECT_EQ(game.phase(), TurnPhase::ForcedCaptureAvailable);

	// Capturing piece only offers its landing, not its simple move.
	EXPECT_TRUE(game.select({5, 4}).changed);
	EXPECT_EQ(game.phase(), TurnPhase::AwaitingDestination);
	ASSERT_EQ(game.destinations().size(), 1u);
	EXPECT_EQ(game.destinations().front(), (Coord{3, 6}));

	// Simple step is illegal; back to the forced state.
	EXPECT_FALSE(game.select({4, 3}).completedTurn);
	EXPECT_EQ(game.phase(), TurnPhase::ForcedCaptureAvailable);

	game.select({5, 4});
	const auto result = game.select({3, 6});
	ASSERT_TRUE(result.completedTurn);
	EXPECT_EQ(result.completedTurn->size(), 1u);
	EXPECT_FALSE(game.board().occupied({4, 5}));
	EXPECT_EQ(game.board().pieceCount(Side::Remote), 12u);
	EXPECT_EQ(game.phase(), TurnPhase::OpponentTurn);
}

TEST(Game, CaptureChainKeepsSamePiece) {
	Board board;
	board.place(Side::Local, {6, 1});
	board.place(Side::Local, {7, 6});
	board.place(Side::Remote, {5, 2});
	board.place(Side::Remote, {3, 4});
	board.place(Side::Remote, {0, 7});
	Game game(board, true);

	ASSERT_EQ(game.phase(), TurnPhase::ForcedCaptureAvailable);
	game.select({6, 1});
	auto result = game.select({4, 3});
	EXPECT_TRUE(result.changed);
	EXPECT_FALSE(result.completedTurn);
	ASSERT_EQ(game.phase(), TurnPhase::ContinuingCaptureChain);
	EXPECT_EQ(*game.selected(), (Coord{4, 3}));

	// Another piece or a non capture cell is ignored mid chain.
	EXPECT_FALSE(game.select({7, 6}).changed);
	EXPECT_FALSE(game.select({3, 2}).changed);
	EXPECT_EQ(game.phase(), TurnPhase::ContinuingCaptureChain);

	result = game.select({2, 5});
	ASSERT_TRUE(result.completedTurn);
	const MoveChain expected{{{6, 1}, {4, 3}}, {{4, 3}, {2, 5}}};
	EXPECT_EQ(*result.completedTurn, expected);
	EXPECT_EQ(game.board().pieceCount(Side::Remote), 1u);
	EXPECT_EQ(game.phase(), TurnPhase::OpponentTurn);
}

TEST(Game, RemoteChainAppliedInOrder) {
	Board board;
	board.place(Side::Remote, {5, 2}, true);
	board.place(Side::Local, {3, 2});
	board.place(Side::Local, {7, 0});
	Game game(board, false);

	const MoveChain chain{{{5, 2}, {4, 3}}, {{4, 3}, {2, 1}}};
	ASSERT_TRUE(game.applyRemoteMove(chain));

	const auto* piece = game.board().pieceAt({2, 1});
	ASSERT_NE(piece, nullptr);
	EXPECT_EQ(piece->owner(), Side::Remote);
	EXPECT_FALSE(game.board().occupied({5, 2}));
	EXPECT_FALSE(game.board().occupied({3, 2}));
	EXPECT_EQ(game.board().pieceCount(Side::Local), 1u);
	EXPECT_EQ(game.phase(), TurnPhase::AwaitingFirstSelection);
}

TEST(Game, RemoteMoveLeadsToForcedCapture) {
	Board board;
	board.place(Side::Remote, {2, 1});
	board.place(Side::Local, {5, 4});
	Game game(board, false);

	ASSERT_TRUE(game.applyRemoteMove({{{2, 1}, {3, 2}}}));
	EXPECT_EQ(game.phase(), TurnPhase::AwaitingFirstSelection);

	Board close;
	close.place(Side::Remote, {3, 2});
	close.place(Side::Local, {5, 4});
	Game forced(close, false);
	ASSERT_TRUE(forced.applyRemoteMove({{{3, 2}, {4, 3}}}));
	ASSERT_EQ(forced.phase(), TurnPhase::ForcedCaptureAvailable);
	EXPECT_EQ(forced.forcedPieces(), (std::vector<Coord>{{5, 4}}));
}

TEST(Game, RemotePromotion) {
	Board board;
	board.place(Side::Remote, {6, 3});
	board.place(Side::Local, {0, 1});
	Game game(board, false);

	ASSERT_TRUE(game.applyRemoteMove({{{6, 3}, {7, 4}}}));
	EXPECT_TRUE(game.board().pieceAt({7, 4})->isKing());
}

TEST(Game, RejectedRemoteMoveLeavesBoardUntouched) {
	Board board;
	board.place(Side::Remote, {2, 1});
	board.place(Side::Remote, {2, 5});
	board.place(Side::Local, {3, 2});
	Game game(board, false);
	const auto before = game.board();

	// Second leg does not continue from the first landing.
	EXPECT_FALSE(game.applyRemoteMove({{{2, 1}, {4, 3}}, {{2, 5}, {3, 6}}}));
	EXPECT_EQ(game.board(), before);
	EXPECT_EQ(game.phase(), TurnPhase::OpponentTurn);

	// Moving a local piece or onto an occupied cell.
	EXPECT_FALSE(game.applyRemoteMove({{{3, 2}, {4, 3}}}));
	EXPECT_FALSE(game.applyRemoteMove({{{2, 1}, {3, 2}}}));
	EXPECT_FALSE(game.applyRemoteMove({}));
	EXPECT_EQ(game.board(), before);

	// Not the remote turn.
	Game host(true);
	EXPECT_FALSE(host.applyRemoteMove({{{2, 1}, {3, 0}}}));
	EXPECT_EQ(host.board(), Board::initial());
}

TEST(Game, ResetRestoresStartPosition) {
	Board board;
	board.place(Side::Local, {5, 2});
	Game host(board, true);
	ASSERT_TRUE(host.isGameOver());
	ASSERT_EQ(*host.loser(), Side::Remote);

	host.reset();
	EXPECT_FALSE(host.isGameOver());
	EXPECT_EQ(host.board(), Board::initial());
	EXPECT_EQ(host.phase(), TurnPhase::AwaitingFirstSelection);

	Game client(board, false);
	client.reset();
	EXPECT_EQ(client.board(), Board::initial());
	EXPECT_EQ(client.phase(), TurnPhase::OpponentTurn);
}

} // namespace checkers::gtest
