#include "core/moveChecker.hpp"

#include <array>
#include <cassert>
#include <cstdlib>

namespace checkers {

static constexpr std::array<int, 2> kColSteps{-1, 1};

//! Row directions a piece may use: forward only, or both for kings.
static std::vector<int> rowSteps(const Piece& piece) {
	if (piece.isKing()) {
		return {-1, 1};
	}
	return {forwardDirection(piece.owner())};
}

std::vector<Coord> legalSimpleMoves(const Board& board, const Piece& piece) {
	std::vector<Coord> moves;

	const auto origin = piece.position();
	for (const auto dr: rowSteps(piece)) {
		for (const auto dc: kColSteps) {
			const Coord target{origin.row + dr, origin.col + dc};
			if (inBounds(target) && !board.occupied(target)) {
				moves.push_back(target);
			}
		}
	}
	return moves;
}

std::vector<Coord> captureLandings(const Board& board, const Piece& piece) {
	std::vector<Coord> landings;

	const auto origin = piece.position();
	for (const auto dr: rowSteps(piece)) {
		for (const auto dc: kColSteps) {
			const Coord over{origin.row + dr, origin.col + dc};
			const Coord landing{origin.row + 2 * dr, origin.col + 2 * dc};
			if (!inBounds(landing)) {
				continue;
			}
			if (board.occupiedByOpponent(over, piece.owner()) && !board.occupied(landing)) {
				landings.push_back(landing);
			}
		}
	}
	return landings;
}

std::vector<CaptureOption> legalCaptures(const Board& board, Side side) {
	std::vector<CaptureOption> captures;

	for (const auto& piece: board.pieces(side)) {
		for (const auto landing: captureLandings(board, *piece)) {
			captures.push_back({.from = piece->position(), .to = landing});
		}
	}
	return captures;
}

bool hasAnotherCaptureFrom(const Board& board, const Piece& piece) {
	return !captureLandings(board, piece).empty();
}

MoveOutcome applyMove(Board& board, Coord from, Coord to) {
	const auto* piece = board.pieceAt(from);
	assert(piece != nullptr);

	MoveOutcome outcome{};

	const int dr = to.row - from.row;
	const int dc = to.col - from.col;
	if (std::abs(dr) >= 2 || std::abs(dc) >= 2) {
		// Jumped piece sits on the diagonal midpoint.
		const Coord over{from.row + dr / 2, from.col + dc / 2};
		assert(board.occupiedByOpponent(over, piece->owner()));
		board.remove(over);
		outcome.captured = over;
	}

	const auto owner = piece->owner();
	board.move(from, to);

	if (to.row == promotionRow(owner) && !board.pieceAt(to)->isKing()) {
		board.crown(to);
		outcome.promoted = true;
	}
	return outcome;
}

bool isApplicable(const Board& board, Side side, const MoveSegment& segment) {
	const auto [from, to] = segment;
	if (!inBounds(from) || !inBounds(to)) {
		return false;
	}

	const auto* piece = board.pieceAt(from);
	if (piece == nullptr || piece->owner() != side || board.occupied(to)) {
		return false;
	}

	const int dr = to.row - from.row;
	const int dc = to.col - from.col;
	if (std::abs(dr) != std::abs(dc)) {
		return false;
	}
	if (std::abs(dr) == 1) {
		return true;
	}
	if (std::abs(dr) == 2) {
		return board.occupiedByOpponent({from.row + dr / 2, from.col + dc / 2}, side);
	}
	return false;
}

bool isGameOver(const Board& board) {
	return loser(board).has_value();
}

std::optional<Side> loser(const Board& board) {
	if (board.pieceCount(Side::Local) == 0u) {
		return Side::Local;
	}
	if (board.pieceCount(Side::Remote) == 0u) {
		return Side::Remote;
	}
	return std::nullopt;
}

} // namespace checkers
