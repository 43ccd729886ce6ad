#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace checkers {

//! A capture available to a side: the capturing piece and one landing cell.
struct CaptureOption {
	Coord from;
	Coord to;

	bool operator==(const CaptureOption&) const = default;
};

//! Result of applying one move segment.
struct MoveOutcome {
	std::optional<Coord> captured; //!< Cell of the removed opponent piece for a jump.
	bool promoted{false};          //!< Piece was crowned by this segment.
};

//! Row step of a non-king piece of the given side.
inline constexpr int forwardDirection(Side side) {
	return side == Side::Local ? -1 : 1;
}

//! Row on which pieces of the given side are crowned.
inline constexpr int promotionRow(Side side) {
	return side == Side::Local ? 0 : BOARD_SIZE - 1;
}

//! Empty cells the piece can step to. Non-kings step forward only, kings in all four diagonals.
std::vector<Coord> legalSimpleMoves(const Board& board, const Piece& piece);

//! Landing cells of all single jumps the piece can make from its current position.
std::vector<Coord> captureLandings(const Board& board, const Piece& piece);

//! All captures of all pieces of a side. Empty if the side has no capture.
//! \note Recompute after every capture; chains change the result.
std::vector<CaptureOption> legalCaptures(const Board& board, Side side);

//! True if the piece that just captured can capture again from where it stands.
bool hasAnotherCaptureFrom(const Board& board, const Piece& piece);

//! Move the piece on from to to. A displacement of two removes the jumped opponent piece.
//! Crowns the piece when it lands on its promotion row.
//! \note Assumes the segment is geometrically valid. Use isApplicable to check untrusted input.
MoveOutcome applyMove(Board& board, Coord from, Coord to);

//! Geometric check of a segment for the given side: own piece on from, empty target, one diagonal step or
//! one diagonal jump over an opponent piece. Does not check direction or mandatory capture.
bool isApplicable(const Board& board, Side side, const MoveSegment& segment);

//! True if either side has no pieces left.
bool isGameOver(const Board& board);

//! The side without pieces. Empty while the game goes on.
std::optional<Side> loser(const Board& board);

} // namespace checkers
