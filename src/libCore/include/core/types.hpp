#pragma once

#include <cstdint>
#include <vector>

namespace checkers {

//! Board coordinate. Row 0 is the far rank of the local player, row 7 the local back rank.
struct Coord {
	int row;
	int col;

	bool operator==(const Coord&) const = default;
};

//! The two parties of a game as seen from one instance.
//! \note Local pieces move toward row 0, remote pieces toward row 7.
enum class Side { Local = 1, Remote = 2 };

//! Returns the opposing side.
inline constexpr Side opponent(Side side) {
	return side == Side::Local ? Side::Remote : Side::Local;
}

inline constexpr int BOARD_SIZE = 8;

//! True if the coordinate lies on the 8x8 board.
inline constexpr bool inBounds(Coord c) {
	return c.row >= 0 && c.row < BOARD_SIZE && c.col >= 0 && c.col < BOARD_SIZE;
}

//! One leg of a move: a single step or a single jump.
struct MoveSegment {
	Coord from;
	Coord to;

	bool operator==(const MoveSegment&) const = default;
};

//! A full turn. More than one segment only for capture chains.
using MoveChain = std::vector<MoveSegment>;

} // namespace checkers
