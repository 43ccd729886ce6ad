#pragma once

#include "core/types.hpp"

namespace checkers {

class Board;

//! A single checker. Position and crown are only changed by the board.
class Piece {
public:
	Piece(Side owner, Coord position, bool king = false);

	Side owner() const;
	bool isKing() const;
	Coord position() const;

private:
	friend class Board;

	void moveTo(Coord c); //!< Update stored position. Board keeps the grid in sync.
	void crown();         //!< Promote to king. Never reverts.

private:
	Side m_owner;
	bool m_king{false};
	Coord m_position;
};

} // namespace checkers
