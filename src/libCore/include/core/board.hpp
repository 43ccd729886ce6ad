#pragma once

#include "core/piece.hpp"
#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <vector>

namespace checkers {

//! 8x8 checkers board. Owns the pieces of both sides and keeps grid and piece positions in sync.
//! \note All coordinates must be on the board. Out of range access is a programming error.
class Board {
public:
	using PieceList = std::vector<std::unique_ptr<Piece>>;

public:
	Board() = default;
	Board(const Board& other);
	Board& operator=(const Board& other);
	Board(Board&& other) noexcept;
	Board& operator=(Board&& other) noexcept;

	//! Board with 12 pieces per side on the dark squares of the three rows next to each back rank.
	static Board initial();

	bool occupied(Coord c) const;                         //!< True if any piece stands on c.
	bool occupiedByOpponent(Coord c, Side asking) const;  //!< True if a piece of the other side stands on c.
	const Piece* pieceAt(Coord c) const;                  //!< Piece on c or nullptr.

	Piece& place(Side owner, Coord c, bool king = false); //!< Create a piece on an empty cell.
	void remove(Coord c);                                 //!< Destroy the piece on c.
	void move(Coord from, Coord to);                      //!< Relocate the piece on from to the empty cell to.
	void crown(Coord c);                                  //!< Promote the piece on c.
	void clear();                                         //!< Remove all pieces.

	const PieceList& pieces(Side side) const; //!< Pieces of a side in no particular order.
	std::size_t pieceCount(Side side) const;

	bool operator==(const Board& other) const; //!< Same owner and king flag on every cell.

private:
	static std::size_t index(Coord c);
	PieceList& piecesOf(Side side);

private:
	std::array<Piece*, BOARD_SIZE * BOARD_SIZE> m_cells{}; //!< Non owning view on the pieces.
	PieceList m_localPieces;
	PieceList m_remotePieces;
};

} // namespace checkers
