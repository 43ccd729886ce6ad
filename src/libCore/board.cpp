#include "core/board.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

namespace checkers {

Board::Board(const Board& other) {
	*this = other;
}

Board& Board::operator=(const Board& other) {
	if (this == &other) {
		return *this;
	}

	clear();
	for (const auto side: {Side::Local, Side::Remote}) {
		for (const auto& piece: other.pieces(side)) {
			place(piece->owner(), piece->position(), piece->isKing());
		}
	}
	return *this;
}

Board::Board(Board&& other) noexcept
    : m_cells(other.m_cells), m_localPieces(std::move(other.m_localPieces)), m_remotePieces(std::move(other.m_remotePieces)) {
	other.clear();
}

Board& Board::operator=(Board&& other) noexcept {
	if (this != &other) {
		m_cells        = other.m_cells;
		m_localPieces  = std::move(other.m_localPieces);
		m_remotePieces = std::move(other.m_remotePieces);
		other.clear();
	}
	return *this;
}

Board Board::initial() {
	Board board;
	for (int row = 0; row < BOARD_SIZE; ++row) {
		if (row > 2 && row < 5) {
			continue;
		}
		for (int col = 0; col < BOARD_SIZE; ++col) {
			// Dark squares only.
			if ((row + col) % 2 == 1) {
				board.place(row < 3 ? Side::Remote : Side::Local, {row, col});
			}
		}
	}
	return board;
}

bool Board::occupied(Coord c) const {
	return m_cells[index(c)] != nullptr;
}

bool Board::occupiedByOpponent(Coord c, Side asking) const {
	const auto* piece = m_cells[index(c)];
	return piece != nullptr && piece->owner() != asking;
}

const Piece* Board::pieceAt(Coord c) const {
	return m_cells[index(c)];
}

Piece& Board::place(Side owner, Coord c, bool king) {
	assert(!occupied(c)); // Callers check the cell first.

	auto& list = piecesOf(owner);
	list.push_back(std::make_unique<Piece>(owner, c, king));
	m_cells[index(c)] = list.back().get();
	return *list.back();
}

void Board::remove(Coord c) {
	auto* piece = m_cells[index(c)];
	assert(piece != nullptr);

	m_cells[index(c)] = nullptr;
	auto& list        = piecesOf(piece->owner());
	list.erase(std::remove_if(list.begin(), list.end(), [&](const auto& p) { return p.get() == piece; }), list.end());
}

void Board::move(Coord from, Coord to) {
	auto* piece = m_cells[index(from)];
	assert(piece != nullptr);
	assert(!occupied(to));

	m_cells[index(from)] = nullptr;
	m_cells[index(to)]   = piece;
	piece->moveTo(to);
}

void Board::crown(Coord c) {
	auto* piece = m_cells[index(c)];
	assert(piece != nullptr);
	piece->crown();
}

void Board::clear() {
	m_cells.fill(nullptr);
	m_localPieces.clear();
	m_remotePieces.clear();
}

const Board::PieceList& Board::pieces(Side side) const {
	return side == Side::Local ? m_localPieces : m_remotePieces;
}

std::size_t Board::pieceCount(Side side) const {
	return pieces(side).size();
}

bool Board::operator==(const Board& other) const {
	for (std::size_t i = 0; i < m_cells.size(); ++i) {
		const auto* lhs = m_cells[i];
		const auto* rhs = other.m_cells[i];
		if ((lhs == nullptr) != (rhs == nullptr)) {
			return false;
		}
		if (lhs && (lhs->owner() != rhs->owner() || lhs->isKing() != rhs->isKing())) {
			return false;
		}
	}
	return true;
}

std::size_t Board::index(Coord c) {
	assert(inBounds(c)); // Rule engine only produces coordinates on the board.
	return static_cast<std::size_t>(c.row * BOARD_SIZE + c.col);
}

Board::PieceList& Board::piecesOf(Side side) {
	return side == Side::Local ? m_localPieces : m_remotePieces;
}

} // namespace checkers
