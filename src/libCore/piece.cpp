#include "core/piece.hpp"

namespace checkers {

Piece::Piece(Side owner, Coord position, bool king) : m_owner(owner), m_king(king), m_position(position) {
}

Side Piece::owner() const {
	return m_owner;
}

bool Piece::isKing() const {
	return m_king;
}

Coord Piece::position() const {
	return m_position;
}

void Piece::moveTo(Coord c) {
	m_position = c;
}

void Piece::crown() {
	m_king = true;
}

} // namespace checkers
