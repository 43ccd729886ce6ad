#include "core/game.hpp"
#include "core/moveChecker.hpp"

#include <algorithm>
#include <utility>

namespace checkers {

static bool contains(const std::vector<Coord>& cells, Coord c) {
	return std::find(cells.begin(), cells.end(), c) != cells.end();
}

Game::Game(bool localStarts) : m_localStarts(localStarts), m_board(Board::initial()), m_state(OpponentTurn{}) {
	if (m_localStarts) {
		beginLocalTurn();
	}
}

Game::Game(Board position, bool localToMove) : m_localStarts(localToMove), m_board(std::move(position)), m_state(OpponentTurn{}) {
	if (localToMove) {
		beginLocalTurn();
	}
}

void Game::reset() {
	m_board = Board::initial();
	m_pendingMove.clear();

	if (m_localStarts) {
		beginLocalTurn();
	} else {
		m_state = OpponentTurn{};
	}
}

SelectionResult Game::select(Coord c) {
	if (!inBounds(c)) {
		return {};
	}

	// Handlers replace m_state; visit a copy.
	const auto state = m_state;
	return std::visit([&](const auto& s) { return handleSelection(s, c); }, state);
}

bool Game::applyRemoteMove(const MoveChain& chain) {
	if (!std::holds_alternative<OpponentTurn>(m_state) || chain.empty()) {
		return false;
	}

	Board scratch = m_board;
	for (std::size_t i = 0; i < chain.size(); ++i) {
		const auto& segment = chain[i];
		// A chain is one piece jumping on.
		if (i > 0 && segment.from != chain[i - 1].to) {
			return false;
		}
		if (!isApplicable(scratch, Side::Remote, segment)) {
			return false;
		}
		applyMove(scratch, segment.from, segment.to);
	}

	m_board = std::move(scratch);
	beginLocalTurn();
	return true;
}

const Board& Game::board() const {
	return m_board;
}

const TurnState& Game::state() const {
	return m_state;
}

TurnPhase Game::phase() const {
	return phaseOf(m_state);
}

bool Game::isLocalTurn() const {
	return !std::holds_alternative<OpponentTurn>(m_state);
}

std::optional<Coord> Game::selected() const {
	if (const auto* s = std::get_if<AwaitingDestination>(&m_state)) {
		return s->selected;
	}
	if (const auto* s = std::get_if<ContinuingCaptureChain>(&m_state)) {
		return s->selected;
	}
	return std::nullopt;
}

std::vector<Coord> Game::destinations() const {
	if (const auto* s = std::get_if<AwaitingDestination>(&m_state)) {
		return s->destinations;
	}
	if (const auto* s = std::get_if<ContinuingCaptureChain>(&m_state)) {
		return s->destinations;
	}
	return {};
}

std::vector<Coord> Game::forcedPieces() const {
	if (const auto* s = std::get_if<ForcedCaptureAvailable>(&m_state)) {
		return s->capturers;
	}
	return {};
}

bool Game::isGameOver() const {
	return checkers::isGameOver(m_board);
}

std::optional<Side> Game::loser() const {
	return checkers::loser(m_board);
}

SelectionResult Game::handleSelection(const AwaitingFirstSelection&, Coord c) {
	const auto* piece = m_board.pieceAt(c);
	if (piece == nullptr || piece->owner() != Side::Local) {
		return {};
	}

	auto moves = legalSimpleMoves(m_board, *piece);
	if (moves.empty()) {
		return {};
	}

	m_state = AwaitingDestination{.selected = c, .destinations = std::move(moves), .captureOnly = false};
	return {.changed = true};
}

SelectionResult Game::handleSelection(const ForcedCaptureAvailable& state, Coord c) {
	if (!contains(state.capturers, c)) {
		return {};
	}

	m_state = AwaitingDestination{.selected = c, .destinations = captureLandings(m_board, *m_board.pieceAt(c)), .captureOnly = true};
	return {.changed = true};
}

SelectionResult Game::handleSelection(const AwaitingDestination& state, Coord c) {
	if (!contains(state.destinations, c)) {
		// Deselect. Mandatory captures are recomputed, not remembered.
		beginLocalTurn();
		return {.changed = true};
	}
	return moveSelected(state.selected, c);
}

SelectionResult Game::handleSelection(const ContinuingCaptureChain& state, Coord c) {
	if (!contains(state.destinations, c)) {
		return {};
	}
	return moveSelected(state.selected, c);
}

SelectionResult Game::handleSelection(const OpponentTurn&, Coord) {
	return {};
}

SelectionResult Game::moveSelected(Coord from, Coord to) {
	const auto outcome = applyMove(m_board, from, to);
	m_pendingMove.push_back({.from = from, .to = to});

	if (outcome.captured) {
		const auto* piece = m_board.pieceAt(to);
		auto landings     = captureLandings(m_board, *piece);
		if (!landings.empty()) {
			m_state = ContinuingCaptureChain{.selected = to, .destinations = std::move(landings)};
			return {.changed = true};
		}
	}

	SelectionResult result{.changed = true, .completedTurn = std::move(m_pendingMove)};
	m_pendingMove.clear();
	m_state = OpponentTurn{};
	return result;
}

void Game::beginLocalTurn() {
	m_pendingMove.clear();

	const auto captures = legalCaptures(m_board, Side::Local);
	if (captures.empty()) {
		m_state = AwaitingFirstSelection{};
		return;
	}

	std::vector<Coord> capturers;
	for (const auto& capture: captures) {
		if (!contains(capturers, capture.from)) {
			capturers.push_back(capture.from);
		}
	}
	m_state = ForcedCaptureAvailable{.capturers = std::move(capturers)};
}

} // namespace checkers
