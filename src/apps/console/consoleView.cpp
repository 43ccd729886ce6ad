#include "consoleView.hpp"

#include <algorithm>
#include <format>

namespace checkers::console {

namespace {

char pieceSymbol(const Piece& piece) {
	if (piece.owner() == Side::Local) {
		return piece.isKing() ? 'O' : 'o';
	}
	return piece.isKing() ? 'X' : 'x';
}

const char* phaseText(TurnPhase phase) {
	switch (phase) {
	case TurnPhase::AwaitingFirstSelection: return "your turn, select a piece";
	case TurnPhase::ForcedCaptureAvailable: return "your turn, you must capture";
	case TurnPhase::AwaitingDestination: return "your turn, select a destination";
	case TurnPhase::ContinuingCaptureChain: return "your turn, continue capturing";
	case TurnPhase::OpponentTurn: return "opponent's turn";
	}
	return "";
}

} // namespace

ConsoleView::ConsoleView(app::SessionManager& session, std::ostream& out) : m_session(session), m_out(out) {
}

void ConsoleView::onAppEvent(app::AppSignal signal) {
	switch (signal) {
	case app::AS_BoardChange: printBoard(); break;
	case app::AS_ChatChange: printNewChat(); break;
	case app::AS_ScoreChange: printScore(); break;
	case app::AS_ReturnToMenu: {
		m_sessionOver = true;
		std::lock_guard<std::mutex> lock(m_outMutex);
		m_out << "Session ended." << std::endl;
		break;
	}
	default: break;
	}
}

void ConsoleView::printBoard() {
	const auto board        = m_session.board();
	const auto selected     = m_session.selected();
	const auto destinations = m_session.destinations();
	const auto forced       = m_session.forcedPieces();
	const auto phase        = m_session.phase();

	auto contains = [](const std::vector<Coord>& list, Coord c) { return std::find(list.begin(), list.end(), c) != list.end(); };

	std::string text = "   0 1 2 3 4 5 6 7\n";
	for (int row = 0; row < BOARD_SIZE; ++row) {
		text += std::format("{}  ", row);
		for (int col = 0; col < BOARD_SIZE; ++col) {
			const Coord c{row, col};
			char symbol = (row + col) % 2 == 1 ? '.' : ' ';
			if (const auto* piece = board.pieceAt(c)) {
				symbol = pieceSymbol(*piece);
			} else if (contains(destinations, c)) {
				symbol = '*';
			}

			const bool marked = (selected && *selected == c) || contains(forced, c);
			text += marked ? '>' : ' ';
			text += symbol;
		}
		text += '\n';
	}
	text += std::format("({})\n", phaseText(phase));

	std::lock_guard<std::mutex> lock(m_outMutex);
	m_out << text << std::flush;
}

void ConsoleView::printScore() {
	const auto text = std::format("{} {} : {} {}\n", m_session.hostName(), m_session.hostScore(), m_session.clientScore(), m_session.clientName());

	std::lock_guard<std::mutex> lock(m_outMutex);
	m_out << text << std::flush;
}

void ConsoleView::printNewChat() {
	std::lock_guard<std::mutex> lock(m_outMutex);
	const auto snapshot = m_session.chatSnapshot(m_chatSeen);
	for (const auto& line: snapshot.entries) {
		m_out << "> " << line << '\n';
	}
	m_chatSeen = snapshot.total;
	m_out << std::flush;
}

bool ConsoleView::sessionOver() const {
	return m_sessionOver;
}

} // namespace checkers::console
