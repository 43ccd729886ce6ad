#include "app/sessionManager.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace checkers::app {

namespace {

void trimInPlace(std::string& text) {
	auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
	auto first   = std::find_if_not(text.begin(), text.end(), isSpace);
	if (first == text.end()) {
		text.clear();
		return;
	}
	auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
	text.assign(first, last);
}

std::string formatChain(const MoveChain& chain) {
	std::string out;
	for (const auto& s: chain) {
		out += std::format("({},{})->({},{}) ", s.from.row, s.from.col, s.to.row, s.to.col);
	}
	return out;
}

} // namespace

SessionManager::SessionManager(Role role, std::string displayName, std::unique_ptr<gameNet::IPeer> peer)
    : m_role(role), m_peer(std::move(peer)), m_game(role == Role::Host), m_hostName(DEFAULT_HOST_NAME), m_clientName(DEFAULT_CLIENT_NAME) {
	trimInPlace(displayName);
	if (!displayName.empty()) {
		ownName() = std::move(displayName);
	}
	if (m_peer) {
		m_peer->registerHandler(this);
	}
}

SessionManager::~SessionManager() {
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_status = GameStatus::Idle;
	}
	if (m_peer) {
		m_peer->disconnect();
	}
}

void SessionManager::signalMask(uint64_t mask) {
	for (uint64_t bit = 1; mask != 0; bit <<= 1) {
		if (mask & bit) {
			m_eventHub.signal(static_cast<AppSignal>(bit));
			mask &= ~bit;
		}
	}
}

void SessionManager::subscribe(IAppSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void SessionManager::unsubscribe(IAppSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}


void SessionManager::start() {
	begin(Game(m_role == Role::Host));
}

void SessionManager::start(const Board& position) {
	begin(Game(position, m_role == Role::Host));
}

void SessionManager::begin(Game game) {
	if (!m_peer) {
		Logger().Log(Logging::LogLevel::Error, "[Session] Cannot start without a connection.");
		return;
	}

	std::string name;
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (m_status == GameStatus::Active) {
			return;
		}
		m_game   = std::move(game);
		m_status = GameStatus::Active;
		m_chatHistory.clear();
		name = ownName();
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Session] Started as {} '{}'.", m_role == Role::Host ? "host" : "client", name));
	m_peer->send(gameNet::NwHandshake{.displayName = name});
	m_peer->start();
	signalMask(AS_BoardChange | AS_ChatChange | AS_ScoreChange);
}

void SessionManager::applyLocalSelection(int row, int col) {
	const Coord c{row, col};
	if (!inBounds(c)) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Session] Ignoring selection outside the board ({},{}).", row, col));
		return;
	}

	uint64_t mask = 0u;
	std::optional<MoveChain> toSend;
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (m_status != GameStatus::Active) {
			return;
		}

		auto result = m_game.select(c);
		if (result.changed) {
			mask |= AS_BoardChange;
		}
		if (result.completedTurn) {
			toSend = std::move(result.completedTurn);
			mask |= finishGameIfOver();
		}
	}

	if (toSend) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Session] Sending move {}", formatChain(*toSend)));
		m_peer->send(gameNet::NwMove{.segments = std::move(*toSend)});
	}
	signalMask(mask);
}

void SessionManager::chat(std::string message) {
	message.erase(std::remove_if(message.begin(), message.end(), [](unsigned char c) { return c == '\r' || c == '\n'; }), message.end());
	trimInPlace(message);
	if (message.empty()) {
		return;
	}

	std::string line;
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (m_status != GameStatus::Active) {
			return;
		}
		line = std::format("{}: {}", ownName(), message);
		m_chatHistory.push_back(line);
	}

	m_peer->send(gameNet::NwChat{.line = std::move(line)});
	signalMask(AS_ChatChange);
}

void SessionManager::quitSession() {
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (m_status != GameStatus::Active) {
			return;
		}
	}

	Logger().Log(Logging::LogLevel::Info, "[Session] Quitting session.");
	m_peer->send(gameNet::NwQuit{});
	terminate();
}

void SessionManager::terminate() {
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (m_status == GameStatus::Idle) {
			return;
		}
		m_status = GameStatus::Idle;
	}

	m_peer->disconnect();
	signalMask(AS_ReturnToMenu);
}

void SessionManager::handleInboundFrame(const network::Message& frame) {
	const auto event = gameNet::fromMessage(frame);

	uint64_t mask = 0u;
	bool keepRunning = true;
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (m_status != GameStatus::Active) {
			return;
		}

		if (!event) {
			Logger().Log(Logging::LogLevel::Error, std::format("[Session] Malformed frame '{}'. Ending session.", frame));
			keepRunning = false;
		} else {
			keepRunning = std::visit([&](const auto& e) { return apply(e, mask); }, *event);
		}
	}

	signalMask(mask);
	if (!keepRunning) {
		terminate();
	}
}

bool SessionManager::apply(const gameNet::NwQuit&, uint64_t&) {
	Logger().Log(Logging::LogLevel::Info, "[Session] Peer quit.");
	return false;
}

bool SessionManager::apply(const gameNet::NwChat& event, uint64_t& mask) {
	m_chatHistory.push_back(event.line);
	mask |= AS_ChatChange;
	return true;
}

bool SessionManager::apply(const gameNet::NwHandshake& event, uint64_t& mask) {
	auto name = event.displayName;
	trimInPlace(name);
	if (name.empty()) {
		return true;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Session] Peer is '{}'.", name));
	peerName() = std::move(name);
	mask |= AS_ScoreChange;
	return true;
}

bool SessionManager::apply(const gameNet::NwMove& event, uint64_t& mask) {
	Logger().Log(Logging::LogLevel::Debug, std::format("[Session] Received move {}", formatChain(event.segments)));

	if (!m_game.applyRemoteMove(event.segments)) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Session] Rejected move {}. Ending session.", formatChain(event.segments)));
		return false;
	}

	mask |= AS_BoardChange | finishGameIfOver();
	return true;
}

uint64_t SessionManager::finishGameIfOver() {
	const auto loser = m_game.loser();
	if (!loser) {
		return AS_None;
	}

	const bool localWon = *loser == Side::Remote;
	const Role winner   = localWon ? m_role : (m_role == Role::Host ? Role::Client : Role::Host);
	if (winner == Role::Host) {
		++m_hostScore;
	} else {
		++m_clientScore;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Session] Game over. {} wins. Score {}:{}.", winner == Role::Host ? m_hostName : m_clientName,
	                                                  m_hostScore, m_clientScore));
	m_game.reset();
	return AS_BoardChange | AS_ScoreChange;
}

std::string& SessionManager::ownName() {
	return m_role == Role::Host ? m_hostName : m_clientName;
}

std::string& SessionManager::peerName() {
	return m_role == Role::Host ? m_clientName : m_hostName;
}

void SessionManager::onFrame(const network::Message& frame) {
	handleInboundFrame(frame);
}

void SessionManager::onDisconnected() {
	Logger().Log(Logging::LogLevel::Warning, "[Session] Connection lost.");
	terminate();
}


GameStatus SessionManager::status() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_status;
}
Role SessionManager::role() const {
	return m_role;
}
Board SessionManager::board() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.board();
}
TurnPhase SessionManager::phase() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.phase();
}
bool SessionManager::isLocalTurn() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.isLocalTurn();
}
std::optional<Coord> SessionManager::selected() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.selected();
}
std::vector<Coord> SessionManager::destinations() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.destinations();
}
std::vector<Coord> SessionManager::forcedPieces() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.forcedPieces();
}

std::string SessionManager::hostName() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_hostName;
}
std::string SessionManager::clientName() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_clientName;
}
unsigned SessionManager::hostScore() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_hostScore;
}
unsigned SessionManager::clientScore() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_clientScore;
}

SessionManager::ChatSnapshot SessionManager::chatSnapshot(std::size_t fromIndex) const {
	ChatSnapshot snapshot;
	std::lock_guard<std::mutex> lock(m_stateMutex);
	snapshot.total = m_chatHistory.size();
	if (fromIndex > snapshot.total) {
		fromIndex = 0;
	}
	if (fromIndex < snapshot.total) {
		snapshot.entries.assign(m_chatHistory.begin() + static_cast<std::ptrdiff_t>(fromIndex), m_chatHistory.end());
	}
	return snapshot;
}

} // namespace checkers::app
