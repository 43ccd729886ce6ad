#pragma once

#include "app/IAppSignalListener.hpp"
#include "app/eventHub.hpp"
#include "app/sessionConfig.hpp"
#include "core/board.hpp"
#include "core/game.hpp"
#include "gameNet/nwEvents.hpp"
#include "gameNet/peer.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace checkers::app {

enum class GameStatus {
	Idle,   //!< Not started or session over.
	Active, //!< Connected and playing.
};

//! Local source of truth for one networked game.
//! Arbitrates local selections against the turn state, applies inbound frames and keeps names, scores and chat.
//! Listeners subscribe to signals and query the updated data from this SessionManager afterwards.
//! \note Local actions and the peer's read thread are serialized through one mutex. Signals fire after it is released.
class SessionManager : public gameNet::IPeerHandler {
public:
	struct ChatSnapshot {
		std::size_t total{0};
		std::vector<std::string> entries;
	};

	SessionManager(Role role, std::string displayName, std::unique_ptr<gameNet::IPeer> peer);
	~SessionManager() override;

	SessionManager(const SessionManager&)            = delete;
	SessionManager& operator=(const SessionManager&) = delete;

	void subscribe(IAppSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IAppSignalListener* listener);

	//! Announce the local name and start receiving. Host moves first.
	void start();
	//! Same as start() but from a prepared position. Used for problems and tests.
	void start(const Board& position);

	// Commands
	void applyLocalSelection(int row, int col); //!< Click on a cell. Sends the move once the turn is complete.
	void chat(std::string message);             //!< Send a chat line under the local name.
	void quitSession();                         //!< Tell the peer, close the connection and return to menu.
	void handleInboundFrame(const network::Message& frame);

	// Getters
	GameStatus status() const;
	Role role() const;
	Board board() const;
	TurnPhase phase() const;
	bool isLocalTurn() const;
	std::optional<Coord> selected() const;
	std::vector<Coord> destinations() const;
	std::vector<Coord> forcedPieces() const;

	std::string hostName() const;
	std::string clientName() const;
	unsigned hostScore() const;
	unsigned clientScore() const;

	ChatSnapshot chatSnapshot(std::size_t fromIndex) const;

public: // Peer handler
	void onFrame(const network::Message& frame) override;
	void onDisconnected() override;

private:
	void begin(Game game);
	void signalMask(uint64_t mask);
	void terminate(); //!< Shut the session down once. Safe from either thread.

	// Inbound events. Called with the state mutex held. Return false if the session must end.
	bool apply(const gameNet::NwQuit& event, uint64_t& mask);
	bool apply(const gameNet::NwChat& event, uint64_t& mask);
	bool apply(const gameNet::NwHandshake& event, uint64_t& mask);
	bool apply(const gameNet::NwMove& event, uint64_t& mask);

	uint64_t finishGameIfOver(); //!< Score the winner and restart the board. Returns signals to emit.
	std::string& ownName();
	std::string& peerName();

private:
	const Role m_role;
	std::unique_ptr<gameNet::IPeer> m_peer;
	EventHub m_eventHub;

	Game m_game;
	GameStatus m_status{GameStatus::Idle};

	std::string m_hostName;
	std::string m_clientName;
	unsigned m_hostScore{0};
	unsigned m_clientScore{0};

	std::vector<std::string> m_chatHistory;
	mutable std::mutex m_stateMutex;
};

} // namespace checkers::app
