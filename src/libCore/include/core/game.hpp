#pragma once

#include "core/board.hpp"
#include "core/turnState.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace checkers {

//! Outcome of a local selection.
struct SelectionResult {
	bool changed{false};                      //!< Board or selection changed. Views should refresh.
	std::optional<MoveChain> completedTurn{}; //!< Set when the selection finished the local turn.
};

//! Turn state machine of one instance. Owns the board and decides which local selections are legal.
//! \note Not thread safe. The session serializes access.
class Game {
public:
	//! Standard start position. The starting side begins in AwaitingFirstSelection, the other in OpponentTurn.
	explicit Game(bool localStarts);

	//! Start from a prepared position. Used for problems and tests.
	Game(Board position, bool localToMove);

	void reset(); //!< Initial board and initial turn state for this instance.

	//! Local click on a cell. Illegal clicks deselect or are ignored; they never change the board.
	SelectionResult select(Coord c);

	//! Apply a full remote turn. The chain is checked on a copy and committed only if every segment fits.
	//! Returns false and leaves the game untouched if the chain is rejected or it is not the remote turn.
	bool applyRemoteMove(const MoveChain& chain);

	const Board& board() const;
	const TurnState& state() const;
	TurnPhase phase() const;
	bool isLocalTurn() const;

	std::optional<Coord> selected() const;  //!< Selected piece, if any.
	std::vector<Coord> destinations() const; //!< Legal destinations of the selected piece.
	std::vector<Coord> forcedPieces() const; //!< Pieces that must capture this turn.

	bool isGameOver() const;
	std::optional<Side> loser() const;

private:
	SelectionResult handleSelection(const AwaitingFirstSelection& state, Coord c);
	SelectionResult handleSelection(const ForcedCaptureAvailable& state, Coord c);
	SelectionResult handleSelection(const AwaitingDestination& state, Coord c);
	SelectionResult handleSelection(const ContinuingCaptureChain& state, Coord c);
	SelectionResult handleSelection(const OpponentTurn& state, Coord c);

	SelectionResult moveSelected(Coord from, Coord to); //!< Apply a leg and decide chain continuation or hand over.
	void beginLocalTurn();                              //!< Enter the first selection state, forced if captures exist.

private:
	bool m_localStarts;
	Board m_board;
	TurnState m_state;
	MoveChain m_pendingMove; //!< Segments of the local turn in progress.
};

} // namespace checkers
