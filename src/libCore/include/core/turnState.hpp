#pragma once

#include "core/types.hpp"

#include <variant>
#include <vector>

namespace checkers {

//! Local turn, nothing selected and no capture pending.
struct AwaitingFirstSelection {};

//! Local turn with mandatory captures. Only the listed pieces may be selected.
struct ForcedCaptureAvailable {
	std::vector<Coord> capturers;
};

//! A piece is selected and waits for its destination.
struct AwaitingDestination {
	Coord selected;
	std::vector<Coord> destinations;
	bool captureOnly{false}; //!< Destinations are capture landings.
};

//! The selected piece captured and must capture again.
struct ContinuingCaptureChain {
	Coord selected;
	std::vector<Coord> destinations;
};

//! The remote side is moving. Local input is ignored.
struct OpponentTurn {};

using TurnState = std::variant<AwaitingFirstSelection, ForcedCaptureAvailable, AwaitingDestination, ContinuingCaptureChain, OpponentTurn>;

//! Tag of a TurnState, for callers that only need to branch on the phase.
enum class TurnPhase { AwaitingFirstSelection, ForcedCaptureAvailable, AwaitingDestination, ContinuingCaptureChain, OpponentTurn };

inline TurnPhase phaseOf(const TurnState& state) {
	return static_cast<TurnPhase>(state.index());
}

} // namespace checkers
