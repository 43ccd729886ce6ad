#pragma once

#include <cstdint>

namespace checkers::app {

//! Types of signals.
enum AppSignal : uint64_t {
	AS_None         = 0,
	AS_BoardChange  = 1 << 0, //!< Board, selection or turn changed.
	AS_ChatChange   = 1 << 1, //!< Chat line appended.
	AS_ScoreChange  = 1 << 2, //!< Score or display name changed.
	AS_ReturnToMenu = 1 << 3, //!< Session ended. Local or remote quit, or connection lost.
	AS_All          = AS_BoardChange | AS_ChatChange | AS_ScoreChange | AS_ReturnToMenu,
};

class IAppSignalListener {
public:
	virtual ~IAppSignalListener()             = default;
	virtual void onAppEvent(AppSignal signal) = 0;
};

} // namespace checkers::app
