#pragma once

#include "app/IAppSignalListener.hpp"

#include <mutex>
#include <vector>

namespace checkers::app {

//! Allows external components to be updated on session events.
//! \note Signals are synchronous, run on the caller thread and reach listeners in registration order.
class EventHub {
	struct SignalListenerEntry {
		IAppSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;          //!< What events the listener cares about.
	};

public:
	void subscribe(IAppSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IAppSignalListener* listener);
	void signal(AppSignal signal); //!< Signal a session event.

private:
	std::mutex m_listenerMutex;
	std::vector<SignalListenerEntry> m_signalListeners;
};

} // namespace checkers::app
