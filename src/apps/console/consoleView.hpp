#pragma once

#include "app/IAppSignalListener.hpp"
#include "app/sessionManager.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <ostream>

namespace checkers::console {

//! Prints the session state whenever it changes.
class ConsoleView : public app::IAppSignalListener {
public:
	ConsoleView(app::SessionManager& session, std::ostream& out);

	void onAppEvent(app::AppSignal signal) override;

	void printBoard();
	void printScore();
	void printNewChat();

	bool sessionOver() const;

private:
	app::SessionManager& m_session;
	std::ostream& m_out;
	std::mutex m_outMutex;

	std::size_t m_chatSeen{0};
	std::atomic<bool> m_sessionOver{false};
};

} // namespace checkers::console
