#include "gameNet/peer.hpp"
#include "Logging.hpp"

#include "network/tcpChannel.hpp"

#include <atomic>
#include <format>
#include <thread>

namespace checkers::gameNet {

class Peer::Implementation {
public:
	Implementation() = default;
	~Implementation();

	bool host(std::uint16_t port, std::chrono::milliseconds acceptTimeout);
	bool join(const std::string& address, std::uint16_t port, std::chrono::milliseconds connectTimeout);

	bool registerHandler(IPeerHandler* handler);
	void start();
	bool send(const NwEvent& event);
	void disconnect();
	bool isConnected() const;

private:
	void readLoop();
	void joinReadThread();

private:
	network::TcpChannel m_channel;
	std::atomic<bool> m_running{false}; //!< Read loop active and no local disconnect requested.
	std::thread m_readThread;

	IPeerHandler* m_handler{nullptr};
};

Peer::Implementation::~Implementation() {
	disconnect();
	joinReadThread();
}

bool Peer::Implementation::host(std::uint16_t port, std::chrono::milliseconds acceptTimeout) {
	if (m_channel.isConnected()) {
		return false;
	}
	return m_channel.accept(port, acceptTimeout);
}

bool Peer::Implementation::join(const std::string& address, std::uint16_t port, std::chrono::milliseconds connectTimeout) {
	if (m_channel.isConnected()) {
		return false;
	}
	return m_channel.connect(address, port, connectTimeout);
}

bool Peer::Implementation::registerHandler(IPeerHandler* handler) {
	if (m_handler) {
		return false;
	}
	m_handler = handler;
	return true;
}

void Peer::Implementation::start() {
	if (!m_channel.isConnected() || m_readThread.joinable()) {
		return;
	}

	m_running    = true;
	m_readThread = std::thread([this] { readLoop(); });
}

bool Peer::Implementation::send(const NwEvent& event) {
	const auto message = toMessage(event);
	if (!m_channel.send(message)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Peer] Could not send '{}'.", message));
		return false;
	}
	return true;
}

void Peer::Implementation::disconnect() {
	m_running = false;
	m_channel.disconnect();

	if (m_readThread.joinable() && m_readThread.get_id() != std::this_thread::get_id()) {
		m_readThread.join();
	}
}

bool Peer::Implementation::isConnected() const {
	return m_channel.isConnected();
}

void Peer::Implementation::readLoop() {
	while (m_running) {
		const auto frame = m_channel.read();
		if (!frame) {
			break;
		}
		if (m_handler) {
			m_handler->onFrame(*frame);
		}
	}

	// Only a loop that was not stopped locally reports the loss.
	if (m_running.exchange(false)) {
		Logger().Log(Logging::LogLevel::Info, "[Peer] Connection closed by remote side.");
		m_channel.disconnect();
		if (m_handler) {
			m_handler->onDisconnected();
		}
	}
}

void Peer::Implementation::joinReadThread() {
	if (!m_readThread.joinable()) {
		return;
	}
	if (m_readThread.get_id() == std::this_thread::get_id()) {
		m_readThread.detach();
	} else {
		m_readThread.join();
	}
}


Peer::Peer() : m_pimpl(std::make_unique<Implementation>()) {
}

Peer::~Peer() = default;

bool Peer::host(std::uint16_t port, std::chrono::milliseconds acceptTimeout) {
	return m_pimpl->host(port, acceptTimeout);
}

bool Peer::join(const std::string& address, std::uint16_t port, std::chrono::milliseconds connectTimeout) {
	return m_pimpl->join(address, port, connectTimeout);
}

bool Peer::registerHandler(IPeerHandler* handler) {
	return m_pimpl->registerHandler(handler);
}

void Peer::start() {
	m_pimpl->start();
}

bool Peer::send(const NwEvent& event) {
	return m_pimpl->send(event);
}

void Peer::disconnect() {
	m_pimpl->disconnect();
}

bool Peer::isConnected() const {
	return m_pimpl->isConnected();
}

} // namespace checkers::gameNet
