#include "app/sessionConfig.hpp"
#include "Logging.hpp"

#include <charconv>
#include <format>

namespace checkers::app {

std::string defaultName(Role role) {
	return role == Role::Host ? DEFAULT_HOST_NAME : DEFAULT_CLIENT_NAME;
}

bool isValidPort(Role role, long port) {
	if (role == Role::Host) {
		return port >= HOST_PORT_MIN && port <= HOST_PORT_MAX;
	}
	return port >= CLIENT_PORT_MIN && port <= CLIENT_PORT_MAX;
}

std::uint16_t parsePort(Role role, const std::string& text) {
	long value{};
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || !isValidPort(role, value)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Invalid port '{}'. Using {}.", text, network::DEFAULT_PORT));
		return network::DEFAULT_PORT;
	}
	return static_cast<std::uint16_t>(value);
}

SessionConfig normalized(SessionConfig config) {
	if (config.displayName.empty()) {
		config.displayName = defaultName(config.role);
	}
	if (!isValidPort(config.role, config.port)) {
		config.port = network::DEFAULT_PORT;
	}
	if (config.hostAddress.empty()) {
		config.hostAddress = DEFAULT_ADDRESS;
	}
	if (config.acceptTimeout <= std::chrono::milliseconds::zero()) {
		config.acceptTimeout = network::DEFAULT_ACCEPT_TIMEOUT;
	}
	if (config.connectTimeout <= std::chrono::milliseconds::zero()) {
		config.connectTimeout = network::DEFAULT_CONNECT_TIMEOUT;
	}
	return config;
}

std::unique_ptr<gameNet::IPeer> openPeer(const SessionConfig& config) {
	auto peer = std::make_unique<gameNet::Peer>();

	const bool connected = config.role == Role::Host ? peer->host(config.port, config.acceptTimeout)
	                                                 : peer->join(config.hostAddress, config.port, config.connectTimeout);
	if (!connected) {
		Logger().Log(Logging::LogLevel::Warning, "[Config] Could not establish a connection.");
		return nullptr;
	}
	return peer;
}

} // namespace checkers::app
