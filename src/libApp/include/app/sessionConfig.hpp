#pragma once

#include "gameNet/peer.hpp"
#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace checkers::app {

//! Which end of the connection this instance is. The host accepts and moves first.
enum class Role { Host, Client };

inline constexpr std::uint16_t HOST_PORT_MIN   = 30000;
inline constexpr std::uint16_t HOST_PORT_MAX   = 40000;
inline constexpr std::uint16_t CLIENT_PORT_MIN = 1;
inline constexpr std::uint16_t CLIENT_PORT_MAX = 65535;

inline constexpr const char* DEFAULT_HOST_NAME   = "Player 1";
inline constexpr const char* DEFAULT_CLIENT_NAME = "Player 2";
inline constexpr const char* DEFAULT_ADDRESS     = "127.0.0.1";

struct SessionConfig {
	Role role{Role::Host};
	std::string displayName{};
	std::uint16_t port{network::DEFAULT_PORT};
	std::string hostAddress{DEFAULT_ADDRESS}; //!< Only used by the client.
	std::chrono::milliseconds acceptTimeout{network::DEFAULT_ACCEPT_TIMEOUT};
	std::chrono::milliseconds connectTimeout{network::DEFAULT_CONNECT_TIMEOUT};
};

std::string defaultName(Role role);

//! True if the port may be used by the given role.
bool isValidPort(Role role, long port);

//! Parse a port argument. Returns the default port if the text is not a valid port for the role.
std::uint16_t parsePort(Role role, const std::string& text);

//! Replace invalid or empty settings with defaults.
SessionConfig normalized(SessionConfig config);

//! Open the connection described by the config. Blocks for at most the configured timeout.
//! Returns nullptr if no connection could be established.
std::unique_ptr<gameNet::IPeer> openPeer(const SessionConfig& config);

} // namespace checkers::app
