#pragma once

#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace checkers {
namespace network {

//! Single blocking TCP connection carrying length-prefixed frames.
//! One thread may block in read() while another sends; send() is synchronized.
class TcpChannel {
public:
	TcpChannel();
	~TcpChannel();

	TcpChannel(const TcpChannel&)            = delete;
	TcpChannel& operator=(const TcpChannel&) = delete;

	//! Listen on port and accept exactly one peer. False if nobody connected within timeout.
	bool accept(std::uint16_t port, std::chrono::milliseconds timeout = DEFAULT_ACCEPT_TIMEOUT);

	//! Connect to host:port. False on resolve failure, refusal or timeout.
	bool connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout = DEFAULT_CONNECT_TIMEOUT);

	//! Shut the socket down. Unblocks a pending read().
	void disconnect();
	bool isConnected() const;

	bool send(const Message& message);

	//! Block until one full frame arrived. Empty on error or when the peer closed the connection.
	std::optional<Message> read();

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace network
} // namespace checkers
