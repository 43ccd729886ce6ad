#pragma once

#include "gameNet/nwEvents.hpp"
#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace checkers::gameNet {

//! Callback interface invoked on the peer's read thread.
class IPeerHandler {
public:
	virtual ~IPeerHandler()                              = default;
	virtual void onFrame(const network::Message& frame) = 0; //!< One raw inbound frame.
	virtual void onDisconnected()                        = 0; //!< Connection lost without a local disconnect.
};

//! Connected counterpart of a session.
class IPeer {
public:
	virtual ~IPeer() = default;

	virtual bool registerHandler(IPeerHandler* handler) = 0;
	virtual void start()                                = 0; //!< Start delivering inbound frames.
	virtual bool send(const NwEvent& event)             = 0;
	virtual void disconnect()                           = 0; //!< Close the connection. No onDisconnected follows.
	virtual bool isConnected() const                    = 0;
};

//! TCP peer. Either accepts one connection or connects to a listening instance,
//! then runs a background read loop that forwards frames to the handler.
class Peer : public IPeer {
public:
	Peer();
	~Peer() override;

	//! Listen on port and wait for the other instance. False on timeout or socket error.
	bool host(std::uint16_t port, std::chrono::milliseconds acceptTimeout = network::DEFAULT_ACCEPT_TIMEOUT);
	//! Connect to a hosting instance. False on timeout, refusal or resolve error.
	bool join(const std::string& address, std::uint16_t port,
	          std::chrono::milliseconds connectTimeout = network::DEFAULT_CONNECT_TIMEOUT);

	bool registerHandler(IPeerHandler* handler) override;
	void start() override;
	bool send(const NwEvent& event) override;
	void disconnect() override;
	bool isConnected() const override;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace checkers::gameNet
