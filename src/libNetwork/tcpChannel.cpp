#include "network/tcpChannel.hpp"
#include "Logging.hpp"

#include <asio.hpp>
#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <atomic>
#include <format>
#include <mutex>
#include <utility>

namespace checkers {
namespace network {

class TcpChannel::Implementation {
public:
	Implementation();

public:
	bool accept(std::uint16_t port, std::chrono::milliseconds timeout);
	bool connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);
	void disconnect();
	bool isConnected() const;

	bool send(const Message& message);
	std::optional<Message> read();

private:
	//! Run the io context until the pending async operation finished or timeout elapsed.
	//! Cancels the operation on timeout. Returns false if it did not complete in time.
	template <typename CancelFn>
	bool runBounded(const bool& done, std::chrono::milliseconds timeout, CancelFn cancel);

	std::optional<BasicMessageHeader> read_header();
	std::optional<Message> read_payload(std::uint32_t expected_bytes);

	asio::io_context m_ioContext{};
	asio::ip::tcp::socket m_socket;

	std::mutex m_sendMutex;
	std::atomic<bool> m_isConnected{false};
};

TcpChannel::Implementation::Implementation() : m_socket(m_ioContext) {
}

template <typename CancelFn>
bool TcpChannel::Implementation::runBounded(const bool& done, std::chrono::milliseconds timeout, CancelFn cancel) {
	m_ioContext.restart();
	m_ioContext.run_for(timeout);

	if (!done) {
		cancel();
		// Drain the cancelled handler so the context is reusable.
		m_ioContext.restart();
		m_ioContext.run();
		return false;
	}
	return true;
}

bool TcpChannel::Implementation::accept(std::uint16_t port, std::chrono::milliseconds timeout) {
	if (m_isConnected) {
		return false;
	}

	asio::error_code ec;
	asio::ip::tcp::acceptor acceptor(m_ioContext);
	const asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port);

	acceptor.open(endpoint.protocol(), ec);
	if (!ec)
		acceptor.set_option(asio::socket_base::reuse_address(true), ec);
	if (!ec)
		acceptor.bind(endpoint, ec);
	if (!ec)
		acceptor.listen(1, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpChannel] Cannot listen on port {}: {}", port, ec.message()));
		return false;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpChannel] Waiting for a peer on port {}.", port));

	bool done = false;
	asio::error_code acceptError;
	acceptor.async_accept(m_socket, [&](const asio::error_code& error) {
		acceptError = error;
		done        = true;
	});

	const bool completed = runBounded(done, timeout, [&] {
		asio::error_code ignored;
		acceptor.cancel(ignored);
	});
	acceptor.close(ec);

	if (!completed) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[TcpChannel] No peer connected within {} ms.", timeout.count()));
		return false;
	}
	if (acceptError) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpChannel] Accept failed: {}", acceptError.message()));
		return false;
	}

	m_socket.set_option(asio::ip::tcp::no_delay(true), ec);
	m_isConnected = true;
	Logger().Log(Logging::LogLevel::Info, "[TcpChannel] Peer connected.");
	return true;
}

bool TcpChannel::Implementation::connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
	if (m_isConnected) {
		return false;
	}

	asio::error_code ec;
	asio::ip::tcp::resolver resolver(m_ioContext);
	const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpChannel] Cannot resolve '{}': {}", host, ec.message()));
		return false;
	}

	bool done = false;
	asio::error_code connectError;
	asio::async_connect(m_socket, endpoints, [&](const asio::error_code& error, const asio::ip::tcp::endpoint&) {
		connectError = error;
		done         = true;
	});

	const bool completed = runBounded(done, timeout, [&] {
		asio::error_code ignored;
		m_socket.cancel(ignored);
	});

	if (!completed || connectError) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[TcpChannel] Connecting to {}:{} failed: {}", host, port,
		                                                     completed ? connectError.message() : "timed out"));
		m_socket.close(ec);
		return false;
	}

	m_socket.set_option(asio::ip::tcp::no_delay(true), ec);
	m_isConnected = true;
	Logger().Log(Logging::LogLevel::Info, std::format("[TcpChannel] Connected to {}:{}.", host, port));
	return true;
}

void TcpChannel::Implementation::disconnect() {
	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_isConnected = false;
}

bool TcpChannel::Implementation::isConnected() const {
	return m_isConnected;
}

bool TcpChannel::Implementation::send(const Message& message) {
	if (!m_isConnected) {
		return false;
	}
	if (message.size() > MAX_PAYLOAD_BYTES) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpChannel] Refusing to send {} byte frame.", message.size()));
		return false;
	}

	BasicMessageHeader header{};
	header.payload_size = to_network_u32(static_cast<std::uint32_t>(message.size()));

	std::array<asio::const_buffer, 2> buffers = {asio::buffer(&header, sizeof(header)), asio::buffer(message.data(), message.size())};

	std::lock_guard<std::mutex> lock(m_sendMutex);
	asio::error_code ec;
	asio::write(m_socket, buffers, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[TcpChannel] Send failed: {}", ec.message()));
		m_isConnected = false;
		return false;
	}
	return true;
}

std::optional<Message> TcpChannel::Implementation::read() {
	const auto header = read_header();
	if (!header) {
		return std::nullopt;
	}

	const auto payload_size = from_network_u32(header->payload_size);
	if (payload_size > MAX_PAYLOAD_BYTES) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpChannel] Peer announced oversized frame ({} bytes).", payload_size));
		m_isConnected = false;
		return std::nullopt;
	}

	return read_payload(payload_size);
}

std::optional<BasicMessageHeader> TcpChannel::Implementation::read_header() {
	BasicMessageHeader header{};
	asio::error_code ec;
	asio::read(m_socket, asio::buffer(&header, sizeof(header)), ec);
	if (ec) {
		m_isConnected = false;
		return std::nullopt;
	}
	return header;
}

std::optional<Message> TcpChannel::Implementation::read_payload(std::uint32_t expected_bytes) {
	if (expected_bytes == 0) {
		return Message{};
	}

	Message payload(expected_bytes, '\0');
	asio::error_code ec;
	asio::read(m_socket, asio::buffer(payload.data(), payload.size()), ec);
	if (ec) {
		m_isConnected = false;
		return std::nullopt;
	}
	return payload;
}

// ---------------------------------------------------------------------------------------------------------------------

TcpChannel::TcpChannel() : m_pimpl(std::make_unique<Implementation>()) {
}
TcpChannel::~TcpChannel() {
	m_pimpl->disconnect();
}

bool TcpChannel::accept(std::uint16_t port, std::chrono::milliseconds timeout) {
	return m_pimpl->accept(port, timeout);
}
bool TcpChannel::connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
	return m_pimpl->connect(host, port, timeout);
}
void TcpChannel::disconnect() {
	m_pimpl->disconnect();
}
bool TcpChannel::isConnected() const {
	return m_pimpl->isConnected();
}
bool TcpChannel::send(const Message& message) {
	return m_pimpl->send(message);
}
std::optional<Message> TcpChannel::read() {
	return m_pimpl->read();
}

} // namespace network
} // namespace checkers
