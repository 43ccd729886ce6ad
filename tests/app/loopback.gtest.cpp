#include "app/sessionConfig.hpp"
#include "app/sessionManager.hpp"
#include "fakePeer.hpp"

#include <gtest/gtest.h>

#include <future>
#include <thread>

namespace checkers::gtest {

using namespace std::chrono_literals;

// Two sessions talking over a real loopback connection.
TEST(Loopback, MoveChatAndQuit) {
	constexpr std::uint16_t port = 30581;

	app::SessionConfig hostConfig;
	hostConfig.role          = app::Role::Host;
	hostConfig.displayName   = "Alice";
	hostConfig.port          = port;
	hostConfig.acceptTimeout = 3s;

	app::SessionConfig clientConfig;
	clientConfig.role           = app::Role::Client;
	clientConfig.displayName    = "Bob";
	clientConfig.port           = port;
	clientConfig.connectTimeout = 500ms;

	auto hostPeerFuture = std::async(std::launch::async, [&] { return app::openPeer(hostConfig); });

	std::unique_ptr<gameNet::IPeer> clientPeer;
	while (!clientPeer && hostPeerFuture.wait_for(20ms) != std::future_status::ready) {
		clientPeer = app::openPeer(clientConfig);
	}
	auto hostPeer = hostPeerFuture.get();
	ASSERT_TRUE(hostPeer);
	ASSERT_TRUE(clientPeer);

	RecordingListener hostListener;
	RecordingListener clientListener;
	app::SessionManager host(app::Role::Host, hostConfig.displayName, std::move(hostPeer));
	app::SessionManager client(app::Role::Client, clientConfig.displayName, std::move(clientPeer));
	host.subscribe(&hostListener, app::AS_All);
	client.subscribe(&clientListener, app::AS_All);

	host.start();
	client.start();

	// Handshakes: start signals once, the peer's name once more.
	ASSERT_TRUE(hostListener.waitFor(app::AS_ScoreChange, 2));
	ASSERT_TRUE(clientListener.waitFor(app::AS_ScoreChange, 2));
	EXPECT_EQ(host.clientName(), "Bob");
	EXPECT_EQ(client.hostName(), "Alice");

	host.applyLocalSelection(5, 2);
	host.applyLocalSelection(4, 3);
	EXPECT_FALSE(host.isLocalTurn());

	ASSERT_TRUE(clientListener.waitFor(app::AS_BoardChange, 2));
	EXPECT_TRUE(client.isLocalTurn());
	EXPECT_TRUE(client.board().occupied({3, 4}));

	client.chat("good luck");
	ASSERT_TRUE(hostListener.waitFor(app::AS_ChatChange, 2));
	EXPECT_EQ(host.chatSnapshot(0).entries, (std::vector<std::string>{"Bob: good luck"}));

	client.quitSession();
	EXPECT_EQ(clientListener.count(app::AS_ReturnToMenu), 1);
	ASSERT_TRUE(hostListener.waitFor(app::AS_ReturnToMenu, 1));
	EXPECT_EQ(host.status(), app::GameStatus::Idle);

	client.unsubscribe(&clientListener);
	host.unsubscribe(&hostListener);
}

} // namespace checkers::gtest
