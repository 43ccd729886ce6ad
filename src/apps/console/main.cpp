#include "consoleView.hpp"

#include "app/sessionConfig.hpp"
#include "app/sessionManager.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using namespace checkers;

static void printUsage() {
	std::cerr << "Usage: checkers host [port] [name]\n"
	             "       checkers join <address> [port] [name]\n";
}

static std::optional<app::SessionConfig> parseArguments(int argc, char** argv) {
	if (argc < 2) {
		return {};
	}

	app::SessionConfig config;
	const std::string mode = argv[1];
	int next               = 2;
	if (mode == "host") {
		config.role = app::Role::Host;
	} else if (mode == "join" && argc >= 3) {
		config.role        = app::Role::Client;
		config.hostAddress = argv[next++];
	} else {
		return {};
	}

	if (argc > next) {
		config.port = app::parsePort(config.role, argv[next++]);
	}
	if (argc > next) {
		config.displayName = argv[next++];
	}
	return app::normalized(config);
}

int main(int argc, char** argv) {
	const auto config = parseArguments(argc, argv);
	if (!config) {
		printUsage();
		return 1;
	}

	if (config->role == app::Role::Host) {
		std::cout << "Waiting for a player on port " << config->port << "..." << std::endl;
	} else {
		std::cout << "Connecting to " << config->hostAddress << ":" << config->port << "..." << std::endl;
	}

	auto peer = app::openPeer(*config);
	if (!peer) {
		std::cerr << "No connection could be established." << std::endl;
		return 1;
	}

	auto session = std::make_unique<app::SessionManager>(config->role, config->displayName, std::move(peer));
	console::ConsoleView view(*session, std::cout);
	session->subscribe(&view, app::AS_All);
	session->start();

	std::cout << "Commands: <row> <col> | chat <text> | score | quit" << std::endl;

	std::string line;
	while (!view.sessionOver() && std::getline(std::cin, line)) {
		if (view.sessionOver()) {
			break;
		}
		if (line == "quit" || line == "exit") {
			break;
		}
		if (line == "score") {
			view.printScore();
			continue;
		}
		if (line.rfind("chat ", 0) == 0) {
			session->chat(line.substr(5));
			continue;
		}

		std::istringstream stream(line);
		int row{};
		int col{};
		if (stream >> row >> col) {
			session->applyLocalSelection(row, col);
		} else if (!line.empty()) {
			std::cout << "Unknown command." << std::endl;
		}
	}

	// Stops the read thread before the view goes away.
	session->quitSession();
	session.reset();
	return 0;
}
