#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace checkers::gameNet {

// Events exchanged between the two instances. Both roles speak the same protocol.

//! Peer ends the session.
struct NwQuit {};

//! Chat line in the form "<senderName>: <text>".
struct NwChat {
	std::string line;
};

//! Peer announces its display name.
struct NwHandshake {
	std::string displayName;
};

//! A completed turn. Coordinates are in the receiver's frame.
struct NwMove {
	MoveChain segments;
};

using NwEvent = std::variant<NwQuit, NwChat, NwHandshake, NwMove>;

//! Encode an event for sending. Move coordinates are mirrored into the peer's frame (7 - x).
std::string toMessage(const NwEvent& event);

//! Classify and decode an inbound frame. Move coordinates are taken literally.
//! Returns nothing for empty or malformed frames.
std::optional<NwEvent> fromMessage(const std::string& message);

} // namespace checkers::gameNet
