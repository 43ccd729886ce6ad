#include "gameNet/nwEvents.hpp"

#include <array>
#include <charconv>
#include <format>
#include <string_view>
#include <vector>

namespace checkers::gameNet {

static constexpr std::string_view QUIT          = "%";
static constexpr char CHAT_PREFIX               = '*';
static constexpr char HANDSHAKE_PREFIX          = '@';
static constexpr char SEGMENT_SEPARATOR         = '+';
static constexpr char FIELD_SEPARATOR           = ',';
static constexpr std::size_t SINGLE_SEGMENT_MAX = 8; //!< Longer move frames are chains.

static int mirror(int value) {
	return BOARD_SIZE - 1 - value;
}

static std::string toMessage(const NwQuit&) {
	return std::string{QUIT};
}
static std::string toMessage(const NwChat& e) {
	return std::format("{}{}", CHAT_PREFIX, e.line);
}
static std::string toMessage(const NwHandshake& e) {
	return std::format("{}{}", HANDSHAKE_PREFIX, e.displayName);
}
static std::string toMessage(const NwMove& e) {
	std::string out;
	for (std::size_t i = 0; i < e.segments.size(); ++i) {
		if (i)
			out.push_back(SEGMENT_SEPARATOR);

		const auto& s = e.segments[i];
		out += std::format("{},{},{},{}", mirror(s.from.row), mirror(s.from.col), mirror(s.to.row), mirror(s.to.col));
	}
	return out;
}

std::string toMessage(const NwEvent& event) {
	return std::visit([&](auto&& ev) { return toMessage(ev); }, event);
}

//! Parse "r0,c0,r1,c1". Every field must be a full integer in board range.
static std::optional<MoveSegment> parseSegment(std::string_view text) {
	std::array<int, 4> values{};
	std::size_t idx = 0;

	while (true) {
		const auto sep   = text.find(FIELD_SEPARATOR);
		const auto field = text.substr(0, sep);
		if (idx >= values.size() || field.empty()) {
			return {};
		}

		int value{};
		const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
		if (ec != std::errc{} || ptr != field.data() + field.size() || value < 0 || value >= BOARD_SIZE) {
			return {};
		}
		values[idx++] = value;

		if (sep == std::string_view::npos)
			break;
		text.remove_prefix(sep + 1);
	}

	if (idx != values.size()) {
		return {};
	}
	return MoveSegment{.from = {values[0], values[1]}, .to = {values[2], values[3]}};
}

static std::optional<NwEvent> parseMove(std::string_view text) {
	MoveChain chain;

	if (text.size() <= SINGLE_SEGMENT_MAX) {
		const auto segment = parseSegment(text);
		if (!segment) {
			return {};
		}
		chain.push_back(*segment);
		return NwMove{.segments = std::move(chain)};
	}

	while (true) {
		const auto sep     = text.find(SEGMENT_SEPARATOR);
		const auto segment = parseSegment(text.substr(0, sep));
		if (!segment) {
			return {};
		}
		chain.push_back(*segment);

		if (sep == std::string_view::npos)
			break;
		text.remove_prefix(sep + 1);
	}

	return NwMove{.segments = std::move(chain)};
}

std::optional<NwEvent> fromMessage(const std::string& message) {
	if (message.empty()) {
		return {};
	}

	if (message == QUIT) {
		return NwQuit{};
	}
	if (message.front() == CHAT_PREFIX) {
		return NwChat{.line = message.substr(1)};
	}
	if (message.front() == HANDSHAKE_PREFIX) {
		return NwHandshake{.displayName = message.substr(1)};
	}

	return parseMove(message);
}

} // namespace checkers::gameNet
