#include "core/notation.hpp"

#include <charconv>
#include <format>

namespace tessera {

static bool parseInt(const std::string_view text, int& out) {
	if (text.empty()) {
		return false;
	}
	const auto* end  = text.data() + text.size();
	const auto [ptr, ec] = std::from_chars(text.data(), end, out);
	return ec == std::errc{} && ptr == end;
}

std::string toNotation(const Move& move) {
	std::string sides;
	for (const auto side: kSides) {
		sides += isConnected(move.tile, side) ? '1' : '0';
	}
	return std::format("{},{}:{}", move.coord.q, move.coord.r, sides);
}

std::optional<Move> fromNotation(const std::string_view text, const Player player) {
	const auto comma = text.find(',');
	const auto colon = text.find(':');
	if (comma == std::string_view::npos || colon == std::string_view::npos || colon < comma) {
		return std::nullopt;
	}

	Coord c{};
	if (!parseInt(text.substr(0u, comma), c.q) || !parseInt(text.substr(comma + 1u, colon - comma - 1u), c.r)) {
		return std::nullopt;
	}

	const auto sides = text.substr(colon + 1u);
	if (sides.size() != kSides.size()) {
		return std::nullopt;
	}

	std::uint8_t bits = 0u;
	for (std::size_t i = 0u; i != sides.size(); ++i) {
		if (sides[i] == '1') {
			bits |= static_cast<std::uint8_t>(1u << static_cast<unsigned>(kSides[i]));
		} else if (sides[i] != '0') {
			return std::nullopt;
		}
	}
	if (bits == 0u) {
		return std::nullopt;
	}

	return Move{c, makeTile(bits, player)};
}

} // namespace tessera
