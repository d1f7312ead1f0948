#pragma once

#include <array>

namespace tessera {

//! The six sides of a hex cell. The numeric value is the connection bit of a tile.
enum class Side { NorthEast = 0, East = 1, SouthEast = 2, SouthWest = 3, West = 4, NorthWest = 5 };

inline constexpr std::array<Side, 6> kSides{Side::NorthEast, Side::East, Side::SouthEast, Side::SouthWest, Side::West, Side::NorthWest};

//! Side facing the given one from the neighboring cell.
inline constexpr Side opposite(Side side) {
	return static_cast<Side>((static_cast<unsigned>(side) + 3u) % 6u);
}

} // namespace tessera
