#pragma once

#include "data/side.hpp"

namespace tessera {

//! Axial hex coordinate. Origin is the center cell of the board.
struct Coord {
	int q, r;

	bool operator==(const Coord&) const = default;
};

//! Coordinate of the adjacent cell in direction of the given side (ignores board bounds).
inline constexpr Coord step(Coord c, Side side) {
	switch (side) {
	case Side::NorthEast:
		return {c.q + 1, c.r - 1};
	case Side::East:
		return {c.q + 1, c.r};
	case Side::SouthEast:
		return {c.q, c.r + 1};
	case Side::SouthWest:
		return {c.q - 1, c.r + 1};
	case Side::West:
		return {c.q - 1, c.r};
	case Side::NorthWest:
		return {c.q, c.r - 1};
	}
	return c;
}

} // namespace tessera
