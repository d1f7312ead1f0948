#pragma once

#include "data/coordinate.hpp"
#include "data/tile.hpp"

namespace tessera {

//! Placement of a tile taken from the mover's hand.
struct Move {
	Coord coord;
	Tile tile;

	bool operator==(const Move&) const = default;
};

} // namespace tessera
