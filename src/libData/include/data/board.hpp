#pragma once

#include "data/coordinate.hpp"
#include "data/side.hpp"
#include "data/tile.hpp"

#include <optional>
#include <vector>

namespace tessera {

//! A hexagon shaped board of cells addressed by axial coordinates.
//! A board of radius R holds every cell with max(|q|, |r|, |q+r|) <= R.
//! \note Storage is a (2R+1)^2 square. Slots outside the hexagon exist but are never used.
class Board {
public:
	explicit Board(unsigned radius);

	unsigned radius() const;           //!< Distance from the center to the border cells.
	std::size_t storageSize() const;   //!< Number of storage slots. Size of any per-cell array.
	std::size_t cellCount() const;     //!< Number of cells inside the hexagon.
	const std::vector<Coord>& cells() const; //!< All coordinates inside the hexagon, in storage order.

	bool contains(Coord c) const;        //!< True if the coordinate lies inside the hexagon.
	std::size_t index(Coord c) const;    //!< Storage index of a coordinate on the board.
	Coord coordAt(std::size_t index) const; //!< Coordinate of a storage index.

	//! Cell adjacent to c through side. Nullopt at the border.
	std::optional<Coord> neighbor(Coord c, Side side) const;

	Tile get(Coord c) const;          //!< Tile at the given coordinate. kNoTile when empty.
	void set(Coord c, Tile tile);     //!< Overwrite the cell. kNoTile clears it.
	bool isEmpty(Coord c) const;      //!< True if no tile lies at the given coordinate.
	std::size_t tileCount() const;    //!< Number of occupied cells.

private:
	unsigned m_radius{0u};          //!< Board radius.
	std::size_t m_width{0u};        //!< Side length of the storage square (2R+1).
	std::vector<Tile> m_tiles{};    //!< Board data.
	std::vector<Coord> m_cells{};   //!< Cached coordinates inside the hexagon.
};

} // namespace tessera
