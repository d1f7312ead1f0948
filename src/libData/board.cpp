#include "data/board.hpp"

#include <algorithm>
#include <cassert>
#include <cstdlib>

namespace tessera {

Board::Board(const unsigned radius) : m_radius(radius), m_width(2u * radius + 1u), m_tiles(m_width * m_width, kNoTile) {
	const int r = static_cast<int>(radius);
	for (int row = -r; row <= r; ++row) {
		for (int col = -r; col <= r; ++col) {
			const Coord c{col, row};
			if (contains(c)) {
				m_cells.push_back(c);
			}
		}
	}
}

unsigned Board::radius() const {
	return m_radius;
}

std::size_t Board::storageSize() const {
	return m_tiles.size();
}

std::size_t Board::cellCount() const {
	return m_cells.size();
}

const std::vector<Coord>& Board::cells() const {
	return m_cells;
}

bool Board::contains(const Coord c) const {
	const int r = static_cast<int>(m_radius);
	return std::abs(c.q) <= r && std::abs(c.r) <= r && std::abs(c.q + c.r) <= r;
}

std::size_t Board::index(const Coord c) const {
	assert(contains(c)); // Callers check contains or use neighbor().

	const int r = static_cast<int>(m_radius);
	return static_cast<std::size_t>(c.r + r) * m_width + static_cast<std::size_t>(c.q + r);
}

Coord Board::coordAt(const std::size_t index) const {
	assert(index < m_tiles.size());

	const int r = static_cast<int>(m_radius);
	return {static_cast<int>(index % m_width) - r, static_cast<int>(index / m_width) - r};
}

std::optional<Coord> Board::neighbor(const Coord c, const Side side) const {
	const auto n = step(c, side);
	if (!contains(n)) {
		return std::nullopt;
	}
	return n;
}

Tile Board::get(const Coord c) const {
	return m_tiles[index(c)];
}

void Board::set(const Coord c, const Tile tile) {
	m_tiles[index(c)] = tile;
}

bool Board::isEmpty(const Coord c) const {
	return get(c) == kNoTile;
}

std::size_t Board::tileCount() const {
	return static_cast<std::size_t>(std::count_if(m_tiles.begin(), m_tiles.end(), [](const Tile t) { return t != kNoTile; }));
}

} // namespace tessera
