#pragma once

#include "data/player.hpp"
#include "data/tile.hpp"

#include <bitset>
#include <vector>

namespace tessera {

//! The tiles a player has not placed yet. One tile per connection pattern.
class Hand {
public:
	//! Full hand holding every playable pattern.
	explicit Hand(Player player);

	//! Empty hand. Use add to fill it (restoring snapshots, tests).
	static Hand empty(Player player);

	Player player() const;
	std::size_t size() const;
	bool contains(std::uint8_t pattern) const;

	bool add(std::uint8_t pattern);    //!< Put a pattern back. False if already held or not playable.
	bool remove(std::uint8_t pattern); //!< Take a pattern out. False if not held.

	//! Tiles still in hand, owned and controlled by the hand's player, in ascending pattern order.
	std::vector<Tile> tiles() const;

private:
	Hand(Player player, bool full);

private:
	Player m_player;
	std::bitset<kPatternCount + 1u> m_patterns{}; //!< Bit i set if pattern i is held. Bit 0 never set.
};

} // namespace tessera
