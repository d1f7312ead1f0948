#pragma once

#include "data/player.hpp"
#include "data/side.hpp"

#include <bit>
#include <cstdint>

namespace tessera {

//! A tile packed into one byte.
//! Bits 0-5: connection per side, bit 6: owner (who placed it), bit 7: controller (who holds it now).
//! \note Zero is the "no tile" value. The fully disconnected pattern is never played, so zero is never a real tile.
using Tile = std::uint8_t;

inline constexpr Tile kNoTile          = 0u;
inline constexpr Tile kConnectionMask  = 0x3Fu;
inline constexpr Tile kOwnerBit        = 0x40u;
inline constexpr Tile kControllerBit   = 0x80u;
inline constexpr unsigned kPatternCount = 63u; //!< Playable connection patterns (1..63).

//! Build a tile from a connection pattern placed (and controlled) by player.
inline constexpr Tile makeTile(std::uint8_t pattern, Player player) {
	const Tile playerBits = player == Player::White ? (kOwnerBit | kControllerBit) : 0u;
	return static_cast<Tile>((pattern & kConnectionMask) | playerBits);
}

inline constexpr bool isEmpty(Tile tile) {
	return tile == kNoTile;
}

inline constexpr std::uint8_t pattern(Tile tile) {
	return static_cast<std::uint8_t>(tile & kConnectionMask);
}

inline constexpr bool isConnected(Tile tile, Side side) {
	return (tile >> static_cast<unsigned>(side)) & 1u;
}

inline constexpr unsigned connectionCount(Tile tile) {
	return static_cast<unsigned>(std::popcount(static_cast<unsigned>(pattern(tile))));
}

inline constexpr Player owner(Tile tile) {
	return (tile & kOwnerBit) ? Player::White : Player::Black;
}

inline constexpr Player controller(Tile tile) {
	return (tile & kControllerBit) ? Player::White : Player::Black;
}

//! Toggle the controller. Owner and connections are kept.
inline constexpr Tile flipController(Tile tile) {
	return static_cast<Tile>(tile ^ kControllerBit);
}

} // namespace tessera
