#pragma once

namespace tessera {

enum class Player { Black = 0, White = 1 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::White ? Player::Black : Player::White;
}

//! Array index of a player (arenas, hands).
inline constexpr unsigned toIndex(Player player) {
	return static_cast<unsigned>(player);
}

} // namespace tessera
