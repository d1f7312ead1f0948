#pragma once

#include "core/move.hpp"
#include "core/resolver.hpp"
#include "data/coordinate.hpp"
#include "data/player.hpp"

#include <optional>
#include <vector>

namespace tessera {

enum class GameAction { Place, Pass, Resign };

//! Change of the game caused by one accepted action.
struct GameDelta {
	unsigned moveId;                    //!< Move number after the action. Resigning does not count as a move.
	GameAction action;
	Player player;                      //!< Player who acted.
	std::optional<Move> move;           //!< Placed tile (Place only).
	std::optional<MoveOutcome> outcome; //!< Resolution of the placement (Place only).
	std::vector<Coord> flipped;         //!< Tiles that changed controller.
	Player nextPlayer;
	bool gameActive;
};

} // namespace tessera
