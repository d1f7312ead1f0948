#pragma once

#include "core/group.hpp"
#include "core/move.hpp"
#include "core/position.hpp"
#include "data/coordinate.hpp"
#include "data/player.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace tessera {

enum class MoveOutcome {
	Placed,       //!< Tile joined or created a group, nothing flipped.
	Captured,     //!< One or more enemy groups ran out of liberties and flipped to the mover.
	SelfCaptured, //!< The mover's structure ran out of liberties and flipped to the opponent.
	Oscillation   //!< The structure has no liberty under either controller. Never legal.
};

//! Complete outcome of a move, computed without touching the position.
struct Resolution {
	MoveOutcome outcome{MoveOutcome::Placed};
	Player controller{Player::Black};   //!< Controller of the structure holding the placed tile.
	Group result;                       //!< Final state of that structure.
	std::optional<GroupHandle> slot;    //!< Existing group whose slot receives result. Nullopt: allocate a new one.
	std::vector<GroupHandle> absorbed;  //!< Groups folded into result and removed from their arenas.
	std::vector<std::pair<GroupHandle, Group>> updated; //!< Enemy groups that only gained the placed cell as enemy adjacent.
	std::vector<std::size_t> flipped;   //!< Storage indices whose controller toggles. Holds the placed cell on self capture.

public:
	explicit Resolution(std::size_t storageSize);
};

//! Result of an applied move, for display.
struct MoveResult {
	MoveOutcome outcome;
	Coord placed;
	std::vector<Coord> flipped; //!< Tiles that changed controller (placed tile included on self capture).
	GroupHandle group;          //!< Group holding the placed tile afterwards.
};

//! Resolve merges, captures and self capture of a move on scratch copies.
//! \note Throws InternalError if the cell is not an empty board cell, the tile is not controlled by mover
//!       or the position holds a stale group handle.
Resolution planMove(const GamePosition& position, Player mover, const Move& move);

//! Apply a move certified by the legal move generator. Updates board, arenas and group index.
//! Hand and turn are left to the caller.
//! \note Throws InternalError before any mutation on oscillation, a stale handle or an exhausted arena.
MoveResult applyMove(GamePosition& position, Player mover, const Move& move);

} // namespace tessera
