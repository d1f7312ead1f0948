#pragma once

#include "core/group.hpp"
#include "core/groupArena.hpp"
#include "data/board.hpp"
#include "data/hand.hpp"
#include "data/player.hpp"

#include <array>
#include <vector>

namespace tessera {

inline constexpr unsigned kDefaultBoardRadius = 6u; //!< 127 cells, one more than both hands hold together.

//! The current game position.
//! \note Arenas and groupIndex are derived from the board. rebuildGroups recomputes them from scratch.
struct GamePosition {
	Board board;                          //!< Current board.
	std::array<GroupArena, 2> arenas;     //!< Groups per controller.
	std::vector<GroupHandle> groupIndex;  //!< Storage index -> handle of the group holding the tile. Invalid when empty.
	std::array<Hand, 2> hands;            //!< Tiles not placed yet.
	Player currentPlayer{Player::Black};  //!< Current Player.
	unsigned moveId{0};                   //!< Move number of game.
	unsigned consecutivePasses{0};        //!< Two consecutive passes end the game.

public:
	explicit GamePosition(unsigned boardRadius = kDefaultBoardRadius);

	GroupArena& arena(Player player);
	const GroupArena& arena(Player player) const;
	Hand& hand(Player player);
	const Hand& hand(Player player) const;

	GroupHandle handleAt(Coord c) const;  //!< Handle of the group at the coordinate. Invalid if empty.
	const Group* groupAt(Coord c) const;  //!< Group at the coordinate. Null if empty or the index is stale.

	void endTurn(); //!< Hand the turn to the opponent and count the move.
};

//! Discard all groups and rebuild them from the board alone.
//! The arena capacity becomes the number of groups found plus the tiles still in that player's hand.
void rebuildGroups(GamePosition& position);

} // namespace tessera
