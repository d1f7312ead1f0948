#pragma once

#include "core/IGameListener.hpp"
#include "core/eventHub.hpp"
#include "core/move.hpp"
#include "core/position.hpp"
#include "data/player.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace tessera {

//! Settings of a new game.
struct GameConfig {
	unsigned boardRadius{kDefaultBoardRadius};
};

//! Persisted form of a game. Groups are derived data and rebuilt on restore.
struct GameSnapshot {
	unsigned boardRadius{kDefaultBoardRadius};
	std::vector<std::pair<Coord, Tile>> tiles;            //!< Occupied cells.
	std::array<std::vector<std::uint8_t>, 2> hands;       //!< Patterns still held, indexed by player.
	Player currentPlayer{Player::Black};
	unsigned moveId{0};
	unsigned consecutivePasses{0};
	bool active{true};
	std::optional<Player> resigned;                       //!< Player who resigned, if any.
};

//! Core game setup.
//! Synchronous: every call resolves completely before it returns and listeners are signalled on the calling thread.
class Game {
public:
	explicit Game(const GameConfig& config = {});

	//! Restore a saved game.
	//! \note Throws std::invalid_argument for tiles outside the board, empty or doubled cells, mismatched sides,
	//!       patterns placed twice or both placed and in hand, and groups without liberty.
	explicit Game(const GameSnapshot& snapshot);

	//! Place a tile. False (and no change) if the game is over, it is not the player's turn or the move is illegal.
	bool putTile(Player player, const Move& move);

	//! Pass the turn. False if the game is over or it is not the player's turn. Two passes in a row end the game.
	bool pass(Player player);

	//! Give up. False if the game is already over.
	bool resign(Player player);

	bool isActive() const;               //!< Return if the game is active or not.
	Player currentPlayer() const;        //!< Returns the currently active player.
	unsigned moveId() const;             //!< Number of accepted actions.
	const GamePosition& position() const;
	const std::vector<Move>& legalMoves() const; //!< Legal moves of the current player.

	unsigned score(Player player) const;  //!< Tiles currently controlled by player.
	std::optional<Player> winner() const; //!< Winner of a finished game. Nullopt while active or on a draw.

	GameSnapshot snapshot() const;

public:
	void subscribe(IGameListener* listener);
	void unsubscribe(IGameListener* listener);

private:
	void regenerateLegalMoves();
	bool isListedMove(const Move& move) const;

private:
	bool m_gameActive{true};
	std::optional<Player> m_resigned;

	GamePosition m_position;
	std::vector<Move> m_legalMoves; //!< Legal moves of m_position.currentPlayer.
	EventHub m_eventHub;            //!< Hub to signal updates of the game state to external components.
};

} // namespace tessera
