#include "core/game.hpp"

#include "Logging.hpp"
#include "core/moveChecker.hpp"
#include "core/notation.hpp"
#include "core/resolver.hpp"

#include <algorithm>
#include <cassert>
#include <format>
#include <stdexcept>

namespace tessera {

Game::Game(const GameConfig& config) : m_position{config.boardRadius} {
	regenerateLegalMoves();
}

Game::Game(const GameSnapshot& snapshot)
    : m_gameActive{snapshot.active}, m_resigned{snapshot.resigned}, m_position{snapshot.boardRadius} {
	auto& board = m_position.board;
	for (const auto& [c, tile]: snapshot.tiles) {
		if (!board.contains(c) || isEmpty(tile)) {
			throw std::invalid_argument(std::format("Snapshot tile {:#04x} at ({}, {}) is not placeable.", tile, c.q, c.r));
		}
		if (!board.isEmpty(c)) {
			throw std::invalid_argument(std::format("Snapshot holds two tiles at ({}, {}).", c.q, c.r));
		}
		board.set(c, tile);
	}

	// Patterns on the board, per owner. Each pattern exists once per player.
	std::array<Hand, 2> placed{Hand::empty(Player::Black), Hand::empty(Player::White)};
	for (const auto& [c, tile]: snapshot.tiles) {
		if (!tilesMatch(board, c, tile)) {
			throw std::invalid_argument(std::format("Snapshot tile at ({}, {}) does not match its neighbors.", c.q, c.r));
		}
		if (!placed[toIndex(owner(tile))].add(pattern(tile))) {
			throw std::invalid_argument(std::format("Snapshot places pattern {} of player {} twice.", pattern(tile), toIndex(owner(tile))));
		}
	}

	for (const auto player: {Player::Black, Player::White}) {
		auto& hand = m_position.hand(player);
		hand       = Hand::empty(player);
		for (const auto p: snapshot.hands[toIndex(player)]) {
			if (!hand.add(p)) {
				throw std::invalid_argument(std::format("Snapshot hand of player {} holds invalid pattern {}.", toIndex(player), p));
			}
			if (placed[toIndex(player)].contains(p)) {
				throw std::invalid_argument(std::format("Snapshot pattern {} of player {} is both placed and in hand.", p, toIndex(player)));
			}
		}
	}

	m_position.currentPlayer     = snapshot.currentPlayer;
	m_position.moveId            = snapshot.moveId;
	m_position.consecutivePasses = snapshot.consecutivePasses;

	rebuildGroups(m_position);
	for (const auto player: {Player::Black, Player::White}) {
		const auto& arena = m_position.arena(player);
		for (const auto handle: arena.liveHandles()) {
			if (arena.get(handle)->libertyCount() == 0u) {
				throw std::invalid_argument(std::format("Snapshot holds a group of player {} without liberty.", toIndex(player)));
			}
		}
	}

	regenerateLegalMoves();
}

bool Game::putTile(const Player player, const Move& move) {
	auto logger = Logger();
	if (!m_gameActive) {
		logger.Log(Logging::LogLevel::Warning, "[Game] Rejecting tile: game is not active.");
		return false;
	}
	if (player != m_position.currentPlayer) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Rejecting tile from player {}: not their turn.", toIndex(player)));
		return false;
	}
	if (!isListedMove(move)) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Rejecting illegal move {} from player {}.", toNotation(move), toIndex(player)));
		return false;
	}

	const auto result = applyMove(m_position, player, move);

	[[maybe_unused]] const bool removed = m_position.hand(player).remove(pattern(move.tile));
	assert(removed); // Legal moves only list tiles in hand.

	m_position.consecutivePasses = 0u;
	m_position.endTurn();
	regenerateLegalMoves();

	logger.Log(Logging::LogLevel::Info, std::format("[Game] Move {}: player {} placed {} ({} flipped).", m_position.moveId, toIndex(player),
	                                                toNotation(move), result.flipped.size()));

	m_eventHub.signalDelta(GameDelta{
	        .moveId     = m_position.moveId,
	        .action     = GameAction::Place,
	        .player     = player,
	        .move       = move,
	        .outcome    = result.outcome,
	        .flipped    = result.flipped,
	        .nextPlayer = m_position.currentPlayer,
	        .gameActive = m_gameActive,
	});
	return true;
}

bool Game::pass(const Player player) {
	auto logger = Logger();
	if (!m_gameActive) {
		logger.Log(Logging::LogLevel::Warning, "[Game] Rejecting pass: game is not active.");
		return false;
	}
	if (player != m_position.currentPlayer) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Rejecting pass from player {}: not their turn.", toIndex(player)));
		return false;
	}

	++m_position.consecutivePasses;
	if (m_position.consecutivePasses == 2u) {
		m_gameActive = false;
	}
	m_position.endTurn();
	regenerateLegalMoves();

	logger.Log(Logging::LogLevel::Info, std::format("[Game] Move {}: player {} passed.", m_position.moveId, toIndex(player)));

	m_eventHub.signalDelta(GameDelta{
	        .moveId     = m_position.moveId,
	        .action     = GameAction::Pass,
	        .player     = player,
	        .move       = std::nullopt,
	        .outcome    = std::nullopt,
	        .flipped    = {},
	        .nextPlayer = m_position.currentPlayer,
	        .gameActive = m_gameActive,
	});
	return true;
}

bool Game::resign(const Player player) {
	if (!m_gameActive) {
		Logger().Log(Logging::LogLevel::Warning, "[Game] Rejecting resign: game already inactive.");
		return false;
	}

	m_gameActive = false;
	m_resigned   = player;
	m_legalMoves.clear();

	Logger().Log(Logging::LogLevel::Info, std::format("[Game] Player {} resigned.", toIndex(player)));

	m_eventHub.signalDelta(GameDelta{
	        .moveId     = m_position.moveId,
	        .action     = GameAction::Resign,
	        .player     = player,
	        .move       = std::nullopt,
	        .outcome    = std::nullopt,
	        .flipped    = {},
	        .nextPlayer = opponent(player),
	        .gameActive = m_gameActive,
	});
	return true;
}

bool Game::isActive() const {
	return m_gameActive;
}

Player Game::currentPlayer() const {
	return m_position.currentPlayer;
}

unsigned Game::moveId() const {
	return m_position.moveId;
}

const GamePosition& Game::position() const {
	return m_position;
}

const std::vector<Move>& Game::legalMoves() const {
	return m_legalMoves;
}

unsigned Game::score(const Player player) const {
	const auto& board = m_position.board;
	return static_cast<unsigned>(std::count_if(board.cells().begin(), board.cells().end(), [&](const Coord c) {
		return !board.isEmpty(c) && controller(board.get(c)) == player;
	}));
}

std::optional<Player> Game::winner() const {
	if (m_gameActive) {
		return std::nullopt;
	}
	if (m_resigned) {
		return opponent(*m_resigned);
	}

	const auto black = score(Player::Black);
	const auto white = score(Player::White);
	if (black == white) {
		return std::nullopt;
	}
	return black > white ? Player::Black : Player::White;
}

GameSnapshot Game::snapshot() const {
	GameSnapshot snapshot;
	snapshot.boardRadius = m_position.board.radius();
	for (const auto c: m_position.board.cells()) {
		if (!m_position.board.isEmpty(c)) {
			snapshot.tiles.emplace_back(c, m_position.board.get(c));
		}
	}
	for (const auto player: {Player::Black, Player::White}) {
		for (const auto tile: m_position.hand(player).tiles()) {
			snapshot.hands[toIndex(player)].push_back(pattern(tile));
		}
	}
	snapshot.currentPlayer     = m_position.currentPlayer;
	snapshot.moveId            = m_position.moveId;
	snapshot.consecutivePasses = m_position.consecutivePasses;
	snapshot.active            = m_gameActive;
	snapshot.resigned          = m_resigned;
	return snapshot;
}

void Game::subscribe(IGameListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribe(IGameListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::regenerateLegalMoves() {
	if (!m_gameActive) {
		m_legalMoves.clear();
		return;
	}
	m_legalMoves = generateLegalMoves(m_position, m_position.currentPlayer);
}

bool Game::isListedMove(const Move& move) const {
	return std::find(m_legalMoves.begin(), m_legalMoves.end(), move) != m_legalMoves.end();
}

} // namespace tessera
