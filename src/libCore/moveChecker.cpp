#include "core/moveChecker.hpp"

#include "core/resolver.hpp"

#include <algorithm>

namespace tessera {

bool tilesMatch(const Board& board, const Coord c, const Tile tile) {
	for (const auto side: kSides) {
		const bool connected = isConnected(tile, side);
		const auto n         = board.neighbor(c, side);
		if (!n) {
			if (connected) {
				return false;
			}
			continue;
		}

		const auto nTile = board.get(*n);
		if (!isEmpty(nTile) && isConnected(nTile, opposite(side)) != connected) {
			return false;
		}
	}
	return true;
}

//! True if the empty cell c is a liberty of an extendable group of player.
static bool isExtendableLiberty(const GamePosition& position, const Coord c, const Player player) {
	const auto& board = position.board;
	const auto cell   = board.index(c);

	for (const auto side: kSides) {
		const auto n = board.neighbor(c, side);
		if (!n) {
			continue;
		}
		const auto nTile = board.get(*n);
		if (isEmpty(nTile) || controller(nTile) != player || !isConnected(nTile, opposite(side))) {
			continue;
		}

		const auto* group = position.groupAt(*n);
		if (group && group->extendable() && group->has(cell, Group::Liberty)) {
			return true;
		}
	}
	return false;
}

static bool touchesPlayer(const Board& board, const Coord c, const Player player) {
	for (const auto side: kSides) {
		const auto n = board.neighbor(c, side);
		if (n && !board.isEmpty(*n) && controller(board.get(*n)) == player) {
			return true;
		}
	}
	return false;
}

std::vector<Coord> candidateCells(const GamePosition& position, const Player mover) {
	const auto& board = position.board;
	const bool opening = board.tileCount() == 0u;

	std::vector<Coord> result;
	for (const auto c: board.cells()) {
		if (!board.isEmpty(c)) {
			continue;
		}
		if (opening || touchesPlayer(board, c, opponent(mover)) || isExtendableLiberty(position, c, mover)) {
			result.push_back(c);
		}
	}
	return result;
}

bool isOscillation(const GamePosition& position, const Player mover, const Move& move) {
	return planMove(position, mover, move).outcome == MoveOutcome::Oscillation;
}

bool isLegalMove(const GamePosition& position, const Player mover, const Move& move) {
	const auto& board = position.board;
	if (!board.contains(move.coord) || !board.isEmpty(move.coord)) {
		return false;
	}
	if (isEmpty(move.tile) || owner(move.tile) != mover || controller(move.tile) != mover || !position.hand(mover).contains(pattern(move.tile))) {
		return false;
	}

	const auto candidates = candidateCells(position, mover);
	if (std::find(candidates.begin(), candidates.end(), move.coord) == candidates.end()) {
		return false;
	}

	return tilesMatch(board, move.coord, move.tile) && !isOscillation(position, mover, move);
}

std::vector<Move> generateLegalMoves(const GamePosition& position, const Player mover) {
	const auto tiles = position.hand(mover).tiles();

	std::vector<Move> result;
	for (const auto c: candidateCells(position, mover)) {
		for (const auto tile: tiles) {
			const Move move{c, tile};
			if (tilesMatch(position.board, c, tile) && !isOscillation(position, mover, move)) {
				result.push_back(move);
			}
		}
	}
	return result;
}

} // namespace tessera
