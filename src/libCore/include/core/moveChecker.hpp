#pragma once

#include "core/move.hpp"
#include "core/position.hpp"
#include "data/board.hpp"
#include "data/player.hpp"

#include <vector>

namespace tessera {

//! True if every side of the tile matches the facing side of its neighbor.
//! Off-board neighbors count as disconnected, empty neighbors accept anything.
bool tilesMatch(const Board& board, Coord c, Tile tile);

//! Empty cells the mover may place on: next to an opponent tile, or a liberty of an extendable friendly group.
//! Every cell of an empty board is a candidate.
std::vector<Coord> candidateCells(const GamePosition& position, Player mover);

//! True if the move leaves a structure without liberty under either controller.
bool isOscillation(const GamePosition& position, Player mover, const Move& move);

//! Full legality check: candidate cell, tile in hand, matching sides, no oscillation.
bool isLegalMove(const GamePosition& position, Player mover, const Move& move);

//! All legal moves of the mover, ordered by cell then pattern.
std::vector<Move> generateLegalMoves(const GamePosition& position, Player mover);

} // namespace tessera
