#pragma once

#include "core/move.hpp"
#include "data/player.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tessera {

//! Convert a move to text: "q,r:pattern" with one '0'/'1' per side in order NE, E, SE, SW, W, NW.
std::string toNotation(const Move& move);

//! Parse the text form of a move placed by player. Nullopt if malformed or the pattern is all zero.
std::optional<Move> fromNotation(std::string_view text, Player player);

} // namespace tessera
