#include "data/hand.hpp"

namespace tessera {

static bool isPlayable(const std::uint8_t pattern) {
	return pattern != 0u && pattern <= kPatternCount;
}

Hand::Hand(const Player player) : Hand(player, true) {
}

Hand::Hand(const Player player, const bool full) : m_player(player) {
	if (full) {
		m_patterns.set();
		m_patterns.reset(0u);
	}
}

Hand Hand::empty(const Player player) {
	return Hand(player, false);
}

Player Hand::player() const {
	return m_player;
}

std::size_t Hand::size() const {
	return m_patterns.count();
}

bool Hand::contains(const std::uint8_t pattern) const {
	return isPlayable(pattern) && m_patterns.test(pattern);
}

bool Hand::add(const std::uint8_t pattern) {
	if (!isPlayable(pattern) || m_patterns.test(pattern)) {
		return false;
	}
	m_patterns.set(pattern);
	return true;
}

bool Hand::remove(const std::uint8_t pattern) {
	if (!contains(pattern)) {
		return false;
	}
	m_patterns.reset(pattern);
	return true;
}

std::vector<Tile> Hand::tiles() const {
	std::vector<Tile> result;
	result.reserve(size());
	for (unsigned p = 1u; p <= kPatternCount; ++p) {
		if (m_patterns.test(p)) {
			result.push_back(makeTile(static_cast<std::uint8_t>(p), m_player));
		}
	}
	return result;
}

} // namespace tessera
