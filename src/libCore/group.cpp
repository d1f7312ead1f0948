#include "core/group.hpp"

#include <algorithm>
#include <cassert>

namespace tessera {

Group::Group(const std::size_t storageSize) : m_tags(storageSize, Empty) {
}

std::uint8_t Group::tags(const std::size_t cell) const {
	return m_tags[cell];
}

bool Group::has(const std::size_t cell, const Tag tag) const {
	return (m_tags[cell] & tag) != 0u;
}

void Group::add(const std::size_t cell, const Tag tag) {
	if (has(cell, Member)) {
		return;
	}
	m_tags[cell] |= tag;
}

void Group::remove(const std::size_t cell, const Tag tag) {
	m_tags[cell] &= static_cast<std::uint8_t>(~tag);
}

void Group::addMember(const std::size_t cell) {
	m_tags[cell] = Member;
}

void Group::merge(const Group& other) {
	assert(m_tags.size() == other.m_tags.size());

	for (std::size_t i = 0u; i != m_tags.size(); ++i) {
		const auto merged = static_cast<std::uint8_t>(m_tags[i] | other.m_tags[i]);
		m_tags[i]         = (merged & Member) ? static_cast<std::uint8_t>(Member) : merged;
	}
}

void Group::absorbMembers(const Group& other) {
	assert(m_tags.size() == other.m_tags.size());

	for (std::size_t i = 0u; i != m_tags.size(); ++i) {
		if (other.has(i, Member)) {
			addMember(i);
		} else if (other.has(i, Liberty)) {
			add(i, Liberty);
		}
	}
}

std::size_t Group::count(const Tag tag) const {
	return static_cast<std::size_t>(std::count_if(m_tags.begin(), m_tags.end(), [tag](const std::uint8_t t) { return (t & tag) != 0u; }));
}

std::size_t Group::libertyCount() const {
	return count(Liberty);
}

std::size_t Group::memberCount() const {
	return count(Member);
}

std::vector<std::size_t> Group::cells(const Tag tag) const {
	std::vector<std::size_t> result;
	for (std::size_t i = 0u; i != m_tags.size(); ++i) {
		if (has(i, tag)) {
			result.push_back(i);
		}
	}
	return result;
}

bool Group::extendable() const {
	return m_extendable;
}

void Group::updateExtendable() {
	m_extendable = count(EnemyAdjacent) == 0u;
}

} // namespace tessera
