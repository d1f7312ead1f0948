#pragma once

#include "data/player.hpp"

#include <cstdint>
#include <vector>

namespace tessera {

//! Reference to a group slot in the arena of its owner.
//! \note The default value is invalid and ownerless, so "no group" matches the zero value of empty cells.
struct GroupHandle {
	std::uint16_t index{0u};
	Player owner{Player::Black};
	bool valid{false};

	bool operator==(const GroupHandle&) const = default;
};

//! Connected set of same-controller tiles, stored as one tag per board storage slot.
class Group {
public:
	//! Cell tags. Stored as bit flags so merging two groups is a plain OR.
	enum Tag : std::uint8_t {
		Empty         = 0u,
		Liberty       = 1u << 0u, //!< Empty cell reachable through a connected side of a member.
		EnemyAdjacent = 1u << 1u, //!< Cell of the other controller reachable through a connected side of a member.
		Member        = 1u << 2u  //!< Tile of this group.
	};

public:
	explicit Group(std::size_t storageSize);

	std::uint8_t tags(std::size_t cell) const;
	bool has(std::size_t cell, Tag tag) const;

	void add(std::size_t cell, Tag tag);    //!< Add a tag. Ignored on member cells.
	void remove(std::size_t cell, Tag tag); //!< Drop a tag.
	void addMember(std::size_t cell);       //!< Make the cell a member. Member replaces any other tag.

	//! Union with another group of the same controller.
	void merge(const Group& other);

	//! Take over the members and liberties of a group changing sides.
	//! Its enemy adjacent cells are not copied: they belong to groups that have to be merged separately.
	void absorbMembers(const Group& other);

	std::size_t count(Tag tag) const;
	std::size_t libertyCount() const;
	std::size_t memberCount() const;
	std::vector<std::size_t> cells(Tag tag) const; //!< Storage indices carrying the tag, ascending.

	bool extendable() const;  //!< True if the group touches no enemy tile.
	void updateExtendable();  //!< Recompute the extendable flag from the tags.

	bool operator==(const Group&) const = default;

private:
	std::vector<std::uint8_t> m_tags{}; //!< Tag bits per storage slot.
	bool m_extendable{true};
};

} // namespace tessera
