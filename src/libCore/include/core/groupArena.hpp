#pragma once

#include "core/group.hpp"
#include "data/player.hpp"

#include <optional>
#include <vector>

namespace tessera {

//! Fixed capacity store for the groups of one player.
//! Slots are handed out by a monotonic cursor and never reused. A player cannot create more groups than
//! tiles it places, so a capacity equal to the hand size is never exceeded during a game.
class GroupArena {
public:
	GroupArena(Player owner, std::size_t capacity);

	//! Store a new group.
	//! \note Throws InternalError when the capacity is exhausted.
	GroupHandle insert(Group group);

	//! Group behind the handle. Null if the handle is invalid, belongs to the other player or the slot is dead.
	Group* get(GroupHandle handle);
	const Group* get(GroupHandle handle) const;

	//! Mark the slot dead and return the final group state. Nullopt if get() would return null.
	std::optional<Group> remove(GroupHandle handle);

	std::vector<GroupHandle> liveHandles() const; //!< Handles of all live groups in slot order.
	std::size_t liveCount() const;                //!< Number of live groups.

	Player owner() const;
	std::size_t capacity() const;
	bool full() const; //!< True if insert would fail.

private:
	//! One arena entry.
	struct Slot {
		Group group;
		bool alive;
	};

private:
	Player m_owner;
	std::size_t m_capacity;
	std::vector<Slot> m_slots{}; //!< Allocated slots. Size is the allocation cursor.
};

} // namespace tessera
