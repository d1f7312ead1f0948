#include "core/groupArena.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>

namespace tessera {

GroupArena::GroupArena(const Player owner, const std::size_t capacity) : m_owner(owner), m_capacity(capacity) {
	m_slots.reserve(capacity);
}

GroupHandle GroupArena::insert(Group group) {
	if (full()) {
		raiseInternalError(std::format("[GroupArena] Arena of player {} exhausted at capacity {}.", toIndex(m_owner), m_capacity));
	}

	group.updateExtendable();
	m_slots.push_back({std::move(group), true});
	return {static_cast<std::uint16_t>(m_slots.size() - 1u), m_owner, true};
}

Group* GroupArena::get(const GroupHandle handle) {
	if (!handle.valid || handle.owner != m_owner || handle.index >= m_slots.size()) {
		return nullptr;
	}

	auto& slot = m_slots[handle.index];
	return slot.alive ? &slot.group : nullptr;
}

const Group* GroupArena::get(const GroupHandle handle) const {
	return const_cast<GroupArena*>(this)->get(handle);
}

std::optional<Group> GroupArena::remove(const GroupHandle handle) {
	auto* group = get(handle);
	if (!group) {
		return std::nullopt;
	}

	m_slots[handle.index].alive = false;
	return std::move(*group);
}

std::vector<GroupHandle> GroupArena::liveHandles() const {
	std::vector<GroupHandle> result;
	for (std::size_t i = 0u; i != m_slots.size(); ++i) {
		if (m_slots[i].alive) {
			result.push_back({static_cast<std::uint16_t>(i), m_owner, true});
		}
	}
	return result;
}

std::size_t GroupArena::liveCount() const {
	return static_cast<std::size_t>(std::count_if(m_slots.begin(), m_slots.end(), [](const Slot& s) { return s.alive; }));
}

Player GroupArena::owner() const {
	return m_owner;
}

std::size_t GroupArena::capacity() const {
	return m_capacity;
}

bool GroupArena::full() const {
	return m_slots.size() >= m_capacity;
}

} // namespace tessera
