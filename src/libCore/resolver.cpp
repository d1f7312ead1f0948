#include "core/resolver.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>

namespace tessera {

Resolution::Resolution(const std::size_t storageSize) : result{storageSize} {
}

static bool containsHandle(const std::vector<GroupHandle>& handles, const GroupHandle handle) {
	return std::find(handles.begin(), handles.end(), handle) != handles.end();
}

static void addUnique(std::vector<GroupHandle>& handles, const GroupHandle handle) {
	if (!containsHandle(handles, handle)) {
		handles.push_back(handle);
	}
}

//! Dereference a handle that must point at a live group of the expected controller.
static const Group& liveGroup(const GamePosition& position, const GroupHandle handle, const Player expected) {
	const auto* group = handle.owner == expected ? position.arena(expected).get(handle) : nullptr;
	if (!group) {
		raiseInternalError(std::format("[Resolver] Stale group handle (index {}, owner {}, valid {}) where a group of player {} was expected.",
		                               handle.index, toIndex(handle.owner), handle.valid, toIndex(expected)));
	}
	return *group;
}

Resolution planMove(const GamePosition& position, const Player mover, const Move& move) {
	const auto& board = position.board;
	if (!board.contains(move.coord) || !board.isEmpty(move.coord)) {
		raiseInternalError(std::format("[Resolver] Move ({}, {}) does not target an empty board cell.", move.coord.q, move.coord.r));
	}
	if (isEmpty(move.tile) || controller(move.tile) != mover) {
		raiseInternalError(std::format("[Resolver] Tile {:#04x} is not playable by player {}.", move.tile, toIndex(mover)));
	}

	const auto enemy = opponent(mover);
	const auto cell  = board.index(move.coord);

	Resolution plan{board.storageSize()};
	plan.controller = mover;

	Group& active = plan.result;
	active.addMember(cell);

	// Classify neighbors reached through connected sides.
	std::vector<GroupHandle> friendly;
	std::vector<GroupHandle> enemies;
	for (const auto side: kSides) {
		if (!isConnected(move.tile, side)) {
			continue;
		}
		const auto n = board.neighbor(move.coord, side);
		if (!n) {
			continue;
		}

		const auto nIndex = board.index(*n);
		const auto nTile  = board.get(*n);
		if (isEmpty(nTile)) {
			active.add(nIndex, Group::Liberty);
		} else if (controller(nTile) == mover) {
			addUnique(friendly, position.groupIndex[nIndex]);
		} else {
			active.add(nIndex, Group::EnemyAdjacent);
			addUnique(enemies, position.groupIndex[nIndex]);
		}
	}

	// Union of friendly groups. merged.front() keeps its arena slot.
	std::vector<GroupHandle> merged;
	auto unite = [&](const GroupHandle handle) {
		if (containsHandle(merged, handle)) {
			return;
		}
		active.merge(liveGroup(position, handle, mover));
		merged.push_back(handle);
	};
	for (const auto handle: friendly) {
		unite(handle);
	}

	// Captures. Every enemy group is judged against the same board (only the placed cell changed),
	// so the order of captures does not matter.
	std::vector<bool> flipMask(board.storageSize(), false);
	std::vector<GroupHandle> captured;
	for (const auto handle: enemies) {
		Group group = liveGroup(position, handle, enemy);
		group.remove(cell, Group::Liberty);
		group.add(cell, Group::EnemyAdjacent);

		if (group.libertyCount() > 0u) {
			group.updateExtendable();
			plan.updated.emplace_back(handle, std::move(group));
			continue;
		}

		captured.push_back(handle);
		for (const auto member: group.cells(Group::Member)) {
			flipMask[member] = !flipMask[member];
		}
		active.absorbMembers(group);

		// Friendly groups touching the captured structure join through it.
		for (const auto adjacent: group.cells(Group::EnemyAdjacent)) {
			if (adjacent != cell) {
				unite(position.groupIndex[adjacent]);
			}
		}
	}
	active.addMember(cell);

	if (active.libertyCount() > 0u) {
		plan.outcome = captured.empty() ? MoveOutcome::Placed : MoveOutcome::Captured;
		if (!merged.empty()) {
			plan.slot = merged.front();
			plan.absorbed.assign(merged.begin() + 1, merged.end());
		}
		plan.absorbed.insert(plan.absorbed.end(), captured.begin(), captured.end());
	} else if (active.count(Group::EnemyAdjacent) == 0u) {
		// No enemy structure could take the flipped tiles in: no liberty under either controller.
		plan.outcome = MoveOutcome::Oscillation;
		active.updateExtendable();
		return plan;
	} else {
		// Self capture. The structure flips and joins every enemy group around it.
		for (const auto member: active.cells(Group::Member)) {
			flipMask[member] = !flipMask[member];
		}

		std::vector<GroupHandle> hosts;
		for (const auto adjacent: active.cells(Group::EnemyAdjacent)) {
			addUnique(hosts, position.groupIndex[adjacent]);
		}

		Group flippedGroup{board.storageSize()};
		flippedGroup.absorbMembers(active);
		for (const auto handle: hosts) {
			const auto it = std::find_if(plan.updated.begin(), plan.updated.end(), [&](const auto& entry) { return entry.first == handle; });
			if (it != plan.updated.end()) {
				flippedGroup.merge(it->second);
				plan.updated.erase(it);
			} else {
				flippedGroup.merge(liveGroup(position, handle, enemy));
			}
		}

		plan.controller = enemy;
		plan.result     = std::move(flippedGroup);
		if (plan.result.libertyCount() == 0u) {
			plan.outcome = MoveOutcome::Oscillation;
			plan.result.updateExtendable();
			return plan;
		}

		plan.outcome = MoveOutcome::SelfCaptured;
		plan.slot    = hosts.front();
		plan.absorbed.assign(hosts.begin() + 1, hosts.end());
		plan.absorbed.insert(plan.absorbed.end(), merged.begin(), merged.end());
		plan.absorbed.insert(plan.absorbed.end(), captured.begin(), captured.end());
	}

	plan.result.updateExtendable();
	for (std::size_t i = 0u; i != flipMask.size(); ++i) {
		if (flipMask[i]) {
			plan.flipped.push_back(i);
		}
	}
	return plan;
}

MoveResult applyMove(GamePosition& position, const Player mover, const Move& move) {
	auto plan = planMove(position, mover, move);

	if (plan.outcome == MoveOutcome::Oscillation) {
		raiseInternalError(std::format("[Resolver] Move ({}, {}) with tile {:#04x} oscillates. It must not pass the legality check.",
		                               move.coord.q, move.coord.r, move.tile));
	}

	auto& target = position.arena(plan.controller);
	if (!plan.slot && target.full()) {
		raiseInternalError(std::format("[Resolver] No free group slot for player {}.", toIndex(plan.controller)));
	}

	// Everything is validated. Commit.
	auto& board = position.board;
	board.set(move.coord, move.tile);

	MoveResult result{plan.outcome, move.coord, {}, {}};
	for (const auto index: plan.flipped) {
		const auto c = board.coordAt(index);
		board.set(c, flipController(board.get(c)));
		result.flipped.push_back(c);
	}

	for (const auto handle: plan.absorbed) {
		if (!position.arena(handle.owner).remove(handle)) {
			raiseInternalError(std::format("[Resolver] Absorbed group {} of player {} vanished during commit.", handle.index, toIndex(handle.owner)));
		}
	}

	const auto members = plan.result.cells(Group::Member);
	if (plan.slot) {
		result.group = *plan.slot;
		*target.get(result.group) = std::move(plan.result);
	} else {
		result.group = target.insert(std::move(plan.result));
	}

	for (auto& [handle, group]: plan.updated) {
		*position.arena(handle.owner).get(handle) = std::move(group);
	}

	for (const auto cell: members) {
		position.groupIndex[cell] = result.group;
	}

	return result;
}

} // namespace tessera
