#include "core/position.hpp"

namespace tessera {

GamePosition::GamePosition(const unsigned boardRadius)
    : board{boardRadius}, arenas{GroupArena{Player::Black, kPatternCount}, GroupArena{Player::White, kPatternCount}},
      groupIndex(board.storageSize()), hands{Hand{Player::Black}, Hand{Player::White}} {
}

GroupArena& GamePosition::arena(const Player player) {
	return arenas[toIndex(player)];
}

const GroupArena& GamePosition::arena(const Player player) const {
	return arenas[toIndex(player)];
}

Hand& GamePosition::hand(const Player player) {
	return hands[toIndex(player)];
}

const Hand& GamePosition::hand(const Player player) const {
	return hands[toIndex(player)];
}

GroupHandle GamePosition::handleAt(const Coord c) const {
	return groupIndex[board.index(c)];
}

const Group* GamePosition::groupAt(const Coord c) const {
	const auto handle = handleAt(c);
	return arena(handle.owner).get(handle);
}

void GamePosition::endTurn() {
	currentPlayer = opponent(currentPlayer);
	++moveId;
}

//! Flood fill the group holding start through connected sides.
//! \param [in,out] visited Marks every member found.
static Group collectGroup(const Board& board, const Coord start, std::vector<bool>& visited) {
	const auto player = controller(board.get(start));

	Group group{board.storageSize()};
	std::vector<Coord> stack{start};
	visited[board.index(start)] = true;
	group.addMember(board.index(start));

	while (!stack.empty()) {
		const auto c = stack.back();
		stack.pop_back();

		const auto tile = board.get(c);
		for (const auto side: kSides) {
			if (!isConnected(tile, side)) {
				continue;
			}
			const auto n = board.neighbor(c, side);
			if (!n) {
				continue;
			}

			const auto nIndex = board.index(*n);
			const auto nTile  = board.get(*n);
			if (isEmpty(nTile)) {
				group.add(nIndex, Group::Liberty);
			} else if (controller(nTile) != player) {
				group.add(nIndex, Group::EnemyAdjacent);
			} else if (!visited[nIndex]) {
				visited[nIndex] = true;
				group.addMember(nIndex);
				stack.push_back(*n);
			}
		}
	}

	group.updateExtendable();
	return group;
}

void rebuildGroups(GamePosition& position) {
	const auto& board = position.board;

	std::array<std::vector<Group>, 2> found;
	std::vector<bool> visited(board.storageSize(), false);
	for (const auto c: board.cells()) {
		if (board.isEmpty(c) || visited[board.index(c)]) {
			continue;
		}
		found[toIndex(controller(board.get(c)))].push_back(collectGroup(board, c, visited));
	}

	position.groupIndex.assign(board.storageSize(), GroupHandle{});
	for (const auto player: {Player::Black, Player::White}) {
		auto& groups = found[toIndex(player)];
		auto& arena  = position.arena(player);

		arena = GroupArena{player, groups.size() + position.hand(player).size()};
		for (auto& group: groups) {
			const auto members = group.cells(Group::Member);
			const auto handle  = arena.insert(std::move(group));
			for (const auto cell: members) {
				position.groupIndex[cell] = handle;
			}
		}
	}
}

} // namespace tessera
