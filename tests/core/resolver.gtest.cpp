#include "core/errors.hpp"
#include "core/resolver.hpp"
#include "core/testBoard.hpp"

#include <gtest/gtest.h>

namespace tessera::gtest {

// Single tile on an empty board: one new extendable group.
TEST(Resolver, NewGroup) {
	GamePosition position(3u);
	const auto result = place(position, {0, 0}, tileWith(Player::Black, {Side::East, Side::West, Side::NorthWest}));

	EXPECT_EQ(result.outcome, MoveOutcome::Placed);
	EXPECT_TRUE(result.flipped.empty());

	const auto* group = position.groupAt({0, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->memberCount(), 1u);
	EXPECT_EQ(group->libertyCount(), 3u);
	EXPECT_TRUE(group->extendable());
	EXPECT_EQ(position.arena(Player::Black).liveCount(), 1u);
	EXPECT_EQ(position.arena(Player::White).liveCount(), 0u);
	EXPECT_TRUE(isConsistent(position));
}

// Liberties only come from connected sides.
TEST(Resolver, NewGroupIgnoresDisconnectedSides) {
	GamePosition position(3u);
	place(position, {0, 0}, tileWith(Player::White, {Side::SouthEast}));

	const auto* group = position.groupAt({0, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->libertyCount(), 1u);
	EXPECT_TRUE(group->has(position.board.index({0, 1}), Group::Liberty));
}

// Two connected tiles of one player form one group with the union of liberties.
TEST(Resolver, MergeFriendly) {
	GamePosition position(3u);
	place(position, {0, 0}, tileWith(Player::Black, {Side::East, Side::West}));
	const auto result = place(position, {1, 0}, tileWith(Player::Black, {Side::West, Side::SouthEast}));

	EXPECT_EQ(result.outcome, MoveOutcome::Placed);
	EXPECT_EQ(position.handleAt({0, 0}), position.handleAt({1, 0}));
	EXPECT_EQ(position.arena(Player::Black).liveCount(), 1u);

	const auto& board = position.board;
	const auto* group = position.groupAt({1, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->memberCount(), 2u);
	EXPECT_EQ(group->libertyCount(), 2u);
	EXPECT_TRUE(group->has(board.index({-1, 0}), Group::Liberty));
	EXPECT_TRUE(group->has(board.index({1, 1}), Group::Liberty));
	EXPECT_FALSE(group->has(board.index({1, 0}), Group::Liberty));
	EXPECT_TRUE(isConsistent(position));
}

// A tile joining three groups keeps one arena slot and kills the others.
TEST(Resolver, MergeSeveralFriendly) {
	GamePosition position(3u);
	place(position, {1, 0}, tileWith(Player::White, {Side::West, Side::East}));
	place(position, {-1, 0}, tileWith(Player::White, {Side::East, Side::West}));
	place(position, {0, 1}, tileWith(Player::White, {Side::NorthWest, Side::SouthEast}));
	ASSERT_EQ(position.arena(Player::White).liveCount(), 3u);

	place(position, {0, 0}, tileWith(Player::White, {Side::East, Side::West, Side::SouthEast}));

	EXPECT_EQ(position.arena(Player::White).liveCount(), 1u);
	const auto* group = position.groupAt({0, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->memberCount(), 4u);
	EXPECT_EQ(group->libertyCount(), 3u);
	EXPECT_TRUE(isConsistent(position));
}

// Opponent group with one liberty is captured when the mover fills it.
TEST(Resolver, Capture) {
	GamePosition position(3u);
	place(position, {0, 0}, tileWith(Player::White, {Side::East}));
	const auto result = place(position, {1, 0}, tileWith(Player::Black, {Side::West, Side::East}));

	EXPECT_EQ(result.outcome, MoveOutcome::Captured);
	ASSERT_EQ(result.flipped.size(), 1u);
	EXPECT_EQ(result.flipped.front(), (Coord{0, 0}));

	const auto captured = position.board.get({0, 0});
	EXPECT_EQ(controller(captured), Player::Black);
	EXPECT_EQ(owner(captured), Player::White);

	EXPECT_EQ(position.arena(Player::White).liveCount(), 0u);
	EXPECT_EQ(position.handleAt({0, 0}), position.handleAt({1, 0}));

	const auto* group = position.groupAt({1, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->memberCount(), 2u);
	EXPECT_EQ(group->libertyCount(), 1u);
	EXPECT_TRUE(group->has(position.board.index({2, 0}), Group::Liberty));
	EXPECT_TRUE(group->extendable());
	EXPECT_TRUE(isConsistent(position));
}

// An enemy group keeping a liberty only records the new tile as enemy adjacent.
TEST(Resolver, EnemyKeepsLiberty) {
	GamePosition position(3u);
	place(position, {0, 0}, tileWith(Player::White, {Side::East, Side::West}));
	place(position, {1, 0}, tileWith(Player::Black, {Side::West, Side::East}));

	const auto* white = position.groupAt({0, 0});
	ASSERT_NE(white, nullptr);
	EXPECT_EQ(white->libertyCount(), 1u);
	EXPECT_TRUE(white->has(position.board.index({1, 0}), Group::EnemyAdjacent));
	EXPECT_FALSE(white->extendable());

	const auto* black = position.groupAt({1, 0});
	ASSERT_NE(black, nullptr);
	EXPECT_FALSE(black->extendable());
	EXPECT_TRUE(isConsistent(position));
}

// One tile captures two separate groups at once.
TEST(Resolver, CaptureSeveralGroups) {
	GamePosition position(3u);
	place(position, {-1, 0}, tileWith(Player::White, {Side::East}));
	place(position, {1, 0}, tileWith(Player::White, {Side::West}));

	const auto result = place(position, {0, 0}, tileWith(Player::Black, {Side::East, Side::West, Side::SouthEast}));

	EXPECT_EQ(result.outcome, MoveOutcome::Captured);
	EXPECT_EQ(result.flipped.size(), 2u);
	EXPECT_EQ(position.arena(Player::White).liveCount(), 0u);
	EXPECT_EQ(position.arena(Player::Black).liveCount(), 1u);

	const auto* group = position.groupAt({0, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->memberCount(), 3u);
	EXPECT_EQ(group->libertyCount(), 1u);
	EXPECT_TRUE(isConsistent(position));
}

// A friendly group reachable only through the captured structure joins the capturing group.
TEST(Resolver, CaptureJoinsFriendlyBehindCapturedGroup) {
	GamePosition position(3u);
	const auto friendHandle = place(position, {2, 0}, tileWith(Player::Black, {Side::West, Side::NorthEast})).group;
	place(position, {1, 0}, tileWith(Player::White, {Side::West, Side::East}));

	const auto result = place(position, {0, 0}, tileWith(Player::Black, {Side::East, Side::West}));

	EXPECT_EQ(result.outcome, MoveOutcome::Captured);
	EXPECT_EQ(result.group, friendHandle);
	EXPECT_EQ(position.arena(Player::Black).liveCount(), 1u);
	EXPECT_EQ(position.arena(Player::White).liveCount(), 0u);

	const auto& board = position.board;
	const auto* group = position.groupAt({0, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->memberCount(), 3u);
	EXPECT_EQ(group->libertyCount(), 2u);
	EXPECT_TRUE(group->has(board.index({-1, 0}), Group::Liberty));
	EXPECT_TRUE(group->has(board.index({3, -1}), Group::Liberty));
	EXPECT_TRUE(isConsistent(position));
}

// Suicide: a tile whose only connection faces an enemy group flips and joins it.
TEST(Resolver, SelfCapture) {
	GamePosition position(3u);
	const auto whiteHandle = place(position, {0, 0}, tileWith(Player::White, {Side::East, Side::West})).group;

	const auto result = place(position, {1, 0}, tileWith(Player::Black, {Side::West}));

	EXPECT_EQ(result.outcome, MoveOutcome::SelfCaptured);
	EXPECT_EQ(result.group, whiteHandle);
	ASSERT_EQ(result.flipped.size(), 1u);
	EXPECT_EQ(result.flipped.front(), (Coord{1, 0}));

	const auto tile = position.board.get({1, 0});
	EXPECT_EQ(owner(tile), Player::Black);
	EXPECT_EQ(controller(tile), Player::White);

	EXPECT_EQ(position.arena(Player::Black).liveCount(), 0u);
	const auto* group = position.groupAt({1, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->memberCount(), 2u);
	EXPECT_EQ(group->libertyCount(), 1u);
	EXPECT_TRUE(group->has(position.board.index({-1, 0}), Group::Liberty));
	EXPECT_TRUE(group->extendable());
	EXPECT_TRUE(isConsistent(position));
}

// Suicide takes the friendly group attached to the new tile along.
TEST(Resolver, SelfCaptureWithFriendlyGroup) {
	GamePosition position(3u);
	place(position, {0, 0}, tileWith(Player::White, {Side::East, Side::West}));
	place(position, {2, 0}, tileWith(Player::Black, {Side::West}));

	const auto result = place(position, {1, 0}, tileWith(Player::Black, {Side::West, Side::East}));

	EXPECT_EQ(result.outcome, MoveOutcome::SelfCaptured);
	EXPECT_EQ(result.flipped.size(), 2u);
	EXPECT_EQ(controller(position.board.get({2, 0})), Player::White);
	EXPECT_EQ(position.arena(Player::Black).liveCount(), 0u);
	EXPECT_EQ(position.arena(Player::White).liveCount(), 1u);

	const auto* group = position.groupAt({2, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->memberCount(), 3u);
	EXPECT_EQ(group->libertyCount(), 1u);
	EXPECT_TRUE(isConsistent(position));
}

// Self capture between two enemy groups merges all three structures.
TEST(Resolver, SelfCaptureJoinsEnemyGroups) {
	GamePosition position(3u);
	place(position, {-1, 0}, tileWith(Player::White, {Side::East, Side::West}));
	place(position, {1, 0}, tileWith(Player::White, {Side::West, Side::East}));

	const auto result = place(position, {0, 0}, tileWith(Player::Black, {Side::East, Side::West}));

	EXPECT_EQ(result.outcome, MoveOutcome::SelfCaptured);
	EXPECT_EQ(position.arena(Player::White).liveCount(), 1u);
	const auto* group = position.groupAt({0, 0});
	ASSERT_NE(group, nullptr);
	EXPECT_EQ(group->memberCount(), 3u);
	EXPECT_EQ(group->libertyCount(), 2u);
	EXPECT_TRUE(isConsistent(position));
}

// Closing an isolated structure on itself leaves no liberty under either controller.
TEST(Resolver, OscillationIsRejectedWithoutMutation) {
	GamePosition position(3u);
	place(position, {0, 0}, tileWith(Player::Black, {Side::East}));
	const GamePosition before = position;

	const Move move{{1, 0}, tileWith(Player::Black, {Side::West})};
	const auto plan = planMove(position, Player::Black, move);
	EXPECT_EQ(plan.outcome, MoveOutcome::Oscillation);
	EXPECT_EQ(plan.result.libertyCount(), 0u);
	EXPECT_EQ(plan.result.memberCount(), 2u);

	EXPECT_THROW(applyMove(position, Player::Black, move), InternalError);
	EXPECT_TRUE(position.board.isEmpty({1, 0}));
	EXPECT_EQ(position.arena(Player::Black).liveCount(), before.arena(Player::Black).liveCount());
	EXPECT_EQ(*position.groupAt({0, 0}), *before.groupAt({0, 0}));
	EXPECT_TRUE(isConsistent(position));
}

// A capture that leaves the combined structure without liberty and without enemy oscillates too.
TEST(Resolver, CaptureWithoutLibertyOscillates) {
	GamePosition position(3u);
	place(position, {0, 0}, tileWith(Player::White, {Side::East}));

	const auto plan = planMove(position, Player::Black, Move{{1, 0}, tileWith(Player::Black, {Side::West})});
	EXPECT_EQ(plan.outcome, MoveOutcome::Oscillation);
	EXPECT_EQ(plan.result.libertyCount(), 0u);
}

// Planning never touches the position.
TEST(Resolver, PlanIsSideEffectFree) {
	GamePosition position(3u);
	place(position, {0, 0}, tileWith(Player::White, {Side::East}));
	const GamePosition before = position;

	const auto plan = planMove(position, Player::Black, Move{{1, 0}, tileWith(Player::Black, {Side::West, Side::East})});
	EXPECT_EQ(plan.outcome, MoveOutcome::Captured);
	EXPECT_EQ(position.board.get({0, 0}), before.board.get({0, 0}));
	EXPECT_TRUE(position.board.isEmpty({1, 0}));
	EXPECT_EQ(position.arena(Player::White).liveCount(), 1u);
}

TEST(Resolver, RejectsBrokenPreconditions) {
	GamePosition position(2u);
	place(position, {0, 0}, tileWith(Player::Black, {Side::East}));

	// Occupied cell, off-board cell, tile of the other player, stale index.
	EXPECT_THROW(planMove(position, Player::Black, Move{{0, 0}, tileWith(Player::Black, {Side::West})}), InternalError);
	EXPECT_THROW(planMove(position, Player::Black, Move{{3, 0}, tileWith(Player::Black, {Side::West})}), InternalError);
	EXPECT_THROW(planMove(position, Player::Black, Move{{1, 0}, tileWith(Player::White, {Side::West})}), InternalError);

	position.groupIndex[position.board.index({0, 0})] = GroupHandle{7u, Player::Black, true};
	EXPECT_THROW(planMove(position, Player::Black, Move{{1, 0}, tileWith(Player::Black, {Side::West, Side::East})}), InternalError);
}

} // namespace tessera::gtest
