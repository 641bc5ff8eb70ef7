#include "world/npc_movement.hpp"
#include "view/output_buffer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace story;

namespace {

NpcMovement route(std::vector<std::string> rooms, bool loop, uint64_t every = 1) {
    NpcMovement mv;
    mv.kind = MovementKind::ROUTE;
    mv.rooms = std::move(rooms);
    mv.loop = loop;
    mv.timing_value = every;
    return mv;
}

class NpcMovementTest : public ::testing::Test {
protected:
    World world = test::make_world();
    OutputBuffer view;

    Npc& butler() { return *world.npc("butler"); }

    size_t step(uint64_t turn) {
        world.turn_count = turn;
        return NpcMovementSystem::update_all(world, view);
    }
};

} // namespace

TEST(NpcMovementTiming, EveryNAndOnTurn) {
    NpcMovement every = route({"hall"}, true, 3);
    EXPECT_FALSE(NpcMovementSystem::move_scheduled(every, 2));
    EXPECT_TRUE(NpcMovementSystem::move_scheduled(every, 3));
    EXPECT_TRUE(NpcMovementSystem::move_scheduled(every, 6));

    NpcMovement once = every;
    once.timing = MovementTiming::ON_TURN;
    once.timing_value = 4;
    EXPECT_TRUE(NpcMovementSystem::move_scheduled(once, 4));
    EXPECT_FALSE(NpcMovementSystem::move_scheduled(once, 8));
}

TEST(NpcMovementRoute, LoopingAndNonLooping) {
    StoryRNG rng(1);
    NpcMovement looping = route({"a", "b", "c"}, true);
    EXPECT_EQ(*NpcMovementSystem::next_room(looping, rng), "b");
    EXPECT_EQ(*NpcMovementSystem::next_room(looping, rng), "c");
    EXPECT_EQ(*NpcMovementSystem::next_room(looping, rng), "a");

    NpcMovement once = route({"a", "b"}, false);
    EXPECT_EQ(*NpcMovementSystem::next_room(once, rng), "b");
    EXPECT_FALSE(NpcMovementSystem::next_room(once, rng).has_value());
    EXPECT_EQ(once.route_index, 1u);
}

TEST(NpcMovementRandom, StaysWithinSetAndIsSeedDeterministic) {
    NpcMovement mv;
    mv.kind = MovementKind::RANDOM_SET;
    mv.rooms = {"hall", "study", "vault"};

    StoryRNG a(99), b(99);
    for (int i = 0; i < 20; i++) {
        auto ra = NpcMovementSystem::next_room(mv, a);
        auto rb = NpcMovementSystem::next_room(mv, b);
        ASSERT_TRUE(ra.has_value());
        EXPECT_EQ(*ra, *rb);
        EXPECT_NE(std::find(mv.rooms.begin(), mv.rooms.end(), *ra), mv.rooms.end());
    }
}

TEST_F(NpcMovementTest, ArrivalsAndDeparturesRelativeToPlayer) {
    butler().movement = route({"hall", "study"}, true);

    EXPECT_EQ(step(1), 1u);
    EXPECT_EQ(butler().location, Location::room("study"));
    EXPECT_EQ(step(2), 1u);
    EXPECT_EQ(butler().location, Location::room("hall"));
    EXPECT_EQ(butler().movement->last_moved_turn, 2u);

    EXPECT_EQ(test::texts(view.items(), OutputTag::TRANSIT),
              (std::vector<std::string>{"Butler leaves.", "Butler arrives."}));
}

TEST_F(NpcMovementTest, InactiveAndPausedNpcsStay) {
    butler().movement = route({"hall", "study"}, true);
    butler().movement->active = false;
    EXPECT_EQ(step(1), 0u);

    butler().movement->active = true;
    butler().movement->paused_until = 3;
    EXPECT_EQ(step(2), 0u);
    EXPECT_EQ(step(3), 1u);
    EXPECT_FALSE(butler().movement->paused_until.has_value());
}

TEST_F(NpcMovementTest, UnknownRoomIsSkippedWithWarning) {
    butler().movement = route({"hall", "attic"}, true);
    EXPECT_EQ(step(1), 0u);
    EXPECT_EQ(butler().location, Location::room("hall"));
}
