#include "rules/turn_coordinator.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace story;
using namespace story::rules;
using test::make_trigger;

namespace {

class TurnCoordinatorTest : public ::testing::Test {
protected:
    World world = test::make_world();
    OutputBuffer view;
    Scheduler scheduler;
    TriggerRegistry registry;

    /** One accepted command: react, bump the turn, advance. */
    CycleReport command(EventKind kind, TurnCoordinator& tc,
                        const std::map<std::string, std::string>& params = {}) {
        tc.react(Event(kind, params), world, view);
        world.turn_count++;
        return tc.advance_turn(world, view);
    }
};

} // namespace

TEST_F(TurnCoordinatorTest, ScheduleInOneFiresInTheSameCycle) {
    registry.add(make_trigger("ping", EventKind::TOUCH, Condition::always(),
                              {ScheduleIn{1, Condition::always(), {ShowMessage{"Ping"}}, {}, ""}}));
    TurnCoordinator tc(registry, scheduler);

    CycleReport report = command(EventKind::TOUCH, tc);
    EXPECT_TRUE(report.turn_advanced);
    ASSERT_EQ(report.resolutions.size(), 1u);
    EXPECT_EQ(report.resolutions[0].status, EventStatus::FIRED);
    EXPECT_EQ(test::texts(report.output, OutputTag::TRIGGERED), std::vector<std::string>{"Ping"});
    EXPECT_EQ(scheduler.pending_count(), 0u);
}

TEST_F(TurnCoordinatorTest, FallbackWhenNothingReacts) {
    TurnCoordinator tc(registry, scheduler);
    CycleReport report = command(EventKind::TOUCH, tc, {{"item", "lamp"}});
    EXPECT_EQ(test::texts(report.output, OutputTag::FAILURE),
              std::vector<std::string>{"Nothing happens."});

    CoreConfig quiet;
    quiet.fallback_message = "";
    TurnCoordinator silent(registry, scheduler, quiet);
    report = command(EventKind::TOUCH, silent);
    EXPECT_TRUE(report.output.empty());
}

TEST_F(TurnCoordinatorTest, NoFallbackWhenATriggerFires) {
    registry.add(make_trigger("t", EventKind::TOUCH, Condition::always(), {ShowMessage{"Click."}}));
    TurnCoordinator tc(registry, scheduler);
    CycleReport report = command(EventKind::TOUCH, tc);
    EXPECT_TRUE(test::texts(report.output, OutputTag::FAILURE).empty());
}

TEST_F(TurnCoordinatorTest, MovementAndDrainRunOncePerTurn) {
    scheduler.schedule_at(1, Condition::always(), {AwardPoints{1, "tick"}});
    TurnCoordinator tc(registry, scheduler);

    world.turn_count = 1;
    CycleReport first = tc.advance_turn(world, view);
    EXPECT_TRUE(first.turn_advanced);
    EXPECT_EQ(first.resolutions.size(), 1u);

    // A command that took no time: only the ambient pass runs.
    CycleReport second = tc.advance_turn(world, view);
    EXPECT_FALSE(second.turn_advanced);
    EXPECT_TRUE(second.resolutions.empty());
    EXPECT_EQ(world.player.score, 1);
    EXPECT_EQ(tc.last_processed_turn(), 1u);
}

TEST_F(TurnCoordinatorTest, AmbientPassRunsEveryCycleWithRoomParam) {
    Trigger t = make_trigger("hall-air", EventKind::ALWAYS, Condition::always(),
                             {ShowRandomMessage{"wind"}});
    t.matcher.params["room"] = "hall";
    registry.add(std::move(t));
    TurnCoordinator tc(registry, scheduler);

    CycleReport r1 = tc.advance_turn(world, view);
    CycleReport r2 = tc.advance_turn(world, view);
    EXPECT_EQ(r1.ambient_fired, std::vector<std::string>{"hall-air"});
    EXPECT_EQ(r2.ambient_fired.size(), 1u);

    world.player.location = Location::room("study");
    CycleReport r3 = tc.advance_turn(world, view);
    EXPECT_TRUE(r3.ambient_fired.empty());
}

TEST_F(TurnCoordinatorTest, NpcMovesBeforeScheduledEventsEvaluate) {
    Npc& butler = *world.npc("butler");
    NpcMovement mv;
    mv.rooms = {"hall", "study"};
    butler.movement = mv;

    scheduler.schedule_at(1, WithNpc{"butler"}, {ShowMessage{"still here"}});
    TurnCoordinator tc(registry, scheduler);

    world.turn_count = 1;
    CycleReport report = tc.advance_turn(world, view);
    EXPECT_EQ(report.npc_moves, 1u);
    ASSERT_EQ(report.resolutions.size(), 1u);
    EXPECT_EQ(report.resolutions[0].status, EventStatus::CANCELLED);
    EXPECT_EQ(test::texts(report.output, OutputTag::TRANSIT),
              std::vector<std::string>{"Butler leaves."});
}

TEST_F(TurnCoordinatorTest, HealthTicksAndDeathFiresTrigger) {
    registry.add(make_trigger("rip", EventKind::PLAYER_DEATH, EventMatches{"cause", "poison"},
                              {ShowMessage{"You have died."}}));
    world.player.health = HealthState(5);
    world.player.health.add_effect({HealthEffectKind::DAMAGE_OVER_TIME, "poison", 2, 5});
    TurnCoordinator tc(registry, scheduler);

    world.turn_count = 1;
    CycleReport r1 = tc.advance_turn(world, view);
    EXPECT_EQ(test::texts(r1.output, OutputTag::STATUS),
              std::vector<std::string>{"poison (-2 hp)"});
    EXPECT_FALSE(r1.player_died);

    world.turn_count = 2;
    tc.advance_turn(world, view);
    world.turn_count = 3;
    CycleReport r3 = tc.advance_turn(world, view);
    EXPECT_TRUE(r3.player_died);
    EXPECT_EQ(test::texts(r3.output, OutputTag::TRIGGERED),
              std::vector<std::string>{"You have died."});

    // Nothing ticks once dead.
    world.turn_count = 4;
    CycleReport r4 = tc.advance_turn(world, view);
    EXPECT_TRUE(r4.output.empty());
}

TEST_F(TurnCoordinatorTest, HealthWaitsForTheTurnToAdvance) {
    world.player.health = HealthState(5);
    world.player.health.add_effect({HealthEffectKind::DAMAGE_OVER_TIME, "poison", 2, 5});
    TurnCoordinator tc(registry, scheduler);

    for (int i = 0; i < 3; i++) {
        CycleReport r = tc.advance_turn(world, view);
        EXPECT_FALSE(r.turn_advanced);
        EXPECT_TRUE(test::texts(r.output, OutputTag::STATUS).empty());
    }
    EXPECT_EQ(world.player.health.current_hp(), 5u);
    EXPECT_TRUE(world.player.health.alive());

    world.turn_count = 1;
    tc.advance_turn(world, view);
    EXPECT_EQ(world.player.health.current_hp(), 3u);
}

TEST_F(TurnCoordinatorTest, NpcDeathStopsMovementAndFiresTrigger) {
    registry.add(make_trigger("butler-gone", EventKind::NPC_DEATH, EventMatches{"npc", "butler"},
                              {ShowMessage{"The house falls silent."}}));
    Npc& butler = *world.npc("butler");
    NpcMovement mv;
    mv.rooms = {"hall", "study"};
    mv.active = false;
    butler.movement = mv;
    butler.health = HealthState(3);
    butler.health.add_effect({HealthEffectKind::DAMAGE_OVER_TIME, "fever", 2, 3});
    TurnCoordinator tc(registry, scheduler);

    world.turn_count = 1;
    CycleReport r1 = tc.advance_turn(world, view);
    EXPECT_EQ(test::texts(r1.output, OutputTag::STATUS),
              std::vector<std::string>{"Butler: fever (-2 hp)"});
    EXPECT_TRUE(r1.npc_deaths.empty());

    butler.movement->active = true;
    world.turn_count = 2;
    CycleReport r2 = tc.advance_turn(world, view);
    EXPECT_EQ(r2.npc_deaths, std::vector<std::string>{"butler"});
    EXPECT_FALSE(butler.health.alive());
    EXPECT_FALSE(butler.movement->active);
    EXPECT_FALSE(r2.player_died);
    EXPECT_EQ(test::texts(r2.output, OutputTag::TRIGGERED),
              std::vector<std::string>{"The house falls silent."});

    // A dead NPC neither ticks nor walks.
    Location where = butler.location;
    world.turn_count = 5;
    CycleReport r3 = tc.advance_turn(world, view);
    EXPECT_TRUE(r3.npc_deaths.empty());
    EXPECT_TRUE(test::texts(r3.output, OutputTag::STATUS).empty());
    EXPECT_EQ(butler.location, where);
    EXPECT_EQ(r3.npc_moves, 0u);
}

TEST_F(TurnCoordinatorTest, TombstoneRetentionWindow) {
    CoreConfig cfg;
    cfg.tombstone_retention = 3;
    TurnCoordinator tc(registry, scheduler, cfg);

    scheduler.schedule_at(1, Condition::always(), {});
    world.turn_count = 1;
    tc.advance_turn(world, view);
    EXPECT_EQ(scheduler.tombstone_count(), 1u);

    world.turn_count = 4;
    EXPECT_EQ(tc.advance_turn(world, view).tombstones_dropped, 0u);
    world.turn_count = 5;
    EXPECT_EQ(tc.advance_turn(world, view).tombstones_dropped, 1u);
    EXPECT_EQ(scheduler.tombstone_count(), 0u);
}

TEST_F(TurnCoordinatorTest, SpawnIntoInventory) {
    TurnCoordinator tc(registry, scheduler);
    EXPECT_TRUE(tc.spawn_into_inventory("key", world, view));
    EXPECT_TRUE(world.player_has_item("key"));
    EXPECT_FALSE(tc.spawn_into_inventory("ghost", world, view));
}
