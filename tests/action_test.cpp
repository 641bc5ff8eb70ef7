#include "rules/action.hpp"
#include "rules/scheduler.hpp"
#include "rules/trigger_registry.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace story;
using namespace story::rules;

namespace {

class ActionTest : public ::testing::Test {
protected:
    World world = test::make_world();
    OutputBuffer view;
    Scheduler scheduler;
    TriggerRegistry registry;
    ActionContext ctx{world, view, scheduler, &registry, "test"};

    ExecutionReport run(std::vector<Action> actions) {
        return ActionExecutor::execute(actions, ctx);
    }
};

} // namespace

TEST_F(ActionTest, BestEffortSkipsFailingActions) {
    ExecutionReport r = run({
        ShowMessage{"before"},
        SpawnItemInRoom{"ghost", "hall"},
        UnlockExit{"study", "up"},
        ShowMessage{"after"},
    });

    EXPECT_EQ(r.executed, 2u);
    EXPECT_EQ(r.failed, 2u);
    EXPECT_EQ(test::texts(view.items(), OutputTag::TRIGGERED),
              (std::vector<std::string>{"before", "after"}));
}

TEST_F(ActionTest, ExecuteOneThrowsOnDanglingReference) {
    EXPECT_THROW(ActionExecutor::execute_one(DespawnItem{"ghost"}, ctx), ReferenceError);
    EXPECT_THROW(ActionExecutor::execute_one(PushPlayerTo{"attic"}, ctx), ReferenceError);
    EXPECT_THROW(ActionExecutor::execute_one(SetTriggerEnabled{"nope"}, ctx), ReferenceError);
}

TEST_F(ActionTest, MessagesCarryTheirTags) {
    run({ShowRandomMessage{"wind"}, NpcSays{"butler", "Good evening."}, AwardPoints{10, "manners"}});

    ASSERT_EQ(view.size(), 3u);
    EXPECT_EQ(view.items()[0].tag, OutputTag::AMBIENT);
    EXPECT_EQ(view.items()[0].text, "The wind howls.");
    EXPECT_EQ(view.items()[1].tag, OutputTag::DIALOGUE);
    EXPECT_EQ(view.items()[1].speaker, "Butler");
    EXPECT_EQ(view.items()[2].tag, OutputTag::POINTS);
    EXPECT_EQ(view.items()[2].text, "+10 (manners)");
    EXPECT_EQ(world.player.score, 10);
}

TEST_F(ActionTest, FlagLifecycle) {
    run({AddFlag{"quest", true, 3u}, AdvanceFlag{"quest"}, AdvanceFlag{"quest"}});
    EXPECT_TRUE(world.player.has_flag_value("quest#2"));

    run({ResetFlag{"quest"}});
    EXPECT_TRUE(world.player.has_flag_value("quest#0"));

    run({RemoveFlag{"quest"}, AddFlag{"plain"}});
    EXPECT_EQ(world.player.find_flag("quest"), nullptr);
    EXPECT_TRUE(world.player.has_flag_value("plain"));
}

TEST_F(ActionTest, ItemPlacement) {
    run({SpawnItemInInventory{"key"}, SpawnItemInContainer{"lamp", "chest"}});
    EXPECT_TRUE(world.player_has_item("key"));
    EXPECT_EQ(world.item("lamp")->location, Location::item("chest"));

    run({SpawnItemCurrentRoom{"key"}, DespawnItem{"coin"}});
    EXPECT_EQ(world.item("key")->location, Location::room("hall"));
    EXPECT_EQ(world.item("coin")->location, Location::nowhere());

    // Not a container, and an item cannot contain itself.
    EXPECT_EQ(run({SpawnItemInContainer{"coin", "lamp"}}).failed, 1u);
    EXPECT_EQ(run({SpawnItemInContainer{"chest", "chest"}}).failed, 1u);
}

TEST_F(ActionTest, GiveItemRequiresTheNpcToCarryIt) {
    EXPECT_EQ(run({GiveItemToPlayer{"butler", "lamp"}}).failed, 1u);
    EXPECT_EQ(run({GiveItemToPlayer{"butler", "letter"}}).failed, 0u);
    EXPECT_TRUE(world.player_has_item("letter"));
}

TEST_F(ActionTest, ExitsAndPlayerMovement) {
    run({UnlockExit{"study", "east"}, SetBarredMessage{"study", "east", "Rusty."}});
    const Exit* east = world.room("study")->find_exit("east");
    EXPECT_FALSE(east->locked);
    EXPECT_EQ(east->barred_message, "Rusty.");

    run({PushPlayerTo{"vault"}});
    EXPECT_EQ(world.player_room(), "vault");
    EXPECT_TRUE(world.room("vault")->visited);
}

TEST_F(ActionTest, HealthEffectsAreQueuedNotApplied) {
    run({DamagePlayer{"poison", 2, 3}, DamagePlayer{"fall", 5, 0}});
    EXPECT_EQ(world.player.health.current_hp(), 20u);
    EXPECT_EQ(world.player.health.effects().size(), 2u);

    run({RemovePlayerEffect{"poison"}});
    EXPECT_EQ(world.player.health.effects().size(), 1u);
}

TEST_F(ActionTest, NpcHealthEffectsAreQueued) {
    ExecutionReport report = run({DamageNpc{"butler", "fever", 2, 3}, HealNpc{"butler", "tea", 1, 0},
                                  DamageNpc{"ghost", "fever", 1, 0}});
    EXPECT_EQ(report.failed, 1u);
    const HealthState& health = world.npc("butler")->health;
    EXPECT_EQ(health.current_hp(), 10u);
    ASSERT_EQ(health.effects().size(), 2u);
    EXPECT_EQ(health.effects()[0].kind, HealthEffectKind::DAMAGE_OVER_TIME);
    EXPECT_EQ(health.effects()[1].kind, HealthEffectKind::INSTANT_HEAL);
}

TEST_F(ActionTest, ScheduleInUsesCurrentTurnAndOrigin) {
    world.turn_count = 4;
    run({ScheduleIn{2, HasFlag{"x"}, {ShowMessage{"later"}}, OnFalsePolicy::retry_next_turn(), "n"}});

    auto pending = scheduler.pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0]->due_turn, 6u);
    EXPECT_EQ(pending[0]->origin_trigger, "test");
    EXPECT_EQ(pending[0]->note, "n");
    EXPECT_EQ(pending[0]->on_false, OnFalsePolicy::retry_next_turn());
}

TEST_F(ActionTest, ScheduleAtInThePastIsClamped) {
    world.turn_count = 10;
    run({ScheduleAt{3, Condition::always(), {ShowMessage{"late"}}, {}, ""}});
    ASSERT_EQ(scheduler.pending_count(), 1u);
    EXPECT_EQ(scheduler.pending()[0]->due_turn, 10u);
}

TEST(ActionName, CamelCaseNames) {
    EXPECT_STREQ(action_name(ShowMessage{"x"}), "showMessage");
    EXPECT_STREQ(action_name(ScheduleIn{}), "scheduleIn");
    EXPECT_STREQ(action_name(GiveItemToPlayer{}), "giveItemToPlayer");
    EXPECT_STREQ(action_name(DamageNpc{}), "damageNpc");
}
