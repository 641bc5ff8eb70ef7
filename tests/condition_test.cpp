#include "rules/condition.hpp"
#include "rules/event.hpp"
#include "core/log.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace story;
using namespace story::rules;

namespace {

class ConditionTest : public ::testing::Test {
protected:
    World world = test::make_world();

    bool eval(const Condition& c, const Event* ev = nullptr) {
        return ConditionEvaluator::evaluate(c, world, ev);
    }
};

} // namespace

TEST_F(ConditionTest, EmptyCompositesAreIdentityValues) {
    EXPECT_TRUE(eval(Condition::always()));
    EXPECT_FALSE(eval(Condition::never()));
}

TEST_F(ConditionTest, SimpleAndSequencedFlags) {
    EXPECT_FALSE(eval(HasFlag{"door"}));
    EXPECT_TRUE(eval(MissingFlag{"door"}));

    world.player.add_flag(Flag::simple("door"));
    EXPECT_TRUE(eval(HasFlag{"door"}));
    EXPECT_TRUE(eval(FlagComplete{"door"}));
    EXPECT_FALSE(eval(FlagInProgress{"door"}));

    world.player.add_flag(Flag::sequenced("quest", 2));
    EXPECT_TRUE(eval(HasFlag{"quest#0"}));
    EXPECT_FALSE(eval(HasFlag{"quest"}));
    EXPECT_TRUE(eval(FlagInProgress{"quest"}));

    world.player.advance_flag("quest");
    world.player.advance_flag("quest");
    EXPECT_TRUE(eval(HasFlag{"quest#2"}));
    EXPECT_TRUE(eval(FlagComplete{"quest"}));
    EXPECT_FALSE(world.player.advance_flag("quest"));
}

TEST_F(ConditionTest, OpenEndedSequenceNeverCompletes) {
    world.player.add_flag(Flag::sequenced("counter", std::nullopt));
    for (int i = 0; i < 10; i++) world.player.advance_flag("counter");
    EXPECT_TRUE(eval(FlagInProgress{"counter"}));
    EXPECT_FALSE(eval(FlagComplete{"counter"}));
}

TEST_F(ConditionTest, ItemsRoomsAndContainers) {
    EXPECT_TRUE(eval(InRoom{"hall"}));
    EXPECT_FALSE(eval(InRoom{"study"}));
    EXPECT_TRUE(eval(ReachedRoom{"hall"}));
    EXPECT_FALSE(eval(ReachedRoom{"vault"}));

    EXPECT_TRUE(eval(MissingItem{"lamp"}));
    world.item("lamp")->location = Location::inventory();
    EXPECT_TRUE(eval(HasItem{"lamp"}));

    EXPECT_TRUE(eval(ContainerHasItem{"chest", "coin"}));
    EXPECT_FALSE(eval(ContainerHasItem{"chest", "lamp"}));
}

TEST_F(ConditionTest, NpcConditions) {
    EXPECT_TRUE(eval(WithNpc{"butler"}));
    EXPECT_TRUE(eval(NpcInState{"butler", "normal"}));
    EXPECT_TRUE(eval(NpcHasItem{"butler", "letter"}));

    world.npc("butler")->location = Location::room("study");
    world.npc("butler")->state = "angry";
    EXPECT_FALSE(eval(WithNpc{"butler"}));
    EXPECT_TRUE(eval(NpcInState{"butler", "angry"}));
}

TEST_F(ConditionTest, UnknownReferencesEvaluateFalse) {
    size_t before = Log::warning_count();
    EXPECT_FALSE(eval(HasItem{"ghost"}));
    EXPECT_FALSE(eval(MissingItem{"ghost"}));
    EXPECT_FALSE(eval(InRoom{"attic"}));
    EXPECT_FALSE(eval(NpcInState{"nobody", "normal"}));
    EXPECT_FALSE(eval(GoalComplete{"nothing"}));
    EXPECT_EQ(Log::warning_count(), before + 5);
}

TEST_F(ConditionTest, EventMatchesNeedsADispatchedEvent) {
    Event touch(EventKind::TOUCH, {{"item", "lamp"}});
    EXPECT_TRUE(eval(EventMatches{"item", "lamp"}, &touch));
    EXPECT_FALSE(eval(EventMatches{"item", "key"}, &touch));
    EXPECT_FALSE(eval(EventMatches{"item", "lamp"}));
}

TEST_F(ConditionTest, CompositesShortCircuit) {
    // The unknown item would log a warning if it were evaluated.
    size_t before = Log::warning_count();
    EXPECT_FALSE(eval(Condition::all({HasFlag{"nope"}, HasItem{"ghost"}})));
    EXPECT_TRUE(eval(Condition::any({InRoom{"hall"}, HasItem{"ghost"}})));
    EXPECT_EQ(Log::warning_count(), before);
}

TEST_F(ConditionTest, GoalStatusOrdering) {
    Goal g;
    g.id = "escape";
    g.activate_when = Condition(HasFlag{"woke"});
    g.finished_when = Condition(InRoom{"vault"});
    g.failed_when = Condition(HasFlag{"caught"});
    world.add_goal(std::move(g));
    const Goal& goal = *world.goal("escape");

    EXPECT_EQ(ConditionEvaluator::goal_status(goal, world), GoalStatus::INACTIVE);
    world.player.add_flag(Flag::simple("woke"));
    EXPECT_EQ(ConditionEvaluator::goal_status(goal, world), GoalStatus::ACTIVE);
    world.player.location = Location::room("vault");
    EXPECT_EQ(ConditionEvaluator::goal_status(goal, world), GoalStatus::COMPLETE);
    EXPECT_TRUE(eval(GoalComplete{"escape"}));
    world.player.add_flag(Flag::simple("caught"));
    EXPECT_EQ(ConditionEvaluator::goal_status(goal, world), GoalStatus::FAILED);
}

TEST_F(ConditionTest, SelfReferencingGoalIsNotComplete) {
    Goal g;
    g.id = "loop";
    g.finished_when = Condition(GoalComplete{"loop"});
    world.add_goal(std::move(g));

    EXPECT_FALSE(eval(GoalComplete{"loop"}));
}

TEST(ConditionFlatten, MergesNestedSameKindComposites) {
    Condition nested = Condition::all({
        HasFlag{"a"},
        Condition::all({HasFlag{"b"}, Condition::all({HasFlag{"c"}})}),
        Condition::any({HasFlag{"d"}, Condition::any({HasFlag{"e"}})}),
    });

    Condition flat = ConditionEvaluator::flatten(nested);
    EXPECT_EQ(ConditionEvaluator::describe(flat),
              "all(hasFlag:a, hasFlag:b, hasFlag:c, any(hasFlag:d, hasFlag:e))");
    EXPECT_LT(ConditionEvaluator::node_count(flat), ConditionEvaluator::node_count(nested));
}

TEST(ConditionFlatten, PreservesTruthForEveryAssignment) {
    Condition tree = Condition::any({
        Condition::all({HasFlag{"a"}, Condition::all({HasFlag{"b"}, MissingFlag{"c"}})}),
        Condition::any({HasFlag{"d"}, Condition::any({Condition::all({HasFlag{"c"}})})}),
        Condition::all({}),
    });
    Condition without_always = Condition::any({
        Condition::all({HasFlag{"a"}, Condition::all({HasFlag{"b"}, MissingFlag{"c"}})}),
        Condition::any({HasFlag{"d"}, Condition::all({HasFlag{"c"}, HasFlag{"a"}})}),
    });

    const char* names[] = {"a", "b", "c", "d"};
    for (int mask = 0; mask < 16; mask++) {
        World world = test::make_world();
        for (int bit = 0; bit < 4; bit++) {
            if (mask & (1 << bit)) world.player.add_flag(Flag::simple(names[bit]));
        }
        for (const Condition* c : {&tree, &without_always}) {
            EXPECT_EQ(ConditionEvaluator::evaluate(*c, world),
                      ConditionEvaluator::evaluate(ConditionEvaluator::flatten(*c), world))
                << "mask " << mask << " on " << ConditionEvaluator::describe(*c);
        }
    }
}

TEST(ConditionDescribe, LeavesAndComposites) {
    Condition c = Condition::all({
        InRoom{"hall"},
        Condition::any({NpcInState{"butler", "angry"}, EventMatches{"item", "lamp"}}),
    });
    EXPECT_EQ(ConditionEvaluator::describe(c),
              "all(inRoom:hall, any(npcInState:butler=angry, event:item=lamp))");
    EXPECT_EQ(ConditionEvaluator::describe(Condition::always()), "all()");
}
