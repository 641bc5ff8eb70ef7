#include "rules/dev_console.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace story;
using namespace story::rules;

namespace {

class DevConsoleTest : public ::testing::Test {
protected:
    World world = test::make_world();
    OutputBuffer view;
    Scheduler scheduler;

    std::string last_text() { return view.items().back().text; }
    OutputTag last_tag() { return view.items().back().tag; }
};

} // namespace

TEST_F(DevConsoleTest, EmptyQueue) {
    DevConsole::list_pending(scheduler, world, view);
    EXPECT_EQ(last_tag(), OutputTag::SYSTEM);
    EXPECT_EQ(last_text(), "No events currently scheduled.");
}

TEST_F(DevConsoleTest, ListsEventsInProcessingOrder) {
    world.turn_count = 2;
    scheduler.schedule_at(9, Condition::always(), {ShowMessage{"x"}}, OnFalsePolicy::retry_after(2),
                          "bell", "toll");
    scheduler.schedule_at(4, InRoom{"hall"}, {});

    DevConsole::list_pending(scheduler, world, view);
    EXPECT_EQ(last_text(),
              "Scheduled events [2], current turn = 2:\n"
              " - turn 4 | id 2 | actions: 0\n"
              "   on_false: cancel\n"
              "   cond: inRoom:hall\n"
              " - turn 9 | id 1 | actions: 1\n"
              "   on_false: retry+2\n"
              "   cond: all()\n"
              "   from: bell\n"
              "   note: toll");
}

TEST_F(DevConsoleTest, CancelReportsOutcome) {
    EventId id = scheduler.schedule_at(5, Condition::always(), {});

    EXPECT_FALSE(DevConsole::cancel(scheduler, 42, world, view));
    EXPECT_EQ(last_tag(), OutputTag::FAILURE);
    EXPECT_EQ(last_text(), "No scheduled event with id 42.");

    EXPECT_TRUE(DevConsole::cancel(scheduler, id, world, view));
    EXPECT_EQ(last_tag(), OutputTag::SUCCESS);
    EXPECT_EQ(last_text(), "Scheduled event 1 canceled.");
    EXPECT_EQ(scheduler.tombstone(id)->status, EventStatus::CANCELLED);
}

TEST_F(DevConsoleTest, DelayReportsNewIdAndTurn) {
    scheduler.schedule_at(5, Condition::always(), {});

    EXPECT_TRUE(DevConsole::delay(scheduler, 1, 3, world, view));
    EXPECT_EQ(last_text(), "Scheduled event 1 delayed by 3 turn(s) (now id 2 on turn 8).");

    EXPECT_TRUE(DevConsole::delay(scheduler, 2, 0, world, view));
    EXPECT_EQ(last_text(), "Scheduled event 2 delayed by 1 turn(s) (now id 3 on turn 9).");

    EXPECT_FALSE(DevConsole::delay(scheduler, 1, 3, world, view));
}
