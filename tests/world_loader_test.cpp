#include "io/world_loader.hpp"
#include "io/json_reader.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace story;
using namespace story::rules;

namespace {

StoryBundle parse(const std::string& json) {
    return WorldLoader::parse(JsonReader::parse(json));
}

// Wraps rooms/items/triggers around a player standing in room "a".
std::string bundle_with(const std::string& extra) {
    return R"({"rooms": [{"id": "a", "exits": []}], "player": {"location": "room:a"})" +
           (extra.empty() ? std::string() : ", " + extra) + "}";
}

} // namespace

TEST(WorldLoader, ParsesSampleBundle) {
    StoryBundle b = parse(test::SAMPLE_BUNDLE);
    const World& w = b.world;

    EXPECT_EQ(w.rooms().size(), 3u);
    EXPECT_EQ(w.items().size(), 3u);
    EXPECT_EQ(w.npcs().size(), 1u);
    EXPECT_EQ(b.triggers.size(), 3u);
    EXPECT_EQ(w.rng.seed(), 7);

    EXPECT_EQ(w.player.name, "Ada");
    EXPECT_EQ(w.player_room(), "hall");
    EXPECT_EQ(w.player.health.max_hp(), 10u);
    EXPECT_TRUE(w.player.has_flag_value("awake"));
    EXPECT_TRUE(w.room("hall")->visited);
    EXPECT_FALSE(w.room("study")->visited);

    const Exit* east = w.room("study")->find_exit("east");
    ASSERT_NE(east, nullptr);
    EXPECT_TRUE(east->locked);
    EXPECT_EQ(east->barred_message, "The vault door is sealed.");

    EXPECT_FALSE(w.item("lever")->portable);
    EXPECT_EQ(w.item("chest")->container, ContainerState::CLOSED);

    const Npc* cat = w.npc("cat");
    ASSERT_TRUE(cat->movement.has_value());
    EXPECT_EQ(cat->movement->timing_value, 2u);
    EXPECT_EQ(cat->movement->rooms.size(), 2u);
    EXPECT_EQ(cat->health.max_hp(), 6u);
    EXPECT_EQ(cat->health.current_hp(), 6u);
}

TEST(WorldLoader, TriggersKeepAuthoringOrderAndOptions) {
    StoryBundle b = parse(test::SAMPLE_BUNDLE);
    const auto& triggers = b.triggers.triggers();
    EXPECT_EQ(triggers[0].id, "pull-lever");
    EXPECT_EQ(triggers[2].id, "rich-goal");
    EXPECT_TRUE(triggers[0].fire_once);
    EXPECT_EQ(triggers[0].matcher.kind, EventKind::TOUCH);
    EXPECT_EQ(triggers[0].matcher.params.at("item"), "lever");
    ASSERT_EQ(triggers[0].actions.size(), 2u);
    EXPECT_STREQ(action_name(triggers[0].actions[1]), "scheduleIn");

    const auto& sched = std::get<ScheduleIn>(triggers[0].actions[1].node);
    EXPECT_EQ(sched.turns, 2u);
    EXPECT_EQ(sched.on_false, OnFalsePolicy::retry_after(1));
    EXPECT_EQ(sched.note, "vault");
}

TEST(WorldLoader, MinimalBundleDefaults) {
    StoryBundle b = parse(bundle_with(""));
    EXPECT_EQ(b.world.player.health.max_hp(), 20u);
    EXPECT_EQ(b.world.turn_count, 0u);
    EXPECT_EQ(b.triggers.size(), 0u);
}

TEST(WorldLoader, EveryZeroTurnsIsClamped) {
    size_t warnings = Log::warning_count();
    StoryBundle b = parse(bundle_with(
        R"("npcs": [{"id": "n", "location": "room:a", "movement": {"rooms": ["a"],
            "timing": {"type": "everyNTurns", "turns": 0}}}])"));
    EXPECT_EQ(b.world.npc("n")->movement->timing_value, 1u);
    EXPECT_EQ(Log::warning_count(), warnings + 1);
}

TEST(WorldLoader, RejectsStructuralErrors) {
    const char* bad[] = {
        // exit to a missing room
        R"({"rooms": [{"id": "a", "exits": [{"direction": "n", "to": "b"}]}],
            "player": {"location": "room:a"}})",
        // duplicate room id
        R"({"rooms": [{"id": "a"}, {"id": "a"}], "player": {"location": "room:a"}})",
        // player outside any room
        R"({"rooms": [{"id": "a"}], "player": {"location": "inventory"}})",
        // malformed location
        R"({"rooms": [{"id": "a"}], "player": {"location": "room:a"},
            "items": [{"id": "i", "location": "shelf"}]})",
        // item in a missing container
        R"({"rooms": [{"id": "a"}], "player": {"location": "room:a"},
            "items": [{"id": "i", "location": "item:box"}]})",
        // unknown action type
        R"({"rooms": [{"id": "a"}], "player": {"location": "room:a"},
            "triggers": [{"id": "t", "event": {"type": "touch"},
                          "actions": [{"type": "explode"}]}]})",
        // unknown event kind
        R"({"rooms": [{"id": "a"}], "player": {"location": "room:a"},
            "triggers": [{"id": "t", "event": {"type": "sneeze"}}]})",
        // duplicate trigger id
        R"({"rooms": [{"id": "a"}], "player": {"location": "room:a"},
            "triggers": [{"id": "t", "event": {"type": "touch"}},
                         {"id": "t", "event": {"type": "touch"}}]})",
        // goal without finishedWhen
        R"({"rooms": [{"id": "a"}], "player": {"location": "room:a"},
            "goals": [{"id": "g"}]})",
        // movement through a missing room
        R"({"rooms": [{"id": "a"}], "player": {"location": "room:a"},
            "npcs": [{"id": "n", "location": "room:a", "movement": {"rooms": ["z"]}}]})",
    };
    for (const char* json : bad) {
        EXPECT_THROW(parse(json), LoadError) << json;
    }
}

TEST(WorldLoader, MissingFileIsALoadError) {
    EXPECT_THROW(WorldLoader::load_file("/nonexistent/bundle.json"), LoadError);
}

TEST(WorldLoader, ReadFlagForms) {
    Flag simple = WorldLoader::read_flag(JsonReader::parse(R"("door")"));
    EXPECT_FALSE(simple.sequence);

    Flag seq = WorldLoader::read_flag(JsonReader::parse(R"({"name": "quest", "end": 3, "step": 1})"));
    EXPECT_TRUE(seq.sequence);
    EXPECT_EQ(seq.value(), "quest#1");
    ASSERT_TRUE(seq.end.has_value());
    EXPECT_EQ(*seq.end, 3u);
}
