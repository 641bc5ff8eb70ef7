/**
 * Shared fixtures: a small three-room world with an NPC, a container and
 * a few loose items.
 *
 *   hall --north--> study --east (locked)--> vault
 *     ^---south-------'
 */

#ifndef STORY_TESTS_TEST_SUPPORT_HPP
#define STORY_TESTS_TEST_SUPPORT_HPP

#include "rules/action.hpp"
#include "rules/scheduler.hpp"
#include "rules/trigger_registry.hpp"
#include "view/output_buffer.hpp"
#include "world/world.hpp"
#include <string>
#include <vector>

namespace story::test {

inline Room make_room(const std::string& id, const std::string& name) {
    Room r;
    r.id = id;
    r.name = name;
    return r;
}

inline Exit make_exit(const std::string& dir, const std::string& to, bool locked = false) {
    Exit e;
    e.direction = dir;
    e.to = to;
    e.locked = locked;
    return e;
}

inline Item make_item(const std::string& id, const Location& loc,
                      ContainerState container = ContainerState::NONE) {
    Item it;
    it.id = id;
    it.name = id;
    it.location = loc;
    it.container = container;
    return it;
}

inline World make_world() {
    World w;

    Room hall = make_room("hall", "Great Hall");
    hall.exits.push_back(make_exit("north", "study"));
    hall.visited = true;
    w.add_room(std::move(hall));

    Room study = make_room("study", "Study");
    study.exits.push_back(make_exit("south", "hall"));
    study.exits.push_back(make_exit("east", "vault", true));
    w.add_room(std::move(study));

    w.add_room(make_room("vault", "Vault"));

    w.add_item(make_item("lamp", Location::room("hall")));
    w.add_item(make_item("key", Location::nowhere()));
    w.add_item(make_item("chest", Location::room("study"), ContainerState::CLOSED));
    w.add_item(make_item("coin", Location::item("chest")));
    w.add_item(make_item("letter", Location::npc("butler")));

    Npc butler;
    butler.id = "butler";
    butler.name = "Butler";
    butler.location = Location::room("hall");
    w.add_npc(std::move(butler));

    Spinner wind;
    wind.id = "wind";
    wind.lines = {"The wind howls."};
    w.add_spinner(std::move(wind));

    w.player.location = Location::room("hall");
    return w;
}

inline rules::Trigger make_trigger(const std::string& id, rules::EventKind kind,
                                   rules::Condition condition,
                                   std::vector<rules::Action> actions,
                                   bool fire_once = false) {
    rules::Trigger t;
    t.id = id;
    t.name = id;
    t.matcher.kind = kind;
    t.condition = std::move(condition);
    t.actions = std::move(actions);
    t.fire_once = fire_once;
    return t;
}

/**
 * A small playable bundle: pulling the lever in the study opens the vault
 * two turns later, provided the player is standing in the study.
 */
inline const char* const SAMPLE_BUNDLE = R"({
  "seed": 7,
  "player": {"name": "Ada", "location": "room:hall", "maxHp": 10, "flags": ["awake"]},
  "rooms": [
    {"id": "hall", "name": "Great Hall", "exits": [{"direction": "north", "to": "study"}]},
    {"id": "study", "name": "Study", "exits": [
      {"direction": "south", "to": "hall"},
      {"direction": "east", "to": "vault", "locked": true,
       "barredMessage": "The vault door is sealed."}]},
    {"id": "vault", "name": "Vault", "exits": [{"direction": "west", "to": "study"}]}
  ],
  "items": [
    {"id": "lever", "name": "brass lever", "location": "room:study", "portable": false},
    {"id": "coin", "name": "gold coin", "location": "room:vault"},
    {"id": "chest", "name": "chest", "location": "room:hall", "container": "closed"}
  ],
  "npcs": [
    {"id": "cat", "name": "The cat", "location": "room:hall", "maxHp": 6,
     "movement": {"type": "route", "rooms": ["hall", "study"],
                  "timing": {"type": "everyNTurns", "turns": 2}}}
  ],
  "goals": [
    {"id": "rich", "name": "Get rich", "finishedWhen": {"type": "hasItem", "item": "coin"}}
  ],
  "spinners": [{"id": "drafts", "lines": ["A draft stirs the dust."]}],
  "triggers": [
    {"id": "pull-lever", "event": {"type": "touch", "item": "lever"},
     "condition": {"type": "inRoom", "room": "study"},
     "actions": [
       {"type": "showMessage", "text": "Gears grind somewhere."},
       {"type": "scheduleIn", "turns": 2, "note": "vault",
        "condition": {"type": "inRoom", "room": "study"},
        "actions": [
          {"type": "unlockExit", "room": "study", "direction": "east"},
          {"type": "showMessage", "text": "The vault door swings open."}],
        "onFalse": {"type": "retryAfter", "turns": 1}}],
     "once": true},
    {"id": "enter-vault", "event": {"type": "enter", "room": "vault"},
     "actions": [{"type": "awardPoints", "amount": 10, "reason": "found the vault"}],
     "once": true},
    {"id": "rich-goal", "event": {"type": "always"},
     "condition": {"type": "goalComplete", "goal": "rich"},
     "actions": [{"type": "showMessage", "text": "You are rich!"}],
     "once": true}
  ]
})";

/** Texts of all items carrying `tag`, in order. */
inline std::vector<std::string> texts(const std::vector<OutputItem>& items, OutputTag tag) {
    std::vector<std::string> out;
    for (const auto& item : items) {
        if (item.tag == tag) out.push_back(item.text);
    }
    return out;
}

} // namespace story::test

#endif // STORY_TESTS_TEST_SUPPORT_HPP
