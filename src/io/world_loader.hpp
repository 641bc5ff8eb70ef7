/**
 * WorldLoader — Builds the World and the TriggerRegistry from a bundle.
 *
 * Bundle layout (JSON):
 * {
 *   "seed": 42,
 *   "player":   {"name": "...", "location": "room:<id>", "maxHp": 20, "score": 0,
 *                "flags": ["simple", {"name": "quest", "end": 3}]},
 *   "rooms":    [{"id", "name", "description", "exits": [
 *                  {"direction", "to", "hidden", "locked", "barredMessage"}]}],
 *   "items":    [{"id", "name", "description", "location", "portable",
 *                 "restricted", "container": "none|open|closed|locked"}],
 *   "npcs":     [{"id", "name", "description", "location", "state",
 *                 "movement": {"type": "route|randomSet", "rooms": [...], "loop": true,
 *                              "timing": {"type": "everyNTurns", "turns": 2}, "active": true}}],
 *   "goals":    [{"id", "name", "group", "activateWhen", "finishedWhen", "failedWhen"}],
 *   "spinners": [{"id", "lines": [...]}],
 *   "triggers": [{"id", "name", "event": {"type": "enter", "room": "hall"},
 *                 "condition": {...}, "actions": [...], "once": false}]
 * }
 *
 * Any structural problem (unknown type, duplicate id, exit or location that
 * names a missing room/item/NPC) throws LoadError before anything is
 * returned.
 */

#ifndef STORY_IO_WORLD_LOADER_HPP
#define STORY_IO_WORLD_LOADER_HPP

#include "rules/trigger_registry.hpp"
#include "world/world.hpp"
#include <string>

namespace story {

class JsonValue;

struct StoryBundle {
    World world;
    rules::TriggerRegistry triggers;
};

class WorldLoader {
public:
    /** @throws LoadError on structural errors */
    static StoryBundle parse(const JsonValue& bundle);

    /** @throws LoadError on file, JSON or structural errors */
    static StoryBundle load_file(const std::string& path);

    // Exposed for the snapshot reader, which shares these encodings.
    static Location read_location(const JsonValue& json, const std::string& context);
    static Flag read_flag(const JsonValue& json);

private:
    static Room read_room(const JsonValue& json);
    static Item read_item(const JsonValue& json);
    static Npc read_npc(const JsonValue& json);
    static NpcMovement read_movement(const JsonValue& json, const std::string& npc_id);
    static Goal read_goal(const JsonValue& json);
    static Spinner read_spinner(const JsonValue& json);
    static rules::Trigger read_trigger(const JsonValue& json);

    static void check_references(const World& world);
};

} // namespace story

#endif // STORY_IO_WORLD_LOADER_HPP
