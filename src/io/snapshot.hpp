/**
 * Snapshot — Save and restore the full rule-core state as JSON.
 *
 * A snapshot is applied on top of a world freshly loaded from the same
 * bundle: it records what play can change (positions, flags, exits, NPC
 * routes, health, RNG), trigger state, and the scheduler queue with its
 * tombstones and id counter.
 *
 * JSON format:
 * {
 *   "version": 1,
 *   "turn_count": 12,
 *   "last_processed_turn": 12,
 *   "rng": {"seed": 42, "state": 123456},
 *   "world": {"rooms": [...], "items": [...], "npcs": [...], "player": {...}},
 *   "triggers": [{"id": "t1", "enabled": true, "fired": true,
 *                 "fire_count": 1, "last_fired_turn": 3}],
 *   "scheduler": {
 *     "next_id": 7,
 *     "pending": [{"id": 5, "due_turn": 14, "condition": {...}, "actions": [...],
 *                  "on_false": "cancel", "origin": "t1", "note": ""}],
 *     "tombstones": [{"id": 4, "status": "fired", "turn": 12, "successor": 0, "note": ""}]
 *   }
 * }
 *
 * restore() is all-or-nothing: it validates everything before touching the
 * live objects.
 */

#ifndef STORY_IO_SNAPSHOT_HPP
#define STORY_IO_SNAPSHOT_HPP

#include "rules/scheduler.hpp"
#include "rules/trigger_registry.hpp"
#include "rules/turn_coordinator.hpp"
#include "world/world.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace story {

class JsonValue;
class JsonWriter;

class Snapshot {
public:
    static constexpr int VERSION = 1;

    /**
     * Save core state to a JSON file.
     * @return true on success (failures are logged)
     */
    static bool save(const std::string& filename, const World& world,
                     const rules::TriggerRegistry& triggers,
                     const rules::Scheduler& scheduler,
                     const rules::TurnCoordinator& coordinator);

    /**
     * Load core state from a JSON file.
     * @return true on success; on failure nothing is modified
     */
    static bool load(const std::string& filename, World& world,
                     rules::TriggerRegistry& triggers, rules::Scheduler& scheduler,
                     rules::TurnCoordinator& coordinator);

    static void write(std::ostream& os, const World& world,
                      const rules::TriggerRegistry& triggers,
                      const rules::Scheduler& scheduler,
                      const rules::TurnCoordinator& coordinator);

    /**
     * @throws LoadError on malformed data or unknown ids
     * @throws QueueCorruption on an inconsistent scheduler queue
     */
    static void restore(const JsonValue& json, World& world,
                        rules::TriggerRegistry& triggers, rules::Scheduler& scheduler,
                        rules::TurnCoordinator& coordinator);

private:
    static void write_health(JsonWriter& w, const HealthState& health);
    static void read_health(const JsonValue& json, HealthState& health);
    static void write_world(JsonWriter& w, const World& world);
    static void read_world(const JsonValue& json, World& world);

    static void write_event(JsonWriter& w, const rules::ScheduledEvent& ev);
    static rules::ScheduledEvent read_event(const JsonValue& json);

    static rules::Scheduler::State read_scheduler(const JsonValue& json);
    static std::vector<rules::TriggerState> read_triggers(const JsonValue& json);
};

} // namespace story

#endif // STORY_IO_SNAPSHOT_HPP
