/**
 * TurnCoordinator — Fixed per-command sequence of the rule core.
 *
 * A command handler mutates the world (and bumps turn_count if the command
 * consumed time), then calls advance_turn() exactly once:
 *
 *   1. NPC movement         } only when turn_count moved past the last
 *   2. Scheduler drain      } processed turn
 *   3. Ambient pass: "always" triggers
 *   4. Status-effect ticks for the player and NPCs, only on an advanced turn
 *   5. Tombstone retention
 *   6. Flush output
 *
 * Because the handler increments the turn before the drain, an event
 * scheduled one turn ahead while handling turn N resolves inside the same
 * command cycle as turn N+1.
 */

#ifndef STORY_RULES_TURN_COORDINATOR_HPP
#define STORY_RULES_TURN_COORDINATOR_HPP

#include "core/log.hpp"
#include "rules/event.hpp"
#include "rules/scheduler.hpp"
#include "rules/trigger_registry.hpp"
#include "view/output_buffer.hpp"
#include "world/health.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace story {
class World;
}

namespace story::rules {

struct CoreConfig {
    std::string fallback_message = "Nothing happens.";
    uint64_t tombstone_retention = 1000;    // turns; 0 keeps every tombstone
    std::optional<int32_t> seed;            // overrides the bundle seed
    LogLevel log_level = LogLevel::WARN;
    bool verbose = false;                   // shorthand for log_level INFO
};

struct CycleReport {
    bool turn_advanced = false;
    size_t npc_moves = 0;
    std::vector<Resolution> resolutions;
    std::vector<std::string> ambient_fired;
    bool player_died = false;
    std::vector<std::string> npc_deaths;
    size_t tombstones_dropped = 0;
    std::vector<OutputItem> output;
};

class TurnCoordinator {
public:
    TurnCoordinator(TriggerRegistry& triggers, Scheduler& scheduler, CoreConfig config = {});

    /** Run one command cycle. Call exactly once per accepted command. */
    CycleReport advance_turn(World& world, OutputBuffer& view);

    /**
     * Dispatch a player-initiated event. Pushes the fallback message when no
     * trigger fired (never for the ambient "always" kind).
     */
    std::vector<std::string> react(const Event& event, World& world, OutputBuffer& view);

    /** Move an item into the player's inventory through the action executor. */
    bool spawn_into_inventory(const std::string& item_id, World& world, OutputBuffer& view);

    uint64_t last_processed_turn() const { return last_processed_turn_; }
    void set_last_processed_turn(uint64_t turn) { last_processed_turn_ = turn; }

    const CoreConfig& config() const { return config_; }

private:
    TriggerRegistry& triggers_;
    Scheduler& scheduler_;
    CoreConfig config_;
    uint64_t last_processed_turn_ = 0;

    void tick_health(World& world, OutputBuffer& view, CycleReport& report);
    static void push_change(OutputBuffer& view, const std::string& who, const HealthChange& change);
};

} // namespace story::rules

#endif // STORY_RULES_TURN_COORDINATOR_HPP
