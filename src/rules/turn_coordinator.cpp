#include "rules/turn_coordinator.hpp"
#include "rules/action.hpp"
#include "world/npc_movement.hpp"
#include "world/world.hpp"

namespace story::rules {

TurnCoordinator::TurnCoordinator(TriggerRegistry& triggers, Scheduler& scheduler,
                                 CoreConfig config)
    : triggers_(triggers), scheduler_(scheduler), config_(std::move(config)) {}

// ═══════════════════════════════════════════════════════════════
// Command cycle
// ═══════════════════════════════════════════════════════════════

CycleReport TurnCoordinator::advance_turn(World& world, OutputBuffer& view) {
    CycleReport report;
    const uint64_t turn = world.turn_count;

    // ── Movement and drain: once per turn ──
    if (turn > last_processed_turn_) {
        report.turn_advanced = true;
        last_processed_turn_ = turn;

        report.npc_moves = NpcMovementSystem::update_all(world, view);
        report.resolutions = scheduler_.drain_due(turn, world, view, &triggers_);
    }

    // ── Ambient pass: every cycle ──
    Event ambient(EventKind::ALWAYS);
    std::string room = world.player_room();
    if (!room.empty()) ambient.params["room"] = room;
    report.ambient_fired = triggers_.check_triggers(ambient, world, view, scheduler_);

    // Status effects tick only when time passed.
    if (report.turn_advanced) tick_health(world, view, report);

    // ── Retention ──
    if (config_.tombstone_retention > 0 && turn > config_.tombstone_retention) {
        report.tombstones_dropped =
            scheduler_.compact_tombstones(turn - config_.tombstone_retention);
    }

    report.output = view.flush();
    return report;
}

void TurnCoordinator::tick_health(World& world, OutputBuffer& view, CycleReport& report) {
    std::vector<Event> deaths;

    if (world.player.health.alive()) {
        HealthTick tick = world.player.health.tick();
        for (const auto& change : tick.changes) push_change(view, "", change);
        if (tick.died) {
            report.player_died = true;
            Log::info("Turn", "player died: " + tick.death_cause);
            deaths.emplace_back(EventKind::PLAYER_DEATH,
                                std::map<std::string, std::string>{{"cause", tick.death_cause}});
        }
    }

    for (auto& npc : world.npcs()) {
        if (!npc.health.alive()) continue;
        HealthTick tick = npc.health.tick();
        for (const auto& change : tick.changes) push_change(view, npc.name, change);
        if (tick.died) {
            if (npc.movement) npc.movement->active = false;
            report.npc_deaths.push_back(npc.id);
            view.push(OutputTag::STATUS, npc.name + " dies.");
            Log::info("Turn", "npc '" + npc.id + "' died: " + tick.death_cause);
            deaths.emplace_back(EventKind::NPC_DEATH, std::map<std::string, std::string>{
                                    {"npc", npc.id}, {"cause", tick.death_cause}});
        }
    }

    // Death events dispatch after all ticks of the cycle.
    for (const auto& death : deaths) {
        triggers_.check_triggers(death, world, view, scheduler_);
    }
}

void TurnCoordinator::push_change(OutputBuffer& view, const std::string& who,
                                  const HealthChange& change) {
    std::string sign = change.damage ? "-" : "+";
    std::string text = change.cause + " (" + sign + std::to_string(change.amount) + " hp)";
    view.push(OutputTag::STATUS, who.empty() ? text : who + ": " + text);
}

// ═══════════════════════════════════════════════════════════════
// Handler entry points
// ═══════════════════════════════════════════════════════════════

std::vector<std::string> TurnCoordinator::react(const Event& event, World& world,
                                                OutputBuffer& view) {
    std::vector<std::string> fired = triggers_.check_triggers(event, world, view, scheduler_);
    if (fired.empty() && event.kind != EventKind::ALWAYS && !config_.fallback_message.empty()) {
        view.push(OutputTag::FAILURE, config_.fallback_message);
    }
    return fired;
}

bool TurnCoordinator::spawn_into_inventory(const std::string& item_id, World& world,
                                           OutputBuffer& view) {
    ActionContext ctx{world, view, scheduler_, &triggers_, "spawn"};
    std::vector<Action> actions{SpawnItemInInventory{item_id}};
    ExecutionReport report = ActionExecutor::execute(actions, ctx);
    return report.failed == 0;
}

} // namespace story::rules
