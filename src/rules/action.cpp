/**
 * ActionExecutor — Applies authored action lists to the world.
 *
 * Each action is dispatched through std::visit. Lookups go through the
 * World::require_* helpers so a dangling id surfaces as ReferenceError,
 * which execute() turns into a warning and a skipped step.
 */

#include "rules/action.hpp"
#include "rules/scheduler.hpp"
#include "rules/trigger_registry.hpp"
#include "view/output_buffer.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

namespace story::rules {

namespace {

// ── Helpers ──

Exit& require_exit(World& world, const std::string& room_id, const std::string& direction) {
    Room& room = world.require_room(room_id);
    Exit* exit = room.find_exit(direction);
    if (!exit) {
        throw ReferenceError("room '" + room_id + "' has no exit '" + direction + "'");
    }
    return *exit;
}

void place_item(World& world, const std::string& item_id, const Location& loc) {
    Item& item = world.require_item(item_id);
    if (!world.location_exists(loc)) {
        throw ReferenceError("cannot place '" + item_id + "': " + loc.to_string() + " not found");
    }
    if (loc.kind == LocationKind::ITEM && loc.id == item_id) {
        throw ReferenceError("cannot place '" + item_id + "' inside itself");
    }
    item.location = loc;
}

HealthEffect make_effect(bool damage, const std::string& cause,
                         uint32_t amount, uint32_t turns) {
    HealthEffect fx;
    fx.cause = cause;
    fx.amount = amount;
    if (turns == 0) {
        fx.kind = damage ? HealthEffectKind::INSTANT_DAMAGE : HealthEffectKind::INSTANT_HEAL;
        fx.times = 1;
    } else {
        fx.kind = damage ? HealthEffectKind::DAMAGE_OVER_TIME : HealthEffectKind::HEAL_OVER_TIME;
        fx.times = turns;
    }
    return fx;
}

// ═══════════════════════════════════════════════════════════════
// Dispatch visitor
// ═══════════════════════════════════════════════════════════════

class Runner {
public:
    explicit Runner(ActionContext& ctx) : ctx_(ctx), world_(ctx.world) {}

    // ── Messages ──

    void operator()(const ShowMessage& a) {
        ctx_.view.push(OutputTag::TRIGGERED, a.text);
    }

    void operator()(const ShowRandomMessage& a) {
        const Spinner* sp = world_.spinner(a.spinner);
        if (!sp) throw ReferenceError("spinner '" + a.spinner + "' not found");
        std::string line = sp->spin(world_.rng);
        if (!line.empty()) ctx_.view.push(OutputTag::AMBIENT, line);
    }

    void operator()(const NpcSays& a) {
        Npc& npc = world_.require_npc(a.npc);
        ctx_.view.push(OutputTag::DIALOGUE, a.quote, npc.name);
    }

    // ── Flags and score ──

    void operator()(const AddFlag& a) {
        Flag flag = a.sequence ? Flag::sequenced(a.flag, a.end, world_.turn_count)
                               : Flag::simple(a.flag, world_.turn_count);
        if (!world_.player.add_flag(flag)) {
            Log::debug("Action", "flag '" + a.flag + "' already set");
        }
    }

    void operator()(const RemoveFlag& a) {
        if (!world_.player.remove_flag(a.flag)) {
            Log::debug("Action", "removeFlag: '" + a.flag + "' was not set");
        }
    }

    void operator()(const AdvanceFlag& a) {
        if (!world_.player.advance_flag(a.flag)) {
            Log::debug("Action", "advanceFlag: '" + a.flag + "' not advanced");
        }
    }

    void operator()(const ResetFlag& a) {
        if (!world_.player.reset_flag(a.flag)) {
            Log::debug("Action", "resetFlag: '" + a.flag + "' not reset");
        }
    }

    void operator()(const AwardPoints& a) {
        world_.player.score += a.amount;
        std::string sign = a.amount >= 0 ? "+" : "";
        ctx_.view.push(OutputTag::POINTS, sign + std::to_string(a.amount) + " (" + a.reason + ")");
    }

    // ── Items ──

    void operator()(const SpawnItemInRoom& a) { place_item(world_, a.item, Location::room(a.room)); }

    void operator()(const SpawnItemCurrentRoom& a) {
        std::string room = world_.player_room();
        if (room.empty()) throw ReferenceError("player is not in a room");
        place_item(world_, a.item, Location::room(room));
    }

    void operator()(const SpawnItemInInventory& a) { place_item(world_, a.item, Location::inventory()); }

    void operator()(const SpawnItemInContainer& a) {
        if (!world_.require_item(a.container).is_container()) {
            throw ReferenceError("item '" + a.container + "' is not a container");
        }
        place_item(world_, a.item, Location::item(a.container));
    }

    void operator()(const DespawnItem& a) { world_.require_item(a.item).location = Location::nowhere(); }

    void operator()(const SetItemDescription& a) { world_.require_item(a.item).description = a.text; }

    void operator()(const RestrictItem& a) { world_.require_item(a.item).restricted = a.restricted; }

    void operator()(const SetContainerState& a) { world_.require_item(a.item).container = a.state; }

    void operator()(const GiveItemToPlayer& a) {
        world_.require_npc(a.npc);
        Item& item = world_.require_item(a.item);
        if (item.location != Location::npc(a.npc)) {
            throw ReferenceError("npc '" + a.npc + "' does not carry '" + a.item + "'");
        }
        item.location = Location::inventory();
    }

    // ── Exits and movement ──

    void operator()(const RevealExit& a) { require_exit(world_, a.room, a.direction).hidden = false; }
    void operator()(const LockExit& a)   { require_exit(world_, a.room, a.direction).locked = true; }
    void operator()(const UnlockExit& a) { require_exit(world_, a.room, a.direction).locked = false; }

    void operator()(const SetBarredMessage& a) {
        require_exit(world_, a.room, a.direction).barred_message = a.message;
    }

    void operator()(const PushPlayerTo& a) {
        Room& room = world_.require_room(a.room);
        world_.player.location = Location::room(a.room);
        room.visited = true;
    }

    // ── NPCs ──

    void operator()(const SetNpcState& a) { world_.require_npc(a.npc).state = a.state; }

    void operator()(const SetNpcMovementActive& a) {
        Npc& npc = world_.require_npc(a.npc);
        if (!npc.movement) throw ReferenceError("npc '" + a.npc + "' has no movement");
        npc.movement->active = a.active;
    }

    void operator()(const DamageNpc& a) {
        world_.require_npc(a.npc).health.add_effect(make_effect(true, a.cause, a.amount, a.turns));
    }

    void operator()(const HealNpc& a) {
        world_.require_npc(a.npc).health.add_effect(make_effect(false, a.cause, a.amount, a.turns));
    }

    // ── Player health (applied on the next ambient tick) ──

    void operator()(const DamagePlayer& a) {
        world_.player.health.add_effect(make_effect(true, a.cause, a.amount, a.turns));
    }

    void operator()(const HealPlayer& a) {
        world_.player.health.add_effect(make_effect(false, a.cause, a.amount, a.turns));
    }

    void operator()(const RemovePlayerEffect& a) {
        if (!world_.player.health.remove_effect(a.cause)) {
            Log::debug("Action", "removePlayerEffect: no effect '" + a.cause + "'");
        }
    }

    // ── Rules ──

    void operator()(const SetTriggerEnabled& a) {
        if (!ctx_.triggers || !ctx_.triggers->set_enabled(a.trigger, a.enabled)) {
            throw ReferenceError("trigger '" + a.trigger + "' not found");
        }
    }

    void operator()(const ScheduleIn& a) {
        ctx_.scheduler.schedule_at(world_.turn_count + a.turns, a.condition, a.actions,
                                   a.on_false, ctx_.origin, a.note);
    }

    void operator()(const ScheduleAt& a) {
        uint64_t due = a.turn;
        if (due < world_.turn_count) {
            Log::warn("Action", "scheduleAt turn " + std::to_string(a.turn) +
                      " is in the past; clamped to " + std::to_string(world_.turn_count));
            due = world_.turn_count;
        }
        ctx_.scheduler.schedule_at(due, a.condition, a.actions, a.on_false, ctx_.origin, a.note);
    }

private:
    ActionContext& ctx_;
    World& world_;
};

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

const char* action_name(const Action& action) {
    static const char* const NAMES[] = {
        "showMessage", "showRandomMessage", "npcSays",
        "addFlag", "removeFlag", "advanceFlag", "resetFlag", "awardPoints",
        "spawnItemInRoom", "spawnItemCurrentRoom", "spawnItemInInventory", "spawnItemInContainer",
        "despawnItem", "setItemDescription", "restrictItem", "setContainerState", "giveItemToPlayer",
        "revealExit", "lockExit", "unlockExit", "setBarredMessage", "pushPlayerTo",
        "setNpcState", "setNpcMovementActive", "damageNpc", "healNpc",
        "damagePlayer", "healPlayer", "removePlayerEffect",
        "setTriggerEnabled", "scheduleIn", "scheduleAt",
    };
    static_assert(sizeof(NAMES) / sizeof(NAMES[0]) == std::variant_size_v<ActionNode>,
                  "action name table out of sync with ActionNode");
    return NAMES[action.node.index()];
}

void ActionExecutor::execute_one(const Action& action, ActionContext& ctx) {
    Runner runner(ctx);
    std::visit(runner, action.node);
}

ExecutionReport ActionExecutor::execute(const std::vector<Action>& actions, ActionContext& ctx) {
    ExecutionReport report;
    for (const auto& action : actions) {
        try {
            execute_one(action, ctx);
            report.executed++;
        } catch (const ReferenceError& e) {
            report.failed++;
            Log::warn("Action", ctx.origin + ": " + action_name(action) + " skipped: " + e.what());
        }
    }
    return report;
}

} // namespace story::rules
