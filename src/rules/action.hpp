/**
 * Action — One step of an authored effect list, and the executor that runs them.
 *
 * Actions form a closed variant. Scheduling actions carry a nested action
 * list that is stored, not run, until the scheduled event resolves.
 *
 * Execution is best-effort: an action that names something missing raises
 * ReferenceError internally, is logged and skipped, and the remaining
 * actions still run.
 */

#ifndef STORY_RULES_ACTION_HPP
#define STORY_RULES_ACTION_HPP

#include "rules/condition.hpp"
#include "rules/on_false_policy.hpp"
#include "world/world.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace story {
class OutputBuffer;
}

namespace story::rules {

class Scheduler;
class TriggerRegistry;
struct Action;

// ── Messages ──

struct ShowMessage       { std::string text; };
struct ShowRandomMessage { std::string spinner; };
struct NpcSays           { std::string npc; std::string quote; };

// ── Flags and score ──

struct AddFlag     { std::string flag; bool sequence = false; std::optional<uint32_t> end; };
struct RemoveFlag  { std::string flag; };
struct AdvanceFlag { std::string flag; };
struct ResetFlag   { std::string flag; };
struct AwardPoints { int64_t amount = 0; std::string reason; };

// ── Items ──

struct SpawnItemInRoom      { std::string item; std::string room; };
struct SpawnItemCurrentRoom { std::string item; };
struct SpawnItemInInventory { std::string item; };
struct SpawnItemInContainer { std::string item; std::string container; };
struct DespawnItem          { std::string item; };
struct SetItemDescription   { std::string item; std::string text; };
struct RestrictItem         { std::string item; bool restricted = true; };
struct SetContainerState    { std::string item; ContainerState state = ContainerState::CLOSED; };
struct GiveItemToPlayer     { std::string npc; std::string item; };

// ── Exits and movement ──

struct RevealExit       { std::string room; std::string direction; };
struct LockExit         { std::string room; std::string direction; };
struct UnlockExit       { std::string room; std::string direction; };
struct SetBarredMessage { std::string room; std::string direction; std::string message; };
struct PushPlayerTo     { std::string room; };

// ── NPCs ──

struct SetNpcState          { std::string npc; std::string state; };
struct SetNpcMovementActive { std::string npc; bool active = true; };
struct DamageNpc            { std::string npc; std::string cause; uint32_t amount = 0; uint32_t turns = 0; };
struct HealNpc              { std::string npc; std::string cause; uint32_t amount = 0; uint32_t turns = 0; };

// ── Player health ──

struct DamagePlayer       { std::string cause; uint32_t amount = 0; uint32_t turns = 0; };  // 0 = instant
struct HealPlayer         { std::string cause; uint32_t amount = 0; uint32_t turns = 0; };
struct RemovePlayerEffect { std::string cause; };

// ── Rules ──

struct SetTriggerEnabled { std::string trigger; bool enabled = true; };

struct ScheduleIn {
    uint64_t turns = 1;
    Condition condition;
    std::vector<Action> actions;
    OnFalsePolicy on_false;
    std::string note;
};

struct ScheduleAt {
    uint64_t turn = 0;
    Condition condition;
    std::vector<Action> actions;
    OnFalsePolicy on_false;
    std::string note;
};

using ActionNode = std::variant<
    ShowMessage, ShowRandomMessage, NpcSays,
    AddFlag, RemoveFlag, AdvanceFlag, ResetFlag, AwardPoints,
    SpawnItemInRoom, SpawnItemCurrentRoom, SpawnItemInInventory, SpawnItemInContainer,
    DespawnItem, SetItemDescription, RestrictItem, SetContainerState, GiveItemToPlayer,
    RevealExit, LockExit, UnlockExit, SetBarredMessage, PushPlayerTo,
    SetNpcState, SetNpcMovementActive, DamageNpc, HealNpc,
    DamagePlayer, HealPlayer, RemovePlayerEffect,
    SetTriggerEnabled, ScheduleIn, ScheduleAt
>;

struct Action {
    ActionNode node;

    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Action>>>
    Action(T step) : node(std::move(step)) {}
};

/** camelCase name of the action's type ("showMessage", "scheduleIn", ...). */
const char* action_name(const Action& action);

// ══════════════════════════════════════════════════════════════

struct ActionContext {
    World& world;
    OutputBuffer& view;
    Scheduler& scheduler;
    TriggerRegistry* triggers = nullptr;   // needed by SetTriggerEnabled only
    std::string origin;                    // trigger id or "event#N", for logs
};

struct ExecutionReport {
    size_t executed = 0;
    size_t failed = 0;
};

class ActionExecutor {
public:
    /** Run `actions` in order. Failing actions are logged and skipped. */
    static ExecutionReport execute(const std::vector<Action>& actions, ActionContext& ctx);

    /**
     * Run a single action.
     * @throws ReferenceError if it names something the world does not contain
     */
    static void execute_one(const Action& action, ActionContext& ctx);
};

} // namespace story::rules

#endif // STORY_RULES_ACTION_HPP
