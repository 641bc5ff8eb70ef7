/**
 * Condition — Boolean expression tree over world state.
 *
 * A closed set of leaf predicates composed by All / Any nodes, stored as a
 * std::variant and evaluated with std::visit. Evaluation is read-only: it
 * never mutates the world and never draws from the RNG.
 *
 *   All([]) == true, Any([]) == false.
 *
 * A leaf that names a room, item, NPC or goal the world does not contain
 * evaluates false and logs a warning; siblings are still evaluated.
 */

#ifndef STORY_RULES_CONDITION_HPP
#define STORY_RULES_CONDITION_HPP

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace story {
class World;
struct Goal;
enum class GoalStatus;
}

namespace story::rules {

struct Event;
struct Condition;

// ── Composites ──

struct AllOf { std::vector<Condition> children; };
struct AnyOf { std::vector<Condition> children; };

// ── Player flags ──

struct HasFlag        { std::string flag; };   // matches flag value, e.g. "door" or "quest#2"
struct MissingFlag    { std::string flag; };
struct FlagInProgress { std::string flag; };   // flag by name, not yet complete
struct FlagComplete   { std::string flag; };

// ── Items and places ──

struct HasItem          { std::string item; };
struct MissingItem      { std::string item; };
struct InRoom           { std::string room; };
struct ReachedRoom      { std::string room; };
struct ContainerHasItem { std::string container; std::string item; };

// ── NPCs ──

struct NpcInState { std::string npc; std::string state; };
struct NpcHasItem { std::string npc; std::string item; };
struct WithNpc    { std::string npc; };

// ── Goals and the triggering event ──

struct GoalComplete  { std::string goal; };
struct EventMatches  { std::string key; std::string value; };

using ConditionNode = std::variant<
    AllOf, AnyOf,
    HasFlag, MissingFlag, FlagInProgress, FlagComplete,
    HasItem, MissingItem, InRoom, ReachedRoom, ContainerHasItem,
    NpcInState, NpcHasItem, WithNpc,
    GoalComplete, EventMatches
>;

struct Condition {
    ConditionNode node;

    Condition() : node(AllOf{}) {}
    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Condition>>>
    Condition(T leaf) : node(std::move(leaf)) {}

    /** Always-true condition (empty All). */
    static Condition always() { return Condition(AllOf{}); }
    static Condition never() { return Condition(AnyOf{}); }

    static Condition all(std::vector<Condition> children) { return Condition(AllOf{std::move(children)}); }
    static Condition any(std::vector<Condition> children) { return Condition(AnyOf{std::move(children)}); }
};

class ConditionEvaluator {
public:
    /**
     * Evaluate a condition. `event` is the event being dispatched, or nullptr
     * when evaluating a scheduled event or goal (EventMatches is then false).
     */
    static bool evaluate(const Condition& cond, const World& world,
                         const Event* event = nullptr);

    /**
     * Merge nested same-kind composites into their parent, recursively.
     * All(a, All(b, c)) -> All(a, b, c). Single-child composites are kept.
     */
    static Condition flatten(const Condition& cond);

    /** One-line summary: "all(hasFlag:a, any(inRoom:hall, hasItem:key))". */
    static std::string describe(const Condition& cond);

    /** Number of nodes in the tree (composites included). */
    static size_t node_count(const Condition& cond);

    /**
     * Failed if failed_when holds; otherwise Inactive if activate_when is
     * present and false; otherwise Complete if finished_when holds, else
     * Active. A goal whose conditions depend on themselves is logged and
     * treated as not complete.
     */
    static GoalStatus goal_status(const Goal& goal, const World& world);
};

} // namespace story::rules

#endif // STORY_RULES_CONDITION_HPP
