#include "rules/condition.hpp"
#include "rules/event.hpp"
#include "world/world.hpp"
#include "core/log.hpp"
#include <algorithm>

namespace story::rules {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void missing(const char* what, const std::string& id, const char* leaf) {
    Log::warn("Condition", std::string(leaf) + ": " + what + " '" + id + "' not found");
}

// ═══════════════════════════════════════════════════════════════
// Evaluation visitor
// ═══════════════════════════════════════════════════════════════

class Evaluator {
public:
    Evaluator(const World& world, const Event* event)
        : world_(world), event_(event) {}

    bool eval(const Condition& c) {
        return std::visit([this](const auto& leaf) { return (*this)(leaf); }, c.node);
    }

    GoalStatus status_of(const Goal& goal) {
        if (std::find(goal_stack_.begin(), goal_stack_.end(), goal.id) != goal_stack_.end()) {
            Log::warn("Condition", "goal '" + goal.id + "' depends on itself; treated as incomplete");
            return GoalStatus::ACTIVE;
        }
        goal_stack_.push_back(goal.id);

        GoalStatus status;
        if (goal.failed_when && eval(*goal.failed_when)) {
            status = GoalStatus::FAILED;
        } else if (goal.activate_when && !eval(*goal.activate_when)) {
            status = GoalStatus::INACTIVE;
        } else if (eval(goal.finished_when)) {
            status = GoalStatus::COMPLETE;
        } else {
            status = GoalStatus::ACTIVE;
        }

        goal_stack_.pop_back();
        return status;
    }

    // ── Composites: short-circuit ──

    bool operator()(const AllOf& n) {
        for (const auto& child : n.children) {
            if (!eval(child)) return false;
        }
        return true;
    }

    bool operator()(const AnyOf& n) {
        for (const auto& child : n.children) {
            if (eval(child)) return true;
        }
        return false;
    }

    // ── Flags ──

    bool operator()(const HasFlag& n)     { return world_.player.has_flag_value(n.flag); }
    bool operator()(const MissingFlag& n) { return !world_.player.has_flag_value(n.flag); }

    bool operator()(const FlagInProgress& n) {
        const Flag* f = world_.player.find_flag(n.flag);
        return f && !f->is_complete();
    }

    bool operator()(const FlagComplete& n) {
        const Flag* f = world_.player.find_flag(n.flag);
        return f && f->is_complete();
    }

    // ── Items and places ──

    bool operator()(const HasItem& n) {
        if (!world_.item(n.item)) { missing("item", n.item, "hasItem"); return false; }
        return world_.player_has_item(n.item);
    }

    bool operator()(const MissingItem& n) {
        if (!world_.item(n.item)) { missing("item", n.item, "missingItem"); return false; }
        return !world_.player_has_item(n.item);
    }

    bool operator()(const InRoom& n) {
        if (!world_.room(n.room)) { missing("room", n.room, "inRoom"); return false; }
        return world_.player_room() == n.room;
    }

    bool operator()(const ReachedRoom& n) {
        const Room* r = world_.room(n.room);
        if (!r) { missing("room", n.room, "reachedRoom"); return false; }
        return r->visited;
    }

    bool operator()(const ContainerHasItem& n) {
        if (!world_.item(n.container)) { missing("container", n.container, "containerHasItem"); return false; }
        const Item* i = world_.item(n.item);
        if (!i) { missing("item", n.item, "containerHasItem"); return false; }
        return i->location == Location::item(n.container);
    }

    // ── NPCs ──

    bool operator()(const NpcInState& n) {
        const Npc* npc = world_.npc(n.npc);
        if (!npc) { missing("npc", n.npc, "npcInState"); return false; }
        return npc->state == n.state;
    }

    bool operator()(const NpcHasItem& n) {
        if (!world_.npc(n.npc)) { missing("npc", n.npc, "npcHasItem"); return false; }
        const Item* i = world_.item(n.item);
        if (!i) { missing("item", n.item, "npcHasItem"); return false; }
        return i->location == Location::npc(n.npc);
    }

    bool operator()(const WithNpc& n) {
        const Npc* npc = world_.npc(n.npc);
        if (!npc) { missing("npc", n.npc, "withNpc"); return false; }
        return npc->location == world_.player.location;
    }

    // ── Goals and events ──

    bool operator()(const GoalComplete& n) {
        const Goal* g = world_.goal(n.goal);
        if (!g) { missing("goal", n.goal, "goalComplete"); return false; }
        return status_of(*g) == GoalStatus::COMPLETE;
    }

    bool operator()(const EventMatches& n) {
        if (!event_) return false;
        auto it = event_->params.find(n.key);
        return it != event_->params.end() && it->second == n.value;
    }

private:
    const World& world_;
    const Event* event_;
    std::vector<std::string> goal_stack_;
};

// ═══════════════════════════════════════════════════════════════
// Flattening
// ═══════════════════════════════════════════════════════════════

template<typename Composite>
Composite flatten_into(const std::vector<Condition>& children) {
    Composite out;
    for (const auto& child : children) {
        Condition flat = ConditionEvaluator::flatten(child);
        if (auto* same = std::get_if<Composite>(&flat.node)) {
            for (auto& grandchild : same->children) {
                out.children.push_back(std::move(grandchild));
            }
        } else {
            out.children.push_back(std::move(flat));
        }
    }
    return out;
}

std::string join_children(const char* name, const std::vector<Condition>& children) {
    std::string s = std::string(name) + "(";
    for (size_t i = 0; i < children.size(); i++) {
        if (i > 0) s += ", ";
        s += ConditionEvaluator::describe(children[i]);
    }
    return s + ")";
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

bool ConditionEvaluator::evaluate(const Condition& cond, const World& world,
                                  const Event* event) {
    Evaluator ev(world, event);
    return ev.eval(cond);
}

GoalStatus ConditionEvaluator::goal_status(const Goal& goal, const World& world) {
    Evaluator ev(world, nullptr);
    return ev.status_of(goal);
}

Condition ConditionEvaluator::flatten(const Condition& cond) {
    if (const auto* all = std::get_if<AllOf>(&cond.node)) {
        return Condition(flatten_into<AllOf>(all->children));
    }
    if (const auto* any = std::get_if<AnyOf>(&cond.node)) {
        return Condition(flatten_into<AnyOf>(any->children));
    }
    return cond;
}

std::string ConditionEvaluator::describe(const Condition& cond) {
    return std::visit(overloaded{
        [](const AllOf& n)            { return join_children("all", n.children); },
        [](const AnyOf& n)            { return join_children("any", n.children); },
        [](const HasFlag& n)          { return "hasFlag:" + n.flag; },
        [](const MissingFlag& n)      { return "missingFlag:" + n.flag; },
        [](const FlagInProgress& n)   { return "flagInProgress:" + n.flag; },
        [](const FlagComplete& n)     { return "flagComplete:" + n.flag; },
        [](const HasItem& n)          { return "hasItem:" + n.item; },
        [](const MissingItem& n)      { return "missingItem:" + n.item; },
        [](const InRoom& n)           { return "inRoom:" + n.room; },
        [](const ReachedRoom& n)      { return "reachedRoom:" + n.room; },
        [](const ContainerHasItem& n) { return "containerHasItem:" + n.container + "/" + n.item; },
        [](const NpcInState& n)       { return "npcInState:" + n.npc + "=" + n.state; },
        [](const NpcHasItem& n)       { return "npcHasItem:" + n.npc + "/" + n.item; },
        [](const WithNpc& n)          { return "withNpc:" + n.npc; },
        [](const GoalComplete& n)     { return "goalComplete:" + n.goal; },
        [](const EventMatches& n)     { return "event:" + n.key + "=" + n.value; },
    }, cond.node);
}

size_t ConditionEvaluator::node_count(const Condition& cond) {
    const std::vector<Condition>* children = nullptr;
    if (const auto* all = std::get_if<AllOf>(&cond.node)) children = &all->children;
    if (const auto* any = std::get_if<AnyOf>(&cond.node)) children = &any->children;

    size_t n = 1;
    if (children) {
        for (const auto& c : *children) n += node_count(c);
    }
    return n;
}

} // namespace story::rules
