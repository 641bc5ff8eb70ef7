/**
 * TriggerRegistry — Authored triggers, bucketed by the event kind they react to.
 *
 * Registration order is authoring order and doubles as priority: within a
 * bucket, triggers are checked one after another, and each sees the world as
 * left by the triggers that fired before it.
 *
 * Triggers are immutable after load except for their enabled/fired state and
 * fire history, which is what export_state()/import_state() persist.
 */

#ifndef STORY_RULES_TRIGGER_REGISTRY_HPP
#define STORY_RULES_TRIGGER_REGISTRY_HPP

#include "rules/action.hpp"
#include "rules/condition.hpp"
#include "rules/event.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace story {
class World;
class OutputBuffer;
}

namespace story::rules {

class Scheduler;

struct EventMatcher {
    EventKind kind = EventKind::ALWAYS;
    std::map<std::string, std::string> params;   // each must equal the event's

    bool matches(const Event& event) const;
};

struct Trigger {
    std::string id;
    std::string name;
    EventMatcher matcher;
    Condition condition;
    std::vector<Action> actions;
    bool fire_once = false;

    // Mutable state
    bool enabled = true;
    bool fired = false;
    uint64_t fire_count = 0;
    std::optional<uint64_t> last_fired_turn;
};

struct TriggerState {
    std::string id;
    bool enabled = true;
    bool fired = false;
    uint64_t fire_count = 0;
    std::optional<uint64_t> last_fired_turn;
};

class TriggerRegistry {
public:
    /**
     * Register a trigger. Its condition is flattened here.
     * @throws LoadError on a duplicate id
     */
    void add(Trigger trigger);

    /**
     * Fire every eligible trigger for `event` in registration order.
     * Returns the ids of the triggers that fired.
     */
    std::vector<std::string> check_triggers(const Event& event, World& world,
                                            OutputBuffer& view, Scheduler& scheduler);

    std::vector<std::string> check_triggers(EventKind kind,
                                            const std::map<std::string, std::string>& params,
                                            World& world, OutputBuffer& view,
                                            Scheduler& scheduler) {
        return check_triggers(Event(kind, params), world, view, scheduler);
    }

    const Trigger* find(const std::string& id) const;

    /** False if `id` is unknown. */
    bool set_enabled(const std::string& id, bool enabled);

    const std::vector<Trigger>& triggers() const { return triggers_; }
    size_t size() const { return triggers_.size(); }

    std::vector<TriggerState> export_state() const;

    /**
     * Apply persisted trigger state. All-or-nothing.
     * @throws LoadError if a state names an unknown trigger
     */
    void import_state(const std::vector<TriggerState>& states);

private:
    std::vector<Trigger> triggers_;
    std::unordered_map<std::string, size_t> id_to_index_;
    std::map<EventKind, std::vector<size_t>> by_kind_;

    bool eligible(const Trigger& t, const Event& event, const World& world) const;
};

} // namespace story::rules

#endif // STORY_RULES_TRIGGER_REGISTRY_HPP
