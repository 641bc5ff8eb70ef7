#include "rules/trigger_registry.hpp"
#include "rules/scheduler.hpp"
#include "view/output_buffer.hpp"
#include "world/world.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

namespace story::rules {

bool EventMatcher::matches(const Event& event) const {
    if (event.kind != kind) return false;
    for (const auto& kv : params) {
        auto it = event.params.find(kv.first);
        if (it == event.params.end() || it->second != kv.second) return false;
    }
    return true;
}

void TriggerRegistry::add(Trigger trigger) {
    if (id_to_index_.count(trigger.id)) {
        throw LoadError("duplicate trigger id '" + trigger.id + "'");
    }
    trigger.condition = ConditionEvaluator::flatten(trigger.condition);

    size_t idx = triggers_.size();
    id_to_index_[trigger.id] = idx;
    by_kind_[trigger.matcher.kind].push_back(idx);
    triggers_.push_back(std::move(trigger));
}

bool TriggerRegistry::eligible(const Trigger& t, const Event& event, const World& world) const {
    if (!t.enabled) return false;
    if (t.fire_once && t.fired) return false;
    if (!t.matcher.matches(event)) return false;
    return ConditionEvaluator::evaluate(t.condition, world, &event);
}

std::vector<std::string> TriggerRegistry::check_triggers(const Event& event, World& world,
                                                         OutputBuffer& view,
                                                         Scheduler& scheduler) {
    std::vector<std::string> fired;

    auto bucket = by_kind_.find(event.kind);
    if (bucket == by_kind_.end()) return fired;

    // Actions may toggle `enabled` on entries later in this bucket.
    for (size_t idx : bucket->second) {
        if (!eligible(triggers_[idx], event, world)) continue;

        Trigger& t = triggers_[idx];
        t.fired = true;
        t.fire_count++;
        t.last_fired_turn = world.turn_count;
        fired.push_back(t.id);

        Log::info("Trigger", "'" + t.id + "' fired on " + event_kind_name(event.kind) +
                  " (turn " + std::to_string(world.turn_count) + ")");

        ActionContext ctx{world, view, scheduler, this, t.id};
        ExecutionReport report = ActionExecutor::execute(t.actions, ctx);
        if (report.failed > 0) {
            Log::warn("Trigger", "'" + t.id + "': " + std::to_string(report.failed) + " of " +
                      std::to_string(t.actions.size()) + " actions failed");
        }
    }
    return fired;
}

const Trigger* TriggerRegistry::find(const std::string& id) const {
    auto it = id_to_index_.find(id);
    return it == id_to_index_.end() ? nullptr : &triggers_[it->second];
}

bool TriggerRegistry::set_enabled(const std::string& id, bool enabled) {
    auto it = id_to_index_.find(id);
    if (it == id_to_index_.end()) return false;
    triggers_[it->second].enabled = enabled;
    return true;
}

std::vector<TriggerState> TriggerRegistry::export_state() const {
    std::vector<TriggerState> out;
    out.reserve(triggers_.size());
    for (const auto& t : triggers_) {
        out.push_back({t.id, t.enabled, t.fired, t.fire_count, t.last_fired_turn});
    }
    return out;
}

void TriggerRegistry::import_state(const std::vector<TriggerState>& states) {
    for (const auto& s : states) {
        if (!id_to_index_.count(s.id)) {
            throw LoadError("saved state names unknown trigger '" + s.id + "'");
        }
    }
    for (const auto& s : states) {
        Trigger& t = triggers_[id_to_index_.at(s.id)];
        t.enabled = s.enabled;
        t.fired = s.fired;
        t.fire_count = s.fire_count;
        t.last_fired_turn = s.last_fired_turn;
    }
}

} // namespace story::rules
