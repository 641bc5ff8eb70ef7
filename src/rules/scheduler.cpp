#include "rules/scheduler.hpp"
#include "rules/trigger_registry.hpp"
#include "view/output_buffer.hpp"
#include "world/world.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include <unordered_set>

namespace story::rules {

// ═══════════════════════════════════════════════════════════════
// OnFalsePolicy
// ═══════════════════════════════════════════════════════════════

OnFalsePolicy OnFalsePolicy::retry_after(int64_t turns) {
    if (turns < 1) {
        Log::warn("Scheduler", "retry delay " + std::to_string(turns) + " clamped to 1 turn");
        turns = 1;
    }
    return {OnFalseKind::RETRY_AFTER, static_cast<uint64_t>(turns)};
}

std::string OnFalsePolicy::summary() const {
    switch (kind) {
        case OnFalseKind::CANCEL:          return "cancel";
        case OnFalseKind::RETRY_AFTER:     return "retry+" + std::to_string(retry_turns());
        case OnFalseKind::RETRY_NEXT_TURN: return "retry-next";
    }
    return "cancel";
}

const char* event_status_name(EventStatus status) {
    switch (status) {
        case EventStatus::FIRED:       return "fired";
        case EventStatus::CANCELLED:   return "cancelled";
        case EventStatus::RESCHEDULED: return "rescheduled";
    }
    return "fired";
}

bool parse_event_status(const std::string& name, EventStatus& out) {
    if (name == "fired")       { out = EventStatus::FIRED;       return true; }
    if (name == "cancelled")   { out = EventStatus::CANCELLED;   return true; }
    if (name == "rescheduled") { out = EventStatus::RESCHEDULED; return true; }
    return false;
}

// ═══════════════════════════════════════════════════════════════
// Queue primitives
// ═══════════════════════════════════════════════════════════════

EventId Scheduler::insert(ScheduledEvent&& ev) {
    ev.id = next_id_++;
    EventId id = ev.id;
    order_.insert({ev.due_turn, id});
    events_.emplace(id, std::move(ev));
    return id;
}

ScheduledEvent Scheduler::take(EventId id) {
    auto it = events_.find(id);
    ScheduledEvent ev = std::move(it->second);
    events_.erase(it);
    order_.erase({ev.due_turn, id});
    return ev;
}

void Scheduler::bury(EventId id, EventStatus status, uint64_t turn, EventId successor,
                     const std::string& note) {
    tombstones_[id] = Tombstone{id, status, turn, successor, note};
}

EventId Scheduler::schedule_at(uint64_t due_turn, Condition condition, std::vector<Action> actions,
                               OnFalsePolicy on_false, const std::string& origin,
                               const std::string& note) {
    ScheduledEvent ev;
    ev.due_turn = due_turn;
    ev.condition = std::move(condition);
    ev.actions = std::move(actions);
    ev.on_false = on_false;
    ev.origin_trigger = origin;
    ev.note = note;
    EventId id = insert(std::move(ev));

    Log::debug("Scheduler", "event #" + std::to_string(id) + " due turn " +
               std::to_string(due_turn) + (note.empty() ? "" : " (" + note + ")"));
    return id;
}

// ═══════════════════════════════════════════════════════════════
// Drain
// ═══════════════════════════════════════════════════════════════

std::vector<Resolution> Scheduler::drain_due(uint64_t current_turn, World& world,
                                             OutputBuffer& view, TriggerRegistry* triggers) {
    // Anything inserted from here on has id >= watermark and waits for the next pass.
    const EventId watermark = next_id_;

    std::vector<Key> due;
    for (const auto& key : order_) {
        if (key.first > current_turn) break;
        if (key.second < watermark) due.push_back(key);
    }

    std::vector<Resolution> resolutions;
    for (const auto& key : due) {
        EventId id = key.second;
        if (events_.find(id) == events_.end()) continue;   // removed by an earlier action

        ScheduledEvent ev = take(id);
        std::string label = "event #" + std::to_string(id) +
                            (ev.note.empty() ? "" : " (" + ev.note + ")");

        if (ConditionEvaluator::evaluate(ev.condition, world)) {
            bury(id, EventStatus::FIRED, current_turn, 0, ev.note);
            resolutions.push_back({id, EventStatus::FIRED, 0, ev.due_turn});
            Log::info("Scheduler", "turn " + std::to_string(current_turn) + ": " + label + " fired");

            ActionContext ctx{world, view, *this, triggers,
                              ev.origin_trigger.empty() ? label : ev.origin_trigger};
            ActionExecutor::execute(ev.actions, ctx);
            continue;
        }

        if (!ev.on_false.retries()) {
            bury(id, EventStatus::CANCELLED, current_turn, 0, ev.note);
            resolutions.push_back({id, EventStatus::CANCELLED, 0, ev.due_turn});
            Log::info("Scheduler", "turn " + std::to_string(current_turn) + ": " + label +
                      " condition false; cancelled");
            continue;
        }

        uint64_t old_due = ev.due_turn;
        ev.due_turn = current_turn + ev.on_false.retry_turns();
        std::string note = ev.note;
        EventId successor = insert(std::move(ev));
        bury(id, EventStatus::RESCHEDULED, current_turn, successor, note);
        resolutions.push_back({id, EventStatus::RESCHEDULED, successor, old_due});
        Log::info("Scheduler", "turn " + std::to_string(current_turn) + ": " + label +
                  " condition false; retry as #" + std::to_string(successor));
    }

    return resolutions;
}

// ═══════════════════════════════════════════════════════════════
// Debug operations
// ═══════════════════════════════════════════════════════════════

std::vector<const ScheduledEvent*> Scheduler::pending() const {
    std::vector<const ScheduledEvent*> out;
    out.reserve(order_.size());
    for (const auto& key : order_) {
        out.push_back(&events_.at(key.second));
    }
    return out;
}

const ScheduledEvent* Scheduler::find(EventId id) const {
    auto it = events_.find(id);
    return it == events_.end() ? nullptr : &it->second;
}

const Tombstone* Scheduler::tombstone(EventId id) const {
    auto it = tombstones_.find(id);
    return it == tombstones_.end() ? nullptr : &it->second;
}

bool Scheduler::cancel(EventId id, uint64_t current_turn) {
    if (!find(id)) return false;
    ScheduledEvent ev = take(id);
    bury(id, EventStatus::CANCELLED, current_turn, 0, ev.note);
    return true;
}

std::optional<EventId> Scheduler::delay(EventId id, uint64_t turns, uint64_t current_turn) {
    if (!find(id)) return std::nullopt;
    if (turns < 1) {
        Log::warn("Scheduler", "delay of 0 turns clamped to 1");
        turns = 1;
    }
    ScheduledEvent ev = take(id);
    ev.due_turn += turns;
    std::string note = ev.note;
    EventId successor = insert(std::move(ev));
    bury(id, EventStatus::RESCHEDULED, current_turn, successor, note);
    return successor;
}

size_t Scheduler::compact_tombstones(uint64_t before_turn) {
    size_t dropped = 0;
    for (auto it = tombstones_.begin(); it != tombstones_.end();) {
        if (it->second.resolved_turn < before_turn) {
            it = tombstones_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    return dropped;
}

// ═══════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════

Scheduler::State Scheduler::export_state() const {
    State s;
    s.next_id = next_id_;
    for (const auto* ev : pending()) s.pending.push_back(*ev);
    for (const auto& kv : tombstones_) s.tombstones.push_back(kv.second);
    return s;
}

void Scheduler::validate(const State& state, uint64_t current_turn) {
    std::unordered_set<EventId> seen;

    for (const auto& t : state.tombstones) {
        if (t.id == 0 || t.id >= state.next_id) {
            throw QueueCorruption("tombstone id " + std::to_string(t.id) +
                                  " outside issued range (next id " +
                                  std::to_string(state.next_id) + ")");
        }
        if (!seen.insert(t.id).second) {
            throw QueueCorruption("duplicate tombstone id " + std::to_string(t.id));
        }
    }

    for (const auto& ev : state.pending) {
        if (ev.id == 0 || ev.id >= state.next_id) {
            throw QueueCorruption("pending id " + std::to_string(ev.id) +
                                  " outside issued range (next id " +
                                  std::to_string(state.next_id) + ")");
        }
        if (!seen.insert(ev.id).second) {
            throw QueueCorruption("duplicate event id " + std::to_string(ev.id));
        }
        if (ev.due_turn < current_turn) {
            throw QueueCorruption("event #" + std::to_string(ev.id) + " due turn " +
                                  std::to_string(ev.due_turn) + " precedes current turn " +
                                  std::to_string(current_turn));
        }
    }
}

void Scheduler::import_state(State state) {
    next_id_ = state.next_id;
    order_.clear();
    events_.clear();
    tombstones_.clear();

    for (auto& ev : state.pending) {
        EventId id = ev.id;
        order_.insert({ev.due_turn, id});
        events_.emplace(id, std::move(ev));
    }
    for (auto& t : state.tombstones) {
        tombstones_.emplace(t.id, std::move(t));
    }
}

} // namespace story::rules
