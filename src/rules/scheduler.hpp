/**
 * Scheduler — Turn-ordered queue of deferred condition+action bundles.
 *
 * Pending events are ordered by (due_turn, id). Ids are handed out from a
 * monotonically increasing counter, so id order is insertion order and ties
 * on due_turn resolve FIFO. An id is never reused: every consumed event
 * leaves a tombstone under its id, and a retried or delayed event re-enters
 * the queue under a fresh id.
 *
 * drain_due() resolves every event due at or before the current turn that
 * existed when the pass began. Events inserted while the pass runs (by the
 * actions it executes, or as retry clones) wait for a later pass.
 */

#ifndef STORY_RULES_SCHEDULER_HPP
#define STORY_RULES_SCHEDULER_HPP

#include "rules/action.hpp"
#include "rules/condition.hpp"
#include "rules/on_false_policy.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace story {
class World;
class OutputBuffer;
}

namespace story::rules {

class TriggerRegistry;

using EventId = uint64_t;

struct ScheduledEvent {
    EventId id = 0;
    uint64_t due_turn = 0;
    Condition condition;
    std::vector<Action> actions;
    OnFalsePolicy on_false;
    std::string origin_trigger;
    std::string note;
};

enum class EventStatus {
    FIRED,
    CANCELLED,
    RESCHEDULED
};

const char* event_status_name(EventStatus status);
bool parse_event_status(const std::string& name, EventStatus& out);

struct Tombstone {
    EventId id = 0;
    EventStatus status = EventStatus::FIRED;
    uint64_t resolved_turn = 0;
    EventId successor = 0;      // RESCHEDULED only; 0 = none
    std::string note;
};

/** One terminal outcome produced by drain_due(). */
struct Resolution {
    EventId id = 0;
    EventStatus status = EventStatus::FIRED;
    EventId successor = 0;
    uint64_t due_turn = 0;
};

class Scheduler {
public:
    Scheduler() = default;

    // ── Insertion ──

    EventId schedule_at(uint64_t due_turn, Condition condition, std::vector<Action> actions,
                        OnFalsePolicy on_false = OnFalsePolicy::cancel(),
                        const std::string& origin = "", const std::string& note = "");

    EventId schedule_in(uint64_t current_turn, uint64_t turns, Condition condition,
                        std::vector<Action> actions,
                        OnFalsePolicy on_false = OnFalsePolicy::cancel(),
                        const std::string& origin = "", const std::string& note = "") {
        return schedule_at(current_turn + turns, std::move(condition), std::move(actions),
                           on_false, origin, note);
    }

    // ── Turn processing ──

    /**
     * Resolve all events with due_turn <= current_turn, in (due_turn, id)
     * order. Each resolves exactly once: Fired, Cancelled, or Rescheduled.
     */
    std::vector<Resolution> drain_due(uint64_t current_turn, World& world, OutputBuffer& view,
                                      TriggerRegistry* triggers = nullptr);

    // ── Debug operations ──

    /** Pending events in processing order. */
    std::vector<const ScheduledEvent*> pending() const;

    const ScheduledEvent* find(EventId id) const;
    const Tombstone* tombstone(EventId id) const;

    /** Tombstone a pending event as Cancelled. False if `id` is not pending. */
    bool cancel(EventId id, uint64_t current_turn);

    /**
     * Tombstone a pending event as Rescheduled and re-insert it `turns` later
     * than its old due turn under a new id. Returns the new id.
     */
    std::optional<EventId> delay(EventId id, uint64_t turns, uint64_t current_turn);

    /** Drop tombstones resolved before `before_turn`. Returns the number dropped. */
    size_t compact_tombstones(uint64_t before_turn);

    size_t pending_count() const { return events_.size(); }
    size_t tombstone_count() const { return tombstones_.size(); }
    EventId next_id() const { return next_id_; }
    const std::map<EventId, Tombstone>& tombstones() const { return tombstones_; }

    // ── Persistence ──

    struct State {
        EventId next_id = 1;
        std::vector<ScheduledEvent> pending;
        std::vector<Tombstone> tombstones;
    };

    State export_state() const;

    /**
     * @throws QueueCorruption if `state` could not come from a valid session:
     *         duplicate ids, an id at or above next_id, or a pending event
     *         due before `current_turn`.
     */
    static void validate(const State& state, uint64_t current_turn);

    /** Replace the queue. Call validate() first; this does not. */
    void import_state(State state);

private:
    using Key = std::pair<uint64_t, EventId>;   // (due_turn, id)

    EventId next_id_ = 1;
    std::set<Key> order_;
    std::map<EventId, ScheduledEvent> events_;
    std::map<EventId, Tombstone> tombstones_;

    EventId insert(ScheduledEvent&& ev);
    ScheduledEvent take(EventId id);
    void bury(EventId id, EventStatus status, uint64_t turn, EventId successor,
              const std::string& note);
};

} // namespace story::rules

#endif // STORY_RULES_SCHEDULER_HPP
