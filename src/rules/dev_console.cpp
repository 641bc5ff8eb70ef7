#include "rules/dev_console.hpp"
#include "view/output_buffer.hpp"
#include "world/world.hpp"
#include "core/log.hpp"

namespace story::rules {

std::string DevConsole::format_event(const ScheduledEvent& ev) {
    std::string s = " - turn " + std::to_string(ev.due_turn) +
                    " | id " + std::to_string(ev.id) +
                    " | actions: " + std::to_string(ev.actions.size());
    s += "\n   on_false: " + ev.on_false.summary();
    s += "\n   cond: " + ConditionEvaluator::describe(ev.condition);
    if (!ev.origin_trigger.empty()) s += "\n   from: " + ev.origin_trigger;
    if (!ev.note.empty()) s += "\n   note: " + ev.note;
    return s;
}

void DevConsole::list_pending(const Scheduler& scheduler, const World& world,
                              OutputBuffer& view) {
    auto pending = scheduler.pending();
    if (pending.empty()) {
        view.push(OutputTag::SYSTEM, "No events currently scheduled.");
        Log::warn("Dev", "sched: listed schedule (empty)");
        return;
    }

    std::string text = "Scheduled events [" + std::to_string(pending.size()) +
                       "], current turn = " + std::to_string(world.turn_count) + ":";
    for (const auto* ev : pending) {
        text += "\n" + format_event(*ev);
    }
    view.push(OutputTag::SYSTEM, text);
    Log::warn("Dev", "sched: listed " + std::to_string(pending.size()) + " events");
}

bool DevConsole::cancel(Scheduler& scheduler, EventId id, const World& world,
                        OutputBuffer& view) {
    const ScheduledEvent* ev = scheduler.find(id);
    if (!ev) {
        view.push(OutputTag::FAILURE, "No scheduled event with id " + std::to_string(id) + ".");
        Log::warn("Dev", "cancel: no pending event #" + std::to_string(id));
        return false;
    }

    std::string note = ev->note;
    scheduler.cancel(id, world.turn_count);
    Log::warn("Dev", "cancelled event #" + std::to_string(id) +
              (note.empty() ? "" : " (" + note + ")"));
    view.push(OutputTag::SUCCESS, "Scheduled event " + std::to_string(id) + " canceled.");
    return true;
}

bool DevConsole::delay(Scheduler& scheduler, EventId id, uint64_t turns, const World& world,
                       OutputBuffer& view) {
    const ScheduledEvent* original = scheduler.find(id);
    uint64_t old_due = original ? original->due_turn : 0;
    std::optional<EventId> successor = scheduler.delay(id, turns, world.turn_count);
    if (!successor) {
        view.push(OutputTag::FAILURE, "No scheduled event with id " + std::to_string(id) + ".");
        Log::warn("Dev", "delay: no pending event #" + std::to_string(id));
        return false;
    }

    const ScheduledEvent* moved = scheduler.find(*successor);
    uint64_t due = moved ? moved->due_turn : old_due;
    turns = due - old_due;
    Log::warn("Dev", "delayed event #" + std::to_string(id) + " by " + std::to_string(turns) +
              " turns as #" + std::to_string(*successor) + " (due " + std::to_string(due) + ")");
    view.push(OutputTag::SUCCESS, "Scheduled event " + std::to_string(id) + " delayed by " +
              std::to_string(turns) + " turn(s) (now id " + std::to_string(*successor) +
              " on turn " + std::to_string(due) + ").");
    return true;
}

} // namespace story::rules
