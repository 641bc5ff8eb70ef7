#include "replay/script_runner.hpp"
#include "io/json_reader.hpp"
#include "io/rule_codec.hpp"
#include "io/snapshot.hpp"
#include "rules/dev_console.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

namespace story {

using rules::Event;
using rules::EventKind;

ScriptRunner::ScriptRunner(StoryBundle bundle, rules::CoreConfig config)
    : world_(std::move(bundle.world)),
      triggers_(std::move(bundle.triggers)),
      coordinator_(triggers_, scheduler_, std::move(config)) {
    if (coordinator_.config().seed) {
        world_.rng.reseed(*coordinator_.config().seed);
    }
    coordinator_.set_last_processed_turn(world_.turn_count);
}

// ═══════════════════════════════════════════════════════════════
// Movement
// ═══════════════════════════════════════════════════════════════

void ScriptRunner::move_player(const std::string& room_id, std::vector<std::string>& fired) {
    std::string from = world_.player_room();
    if (!from.empty()) {
        auto left = triggers_.check_triggers(Event(EventKind::LEAVE, {{"room", from}}),
                                             world_, view_, scheduler_);
        fired.insert(fired.end(), left.begin(), left.end());
    }

    Room& dest = world_.require_room(room_id);
    world_.player.location = Location::room(room_id);
    dest.visited = true;
    view_.push(OutputTag::TRANSIT, dest.name);

    auto entered = triggers_.check_triggers(Event(EventKind::ENTER, {{"room", room_id}}),
                                            world_, view_, scheduler_);
    fired.insert(fired.end(), entered.begin(), entered.end());
}

bool ScriptRunner::go(const JsonValue& command, std::vector<std::string>& fired) {
    if (command.has("room")) {
        const std::string& room = RuleCodec::require_string(command, "room", "go");
        if (!world_.room(room)) {
            view_.push(OutputTag::ERROR, "No such room: " + room);
            return false;
        }
        move_player(room, fired);
        return true;
    }

    const std::string& dir = RuleCodec::require_string(command, "direction", "go");
    const Room* here = world_.room(world_.player_room());
    const Exit* exit = here ? here->find_exit(dir) : nullptr;
    if (!exit || exit->hidden) {
        view_.push(OutputTag::FAILURE, "You can't go that way.");
        return false;
    }
    if (exit->locked) {
        view_.push(OutputTag::FAILURE, exit->barred_message.empty()
                                           ? std::string("The way is locked.")
                                           : exit->barred_message);
        return false;
    }
    move_player(exit->to, fired);
    return true;
}

// ═══════════════════════════════════════════════════════════════
// Command dispatch
// ═══════════════════════════════════════════════════════════════

TranscriptEntry ScriptRunner::run_command(const JsonValue& command, size_t index) {
    TranscriptEntry entry;
    entry.index = index;
    entry.command = RuleCodec::require_string(command, "cmd", "script command");

    const std::string& cmd = entry.command;
    bool counts = command["advance"].get_bool(true);

    if (cmd == "wait") {
        view_.push(OutputTag::SUCCESS, "Time passes.");
    } else if (cmd == "go") {
        counts = go(command, entry.fired) && counts;
    } else if (cmd == "event") {
        Event ev;
        const std::string& kind = RuleCodec::require_string(command, "kind", "event");
        if (!rules::parse_event_kind(kind, ev.kind)) {
            throw LoadError("event: unknown kind '" + kind + "'");
        }
        const auto& params = command["params"];
        if (!params.is_null() && !params.is_object()) {
            throw LoadError("event: 'params' must be an object");
        }
        for (const auto& key : params.keys()) {
            ev.params[key] = RuleCodec::require_string(params, key, "event param");
        }
        entry.fired = coordinator_.react(ev, world_, view_);
    } else if (cmd == "spawn") {
        const std::string& item = RuleCodec::require_string(command, "item", "spawn");
        if (coordinator_.spawn_into_inventory(item, world_, view_)) {
            view_.push(OutputTag::SUCCESS, "Taken.");
        } else {
            view_.push(OutputTag::ERROR, "Cannot spawn '" + item + "'.");
        }
    } else if (cmd == "save") {
        counts = false;
        const std::string& path = RuleCodec::require_string(command, "path", "save");
        bool ok = Snapshot::save(path, world_, triggers_, scheduler_, coordinator_);
        view_.push(ok ? OutputTag::SYSTEM : OutputTag::ERROR, ok ? "Saved." : "Save failed.");
    } else if (cmd == "load") {
        counts = false;
        const std::string& path = RuleCodec::require_string(command, "path", "load");
        bool ok = Snapshot::load(path, world_, triggers_, scheduler_, coordinator_);
        view_.push(ok ? OutputTag::SYSTEM : OutputTag::ERROR, ok ? "Loaded." : "Load failed.");
    } else if (cmd == "sched") {
        counts = false;
        rules::DevConsole::list_pending(scheduler_, world_, view_);
    } else if (cmd == "cancel") {
        counts = false;
        rules::DevConsole::cancel(scheduler_, RuleCodec::require_u64(command, "id", "cancel"),
                                  world_, view_);
    } else if (cmd == "delay") {
        counts = false;
        rules::DevConsole::delay(scheduler_, RuleCodec::require_u64(command, "id", "delay"),
                                 command["turns"].get_u64(1), world_, view_);
    } else {
        throw LoadError("unknown script command '" + cmd + "'");
    }

    if (counts) world_.turn_count++;

    rules::CycleReport report = coordinator_.advance_turn(world_, view_);
    entry.turn = world_.turn_count;
    entry.turn_advanced = report.turn_advanced;
    entry.fired.insert(entry.fired.end(), report.ambient_fired.begin(), report.ambient_fired.end());
    entry.output = std::move(report.output);
    return entry;
}

std::vector<TranscriptEntry> ScriptRunner::run_script(const JsonValue& script) {
    const auto& commands = script["commands"];
    if (!commands.is_array()) throw LoadError("script: missing array 'commands'");

    std::vector<TranscriptEntry> out;
    for (size_t i = 0; i < commands.size(); i++) {
        out.push_back(run_command(commands[i], i));
        Log::debug("Replay", "command " + std::to_string(i) + " '" + out.back().command +
                   "' -> turn " + std::to_string(out.back().turn));
    }
    return out;
}

} // namespace story
