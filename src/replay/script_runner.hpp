/**
 * ScriptRunner — Plays a scripted command list through the rule core.
 *
 * Stands in for the command parser and its domain handlers: each script
 * command mutates the world the way a handler would, bumps the turn counter
 * if the command consumes time, then calls TurnCoordinator::advance_turn()
 * exactly once.
 *
 * Script format:
 * {"commands": [
 *   {"cmd": "wait"},
 *   {"cmd": "go", "direction": "north"},          or {"cmd": "go", "room": "hall"}
 *   {"cmd": "event", "kind": "touch", "params": {"item": "lever"}, "advance": true},
 *   {"cmd": "spawn", "item": "coin"},
 *   {"cmd": "save", "path": "s.json"},  {"cmd": "load", "path": "s.json"},
 *   {"cmd": "sched"},  {"cmd": "cancel", "id": 3},  {"cmd": "delay", "id": 3, "turns": 2}
 * ]}
 *
 * sched, cancel, delay, save and load never consume a turn; any command can
 * opt out with "advance": false.
 */

#ifndef STORY_REPLAY_SCRIPT_RUNNER_HPP
#define STORY_REPLAY_SCRIPT_RUNNER_HPP

#include "io/world_loader.hpp"
#include "rules/scheduler.hpp"
#include "rules/trigger_registry.hpp"
#include "rules/turn_coordinator.hpp"
#include "view/output_buffer.hpp"
#include "world/world.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace story {

class JsonValue;

struct ReplayConfig {
    std::string world_path;
    std::string script_path;
    std::string output_path;        // empty = stdout
    std::string load_path;          // snapshot applied before the script
    rules::CoreConfig core;
};

struct TranscriptEntry {
    size_t index = 0;
    std::string command;
    uint64_t turn = 0;
    bool turn_advanced = false;
    std::vector<std::string> fired;
    std::vector<OutputItem> output;
};

class ScriptRunner {
public:
    ScriptRunner(StoryBundle bundle, rules::CoreConfig config);

    ScriptRunner(const ScriptRunner&) = delete;
    ScriptRunner& operator=(const ScriptRunner&) = delete;

    /** @throws LoadError on a malformed command */
    TranscriptEntry run_command(const JsonValue& command, size_t index = 0);

    /** Runs every command in script["commands"]. */
    std::vector<TranscriptEntry> run_script(const JsonValue& script);

    World& world() { return world_; }
    rules::TriggerRegistry& triggers() { return triggers_; }
    rules::Scheduler& scheduler() { return scheduler_; }
    rules::TurnCoordinator& coordinator() { return coordinator_; }
    OutputBuffer& view() { return view_; }

private:
    World world_;
    rules::TriggerRegistry triggers_;
    rules::Scheduler scheduler_;
    OutputBuffer view_;
    rules::TurnCoordinator coordinator_;

    /** Returns false if the move was refused (no turn is consumed). */
    bool go(const JsonValue& command, std::vector<std::string>& fired);
    void move_player(const std::string& room_id, std::vector<std::string>& fired);
};

} // namespace story

#endif // STORY_REPLAY_SCRIPT_RUNNER_HPP
