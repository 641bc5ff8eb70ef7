/**
 * Snapshot Implementation
 */

#include "io/snapshot.hpp"
#include "io/json_reader.hpp"
#include "io/json_writer.hpp"
#include "io/rule_codec.hpp"
#include "io/world_loader.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include <fstream>

namespace story {

using rules::EventStatus;
using rules::ScheduledEvent;
using rules::Scheduler;
using rules::Tombstone;
using rules::TriggerState;

// ─────────────────────────────────────────────────────────────
// Health (player and NPCs share the layout)
// ─────────────────────────────────────────────────────────────

void Snapshot::write_health(JsonWriter& w, const HealthState& health) {
    w.kv("max_hp", health.max_hp());
    w.kv("hp", health.current_hp());
    w.key("effects").begin_array();
    for (const auto& fx : health.effects()) {
        w.begin_object();
        w.kv("kind", HealthState::kind_name(fx.kind));
        w.kv("cause", fx.cause);
        w.kv("amount", fx.amount);
        w.kv("times", fx.times);
        w.end_object();
    }
    w.end_array();
}

void Snapshot::read_health(const JsonValue& json, HealthState& health) {
    std::vector<HealthEffect> effects;
    for (const auto& fj : json["effects"].as_array()) {
        HealthEffect fx;
        std::string kind = fj["kind"].get_string("");
        if (!HealthState::parse_kind(kind, fx.kind)) {
            throw LoadError("snapshot: unknown health effect '" + kind + "'");
        }
        fx.cause = fj["cause"].get_string("");
        fx.amount = static_cast<uint32_t>(fj["amount"].get_u64(0));
        fx.times = static_cast<uint32_t>(fj["times"].get_u64(1));
        effects.push_back(std::move(fx));
    }
    health.restore(static_cast<uint32_t>(json["max_hp"].get_u64(health.max_hp())),
                   static_cast<uint32_t>(json["hp"].get_u64(health.current_hp())),
                   std::move(effects));
}

// ─────────────────────────────────────────────────────────────
// World state
// ─────────────────────────────────────────────────────────────

void Snapshot::write_world(JsonWriter& w, const World& world) {
    w.begin_object();

    w.key("rooms").begin_array();
    for (const auto& r : world.rooms()) {
        w.begin_object();
        w.kv("id", r.id);
        w.kv("visited", r.visited);
        w.key("exits").begin_array();
        for (const auto& e : r.exits) {
            w.begin_object();
            w.kv("direction", e.direction);
            w.kv("hidden", e.hidden);
            w.kv("locked", e.locked);
            w.kv("barred_message", e.barred_message);
            w.end_object();
        }
        w.end_array();
        w.end_object();
    }
    w.end_array();

    w.key("items").begin_array();
    for (const auto& it : world.items()) {
        w.begin_object();
        w.kv("id", it.id);
        w.kv("location", it.location.to_string());
        w.kv("description", it.description);
        w.kv("restricted", it.restricted);
        w.kv("container", container_state_name(it.container));
        w.end_object();
    }
    w.end_array();

    w.key("npcs").begin_array();
    for (const auto& n : world.npcs()) {
        w.begin_object();
        w.kv("id", n.id);
        w.kv("location", n.location.to_string());
        w.kv("state", n.state);
        write_health(w, n.health);
        if (n.movement) {
            w.key("movement").begin_object();
            w.kv("index", n.movement->route_index);
            w.kv("active", n.movement->active);
            if (n.movement->paused_until) w.kv("paused_until", *n.movement->paused_until);
            w.kv("last_moved_turn", n.movement->last_moved_turn);
            w.end_object();
        }
        w.end_object();
    }
    w.end_array();

    const Player& p = world.player;
    w.key("player").begin_object();
    w.kv("location", p.location.to_string());
    w.kv("score", p.score);
    write_health(w, p.health);
    w.key("flags").begin_array();
    for (const auto& f : p.flags) {
        w.begin_object();
        w.kv("name", f.name);
        w.kv("sequence", f.sequence);
        w.kv("step", f.step);
        if (f.end) w.kv("end", *f.end);
        w.kv("turn_set", f.turn_set);
        w.end_object();
    }
    w.end_array();
    w.end_object();

    w.end_object();
}

void Snapshot::read_world(const JsonValue& json, World& world) {
    for (const auto& rj : json["rooms"].as_array()) {
        const std::string& id = RuleCodec::require_string(rj, "id", "snapshot room");
        Room* r = world.room(id);
        if (!r) throw LoadError("snapshot names unknown room '" + id + "'");
        r->visited = rj["visited"].get_bool(false);
        for (const auto& ej : rj["exits"].as_array()) {
            const std::string& dir = RuleCodec::require_string(ej, "direction", "snapshot exit");
            Exit* e = r->find_exit(dir);
            if (!e) throw LoadError("snapshot names unknown exit '" + dir + "' in '" + id + "'");
            e->hidden = ej["hidden"].get_bool(false);
            e->locked = ej["locked"].get_bool(false);
            e->barred_message = ej["barred_message"].get_string("");
        }
    }

    for (const auto& ij : json["items"].as_array()) {
        const std::string& id = RuleCodec::require_string(ij, "id", "snapshot item");
        Item* it = world.item(id);
        if (!it) throw LoadError("snapshot names unknown item '" + id + "'");
        it->location = WorldLoader::read_location(ij["location"], "snapshot item '" + id + "'");
        it->description = ij["description"].get_string(it->description);
        it->restricted = ij["restricted"].get_bool(false);
        std::string state = ij["container"].get_string("none");
        if (!parse_container_state(state, it->container)) {
            throw LoadError("snapshot item '" + id + "': unknown container state '" + state + "'");
        }
    }

    for (const auto& nj : json["npcs"].as_array()) {
        const std::string& id = RuleCodec::require_string(nj, "id", "snapshot npc");
        Npc* n = world.npc(id);
        if (!n) throw LoadError("snapshot names unknown npc '" + id + "'");
        n->location = WorldLoader::read_location(nj["location"], "snapshot npc '" + id + "'");
        n->state = nj["state"].get_string("normal");
        read_health(nj, n->health);

        const auto& mj = nj["movement"];
        if (mj.is_object() && n->movement) {
            n->movement->route_index = static_cast<size_t>(mj["index"].get_u64(0));
            n->movement->active = mj["active"].get_bool(true);
            n->movement->paused_until.reset();
            if (mj["paused_until"].is_number()) n->movement->paused_until = mj["paused_until"].as_u64();
            n->movement->last_moved_turn = mj["last_moved_turn"].get_u64(0);
        }
    }

    const auto& pj = json["player"];
    Player& p = world.player;
    p.location = WorldLoader::read_location(pj["location"], "snapshot player");
    p.score = pj["score"].get_i64(0);

    read_health(pj, p.health);

    p.flags.clear();
    for (const auto& fj : pj["flags"].as_array()) {
        Flag f;
        f.name = RuleCodec::require_string(fj, "name", "snapshot flag");
        f.sequence = fj["sequence"].get_bool(false);
        f.step = static_cast<uint32_t>(fj["step"].get_u64(0));
        if (fj["end"].is_number()) f.end = static_cast<uint32_t>(fj["end"].as_u64());
        f.turn_set = fj["turn_set"].get_u64(0);
        p.flags.push_back(std::move(f));
    }

    if (!world.location_exists(p.location)) {
        throw LoadError("snapshot player location " + p.location.to_string() + " not found");
    }
    for (const auto& it : world.items()) {
        if (!world.location_exists(it.location)) {
            throw LoadError("snapshot item '" + it.id + "' at unknown " + it.location.to_string());
        }
    }
    for (const auto& n : world.npcs()) {
        if (!world.location_exists(n.location)) {
            throw LoadError("snapshot npc '" + n.id + "' at unknown " + n.location.to_string());
        }
    }
}

// ─────────────────────────────────────────────────────────────
// Scheduler and triggers
// ─────────────────────────────────────────────────────────────

void Snapshot::write_event(JsonWriter& w, const ScheduledEvent& ev) {
    w.begin_object();
    w.kv("id", ev.id);
    w.kv("due_turn", ev.due_turn);
    w.key("condition");
    RuleCodec::write_condition(w, ev.condition);
    w.key("actions");
    RuleCodec::write_actions(w, ev.actions);
    w.key("on_false");
    RuleCodec::write_policy(w, ev.on_false);
    w.kv("origin", ev.origin_trigger);
    w.kv("note", ev.note);
    w.end_object();
}

ScheduledEvent Snapshot::read_event(const JsonValue& json) {
    ScheduledEvent ev;
    ev.id = RuleCodec::require_u64(json, "id", "snapshot event");
    ev.due_turn = RuleCodec::require_u64(json, "due_turn", "snapshot event");
    ev.condition = RuleCodec::read_condition(json["condition"]);
    ev.actions = RuleCodec::read_actions(json["actions"]);
    ev.on_false = RuleCodec::read_policy(json["on_false"]);
    ev.origin_trigger = json["origin"].get_string("");
    ev.note = json["note"].get_string("");
    return ev;
}

Scheduler::State Snapshot::read_scheduler(const JsonValue& json) {
    if (!json.is_object()) throw LoadError("snapshot: missing 'scheduler'");

    Scheduler::State state;
    state.next_id = RuleCodec::require_u64(json, "next_id", "snapshot scheduler");
    for (const auto& ej : json["pending"].as_array()) {
        state.pending.push_back(read_event(ej));
    }
    for (const auto& tj : json["tombstones"].as_array()) {
        Tombstone t;
        t.id = RuleCodec::require_u64(tj, "id", "snapshot tombstone");
        std::string status = tj["status"].get_string("");
        if (!rules::parse_event_status(status, t.status)) {
            throw LoadError("snapshot tombstone " + std::to_string(t.id) +
                            ": unknown status '" + status + "'");
        }
        t.resolved_turn = tj["turn"].get_u64(0);
        t.successor = tj["successor"].get_u64(0);
        t.note = tj["note"].get_string("");
        state.tombstones.push_back(std::move(t));
    }
    return state;
}

std::vector<TriggerState> Snapshot::read_triggers(const JsonValue& json) {
    std::vector<TriggerState> out;
    for (const auto& tj : json.as_array()) {
        TriggerState s;
        s.id = RuleCodec::require_string(tj, "id", "snapshot trigger");
        s.enabled = tj["enabled"].get_bool(true);
        s.fired = tj["fired"].get_bool(false);
        s.fire_count = tj["fire_count"].get_u64(0);
        if (tj["last_fired_turn"].is_number()) s.last_fired_turn = tj["last_fired_turn"].as_u64();
        out.push_back(std::move(s));
    }
    return out;
}

// ─────────────────────────────────────────────────────────────
// Stream API
// ─────────────────────────────────────────────────────────────

void Snapshot::write(std::ostream& os, const World& world,
                     const rules::TriggerRegistry& triggers, const Scheduler& scheduler,
                     const rules::TurnCoordinator& coordinator) {
    JsonWriter w(os);
    w.begin_object();
    w.kv("version", VERSION);
    w.kv("turn_count", world.turn_count);
    w.kv("last_processed_turn", coordinator.last_processed_turn());

    w.key("rng").begin_object();
    w.kv("seed", world.rng.seed());
    w.kv("state", world.rng.state());
    w.end_object();

    w.key("world");
    write_world(w, world);

    w.key("triggers").begin_array();
    for (const auto& s : triggers.export_state()) {
        w.begin_object();
        w.kv("id", s.id);
        w.kv("enabled", s.enabled);
        w.kv("fired", s.fired);
        w.kv("fire_count", s.fire_count);
        if (s.last_fired_turn) w.kv("last_fired_turn", *s.last_fired_turn);
        w.end_object();
    }
    w.end_array();

    Scheduler::State sched = scheduler.export_state();
    w.key("scheduler").begin_object();
    w.kv("next_id", sched.next_id);
    w.key("pending").begin_array();
    for (const auto& ev : sched.pending) write_event(w, ev);
    w.end_array();
    w.key("tombstones").begin_array();
    for (const auto& t : sched.tombstones) {
        w.begin_object();
        w.kv("id", t.id);
        w.kv("status", rules::event_status_name(t.status));
        w.kv("turn", t.resolved_turn);
        w.kv("successor", t.successor);
        w.kv("note", t.note);
        w.end_object();
    }
    w.end_array();
    w.end_object();

    w.end_object();
    os << '\n';
}

void Snapshot::restore(const JsonValue& json, World& world,
                       rules::TriggerRegistry& triggers, Scheduler& scheduler,
                       rules::TurnCoordinator& coordinator) {
    if (!json.is_object()) throw LoadError("snapshot root must be an object");

    int version = json["version"].get_int(0);
    if (version != VERSION) {
        throw LoadError("unsupported snapshot version " + std::to_string(version));
    }

    const uint64_t turn = RuleCodec::require_u64(json, "turn_count", "snapshot");
    const uint64_t last_processed = json["last_processed_turn"].get_u64(turn);

    // Stage everything on copies; the live objects change only after this succeeds.
    World staged = world;
    staged.turn_count = turn;
    const auto& rng = json["rng"];
    staged.rng.restore(static_cast<int32_t>(rng["seed"].get_i64(staged.rng.seed())),
                       static_cast<int32_t>(rng["state"].get_i64(staged.rng.state())));
    read_world(json["world"], staged);

    std::vector<TriggerState> trigger_states = read_triggers(json["triggers"]);
    for (const auto& s : trigger_states) {
        if (!triggers.find(s.id)) {
            throw LoadError("snapshot names unknown trigger '" + s.id + "'");
        }
    }

    Scheduler::State sched = read_scheduler(json["scheduler"]);
    Scheduler::validate(sched, turn);

    world = std::move(staged);
    triggers.import_state(trigger_states);
    scheduler.import_state(std::move(sched));
    coordinator.set_last_processed_turn(last_processed);
}

// ─────────────────────────────────────────────────────────────
// File API
// ─────────────────────────────────────────────────────────────

bool Snapshot::save(const std::string& filename, const World& world,
                    const rules::TriggerRegistry& triggers, const Scheduler& scheduler,
                    const rules::TurnCoordinator& coordinator) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        Log::error("Snapshot", "cannot open " + filename + " for writing");
        return false;
    }

    write(file, world, triggers, scheduler, coordinator);
    if (!file.good()) {
        Log::error("Snapshot", "write failed: " + filename);
        return false;
    }

    Log::info("Snapshot", "saved turn " + std::to_string(world.turn_count) + " (" +
              std::to_string(scheduler.pending_count()) + " pending events) to " + filename);
    return true;
}

bool Snapshot::load(const std::string& filename, World& world,
                    rules::TriggerRegistry& triggers, Scheduler& scheduler,
                    rules::TurnCoordinator& coordinator) {
    try {
        JsonValue root = JsonReader::parse_file(filename);
        restore(root, world, triggers, scheduler, coordinator);
    } catch (const QueueCorruption& e) {
        Log::error("Snapshot", "corrupt scheduler queue in " + filename + ": " + e.what());
        return false;
    } catch (const std::runtime_error& e) {
        Log::error("Snapshot", "cannot load " + filename + ": " + e.what());
        return false;
    }

    Log::info("Snapshot", "loaded turn " + std::to_string(world.turn_count) + " from " + filename);
    return true;
}

} // namespace story
