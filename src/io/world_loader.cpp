#include "io/world_loader.hpp"
#include "io/json_reader.hpp"
#include "io/rule_codec.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

namespace story {

using rules::Trigger;

// ═══════════════════════════════════════════════════════════════
// Shared pieces
// ═══════════════════════════════════════════════════════════════

Location WorldLoader::read_location(const JsonValue& json, const std::string& context) {
    if (json.is_null()) return Location::nowhere();
    Location loc;
    if (!json.is_string() || !Location::parse(json.as_string(), loc)) {
        throw LoadError(context + ": bad location " +
                        (json.is_string() ? "'" + json.as_string() + "'" : std::string("value")));
    }
    return loc;
}

Flag WorldLoader::read_flag(const JsonValue& json) {
    if (json.is_string()) return Flag::simple(json.as_string());

    Flag f;
    f.name = RuleCodec::require_string(json, "name", "flag");
    f.sequence = json["sequence"].get_bool(false) || json.has("end") || json.has("step");
    f.step = static_cast<uint32_t>(json["step"].get_u64(0));
    if (json["end"].is_number()) f.end = static_cast<uint32_t>(json["end"].get_u64(0));
    f.turn_set = json["turnSet"].get_u64(0);
    return f;
}

// ═══════════════════════════════════════════════════════════════
// Entities
// ═══════════════════════════════════════════════════════════════

Room WorldLoader::read_room(const JsonValue& json) {
    Room r;
    r.id = RuleCodec::require_string(json, "id", "room");
    r.name = json["name"].get_string(r.id);
    r.description = json["description"].get_string("");
    r.visited = json["visited"].get_bool(false);

    const auto& exits = json["exits"];
    for (size_t i = 0; i < exits.size(); i++) {
        const auto& e = exits[i];
        Exit ex;
        ex.direction = RuleCodec::require_string(e, "direction", "room '" + r.id + "' exit");
        ex.to = RuleCodec::require_string(e, "to", "room '" + r.id + "' exit");
        ex.hidden = e["hidden"].get_bool(false);
        ex.locked = e["locked"].get_bool(false);
        ex.barred_message = e["barredMessage"].get_string("");
        r.exits.push_back(std::move(ex));
    }
    return r;
}

Item WorldLoader::read_item(const JsonValue& json) {
    Item it;
    it.id = RuleCodec::require_string(json, "id", "item");
    it.name = json["name"].get_string(it.id);
    it.description = json["description"].get_string("");
    it.location = read_location(json["location"], "item '" + it.id + "'");
    it.portable = json["portable"].get_bool(true);
    it.restricted = json["restricted"].get_bool(false);

    std::string state = json["container"].get_string("none");
    if (!parse_container_state(state, it.container)) {
        throw LoadError("item '" + it.id + "': unknown container state '" + state + "'");
    }
    return it;
}

NpcMovement WorldLoader::read_movement(const JsonValue& json, const std::string& npc_id) {
    const std::string ctx = "npc '" + npc_id + "' movement";
    NpcMovement mv;

    std::string type = json["type"].get_string("route");
    if (type == "route") {
        mv.kind = MovementKind::ROUTE;
    } else if (type == "randomSet") {
        mv.kind = MovementKind::RANDOM_SET;
    } else {
        throw LoadError(ctx + ": unknown type '" + type + "'");
    }

    for (const auto& room : json["rooms"].as_array()) {
        if (!room.is_string()) throw LoadError(ctx + ": room ids must be strings");
        mv.rooms.push_back(room.as_string());
    }
    if (mv.rooms.empty()) throw LoadError(ctx + ": no rooms");

    mv.loop = json["loop"].get_bool(true);
    mv.route_index = static_cast<size_t>(json["index"].get_u64(0));
    mv.active = json["active"].get_bool(true);
    if (json["pausedUntil"].is_number()) mv.paused_until = json["pausedUntil"].as_u64();
    mv.last_moved_turn = json["lastMovedTurn"].get_u64(0);

    const auto& timing = json["timing"];
    std::string ttype = timing["type"].get_string("everyNTurns");
    if (ttype == "everyNTurns") {
        mv.timing = MovementTiming::EVERY_N_TURNS;
        mv.timing_value = timing["turns"].get_u64(1);
        if (mv.timing_value == 0) {
            Log::warn("Loader", ctx + ": everyNTurns 0 clamped to 1");
            mv.timing_value = 1;
        }
    } else if (ttype == "onTurn") {
        mv.timing = MovementTiming::ON_TURN;
        mv.timing_value = RuleCodec::require_u64(timing, "turn", ctx);
    } else {
        throw LoadError(ctx + ": unknown timing '" + ttype + "'");
    }
    return mv;
}

Npc WorldLoader::read_npc(const JsonValue& json) {
    Npc n;
    n.id = RuleCodec::require_string(json, "id", "npc");
    n.name = json["name"].get_string(n.id);
    n.description = json["description"].get_string("");
    n.location = read_location(json["location"], "npc '" + n.id + "'");
    n.state = json["state"].get_string("normal");
    n.health = HealthState(static_cast<uint32_t>(json["maxHp"].get_u64(10)));
    if (json.has("movement") && !json["movement"].is_null()) {
        n.movement = read_movement(json["movement"], n.id);
    }
    return n;
}

Goal WorldLoader::read_goal(const JsonValue& json) {
    Goal g;
    g.id = RuleCodec::require_string(json, "id", "goal");
    g.name = json["name"].get_string(g.id);
    g.description = json["description"].get_string("");
    g.group = json["group"].get_string("required");

    if (!json["activateWhen"].is_null()) {
        g.activate_when = rules::ConditionEvaluator::flatten(RuleCodec::read_condition(json["activateWhen"]));
    }
    if (!json.has("finishedWhen")) {
        throw LoadError("goal '" + g.id + "': missing 'finishedWhen'");
    }
    g.finished_when = rules::ConditionEvaluator::flatten(RuleCodec::read_condition(json["finishedWhen"]));
    if (!json["failedWhen"].is_null()) {
        g.failed_when = rules::ConditionEvaluator::flatten(RuleCodec::read_condition(json["failedWhen"]));
    }
    return g;
}

Spinner WorldLoader::read_spinner(const JsonValue& json) {
    Spinner s;
    s.id = RuleCodec::require_string(json, "id", "spinner");
    for (const auto& line : json["lines"].as_array()) {
        s.lines.push_back(line.get_string(""));
    }
    return s;
}

Trigger WorldLoader::read_trigger(const JsonValue& json) {
    Trigger t;
    t.id = RuleCodec::require_string(json, "id", "trigger");
    t.name = json["name"].get_string(t.id);
    try {
        t.matcher = RuleCodec::read_matcher(json["event"]);
        t.condition = RuleCodec::read_condition(json["condition"]);
        t.actions = RuleCodec::read_actions(json["actions"]);
    } catch (const LoadError& e) {
        throw LoadError("trigger '" + t.id + "': " + e.what());
    }
    t.fire_once = json["once"].get_bool(false);
    t.enabled = json["enabled"].get_bool(true);
    return t;
}

// ═══════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════

void WorldLoader::check_references(const World& world) {
    for (const auto& r : world.rooms()) {
        for (const auto& e : r.exits) {
            if (!world.room(e.to)) {
                throw LoadError("room '" + r.id + "' exit '" + e.direction +
                                "' leads to unknown room '" + e.to + "'");
            }
        }
    }
    for (const auto& it : world.items()) {
        if (!world.location_exists(it.location)) {
            throw LoadError("item '" + it.id + "' placed at unknown " + it.location.to_string());
        }
    }
    for (const auto& n : world.npcs()) {
        if (n.location.kind != LocationKind::ROOM && n.location.kind != LocationKind::NOWHERE) {
            throw LoadError("npc '" + n.id + "' must be in a room or nowhere");
        }
        if (!world.location_exists(n.location)) {
            throw LoadError("npc '" + n.id + "' placed at unknown " + n.location.to_string());
        }
        if (!n.movement) continue;
        for (const auto& room : n.movement->rooms) {
            if (!world.room(room)) {
                throw LoadError("npc '" + n.id + "' movement names unknown room '" + room + "'");
            }
        }
    }
    if (world.player.location.kind != LocationKind::ROOM ||
        !world.room(world.player.location.id)) {
        throw LoadError("player must start in a known room (got " +
                        world.player.location.to_string() + ")");
    }
}

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

StoryBundle WorldLoader::parse(const JsonValue& bundle) {
    if (!bundle.is_object()) throw LoadError("bundle root must be an object");

    StoryBundle out;
    World& world = out.world;

    for (const auto& r : bundle["rooms"].as_array())    world.add_room(read_room(r));
    for (const auto& i : bundle["items"].as_array())    world.add_item(read_item(i));
    for (const auto& n : bundle["npcs"].as_array())     world.add_npc(read_npc(n));
    for (const auto& g : bundle["goals"].as_array())    world.add_goal(read_goal(g));
    for (const auto& s : bundle["spinners"].as_array()) world.add_spinner(read_spinner(s));

    const auto& player = bundle["player"];
    world.player.name = player["name"].get_string("player");
    world.player.location = read_location(player["location"], "player");
    world.player.score = player["score"].get_i64(0);
    world.player.health = HealthState(static_cast<uint32_t>(player["maxHp"].get_u64(20)));
    for (const auto& f : player["flags"].as_array()) {
        world.player.add_flag(read_flag(f));
    }

    // Authoring order is priority order.
    for (const auto& t : bundle["triggers"].as_array()) {
        out.triggers.add(read_trigger(t));
    }

    world.rng.reseed(static_cast<int32_t>(bundle["seed"].get_i64(42)));
    world.turn_count = bundle["turn"].get_u64(0);

    check_references(world);
    world.require_room(world.player.location.id).visited = true;

    Log::info("Loader", std::to_string(world.rooms().size()) + " rooms, " +
              std::to_string(world.items().size()) + " items, " +
              std::to_string(world.npcs().size()) + " npcs, " +
              std::to_string(out.triggers.size()) + " triggers");
    return out;
}

StoryBundle WorldLoader::load_file(const std::string& path) {
    JsonValue root;
    try {
        root = JsonReader::parse_file(path);
    } catch (const std::runtime_error& e) {
        throw LoadError(path + ": " + e.what());
    }
    return parse(root);
}

} // namespace story
