#include "io/rule_codec.hpp"
#include "io/json_reader.hpp"
#include "io/json_writer.hpp"
#include "core/errors.hpp"

namespace story {

using namespace rules;

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string type_of(const JsonValue& json, const char* what) {
    if (!json.is_object()) {
        throw LoadError(std::string(what) + " must be an object");
    }
    if (!json["type"].is_string()) {
        throw LoadError(std::string(what) + " is missing its \"type\"");
    }
    return json["type"].as_string();
}

uint32_t read_u32(const JsonValue& obj, const std::string& key, uint32_t def) {
    const JsonValue& v = obj[key];
    if (v.is_null()) return def;
    if (!v.is_number() || v.as_i64() < 0) {
        throw LoadError("'" + key + "' must be a non-negative number");
    }
    return static_cast<uint32_t>(v.as_u64());
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Field helpers
// ═══════════════════════════════════════════════════════════════

const std::string& RuleCodec::require_string(const JsonValue& obj, const std::string& key,
                                             const std::string& context) {
    const JsonValue& v = obj[key];
    if (!v.is_string()) {
        throw LoadError(context + ": missing string '" + key + "'");
    }
    return v.as_string();
}

uint64_t RuleCodec::require_u64(const JsonValue& obj, const std::string& key,
                                const std::string& context) {
    const JsonValue& v = obj[key];
    if (!v.is_number() || v.as_i64() < 0) {
        throw LoadError(context + ": missing non-negative number '" + key + "'");
    }
    return v.as_u64();
}

// ═══════════════════════════════════════════════════════════════
// Conditions
// ═══════════════════════════════════════════════════════════════

Condition RuleCodec::read_condition(const JsonValue& json) {
    if (json.is_null()) return Condition::always();

    const std::string type = type_of(json, "condition");
    auto str = [&](const char* key) { return require_string(json, key, type); };

    if (type == "all" || type == "any") {
        const JsonValue& list = json["conditions"];
        if (!list.is_array()) throw LoadError(type + ": missing array 'conditions'");
        std::vector<Condition> children;
        for (const auto& c : list.as_array()) children.push_back(read_condition(c));
        return type == "all" ? Condition::all(std::move(children))
                             : Condition::any(std::move(children));
    }

    if (type == "hasFlag")          return HasFlag{str("flag")};
    if (type == "missingFlag")      return MissingFlag{str("flag")};
    if (type == "flagInProgress")   return FlagInProgress{str("flag")};
    if (type == "flagComplete")     return FlagComplete{str("flag")};
    if (type == "hasItem")          return HasItem{str("item")};
    if (type == "missingItem")      return MissingItem{str("item")};
    if (type == "inRoom")           return InRoom{str("room")};
    if (type == "reachedRoom")      return ReachedRoom{str("room")};
    if (type == "containerHasItem") return ContainerHasItem{str("container"), str("item")};
    if (type == "npcInState")       return NpcInState{str("npc"), str("state")};
    if (type == "npcHasItem")       return NpcHasItem{str("npc"), str("item")};
    if (type == "withNpc")          return WithNpc{str("npc")};
    if (type == "goalComplete")     return GoalComplete{str("goal")};
    if (type == "eventMatches")     return EventMatches{str("key"), str("value")};

    throw LoadError("unknown condition type '" + type + "'");
}

void RuleCodec::write_condition(JsonWriter& w, const Condition& cond) {
    w.begin_object();
    std::visit(overloaded{
        [&](const AllOf& n) {
            w.kv("type", "all");
            w.key("conditions").begin_array();
            for (const auto& c : n.children) write_condition(w, c);
            w.end_array();
        },
        [&](const AnyOf& n) {
            w.kv("type", "any");
            w.key("conditions").begin_array();
            for (const auto& c : n.children) write_condition(w, c);
            w.end_array();
        },
        [&](const HasFlag& n)        { w.kv("type", "hasFlag").kv("flag", n.flag); },
        [&](const MissingFlag& n)    { w.kv("type", "missingFlag").kv("flag", n.flag); },
        [&](const FlagInProgress& n) { w.kv("type", "flagInProgress").kv("flag", n.flag); },
        [&](const FlagComplete& n)   { w.kv("type", "flagComplete").kv("flag", n.flag); },
        [&](const HasItem& n)        { w.kv("type", "hasItem").kv("item", n.item); },
        [&](const MissingItem& n)    { w.kv("type", "missingItem").kv("item", n.item); },
        [&](const InRoom& n)         { w.kv("type", "inRoom").kv("room", n.room); },
        [&](const ReachedRoom& n)    { w.kv("type", "reachedRoom").kv("room", n.room); },
        [&](const ContainerHasItem& n) {
            w.kv("type", "containerHasItem").kv("container", n.container).kv("item", n.item);
        },
        [&](const NpcInState& n)   { w.kv("type", "npcInState").kv("npc", n.npc).kv("state", n.state); },
        [&](const NpcHasItem& n)   { w.kv("type", "npcHasItem").kv("npc", n.npc).kv("item", n.item); },
        [&](const WithNpc& n)      { w.kv("type", "withNpc").kv("npc", n.npc); },
        [&](const GoalComplete& n) { w.kv("type", "goalComplete").kv("goal", n.goal); },
        [&](const EventMatches& n) { w.kv("type", "eventMatches").kv("key", n.key).kv("value", n.value); },
    }, cond.node);
    w.end_object();
}

// ═══════════════════════════════════════════════════════════════
// Policies and matchers
// ═══════════════════════════════════════════════════════════════

OnFalsePolicy RuleCodec::read_policy(const JsonValue& json) {
    if (json.is_null()) return OnFalsePolicy::cancel();

    std::string type = json.is_string() ? json.as_string() : type_of(json, "onFalse");
    if (type == "cancel")        return OnFalsePolicy::cancel();
    if (type == "retryNextTurn") return OnFalsePolicy::retry_next_turn();
    if (type == "retryAfter") {
        const JsonValue& turns = json["turns"];
        if (!turns.is_number()) throw LoadError("retryAfter: missing number 'turns'");
        return OnFalsePolicy::retry_after(turns.as_i64());
    }
    throw LoadError("unknown onFalse policy '" + type + "'");
}

void RuleCodec::write_policy(JsonWriter& w, const OnFalsePolicy& policy) {
    switch (policy.kind) {
        case OnFalseKind::CANCEL:
            w.value("cancel");
            break;
        case OnFalseKind::RETRY_NEXT_TURN:
            w.value("retryNextTurn");
            break;
        case OnFalseKind::RETRY_AFTER:
            w.begin_object();
            w.kv("type", "retryAfter").kv("turns", policy.retry_turns());
            w.end_object();
            break;
    }
}

EventMatcher RuleCodec::read_matcher(const JsonValue& json) {
    const std::string type = type_of(json, "trigger event");
    EventMatcher m;
    if (!parse_event_kind(type, m.kind)) {
        throw LoadError("unknown event type '" + type + "'");
    }
    for (const auto& key : json.keys()) {
        if (key == "type") continue;
        const JsonValue& v = json[key];
        if (!v.is_string()) throw LoadError(type + ": event parameter '" + key + "' must be a string");
        m.params[key] = v.as_string();
    }
    return m;
}

void RuleCodec::write_matcher(JsonWriter& w, const EventMatcher& matcher) {
    w.begin_object();
    w.kv("type", event_kind_name(matcher.kind));
    for (const auto& kv : matcher.params) w.kv(kv.first, kv.second);
    w.end_object();
}

// ═══════════════════════════════════════════════════════════════
// Actions
// ═══════════════════════════════════════════════════════════════

Action RuleCodec::read_action(const JsonValue& json) {
    const std::string type = type_of(json, "action");
    auto str = [&](const char* key) { return require_string(json, key, type); };

    // ── Messages ──
    if (type == "showMessage")       return ShowMessage{str("text")};
    if (type == "showRandomMessage") return ShowRandomMessage{str("spinner")};
    if (type == "npcSays")           return NpcSays{str("npc"), str("quote")};

    // ── Flags and score ──
    if (type == "addFlag") {
        AddFlag a;
        a.flag = str("flag");
        a.sequence = json["sequence"].get_bool(false);
        if (json.has("end")) {
            a.sequence = true;
            a.end = read_u32(json, "end", 0);
        }
        return a;
    }
    if (type == "removeFlag")  return RemoveFlag{str("flag")};
    if (type == "advanceFlag") return AdvanceFlag{str("flag")};
    if (type == "resetFlag")   return ResetFlag{str("flag")};
    if (type == "awardPoints") {
        if (!json["amount"].is_number()) throw LoadError("awardPoints: missing number 'amount'");
        return AwardPoints{json["amount"].as_i64(), json["reason"].get_string("")};
    }

    // ── Items ──
    if (type == "spawnItemInRoom")      return SpawnItemInRoom{str("item"), str("room")};
    if (type == "spawnItemCurrentRoom") return SpawnItemCurrentRoom{str("item")};
    if (type == "spawnItemInInventory") return SpawnItemInInventory{str("item")};
    if (type == "spawnItemInContainer") return SpawnItemInContainer{str("item"), str("container")};
    if (type == "despawnItem")          return DespawnItem{str("item")};
    if (type == "setItemDescription")   return SetItemDescription{str("item"), str("text")};
    if (type == "restrictItem")         return RestrictItem{str("item"), json["restricted"].get_bool(true)};
    if (type == "setContainerState") {
        SetContainerState a;
        a.item = str("item");
        if (!parse_container_state(str("state"), a.state)) {
            throw LoadError("setContainerState: unknown state '" + str("state") + "'");
        }
        return a;
    }
    if (type == "giveItemToPlayer") return GiveItemToPlayer{str("npc"), str("item")};

    // ── Exits and movement ──
    if (type == "revealExit")       return RevealExit{str("room"), str("direction")};
    if (type == "lockExit")         return LockExit{str("room"), str("direction")};
    if (type == "unlockExit")       return UnlockExit{str("room"), str("direction")};
    if (type == "setBarredMessage") return SetBarredMessage{str("room"), str("direction"), str("message")};
    if (type == "pushPlayerTo")     return PushPlayerTo{str("room")};

    // ── NPCs ──
    if (type == "setNpcState")          return SetNpcState{str("npc"), str("state")};
    if (type == "setNpcMovementActive") return SetNpcMovementActive{str("npc"), json["active"].get_bool(true)};
    if (type == "damageNpc") {
        return DamageNpc{str("npc"), str("cause"),
                         static_cast<uint32_t>(require_u64(json, "amount", type)),
                         read_u32(json, "turns", 0)};
    }
    if (type == "healNpc") {
        return HealNpc{str("npc"), str("cause"),
                       static_cast<uint32_t>(require_u64(json, "amount", type)),
                       read_u32(json, "turns", 0)};
    }

    // ── Player health ──
    if (type == "damagePlayer") {
        return DamagePlayer{str("cause"), static_cast<uint32_t>(require_u64(json, "amount", type)),
                            read_u32(json, "turns", 0)};
    }
    if (type == "healPlayer") {
        return HealPlayer{str("cause"), static_cast<uint32_t>(require_u64(json, "amount", type)),
                          read_u32(json, "turns", 0)};
    }
    if (type == "removePlayerEffect") return RemovePlayerEffect{str("cause")};

    // ── Rules ──
    if (type == "setTriggerEnabled") return SetTriggerEnabled{str("trigger"), json["enabled"].get_bool(true)};

    if (type == "scheduleIn") {
        ScheduleIn a;
        a.turns = require_u64(json, "turns", type);
        a.condition = ConditionEvaluator::flatten(read_condition(json["condition"]));
        a.actions = read_actions(json["actions"]);
        a.on_false = read_policy(json["onFalse"]);
        a.note = json["note"].get_string("");
        return a;
    }
    if (type == "scheduleAt") {
        ScheduleAt a;
        a.turn = require_u64(json, "turn", type);
        a.condition = ConditionEvaluator::flatten(read_condition(json["condition"]));
        a.actions = read_actions(json["actions"]);
        a.on_false = read_policy(json["onFalse"]);
        a.note = json["note"].get_string("");
        return a;
    }

    throw LoadError("unknown action type '" + type + "'");
}

std::vector<Action> RuleCodec::read_actions(const JsonValue& json) {
    if (json.is_null()) return {};
    if (!json.is_array()) throw LoadError("'actions' must be an array");

    std::vector<Action> out;
    out.reserve(json.size());
    for (const auto& a : json.as_array()) out.push_back(read_action(a));
    return out;
}

void RuleCodec::write_actions(JsonWriter& w, const std::vector<Action>& actions) {
    w.begin_array();
    for (const auto& a : actions) write_action(w, a);
    w.end_array();
}

void RuleCodec::write_action(JsonWriter& w, const Action& action) {
    w.begin_object();
    w.kv("type", action_name(action));

    auto schedule_body = [&](const Condition& cond, const std::vector<Action>& actions,
                             const OnFalsePolicy& on_false, const std::string& note) {
        w.key("condition");
        write_condition(w, cond);
        w.key("actions");
        write_actions(w, actions);
        w.key("onFalse");
        write_policy(w, on_false);
        if (!note.empty()) w.kv("note", note);
    };

    std::visit(overloaded{
        [&](const ShowMessage& a)       { w.kv("text", a.text); },
        [&](const ShowRandomMessage& a) { w.kv("spinner", a.spinner); },
        [&](const NpcSays& a)           { w.kv("npc", a.npc).kv("quote", a.quote); },
        [&](const AddFlag& a) {
            w.kv("flag", a.flag);
            if (a.sequence) w.kv("sequence", true);
            if (a.end) w.kv("end", *a.end);
        },
        [&](const RemoveFlag& a)  { w.kv("flag", a.flag); },
        [&](const AdvanceFlag& a) { w.kv("flag", a.flag); },
        [&](const ResetFlag& a)   { w.kv("flag", a.flag); },
        [&](const AwardPoints& a) { w.kv("amount", a.amount).kv("reason", a.reason); },
        [&](const SpawnItemInRoom& a)      { w.kv("item", a.item).kv("room", a.room); },
        [&](const SpawnItemCurrentRoom& a) { w.kv("item", a.item); },
        [&](const SpawnItemInInventory& a) { w.kv("item", a.item); },
        [&](const SpawnItemInContainer& a) { w.kv("item", a.item).kv("container", a.container); },
        [&](const DespawnItem& a)          { w.kv("item", a.item); },
        [&](const SetItemDescription& a)   { w.kv("item", a.item).kv("text", a.text); },
        [&](const RestrictItem& a)         { w.kv("item", a.item).kv("restricted", a.restricted); },
        [&](const SetContainerState& a) {
            w.kv("item", a.item).kv("state", container_state_name(a.state));
        },
        [&](const GiveItemToPlayer& a) { w.kv("npc", a.npc).kv("item", a.item); },
        [&](const RevealExit& a)       { w.kv("room", a.room).kv("direction", a.direction); },
        [&](const LockExit& a)         { w.kv("room", a.room).kv("direction", a.direction); },
        [&](const UnlockExit& a)       { w.kv("room", a.room).kv("direction", a.direction); },
        [&](const SetBarredMessage& a) {
            w.kv("room", a.room).kv("direction", a.direction).kv("message", a.message);
        },
        [&](const PushPlayerTo& a)         { w.kv("room", a.room); },
        [&](const SetNpcState& a)          { w.kv("npc", a.npc).kv("state", a.state); },
        [&](const SetNpcMovementActive& a) { w.kv("npc", a.npc).kv("active", a.active); },
        [&](const DamageNpc& a) {
            w.kv("npc", a.npc).kv("cause", a.cause).kv("amount", a.amount).kv("turns", a.turns);
        },
        [&](const HealNpc& a) {
            w.kv("npc", a.npc).kv("cause", a.cause).kv("amount", a.amount).kv("turns", a.turns);
        },
        [&](const DamagePlayer& a) { w.kv("cause", a.cause).kv("amount", a.amount).kv("turns", a.turns); },
        [&](const HealPlayer& a)   { w.kv("cause", a.cause).kv("amount", a.amount).kv("turns", a.turns); },
        [&](const RemovePlayerEffect& a) { w.kv("cause", a.cause); },
        [&](const SetTriggerEnabled& a)  { w.kv("trigger", a.trigger).kv("enabled", a.enabled); },
        [&](const ScheduleIn& a) {
            w.kv("turns", a.turns);
            schedule_body(a.condition, a.actions, a.on_false, a.note);
        },
        [&](const ScheduleAt& a) {
            w.kv("turn", a.turn);
            schedule_body(a.condition, a.actions, a.on_false, a.note);
        },
    }, action.node);

    w.end_object();
}

} // namespace story
