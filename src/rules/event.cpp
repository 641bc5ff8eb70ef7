#include "rules/event.hpp"

namespace story::rules {

namespace {

struct KindName {
    EventKind kind;
    const char* name;
};

constexpr KindName KIND_NAMES[] = {
    {EventKind::ALWAYS,           "always"},
    {EventKind::ENTER,            "enter"},
    {EventKind::LEAVE,            "leave"},
    {EventKind::TAKE,             "take"},
    {EventKind::DROP,             "drop"},
    {EventKind::OPEN,             "open"},
    {EventKind::UNLOCK,           "unlock"},
    {EventKind::LOOK_AT,          "lookAt"},
    {EventKind::TOUCH,            "touch"},
    {EventKind::TALK_TO_NPC,      "talkToNpc"},
    {EventKind::GIVE_TO_NPC,      "giveToNpc"},
    {EventKind::TAKE_FROM_NPC,    "takeFromNpc"},
    {EventKind::INSERT,           "insert"},
    {EventKind::USE_ITEM,         "useItem"},
    {EventKind::USE_ITEM_ON_ITEM, "useItemOnItem"},
    {EventKind::PLAYER_DEATH,     "playerDeath"},
    {EventKind::NPC_DEATH,        "npcDeath"},
};

} // anonymous namespace

const std::string& Event::param(const std::string& key) const {
    static const std::string empty;
    auto it = params.find(key);
    return it == params.end() ? empty : it->second;
}

const char* event_kind_name(EventKind kind) {
    for (const auto& kn : KIND_NAMES) {
        if (kn.kind == kind) return kn.name;
    }
    return "always";
}

bool parse_event_kind(const std::string& name, EventKind& out) {
    for (const auto& kn : KIND_NAMES) {
        if (name == kn.name) {
            out = kn.kind;
            return true;
        }
    }
    return false;
}

} // namespace story::rules
