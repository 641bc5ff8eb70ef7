/**
 * Event — What a command handler (or the turn loop) reports to the rule core.
 *
 * An event is a kind plus named string parameters such as "room", "item",
 * "npc" or "target". Triggers subscribe to a kind and may pin some of the
 * parameters; everything else about the event is visible to conditions
 * through EventMatches.
 */

#ifndef STORY_RULES_EVENT_HPP
#define STORY_RULES_EVENT_HPP

#include <map>
#include <string>
#include <utility>

namespace story::rules {

enum class EventKind {
    ALWAYS,             // ambient pass, once per command cycle
    ENTER,
    LEAVE,
    TAKE,
    DROP,
    OPEN,
    UNLOCK,
    LOOK_AT,
    TOUCH,
    TALK_TO_NPC,
    GIVE_TO_NPC,
    TAKE_FROM_NPC,
    INSERT,
    USE_ITEM,
    USE_ITEM_ON_ITEM,
    PLAYER_DEATH,
    NPC_DEATH
};

struct Event {
    EventKind kind = EventKind::ALWAYS;
    std::map<std::string, std::string> params;

    Event() = default;
    explicit Event(EventKind k) : kind(k) {}
    Event(EventKind k, std::map<std::string, std::string> p)
        : kind(k), params(std::move(p)) {}

    /** Empty string when the parameter is absent. */
    const std::string& param(const std::string& key) const;
};

/** camelCase wire name ("enter", "useItemOnItem", ...). */
const char* event_kind_name(EventKind kind);

/** Returns false for unknown names; `out` is left untouched. */
bool parse_event_kind(const std::string& name, EventKind& out);

} // namespace story::rules

#endif // STORY_RULES_EVENT_HPP
