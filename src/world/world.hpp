/**
 * World — The mutable state aggregate the rule core reads and writes.
 *
 * Rooms, items, NPCs, goals and spinners live in contiguous vectors in
 * authoring order, with O(1) lookup by string id through an index map.
 * The player, the turn counter and the RNG are public members.
 *
 * Rule entry points take it by exclusive reference for the duration of one
 * call and keep no copy.
 */

#ifndef STORY_WORLD_WORLD_HPP
#define STORY_WORLD_WORLD_HPP

#include "core/story_rng.hpp"
#include "rules/condition.hpp"
#include "world/health.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace story {

// ── Locations ──

enum class LocationKind {
    NOWHERE,
    ROOM,
    INVENTORY,
    ITEM,       // inside a container item
    NPC         // carried by an NPC
};

struct Location {
    LocationKind kind = LocationKind::NOWHERE;
    std::string id;     // empty for NOWHERE / INVENTORY

    static Location nowhere() { return {}; }
    static Location room(const std::string& id) { return {LocationKind::ROOM, id}; }
    static Location inventory() { return {LocationKind::INVENTORY, ""}; }
    static Location item(const std::string& id) { return {LocationKind::ITEM, id}; }
    static Location npc(const std::string& id) { return {LocationKind::NPC, id}; }

    bool operator==(const Location& o) const { return kind == o.kind && id == o.id; }
    bool operator!=(const Location& o) const { return !(*this == o); }

    /** "nowhere", "inventory", "room:<id>", "item:<id>", "npc:<id>" */
    std::string to_string() const;

    /** Inverse of to_string(). Returns false on malformed input. */
    static bool parse(const std::string& text, Location& out);
};

// ── Rooms ──

struct Exit {
    std::string direction;
    std::string to;
    bool hidden = false;
    bool locked = false;
    std::string barred_message;
};

struct Room {
    std::string id;
    std::string name;
    std::string description;
    bool visited = false;
    std::vector<Exit> exits;

    Exit* find_exit(const std::string& direction);
    const Exit* find_exit(const std::string& direction) const;
};

// ── Items ──

enum class ContainerState {
    NONE,       // not a container
    OPEN,
    CLOSED,
    LOCKED
};

const char* container_state_name(ContainerState state);
bool parse_container_state(const std::string& name, ContainerState& out);

struct Item {
    std::string id;
    std::string name;
    std::string description;
    Location location;
    bool portable = true;
    bool restricted = false;
    ContainerState container = ContainerState::NONE;

    bool is_container() const { return container != ContainerState::NONE; }
};

// ── NPCs ──

enum class MovementKind { ROUTE, RANDOM_SET };
enum class MovementTiming { EVERY_N_TURNS, ON_TURN };

struct NpcMovement {
    MovementKind kind = MovementKind::ROUTE;
    std::vector<std::string> rooms;
    size_t route_index = 0;
    bool loop = true;

    MovementTiming timing = MovementTiming::EVERY_N_TURNS;
    uint64_t timing_value = 1;  // n for EVERY_N_TURNS, turn for ON_TURN

    bool active = true;
    std::optional<uint64_t> paused_until;
    uint64_t last_moved_turn = 0;
};

struct Npc {
    std::string id;
    std::string name;
    std::string description;
    Location location;
    std::string state = "normal";
    std::optional<NpcMovement> movement;
    HealthState health{10};
};

// ── Player ──

struct Flag {
    std::string name;
    bool sequence = false;
    uint32_t step = 0;
    std::optional<uint32_t> end;
    uint64_t turn_set = 0;

    static Flag simple(const std::string& name, uint64_t turn = 0);
    static Flag sequenced(const std::string& name, std::optional<uint32_t> end, uint64_t turn = 0);

    /** "name" for simple flags, "name#step" for sequences. */
    std::string value() const;

    /** Simple flags are always complete; sequences once step reaches end. */
    bool is_complete() const;
};

struct Player {
    std::string name = "player";
    Location location;
    int64_t score = 0;
    HealthState health{20};
    std::vector<Flag> flags;

    const Flag* find_flag(const std::string& name) const;
    Flag* find_flag(const std::string& name);

    /** True if any flag's value() equals `value`. */
    bool has_flag_value(const std::string& value) const;

    /** Adds the flag unless one with the same name is already set. */
    bool add_flag(const Flag& flag);
    bool remove_flag(const std::string& name);

    // Sequence-only; return false for missing or simple flags.
    bool advance_flag(const std::string& name);
    bool reset_flag(const std::string& name);
};

// ── Goals ──

enum class GoalStatus { INACTIVE, ACTIVE, COMPLETE, FAILED };

const char* goal_status_name(GoalStatus status);

struct Goal {
    std::string id;
    std::string name;
    std::string description;
    std::string group = "required";
    std::optional<rules::Condition> activate_when;
    rules::Condition finished_when;
    std::optional<rules::Condition> failed_when;
};

// ── Spinners ──

struct Spinner {
    std::string id;
    std::vector<std::string> lines;

    /** Random line; empty string if the spinner has no lines. */
    std::string spin(StoryRNG& rng) const;
};

// ══════════════════════════════════════════════════════════════

class World {
public:
    World() = default;

    // Adders throw LoadError on duplicate ids.
    void add_room(Room&& room);
    void add_item(Item&& item);
    void add_npc(Npc&& npc);
    void add_goal(Goal&& goal);
    void add_spinner(Spinner&& spinner);

    Room* room(const std::string& id);
    const Room* room(const std::string& id) const;
    Item* item(const std::string& id);
    const Item* item(const std::string& id) const;
    Npc* npc(const std::string& id);
    const Npc* npc(const std::string& id) const;
    const Goal* goal(const std::string& id) const;
    const Spinner* spinner(const std::string& id) const;

    // Lookups that throw ReferenceError when the id is unknown.
    Room& require_room(const std::string& id);
    Item& require_item(const std::string& id);
    Npc& require_npc(const std::string& id);

    std::vector<Room>& rooms() { return rooms_; }
    const std::vector<Room>& rooms() const { return rooms_; }
    std::vector<Item>& items() { return items_; }
    const std::vector<Item>& items() const { return items_; }
    std::vector<Npc>& npcs() { return npcs_; }
    const std::vector<Npc>& npcs() const { return npcs_; }
    const std::vector<Goal>& goals() const { return goals_; }
    const std::vector<Spinner>& spinners() const { return spinners_; }

    /** Id of the room the player stands in, or empty if not in a room. */
    std::string player_room() const;

    bool player_has_item(const std::string& item_id) const;

    /** Items whose location equals `loc`, in authoring order. */
    std::vector<const Item*> items_at(const Location& loc) const;

    /** True if the location names an existing room/item/NPC (or needs none). */
    bool location_exists(const Location& loc) const;

    uint64_t turn_count = 0;
    Player player;
    StoryRNG rng{42};

private:
    std::vector<Room> rooms_;
    std::vector<Item> items_;
    std::vector<Npc> npcs_;
    std::vector<Goal> goals_;
    std::vector<Spinner> spinners_;

    std::unordered_map<std::string, size_t> room_index_;
    std::unordered_map<std::string, size_t> item_index_;
    std::unordered_map<std::string, size_t> npc_index_;
    std::unordered_map<std::string, size_t> goal_index_;
    std::unordered_map<std::string, size_t> spinner_index_;
};

} // namespace story

#endif // STORY_WORLD_WORLD_HPP
