#include "world/world.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace story {

// ═══════════════════════════════════════════════════════════════
// Location
// ═══════════════════════════════════════════════════════════════

std::string Location::to_string() const {
    switch (kind) {
        case LocationKind::NOWHERE:   return "nowhere";
        case LocationKind::INVENTORY: return "inventory";
        case LocationKind::ROOM:      return "room:" + id;
        case LocationKind::ITEM:      return "item:" + id;
        case LocationKind::NPC:       return "npc:" + id;
    }
    return "nowhere";
}

bool Location::parse(const std::string& text, Location& out) {
    if (text == "nowhere")   { out = nowhere();   return true; }
    if (text == "inventory") { out = inventory(); return true; }

    auto colon = text.find(':');
    if (colon == std::string::npos || colon + 1 >= text.size()) return false;

    std::string prefix = text.substr(0, colon);
    std::string id = text.substr(colon + 1);
    if (prefix == "room") { out = room(id); return true; }
    if (prefix == "item") { out = item(id); return true; }
    if (prefix == "npc")  { out = npc(id);  return true; }
    return false;
}

// ═══════════════════════════════════════════════════════════════
// Rooms / items / goals
// ═══════════════════════════════════════════════════════════════

Exit* Room::find_exit(const std::string& direction) {
    for (auto& e : exits) {
        if (e.direction == direction) return &e;
    }
    return nullptr;
}

const Exit* Room::find_exit(const std::string& direction) const {
    for (const auto& e : exits) {
        if (e.direction == direction) return &e;
    }
    return nullptr;
}

const char* container_state_name(ContainerState state) {
    switch (state) {
        case ContainerState::NONE:   return "none";
        case ContainerState::OPEN:   return "open";
        case ContainerState::CLOSED: return "closed";
        case ContainerState::LOCKED: return "locked";
    }
    return "none";
}

bool parse_container_state(const std::string& name, ContainerState& out) {
    if (name == "none")   { out = ContainerState::NONE;   return true; }
    if (name == "open")   { out = ContainerState::OPEN;   return true; }
    if (name == "closed") { out = ContainerState::CLOSED; return true; }
    if (name == "locked") { out = ContainerState::LOCKED; return true; }
    return false;
}

const char* goal_status_name(GoalStatus status) {
    switch (status) {
        case GoalStatus::INACTIVE: return "inactive";
        case GoalStatus::ACTIVE:   return "active";
        case GoalStatus::COMPLETE: return "complete";
        case GoalStatus::FAILED:   return "failed";
    }
    return "inactive";
}

std::string Spinner::spin(StoryRNG& rng) const {
    if (lines.empty()) return "";
    return lines[rng.next_index(lines.size())];
}

// ═══════════════════════════════════════════════════════════════
// Flags
// ═══════════════════════════════════════════════════════════════

Flag Flag::simple(const std::string& name, uint64_t turn) {
    Flag f;
    f.name = name;
    f.turn_set = turn;
    return f;
}

Flag Flag::sequenced(const std::string& name, std::optional<uint32_t> end, uint64_t turn) {
    Flag f;
    f.name = name;
    f.sequence = true;
    f.end = end;
    f.turn_set = turn;
    return f;
}

std::string Flag::value() const {
    if (!sequence) return name;
    return name + "#" + std::to_string(step);
}

bool Flag::is_complete() const {
    if (!sequence) return true;
    return end.has_value() && step >= *end;
}

const Flag* Player::find_flag(const std::string& name) const {
    for (const auto& f : flags) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

Flag* Player::find_flag(const std::string& name) {
    for (auto& f : flags) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

bool Player::has_flag_value(const std::string& value) const {
    return std::any_of(flags.begin(), flags.end(),
                       [&](const Flag& f) { return f.value() == value; });
}

bool Player::add_flag(const Flag& flag) {
    if (find_flag(flag.name)) return false;
    flags.push_back(flag);
    return true;
}

bool Player::remove_flag(const std::string& name) {
    auto it = std::find_if(flags.begin(), flags.end(),
                           [&](const Flag& f) { return f.name == name; });
    if (it == flags.end()) return false;
    flags.erase(it);
    return true;
}

bool Player::advance_flag(const std::string& name) {
    Flag* f = find_flag(name);
    if (!f || !f->sequence) return false;
    if (f->end && f->step >= *f->end) return false;
    f->step++;
    return true;
}

bool Player::reset_flag(const std::string& name) {
    Flag* f = find_flag(name);
    if (!f || !f->sequence) return false;
    f->step = 0;
    return true;
}

// ═══════════════════════════════════════════════════════════════
// World containers
// ═══════════════════════════════════════════════════════════════

namespace {

template<typename T>
void add_indexed(std::vector<T>& vec, std::unordered_map<std::string, size_t>& index,
                 T&& value, const char* what) {
    if (index.count(value.id)) {
        throw LoadError(std::string("duplicate ") + what + " id '" + value.id + "'");
    }
    index[value.id] = vec.size();
    vec.push_back(std::move(value));
}

template<typename T>
T* find_indexed(std::vector<T>& vec, const std::unordered_map<std::string, size_t>& index,
                const std::string& id) {
    auto it = index.find(id);
    return it == index.end() ? nullptr : &vec[it->second];
}

template<typename T>
const T* find_indexed(const std::vector<T>& vec,
                      const std::unordered_map<std::string, size_t>& index,
                      const std::string& id) {
    auto it = index.find(id);
    return it == index.end() ? nullptr : &vec[it->second];
}

} // anonymous namespace

void World::add_room(Room&& room)          { add_indexed(rooms_, room_index_, std::move(room), "room"); }
void World::add_item(Item&& item)          { add_indexed(items_, item_index_, std::move(item), "item"); }
void World::add_npc(Npc&& npc)             { add_indexed(npcs_, npc_index_, std::move(npc), "npc"); }
void World::add_goal(Goal&& goal)          { add_indexed(goals_, goal_index_, std::move(goal), "goal"); }
void World::add_spinner(Spinner&& spinner) { add_indexed(spinners_, spinner_index_, std::move(spinner), "spinner"); }

Room* World::room(const std::string& id)             { return find_indexed(rooms_, room_index_, id); }
const Room* World::room(const std::string& id) const { return find_indexed(rooms_, room_index_, id); }
Item* World::item(const std::string& id)             { return find_indexed(items_, item_index_, id); }
const Item* World::item(const std::string& id) const { return find_indexed(items_, item_index_, id); }
Npc* World::npc(const std::string& id)               { return find_indexed(npcs_, npc_index_, id); }
const Npc* World::npc(const std::string& id) const   { return find_indexed(npcs_, npc_index_, id); }
const Goal* World::goal(const std::string& id) const { return find_indexed(goals_, goal_index_, id); }
const Spinner* World::spinner(const std::string& id) const {
    return find_indexed(spinners_, spinner_index_, id);
}

Room& World::require_room(const std::string& id) {
    Room* r = room(id);
    if (!r) throw ReferenceError("room '" + id + "' not found");
    return *r;
}

Item& World::require_item(const std::string& id) {
    Item* i = item(id);
    if (!i) throw ReferenceError("item '" + id + "' not found");
    return *i;
}

Npc& World::require_npc(const std::string& id) {
    Npc* n = npc(id);
    if (!n) throw ReferenceError("npc '" + id + "' not found");
    return *n;
}

std::string World::player_room() const {
    return player.location.kind == LocationKind::ROOM ? player.location.id : std::string();
}

bool World::player_has_item(const std::string& item_id) const {
    const Item* i = item(item_id);
    return i && i->location.kind == LocationKind::INVENTORY;
}

std::vector<const Item*> World::items_at(const Location& loc) const {
    std::vector<const Item*> out;
    for (const auto& i : items_) {
        if (i.location == loc) out.push_back(&i);
    }
    return out;
}

bool World::location_exists(const Location& loc) const {
    switch (loc.kind) {
        case LocationKind::NOWHERE:
        case LocationKind::INVENTORY: return true;
        case LocationKind::ROOM:      return room(loc.id) != nullptr;
        case LocationKind::ITEM:      return item(loc.id) != nullptr;
        case LocationKind::NPC:       return npc(loc.id) != nullptr;
    }
    return false;
}

} // namespace story
