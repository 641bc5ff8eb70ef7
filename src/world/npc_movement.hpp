/**
 * NpcMovement — Per-turn route and random-walk movement for NPCs.
 *
 * Runs once per advanced turn, before scheduled events drain. An NPC moves
 * when its movement is active, any pause has expired, and its timing matches
 * the current turn. Moves into or out of the player's room are reported as
 * TRANSIT output.
 */

#ifndef STORY_WORLD_NPC_MOVEMENT_HPP
#define STORY_WORLD_NPC_MOVEMENT_HPP

#include "world/world.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace story {

class OutputBuffer;

class NpcMovementSystem {
public:
    /** Move every scheduled NPC. Returns the number of NPCs that moved. */
    static size_t update_all(World& world, OutputBuffer& view);

    /** True if the timing rule says this turn is a movement turn. */
    static bool move_scheduled(const NpcMovement& movement, uint64_t turn);

    /**
     * Advance the route cursor (or draw a random room) and return the
     * destination room id. nullopt at the end of a non-looping route.
     */
    static std::optional<std::string> next_room(NpcMovement& movement, StoryRNG& rng);

private:
    static void move_npc(World& world, OutputBuffer& view, Npc& npc, const std::string& room_id);
};

} // namespace story

#endif // STORY_WORLD_NPC_MOVEMENT_HPP
