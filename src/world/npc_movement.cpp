#include "world/npc_movement.hpp"
#include "view/output_buffer.hpp"
#include "core/log.hpp"

namespace story {

bool NpcMovementSystem::move_scheduled(const NpcMovement& movement, uint64_t turn) {
    switch (movement.timing) {
        case MovementTiming::EVERY_N_TURNS:
            return movement.timing_value > 0 && turn % movement.timing_value == 0;
        case MovementTiming::ON_TURN:
            return turn == movement.timing_value;
    }
    return false;
}

std::optional<std::string> NpcMovementSystem::next_room(NpcMovement& movement, StoryRNG& rng) {
    if (movement.rooms.empty()) return std::nullopt;

    if (movement.kind == MovementKind::RANDOM_SET) {
        return movement.rooms[rng.next_index(movement.rooms.size())];
    }

    size_t next = movement.route_index + 1;
    if (movement.loop) next %= movement.rooms.size();
    if (next >= movement.rooms.size()) return std::nullopt;

    movement.route_index = next;
    return movement.rooms[next];
}

void NpcMovementSystem::move_npc(World& world, OutputBuffer& view, Npc& npc,
                                 const std::string& room_id) {
    std::string player_room = world.player_room();
    std::string from = npc.location.kind == LocationKind::ROOM ? npc.location.id : "";

    Log::info("Movement", "npc '" + npc.id + "' " +
              (from.empty() ? std::string("<nowhere>") : from) + " -> " + room_id);

    npc.location = Location::room(room_id);

    if (player_room.empty()) return;
    if (from == player_room) {
        view.push(OutputTag::TRANSIT, npc.name + " leaves.");
    } else if (room_id == player_room) {
        view.push(OutputTag::TRANSIT, npc.name + " arrives.");
    }
}

size_t NpcMovementSystem::update_all(World& world, OutputBuffer& view) {
    const uint64_t turn = world.turn_count;
    size_t moved = 0;

    for (auto& npc : world.npcs()) {
        if (!npc.movement) continue;
        NpcMovement& mv = *npc.movement;
        if (!mv.active) continue;

        if (mv.paused_until) {
            if (turn < *mv.paused_until) continue;
            mv.paused_until.reset();
        }

        if (!move_scheduled(mv, turn)) continue;

        std::optional<std::string> dest = next_room(mv, world.rng);
        if (!dest || npc.location == Location::room(*dest)) continue;

        if (!world.room(*dest)) {
            Log::warn("Movement", "npc '" + npc.id + "': room '" + *dest + "' not found");
            continue;
        }

        mv.last_moved_turn = turn;
        move_npc(world, view, npc, *dest);
        moved++;
    }
    return moved;
}

} // namespace story
