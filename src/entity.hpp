#pragma once
#include "common.hpp"
#include "direction.hpp"

#include <cstdint>
#include <optional>
#include <string>

// Entities and tiles refer to each other through handles into the Grid's
// arenas, never through pointers.
using EntityId = int;
constexpr EntityId NO_ENTITY = -1;
constexpr int NO_TILE = -1;

enum class EntityKind : uint8_t {
    Player = 0,
    Npc,
};

// A stored directional intent. inputToken identifies the input that produced
// it (the host uses the key code) so only the matching key release cancels it.
struct PendingMove {
    Direction dir = Direction::Left;
    int inputToken = 0;
};

struct Entity {
    EntityId id = NO_ENTITY;
    EntityKind kind = EntityKind::Npc;
    std::string name;
    Color tint;

    // Index of the occupied tile, NO_TILE until placed.
    // Owned by Grid: only place/vacate/relocate/remove write it.
    int tile = NO_TILE;

    std::optional<PendingMove> pendingMove;

    bool placed() const { return tile != NO_TILE; }
    bool isPlayer() const { return kind == EntityKind::Player; }
};
