#pragma once
#include "common.hpp"
#include "direction.hpp"
#include "grid.hpp"

#include <cstdint>

// Why a step did not happen. None means the step was applied.
// Blocked steps are ordinary outcomes (walking into a wall or another
// entity), not errors.
enum class MoveBlock : uint8_t {
    None = 0,
    NoPendingMove,
    NotPlaced,
    OutOfBounds,
    Occupied,
    Blocked, // tile is not walkable
};

const char* moveBlockName(MoveBlock b);

struct MoveResult {
    EntityId entity = NO_ENTITY;
    bool moved = false;
    Direction dir = Direction::Left;
    MoveBlock block = MoveBlock::None;
    Vec2i from{};
    Vec2i to{};                   // attempted target (valid even when blocked)
    EntityId blocker = NO_ENTITY; // set for MoveBlock::Occupied
};

// Attempts a single step in `dir`. Never touches pendingMove.
MoveResult tryStep(Grid& grid, EntityId id, Direction dir);

// Consumes the entity's pending move (if any) and attempts it once.
// The pending move is cleared whatever the outcome; a blocked move needs a
// fresh input to be tried again.
MoveResult resolvePendingMove(Grid& grid, EntityId id);
