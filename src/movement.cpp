#include "movement.hpp"

const char* moveBlockName(MoveBlock b) {
    switch (b) {
        case MoveBlock::None:          return "none";
        case MoveBlock::NoPendingMove: return "no pending move";
        case MoveBlock::NotPlaced:     return "not placed";
        case MoveBlock::OutOfBounds:   return "out of bounds";
        case MoveBlock::Occupied:      return "tile occupied";
        case MoveBlock::Blocked:       return "not walkable";
    }
    return "unknown";
}

MoveResult tryStep(Grid& grid, EntityId id, Direction dir) {
    MoveResult r;
    r.entity = id;
    r.dir = dir;

    const std::optional<Vec2i> from = grid.positionOf(id);
    if (!from) {
        r.block = MoveBlock::NotPlaced;
        return r;
    }

    const Vec2i d = delta(dir);
    r.from = *from;
    r.to = Vec2i{ from->x + d.x, from->y + d.y };

    const Tile* target = grid.tileAt(r.to.x, r.to.y);
    if (!target) {
        r.block = MoveBlock::OutOfBounds;
        return r;
    }
    if (target->occupied()) {
        r.block = MoveBlock::Occupied;
        r.blocker = target->occupant;
        return r;
    }
    if (!target->walkable) {
        r.block = MoveBlock::Blocked;
        return r;
    }

    // Bounds and occupancy were checked above, so relocate cannot fail here.
    if (grid.relocate(id, r.to.x, r.to.y) != GridStatus::Ok) {
        r.block = MoveBlock::Occupied;
        return r;
    }
    r.moved = true;
    return r;
}

MoveResult resolvePendingMove(Grid& grid, EntityId id) {
    Entity* e = grid.entity(id);
    if (!e || !e->pendingMove) {
        MoveResult r;
        r.entity = id;
        r.block = MoveBlock::NoPendingMove;
        return r;
    }

    const Direction dir = e->pendingMove->dir;
    e->pendingMove.reset();
    return tryStep(grid, id, dir);
}
