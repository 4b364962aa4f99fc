#include "grid.hpp"

#include <algorithm>
#include <utility>

const char* gridStatusName(GridStatus s) {
    switch (s) {
        case GridStatus::Ok:            return "ok";
        case GridStatus::OutOfBounds:   return "out of bounds";
        case GridStatus::CellOccupied:  return "cell occupied";
        case GridStatus::AlreadyPlaced: return "already placed";
        case GridStatus::NotPlaced:     return "not placed";
        case GridStatus::NoSuchEntity:  return "no such entity";
    }
    return "unknown";
}

Grid::Grid(int cols, int rows)
    : cols_(std::max(0, cols)), rows_(std::max(0, rows)) {
    tiles_.resize(static_cast<size_t>(cols_) * static_cast<size_t>(rows_));
    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < cols_; ++col) {
            Tile& t = tiles_[static_cast<size_t>(tileIndex(col, row))];
            t.gridX = col;
            t.gridY = row;
        }
    }
}

Tile* Grid::tileAt(int col, int row) {
    if (!inBounds(col, row)) return nullptr;
    return &tiles_[static_cast<size_t>(tileIndex(col, row))];
}

const Tile* Grid::tileAt(int col, int row) const {
    if (!inBounds(col, row)) return nullptr;
    return &tiles_[static_cast<size_t>(tileIndex(col, row))];
}

EntityId Grid::createEntity(std::string name, EntityKind kind) {
    Entity e;
    e.id = static_cast<EntityId>(entities_.size());
    e.kind = kind;
    e.name = std::move(name);
    entities_.push_back(std::move(e));
    return entities_.back().id;
}

Entity* Grid::entity(EntityId id) {
    if (id < 0 || static_cast<size_t>(id) >= entities_.size()) return nullptr;
    return &entities_[static_cast<size_t>(id)];
}

const Entity* Grid::entity(EntityId id) const {
    if (id < 0 || static_cast<size_t>(id) >= entities_.size()) return nullptr;
    return &entities_[static_cast<size_t>(id)];
}

std::optional<Vec2i> Grid::positionOf(EntityId id) const {
    const Entity* e = entity(id);
    if (!e || !e->placed()) return std::nullopt;
    const Tile& t = tile(e->tile);
    return Vec2i{ t.gridX, t.gridY };
}

void Grid::link(Entity& e, Tile& t) {
    t.occupant = e.id;
    e.tile = tileIndex(t.gridX, t.gridY);
}

void Grid::unlink(Tile& t) {
    if (Entity* e = entity(t.occupant)) {
        e->tile = NO_TILE;
    }
    t.occupant = NO_ENTITY;
}

GridStatus Grid::place(EntityId id, int col, int row) {
    Entity* e = entity(id);
    if (!e) return GridStatus::NoSuchEntity;

    Tile* t = tileAt(col, row);
    if (!t) return GridStatus::OutOfBounds;
    if (t->occupied()) return GridStatus::CellOccupied;
    if (e->placed()) return GridStatus::AlreadyPlaced;

    link(*e, *t);
    return GridStatus::Ok;
}

GridStatus Grid::vacate(int col, int row) {
    Tile* t = tileAt(col, row);
    if (!t) return GridStatus::OutOfBounds;
    unlink(*t);
    return GridStatus::Ok;
}

GridStatus Grid::relocate(EntityId id, int col, int row) {
    Entity* e = entity(id);
    if (!e) return GridStatus::NoSuchEntity;
    if (!e->placed()) return GridStatus::NotPlaced;

    Tile* dst = tileAt(col, row);
    if (!dst) return GridStatus::OutOfBounds;
    if (dst->occupied()) return GridStatus::CellOccupied;

    unlink(tile(e->tile));
    link(*e, *dst);
    return GridStatus::Ok;
}

GridStatus Grid::remove(EntityId id) {
    Entity* e = entity(id);
    if (!e) return GridStatus::NoSuchEntity;
    if (!e->placed()) return GridStatus::NotPlaced;
    unlink(tile(e->tile));
    return GridStatus::Ok;
}

bool Grid::checkOccupancy(std::string* err) const {
    auto fail = [&](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };

    for (const Tile& t : tiles_) {
        if (!t.occupied()) continue;
        const Entity* e = entity(t.occupant);
        if (!e) {
            return fail("tile (" + std::to_string(t.gridX) + "," + std::to_string(t.gridY) +
                        ") names missing entity " + std::to_string(t.occupant));
        }
        if (e->tile != tileIndex(t.gridX, t.gridY)) {
            return fail("tile (" + std::to_string(t.gridX) + "," + std::to_string(t.gridY) +
                        ") claims '" + e->name + "' but the entity points elsewhere");
        }
    }

    for (const Entity& e : entities_) {
        if (!e.placed()) continue;
        if (e.tile < 0 || static_cast<size_t>(e.tile) >= tiles_.size()) {
            return fail("entity '" + e.name + "' points at invalid tile " + std::to_string(e.tile));
        }
        if (tile(e.tile).occupant != e.id) {
            return fail("entity '" + e.name + "' points at a tile that does not hold it");
        }
    }
    return true;
}
