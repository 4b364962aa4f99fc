#pragma once
#include "common.hpp"
#include "entity.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class GridStatus : uint8_t {
    Ok = 0,
    OutOfBounds,   // coordinate outside [0,cols) x [0,rows)
    CellOccupied,  // target tile already has an occupant
    AlreadyPlaced, // entity already sits on a tile (use relocate)
    NotPlaced,     // entity has no tile yet
    NoSuchEntity,  // handle does not name an entity
};

const char* gridStatusName(GridStatus s);

struct Tile {
    int gridX = 0;
    int gridY = 0;

    EntityId occupant = NO_ENTITY;
    bool walkable = true;

    // Viewport state: active tiles are inside the visible window and carry
    // their screen position; inactive tiles never do.
    bool active = false;
    std::optional<Vec2i> screenPos;

    bool occupied() const { return occupant != NO_ENTITY; }
};

// Fixed-size 2D grid of tiles plus the arena of entities standing on it.
//
// Tiles are stored row-major (index = row * cols + col). Row 0 is the bottom
// row. The shape never changes after construction.
//
// Occupancy is kept in two places: Tile::occupant and Entity::tile. Every
// mutation below writes both sides in the same call, so between calls the two
// always agree (see checkOccupancy()).
class Grid {
public:
    Grid() = default;
    Grid(int cols, int rows);

    int cols() const { return cols_; }
    int rows() const { return rows_; }

    bool inBounds(int col, int row) const {
        return col >= 0 && row >= 0 && col < cols_ && row < rows_;
    }

    int tileIndex(int col, int row) const { return row * cols_ + col; }

    // nullptr when (col,row) is out of bounds.
    Tile* tileAt(int col, int row);
    const Tile* tileAt(int col, int row) const;

    Tile& tile(int index) { return tiles_[static_cast<size_t>(index)]; }
    const Tile& tile(int index) const { return tiles_[static_cast<size_t>(index)]; }
    const std::vector<Tile>& tiles() const { return tiles_; }

    // Creates an unplaced entity. Handles are never reused.
    EntityId createEntity(std::string name, EntityKind kind);

    Entity* entity(EntityId id);
    const Entity* entity(EntityId id) const;
    const std::vector<Entity>& entities() const { return entities_; }

    std::optional<Vec2i> positionOf(EntityId id) const;

    GridStatus place(EntityId id, int col, int row);

    // Clears the tile's occupant together with that occupant's back reference.
    // Vacating an empty tile is a no-op.
    GridStatus vacate(int col, int row);

    // Moves a placed entity to another tile in one step.
    GridStatus relocate(EntityId id, int col, int row);

    // Unlinks the entity from its tile. The entity stays in the arena.
    GridStatus remove(EntityId id);

    // Verifies the two-sided occupancy links. Returns false and fills err with
    // the first disagreement found.
    bool checkOccupancy(std::string* err = nullptr) const;

private:
    int cols_ = 0;
    int rows_ = 0;
    std::vector<Tile> tiles_;
    std::vector<Entity> entities_;

    void link(Entity& e, Tile& t);
    void unlink(Tile& t);
};
