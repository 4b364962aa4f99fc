#pragma once
#include "common.hpp"
#include "diag.hpp"
#include "direction.hpp"
#include "grid.hpp"
#include "movement.hpp"
#include "render_hooks.hpp"
#include "rng.hpp"
#include "viewport.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct WorldConfig {
    int cols = 100;
    int rows = 100;

    // Tile size in screen pixels and the initial window size.
    int tileW = 20;
    int tileH = 20;
    int windowW = 960;
    int windowH = 540;
    Vec2i screenOrigin{ 0, 0 };

    // Population for generate(). The spawn cell is clamped into the grid.
    Vec2i playerSpawn{ 24, 13 };
    int npcCount = 10;
};

// One play session: the grid, its entities, and the view that follows the
// player.
//
// Everything here is driven from a single thread. The host calls update() on
// a fixed step and draws afterwards; all tile/entity mutation happens inside
// update(), resize(), generate() and the spawn helpers, and every change is
// reported through the RenderHooks before the call returns.
class World {
public:
    explicit World(const WorldConfig& cfg, RenderHooks* hooks = nullptr, DiagSink* diag = nullptr);

    // Rebuilds the grid as uniform walkable floor, places the player at the
    // configured spawn and scatters npcCount NPCs on random free tiles.
    void generate(RNG& rng);

    // Places a new entity. Returns NO_ENTITY (and the reason in *status) when
    // the cell is out of bounds or taken. The first Player spawned becomes
    // the view focus.
    EntityId spawnEntity(const std::string& name, EntityKind kind, int col, int row,
                         GridStatus* status = nullptr);

    // Takes the entity off the grid (both sides of the occupancy link).
    // Despawning the player releases the focus; the next Player spawned
    // takes it over.
    GridStatus despawn(EntityId id);

    // Input side. Returns false for unknown or unplaced entities.
    // A new request replaces any pending one (last key wins).
    bool setPendingMove(EntityId id, Direction dir, int inputToken);
    // Cancels the pending move only if it came from inputToken (key release).
    bool releaseMoveInput(EntityId id, int inputToken);
    void clearPendingMove(EntityId id);

    // One simulation tick: resolves every pending move once, player first,
    // then the others in spawn order.
    void update(float dt);

    // Window resized: recompute the visible tile counts and re-diff the whole
    // window.
    void resize(int windowW, int windowH);

    EntityId player() const { return player_; }
    const std::vector<EntityId>& npcs() const { return npcs_; }

    Grid& grid() { return grid_; }
    const Grid& grid() const { return grid_; }
    const Viewport& viewport() const { return viewport_; }
    const WorldConfig& config() const { return cfg_; }

    // Results of the most recent update(), in resolution order.
    const std::vector<MoveResult>& lastResults() const { return lastResults_; }

    // Number of update() calls and the simulated time they covered.
    uint64_t ticks() const { return ticks_; }
    double elapsedSeconds() const { return elapsed_; }

private:
    WorldConfig cfg_;
    RenderHooks* hooks_ = nullptr;
    DiagSink* diag_ = nullptr;

    Grid grid_;
    Viewport viewport_;

    EntityId player_ = NO_ENTITY;
    std::vector<EntityId> npcs_;

    std::vector<MoveResult> lastResults_;
    uint64_t ticks_ = 0;
    double elapsed_ = 0.0;

    void resetGrid();
    bool placeRandomly(EntityId id, RNG& rng);
    Vec2i focusCell() const;
    void announceEntity(const Entity& e);
    void applyResult(const MoveResult& r);
    void verifyOccupancy() const;
};
