#include "world.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace {

std::string cellStr(int col, int row) {
    return "(" + std::to_string(col) + "," + std::to_string(row) + ")";
}

} // namespace

World::World(const WorldConfig& cfg, RenderHooks* hooks, DiagSink* diag)
    : cfg_(cfg),
      hooks_(hooks),
      diag_(diag),
      grid_(cfg.cols, cfg.rows),
      viewport_(cfg.tileW, cfg.tileH, cfg.screenOrigin) {
    viewport_.setWindowSize(cfg_.windowW, cfg_.windowH);
}

void World::resetGrid() {
    viewport_.clear(grid_, hooks_);
    for (const Entity& e : grid_.entities()) {
        if (e.placed() && hooks_) hooks_->onEntityRemoved(e);
    }

    grid_ = Grid(cfg_.cols, cfg_.rows);
    viewport_ = Viewport(cfg_.tileW, cfg_.tileH, cfg_.screenOrigin);
    viewport_.setWindowSize(cfg_.windowW, cfg_.windowH);

    player_ = NO_ENTITY;
    npcs_.clear();
    lastResults_.clear();
}

void World::generate(RNG& rng) {
    logDebug(diag_, "Initializing grid");
    const auto t0 = std::chrono::steady_clock::now();

    resetGrid();

    if (grid_.cols() <= 0 || grid_.rows() <= 0) {
        logWarn(diag_, "Grid has no tiles; nothing to populate");
        return;
    }

    const int px = clampi(cfg_.playerSpawn.x, 0, grid_.cols() - 1);
    const int py = clampi(cfg_.playerSpawn.y, 0, grid_.rows() - 1);
    spawnEntity("player", EntityKind::Player, px, py);

    for (int i = 0; i < cfg_.npcCount; ++i) {
        const EntityId id = grid_.createEntity("npc" + std::to_string(i), EntityKind::Npc);
        Entity* e = grid_.entity(id);
        e->tint = Color{ rng.channel(), rng.channel(), rng.channel(), 255 };
        if (!placeRandomly(id, rng)) {
            logWarn(diag_, "No free tile left for '" + e->name + "'; stopping at " +
                               std::to_string(npcs_.size()) + " NPCs");
            break;
        }
        npcs_.push_back(id);
        announceEntity(*grid_.entity(id));
    }

    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    std::ostringstream ss;
    ss << "Init took " << std::fixed << std::setprecision(4) << secs << "s ("
       << grid_.cols() << "x" << grid_.rows() << " tiles, " << npcs_.size() << " NPCs)";
    logInfo(diag_, ss.str());
}

bool World::placeRandomly(EntityId id, RNG& rng) {
    constexpr int RANDOM_TRIES = 64;
    for (int i = 0; i < RANDOM_TRIES; ++i) {
        const int col = rng.range(0, grid_.cols() - 1);
        const int row = rng.range(0, grid_.rows() - 1);
        if (grid_.place(id, col, row) == GridStatus::Ok) return true;
    }

    // Crowded grid: walk from a random start to the first free tile.
    const int total = grid_.cols() * grid_.rows();
    const int start = rng.range(0, total - 1);
    for (int k = 0; k < total; ++k) {
        const Tile& t = grid_.tile((start + k) % total);
        if (t.occupied()) continue;
        if (grid_.place(id, t.gridX, t.gridY) == GridStatus::Ok) return true;
    }
    return false;
}

EntityId World::spawnEntity(const std::string& name, EntityKind kind, int col, int row, GridStatus* status) {
    auto setStatus = [&](GridStatus s) {
        if (status) *status = s;
    };

    const Tile* t = grid_.tileAt(col, row);
    if (!t) {
        setStatus(GridStatus::OutOfBounds);
        return NO_ENTITY;
    }
    if (t->occupied()) {
        setStatus(GridStatus::CellOccupied);
        return NO_ENTITY;
    }

    const EntityId id = grid_.createEntity(name, kind);
    const GridStatus s = grid_.place(id, col, row);
    setStatus(s);
    if (s != GridStatus::Ok) return NO_ENTITY;

    const Vec2i pos = viewport_.tileScreenPos(col, row);
    logDebug(diag_, "Adding entity '" + name + "' on: grid" + cellStr(col, row) +
                        " abs" + cellStr(pos.x, pos.y));

    if (kind == EntityKind::Player && player_ == NO_ENTITY) {
        player_ = id;
        viewport_.rebuild(grid_, Vec2i{ col, row }, hooks_);
    } else if (kind == EntityKind::Npc) {
        npcs_.push_back(id);
    }

    announceEntity(*grid_.entity(id));
    return id;
}

GridStatus World::despawn(EntityId id) {
    const GridStatus s = grid_.remove(id);
    if (s != GridStatus::Ok) return s;

    clearPendingMove(id);
    // The view stays where it is until another Player is spawned.
    if (id == player_) player_ = NO_ENTITY;
    const Entity* e = grid_.entity(id);
    logDebug(diag_, "Removed entity '" + e->name + "'");
    if (hooks_) hooks_->onEntityRemoved(*e);
    return s;
}

void World::announceEntity(const Entity& e) {
    if (!hooks_ || !e.placed()) return;
    const Tile& t = grid_.tile(e.tile);
    const Vec2i p = viewport_.tileScreenPos(t.gridX, t.gridY);
    hooks_->onEntityMoved(e, p.x, p.y);
}

bool World::setPendingMove(EntityId id, Direction dir, int inputToken) {
    Entity* e = grid_.entity(id);
    if (!e || !e->placed()) return false;
    e->pendingMove = PendingMove{ dir, inputToken };
    return true;
}

bool World::releaseMoveInput(EntityId id, int inputToken) {
    Entity* e = grid_.entity(id);
    if (!e || !e->pendingMove) return false;
    if (e->pendingMove->inputToken != inputToken) return false;
    e->pendingMove.reset();
    return true;
}

void World::clearPendingMove(EntityId id) {
    if (Entity* e = grid_.entity(id)) e->pendingMove.reset();
}

void World::update(float dt) {
    ++ticks_;
    elapsed_ += static_cast<double>(dt);
    lastResults_.clear();

    if (const Entity* p = grid_.entity(player_)) {
        if (p->pendingMove) applyResult(resolvePendingMove(grid_, player_));
    }

    const EntityId count = static_cast<EntityId>(grid_.entities().size());
    for (EntityId id = 0; id < count; ++id) {
        if (id == player_ || !grid_.entity(id)->pendingMove) continue;
        applyResult(resolvePendingMove(grid_, id));
    }

    verifyOccupancy();
}

void World::applyResult(const MoveResult& r) {
    lastResults_.push_back(r);

    const Entity* e = grid_.entity(r.entity);
    if (!e) return;

    if (!r.moved) {
        logDebug(diag_, "Cannot move entity '" + e->name + "' to " + cellStr(r.to.x, r.to.y) +
                            " - " + moveBlockName(r.block));
        return;
    }

    announceEntity(*e);
    if (r.entity == player_) {
        viewport_.follow(grid_, r.to, r.dir, hooks_);
    }
}

void World::resize(int windowW, int windowH) {
    logDebug(diag_, "The window was resized to " + std::to_string(windowW) + "x" + std::to_string(windowH));
    cfg_.windowW = windowW;
    cfg_.windowH = windowH;
    viewport_.setWindowSize(windowW, windowH);
    viewport_.rebuild(grid_, focusCell(), hooks_);
}

Vec2i World::focusCell() const {
    if (const std::optional<Vec2i> p = grid_.positionOf(player_)) return *p;
    return viewport_.focus();
}

void World::verifyOccupancy() const {
#ifndef NDEBUG
    std::string err;
    if (!grid_.checkOccupancy(&err)) {
        // A half-applied occupancy change cannot be repaired from here.
        logError(diag_, "Occupancy invariant violated: " + err);
        std::abort();
    }
#endif
}
