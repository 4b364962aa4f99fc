#include "viewport.hpp"

#include <algorithm>
#include <cstdlib>

Viewport::Viewport(int tileW, int tileH, Vec2i screenOrigin)
    : tileW_(std::max(1, tileW)), tileH_(std::max(1, tileH)), origin_(screenOrigin) {
    setWindowSize(tileW_, tileH_);
}

int Viewport::visibleTilesFor(int windowPx, int tilePx) {
    const int px = std::max(1, windowPx);
    const int tile = std::max(1, tilePx);
    int n = ceilDiv(px, tile);
    // Even counts are at most INT_MAX - 1, so the bump cannot overflow.
    if (n % 2 == 0) ++n;
    return n;
}

void Viewport::setWindowSize(int windowW, int windowH) {
    windowW_ = std::max(1, windowW);
    windowH_ = std::max(1, windowH);
    visibleCols_ = visibleTilesFor(windowW_, tileW_);
    visibleRows_ = visibleTilesFor(windowH_, tileH_);
}

TileRect Viewport::computeWindow(const Grid& grid, Vec2i focus, int& leftOff, int& bottomOff) const {
    leftOff = 0;
    bottomOff = 0;
    if (grid.cols() <= 0 || grid.rows() <= 0) return TileRect{};

    const int fx = clampi(focus.x, 0, grid.cols() - 1);
    const int fy = clampi(focus.y, 0, grid.rows() - 1);

    const int w = std::min(visibleCols_, grid.cols());
    const int h = std::min(visibleRows_, grid.rows());

    const int centeredCol = fx - visibleCols_ / 2;
    const int centeredRow = fy - visibleRows_ / 2;

    TileRect r;
    r.minCol = clampi(centeredCol, 0, grid.cols() - w);
    r.maxCol = r.minCol + w - 1;
    r.minRow = clampi(centeredRow, 0, grid.rows() - h);
    r.maxRow = r.minRow + h - 1;

    leftOff = r.minCol - centeredCol;
    bottomOff = r.minRow - centeredRow;
    return r;
}

void Viewport::commit(const TileRect& next, Vec2i focus, int leftOff, int bottomOff, RenderHooks* hooks) {
    window_ = next;
    focus_ = focus;
    leftOffset_ = leftOff;
    bottomOffset_ = bottomOff;

    Vec2i cam{};
    if (!window_.empty()) {
        const Vec2i base = tileScreenPos(window_.minCol, window_.minRow);
        cam.x = base.x + (window_.width() * tileW_) / 2 - windowW_ / 2;
        cam.y = base.y + (window_.height() * tileH_) / 2 - windowH_ / 2;
    }
    camera_ = cam;
    if (hooks) hooks->onCameraMoved(camera_.x, camera_.y);
}

void Viewport::activate(Tile& t, RenderHooks* hooks) {
    if (t.active) return;
    const Vec2i p = tileScreenPos(t.gridX, t.gridY);
    t.active = true;
    t.screenPos = p;
    if (hooks) hooks->onTileActivated(t, p.x, p.y);
}

void Viewport::deactivate(Tile& t, RenderHooks* hooks) {
    if (!t.active) return;
    t.active = false;
    t.screenPos.reset();
    if (hooks) hooks->onTileDeactivated(t);
}

void Viewport::deactivateOutside(Grid& grid, const TileRect& from, const TileRect& keep, RenderHooks* hooks) {
    if (from.empty()) return;
    for (int row = from.minRow; row <= from.maxRow; ++row) {
        const bool rowKept = !keep.empty() && row >= keep.minRow && row <= keep.maxRow;
        if (!rowKept) {
            for (int col = from.minCol; col <= from.maxCol; ++col) {
                if (Tile* t = grid.tileAt(col, row)) deactivate(*t, hooks);
            }
            continue;
        }
        // Row survives: only the columns left of / right of `keep` go.
        for (int col = from.minCol; col <= std::min(from.maxCol, keep.minCol - 1); ++col) {
            if (Tile* t = grid.tileAt(col, row)) deactivate(*t, hooks);
        }
        for (int col = std::max(from.minCol, keep.maxCol + 1); col <= from.maxCol; ++col) {
            if (Tile* t = grid.tileAt(col, row)) deactivate(*t, hooks);
        }
    }
}

void Viewport::activateOutside(Grid& grid, const TileRect& to, const TileRect& had, RenderHooks* hooks) {
    if (to.empty()) return;
    for (int row = to.minRow; row <= to.maxRow; ++row) {
        const bool rowHad = !had.empty() && row >= had.minRow && row <= had.maxRow;
        if (!rowHad) {
            for (int col = to.minCol; col <= to.maxCol; ++col) {
                if (Tile* t = grid.tileAt(col, row)) activate(*t, hooks);
            }
            continue;
        }
        for (int col = to.minCol; col <= std::min(to.maxCol, had.minCol - 1); ++col) {
            if (Tile* t = grid.tileAt(col, row)) activate(*t, hooks);
        }
        for (int col = std::max(to.minCol, had.maxCol + 1); col <= to.maxCol; ++col) {
            if (Tile* t = grid.tileAt(col, row)) activate(*t, hooks);
        }
    }
}

void Viewport::rebuild(Grid& grid, Vec2i focus, RenderHooks* hooks) {
    int leftOff = 0;
    int bottomOff = 0;
    const TileRect next = computeWindow(grid, focus, leftOff, bottomOff);

    // Full pass over both windows: after a resize any number of rows and
    // columns may have changed on every side.
    const TileRect prev = window_;
    if (!prev.empty()) {
        for (int row = prev.minRow; row <= prev.maxRow; ++row) {
            for (int col = prev.minCol; col <= prev.maxCol; ++col) {
                if (next.contains(col, row)) continue;
                if (Tile* t = grid.tileAt(col, row)) deactivate(*t, hooks);
            }
        }
    }
    if (!next.empty()) {
        for (int row = next.minRow; row <= next.maxRow; ++row) {
            for (int col = next.minCol; col <= next.maxCol; ++col) {
                if (Tile* t = grid.tileAt(col, row)) activate(*t, hooks);
            }
        }
    }

    commit(next, focus, leftOff, bottomOff, hooks);
}

void Viewport::follow(Grid& grid, Vec2i focus, Direction moved, RenderHooks* hooks) {
    int leftOff = 0;
    int bottomOff = 0;
    const TileRect next = computeWindow(grid, focus, leftOff, bottomOff);
    const TileRect prev = window_;

    const Vec2i d = delta(moved);
    const int shiftX = next.minCol - prev.minCol;
    const int shiftY = next.minRow - prev.minRow;

    // A single step shifts the window by at most one tile along the step,
    // without changing its size. Anything else gets the full pass.
    const bool stepShift =
        !prev.empty() && !next.empty() &&
        prev.width() == next.width() && prev.height() == next.height() &&
        (shiftX == 0 || shiftX == d.x) && (shiftY == 0 || shiftY == d.y);
    if (!stepShift) {
        rebuild(grid, focus, hooks);
        return;
    }

    if (shiftX != 0 || shiftY != 0) {
        deactivateOutside(grid, prev, next, hooks);
        activateOutside(grid, next, prev, hooks);
        commit(next, focus, leftOff, bottomOff, hooks);
        return;
    }

    // Window pinned against an edge: only the focus moved.
    focus_ = focus;
    leftOffset_ = leftOff;
    bottomOffset_ = bottomOff;
}

void Viewport::clear(Grid& grid, RenderHooks* hooks) {
    deactivateOutside(grid, window_, TileRect{}, hooks);
    window_ = TileRect{};
}
