#pragma once
#include "common.hpp"
#include "direction.hpp"
#include "grid.hpp"
#include "render_hooks.hpp"

// Inclusive range of grid indices. Default-constructed rects are empty.
struct TileRect {
    int minCol = 0;
    int maxCol = -1;
    int minRow = 0;
    int maxRow = -1;

    bool empty() const { return maxCol < minCol || maxRow < minRow; }
    int width() const { return empty() ? 0 : maxCol - minCol + 1; }
    int height() const { return empty() ? 0 : maxRow - minRow + 1; }

    bool contains(int col, int row) const {
        return col >= minCol && col <= maxCol && row >= minRow && row <= maxRow;
    }
};

inline bool operator==(const TileRect& a, const TileRect& b) {
    if (a.empty() || b.empty()) return a.empty() && b.empty();
    return a.minCol == b.minCol && a.maxCol == b.maxCol && a.minRow == b.minRow && a.maxRow == b.maxRow;
}

inline bool operator!=(const TileRect& a, const TileRect& b) {
    return !(a == b);
}

// The scrolling window of tiles that is currently rendered.
//
// The visible tile count per axis is ceil(window / tile) rounded up to the
// next odd number, so the focus tile can sit exactly in the middle with
// visible/2 tiles on either side. Near a grid edge the window is pushed back
// inside the grid (it keeps its size when the grid is large enough), and the
// focus ends up off-center. A grid smaller than the window is shown whole.
//
// Tiles inside the window are active and carry screen positions laid out
// left-to-right, bottom-to-top from the screen origin:
//   x = origin.x + col * tileW,  y = origin.y + row * tileH
// The camera offset is the translation that puts the window in the middle of
// the screen.
class Viewport {
public:
    Viewport(int tileW, int tileH, Vec2i screenOrigin = Vec2i{});

    // Odd tile count covering windowPx pixels; at least 1.
    static int visibleTilesFor(int windowPx, int tilePx);

    // Updates the visible tile counts. Does not touch any tile; call rebuild()
    // afterwards to apply.
    void setWindowSize(int windowW, int windowH);

    // Recomputes the window around `focus` and re-diffs every tile of the old
    // and new window. Used for the first build, resizes and jumps.
    void rebuild(Grid& grid, Vec2i focus, RenderHooks* hooks);

    // Recomputes the window after the focus stepped one tile in `moved`.
    // Only the rows/columns that left or entered the window are visited; if
    // the window changed in any other way it falls back to rebuild().
    void follow(Grid& grid, Vec2i focus, Direction moved, RenderHooks* hooks);

    // Deactivates every tile of the current window.
    void clear(Grid& grid, RenderHooks* hooks);

    Vec2i tileScreenPos(int col, int row) const {
        return Vec2i{ origin_.x + col * tileW_, origin_.y + row * tileH_ };
    }

    int tileWidth() const { return tileW_; }
    int tileHeight() const { return tileH_; }
    int windowWidth() const { return windowW_; }
    int windowHeight() const { return windowH_; }
    int visibleCols() const { return visibleCols_; }
    int visibleRows() const { return visibleRows_; }

    Vec2i focus() const { return focus_; }
    const TileRect& window() const { return window_; }

    // How many tiles the window was shifted right (left edge) / up (bottom
    // edge) to stay inside the grid; negative when pushed left/down.
    int leftOffset() const { return leftOffset_; }
    int bottomOffset() const { return bottomOffset_; }

    Vec2i cameraOffset() const { return camera_; }

private:
    int tileW_ = 1;
    int tileH_ = 1;
    Vec2i origin_{};

    int windowW_ = 1;
    int windowH_ = 1;
    int visibleCols_ = 1;
    int visibleRows_ = 1;

    Vec2i focus_{};
    TileRect window_{};
    int leftOffset_ = 0;
    int bottomOffset_ = 0;
    Vec2i camera_{};

    TileRect computeWindow(const Grid& grid, Vec2i focus, int& leftOff, int& bottomOff) const;
    void commit(const TileRect& next, Vec2i focus, int leftOff, int bottomOff, RenderHooks* hooks);

    void activate(Tile& t, RenderHooks* hooks);
    void deactivate(Tile& t, RenderHooks* hooks);

    // Deactivates tiles of `from` that are outside `keep`, walking only the
    // rows and columns of `from` that lie outside `keep`.
    void deactivateOutside(Grid& grid, const TileRect& from, const TileRect& keep, RenderHooks* hooks);
    void activateOutside(Grid& grid, const TileRect& to, const TileRect& had, RenderHooks* hooks);
};
