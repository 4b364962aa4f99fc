#pragma once
#include "sdl.hpp"

#include "common.hpp"
#include "render_hooks.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

// SDL2 presentation of the world.
//
// Receives activation/movement callbacks from the World and keeps its own
// draw lists: one record per active tile and one per placed entity. Nothing
// here reads world state directly, so drawing only ever sees what the last
// update reported.
class Renderer : public RenderHooks {
public:
    Renderer(int windowW, int windowH, int tileSize, bool vsync);
    ~Renderer() override;

    bool init();
    void shutdown();

    void render();

    void toggleFullscreen();
    void setTitleSuffix(const std::string& suffix);
    // Re-reads the drawable size in pixels (not window points). Returns false
    // and keeps the old size if SDL cannot report it.
    bool syncOutputSize();

    // Window size in points, as passed to SDL_CreateWindow. Leaves w/h alone
    // when there is no window.
    void windowPointSize(int& w, int& h) const;

    // Current drawable size (may differ from the requested size on HiDPI).
    int windowWidth() const { return winW; }
    int windowHeight() const { return winH; }

    void onTileActivated(const Tile& tile, int screenX, int screenY) override;
    void onTileDeactivated(const Tile& tile) override;
    void onEntityMoved(const Entity& entity, int screenX, int screenY) override;
    void onEntityRemoved(const Entity& entity) override;
    void onCameraMoved(int offsetX, int offsetY) override;

private:
    struct TileDraw {
        Vec2i pos;
        uint32_t shade = 0;
    };

    struct EntityDraw {
        Vec2i pos;
        Color color;
        bool player = false;
    };

    int winW = 0;
    int winH = 0;
    int tile = 20;
    bool vsyncEnabled = false;
    bool initialized = false;

    Vec2i camera{};

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    std::unordered_map<uint64_t, TileDraw> tiles;       // keyed by tile grid coords
    std::unordered_map<uint64_t, Vec2i> activeByPixel;  // screen pos -> grid coords
    std::unordered_map<int, EntityDraw> entities;

    static uint64_t packKey(int a, int b);

    // World pixels (y up) to an SDL rect (y down) after the camera offset.
    SDL_Rect toScreen(const Vec2i& worldPos, int inset) const;
};
