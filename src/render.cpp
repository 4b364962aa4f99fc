#include "render.hpp"
#include "rng.hpp"
#include "version.hpp"

#include <iostream>

Renderer::Renderer(int windowW, int windowH, int tileSize, bool vsync)
    : winW(windowW), winH(windowH), tile(tileSize), vsyncEnabled(vsync) {}

Renderer::~Renderer() {
    shutdown();
}

uint64_t Renderer::packKey(int a, int b) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(a)) << 32) | static_cast<uint32_t>(b);
}

bool Renderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(GRIDROGUE_APPNAME) + " v" + GRIDROGUE_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window);
        window = nullptr;
        return false;
    }

    initialized = true;
    syncOutputSize();
    return true;
}

void Renderer::shutdown() {
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    initialized = false;
}

void Renderer::toggleFullscreen() {
    if (!window) return;
    const Uint32 flags = SDL_GetWindowFlags(window);
    const bool isFs = (flags & SDL_WINDOW_FULLSCREEN_DESKTOP) != 0;
    if (SDL_SetWindowFullscreen(window, isFs ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP) != 0) {
        std::cerr << "SDL_SetWindowFullscreen failed: " << SDL_GetError() << "\n";
    }
}

void Renderer::setTitleSuffix(const std::string& suffix) {
    if (!window) return;
    std::string title = std::string(GRIDROGUE_APPNAME) + " v" + GRIDROGUE_VERSION;
    if (!suffix.empty()) title += "  |  " + suffix;
    SDL_SetWindowTitle(window, title.c_str());
}

void Renderer::windowPointSize(int& w, int& h) const {
    if (!window) return;
    SDL_GetWindowSize(window, &w, &h);
}

bool Renderer::syncOutputSize() {
    if (!renderer) return false;
    int outW = 0;
    int outH = 0;
    if (SDL_GetRendererOutputSize(renderer, &outW, &outH) != 0) {
        std::cerr << "SDL_GetRendererOutputSize failed: " << SDL_GetError() << "\n";
        return false;
    }
    if (outW <= 0 || outH <= 0) return false;
    winW = outW;
    winH = outH;
    return true;
}

void Renderer::onTileActivated(const Tile& t, int screenX, int screenY) {
    TileDraw d;
    d.pos = Vec2i{ screenX, screenY };
    // Slight per-tile shade variation so scrolling is visible on a uniform floor.
    d.shade = hash32(static_cast<uint32_t>(t.gridX) * 73856093u ^ static_cast<uint32_t>(t.gridY) * 19349663u) % 16u;
    tiles[packKey(t.gridX, t.gridY)] = d;
    activeByPixel[packKey(screenX, screenY)] = Vec2i{ t.gridX, t.gridY };
}

void Renderer::onTileDeactivated(const Tile& t) {
    auto it = tiles.find(packKey(t.gridX, t.gridY));
    if (it == tiles.end()) return;
    activeByPixel.erase(packKey(it->second.pos.x, it->second.pos.y));
    tiles.erase(it);
}

void Renderer::onEntityMoved(const Entity& e, int screenX, int screenY) {
    EntityDraw& d = entities[e.id];
    d.pos = Vec2i{ screenX, screenY };
    d.color = e.isPlayer() ? Color{ 255, 255, 255, 255 } : e.tint;
    d.player = e.isPlayer();
}

void Renderer::onEntityRemoved(const Entity& e) {
    entities.erase(e.id);
}

void Renderer::onCameraMoved(int offsetX, int offsetY) {
    camera = Vec2i{ offsetX, offsetY };
}

SDL_Rect Renderer::toScreen(const Vec2i& worldPos, int inset) const {
    SDL_Rect r;
    r.x = worldPos.x - camera.x + inset;
    r.y = winH - (worldPos.y - camera.y) - tile + inset;
    r.w = tile - inset * 2;
    r.h = tile - inset * 2;
    return r;
}

void Renderer::render() {
    if (!initialized) return;

    SDL_SetRenderDrawColor(renderer, 8, 8, 12, 255);
    SDL_RenderClear(renderer);

    for (const auto& kv : tiles) {
        const TileDraw& d = kv.second;
        const Uint8 base = static_cast<Uint8>(40 + d.shade);
        SDL_SetRenderDrawColor(renderer, base, base, static_cast<Uint8>(base + 6), 255);
        const SDL_Rect r = toScreen(d.pos, 1);
        SDL_RenderFillRect(renderer, &r);
    }

    // Entities are only drawn while their tile is active.
    for (const auto& kv : entities) {
        const EntityDraw& d = kv.second;
        if (activeByPixel.find(packKey(d.pos.x, d.pos.y)) == activeByPixel.end()) continue;
        SDL_SetRenderDrawColor(renderer, d.color.r, d.color.g, d.color.b, d.color.a);
        const SDL_Rect r = toScreen(d.pos, d.player ? 2 : 4);
        SDL_RenderFillRect(renderer, &r);
    }

    SDL_RenderPresent(renderer);
}
