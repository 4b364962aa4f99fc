#pragma once
#include "entity.hpp"
#include "grid.hpp"

// Callbacks from the world to whatever draws it.
//
// The world only flips activation flags and computes positions; creating,
// pooling and positioning the actual visuals is the receiver's job.
// Screen coordinates are in world pixels (y up); the receiver applies the
// camera offset from onCameraMoved() when drawing.
class RenderHooks {
public:
    virtual ~RenderHooks() = default;

    virtual void onTileActivated(const Tile& tile, int screenX, int screenY) {
        (void)tile; (void)screenX; (void)screenY;
    }
    virtual void onTileDeactivated(const Tile& tile) { (void)tile; }

    virtual void onEntityMoved(const Entity& entity, int screenX, int screenY) {
        (void)entity; (void)screenX; (void)screenY;
    }
    virtual void onEntityRemoved(const Entity& entity) { (void)entity; }

    virtual void onCameraMoved(int offsetX, int offsetY) { (void)offsetX; (void)offsetY; }
};
