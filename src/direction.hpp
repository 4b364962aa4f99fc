#pragma once
#include "common.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

// The eight compass directions an entity can step in.
//
// Deltas use the grid's own convention: x grows to the right, y grows upward
// (row 0 is the bottom row, matching the bottom-to-top screen layout).
// Diagonal and orthogonal steps cost the same single tick.
enum class Direction : uint8_t {
    Left = 0,
    LeftUp,
    Up,
    RightUp,
    Right,
    RightDown,
    Down,
    LeftDown,
};

constexpr int DIRECTION_COUNT = 8;

constexpr std::array<Direction, DIRECTION_COUNT> ALL_DIRECTIONS = {
    Direction::Left,  Direction::LeftUp,    Direction::Up,   Direction::RightUp,
    Direction::Right, Direction::RightDown, Direction::Down, Direction::LeftDown,
};

Vec2i delta(Direction d);
Direction opposite(Direction d);
const char* directionName(Direction d);

// Accepts the names produced by directionName() plus a few aliases
// ("up_left", "nw", ...). Case-insensitive.
std::optional<Direction> parseDirection(const std::string& name);

// Reverse lookup; (0,0) and non-unit deltas have no direction.
std::optional<Direction> directionFromDelta(int dx, int dy);
