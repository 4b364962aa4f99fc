#include "direction.hpp"

namespace {

struct DirectionInfo {
    Direction dir;
    int dx;
    int dy;
    const char* name;
};

// Indexed by Direction. Opposites sit four entries apart.
constexpr DirectionInfo DIRECTION_TABLE[DIRECTION_COUNT] = {
    { Direction::Left,      -1,  0, "left" },
    { Direction::LeftUp,    -1,  1, "left_up" },
    { Direction::Up,         0,  1, "up" },
    { Direction::RightUp,    1,  1, "right_up" },
    { Direction::Right,      1,  0, "right" },
    { Direction::RightDown,  1, -1, "right_down" },
    { Direction::Down,       0, -1, "down" },
    { Direction::LeftDown,  -1, -1, "left_down" },
};

const DirectionInfo& info(Direction d) {
    return DIRECTION_TABLE[static_cast<size_t>(d)];
}

} // namespace

Vec2i delta(Direction d) {
    const DirectionInfo& i = info(d);
    return Vec2i{ i.dx, i.dy };
}

Direction opposite(Direction d) {
    return static_cast<Direction>((static_cast<int>(d) + DIRECTION_COUNT / 2) % DIRECTION_COUNT);
}

const char* directionName(Direction d) {
    return info(d).name;
}

std::optional<Direction> parseDirection(const std::string& nameIn) {
    const std::string name = toLower(trim(nameIn));
    for (const DirectionInfo& i : DIRECTION_TABLE) {
        if (name == i.name) return i.dir;
    }

    if (name == "w" || name == "west") return Direction::Left;
    if (name == "e" || name == "east") return Direction::Right;
    if (name == "n" || name == "north") return Direction::Up;
    if (name == "s" || name == "south") return Direction::Down;
    if (name == "nw" || name == "up_left" || name == "upleft") return Direction::LeftUp;
    if (name == "ne" || name == "up_right" || name == "upright") return Direction::RightUp;
    if (name == "se" || name == "down_right" || name == "downright") return Direction::RightDown;
    if (name == "sw" || name == "down_left" || name == "downleft") return Direction::LeftDown;
    return std::nullopt;
}

std::optional<Direction> directionFromDelta(int dx, int dy) {
    for (const DirectionInfo& i : DIRECTION_TABLE) {
        if (i.dx == dx && i.dy == dy) return i.dir;
    }
    return std::nullopt;
}
