#include "settings.hpp"
#include "common.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        size_t used = 0;
        const std::string t = trim(v);
        const int parsed = std::stoi(t, &used);
        if (used != t.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Strips a trailing # or ; comment.
std::string stripComment(const std::string& line) {
    const size_t cut = line.find_first_of("#;");
    return cut == std::string::npos ? line : line.substr(0, cut);
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        line = trim(stripComment(line));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        int v = 0;
        bool b = false;
        if (key == "tile_size") {
            if (parseInt(val, v)) s.tileSize = std::clamp(v, 4, 128);
        } else if (key == "window_width") {
            if (parseInt(val, v)) s.windowWidth = std::clamp(v, 64, 8192);
        } else if (key == "window_height") {
            if (parseInt(val, v)) s.windowHeight = std::clamp(v, 64, 8192);
        } else if (key == "start_fullscreen") {
            if (parseBool(val, b)) s.startFullscreen = b;
        } else if (key == "vsync") {
            if (parseBool(val, b)) s.vsync = b;
        } else if (key == "show_fps") {
            if (parseBool(val, b)) s.showFps = b;
        } else if (key == "remember_window_size") {
            if (parseBool(val, b)) s.rememberWindowSize = b;
        } else if (key == "grid_cols") {
            if (parseInt(val, v)) s.gridCols = std::clamp(v, 1, 4096);
        } else if (key == "grid_rows") {
            if (parseInt(val, v)) s.gridRows = std::clamp(v, 1, 4096);
        } else if (key == "npc_count") {
            if (parseInt(val, v)) s.npcCount = std::clamp(v, 0, 10000);
        } else if (key == "spawn_x") {
            if (parseInt(val, v)) s.spawnX = std::max(0, v);
        } else if (key == "spawn_y") {
            if (parseInt(val, v)) s.spawnY = std::max(0, v);
        } else if (key == "update_hz") {
            if (parseInt(val, v)) s.updateHz = std::clamp(v, 10, 240);
        } else if (key == "move_repeat_ms") {
            if (parseInt(val, v)) s.moveRepeatMs = std::clamp(v, 0, 2000);
        } else if (key == "log_level") {
            if (auto l = parseLogLevel(val)) s.logLevel = *l;
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# GridRogue settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# Rendering / window
tile_size = 20
window_width = 960
window_height = 540
start_fullscreen = false
vsync = true
# show_fps: true/false (updates/s and ms/draw in the window title)
show_fps = true
remember_window_size = true

# Level
grid_cols = 100
grid_rows = 100
npc_count = 10
spawn_x = 24
spawn_y = 13

# Simulation
# update_hz: fixed simulation rate, 10..240
update_hz = 60
# move_repeat_ms: holding a movement key repeats the step every N ms (0 = off)
move_repeat_ms = 100

# Diagnostics
# log_level: debug | info | warn | error | off
log_level = info

# -----------------------------------------------------------------------------
# Keybindings
#
# Rebind movement keys by adding entries of the form:
#   bind_<direction> = key[, key, ...]
#
# Directions: left, left_up, up, right_up, right, right_down, down, left_down
# Set a binding to "none" to disable it.
# -----------------------------------------------------------------------------

bind_left = left, kp_4
bind_left_up = kp_7
bind_up = up, kp_8
bind_right_up = kp_9
bind_right = right, kp_6
bind_right_down = kp_3
bind_down = down, kp_2
bind_left_down = kp_1
)INI";

    return true;
}

bool updateIniKey(const std::string& path, const std::string& key, const std::string& value) {
    std::ifstream in(path);
    if (!in) return false;

    std::vector<std::string> lines;
    std::string line;
    const std::string keyLower = toLower(key);

    bool found = false;
    while (std::getline(in, line)) {
        // Match on the comment-stripped text, but keep non-matching lines verbatim.
        const std::string raw = stripComment(line);
        auto eq = raw.find('=');
        if (eq != std::string::npos) {
            const std::string k = trim(raw.substr(0, eq));
            if (!k.empty() && toLower(k) == keyLower) {
                lines.push_back(key + " = " + value);
                found = true;
                continue;
            }
        }
        lines.push_back(line);
    }
    in.close();

    if (!found) {
        lines.push_back(key + " = " + value);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;

    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 < lines.size()) out << "\n";
    }
    return true;
}

WorldConfig worldConfigFromSettings(const Settings& s) {
    WorldConfig cfg;
    cfg.cols = s.gridCols;
    cfg.rows = s.gridRows;
    cfg.tileW = s.tileSize;
    cfg.tileH = s.tileSize;
    cfg.windowW = s.windowWidth;
    cfg.windowH = s.windowHeight;
    cfg.playerSpawn = Vec2i{ s.spawnX, s.spawnY };
    cfg.npcCount = s.npcCount;
    return cfg;
}
