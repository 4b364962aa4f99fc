#pragma once

#include <string>

#include "diag.hpp"
#include "world.hpp"

// Simple user-editable settings file (INI-ish: key = value).
// The file is created next to the executable's data directory on first run.
// Unknown keys are ignored; malformed or out-of-range values fall back to or
// are clamped into sane defaults.
struct Settings {
    // Rendering / window
    int tileSize = 20;
    int windowWidth = 960;
    int windowHeight = 540;
    bool startFullscreen = false;
    bool vsync = true;
    bool showFps = true;             // updates/s and ms/draw in the window title
    bool rememberWindowSize = true;  // write the last window size back on exit

    // Level
    int gridCols = 100;
    int gridRows = 100;
    int npcCount = 10;
    int spawnX = 24;
    int spawnY = 13;

    // Simulation
    int updateHz = 60;
    // Held movement keys re-issue their move every N ms (0 = one step per press).
    int moveRepeatMs = 100;

    LogLevel logLevel = LogLevel::Info;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Update (or append) a single key=value entry in the settings file.
// Returns false if the file could not be read/written.
bool updateIniKey(const std::string& path, const std::string& key, const std::string& value);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);

WorldConfig worldConfigFromSettings(const Settings& s);
