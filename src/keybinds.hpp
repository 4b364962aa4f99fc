#pragma once

#include "sdl.hpp"

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "direction.hpp"

// Movement keybindings, loaded from the settings file.
//
// The binding format is:
//   bind_<direction> = key[, key, ...]
//
// Each key can be:
//   - a single character: w, ., ?
//   - a named key: up, down, left, right, kp_8, ...
// Modifiers can be prefixed with: shift+, ctrl+, alt+  (example: shift+left)
//
// Bindings are (keycode + required modifiers). Extra modifiers do NOT match.
struct KeyChord {
    SDL_Keycode key = SDLK_UNKNOWN;
    Uint16 mods = KMOD_NONE; // only SHIFT/CTRL/ALT bits are used
};

class KeyBinds {
public:
    // Arrow keys plus the numeric keypad (5 unbound).
    static KeyBinds defaults();
    void loadOverridesFromIni(const std::string& settingsPath);

    std::optional<Direction> mapKey(SDL_Keycode key, Uint16 mods) const;

    // direction name -> "key, key" for logging/help.
    std::vector<std::pair<std::string, std::string>> describeAll() const;

private:
    std::array<std::vector<KeyChord>, DIRECTION_COUNT> binds;

    static Uint16 normalizeMods(Uint16 mods);
    static bool chordMatches(const KeyChord& chord, SDL_Keycode key, Uint16 mods);

    static std::optional<Direction> parseBindName(const std::string& bindKey);
    static std::vector<KeyChord> parseChordList(const std::string& value);
    static std::vector<std::string> split(const std::string& s, char delim);

    static std::optional<KeyChord> parseChord(const std::string& token);
    static SDL_Keycode parseKeycode(const std::string& keyName);
    static std::string chordToString(const KeyChord& chord);
};
