#include "keybinds.hpp"
#include "common.hpp"

#include <fstream>
#include <sstream>

Uint16 KeyBinds::normalizeMods(Uint16 mods) {
    Uint16 out = KMOD_NONE;
    if (mods & KMOD_SHIFT) out |= KMOD_SHIFT;
    if (mods & KMOD_CTRL) out |= KMOD_CTRL;
    if (mods & KMOD_ALT) out |= KMOD_ALT;
    return out;
}

bool KeyBinds::chordMatches(const KeyChord& chord, SDL_Keycode key, Uint16 mods) {
    return chord.key == key && chord.mods == normalizeMods(mods);
}

std::vector<std::string> KeyBinds::split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, delim)) out.push_back(cur);
    return out;
}

SDL_Keycode KeyBinds::parseKeycode(const std::string& keyNameIn) {
    const std::string keyName = trim(toLower(keyNameIn));
    if (keyName.empty()) return SDLK_UNKNOWN;

    // Single character (letters are treated case-insensitively).
    if (keyName.size() == 1) {
        return static_cast<SDL_Keycode>(static_cast<unsigned char>(keyName[0]));
    }

    if (keyName == "up") return SDLK_UP;
    if (keyName == "down") return SDLK_DOWN;
    if (keyName == "left") return SDLK_LEFT;
    if (keyName == "right") return SDLK_RIGHT;
    if (keyName == "home") return SDLK_HOME;
    if (keyName == "end") return SDLK_END;
    if (keyName == "pageup" || keyName == "pgup") return SDLK_PAGEUP;
    if (keyName == "pagedown" || keyName == "pgdn") return SDLK_PAGEDOWN;
    if (keyName == "space") return SDLK_SPACE;
    if (keyName == "comma") return SDLK_COMMA;
    if (keyName == "period" || keyName == "dot") return SDLK_PERIOD;
    if (keyName == "slash") return SDLK_SLASH;

    if (keyName == "kp_1") return SDLK_KP_1;
    if (keyName == "kp_2") return SDLK_KP_2;
    if (keyName == "kp_3") return SDLK_KP_3;
    if (keyName == "kp_4") return SDLK_KP_4;
    if (keyName == "kp_6") return SDLK_KP_6;
    if (keyName == "kp_7") return SDLK_KP_7;
    if (keyName == "kp_8") return SDLK_KP_8;
    if (keyName == "kp_9") return SDLK_KP_9;

    // Fallback: SDL's own key name parsing ("Keypad 8", "Left", ...).
    return SDL_GetKeyFromName(keyNameIn.c_str());
}

std::optional<KeyChord> KeyBinds::parseChord(const std::string& tokenIn) {
    const std::string token = trim(tokenIn);
    if (token.empty()) return std::nullopt;

    const std::vector<std::string> parts = split(token, '+');
    if (parts.empty()) return std::nullopt;

    Uint16 mods = KMOD_NONE;
    // All parts except the last are modifiers.
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        const std::string m = trim(toLower(parts[i]));
        if (m == "shift") mods |= KMOD_SHIFT;
        else if (m == "ctrl" || m == "control") mods |= KMOD_CTRL;
        else if (m == "alt") mods |= KMOD_ALT;
        else return std::nullopt;
    }

    const SDL_Keycode key = parseKeycode(parts.back());
    if (key == SDLK_UNKNOWN) return std::nullopt;

    KeyChord chord;
    chord.key = key;
    chord.mods = normalizeMods(mods);
    return chord;
}

std::vector<KeyChord> KeyBinds::parseChordList(const std::string& valueIn) {
    const std::string value = trim(valueIn);
    if (value.empty()) return {};
    const std::string vLow = toLower(value);
    if (vLow == "none" || vLow == "unbound" || vLow == "disabled") return {};

    std::vector<KeyChord> out;
    for (const auto& part : split(value, ',')) {
        auto chord = parseChord(part);
        if (chord.has_value()) out.push_back(*chord);
    }
    return out;
}

std::optional<Direction> KeyBinds::parseBindName(const std::string& bindKeyIn) {
    const std::string key = trim(toLower(bindKeyIn));
    if (key.rfind("bind_", 0) != 0) return std::nullopt;
    return parseDirection(key.substr(5));
}

KeyBinds KeyBinds::defaults() {
    KeyBinds kb;

    auto add = [&](Direction d, SDL_Keycode key) {
        kb.binds[static_cast<size_t>(d)].push_back({ key, KMOD_NONE });
    };

    add(Direction::Left, SDLK_LEFT);
    add(Direction::Left, SDLK_KP_4);
    add(Direction::LeftUp, SDLK_KP_7);
    add(Direction::Up, SDLK_UP);
    add(Direction::Up, SDLK_KP_8);
    add(Direction::RightUp, SDLK_KP_9);
    add(Direction::Right, SDLK_RIGHT);
    add(Direction::Right, SDLK_KP_6);
    add(Direction::RightDown, SDLK_KP_3);
    add(Direction::Down, SDLK_DOWN);
    add(Direction::Down, SDLK_KP_2);
    add(Direction::LeftDown, SDLK_KP_1);

    return kb;
}

void KeyBinds::loadOverridesFromIni(const std::string& settingsPath) {
    std::ifstream in(settingsPath);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        auto commentPos = line.find_first_of("#;");
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = trim(line.substr(0, eq));
        const std::string val = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        auto dir = parseBindName(key);
        if (!dir.has_value()) continue;

        binds[static_cast<size_t>(*dir)] = parseChordList(val);
    }
}

std::optional<Direction> KeyBinds::mapKey(SDL_Keycode key, Uint16 mods) const {
    for (Direction d : ALL_DIRECTIONS) {
        for (const KeyChord& c : binds[static_cast<size_t>(d)]) {
            if (chordMatches(c, key, mods)) return d;
        }
    }
    return std::nullopt;
}

std::string KeyBinds::chordToString(const KeyChord& chord) {
    std::string out;
    if (chord.mods & KMOD_CTRL) out += "ctrl+";
    if (chord.mods & KMOD_ALT) out += "alt+";
    if (chord.mods & KMOD_SHIFT) out += "shift+";
    const char* name = SDL_GetKeyName(chord.key);
    out += toLower((name && *name) ? name : "?");
    return out;
}

std::vector<std::pair<std::string, std::string>> KeyBinds::describeAll() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (Direction d : ALL_DIRECTIONS) {
        std::string keys;
        for (const KeyChord& c : binds[static_cast<size_t>(d)]) {
            if (!keys.empty()) keys += ", ";
            keys += chordToString(c);
        }
        out.emplace_back(directionName(d), keys.empty() ? "none" : keys);
    }
    return out;
}
