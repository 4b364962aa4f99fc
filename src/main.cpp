#include "sdl.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <system_error>

#include "diag.hpp"
#include "frame_stats.hpp"
#include "keybinds.hpp"
#include "render.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "version.hpp"
#include "world.hpp"

static std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            try {
                unsigned long v = std::stoul(argv[i + 1], nullptr, 0);
                return static_cast<uint32_t>(v);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << GRIDROGUE_APPNAME << " " << GRIDROGUE_VERSION << "\n"
        << "Usage: " << (exe ? exe : "gridrogue") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Populate the level from a specific seed\n"
        << "  --settings <path>    Use this settings file instead of the per-user one\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "  --verbose            Log at debug level\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

static std::string settingsFilePath(int argc, char** argv) {
    if (auto p = parseStringArg(argc, argv, "--settings")) {
        if (!p->empty()) return *p;
    }

    std::filesystem::path baseDir;
    if (char* p = SDL_GetPrefPath("gridrogue", GRIDROGUE_APPNAME)) {
        baseDir = std::filesystem::path(p);
        SDL_free(p);
    } else {
        baseDir = std::filesystem::current_path();
    }

    std::error_code ec;
    std::filesystem::create_directories(baseDir, ec);
    return (baseDir / "gridrogue_settings.ini").string();
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "gridrogue");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << GRIDROGUE_APPNAME << " " << GRIDROGUE_VERSION << "\n";
        return 0;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    const std::string settingsPath = settingsFilePath(argc, argv);
    if (hasFlag(argc, argv, "--reset-settings") || !std::filesystem::exists(settingsPath)) {
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "Could not write settings file: " << settingsPath << "\n";
        }
    }
    const Settings settings = loadSettings(settingsPath);

    DiagSink diag(std::cerr, hasFlag(argc, argv, "--verbose") ? LogLevel::Debug : settings.logLevel);
    diag.debug("Starting " + std::string(GRIDROGUE_APPNAME) + " " + GRIDROGUE_VERSION);
    diag.debug("Settings: " + settingsPath);

    KeyBinds keyBinds = KeyBinds::defaults();
    keyBinds.loadOverridesFromIni(settingsPath);
    for (const auto& kv : keyBinds.describeAll()) {
        diag.debug("bind_" + kv.first + " = " + kv.second);
    }

    Renderer renderer(settings.windowWidth, settings.windowHeight, settings.tileSize, settings.vsync);
    if (!renderer.init()) {
        SDL_Quit();
        return 1;
    }
    if (settings.startFullscreen) {
        renderer.toggleFullscreen();
    }

    WorldConfig cfg = worldConfigFromSettings(settings);
    cfg.windowW = renderer.windowWidth();
    cfg.windowH = renderer.windowHeight();

    World world(cfg, &renderer, &diag);

    const std::optional<uint32_t> seedArg = parseSeedArg(argc, argv);
    const uint32_t seed = seedArg ? *seedArg : static_cast<uint32_t>(SDL_GetTicks() ^ 0x9e3779b9u);
    diag.info("Seed: " + std::to_string(seed));
    RNG rng(seed);
    world.generate(rng);

    const EntityId player = world.player();
    const float stepSec = 1.0f / static_cast<float>(settings.updateHz);
    const uint32_t repeatMs = static_cast<uint32_t>(settings.moveRepeatMs);

    // Held movement key (the input token is the key code).
    SDL_Keycode heldKey = SDLK_UNKNOWN;
    Direction heldDir = Direction::Left;
    uint32_t nextRepeatMs = 0;

    // Updates/s and ms/draw, sampled every half second.
    FrameStats frameStats(500);
    frameStats.start(SDL_GetTicks());

    bool running = true;
    bool paused = false;
    float accumulator = 0.0f;
    uint32_t lastTicks = SDL_GetTicks();

    while (running) {
        const uint32_t now = SDL_GetTicks();
        float dt = (now - lastTicks) / 1000.0f;
        if (dt > 0.25f) dt = 0.25f;
        lastTicks = now;

        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            switch (ev.type) {
                case SDL_QUIT:
                    running = false;
                    break;

                case SDL_WINDOWEVENT:
                    switch (ev.window.event) {
                        case SDL_WINDOWEVENT_SIZE_CHANGED:
                            // Event sizes are in window points; the view works in drawable pixels.
                            if (renderer.syncOutputSize()) {
                                world.resize(renderer.windowWidth(), renderer.windowHeight());
                            }
                            break;
                        case SDL_WINDOWEVENT_FOCUS_LOST:
                            diag.debug("Window deactivated; pausing updates");
                            paused = true;
                            break;
                        case SDL_WINDOWEVENT_FOCUS_GAINED:
                            paused = false;
                            accumulator = 0.0f;
                            break;
                        default:
                            break;
                    }
                    break;

                case SDL_KEYDOWN: {
                    if (ev.key.repeat != 0) break;
                    const SDL_Keycode key = ev.key.keysym.sym;
                    diag.debug("Key pressed " + std::to_string(key));

                    if (key == SDLK_ESCAPE) {
                        running = false;
                        break;
                    }
                    if (key == SDLK_F11) {
                        renderer.toggleFullscreen();
                        break;
                    }

                    if (auto dir = keyBinds.mapKey(key, ev.key.keysym.mod)) {
                        world.setPendingMove(player, *dir, static_cast<int>(key));
                        heldKey = key;
                        heldDir = *dir;
                        nextRepeatMs = now + repeatMs;
                    }
                    break;
                }

                case SDL_KEYUP: {
                    const SDL_Keycode key = ev.key.keysym.sym;
                    diag.debug("Key released " + std::to_string(key));
                    world.releaseMoveInput(player, static_cast<int>(key));
                    if (key == heldKey) heldKey = SDLK_UNKNOWN;
                    break;
                }

                default:
                    break;
            }
        }

        if (heldKey != SDLK_UNKNOWN && repeatMs > 0 && !paused && now >= nextRepeatMs) {
            world.setPendingMove(player, heldDir, static_cast<int>(heldKey));
            nextRepeatMs = now + repeatMs;
        }

        if (!paused) {
            accumulator += dt;
            while (accumulator >= stepSec) {
                world.update(stepSec);
                accumulator -= stepSec;
                frameStats.addUpdate();
            }
        }

        const uint32_t drawStart = SDL_GetTicks();
        renderer.render();
        frameStats.addDraw(static_cast<double>(SDL_GetTicks() - drawStart));

        if (const auto sample = frameStats.poll(SDL_GetTicks())) {
            if (settings.showFps) {
                std::ostringstream ss;
                ss << std::fixed << std::setprecision(2)
                   << sample->updatesPerSec << " updates/s  "
                   << sample->msPerDraw << " ms/draw";
                renderer.setTitleSuffix(ss.str());
            }
        }

        if (paused || !settings.vsync) {
            SDL_Delay(1);
        }
    }

    if (settings.rememberWindowSize) {
        // Saved in window points, the unit SDL_CreateWindow takes.
        int lastW = settings.windowWidth;
        int lastH = settings.windowHeight;
        renderer.windowPointSize(lastW, lastH);
        if (!updateIniKey(settingsPath, "window_width", std::to_string(lastW)) ||
            !updateIniKey(settingsPath, "window_height", std::to_string(lastH))) {
            diag.warn("Could not store window size in " + settingsPath);
        }
    }

    {
        std::ostringstream ss;
        ss << "Ran " << world.ticks() << " updates (" << std::fixed << std::setprecision(2)
           << world.elapsedSeconds() << "s simulated)";
        diag.info(ss.str());
    }

    renderer.shutdown();
    SDL_Quit();
    return 0;
}
