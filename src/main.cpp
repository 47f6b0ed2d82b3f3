#include "sdl.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "game.hpp"
#include "keybinds.hpp"
#include "render.hpp"
#include "settings.hpp"
#include "version.hpp"

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
        << DRAGONSLAYER_APPNAME << " " << DRAGONSLAYER_VERSION << "\n"
        << "Usage: " << (exe ? exe : "dragonslayer") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Start with a specific level seed\n"
        << "  --settings <path>    Use this settings file instead of the per-user one\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

static std::string statusLine(const Game& game, const std::string& lastMsg) {
    std::string s;
    const Entity& p = game.player();
    if (p.fighter) {
        s = "HP: " + std::to_string(p.fighter->hp) + "/" + std::to_string(p.fighter->maxHp);
    }
    if (!lastMsg.empty()) s += "  " + lastMsg;
    return s;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "dragonslayer");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << DRAGONSLAYER_APPNAME << " " << DRAGONSLAYER_VERSION << "\n";
        return 0;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    std::filesystem::path settingsPathFs;
    if (const auto arg = parseStringArg(argc, argv, "--settings")) {
        settingsPathFs = *arg;
    } else if (char* p = SDL_GetPrefPath("dragonslayer", DRAGONSLAYER_APPNAME)) {
        settingsPathFs = std::filesystem::path(p) / "dragonslayer_settings.ini";
        SDL_free(p);
    } else {
        settingsPathFs = std::filesystem::current_path() / "dragonslayer_settings.ini";
    }
    const std::string settingsPath = settingsPathFs.string();

    {
        std::error_code ec;
        if (hasFlag(argc, argv, "--reset-settings") || !std::filesystem::exists(settingsPathFs, ec)) {
            if (!writeDefaultSettings(settingsPath)) {
                std::cerr << "Could not write settings file: " << settingsPath << "\n";
            }
        }
    }

    const Settings settings = loadSettings(settingsPath);

    KeyBinds keyBinds = KeyBinds::defaults();
    if (!keyBinds.loadOverridesFromIni(settingsPath)) {
        std::cerr << "Using default keybindings; could not read " << settingsPath << "\n";
    }

    Game game(settings.game);
    const uint32_t seed = parseSeedArg(argc, argv).value_or(static_cast<uint32_t>(SDL_GetTicks()) ^ 0x9e3779b9u);
    game.newGame(seed);
    std::cout << "Seed: " << game.seed() << "\n";

    Renderer renderer(settings.game.mapWidth, settings.game.mapHeight, settings.tileSize, settings.hudHeight, settings.vsync);
    if (!renderer.init()) {
        SDL_Quit();
        return 1;
    }
    if (settings.startFullscreen) renderer.toggleFullscreen();

    std::string lastMsg = "WELCOME, STRANGER! PREPARE TO PERISH.";
    std::vector<std::string> history{lastMsg};
    constexpr size_t kHistoryLen = 32;
    bool inventoryOpen = false;
    bool running = true;

    auto present = [&](const TickResult& r) {
        for (const auto& ev : r.events) {
            if (ev.text.empty()) continue;
            std::cout << ev.text << "\n";
            lastMsg = ev.text;
            history.push_back(ev.text);
        }
        if (history.size() > kHistoryLen) {
            history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(kHistoryLen));
        }
        if (r.action == PlayerAction::Exit) running = false;
    };

    renderer.setStatusLine(statusLine(game, lastMsg));
    renderer.render(game, inventoryOpen, history);

    // Turn-based: block until the next event instead of spinning.
    SDL_Event ev;
    while (running && SDL_WaitEvent(&ev)) {
        switch (ev.type) {
            case SDL_QUIT:
                running = false;
                break;

            case SDL_KEYDOWN: {
                const SDL_Keycode key = ev.key.keysym.sym;
                const Uint16 mod = ev.key.keysym.mod;

                if (inventoryOpen) {
                    // Any key closes the inventory; a letter naming a slot also uses it.
                    inventoryOpen = false;
                    if (key >= SDLK_a && key <= SDLK_z) {
                        const auto slot = menuSelection(game.inventoryMenu(), static_cast<char>(key));
                        if (slot) present(game.handleIntent(PlayerIntent::useItem(*slot)));
                    }
                    break;
                }

                const Action a = keyBinds.mapKey(key, mod);
                if (a == Action::None) break;

                if (a == Action::ToggleFullscreen) {
                    renderer.toggleFullscreen();
                } else if (a == Action::Inventory) {
                    inventoryOpen = true;
                    const Menu menu = game.inventoryMenu();
                    std::cout << menu.header << "\n";
                    for (const auto& e : menu.entries) {
                        std::cout << "  (" << e.key << ") " << e.label << "\n";
                    }
                }

                if (auto intent = intentFor(a)) present(game.handleIntent(*intent));
                break;
            }

            default:
                break;
        }

        renderer.setStatusLine(statusLine(game, lastMsg));
        renderer.render(game, inventoryOpen, history);
    }

    renderer.shutdown();
    SDL_Quit();
    return 0;
}
