#pragma once

#include "sdl.hpp"

#include "game.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Front-end input actions. Translated into PlayerIntents by intentFor().
enum class Action : uint8_t {
    None = 0,

    Up,
    Down,
    Left,
    Right,
    UpLeft,
    UpRight,
    DownLeft,
    DownRight,
    Wait,

    Pickup,
    Inventory,
    Cancel,

    ToggleFullscreen,
    Quit,
};

// Configurable keybindings loaded from the settings file.
//
// The binding format is:
//   bind_<action> = key[, key, ...]
//
// Each key can be a single character (g, .), a named key (up, kp_8, enter)
// or any name SDL_GetKeyFromName() understands. Modifiers can be prefixed
// with shift+, ctrl+, alt+. Extra modifiers do NOT match.
struct KeyChord {
    SDL_Keycode key = SDLK_UNKNOWN;
    Uint16 mods = KMOD_NONE;
};

struct ActionHash {
    size_t operator()(Action a) const noexcept { return static_cast<size_t>(a); }
};

class KeyBinds {
public:
    static KeyBinds defaults();
    // Returns false if the settings file could not be read (defaults stay).
    bool loadOverridesFromIni(const std::string& settingsPath);

    Action mapKey(SDL_Keycode key, Uint16 mods) const;

private:
    std::unordered_map<Action, std::vector<KeyChord>, ActionHash> binds;

    static Uint16 normalizeMods(Uint16 mods);

    static std::optional<Action> parseActionName(const std::string& bindKey);
    static std::optional<KeyChord> parseChord(const std::string& token);
    static std::vector<KeyChord> parseChordList(const std::string& value);
    static SDL_Keycode parseKeycode(const std::string& keyName);
};

// Intent for a map-mode action. Inventory selection and platform actions
// (fullscreen, quit confirmation) are resolved by the caller.
std::optional<PlayerIntent> intentFor(Action a);
