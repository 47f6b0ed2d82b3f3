#include "keybinds.hpp"

#include "ini.hpp"

#include <cctype>

Uint16 KeyBinds::normalizeMods(Uint16 mods) {
    // Left/right variants collapse to one bit group so "shift+x" matches either shift key.
    Uint16 out = KMOD_NONE;
    if (mods & KMOD_SHIFT) out |= KMOD_SHIFT;
    if (mods & KMOD_CTRL) out |= KMOD_CTRL;
    if (mods & KMOD_ALT) out |= KMOD_ALT;
    return out;
}

SDL_Keycode KeyBinds::parseKeycode(const std::string& keyNameIn) {
    const std::string keyName = trimCopy(lowerCopy(keyNameIn));
    if (keyName.empty()) return SDLK_UNKNOWN;

    // Single character (letters are treated case-insensitively).
    if (keyName.size() == 1) {
        return static_cast<SDL_Keycode>(static_cast<unsigned char>(keyName[0]));
    }

    if (keyName == "up") return SDLK_UP;
    if (keyName == "down") return SDLK_DOWN;
    if (keyName == "left") return SDLK_LEFT;
    if (keyName == "right") return SDLK_RIGHT;

    if (keyName == "enter" || keyName == "return") return SDLK_RETURN;
    if (keyName == "escape" || keyName == "esc") return SDLK_ESCAPE;
    if (keyName == "space") return SDLK_SPACE;
    if (keyName == "period" || keyName == "dot") return SDLK_PERIOD;
    if (keyName == "comma") return SDLK_COMMA;

    if (keyName.size() == 4 && keyName.rfind("kp_", 0) == 0 && std::isdigit(static_cast<unsigned char>(keyName[3]))) {
        const int n = keyName[3] - '0';
        // SDLK_KP_0 comes after SDLK_KP_9 in SDL's keycode table.
        return n == 0 ? SDLK_KP_0 : static_cast<SDL_Keycode>(SDLK_KP_1 + (n - 1));
    }
    if (keyName == "kp_enter") return SDLK_KP_ENTER;

    // Fallback: SDL's own key name parsing ("Keypad 8", "Left Shift", ...).
    return SDL_GetKeyFromName(trimCopy(keyNameIn).c_str());
}

std::optional<KeyChord> KeyBinds::parseChord(const std::string& tokenIn) {
    const std::string token = trimCopy(tokenIn);
    if (token.empty()) return std::nullopt;

    const std::vector<std::string> parts = splitOn(token, '+');
    if (parts.empty()) return std::nullopt;

    Uint16 mods = KMOD_NONE;

    // All parts except the last are modifiers.
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        const std::string m = trimCopy(lowerCopy(parts[i]));
        if (m == "shift") mods |= KMOD_SHIFT;
        else if (m == "ctrl" || m == "control") mods |= KMOD_CTRL;
        else if (m == "alt") mods |= KMOD_ALT;
        else return std::nullopt;
    }

    const SDL_Keycode key = parseKeycode(parts.back());
    if (key == SDLK_UNKNOWN) return std::nullopt;

    return KeyChord{key, normalizeMods(mods)};
}

std::vector<KeyChord> KeyBinds::parseChordList(const std::string& valueIn) {
    const std::string value = trimCopy(valueIn);
    if (value.empty() || lowerCopy(value) == "none") return {};

    std::vector<KeyChord> out;
    for (const auto& part : splitOn(value, ',')) {
        if (auto chord = parseChord(part)) out.push_back(*chord);
    }
    return out;
}

std::optional<Action> KeyBinds::parseActionName(const std::string& bindKeyIn) {
    const std::string key = trimCopy(lowerCopy(bindKeyIn));
    if (key.rfind("bind_", 0) != 0) return std::nullopt;
    const std::string name = key.substr(5);

    if (name == "up") return Action::Up;
    if (name == "down") return Action::Down;
    if (name == "left") return Action::Left;
    if (name == "right") return Action::Right;
    if (name == "up_left") return Action::UpLeft;
    if (name == "up_right") return Action::UpRight;
    if (name == "down_left") return Action::DownLeft;
    if (name == "down_right") return Action::DownRight;
    if (name == "wait") return Action::Wait;
    if (name == "pickup") return Action::Pickup;
    if (name == "inventory") return Action::Inventory;
    if (name == "cancel") return Action::Cancel;
    if (name == "toggle_fullscreen") return Action::ToggleFullscreen;
    if (name == "quit") return Action::Quit;
    return std::nullopt;
}

KeyBinds KeyBinds::defaults() {
    KeyBinds kb;
    auto add = [&](Action a, SDL_Keycode key, Uint16 mods = KMOD_NONE) {
        kb.binds[a].push_back({key, normalizeMods(mods)});
    };

    add(Action::Up, SDLK_UP);
    add(Action::Up, SDLK_k);
    add(Action::Up, SDLK_KP_8);

    add(Action::Down, SDLK_DOWN);
    add(Action::Down, SDLK_j);
    add(Action::Down, SDLK_KP_2);

    add(Action::Left, SDLK_LEFT);
    add(Action::Left, SDLK_h);
    add(Action::Left, SDLK_KP_4);

    add(Action::Right, SDLK_RIGHT);
    add(Action::Right, SDLK_l);
    add(Action::Right, SDLK_KP_6);

    add(Action::UpLeft, SDLK_y);
    add(Action::UpLeft, SDLK_KP_7);
    add(Action::UpRight, SDLK_u);
    add(Action::UpRight, SDLK_KP_9);
    add(Action::DownLeft, SDLK_b);
    add(Action::DownLeft, SDLK_KP_1);
    add(Action::DownRight, SDLK_n);
    add(Action::DownRight, SDLK_KP_3);

    add(Action::Wait, SDLK_PERIOD);
    add(Action::Wait, SDLK_KP_5);

    add(Action::Pickup, SDLK_g);
    add(Action::Inventory, SDLK_i);
    add(Action::Cancel, SDLK_ESCAPE);

    add(Action::ToggleFullscreen, SDLK_RETURN, KMOD_ALT);
    add(Action::Quit, SDLK_q, KMOD_CTRL);

    return kb;
}

bool KeyBinds::loadOverridesFromIni(const std::string& settingsPath) {
    return forEachIniEntry(settingsPath, [&](const std::string& key, const std::string& val) {
        if (auto act = parseActionName(key)) binds[*act] = parseChordList(val);
    });
}

Action KeyBinds::mapKey(SDL_Keycode key, Uint16 mods) const {
    const Uint16 nm = normalizeMods(mods);
    for (const auto& [action, chords] : binds) {
        for (const auto& chord : chords) {
            if (chord.key == key && chord.mods == nm) return action;
        }
    }
    return Action::None;
}

std::optional<PlayerIntent> intentFor(Action a) {
    switch (a) {
        case Action::Up: return PlayerIntent::move(0, -1);
        case Action::Down: return PlayerIntent::move(0, 1);
        case Action::Left: return PlayerIntent::move(-1, 0);
        case Action::Right: return PlayerIntent::move(1, 0);
        case Action::UpLeft: return PlayerIntent::move(-1, -1);
        case Action::UpRight: return PlayerIntent::move(1, -1);
        case Action::DownLeft: return PlayerIntent::move(-1, 1);
        case Action::DownRight: return PlayerIntent::move(1, 1);
        case Action::Wait: return PlayerIntent::wait();
        case Action::Pickup: return PlayerIntent::pickUp();
        case Action::Inventory: return PlayerIntent::openInventory();
        case Action::ToggleFullscreen: return PlayerIntent::toggleDisplay();
        case Action::Cancel:
        case Action::Quit: return PlayerIntent::quit();
        default: return std::nullopt;
    }
}
