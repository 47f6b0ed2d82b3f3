#include "settings.hpp"

#include "ini.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

bool parseBool(const std::string& v, bool& out) {
    const std::string s = lowerCopy(trimCopy(v));
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
    const std::string s = trimCopy(v);
    size_t used = 0;
    try {
        out = std::stoi(s, &used);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return used == s.size();
}

bool parseStatKey(const std::string& key, const std::string& prefix, FighterStats& stats, int v) {
    if (key == prefix + "_hp") { stats.hp = v; return true; }
    if (key == prefix + "_defense") { stats.defense = v; return true; }
    if (key == prefix + "_power") { stats.power = v; return true; }
    return false;
}

void sanitizeStats(FighterStats& s) {
    s.hp = std::clamp(s.hp, 1, 999);
    s.defense = std::clamp(s.defense, 0, 99);
    s.power = std::clamp(s.power, 0, 99);
}

} // namespace

GameConfig sanitizeConfig(GameConfig cfg) {
    cfg.mapWidth = std::clamp(cfg.mapWidth, 20, 250);
    cfg.mapHeight = std::clamp(cfg.mapHeight, 20, 250);
    cfg.maxRooms = std::clamp(cfg.maxRooms, 0, 500);
    // A room needs at least one interior cell inside its wall ring.
    cfg.roomMinSize = std::clamp(cfg.roomMinSize, 3, std::min(cfg.mapWidth, cfg.mapHeight) - 1);
    cfg.roomMaxSize = std::clamp(cfg.roomMaxSize, cfg.roomMinSize, std::min(cfg.mapWidth, cfg.mapHeight) - 1);
    cfg.maxRoomMonsters = std::clamp(cfg.maxRoomMonsters, 0, 50);
    cfg.maxRoomItems = std::clamp(cfg.maxRoomItems, 0, 50);
    cfg.fovRadius = std::clamp(cfg.fovRadius, 1, 100);
    cfg.healAmount = std::clamp(cfg.healAmount, 1, 999);
    cfg.inventoryCapacity = std::clamp(cfg.inventoryCapacity, 1, 26);
    cfg.orcChance = std::clamp(cfg.orcChance, 0.0f, 1.0f);
    sanitizeStats(cfg.player);
    sanitizeStats(cfg.orc);
    sanitizeStats(cfg.troll);
    return cfg;
}

namespace {

void applySetting(Settings& s, const std::string& key, const std::string& val) {
    if (key == "start_fullscreen" || key == "vsync") {
        bool b = false;
        if (!parseBool(val, b)) return;
        (key == "vsync" ? s.vsync : s.startFullscreen) = b;
        return;
    }

    int v = 0;
    if (!parseInt(val, v)) return;

    GameConfig& g = s.game;
    if (key == "tile_size") {
        s.tileSize = std::clamp(v, 4, 64);
    } else if (key == "hud_height") {
        s.hudHeight = std::clamp(v, 32, 240);
    } else if (key == "map_width") {
        g.mapWidth = v;
    } else if (key == "map_height") {
        g.mapHeight = v;
    } else if (key == "max_rooms") {
        g.maxRooms = v;
    } else if (key == "room_min_size") {
        g.roomMinSize = v;
    } else if (key == "room_max_size") {
        g.roomMaxSize = v;
    } else if (key == "max_room_monsters") {
        g.maxRoomMonsters = v;
    } else if (key == "max_room_items") {
        g.maxRoomItems = v;
    } else if (key == "fov_radius" || key == "torch_radius") {
        g.fovRadius = v;
    } else if (key == "heal_amount") {
        g.healAmount = v;
    } else if (key == "orc_chance_pct") {
        g.orcChance = static_cast<float>(std::clamp(v, 0, 100)) / 100.0f;
    } else if (!parseStatKey(key, "player", g.player, v) && !parseStatKey(key, "orc", g.orc, v)) {
        parseStatKey(key, "troll", g.troll, v);
    }
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;
    // Unknown keys (bind_*) belong to the front-end.
    const bool found = forEachIniEntry(path, [&](const std::string& key, const std::string& val) {
        applySetting(s, key, val);
    });
    if (!found) return s;

    s.game = sanitizeConfig(s.game);
    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# Dragonslayer settings
#
# Lines are: key = value
# Comments start with # or ;
#
# Edit this file and restart the game.

# Rendering / UI
tile_size = 16
hud_height = 96
start_fullscreen = false
vsync = true

# Map generation
map_width = 80
map_height = 45
max_rooms = 30
room_min_size = 6
room_max_size = 10
max_room_monsters = 3
max_room_items = 2
# Percentage of spawned monsters that are orcs (the rest are trolls).
orc_chance_pct = 80

# Field of view
fov_radius = 10

# Stats
heal_amount = 4
player_hp = 30
player_defense = 2
player_power = 5
orc_hp = 10
orc_defense = 0
orc_power = 3
troll_hp = 16
troll_defense = 1
troll_power = 4

# -----------------------------------------------------------------------------
# Keybindings
#
# Rebind keys by adding entries of the form:
#   bind_<action> = key[, key, ...]
#
# Keys: a single character, a named key (up, left, kp_8, enter, escape),
# or any SDL key name. Modifiers: shift+, ctrl+, alt+.
# -----------------------------------------------------------------------------
bind_up = up, k, kp_8
bind_down = down, j, kp_2
bind_left = left, h, kp_4
bind_right = right, l, kp_6
bind_up_left = y, kp_7
bind_up_right = u, kp_9
bind_down_left = b, kp_1
bind_down_right = n, kp_3
bind_pickup = g
bind_inventory = i
)INI";

    return static_cast<bool>(f);
}
