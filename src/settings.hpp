#pragma once

#include <string>

struct FighterStats {
    int hp = 1;
    int defense = 0;
    int power = 0;
};

// Numeric constants consumed at session setup. The simulation core only ever
// sees this struct; it never reads files itself.
struct GameConfig {
    int mapWidth = 80;
    int mapHeight = 45;

    int maxRooms = 30;
    int roomMinSize = 6;
    int roomMaxSize = 10;

    int maxRoomMonsters = 3;
    int maxRoomItems = 2;

    int fovRadius = 10;
    int healAmount = 4;
    int inventoryCapacity = 26;

    // Probability that a spawned monster is the weaker variant (orc).
    float orcChance = 0.8f;

    FighterStats player{30, 2, 5};
    FighterStats orc{10, 0, 3};
    FighterStats troll{16, 1, 4};
};

// Simple user-editable settings file (INI-ish: key = value).
// Front-ends load it; the core receives only `game`.
struct Settings {
    GameConfig game;

    int tileSize = 16;
    int hudHeight = 96;
    bool startFullscreen = false;
    bool vsync = true;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
// Out-of-range values are clamped.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);

// Clamps a config into ranges the generator and scheduler can work with.
GameConfig sanitizeConfig(GameConfig cfg);
