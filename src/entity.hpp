#pragma once
#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>

struct GameConfig;

// Closed set of death behaviours. Matched with a switch in combat.cpp.
enum class DeathKind : uint8_t {
    Player = 0,
    Monster,
};

struct Fighter {
    int maxHp = 1;
    int hp = 1;
    int defense = 0;
    int power = 0;
    DeathKind onDeath = DeathKind::Monster;
};

// Marker capability: the entity is driven by aiTakeTurn() on every turn the
// player spends.
struct BasicAi {};

enum class ItemKind : uint8_t {
    Heal = 0,
};

// An actor or object on the map. Fighter, AI and Item are independent optional
// capabilities; death removes capabilities rather than changing the type.
struct Entity {
    Vec2i pos{0, 0};

    // Display identity. Owned by the presentation layer but carried here so a
    // death transition can rewrite it.
    char glyph = '?';
    std::string name;
    Color color{};

    bool blocks = false;
    bool alive = false;

    std::optional<Fighter> fighter;
    std::optional<BasicAi> ai;
    std::optional<ItemKind> item;

    float distanceTo(const Entity& other) const;
    float distanceTo(Vec2i p) const;
};

Entity makePlayer(const GameConfig& cfg, Vec2i pos = {0, 0});
Entity makeOrc(const GameConfig& cfg, Vec2i pos);
Entity makeTroll(const GameConfig& cfg, Vec2i pos);
Entity makeHealingPotion(Vec2i pos);

const char* itemKindName(ItemKind k);
