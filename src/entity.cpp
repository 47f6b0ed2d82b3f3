#include "entity.hpp"
#include "settings.hpp"

#include <cmath>

float Entity::distanceTo(Vec2i p) const {
    const int dx = p.x - pos.x;
    const int dy = p.y - pos.y;
    return std::sqrt(static_cast<float>(dx * dx + dy * dy));
}

float Entity::distanceTo(const Entity& other) const {
    return distanceTo(other.pos);
}

namespace {

Entity makeMonster(Vec2i pos, char glyph, const char* name, Color color, const FighterStats& stats) {
    Entity e;
    e.pos = pos;
    e.glyph = glyph;
    e.name = name;
    e.color = color;
    e.blocks = true;
    e.alive = true;
    e.fighter = Fighter{stats.hp, stats.hp, stats.defense, stats.power, DeathKind::Monster};
    e.ai = BasicAi{};
    return e;
}

} // namespace

Entity makePlayer(const GameConfig& cfg, Vec2i pos) {
    Entity e;
    e.pos = pos;
    e.glyph = '@';
    e.name = "player";
    e.color = colors::White;
    e.blocks = true;
    e.alive = true;
    e.fighter = Fighter{cfg.player.hp, cfg.player.hp, cfg.player.defense, cfg.player.power, DeathKind::Player};
    return e;
}

Entity makeOrc(const GameConfig& cfg, Vec2i pos) {
    return makeMonster(pos, 'o', "orc", colors::DesaturatedGreen, cfg.orc);
}

Entity makeTroll(const GameConfig& cfg, Vec2i pos) {
    return makeMonster(pos, 'T', "troll", colors::DarkerGreen, cfg.troll);
}

Entity makeHealingPotion(Vec2i pos) {
    Entity e;
    e.pos = pos;
    e.glyph = '!';
    e.name = itemKindName(ItemKind::Heal);
    e.color = colors::Violet;
    e.blocks = false;
    e.item = ItemKind::Heal;
    return e;
}

const char* itemKindName(ItemKind k) {
    switch (k) {
        case ItemKind::Heal: return "healing potion";
        default: return "thing";
    }
}
