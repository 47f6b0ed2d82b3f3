#include "ai.hpp"

#include "combat.hpp"

#include <cmath>

bool moveBy(size_t idx, int dx, int dy, const TileMap& map, EntityRegistry& ents) {
    Entity& e = ents.at(idx);
    const int nx = e.pos.x + dx;
    const int ny = e.pos.y + dy;
    if (!map.inBounds(nx, ny)) return false;
    if (ents.isBlocked(map, nx, ny)) return false;
    e.pos = {nx, ny};
    return true;
}

bool moveTowards(size_t idx, Vec2i target, const TileMap& map, EntityRegistry& ents) {
    const Entity& e = ents.at(idx);
    const int dx = target.x - e.pos.x;
    const int dy = target.y - e.pos.y;
    if (dx == 0 && dy == 0) return false;

    const float distance = std::sqrt(static_cast<float>(dx * dx + dy * dy));
    const int stepX = static_cast<int>(std::round(static_cast<float>(dx) / distance));
    const int stepY = static_cast<int>(std::round(static_cast<float>(dy) / distance));
    return moveBy(idx, stepX, stepY, map, ents);
}

void aiTakeTurn(size_t idx, const TileMap& map, EntityRegistry& ents, const VisibilityTracker& fov, EventLog& log) {
    const Entity& monster = ents.at(idx);
    if (!monster.ai) return;

    // If you can see it, it can see you.
    if (!fov.isVisible(monster.pos.x, monster.pos.y)) return;

    const Entity& player = ents.player();
    if (monster.distanceTo(player) >= kMeleeRange) {
        moveTowards(idx, player.pos, map, ents);
    } else if (player.fighter && player.fighter->hp > 0) {
        attack(ents, idx, EntityRegistry::playerIndex(), log);
    }
}
