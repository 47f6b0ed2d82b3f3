#include "dungeon_gen.hpp"

#include <algorithm>
#include <utility>

namespace {

Vec2i randomInterior(const Room& r, RNG& rng) {
    return {rng.range(r.x1 + 1, r.x2 - 1), rng.range(r.y1 + 1, r.y2 - 1)};
}

void placeObjects(const GameConfig& cfg, const Room& room, const TileMap& map, RNG& rng, EntityRegistry& ents) {
    const int numMonsters = rng.range(0, cfg.maxRoomMonsters);
    for (int i = 0; i < numMonsters; ++i) {
        const Vec2i p = randomInterior(room, rng);
        if (ents.isBlocked(map, p.x, p.y)) continue;

        if (rng.chance(cfg.orcChance)) {
            ents.add(makeOrc(cfg, p));
        } else {
            ents.add(makeTroll(cfg, p));
        }
    }

    const int numItems = rng.range(0, cfg.maxRoomItems);
    for (int i = 0; i < numItems; ++i) {
        const Vec2i p = randomInterior(room, rng);
        if (ents.isBlocked(map, p.x, p.y)) continue;
        ents.add(makeHealingPotion(p));
    }
}

} // namespace

void carveRoom(TileMap& map, const Room& room) {
    for (int y = room.y1 + 1; y < room.y2; ++y) {
        for (int x = room.x1 + 1; x < room.x2; ++x) {
            map.carve(x, y);
        }
    }
}

void carveHTunnel(TileMap& map, int x1, int x2, int y) {
    if (x2 < x1) std::swap(x1, x2);
    for (int x = x1; x <= x2; ++x) map.carve(x, y);
}

void carveVTunnel(TileMap& map, int y1, int y2, int x) {
    if (y2 < y1) std::swap(y1, y2);
    for (int y = y1; y <= y2; ++y) map.carve(x, y);
}

LevelLayout generateDungeon(const GameConfig& cfg, RNG& rng, EntityRegistry& ents) {
    LevelLayout out{TileMap(cfg.mapWidth, cfg.mapHeight), {}, std::nullopt};
    TileMap& map = out.map;

    for (int attempt = 0; attempt < cfg.maxRooms; ++attempt) {
        const int w = rng.range(cfg.roomMinSize, cfg.roomMaxSize);
        const int h = rng.range(cfg.roomMinSize, cfg.roomMaxSize);

        // A room that cannot fit, or has no interior inside its wall ring, is
        // just another rejected attempt.
        if (w < kMinRoomSize || h < kMinRoomSize) continue;
        if (w >= map.width() || h >= map.height()) continue;

        const int x = rng.range(0, map.width() - w - 1);
        const int y = rng.range(0, map.height() - h - 1);
        const Room room = Room::fromSize(x, y, w, h);

        const bool overlaps = std::any_of(out.rooms.begin(), out.rooms.end(),
                                          [&](const Room& other) { return room.intersects(other); });
        if (overlaps) continue;

        carveRoom(map, room);

        const Vec2i c = room.center();
        if (out.rooms.empty()) {
            // The first room hosts the player; claim the spawn before populating
            // so nothing else lands on it.
            out.playerSpawn = c;
            ents.player().pos = c;
        }

        placeObjects(cfg, room, map, rng, ents);

        if (!out.rooms.empty()) {
            const Vec2i prev = out.rooms.back().center();
            if (rng.coinFlip()) {
                carveHTunnel(map, prev.x, c.x, prev.y);
                carveVTunnel(map, prev.y, c.y, c.x);
            } else {
                carveVTunnel(map, prev.y, c.y, prev.x);
                carveHTunnel(map, prev.x, c.x, c.y);
            }
        }

        out.rooms.push_back(room);
    }

    return out;
}
