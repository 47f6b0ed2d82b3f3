#pragma once
#include "common.hpp"
#include "entity_registry.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "tile_map.hpp"

#include <optional>
#include <vector>

// Smallest room side that leaves a carved interior inside the wall ring.
constexpr int kMinRoomSize = 3;

// Axis-aligned room rectangle. The outer ring (x1, y1, x2, y2 lines) stays
// wall; only the strict interior is carved.
struct Room {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    static Room fromSize(int x, int y, int w, int h) { return Room{x, y, x + w, y + h}; }

    Vec2i center() const { return {(x1 + x2) / 2, (y1 + y2) / 2}; }

    // Inclusive on both axes: rooms that merely touch count as intersecting.
    bool intersects(const Room& o) const {
        return x1 <= o.x2 && x2 >= o.x1 && y1 <= o.y2 && y2 >= o.y1;
    }

    // True for carved interior cells.
    bool contains(int x, int y) const {
        return x > x1 && x < x2 && y > y1 && y < y2;
    }
};

struct LevelLayout {
    TileMap map;
    // Accepted rooms in acceptance order; room i is joined to room i-1.
    std::vector<Room> rooms;
    // Center of the first accepted room. Empty when no room was accepted
    // (callers must request at least one room).
    std::optional<Vec2i> playerSpawn;
};

// Builds a rooms-and-corridors level. Monsters and items are appended to
// `ents`; the player (already in the registry) is moved to the spawn point.
//
// Placement attempts that hit a blocked cell are dropped, not retried, so the
// entity count for a given seed is stable.
LevelLayout generateDungeon(const GameConfig& cfg, RNG& rng, EntityRegistry& ents);

void carveRoom(TileMap& map, const Room& room);
void carveHTunnel(TileMap& map, int x1, int x2, int y);
void carveVTunnel(TileMap& map, int y1, int y2, int x);
