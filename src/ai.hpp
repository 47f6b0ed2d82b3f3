#pragma once
#include "entity_registry.hpp"
#include "events.hpp"
#include "fov.hpp"
#include "tile_map.hpp"

#include <cstddef>

// Melee reach: anything closer than this (Euclidean) is attacked instead of approached.
constexpr float kMeleeRange = 2.0f;

// Moves the entity by (dx, dy) unless the destination is off the map, a wall,
// or holds a blocking entity. Returns true if the entity moved.
bool moveBy(size_t idx, int dx, int dy, const TileMap& map, EntityRegistry& ents);

// One grid step along the normalized, per-axis rounded direction to target.
bool moveTowards(size_t idx, Vec2i target, const TileMap& map, EntityRegistry& ents);

// A basic monster's turn. Recomputed from scratch every call:
//   - outside the player's FOV: sleep,
//   - farther than melee range: step toward the player,
//   - otherwise: attack the player while it still has hp.
void aiTakeTurn(size_t idx, const TileMap& map, EntityRegistry& ents, const VisibilityTracker& fov, EventLog& log);
