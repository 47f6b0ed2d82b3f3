#pragma once
#include "common.hpp"
#include "tile_map.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Single-observer field of view over a TileMap.
//
// Transparency and walkability are captured once by setup(); recompute() then
// marks the tiles in view and latches their `explored` flag on the bound map.
// Monsters "see" the player exactly when the player's FOV contains them.
//
// The tracker holds a non-owning pointer to the map passed to setup(); the map
// must outlive it and must not be moved while bound.
class VisibilityTracker {
public:
    void setup(TileMap& map);

    void recompute(int ox, int oy, int radius);

    bool isVisible(int x, int y) const;
    bool isExplored(int x, int y) const;
    bool isTransparent(int x, int y) const;
    bool isWalkable(int x, int y) const;

private:
    size_t index(int x, int y) const;
    void markVisible(int x, int y);
    void castLight(int ox, int oy, int radius, int row, float start, float end, int xx, int xy, int yx, int yy);

    TileMap* map_ = nullptr;
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> transparent_;
    std::vector<uint8_t> walkable_;
    std::vector<uint8_t> visible_;
};
