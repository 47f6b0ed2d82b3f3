#pragma once
#include "common.hpp"

#include <cstddef>
#include <vector>

struct Tile {
    bool blocked = true;
    bool blocksSight = true;
    // One-way latch: set once the tile has been in the player's FOV.
    bool explored = false;

    static Tile wall() { return Tile{}; }
    static Tile floor() { return Tile{false, false, false}; }
};

// Fixed-size grid of tiles. Coordinates outside [0,width) x [0,height) are a
// programming error: at() throws std::out_of_range instead of clamping.
class TileMap {
public:
    TileMap() = default;
    TileMap(int w, int h);

    int width() const { return width_; }
    int height() const { return height_; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
    bool inBounds(Vec2i p) const { return inBounds(p.x, p.y); }

    Tile& at(int x, int y);
    const Tile& at(int x, int y) const;

    bool isBlocked(int x, int y) const { return at(x, y).blocked; }
    bool blocksSight(int x, int y) const { return at(x, y).blocksSight; }
    bool isExplored(int x, int y) const { return at(x, y).explored; }

    void carve(int x, int y);
    void markExplored(int x, int y) { at(x, y).explored = true; }

    size_t countOpen() const;

private:
    size_t index(int x, int y) const;

    int width_ = 0;
    int height_ = 0;
    std::vector<Tile> tiles_;
};
