#include "tile_map.hpp"

#include <stdexcept>
#include <string>

TileMap::TileMap(int w, int h) : width_(w), height_(h) {
    if (w <= 0 || h <= 0) {
        throw std::invalid_argument("TileMap dimensions must be positive");
    }
    tiles_.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_), Tile::wall());
}

size_t TileMap::index(int x, int y) const {
    if (!inBounds(x, y)) {
        throw std::out_of_range("tile (" + std::to_string(x) + "," + std::to_string(y) + ") outside " +
                                std::to_string(width_) + "x" + std::to_string(height_) + " map");
    }
    return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
}

Tile& TileMap::at(int x, int y) {
    return tiles_[index(x, y)];
}

const Tile& TileMap::at(int x, int y) const {
    return tiles_[index(x, y)];
}

void TileMap::carve(int x, int y) {
    Tile& t = at(x, y);
    // The explored latch survives carving.
    const bool explored = t.explored;
    t = Tile::floor();
    t.explored = explored;
}

size_t TileMap::countOpen() const {
    size_t n = 0;
    for (const Tile& t : tiles_) {
        if (!t.blocked) ++n;
    }
    return n;
}
