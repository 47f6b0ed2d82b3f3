#include "fov.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

void VisibilityTracker::setup(TileMap& map) {
    map_ = &map;
    width_ = map.width();
    height_ = map.height();

    const size_t n = static_cast<size_t>(width_) * static_cast<size_t>(height_);
    transparent_.assign(n, 0);
    walkable_.assign(n, 0);
    visible_.assign(n, 0);

    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            const Tile& t = map.at(x, y);
            transparent_[index(x, y)] = t.blocksSight ? 0 : 1;
            walkable_[index(x, y)] = t.blocked ? 0 : 1;
        }
    }
}

size_t VisibilityTracker::index(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        throw std::out_of_range("FOV query (" + std::to_string(x) + "," + std::to_string(y) + ") out of bounds");
    }
    return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
}

bool VisibilityTracker::isVisible(int x, int y) const {
    return visible_[index(x, y)] != 0;
}

bool VisibilityTracker::isExplored(int x, int y) const {
    if (!map_) throw std::logic_error("VisibilityTracker used before setup()");
    return map_->isExplored(x, y);
}

bool VisibilityTracker::isTransparent(int x, int y) const {
    return transparent_[index(x, y)] != 0;
}

bool VisibilityTracker::isWalkable(int x, int y) const {
    return walkable_[index(x, y)] != 0;
}

void VisibilityTracker::markVisible(int x, int y) {
    visible_[index(x, y)] = 1;
    map_->markExplored(x, y);
}

// Recursive shadowcasting for one octant.
// Reference: RogueBasin "Recursive Shadowcasting".
void VisibilityTracker::castLight(int ox, int oy, int radius, int row, float start, float end,
                                  int xx, int xy, int yx, int yy) {
    if (start < end) return;
    const int r2 = radius * radius;
    float newStart = start;
    for (int dist = row; dist <= radius; ++dist) {
        bool blocked = false;

        for (int dx = -dist, dy = -dist; dx <= 0; ++dx) {
            const float lSlope = (dx - 0.5f) / (dy + 0.5f);
            const float rSlope = (dx + 0.5f) / (dy - 0.5f);
            if (start < rSlope) continue;
            if (end > lSlope) break;

            const int ax = ox + dx * xx + dy * xy;
            const int ay = oy + dx * yx + dy * yy;

            if (ax < 0 || ay < 0 || ax >= width_ || ay >= height_) continue;
            const int d2 = (ax - ox) * (ax - ox) + (ay - oy) * (ay - oy);
            // Walls are lit too, so room outlines show up as soon as the room is seen.
            if (d2 <= r2) {
                markVisible(ax, ay);
            }

            const bool opaque = !isTransparent(ax, ay);
            if (blocked) {
                if (opaque) {
                    newStart = rSlope;
                    continue;
                }
                blocked = false;
                start = newStart;
            } else if (opaque && dist < radius) {
                blocked = true;
                castLight(ox, oy, radius, dist + 1, start, lSlope, xx, xy, yx, yy);
                newStart = rSlope;
            }
        }

        if (blocked) break;
    }
}

void VisibilityTracker::recompute(int ox, int oy, int radius) {
    if (!map_) throw std::logic_error("VisibilityTracker used before setup()");

    // Reset visibility each recompute; explored stays latched on the map.
    std::fill(visible_.begin(), visible_.end(), static_cast<uint8_t>(0));

    // The observer must stand on the map.
    markVisible(ox, oy);
    if (radius <= 0) return;

    // Octant transforms
    castLight(ox, oy, radius, 1, 1.0f, 0.0f, 1, 0, 0, 1);
    castLight(ox, oy, radius, 1, 1.0f, 0.0f, 0, 1, 1, 0);
    castLight(ox, oy, radius, 1, 1.0f, 0.0f, 0, -1, 1, 0);
    castLight(ox, oy, radius, 1, 1.0f, 0.0f, -1, 0, 0, 1);
    castLight(ox, oy, radius, 1, 1.0f, 0.0f, -1, 0, 0, -1);
    castLight(ox, oy, radius, 1, 1.0f, 0.0f, 0, -1, -1, 0);
    castLight(ox, oy, radius, 1, 1.0f, 0.0f, 0, 1, -1, 0);
    castLight(ox, oy, radius, 1, 1.0f, 0.0f, 1, 0, 0, -1);
}
