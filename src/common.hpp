#pragma once
#include <cstdint>
#include <string>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(Vec2i a, Vec2i b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Vec2i a, Vec2i b) { return !(a == b); }

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

// Named colors used by entity identities and the map palette.
namespace colors {
constexpr Color White{255, 255, 255, 255};
constexpr Color DarkRed{127, 0, 0, 255};
constexpr Color DesaturatedGreen{63, 127, 63, 255};
constexpr Color DarkerGreen{0, 127, 0, 255};
constexpr Color Violet{127, 0, 255, 255};

constexpr Color DarkWall{0, 0, 100, 255};
constexpr Color LightWall{130, 110, 50, 255};
constexpr Color DarkGround{50, 50, 150, 255};
constexpr Color LightGround{200, 180, 50, 255};
} // namespace colors

inline int sign(int v) {
    return (v > 0) - (v < 0);
}

inline std::string toUpper(std::string s) {
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}
