#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Built-in 5x7 bitmap font so the SDL front-end can draw entity glyphs and
// message text without SDL_ttf. Letters are drawn upper-case; characters
// without a bitmap fall back to '?'.

constexpr int kGlyphW = 5;
constexpr int kGlyphH = 7;

struct Glyph5x7 {
    // One byte per row, top to bottom; bit 4 is the leftmost column.
    uint8_t rows[kGlyphH];
};

Glyph5x7 glyph5x7(char c);
bool hasGlyph(char c);

// Greedy word wrap to at most maxChars per line. Words longer than a line are
// split; '\n' forces a break.
std::vector<std::string> wrapText(const std::string& text, int maxChars);
