#include "ui_font.hpp"

#include <algorithm>
#include <iterator>

namespace {

struct GlyphEntry {
    char ch;
    Glyph5x7 glyph;
};

constexpr Glyph5x7 kUnknown{{0b01110, 0b10001, 0b00010, 0b00100, 0b00100, 0, 0b00100}};

// Sorted by character so lookups can binary search.
constexpr GlyphEntry kGlyphs[] = {
    {' ',  {{0, 0, 0, 0, 0, 0, 0}}},
    {'!',  {{0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0, 0b00100}}},
    {'%',  {{0b11001, 0b11010, 0b00010, 0b00100, 0b01000, 0b01011, 0b10011}}},
    {'\'', {{0b00100, 0b00100, 0, 0, 0, 0, 0}}},
    {'(',  {{0b00100, 0b01000, 0b10000, 0b10000, 0b10000, 0b01000, 0b00100}}},
    {')',  {{0b00100, 0b00010, 0b00001, 0b00001, 0b00001, 0b00010, 0b00100}}},
    {',',  {{0, 0, 0, 0, 0, 0b01100, 0b00100}}},
    {'-',  {{0, 0, 0, 0b11111, 0, 0, 0}}},
    {'.',  {{0, 0, 0, 0, 0, 0b01100, 0b01100}}},
    {'/',  {{0b00001, 0b00010, 0b00100, 0b01000, 0b10000, 0, 0}}},
    {'0',  {{0b01110, 0b10001, 0b10011, 0b10101, 0b11001, 0b10001, 0b01110}}},
    {'1',  {{0b00100, 0b01100, 0b00100, 0b00100, 0b00100, 0b00100, 0b01110}}},
    {'2',  {{0b01110, 0b10001, 0b00001, 0b00010, 0b00100, 0b01000, 0b11111}}},
    {'3',  {{0b11110, 0b00001, 0b00001, 0b01110, 0b00001, 0b00001, 0b11110}}},
    {'4',  {{0b00010, 0b00110, 0b01010, 0b10010, 0b11111, 0b00010, 0b00010}}},
    {'5',  {{0b11111, 0b10000, 0b10000, 0b11110, 0b00001, 0b00001, 0b11110}}},
    {'6',  {{0b00110, 0b01000, 0b10000, 0b11110, 0b10001, 0b10001, 0b01110}}},
    {'7',  {{0b11111, 0b00001, 0b00010, 0b00100, 0b01000, 0b01000, 0b01000}}},
    {'8',  {{0b01110, 0b10001, 0b10001, 0b01110, 0b10001, 0b10001, 0b01110}}},
    {'9',  {{0b01110, 0b10001, 0b10001, 0b01111, 0b00001, 0b00010, 0b01100}}},
    {':',  {{0, 0b01100, 0b01100, 0, 0b01100, 0b01100, 0}}},
    {'?',  {{0b01110, 0b10001, 0b00001, 0b00010, 0b00100, 0, 0b00100}}},
    {'@',  {{0b01110, 0b10001, 0b10111, 0b10101, 0b10111, 0b10000, 0b01110}}},
    {'A',  {{0b01110, 0b10001, 0b10001, 0b11111, 0b10001, 0b10001, 0b10001}}},
    {'B',  {{0b11110, 0b10001, 0b10001, 0b11110, 0b10001, 0b10001, 0b11110}}},
    {'C',  {{0b01110, 0b10001, 0b10000, 0b10000, 0b10000, 0b10001, 0b01110}}},
    {'D',  {{0b11100, 0b10010, 0b10001, 0b10001, 0b10001, 0b10010, 0b11100}}},
    {'E',  {{0b11111, 0b10000, 0b10000, 0b11110, 0b10000, 0b10000, 0b11111}}},
    {'F',  {{0b11111, 0b10000, 0b10000, 0b11110, 0b10000, 0b10000, 0b10000}}},
    {'G',  {{0b01110, 0b10001, 0b10000, 0b10000, 0b10011, 0b10001, 0b01110}}},
    {'H',  {{0b10001, 0b10001, 0b10001, 0b11111, 0b10001, 0b10001, 0b10001}}},
    {'I',  {{0b01110, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0b01110}}},
    {'J',  {{0b00001, 0b00001, 0b00001, 0b00001, 0b10001, 0b10001, 0b01110}}},
    {'K',  {{0b10001, 0b10010, 0b10100, 0b11000, 0b10100, 0b10010, 0b10001}}},
    {'L',  {{0b10000, 0b10000, 0b10000, 0b10000, 0b10000, 0b10000, 0b11111}}},
    {'M',  {{0b10001, 0b11011, 0b10101, 0b10101, 0b10001, 0b10001, 0b10001}}},
    {'N',  {{0b10001, 0b10001, 0b11001, 0b10101, 0b10011, 0b10001, 0b10001}}},
    {'O',  {{0b01110, 0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01110}}},
    {'P',  {{0b11110, 0b10001, 0b10001, 0b11110, 0b10000, 0b10000, 0b10000}}},
    {'Q',  {{0b01110, 0b10001, 0b10001, 0b10001, 0b10101, 0b10010, 0b01101}}},
    {'R',  {{0b11110, 0b10001, 0b10001, 0b11110, 0b10100, 0b10010, 0b10001}}},
    {'S',  {{0b01111, 0b10000, 0b10000, 0b01110, 0b00001, 0b00001, 0b11110}}},
    {'T',  {{0b11111, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100}}},
    {'U',  {{0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01110}}},
    {'V',  {{0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01010, 0b00100}}},
    {'W',  {{0b10001, 0b10001, 0b10001, 0b10101, 0b10101, 0b10101, 0b01010}}},
    {'X',  {{0b10001, 0b10001, 0b01010, 0b00100, 0b01010, 0b10001, 0b10001}}},
    {'Y',  {{0b10001, 0b10001, 0b01010, 0b00100, 0b00100, 0b00100, 0b00100}}},
    {'Z',  {{0b11111, 0b00001, 0b00010, 0b00100, 0b01000, 0b10000, 0b11111}}},
};

const GlyphEntry* findGlyph(char c) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    const auto* end = std::end(kGlyphs);
    const auto* it = std::lower_bound(std::begin(kGlyphs), end, c,
                                      [](const GlyphEntry& e, char ch) { return e.ch < ch; });
    if (it == end || it->ch != c) return nullptr;
    return it;
}

} // namespace

Glyph5x7 glyph5x7(char c) {
    const GlyphEntry* e = findGlyph(c);
    return e ? e->glyph : kUnknown;
}

bool hasGlyph(char c) {
    return findGlyph(c) != nullptr;
}

std::vector<std::string> wrapText(const std::string& text, int maxChars) {
    const size_t width = static_cast<size_t>(std::max(1, maxChars));
    std::vector<std::string> lines;
    std::string line;

    auto flush = [&] {
        lines.push_back(line);
        line.clear();
    };

    auto place = [&](std::string word) {
        while (word.size() > width) {
            if (!line.empty()) flush();
            line = word.substr(0, width);
            word.erase(0, width);
            flush();
        }
        if (word.empty()) return;
        if (line.empty()) {
            line = word;
        } else if (line.size() + 1 + word.size() <= width) {
            line += ' ';
            line += word;
        } else {
            flush();
            line = word;
        }
    };

    std::string word;
    for (char ch : text) {
        if (ch == '\n') {
            place(word);
            word.clear();
            flush();
        } else if (ch == ' ' || ch == '\t' || ch == '\r') {
            place(word);
            word.clear();
        } else {
            word.push_back(ch);
        }
    }
    place(word);
    if (!line.empty()) flush();
    return lines;
}
