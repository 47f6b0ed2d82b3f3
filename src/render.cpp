#include "render.hpp"
#include "ui_font.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

Renderer::Renderer(int mapWidth, int mapHeight, int tileSize, int hudHeight, bool vsync)
    : mapW(mapWidth), mapH(mapHeight), tile(tileSize), hudH(hudHeight),
      winW(mapWidth * tileSize), winH(mapHeight * tileSize + hudHeight), vsyncEnabled(vsync) {}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(DRAGONSLAYER_APPNAME) + " v" + DRAGONSLAYER_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window);
        window = nullptr;
        return false;
    }

    // Keep a fixed "virtual" resolution and let SDL scale the final output.
    SDL_RenderSetLogicalSize(renderer, winW, winH);
    SDL_RenderSetIntegerScale(renderer, SDL_TRUE);

    initialized = true;
    return true;
}

void Renderer::shutdown() {
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    initialized = false;
}

void Renderer::toggleFullscreen() {
    if (!window) return;
    const Uint32 flags = SDL_GetWindowFlags(window);
    const bool isFs = (flags & SDL_WINDOW_FULLSCREEN_DESKTOP) != 0;
    if (SDL_SetWindowFullscreen(window, isFs ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP) != 0) {
        std::cerr << "SDL_SetWindowFullscreen failed: " << SDL_GetError() << "\n";
    }
}

void Renderer::setStatusLine(const std::string& text) {
    if (!window) return;
    const std::string title = std::string(DRAGONSLAYER_APPNAME) + " - " + text;
    SDL_SetWindowTitle(window, title.c_str());
}

void Renderer::fillRect(int x, int y, int w, int h, Color c) {
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_Rect r{x, y, w, h};
    SDL_RenderFillRect(renderer, &r);
}

void Renderer::fillCell(int x, int y, Color c) {
    fillRect(x * tile, y * tile, tile, tile, c);
}

void Renderer::drawChar(int px, int py, int scale, Color c, char ch) {
    const Glyph5x7 g = glyph5x7(ch);
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    for (int row = 0; row < kGlyphH; ++row) {
        for (int col = 0; col < kGlyphW; ++col) {
            if (!(g.rows[row] & (1 << (kGlyphW - 1 - col)))) continue;
            SDL_Rect px1{px + col * scale, py + row * scale, scale, scale};
            SDL_RenderFillRect(renderer, &px1);
        }
    }
}

void Renderer::drawText(int px, int py, int scale, Color c, const std::string& text) {
    // One blank column between characters.
    for (char ch : text) {
        drawChar(px, py, scale, c, ch);
        px += (kGlyphW + 1) * scale;
    }
}

void Renderer::drawMap(const Game& game) {
    const TileMap& map = game.map();
    const VisibilityTracker& fov = game.fov();

    for (int y = 0; y < map.height(); ++y) {
        for (int x = 0; x < map.width(); ++x) {
            // Unexplored tiles stay black.
            if (!fov.isExplored(x, y)) continue;

            const bool visible = fov.isVisible(x, y);
            const bool wall = map.blocksSight(x, y);
            Color c;
            if (visible) c = wall ? colors::LightWall : colors::LightGround;
            else c = wall ? colors::DarkWall : colors::DarkGround;
            fillCell(x, y, c);
        }
    }
}

void Renderer::drawEntities(const Game& game) {
    const EntityRegistry& ents = game.entities();
    // Largest whole scale that fits the 5x7 cell inside a tile.
    const int scale = std::max(1, tile / (kGlyphH + 1));
    const int offX = (tile - kGlyphW * scale) / 2;
    const int offY = (tile - kGlyphH * scale) / 2;

    for (size_t idx : game.visibleEntities()) {
        const Entity& e = ents.at(idx);
        // Clear the floor under the glyph so it reads on light ground.
        fillCell(e.pos.x, e.pos.y, Color{0, 0, 0, 255});
        drawChar(e.pos.x * tile + offX, e.pos.y * tile + offY, scale, e.color, e.glyph);
    }
}

void Renderer::drawHud(const Game& game, const std::vector<std::string>& messages) {
    const int top = mapH * tile;
    fillRect(0, top, winW, hudH, Color{16, 16, 16, 255});

    const int lineH = (kGlyphH + 1) * 2;
    const int barW = winW / 3;
    const int barH = kGlyphH * 2;
    const int barX = tile;
    const int barY = top + 6;

    const Entity& p = game.player();
    if (p.fighter) {
        const int filled = p.fighter->maxHp > 0 ? (barW * std::max(0, p.fighter->hp)) / p.fighter->maxHp : 0;
        fillRect(barX, barY, barW, barH, Color{64, 16, 16, 255});
        fillRect(barX, barY, filled, barH, Color{191, 0, 0, 255});
        drawText(barX + 4, barY, 2, colors::White,
                 "HP: " + std::to_string(p.fighter->hp) + "/" + std::to_string(p.fighter->maxHp));
    }
    drawText(barX + barW + tile, barY, 2, colors::White, "TURN " + std::to_string(game.turns()));

    // Newest message at the bottom; older ones scroll up and fade.
    const int firstY = barY + lineH + 4;
    const int rows = std::max(0, (top + hudH - firstY) / lineH);
    const int maxChars = std::max(1, (winW - 2 * tile) / ((kGlyphW + 1) * 2));

    std::vector<std::string> lines;
    for (const auto& m : messages) {
        for (auto& l : wrapText(m, maxChars)) lines.push_back(std::move(l));
    }
    const size_t shown = std::min(lines.size(), static_cast<size_t>(rows));
    for (size_t i = 0; i < shown; ++i) {
        const std::string& l = lines[lines.size() - shown + i];
        const Uint8 v = static_cast<Uint8>(i + 1 == shown ? 255 : 150);
        drawText(tile, firstY + static_cast<int>(i) * lineH, 2, Color{v, v, v, 255}, l);
    }
}

void Renderer::drawInventory(const Game& game) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    fillRect(0, 0, winW, mapH * tile, Color{0, 0, 0, 200});
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);

    const Menu menu = game.inventoryMenu();
    const int lineH = (kGlyphH + 1) * 2;
    const int maxChars = std::max(1, (winW - 2 * tile) / ((kGlyphW + 1) * 2));
    int y = tile;

    for (const auto& l : wrapText(menu.header, maxChars)) {
        drawText(tile, y, 2, colors::White, l);
        y += lineH;
    }
    y += lineH / 2;

    if (menu.entries.empty()) {
        drawText(tile, y, 2, colors::White, "INVENTORY IS EMPTY.");
        return;
    }
    const auto& inv = game.inventory();
    for (size_t i = 0; i < menu.entries.size(); ++i) {
        const MenuEntry& e = menu.entries[i];
        drawChar(tile, y, 2, inv[i].color, inv[i].glyph);
        drawText(tile + 3 * (kGlyphW + 1) * 2, y, 2, colors::White,
                 std::string("(") + e.key + ") " + e.label);
        y += lineH;
    }
}

void Renderer::render(const Game& game, bool inventoryOpen, const std::vector<std::string>& messages) {
    if (!initialized) return;

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    drawMap(game);
    drawEntities(game);
    drawHud(game, messages);
    if (inventoryOpen) drawInventory(game);

    SDL_RenderPresent(renderer);
}
