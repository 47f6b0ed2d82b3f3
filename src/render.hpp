#pragma once
#include "sdl.hpp"

#include "game.hpp"

#include <string>
#include <vector>

// Draws the session through SDL_Renderer: explored tiles as dark/light wall
// and ground cells, visible entities as their glyph in the built-in 5x7 font,
// and a HUD strip below the map with the hp bar and recent messages.
class Renderer {
public:
    Renderer(int mapW, int mapH, int tileSize, int hudHeight, bool vsync);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool init();
    void shutdown();

    // `messages` is oldest first; the HUD shows as many of the newest as fit.
    void render(const Game& game, bool inventoryOpen, const std::vector<std::string>& messages);

    void toggleFullscreen();
    void setStatusLine(const std::string& text);

private:
    void drawMap(const Game& game);
    void drawEntities(const Game& game);
    void drawHud(const Game& game, const std::vector<std::string>& messages);
    void drawInventory(const Game& game);

    void fillCell(int x, int y, Color c);
    void fillRect(int x, int y, int w, int h, Color c);
    void drawChar(int px, int py, int scale, Color c, char ch);
    void drawText(int px, int py, int scale, Color c, const std::string& text);

    int mapW = 0;
    int mapH = 0;
    int tile = 16;
    int hudH = 96;
    int winW = 0;
    int winH = 0;
    bool vsyncEnabled = true;
    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
};
