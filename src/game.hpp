#pragma once
#include "common.hpp"
#include "dungeon_gen.hpp"
#include "entity.hpp"
#include "entity_registry.hpp"
#include "events.hpp"
#include "fov.hpp"
#include "menu.hpp"
#include "settings.hpp"
#include "tile_map.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Classification of one player tick. Monsters only act on TookTurn.
enum class PlayerAction : uint8_t {
    TookTurn = 0,
    DidNotTakeTurn,
    Exit,
};

enum class IntentKind : uint8_t {
    Move = 0,
    Wait,
    PickUp,
    OpenInventory,
    UseItem,
    ToggleDisplay,
    Quit,
};

// One classified player input, produced by the key mapping of a front-end.
struct PlayerIntent {
    IntentKind kind = IntentKind::Wait;
    int dx = 0;
    int dy = 0;
    size_t slot = 0;

    static PlayerIntent move(int dx, int dy) { return {IntentKind::Move, dx, dy, 0}; }
    static PlayerIntent wait() { return {IntentKind::Wait, 0, 0, 0}; }
    static PlayerIntent pickUp() { return {IntentKind::PickUp, 0, 0, 0}; }
    static PlayerIntent openInventory() { return {IntentKind::OpenInventory, 0, 0, 0}; }
    static PlayerIntent useItem(size_t slot) { return {IntentKind::UseItem, 0, 0, slot}; }
    static PlayerIntent toggleDisplay() { return {IntentKind::ToggleDisplay, 0, 0, 0}; }
    static PlayerIntent quit() { return {IntentKind::Quit, 0, 0, 0}; }
};

struct TickResult {
    PlayerAction action = PlayerAction::DidNotTakeTurn;
    std::vector<GameEvent> events;
};

// A play session: the level, its entities, the player's inventory and the
// turn scheduler that advances them.
//
// One tick = one player intent followed, if the player spent the turn, by one
// pass over every AI entity in registry order. A tick always runs to
// completion; Exit only stops later ticks.
class Game {
public:
    explicit Game(GameConfig cfg = GameConfig{});

    // The FOV tracker points into map_, so a session is pinned in memory.
    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    void newGame(uint32_t seed);

    // Starts a session on a prepared level instead of a generated one.
    // The registry's player entity is used as-is.
    void startWithLevel(TileMap map, EntityRegistry ents);

    TickResult handleIntent(const PlayerIntent& intent);

    // Render-query surface. Everything here is read-only.
    const GameConfig& config() const { return cfg_; }
    const TileMap& map() const { return map_; }
    const VisibilityTracker& fov() const { return fov_; }
    const EntityRegistry& entities() const { return ents_; }
    const std::vector<Entity>& inventory() const { return inventory_; }
    const std::vector<Room>& rooms() const { return rooms_; }
    std::optional<Vec2i> playerSpawn() const { return spawn_; }
    const Entity& player() const { return ents_.player(); }

    // Indices of entities in the player's FOV, non-blocking ones first so
    // actors draw over items and remains.
    std::vector<size_t> visibleEntities() const;
    Menu inventoryMenu() const;

    bool isPlayerAlive() const { return ents_.player().alive; }
    bool isFinished() const { return finished_; }
    uint32_t turns() const { return turns_; }
    uint32_t seed() const { return seed_; }

private:
    PlayerAction playerMoveOrAttack(int dx, int dy, EventLog& log);
    PlayerAction pickUp(EventLog& log);
    PlayerAction useItem(size_t slot, EventLog& log);
    PlayerAction openInventory(EventLog& log);
    void runMonsterTurns(EventLog& log);

    // Recomputes the FOV only when the player has moved since the last call.
    void refreshFov(bool force = false);

    GameConfig cfg_;
    uint32_t seed_ = 0;

    TileMap map_;
    std::vector<Room> rooms_;
    std::optional<Vec2i> spawn_;
    EntityRegistry ents_;
    std::vector<Entity> inventory_;
    VisibilityTracker fov_;
    Vec2i lastFovPos_{-1, -1};

    bool finished_ = false;
    uint32_t turns_ = 0;
};

const char* playerActionName(PlayerAction a);
