#include "game.hpp"

#include "ai.hpp"
#include "combat.hpp"
#include "rng.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

Game::Game(GameConfig cfg)
    : cfg_(sanitizeConfig(cfg)), ents_(makePlayer(cfg_)) {}

void Game::newGame(uint32_t seed) {
    seed_ = seed;
    RNG rng(seed);

    EntityRegistry ents(makePlayer(cfg_));
    LevelLayout level = generateDungeon(cfg_, rng, ents);

    startWithLevel(std::move(level.map), std::move(ents));
    rooms_ = std::move(level.rooms);
    spawn_ = level.playerSpawn;
}

void Game::startWithLevel(TileMap map, EntityRegistry ents) {
    map_ = std::move(map);
    ents_ = std::move(ents);
    rooms_.clear();
    spawn_.reset();
    inventory_.clear();
    finished_ = false;
    turns_ = 0;

    fov_.setup(map_);
    refreshFov(true);
}

void Game::refreshFov(bool force) {
    const Vec2i p = ents_.player().pos;
    if (!force && p == lastFovPos_) return;
    fov_.recompute(p.x, p.y, cfg_.fovRadius);
    lastFovPos_ = p;
}

TickResult Game::handleIntent(const PlayerIntent& intent) {
    TickResult result;
    if (finished_) {
        result.action = PlayerAction::Exit;
        return result;
    }

    EventLog log;
    PlayerAction action = PlayerAction::DidNotTakeTurn;

    switch (intent.kind) {
        case IntentKind::Move:
            if (std::abs(intent.dx) > 1 || std::abs(intent.dy) > 1) {
                throw std::invalid_argument("move intent (" + std::to_string(intent.dx) + "," +
                                            std::to_string(intent.dy) + ") is longer than one step");
            }
            if (intent.dx == 0 && intent.dy == 0) {
                action = isPlayerAlive() ? PlayerAction::TookTurn : PlayerAction::DidNotTakeTurn;
            } else {
                action = playerMoveOrAttack(intent.dx, intent.dy, log);
            }
            break;
        case IntentKind::Wait:
            action = isPlayerAlive() ? PlayerAction::TookTurn : PlayerAction::DidNotTakeTurn;
            break;
        case IntentKind::PickUp:
            action = pickUp(log);
            break;
        case IntentKind::OpenInventory:
            action = openInventory(log);
            break;
        case IntentKind::UseItem:
            action = useItem(intent.slot, log);
            break;
        case IntentKind::ToggleDisplay:
            log.push(EventKind::DisplayToggled, MessageKind::System, "");
            action = PlayerAction::DidNotTakeTurn;
            break;
        case IntentKind::Quit:
            log.push(EventKind::Quit, MessageKind::System, "");
            finished_ = true;
            action = PlayerAction::Exit;
            break;
    }

    refreshFov();

    if (action == PlayerAction::TookTurn) {
        ++turns_;
        if (isPlayerAlive()) runMonsterTurns(log);
    }

    result.action = action;
    result.events = log.take();
    return result;
}

PlayerAction Game::playerMoveOrAttack(int dx, int dy, EventLog& log) {
    if (!isPlayerAlive()) return PlayerAction::DidNotTakeTurn;

    const size_t self = EntityRegistry::playerIndex();
    const Vec2i dest{ents_.player().pos.x + dx, ents_.player().pos.y + dy};

    if (const auto target = ents_.firstFighterAt(dest)) {
        attack(ents_, self, *target, log);
        return PlayerAction::TookTurn;
    }

    if (moveBy(self, dx, dy, map_, ents_)) {
        log.push(EventKind::Moved, MessageKind::Info, "", self);
        return PlayerAction::TookTurn;
    }

    const bool wall = !map_.inBounds(dest) || map_.isBlocked(dest.x, dest.y);
    // Bumping still spends the turn; monsters get to act.
    log.push(EventKind::Bumped, MessageKind::Info, wall ? "THERE IS A WALL IN THE WAY." : "SOMETHING BLOCKS THE WAY.", self);
    return PlayerAction::TookTurn;
}

PlayerAction Game::pickUp(EventLog& log) {
    if (!isPlayerAlive()) return PlayerAction::DidNotTakeTurn;

    const auto idx = ents_.firstItemAt(ents_.player().pos);
    if (!idx) {
        log.push(EventKind::NothingToPickUp, MessageKind::Info, "THERE IS NOTHING HERE TO PICK UP.");
        return PlayerAction::DidNotTakeTurn;
    }

    const std::string name = toUpper(ents_.at(*idx).name);
    if (inventory_.size() >= static_cast<size_t>(cfg_.inventoryCapacity)) {
        log.push(EventKind::InventoryFull, MessageKind::Warning,
                 "YOUR INVENTORY IS FULL, CANNOT PICK UP " + name + ".", *idx);
        return PlayerAction::DidNotTakeTurn;
    }

    // swapRemove() reorders the tail; idx is not used past this point.
    inventory_.push_back(ents_.swapRemove(*idx));
    log.push(EventKind::PickedUp, MessageKind::Loot, "YOU PICKED UP A " + name + "!");
    return PlayerAction::DidNotTakeTurn;
}

PlayerAction Game::useItem(size_t slot, EventLog& log) {
    if (!isPlayerAlive()) return PlayerAction::DidNotTakeTurn;

    if (slot >= inventory_.size() || !inventory_[slot].item) {
        log.push(EventKind::EmptySlot, MessageKind::Info, "THERE IS NO ITEM IN THAT SLOT.");
        return PlayerAction::DidNotTakeTurn;
    }

    Fighter* f = ents_.player().fighter ? &*ents_.player().fighter : nullptr;

    switch (*inventory_[slot].item) {
        case ItemKind::Heal:
            if (!f || f->hp >= f->maxHp) {
                log.push(EventKind::ItemCancelled, MessageKind::Warning, "YOU ARE ALREADY AT FULL HEALTH.");
                return PlayerAction::DidNotTakeTurn;
            }
            heal(*f, cfg_.healAmount);
            log.push(EventKind::ItemUsed, MessageKind::Success, "YOUR WOUNDS START TO FEEL BETTER!");
            break;
    }

    inventory_.erase(inventory_.begin() + static_cast<std::ptrdiff_t>(slot));
    return PlayerAction::TookTurn;
}

PlayerAction Game::openInventory(EventLog& log) {
    if (inventory_.empty()) {
        log.push(EventKind::InventoryOpened, MessageKind::Info, "INVENTORY IS EMPTY.");
    } else {
        log.push(EventKind::InventoryOpened, MessageKind::Info,
                 "YOU ARE CARRYING " + std::to_string(inventory_.size()) + " ITEM(S).");
    }
    return PlayerAction::DidNotTakeTurn;
}

void Game::runMonsterTurns(EventLog& log) {
    // Nothing is added or removed from the registry during this pass.
    for (size_t i = 0; i < ents_.size(); ++i) {
        if (ents_.at(i).ai) {
            aiTakeTurn(i, map_, ents_, fov_, log);
        }
    }
}

std::vector<size_t> Game::visibleEntities() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < ents_.size(); ++i) {
        const Vec2i p = ents_.at(i).pos;
        if (map_.inBounds(p) && fov_.isVisible(p.x, p.y)) out.push_back(i);
    }
    std::stable_sort(out.begin(), out.end(), [&](size_t a, size_t b) {
        return !ents_.at(a).blocks && ents_.at(b).blocks;
    });
    return out;
}

Menu Game::inventoryMenu() const {
    std::vector<std::string> labels;
    labels.reserve(inventory_.size());
    for (const auto& e : inventory_) labels.push_back(e.name);
    return buildMenu("Press the key next to an item to use it, or any other to cancel.", labels);
}

const char* playerActionName(PlayerAction a) {
    switch (a) {
        case PlayerAction::TookTurn: return "took_turn";
        case PlayerAction::DidNotTakeTurn: return "did_not_take_turn";
        case PlayerAction::Exit: return "exit";
        default: return "unknown";
    }
}
