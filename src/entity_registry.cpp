#include "entity_registry.hpp"

#include <stdexcept>
#include <string>

EntityRegistry::EntityRegistry(Entity player) {
    ents_.push_back(std::move(player));
}

Entity& EntityRegistry::at(size_t idx) {
    if (idx >= ents_.size()) {
        throw std::out_of_range("entity index " + std::to_string(idx) + " out of range");
    }
    return ents_[idx];
}

const Entity& EntityRegistry::at(size_t idx) const {
    if (idx >= ents_.size()) {
        throw std::out_of_range("entity index " + std::to_string(idx) + " out of range");
    }
    return ents_[idx];
}

size_t EntityRegistry::add(Entity e) {
    ents_.push_back(std::move(e));
    return ents_.size() - 1;
}

std::pair<Entity&, Entity&> EntityRegistry::mutTwo(size_t first, size_t second) {
    if (first == second) {
        throw std::logic_error("mutTwo: entity " + std::to_string(first) + " requested twice");
    }
    Entity& a = at(first);
    Entity& b = at(second);
    return {a, b};
}

Entity EntityRegistry::swapRemove(size_t idx) {
    if (idx == playerIndex()) {
        throw std::logic_error("swapRemove: the player entity cannot be removed");
    }
    Entity& slot = at(idx);
    Entity out = std::move(slot);
    if (idx != ents_.size() - 1) {
        slot = std::move(ents_.back());
    }
    ents_.pop_back();
    return out;
}

bool EntityRegistry::isOccupied(int x, int y) const {
    for (const auto& e : ents_) {
        if (e.blocks && e.pos.x == x && e.pos.y == y) return true;
    }
    return false;
}

bool EntityRegistry::isBlocked(const TileMap& map, int x, int y) const {
    if (map.isBlocked(x, y)) return true;
    return isOccupied(x, y);
}

std::optional<size_t> EntityRegistry::firstFighterAt(Vec2i p) const {
    for (size_t i = 0; i < ents_.size(); ++i) {
        if (ents_[i].fighter && ents_[i].pos == p) return i;
    }
    return std::nullopt;
}

std::optional<size_t> EntityRegistry::firstItemAt(Vec2i p) const {
    for (size_t i = 0; i < ents_.size(); ++i) {
        if (ents_[i].item && ents_[i].pos == p) return i;
    }
    return std::nullopt;
}
