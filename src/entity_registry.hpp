#pragma once
#include "entity.hpp"
#include "tile_map.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

// Ordered collection of every entity on the level. The player is always at
// playerIndex(); all other slots are unordered.
//
// swapRemove() moves the last entity into the removed slot, so an index held
// across a removal may refer to a different entity afterwards.
class EntityRegistry {
public:
    explicit EntityRegistry(Entity player);

    static constexpr size_t playerIndex() { return 0; }

    size_t size() const { return ents_.size(); }

    Entity& at(size_t idx);
    const Entity& at(size_t idx) const;

    Entity& player() { return ents_[playerIndex()]; }
    const Entity& player() const { return ents_[playerIndex()]; }

    size_t add(Entity e);

    // Two distinct mutable entities at once (attacker/target). Asking for the
    // same index twice throws std::logic_error.
    std::pair<Entity&, Entity&> mutTwo(size_t first, size_t second);

    // Removes the entity at idx and returns it. The player cannot be removed.
    Entity swapRemove(size_t idx);

    // Terrain or any blocking entity on (x,y).
    bool isBlocked(const TileMap& map, int x, int y) const;
    bool isOccupied(int x, int y) const;

    std::optional<size_t> firstFighterAt(Vec2i p) const;
    std::optional<size_t> firstItemAt(Vec2i p) const;

    std::vector<Entity>::iterator begin() { return ents_.begin(); }
    std::vector<Entity>::iterator end() { return ents_.end(); }
    std::vector<Entity>::const_iterator begin() const { return ents_.begin(); }
    std::vector<Entity>::const_iterator end() const { return ents_.end(); }

private:
    std::vector<Entity> ents_;
};
