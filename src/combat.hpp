#pragma once
#include "entity.hpp"
#include "entity_registry.hpp"
#include "events.hpp"

#include <cstddef>
#include <cstdint>

enum class AttackResult : uint8_t {
    Hit = 0,    // damage > 0 was applied
    NoEffect,   // power <= defense; nothing changed
    Ignored,    // attacker or target cannot fight (no Fighter, already dead)
};

struct AttackOutcome {
    AttackResult result = AttackResult::Ignored;
    int damage = 0;
    bool killed = false;
};

// Raw damage before the zero floor: attacker.power - target.defense.
int rawDamage(const Fighter& attacker, const Fighter& target);

// Resolves one melee attack between two distinct registry entries.
// attackerIdx == targetIdx throws std::logic_error (see EntityRegistry::mutTwo).
AttackOutcome attack(EntityRegistry& ents, size_t attackerIdx, size_t targetIdx, EventLog& log);

// Applies damage (ignored when <= 0) and runs the death transition the first
// time hp reaches zero. Returns true if this call killed the entity.
bool takeDamage(Entity& target, int damage, EventLog& log, size_t subject = EventLog::npos);

// Restores up to `amount` hp without exceeding maxHp. Returns hp gained.
int heal(Fighter& f, int amount);
