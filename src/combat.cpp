#include "combat.hpp"

#include <algorithm>
#include <string>

namespace {

void playerDeath(Entity& player, EventLog& log, size_t subject) {
    // The session stops accepting turns; the body just changes appearance.
    player.glyph = '%';
    player.color = colors::DarkRed;
    log.push(EventKind::PlayerDied, MessageKind::Warning, "YOU DIED!", subject);
}

void monsterDeath(Entity& monster, EventLog& log, size_t subject) {
    log.push(EventKind::Died, MessageKind::Success, toUpper(monster.name) + " IS DEAD!", subject);
    monster.glyph = '%';
    monster.color = colors::DarkRed;
    monster.blocks = false;
    monster.fighter.reset();
    monster.ai.reset();
    monster.name = "remains of " + monster.name;
}

} // namespace

int rawDamage(const Fighter& attacker, const Fighter& target) {
    return attacker.power - target.defense;
}

bool takeDamage(Entity& target, int damage, EventLog& log, size_t subject) {
    if (!target.fighter) return false;
    Fighter& f = *target.fighter;

    if (damage > 0) {
        f.hp = std::max(0, f.hp - damage);
    }

    if (f.hp > 0 || !target.alive) return false;

    target.alive = false;
    switch (f.onDeath) {
        case DeathKind::Player:
            playerDeath(target, log, subject);
            break;
        case DeathKind::Monster:
            // Invalidates `f`: the Fighter capability is stripped here.
            monsterDeath(target, log, subject);
            break;
    }
    return true;
}

AttackOutcome attack(EntityRegistry& ents, size_t attackerIdx, size_t targetIdx, EventLog& log) {
    auto [attacker, target] = ents.mutTwo(attackerIdx, targetIdx);

    AttackOutcome out;
    if (!attacker.fighter || !attacker.alive || !target.fighter || !target.alive) return out;

    const int damage = rawDamage(*attacker.fighter, *target.fighter);
    const std::string who = toUpper(attacker.name);
    const std::string whom = toUpper(target.name);

    if (damage <= 0) {
        out.result = AttackResult::NoEffect;
        log.push(EventKind::NoEffect, MessageKind::Combat, who + " ATTACKS " + whom + " BUT IT HAS NO EFFECT!", targetIdx);
        return out;
    }

    out.result = AttackResult::Hit;
    out.damage = damage;
    log.push(EventKind::Attack, MessageKind::Combat,
             who + " ATTACKS " + whom + " FOR " + std::to_string(damage) + " HIT POINTS.", targetIdx);
    out.killed = takeDamage(target, damage, log, targetIdx);
    return out;
}

int heal(Fighter& f, int amount) {
    if (amount <= 0) return 0;
    const int before = f.hp;
    f.hp = std::min(f.maxHp, f.hp + amount);
    return f.hp - before;
}
