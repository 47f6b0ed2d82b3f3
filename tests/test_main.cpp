#include "ai.hpp"
#include "combat.hpp"
#include "dungeon_gen.hpp"
#include "entity.hpp"
#include "entity_registry.hpp"
#include "events.hpp"
#include "fov.hpp"
#include "game.hpp"
#include "ini.hpp"
#include "menu.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "tile_map.hpp"
#include "ui_font.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

template <typename Ex, typename Fn>
bool throwsAs(Fn&& fn) {
    try {
        fn();
    } catch (const Ex&) {
        return true;
    }
    return false;
}

// A w x h map whose interior (everything but the outer ring) is open floor.
TileMap openRoom(int w, int h) {
    TileMap m(w, h);
    for (int y = 1; y < h - 1; ++y) {
        for (int x = 1; x < w - 1; ++x) m.carve(x, y);
    }
    return m;
}

int countEvents(const std::vector<GameEvent>& events, EventKind kind) {
    int n = 0;
    for (const auto& e : events) {
        if (e.kind == kind) ++n;
    }
    return n;
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }
}

void test_carve_keeps_explored_latch() {
    TileMap m(4, 4);
    m.markExplored(1, 1);
    m.carve(1, 1);
    m.carve(2, 2);
    expect(!m.isBlocked(1, 1) && !m.blocksSight(1, 1), "carved tile is floor");
    expect(m.isExplored(1, 1), "carving keeps an explored tile explored");
    expect(!m.isExplored(2, 2), "carving does not mark a tile explored");
    expect(m.countOpen() == 2, "two tiles carved");
}

void test_tile_map_bounds() {
    TileMap m(10, 5);
    expect(m.isBlocked(0, 0) && m.blocksSight(0, 0), "New tiles start as wall");
    expect(m.countOpen() == 0, "New map has no open tiles");

    m.carve(3, 3);
    expect(!m.isBlocked(3, 3) && !m.blocksSight(3, 3), "carve() opens a tile");

    expect(throwsAs<std::out_of_range>([&] { (void)m.at(-1, 0); }), "at(-1,0) must throw");
    expect(throwsAs<std::out_of_range>([&] { (void)m.at(10, 0); }), "at(width,0) must throw");
    expect(throwsAs<std::out_of_range>([&] { (void)m.at(0, 5); }), "at(0,height) must throw");
}

void test_room_intersection_is_inclusive() {
    const Room a = Room::fromSize(0, 0, 5, 5);
    const Room touching = Room::fromSize(5, 0, 5, 5);
    const Room apart = Room::fromSize(6, 0, 5, 5);

    expect(a.intersects(touching), "Rooms sharing an edge line count as intersecting");
    expect(touching.intersects(a), "Intersection is symmetric");
    expect(!a.intersects(apart), "Rooms one tile apart do not intersect");

    const Vec2i c = Room::fromSize(2, 4, 6, 8).center();
    expect(c.x == 5 && c.y == 8, "Room center is the midpoint of its corners");
}

void test_generated_rooms_disjoint() {
    const GameConfig cfg;
    for (uint32_t seed = 1; seed <= 25; ++seed) {
        RNG rng(seed);
        EntityRegistry ents(makePlayer(cfg));
        const LevelLayout level = generateDungeon(cfg, rng, ents);

        expect(!level.rooms.empty(), "Default config should accept at least one room (seed " + std::to_string(seed) + ")");
        for (size_t i = 0; i < level.rooms.size(); ++i) {
            for (size_t j = i + 1; j < level.rooms.size(); ++j) {
                expect(!level.rooms[i].intersects(level.rooms[j]),
                       "Accepted rooms overlap (seed " + std::to_string(seed) + ")");
            }
        }
    }
}

void test_generated_rooms_connected() {
    const GameConfig cfg;
    for (uint32_t seed = 1; seed <= 25; ++seed) {
        RNG rng(seed);
        EntityRegistry ents(makePlayer(cfg));
        const LevelLayout level = generateDungeon(cfg, rng, ents);
        const TileMap& m = level.map;

        expect(level.playerSpawn.has_value(), "Spawn should be set when rooms exist");
        if (!level.playerSpawn) continue;
        const Vec2i start = *level.playerSpawn;
        expect(start == level.rooms.front().center(), "Spawn is the first room's center");
        expect(ents.player().pos == start, "Player moved to the spawn point");

        std::vector<uint8_t> visited(static_cast<size_t>(m.width() * m.height()), 0);
        auto idx = [&](int x, int y) { return static_cast<size_t>(y * m.width() + x); };

        std::queue<Vec2i> q;
        q.push(start);
        visited[idx(start.x, start.y)] = 1;

        const int dirs[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};
        while (!q.empty()) {
            const Vec2i p = q.front();
            q.pop();
            for (auto& d : dirs) {
                const int nx = p.x + d[0];
                const int ny = p.y + d[1];
                if (!m.inBounds(nx, ny) || m.isBlocked(nx, ny)) continue;
                if (visited[idx(nx, ny)]) continue;
                visited[idx(nx, ny)] = 1;
                q.push({nx, ny});
            }
        }

        for (const Room& r : level.rooms) {
            const Vec2i c = r.center();
            expect(visited[idx(c.x, c.y)] != 0, "Room center unreachable from spawn (seed " + std::to_string(seed) + ")");
        }
    }
}

void test_spawns_on_open_unoccupied_tiles() {
    GameConfig cfg;
    cfg.maxRoomMonsters = 6;
    cfg.maxRoomItems = 4;

    for (uint32_t seed = 1; seed <= 25; ++seed) {
        RNG rng(seed);
        EntityRegistry ents(makePlayer(cfg));
        const LevelLayout level = generateDungeon(cfg, rng, ents);

        for (size_t i = 1; i < ents.size(); ++i) {
            const Entity& e = ents.at(i);
            expect(level.map.inBounds(e.pos), "Spawned entity out of bounds");
            expect(!level.map.isBlocked(e.pos.x, e.pos.y), "Entity spawned on a blocked tile");

            bool inRoom = false;
            for (const Room& r : level.rooms) inRoom = inRoom || r.contains(e.pos.x, e.pos.y);
            expect(inRoom, "Entity spawned outside every room interior");

            for (size_t j = 0; j < ents.size(); ++j) {
                if (j == i) continue;
                const Entity& o = ents.at(j);
                // Items are placed after monsters, so no spawn may share a blocker's tile.
                expect(!(o.blocks && o.pos == e.pos),
                       "Entity shares a tile with a blocking entity (seed " + std::to_string(seed) + ")");
            }

            if (e.fighter) {
                expect(e.ai.has_value() && e.blocks && e.alive, "Monsters carry AI, block and start alive");
                expect(e.name == "orc" || e.name == "troll", "Unexpected monster variant");
            } else {
                expect(e.item.has_value() && !e.blocks, "Non-monster spawns are non-blocking items");
            }
        }
    }
}

void test_zero_rooms_yields_empty_level() {
    GameConfig cfg;
    cfg.maxRooms = 0;

    RNG rng(99u);
    EntityRegistry ents(makePlayer(cfg));
    const LevelLayout level = generateDungeon(cfg, rng, ents);

    expect(level.map.width() == 80 && level.map.height() == 45, "Map uses configured size");
    expect(level.map.countOpen() == 0, "maxRooms=0 leaves every tile blocked");
    expect(level.rooms.empty(), "maxRooms=0 accepts no rooms");
    expect(ents.size() == 1, "maxRooms=0 spawns nothing besides the player");
    expect(!level.playerSpawn.has_value(), "maxRooms=0 leaves the spawn unset");
}

void test_rooms_without_interior_are_rejected() {
    GameConfig tiny;
    tiny.maxRooms = 5;
    tiny.roomMinSize = 0;
    tiny.roomMaxSize = 0;

    RNG rng(3u);
    EntityRegistry ents(makePlayer(tiny));
    const LevelLayout level = generateDungeon(tiny, rng, ents);
    expect(level.rooms.empty(), "zero-size rooms are never accepted");
    expect(!level.playerSpawn.has_value(), "no spawn without a room");
    expect(level.map.countOpen() == 0, "nothing carved for zero-size rooms");

    GameConfig mixed;
    mixed.maxRooms = 60;
    mixed.roomMinSize = 1;
    mixed.roomMaxSize = 5;
    for (uint32_t seed = 1; seed <= 10; ++seed) {
        RNG r(seed);
        EntityRegistry e(makePlayer(mixed));
        const LevelLayout l = generateDungeon(mixed, r, e);
        for (const Room& room : l.rooms) {
            expect(room.x2 - room.x1 >= kMinRoomSize && room.y2 - room.y1 >= kMinRoomSize,
                   "accepted rooms have an interior");
            const Vec2i c = room.center();
            expect(!l.map.isBlocked(c.x, c.y), "room centers are carved floor");
        }
    }
}

void test_generation_reproducible() {
    const GameConfig cfg;
    RNG a(2024u);
    RNG b(2024u);
    EntityRegistry ea(makePlayer(cfg));
    EntityRegistry eb(makePlayer(cfg));
    const LevelLayout la = generateDungeon(cfg, a, ea);
    const LevelLayout lb = generateDungeon(cfg, b, eb);

    expect(la.rooms.size() == lb.rooms.size(), "Same seed, same room count");
    expect(ea.size() == eb.size(), "Same seed, same entity count");
    for (size_t i = 0; i < la.rooms.size() && i < lb.rooms.size(); ++i) {
        expect(la.rooms[i].x1 == lb.rooms[i].x1 && la.rooms[i].y2 == lb.rooms[i].y2, "Same seed, same rooms");
    }
    for (size_t i = 0; i < ea.size() && i < eb.size(); ++i) {
        expect(ea.at(i).pos == eb.at(i).pos && ea.at(i).name == eb.at(i).name, "Same seed, same entities");
    }
}

void test_damage_formula() {
    const GameConfig cfg;
    Entity attacker = makePlayer(cfg, {1, 1}); // power 5, defense 2
    Entity target = makeOrc(cfg, {2, 1});
    target.fighter->defense = 2;

    EntityRegistry ents(attacker);
    const size_t t = ents.add(target);

    EventLog log;
    const AttackOutcome out = attack(ents, EntityRegistry::playerIndex(), t, log);

    expect(out.result == AttackResult::Hit, "power 5 vs defense 2 should hit");
    expect(out.damage == 3, "damage = power - defense");
    expect(ents.at(t).fighter->hp == 7, "target hp drops by exactly 3");
    expect(log.contains(EventKind::Attack), "Attack event recorded");
    expect(!out.killed && ents.at(t).alive, "target survives");
}

void test_no_effect_attack() {
    const GameConfig cfg;
    Entity weak = makeOrc(cfg, {1, 1});
    weak.fighter->power = 2;
    Entity tank = makeTroll(cfg, {2, 1});
    tank.fighter->defense = 3;

    EntityRegistry ents(makePlayer(cfg, {5, 5}));
    const size_t a = ents.add(weak);
    const size_t t = ents.add(tank);

    EventLog log;
    const AttackOutcome out = attack(ents, a, t, log);
    expect(out.result == AttackResult::NoEffect, "power <= defense is a no-effect attack");
    expect(out.damage == 0, "no-effect attack deals no damage");
    expect(ents.at(t).fighter->hp == ents.at(t).fighter->maxHp, "no-effect attack leaves hp untouched");
    expect(log.contains(EventKind::NoEffect) && !log.contains(EventKind::Attack), "NoEffect event recorded");
}

void test_monster_death_transition_once() {
    const GameConfig cfg;
    Entity target = makeOrc(cfg, {2, 1});
    target.fighter->defense = 2;
    target.fighter->hp = 3;

    EntityRegistry ents(makePlayer(cfg, {1, 1}));
    const size_t t = ents.add(target);

    EventLog log;
    const AttackOutcome out = attack(ents, EntityRegistry::playerIndex(), t, log);
    const Entity& corpse = ents.at(t);

    expect(out.killed, "hp 3 and damage 3 kills");
    expect(!corpse.alive, "alive flips false");
    expect(!corpse.fighter.has_value() && !corpse.ai.has_value(), "death strips Fighter and AI");
    expect(!corpse.blocks, "remains do not block");
    expect(corpse.name == "remains of orc", "remains are renamed");
    expect(corpse.glyph == '%', "remains use the corpse glyph");
    expect(countEvents(log.events(), EventKind::Died) == 1, "one Died event");

    EventLog again;
    const AttackOutcome second = attack(ents, EntityRegistry::playerIndex(), t, again);
    expect(second.result == AttackResult::Ignored, "attacking remains does nothing");
    expect(ents.at(t).name == "remains of orc", "death transition does not run twice");
    expect(again.empty(), "no events for attacking remains");

    // Direct damage on an already-dead entity is ignored as well.
    EventLog direct;
    expect(!takeDamage(ents.at(t), 5, direct), "takeDamage on remains kills nothing");
    expect(direct.empty(), "takeDamage on remains emits nothing");
}

void test_hp_stays_in_bounds() {
    const GameConfig cfg;
    Entity e = makeTroll(cfg, {1, 1});
    EventLog log;

    expect(takeDamage(e, 100, log), "overkill damage kills");
    expect(!e.fighter.has_value(), "monster fighter stripped on death");

    Entity p = makePlayer(cfg);
    expect(takeDamage(p, 100, log), "overkill damage kills the player");
    expect(p.fighter.has_value() && p.fighter->hp == 0, "player hp floors at 0 and keeps its Fighter");
    expect(log.contains(EventKind::PlayerDied), "PlayerDied event recorded");

    Fighter f{30, 28, 0, 0, DeathKind::Player};
    expect(heal(f, 4) == 2, "heal reports the hp actually gained");
    expect(f.hp == 30, "heal caps at maxHp");
    expect(heal(f, 4) == 0 && f.hp == 30, "healing at full hp changes nothing");
}

void test_mut_two_rejects_same_index() {
    const GameConfig cfg;
    EntityRegistry ents(makePlayer(cfg));
    const size_t o = ents.add(makeOrc(cfg, {3, 3}));

    expect(throwsAs<std::logic_error>([&] { ents.mutTwo(o, o); }), "mutTwo(i, i) must throw");
    expect(throwsAs<std::logic_error>([&] {
        EventLog log;
        attack(ents, o, o, log);
    }), "self-attack must throw");
    expect(throwsAs<std::out_of_range>([&] { ents.mutTwo(0, 42); }), "mutTwo with a bad index must throw");

    auto [a, b] = ents.mutTwo(o, EntityRegistry::playerIndex());
    expect(a.name == "orc" && b.name == "player", "mutTwo returns entities in argument order");
}

void test_swap_remove() {
    const GameConfig cfg;
    EntityRegistry ents(makePlayer(cfg));
    ents.add(makeHealingPotion({1, 1}));
    ents.add(makeOrc(cfg, {2, 2}));
    ents.add(makeTroll(cfg, {3, 3}));

    const Entity removed = ents.swapRemove(1);
    expect(removed.item.has_value(), "swapRemove returns the removed entity");
    expect(ents.size() == 3, "swapRemove shrinks the registry");
    expect(ents.at(1).name == "troll", "last entity moves into the freed slot");
    expect(ents.at(2).name == "orc", "other entities keep their slots");

    const Entity last = ents.swapRemove(2);
    expect(last.name == "orc" && ents.size() == 2, "removing the last slot just pops it");

    expect(throwsAs<std::logic_error>([&] { ents.swapRemove(EntityRegistry::playerIndex()); }),
           "the player cannot be removed");
}

void test_fov_walls_block_and_explored_latches() {
    TileMap m(10, 5);
    for (int x = 1; x <= 8; ++x) {
        if (x != 5) m.carve(x, 2);
    }

    VisibilityTracker fov;
    fov.setup(m);
    expect(fov.isTransparent(4, 2) && !fov.isTransparent(5, 2), "setup() captures transparency");
    expect(fov.isWalkable(4, 2) && !fov.isWalkable(5, 2), "setup() captures walkability");

    fov.recompute(1, 2, 10);
    expect(fov.isVisible(1, 2), "observer tile is visible");
    expect(fov.isVisible(4, 2), "open hallway tile is visible");
    expect(fov.isVisible(5, 2), "blocking wall itself is lit");
    expect(!fov.isVisible(6, 2), "tile behind a wall is hidden");
    expect(fov.isExplored(4, 2) && m.isExplored(4, 2), "visible tiles become explored");
    expect(!fov.isExplored(7, 2), "hidden tiles stay unexplored");

    fov.recompute(1, 2, 1);
    expect(!fov.isVisible(4, 2), "smaller radius hides far tiles");
    expect(fov.isExplored(4, 2), "explored never resets");

    expect(throwsAs<std::out_of_range>([&] { (void)fov.isVisible(10, 2); }), "FOV query out of bounds must throw");
}

void test_ai_steps_diagonally_toward_player() {
    const GameConfig cfg;
    TileMap m = openRoom(10, 10);
    EntityRegistry ents(makePlayer(cfg, {2, 2}));
    const size_t o = ents.add(makeOrc(cfg, {4, 4}));

    VisibilityTracker fov;
    fov.setup(m);
    fov.recompute(2, 2, cfg.fovRadius);

    expect(ents.at(o).distanceTo(ents.player()) > 2.8f && ents.at(o).distanceTo(ents.player()) < 2.9f,
           "orc starts ~2.83 tiles away");

    EventLog log;
    aiTakeTurn(o, m, ents, fov, log);
    expect(ents.at(o).pos == Vec2i{3, 3}, "orc takes exactly one diagonal step");
    expect(ents.player().fighter->hp == cfg.player.hp, "no attack from range 2.83");
    expect(log.empty(), "approaching emits no events");
}

void test_ai_attacks_in_melee_range() {
    const GameConfig cfg;
    TileMap m = openRoom(10, 10);
    EntityRegistry ents(makePlayer(cfg, {2, 2}));
    const size_t o = ents.add(makeOrc(cfg, {3, 3}));

    VisibilityTracker fov;
    fov.setup(m);
    fov.recompute(2, 2, cfg.fovRadius);

    EventLog log;
    aiTakeTurn(o, m, ents, fov, log);
    expect(ents.at(o).pos == Vec2i{3, 3}, "orc in melee range does not move");
    expect(ents.player().fighter->hp == cfg.player.hp - (cfg.orc.power - cfg.player.defense), "orc hits the player");
    expect(log.contains(EventKind::Attack), "melee emits an Attack event");
}

void test_ai_sleeps_outside_fov_and_respects_blocking() {
    const GameConfig cfg;

    // Orc behind a wall: never wakes.
    {
        TileMap m = openRoom(12, 6);
        for (int y = 1; y < 5; ++y) {
            m.at(6, y).blocked = true;
            m.at(6, y).blocksSight = true;
        }
        EntityRegistry ents(makePlayer(cfg, {2, 3}));
        const size_t o = ents.add(makeOrc(cfg, {9, 3}));

        VisibilityTracker fov;
        fov.setup(m);
        fov.recompute(2, 3, cfg.fovRadius);
        expect(!fov.isVisible(9, 3), "orc behind the wall is out of view");

        EventLog log;
        aiTakeTurn(o, m, ents, fov, log);
        expect(ents.at(o).pos == Vec2i{9, 3}, "unseen monsters stay asleep");
    }

    // Step target held by another blocking entity: stay put.
    {
        TileMap m = openRoom(10, 6);
        EntityRegistry ents(makePlayer(cfg, {2, 2}));
        ents.add(makeTroll(cfg, {3, 2}));
        const size_t o = ents.add(makeOrc(cfg, {4, 2}));

        VisibilityTracker fov;
        fov.setup(m);
        fov.recompute(2, 2, cfg.fovRadius);

        EventLog log;
        aiTakeTurn(o, m, ents, fov, log);
        expect(ents.at(o).pos == Vec2i{4, 2}, "blocked monsters do not path around");
    }

    // Step target is a wall: stay put.
    {
        TileMap m = openRoom(10, 6);
        EntityRegistry ents(makePlayer(cfg, {1, 4}));
        const size_t o = ents.add(makeOrc(cfg, {1, 1}));
        m.at(1, 2).blocked = true;

        VisibilityTracker fov;
        fov.setup(m);
        fov.recompute(1, 4, cfg.fovRadius);

        EventLog log;
        expect(fov.isVisible(1, 1), "orc visible over a see-through obstacle");
        aiTakeTurn(o, m, ents, fov, log);
        expect(ents.at(o).pos == Vec2i{1, 1}, "monsters do not walk into blocked tiles");
    }
}

void test_scheduler_turn_classification() {
    const GameConfig cfg;
    Game game(cfg);

    EntityRegistry ents(makePlayer(cfg, {1, 5}));
    ents.add(makeOrc(cfg, {4, 5}));
    game.startWithLevel(openRoom(12, 12), std::move(ents));

    auto orcPos = [&] { return game.entities().at(1).pos; };

    TickResult r = game.handleIntent(PlayerIntent::toggleDisplay());
    expect(r.action == PlayerAction::DidNotTakeTurn, "toggling the display spends no turn");
    expect(orcPos() == Vec2i{4, 5}, "no AI on a free action");

    r = game.handleIntent(PlayerIntent::openInventory());
    expect(r.action == PlayerAction::DidNotTakeTurn, "opening the inventory spends no turn");
    expect(countEvents(r.events, EventKind::InventoryOpened) == 1, "inventory event reported");

    expect(orcPos() == Vec2i{4, 5}, "no AI after free actions");
    expect(game.turns() == 0, "no turns spent yet");

    r = game.handleIntent(PlayerIntent::move(1, 0));
    expect(r.action == PlayerAction::TookTurn, "moving spends a turn");
    expect(game.player().pos == Vec2i{2, 5}, "player moved");
    expect(orcPos() == Vec2i{3, 5}, "orc approached after the player's turn");
    expect(game.turns() == 1, "one turn spent");

    r = game.handleIntent(PlayerIntent::move(1, 0));
    expect(r.action == PlayerAction::TookTurn, "bump-attacking spends a turn");
    expect(game.player().pos == Vec2i{2, 5}, "attacking does not move the player");
    expect(game.entities().at(1).fighter->hp == cfg.orc.hp - cfg.player.power, "player hit the orc");
    expect(game.player().fighter->hp == cfg.player.hp - (cfg.orc.power - cfg.player.defense), "orc hit back");
    expect(countEvents(r.events, EventKind::Attack) == 2, "two attacks this tick");

    r = game.handleIntent(PlayerIntent::move(1, 0));
    expect(countEvents(r.events, EventKind::Died) == 1, "second hit kills the orc");
    expect(game.entities().at(1).name == "remains of orc", "orc became remains");

    r = game.handleIntent(PlayerIntent::move(1, 0));
    expect(r.action == PlayerAction::TookTurn, "walking onto remains spends a turn");
    expect(game.player().pos == Vec2i{3, 5}, "remains do not block movement");

    r = game.handleIntent(PlayerIntent::quit());
    expect(r.action == PlayerAction::Exit && game.isFinished(), "quit exits");
    r = game.handleIntent(PlayerIntent::move(1, 0));
    expect(r.action == PlayerAction::Exit, "nothing runs after exit");
    expect(game.player().pos == Vec2i{3, 5}, "no movement after exit");
}

void test_bumping_spends_a_turn() {
    const GameConfig cfg;
    Game game(cfg);

    EntityRegistry ents(makePlayer(cfg, {1, 5}));
    const size_t orc = ents.add(makeOrc(cfg, {5, 5}));
    Entity crate = makeHealingPotion({1, 4});
    crate.blocks = true;
    ents.add(crate);
    game.startWithLevel(openRoom(12, 12), std::move(ents));

    TickResult r = game.handleIntent(PlayerIntent::move(-1, 0));
    expect(r.action == PlayerAction::TookTurn, "bumping a wall spends the turn");
    expect(countEvents(r.events, EventKind::Bumped) == 1, "wall bump is reported");
    expect(game.player().pos == Vec2i{1, 5}, "bumping does not move the player");
    expect(game.entities().at(orc).pos == Vec2i{4, 5}, "monsters act after a bump");
    expect(game.turns() == 1, "bump counted as a turn");

    r = game.handleIntent(PlayerIntent::move(0, -1));
    expect(r.action == PlayerAction::TookTurn, "bumping a blocking non-fighter spends the turn");
    expect(countEvents(r.events, EventKind::Bumped) == 1, "blocker bump is reported");
    expect(game.player().pos == Vec2i{1, 5}, "blocker holds its tile");
    expect(game.entities().at(orc).pos == Vec2i{3, 5}, "monsters act after a blocker bump");
}

void test_move_longer_than_one_step_throws() {
    const GameConfig cfg;
    Game game(cfg);

    TileMap m = openRoom(12, 5);
    for (int y = 1; y < 4; ++y) m.at(4, y) = Tile::wall();
    game.startWithLevel(std::move(m), EntityRegistry(makePlayer(cfg, {2, 2})));

    expect(throwsAs<std::invalid_argument>([&] { game.handleIntent(PlayerIntent::move(4, 0)); }),
           "a multi-tile move must throw");
    expect(throwsAs<std::invalid_argument>([&] { game.handleIntent(PlayerIntent::move(0, -2)); }),
           "a vertical multi-tile move must throw");
    expect(game.player().pos == Vec2i{2, 2}, "rejected move leaves the player in place");
    expect(game.turns() == 0, "rejected move spends no turn");

    const TickResult r = game.handleIntent(PlayerIntent::move(1, 1));
    expect(r.action == PlayerAction::TookTurn && game.player().pos == Vec2i{3, 3}, "single diagonal step is fine");
}

void test_dead_player_cannot_act() {
    const GameConfig cfg;
    Game game(cfg);

    Entity p = makePlayer(cfg, {2, 2});
    p.fighter->hp = 1;
    EntityRegistry ents(p);
    ents.add(makeOrc(cfg, {3, 2}));
    game.startWithLevel(openRoom(8, 8), std::move(ents));

    TickResult r = game.handleIntent(PlayerIntent::wait());
    expect(r.action == PlayerAction::TookTurn, "waiting spends a turn");
    expect(!game.isPlayerAlive(), "orc killed the player");
    expect(countEvents(r.events, EventKind::PlayerDied) == 1, "player death reported once");
    expect(game.player().glyph == '%', "player remains glyph");

    r = game.handleIntent(PlayerIntent::move(0, 1));
    expect(r.action == PlayerAction::DidNotTakeTurn, "a dead player cannot move");
    expect(game.player().pos == Vec2i{2, 2}, "dead player stays put");
    expect(r.events.empty(), "no monster acts for a dead player");
    expect(game.player().fighter->hp == 0, "hp never drops below zero");
}

void test_pickup_until_inventory_full() {
    const GameConfig cfg;
    Game game(cfg);

    EntityRegistry ents(makePlayer(cfg, {3, 3}));
    for (int i = 0; i < 27; ++i) ents.add(makeHealingPotion({3, 3}));
    game.startWithLevel(openRoom(8, 8), std::move(ents));

    for (int i = 0; i < 26; ++i) {
        const TickResult r = game.handleIntent(PlayerIntent::pickUp());
        expect(r.action == PlayerAction::DidNotTakeTurn, "picking up spends no turn");
        expect(countEvents(r.events, EventKind::PickedUp) == 1, "pick-up reported");
    }
    expect(game.inventory().size() == 26, "inventory holds 26 items");
    expect(game.entities().size() == 2, "picked-up items leave the registry");

    const TickResult full = game.handleIntent(PlayerIntent::pickUp());
    expect(full.action == PlayerAction::DidNotTakeTurn, "full inventory pick-up spends no turn");
    expect(countEvents(full.events, EventKind::InventoryFull) == 1, "inventory full is reported");
    expect(game.inventory().size() == 26, "inventory does not grow past capacity");
    expect(game.entities().size() == 2 && game.entities().at(1).item.has_value(), "source item stays in the registry");

    const Menu menu = game.inventoryMenu();
    expect(menu.entries.size() == 26 && menu.entries.back().key == 'z', "inventory menu uses a..z");

    // Step off; nothing to pick up there.
    game.handleIntent(PlayerIntent::move(1, 0));
    const TickResult none = game.handleIntent(PlayerIntent::pickUp());
    expect(countEvents(none.events, EventKind::NothingToPickUp) == 1, "empty tile pick-up is reported");
}

void test_use_healing_potion() {
    const GameConfig cfg;
    Game game(cfg);

    Entity p = makePlayer(cfg, {3, 3});
    p.fighter->hp = 25;
    EntityRegistry ents(p);
    ents.add(makeHealingPotion({3, 3}));
    ents.add(makeHealingPotion({3, 3}));
    game.startWithLevel(openRoom(8, 8), std::move(ents));

    game.handleIntent(PlayerIntent::pickUp());
    game.handleIntent(PlayerIntent::pickUp());
    expect(game.inventory().size() == 2, "two potions picked up");

    TickResult r = game.handleIntent(PlayerIntent::useItem(0));
    expect(r.action == PlayerAction::TookTurn, "drinking a potion spends a turn");
    expect(game.player().fighter->hp == 25 + cfg.healAmount, "potion heals healAmount");
    expect(game.inventory().size() == 1, "used potion is consumed");

    r = game.handleIntent(PlayerIntent::useItem(0));
    expect(game.player().fighter->hp == cfg.player.hp, "healing caps at max hp");
    expect(game.inventory().empty(), "second potion consumed");

    r = game.handleIntent(PlayerIntent::useItem(0));
    expect(r.action == PlayerAction::DidNotTakeTurn, "empty slot spends no turn");
    expect(countEvents(r.events, EventKind::EmptySlot) == 1, "empty slot reported");
}

void test_potion_at_full_health_is_kept() {
    const GameConfig cfg;
    Game game(cfg);

    EntityRegistry ents(makePlayer(cfg, {3, 3}));
    ents.add(makeHealingPotion({3, 3}));
    game.startWithLevel(openRoom(8, 8), std::move(ents));

    game.handleIntent(PlayerIntent::pickUp());
    const TickResult r = game.handleIntent(PlayerIntent::useItem(0));
    expect(r.action == PlayerAction::DidNotTakeTurn, "cancelled use spends no turn");
    expect(countEvents(r.events, EventKind::ItemCancelled) == 1, "cancelled use reported");
    expect(game.inventory().size() == 1, "potion kept when already at full health");
}

void test_explored_is_monotonic_during_play() {
    Game game(GameConfig{});
    game.newGame(7u);

    const TileMap& m = game.map();
    std::vector<uint8_t> seen(static_cast<size_t>(m.width() * m.height()), 0);
    auto snapshot = [&] {
        bool ok = true;
        for (int y = 0; y < m.height(); ++y) {
            for (int x = 0; x < m.width(); ++x) {
                const size_t i = static_cast<size_t>(y * m.width() + x);
                if (seen[i] && !game.fov().isExplored(x, y)) ok = false;
                if (game.fov().isExplored(x, y)) seen[i] = 1;
            }
        }
        return ok;
    };

    expect(snapshot(), "initial snapshot");
    expect(game.fov().isVisible(game.player().pos.x, game.player().pos.y), "player tile is in view after newGame");

    RNG rng(11u);
    const int dirs[8][2] = {{1,0},{-1,0},{0,1},{0,-1},{1,1},{1,-1},{-1,1},{-1,-1}};
    for (int i = 0; i < 60; ++i) {
        const auto& d = dirs[rng.range(0, 7)];
        game.handleIntent(PlayerIntent::move(d[0], d[1]));
        expect(snapshot(), "explored tile became unexplored at step " + std::to_string(i));
    }
}

void test_visible_entities_draw_order() {
    const GameConfig cfg;
    Game game(cfg);

    EntityRegistry ents(makePlayer(cfg, {2, 2}));
    ents.add(makeOrc(cfg, {4, 2}));
    ents.add(makeHealingPotion({3, 3}));
    game.startWithLevel(openRoom(8, 8), std::move(ents));

    const std::vector<size_t> order = game.visibleEntities();
    expect(order.size() == 3, "all three entities are in view");
    if (order.size() == 3) {
        expect(order[0] == 2, "non-blocking items draw first");
        expect(order[1] == 0 && order[2] == 1, "blocking entities keep registry order");
    }
}

void test_event_and_action_names() {
    expect(std::string(eventKindName(EventKind::Bumped)) == "bumped", "Bumped name");
    expect(std::string(eventKindName(EventKind::InventoryOpened)) == "inventory_opened", "InventoryOpened name");
    expect(std::string(eventKindName(EventKind::PlayerDied)) == "player_died", "PlayerDied name");
    expect(std::string(playerActionName(PlayerAction::TookTurn)) == "took_turn", "TookTurn name");
    expect(std::string(playerActionName(PlayerAction::DidNotTakeTurn)) == "did_not_take_turn", "DidNotTakeTurn name");
    expect(std::string(playerActionName(PlayerAction::Exit)) == "exit", "Exit name");

    Game game(GameConfig{});
    game.newGame(4242u);
    expect(game.seed() == 4242u, "session remembers its seed");
}

void test_font_glyphs_and_wrap() {
    for (char c : std::string("@%!oT")) {
        expect(hasGlyph(c), std::string("entity glyph has a bitmap: ") + c);
    }
    for (char c : std::string("ATTACKS FOR 3 HIT POINTS. HP: 30/30 (a)")) {
        expect(hasGlyph(c), std::string("message character has a bitmap: ") + c);
    }
    expect(!hasGlyph('~'), "unmapped characters report no bitmap");

    const Glyph5x7 lower = glyph5x7('o');
    const Glyph5x7 upper = glyph5x7('O');
    const Glyph5x7 unknown = glyph5x7('~');
    const Glyph5x7 question = glyph5x7('?');
    bool sameCase = true;
    bool sameFallback = true;
    for (int i = 0; i < kGlyphH; ++i) {
        sameCase = sameCase && lower.rows[i] == upper.rows[i];
        sameFallback = sameFallback && unknown.rows[i] == question.rows[i];
    }
    expect(sameCase, "letters render upper-case");
    expect(sameFallback, "unknown characters render as '?'");

    const std::vector<std::string> lines = wrapText("ORC ATTACKS PLAYER FOR 3 HIT POINTS.", 12);
    expect(lines.size() == 3, "message wraps into three lines");
    if (lines.size() == 3) {
        expect(lines[0] == "ORC ATTACKS", "first wrapped line");
        expect(lines[1] == "PLAYER FOR 3", "second wrapped line");
        expect(lines[2] == "HIT POINTS.", "third wrapped line");
    }
    for (const auto& l : lines) expect(l.size() <= 12, "wrapped lines respect the width");

    const std::vector<std::string> split = wrapText("ABCDEFGHIJ", 4);
    expect(split.size() == 3 && split[0] == "ABCD" && split[2] == "IJ", "long words are split");
    expect(wrapText("A\nB", 10).size() == 2, "newline forces a break");
    expect(wrapText("", 10).empty(), "empty text yields no lines");
}

void test_menu_limits() {
    std::vector<std::string> opts(26, "potion");
    const Menu m = buildMenu("Inventory", opts);
    expect(m.entries.front().key == 'a' && m.entries.back().key == 'z', "menu keys run a..z");
    expect(menuSelection(m, 'c') == std::optional<size_t>(2), "letter selects its slot");
    expect(menuSelection(m, 'C') == std::optional<size_t>(2), "selection ignores case");
    expect(!menuSelection(m, '1').has_value(), "non-letters select nothing");

    const Menu small = buildMenu("Inventory", {"a", "b", "c"});
    expect(!menuSelection(small, 'z').has_value(), "letters past the last entry select nothing");

    opts.push_back("one too many");
    expect(throwsAs<std::length_error>([&] { buildMenu("Inventory", opts); }), "27 options must throw");
}

void test_ini_line_parsing() {
    const auto kv = parseIniLine("  Bind_Up = k, kp_8   # vi keys");
    expect(kv.has_value(), "key/value line parses");
    if (kv) {
        expect(kv->first == "bind_up", "keys are trimmed and lower-cased");
        expect(kv->second == "k, kp_8", "values are trimmed and comments stripped");
    }
    expect(!parseIniLine("; just a comment").has_value(), "comment lines yield nothing");
    expect(!parseIniLine("no equals sign").has_value(), "lines without '=' yield nothing");
    expect(!parseIniLine("   = 3").has_value(), "empty keys yield nothing");

    const std::vector<std::string> parts = splitOn("ctrl+q", '+');
    expect(parts.size() == 2 && parts[0] == "ctrl" && parts[1] == "q", "splitOn splits on the delimiter");
}

void test_settings_load_and_clamp() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "dragonslayer_settings_test.ini";

    {
        std::ofstream out(path);
        out << "# comment line\n";
        out << "map_width = 100\n";
        out << "MAX_ROOMS=5\n";
        out << "room_min_size = 2 ; too small\n";
        out << "player_power = 7\n";
        out << "troll_hp = 20\n";
        out << "fov_radius = banana\n";
        out << "vsync = off\n";
        out << "orc_chance_pct = 50\n";
        out << "this line has no equals sign\n";
    }

    const Settings s = loadSettings(path.string());
    expect(s.game.mapWidth == 100, "map_width parsed");
    expect(s.game.maxRooms == 5, "keys are case-insensitive");
    expect(s.game.roomMinSize == 3, "room_min_size clamped to 3");
    expect(s.game.player.power == 7, "player_power parsed");
    expect(s.game.troll.hp == 20, "troll_hp parsed");
    expect(s.game.fovRadius == 10, "malformed values keep defaults");
    expect(!s.vsync, "bool parsed");
    expect(s.game.orcChance > 0.49f && s.game.orcChance < 0.51f, "orc chance percentage parsed");

    std::error_code ec;
    fs::remove(path, ec);

    const Settings missing = loadSettings((fs::temp_directory_path() / "dragonslayer_missing_settings.ini").string());
    expect(missing.game.mapWidth == 80 && missing.game.maxRooms == 30, "missing file yields defaults");

    const fs::path defaults = fs::temp_directory_path() / "dragonslayer_defaults_test.ini";
    expect(writeDefaultSettings(defaults.string()), "default settings written");
    const Settings round = loadSettings(defaults.string());
    expect(round.game.mapHeight == 45 && round.game.roomMaxSize == 10 && round.game.player.hp == 30,
           "default file loads back to defaults");
    fs::remove(defaults, ec);
}

} // namespace

int main() {
    std::cout << "Running Dragonslayer tests...\n";

    test_rng_reproducible();
    test_tile_map_bounds();
    test_carve_keeps_explored_latch();
    test_room_intersection_is_inclusive();
    test_generated_rooms_disjoint();
    test_generated_rooms_connected();
    test_spawns_on_open_unoccupied_tiles();
    test_zero_rooms_yields_empty_level();
    test_rooms_without_interior_are_rejected();
    test_generation_reproducible();

    test_damage_formula();
    test_no_effect_attack();
    test_monster_death_transition_once();
    test_hp_stays_in_bounds();
    test_mut_two_rejects_same_index();
    test_swap_remove();

    test_fov_walls_block_and_explored_latches();
    test_ai_steps_diagonally_toward_player();
    test_ai_attacks_in_melee_range();
    test_ai_sleeps_outside_fov_and_respects_blocking();

    test_scheduler_turn_classification();
    test_bumping_spends_a_turn();
    test_move_longer_than_one_step_throws();
    test_dead_player_cannot_act();
    test_pickup_until_inventory_full();
    test_use_healing_potion();
    test_potion_at_full_health_is_kept();
    test_explored_is_monotonic_during_play();
    test_visible_entities_draw_order();

    test_event_and_action_names();
    test_font_glyphs_and_wrap();
    test_menu_limits();
    test_ini_line_parsing();
    test_settings_load_and_clamp();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
