#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Loot,
    System,
    Warning,
    Success,
};

enum class EventKind : uint8_t {
    Moved = 0,
    Bumped,          // movement rejected by a wall or a blocking non-fighter
    Attack,          // damage was dealt
    NoEffect,        // attack landed but power <= defense
    Died,            // a monster died and became remains
    PlayerDied,
    PickedUp,
    InventoryFull,
    NothingToPickUp,
    ItemUsed,
    ItemCancelled,
    EmptySlot,
    InventoryOpened,
    DisplayToggled,
    Quit,
};

struct GameEvent {
    EventKind kind = EventKind::Moved;
    MessageKind tone = MessageKind::Info;
    std::string text;
    // Registry index of the entity the event is about (npos when none).
    size_t subject = static_cast<size_t>(-1);
};

// Append-only sink for the outcomes of a single tick. The core never prints;
// collaborators decide how (and whether) to present each event.
class EventLog {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    void push(EventKind kind, MessageKind tone, std::string text, size_t subject = npos) {
        events_.push_back(GameEvent{kind, tone, std::move(text), subject});
    }

    const std::vector<GameEvent>& events() const { return events_; }
    std::vector<GameEvent> take() { return std::move(events_); }

    bool contains(EventKind kind) const {
        for (const auto& e : events_) {
            if (e.kind == kind) return true;
        }
        return false;
    }

    void clear() { events_.clear(); }
    bool empty() const { return events_.empty(); }

private:
    std::vector<GameEvent> events_;
};

const char* eventKindName(EventKind k);
