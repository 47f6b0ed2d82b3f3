#include "events.hpp"

const char* eventKindName(EventKind k) {
    switch (k) {
        case EventKind::Moved: return "moved";
        case EventKind::Bumped: return "bumped";
        case EventKind::Attack: return "attack";
        case EventKind::NoEffect: return "no_effect";
        case EventKind::Died: return "died";
        case EventKind::PlayerDied: return "player_died";
        case EventKind::PickedUp: return "picked_up";
        case EventKind::InventoryFull: return "inventory_full";
        case EventKind::NothingToPickUp: return "nothing_to_pick_up";
        case EventKind::ItemUsed: return "item_used";
        case EventKind::ItemCancelled: return "item_cancelled";
        case EventKind::EmptySlot: return "empty_slot";
        case EventKind::InventoryOpened: return "inventory_opened";
        case EventKind::DisplayToggled: return "display_toggled";
        case EventKind::Quit: return "quit";
        default: return "unknown";
    }
}
