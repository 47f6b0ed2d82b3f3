#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// A letter-keyed selection list ('a'..'z'), as used by the inventory screen.
struct MenuEntry {
    char key = 'a';
    std::string label;
};

struct Menu {
    std::string header;
    std::vector<MenuEntry> entries;
};

constexpr size_t kMaxMenuOptions = 26;

// Throws std::length_error for more options than there are letter keys.
Menu buildMenu(std::string header, const std::vector<std::string>& options);

// Maps a pressed key to an option index, if it names one of the entries.
std::optional<size_t> menuSelection(const Menu& menu, char key);
