#include "menu.hpp"

#include <stdexcept>
#include <string>
#include <utility>

Menu buildMenu(std::string header, const std::vector<std::string>& options) {
    if (options.size() > kMaxMenuOptions) {
        throw std::length_error("cannot have a menu with more than 26 options (got " +
                                std::to_string(options.size()) + ")");
    }

    Menu m;
    m.header = std::move(header);
    m.entries.reserve(options.size());
    for (size_t i = 0; i < options.size(); ++i) {
        m.entries.push_back(MenuEntry{static_cast<char>('a' + i), options[i]});
    }
    return m;
}

std::optional<size_t> menuSelection(const Menu& menu, char key) {
    if (key >= 'A' && key <= 'Z') key = static_cast<char>(key - 'A' + 'a');
    if (key < 'a' || key > 'z') return std::nullopt;
    const size_t idx = static_cast<size_t>(key - 'a');
    if (idx >= menu.entries.size()) return std::nullopt;
    return idx;
}
