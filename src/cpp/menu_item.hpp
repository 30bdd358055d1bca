#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

// Description of a menu entry as loaded from configuration. The engine turns
// a tree of these into a NodeTree when the menu is shown.
struct MenuItem {
    std::string label;
    std::string description;
    std::string command;
    std::vector<MenuItem> submenu;

    std::optional<std::string> icon;       // Icon name or path to an image file
    std::optional<std::string> menu_ref;   // Name of a shared menu in the MenuLibrary

    MenuItem() = default;

    // Constructor for leaf items (execute command)
    MenuItem(const std::string& label,
             const std::string& command,
             const std::string& description = "")
        : label(label)
        , description(description)
        , command(command)
    {}

    // Constructor for submenu items (open nested ring)
    MenuItem(const std::string& label,
             const std::vector<MenuItem>& submenu,
             const std::string& description = "")
        : label(label)
        , description(description)
        , submenu(submenu)
    {}

    bool has_submenu() const {
        return !submenu.empty() || has_menu_ref();
    }

    bool has_menu_ref() const {
        return menu_ref.has_value() && !menu_ref->empty();
    }

    bool is_valid() const {
        return !label.empty();
    }

    bool has_icon() const {
        return icon.has_value() && !icon->empty();
    }
};

// Named menus that items may reference with `menu: <name>`
using MenuLibrary = std::map<std::string, std::vector<MenuItem>>;
