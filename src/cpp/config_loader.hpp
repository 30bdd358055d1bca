#pragma once

#include <string>
#include <vector>
#include "color_theme.hpp"
#include "engine_config.hpp"
#include "menu_item.hpp"

// Forward declaration for YAML
namespace YAML {
    class Node;
}

// Limits applied while reading YAML
namespace SecurityLimits {
    constexpr size_t MAX_CONFIG_FILE_SIZE = 1024 * 1024;  // 1MB
    constexpr int MAX_YAML_DEPTH = 10;                      // Maximum nesting depth
    constexpr size_t MAX_MENU_ITEMS = 50;                   // Maximum items per list
    constexpr size_t MAX_NAMED_MENUS = 50;                  // Maximum entries in `menus`
}

// Path validation utilities
class PathValidator {
public:
    // Allowed paths: ~/.config/spoke/ and the current working directory
    static bool is_config_path_allowed(const std::string& filepath);

    // Normalize a path (resolve . and ..)
    static std::string normalize_path(const std::string& path);

    // Replaces a "~" that starts a word ("~" or "~/...") with $HOME
    static std::string expand_home(const std::string& text);

private:
    static bool is_in_directory(const std::string& path, const std::string& directory);
    static std::string get_home_directory();
};

class MenuConfig {
public:
    EngineConfig engine;

    // Label and icon of the center item
    std::string root_label = "Root";
    std::string root_icon = "open_with";

    std::vector<MenuItem> items;
    MenuLibrary menus;

    Theme theme;

    // Load from a YAML file in an allowed location
    static MenuConfig from_yaml(const std::string& filepath);

    // Parse a YAML document held in memory
    static MenuConfig from_yaml_string(const std::string& yaml);

    // Format: "title:description:action;title2:desc2:act2;..."
    static MenuConfig from_command_line(const std::string& cli_string);

    // Generated test menu with engine.children_per_level items on each level
    static MenuConfig demo();

    // Item the engine shows at the center, with items as its children
    MenuItem root_item() const;

    bool validate() const;

private:
    static MenuConfig from_yaml_node(const YAML::Node& yaml_config);

    static void parse_engine(const YAML::Node& node, EngineConfig& engine);

    static std::vector<MenuItem> parse_item_list(const YAML::Node& node, int depth);

    static MenuItem parse_menu_item(const YAML::Node& node, int depth);

    static MenuItem parse_cli_item(const std::string& item_str);
};
