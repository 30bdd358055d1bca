#include "config_loader.hpp"
#include "configuration_error.hpp"
#include "debug.hpp"
#include "node_tree.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>

// PathValidator implementation
std::string PathValidator::get_home_directory() {
    const char* home = std::getenv("HOME");
    return home ? home : "/";
}

std::string PathValidator::normalize_path(const std::string& path) {
    try {
        return std::filesystem::weakly_canonical(std::filesystem::path(path)).string();
    } catch (const std::filesystem::filesystem_error& e) {
        DEBUG_LOGLN << "Could not normalize '" << path << "': " << e.what();
        return path;
    }
}

std::string PathValidator::expand_home(const std::string& text) {
    const std::string home = get_home_directory();
    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        bool word_start = i == 0 || text[i - 1] == ' ' || text[i - 1] == '\t';
        bool word_end = i + 1 == text.size() || text[i + 1] == '/' ||
                        text[i + 1] == ' ' || text[i + 1] == '\t';
        if (text[i] == '~' && word_start && word_end) {
            result += home;
        } else {
            result += text[i];
        }
    }

    return result;
}

bool PathValidator::is_in_directory(const std::string& path, const std::string& directory) {
    std::string path_str = normalize_path(path);
    std::string dir_str = normalize_path(directory);

    // Ensure directory ends with separator for proper matching
    if (!dir_str.empty() && dir_str.back() != '/') {
        dir_str += '/';
    }

    return path_str.rfind(dir_str, 0) == 0;
}

bool PathValidator::is_config_path_allowed(const std::string& filepath) {
    std::string normalized = normalize_path(filepath);

    std::string config_dir = get_home_directory() + "/.config/spoke";
    if (is_in_directory(normalized, config_dir)) {
        return true;
    }

    std::error_code ec;
    std::string cwd = std::filesystem::current_path(ec).string();
    if (!ec && is_in_directory(normalized, cwd)) {
        return true;
    }

    ERROR_LOG("Config file path not allowed: " << filepath);
    ERROR_LOG("Config files must be in ~/.config/spoke/ or relative to current directory.");
    return false;
}

MenuConfig MenuConfig::from_yaml(const std::string& filepath) {
    MenuConfig config;

    if (!PathValidator::is_config_path_allowed(filepath)) {
        ERROR_LOG("Refusing to load config from disallowed path.");
        return config;
    }

    // Check file size before parsing
    try {
        std::filesystem::path file_path(filepath);
        if (!std::filesystem::exists(file_path)) {
            ERROR_LOG("Config file does not exist: " << filepath);
            return config;
        }

        auto file_size = std::filesystem::file_size(file_path);
        if (file_size > SecurityLimits::MAX_CONFIG_FILE_SIZE) {
            ERROR_LOG("Config file too large (" << file_size << " bytes), maximum is "
                      << SecurityLimits::MAX_CONFIG_FILE_SIZE << " bytes.");
            return config;
        }
    } catch (const std::filesystem::filesystem_error& e) {
        ERROR_LOG("Error accessing config file: " << e.what());
        return config;
    }

    try {
        return from_yaml_node(YAML::LoadFile(filepath));
    } catch (const YAML::Exception& e) {
        ERROR_LOG("Error loading YAML from " << filepath << ": " << e.what());
    }

    return config;
}

MenuConfig MenuConfig::from_yaml_string(const std::string& yaml) {
    try {
        return from_yaml_node(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        ERROR_LOG("Error parsing YAML: " << e.what());
    }

    return MenuConfig();
}

MenuConfig MenuConfig::from_yaml_node(const YAML::Node& yaml_config) {
    MenuConfig config;

    if (!yaml_config.IsMap()) {
        ERROR_LOG("Config root must be a mapping");
        return config;
    }

    parse_engine(yaml_config, config.engine);

    if (yaml_config["root"]) {
        const YAML::Node& root = yaml_config["root"];
        if (root["label"]) {
            config.root_label = root["label"].as<std::string>();
        }
        if (root["icon"]) {
            config.root_icon = root["icon"].as<std::string>();
        }
    }

    config.theme = Theme::from_yaml(yaml_config);

    if (yaml_config["items"]) {
        config.items = parse_item_list(yaml_config["items"], 0);
    }

    if (yaml_config["menus"]) {
        const YAML::Node& menus = yaml_config["menus"];
        if (!menus.IsMap()) {
            WARN_LOG("'menus' must map names to item lists, ignoring it");
        } else {
            for (const auto& entry : menus) {
                if (config.menus.size() >= SecurityLimits::MAX_NAMED_MENUS) {
                    WARN_LOG("Maximum named menus limit reached ("
                             << SecurityLimits::MAX_NAMED_MENUS << "). Skipping remaining menus.");
                    break;
                }
                std::string name = entry.first.as<std::string>();
                config.menus[name] = parse_item_list(entry.second, 1);
            }
        }
    }

    return config;
}

void MenuConfig::parse_engine(const YAML::Node& node, EngineConfig& engine) {
    if (node["center-radius"]) {
        engine.center_radius = std::clamp(node["center-radius"].as<double>(), 10.0, 200.0);
    }
    if (node["child-distance"]) {
        engine.child_distance = std::clamp(node["child-distance"].as<double>(), 30.0, 500.0);
    }
    if (node["grandchild-distance"]) {
        engine.grandchild_distance = std::clamp(node["grandchild-distance"].as<double>(), 5.0, 200.0);
    }
    if (node["drag-threshold"]) {
        engine.drag_threshold = std::clamp(node["drag-threshold"].as<double>(), 0.0, 100.0);
    }
    if (node["max-depth"]) {
        engine.max_depth = std::clamp(node["max-depth"].as<int>(), 1, SecurityLimits::MAX_YAML_DEPTH);
    }
    if (node["max-total-nodes"]) {
        engine.max_total_nodes = static_cast<std::size_t>(
            std::clamp(node["max-total-nodes"].as<int>(), 1, 5000));
    }

    if (node["children-per-level"]) {
        const YAML::Node& levels = node["children-per-level"];
        if (!levels.IsSequence() || levels.size() == 0) {
            WARN_LOG("'children-per-level' must be a non-empty list, keeping defaults");
        } else {
            engine.children_per_level.clear();
            for (const auto& level : levels) {
                int cap = std::clamp(level.as<int>(), 1, static_cast<int>(SecurityLimits::MAX_MENU_ITEMS));
                engine.children_per_level.push_back(static_cast<std::size_t>(cap));
            }
        }
    }
}

std::vector<MenuItem> MenuConfig::parse_item_list(const YAML::Node& node, int depth) {
    std::vector<MenuItem> items;

    if (!node.IsSequence()) {
        WARN_LOG("Expected a list of items, skipping");
        return items;
    }

    for (const auto& entry : node) {
        if (items.size() >= SecurityLimits::MAX_MENU_ITEMS) {
            WARN_LOG("Maximum menu items limit reached ("
                     << SecurityLimits::MAX_MENU_ITEMS << "). Skipping remaining items.");
            break;
        }

        MenuItem item = parse_menu_item(entry, depth);
        if (item.is_valid()) {
            items.push_back(item);
        }
    }

    return items;
}

MenuItem MenuConfig::parse_menu_item(const YAML::Node& node, int depth) {
    MenuItem item;

    if (depth >= SecurityLimits::MAX_YAML_DEPTH) {
        ERROR_LOG("Maximum submenu nesting depth reached (" << SecurityLimits::MAX_YAML_DEPTH << ").");
        return item;
    }

    if (!node.IsMap() || !node["label"]) {
        WARN_LOG("Item missing label, skipping");
        return item;
    }

    item.label = node["label"].as<std::string>();
    item.command = node["command"] ? node["command"].as<std::string>() : "";
    item.description = node["description"] ? node["description"].as<std::string>() : "";

    if (node["icon"]) {
        item.icon = node["icon"].as<std::string>();
    }

    if (node["menu"]) {
        item.menu_ref = node["menu"].as<std::string>();
        if (node["submenu"]) {
            WARN_LOG("Item '" << item.label << "' has both 'menu' and 'submenu', using 'menu'");
        }
    } else if (node["submenu"]) {
        item.submenu = parse_item_list(node["submenu"], depth + 1);
    }

    // Leaf item - must have command
    if (!item.has_submenu() && item.command.empty()) {
        WARN_LOG("Item '" << item.label << "' missing command, skipping");
        return MenuItem();
    }

    return item;
}

MenuConfig MenuConfig::from_command_line(const std::string& cli_string) {
    MenuConfig config;

    std::stringstream ss(cli_string);
    std::string item_str;

    while (std::getline(ss, item_str, ';')) {
        // Trim whitespace
        item_str.erase(0, item_str.find_first_not_of(" \t"));
        item_str.erase(item_str.find_last_not_of(" \t") + 1);

        if (!item_str.empty()) {
            MenuItem item = parse_cli_item(item_str);
            if (item.is_valid()) {
                config.items.push_back(item);
            }
        }
    }

    return config;
}

MenuItem MenuConfig::parse_cli_item(const std::string& item_str) {
    // "title:description:action", "title::action" or "title:action"
    std::string parts[3];
    size_t start = 0;
    int part_idx = 0;

    for (size_t i = 0; i < item_str.size() && part_idx < 2; ++i) {
        if (item_str[i] == ':' && (i == 0 || item_str[i - 1] != '\\')) {
            parts[part_idx++] = item_str.substr(start, i - start);
            start = i + 1;
        }
    }
    if (start < item_str.size()) {
        parts[part_idx] = item_str.substr(start);
    }

    std::string label = parts[0];
    std::string description = parts[1];
    std::string command = parts[2];

    if (command.empty() && !description.empty()) {
        command = description;
        description = "";
    }

    if (description.empty()) {
        description = label;
    }

    return MenuItem(label, command, description);
}

MenuConfig MenuConfig::demo() {
    static const char* TEST_ICONS[] = {
        "play_circle", "public", "arrow_circle_right", "terminal",
        "settings", "apps", "arrow_circle_left", "fullscreen",
    };
    constexpr size_t ICON_COUNT = sizeof(TEST_ICONS) / sizeof(TEST_ICONS[0]);

    MenuConfig config;
    const std::vector<size_t>& levels = config.engine.children_per_level;

    struct Builder {
        const std::vector<size_t>& levels;

        std::vector<MenuItem> children(size_t level) const {
            std::vector<MenuItem> result;
            if (level >= levels.size()) {
                return result;
            }
            for (size_t i = 0; i < levels[level]; ++i) {
                MenuItem item;
                item.label = "Item " + std::to_string(level) + "." + std::to_string(i);
                item.icon = TEST_ICONS[i % ICON_COUNT];
                item.submenu = children(level + 1);
                result.push_back(item);
            }
            return result;
        }
    };

    config.items = Builder{levels}.children(0);
    return config;
}

MenuItem MenuConfig::root_item() const {
    MenuItem root(root_label, items);
    root.icon = root_icon;
    return root;
}

bool MenuConfig::validate() const {
    if (engine.center_radius <= 0.0) {
        ERROR_LOG("Invalid center-radius: " << engine.center_radius);
        return false;
    }

    if (engine.child_distance <= engine.center_radius) {
        ERROR_LOG("child-distance (" << engine.child_distance
                  << ") must be larger than center-radius (" << engine.center_radius << ")");
        return false;
    }

    if (engine.grandchild_distance >= engine.child_distance) {
        ERROR_LOG("grandchild-distance must be smaller than child-distance");
        return false;
    }

    if (engine.children_per_level.empty() ||
        std::find(engine.children_per_level.begin(), engine.children_per_level.end(), 0u) !=
            engine.children_per_level.end()) {
        ERROR_LOG("children-per-level must list positive counts");
        return false;
    }

    if (items.empty()) {
        ERROR_LOG("No items configured");
        return false;
    }

    for (const auto& item : items) {
        if (!item.is_valid()) {
            ERROR_LOG("Invalid item found");
            return false;
        }
    }

    // Resolve menu references and limits now rather than when the menu opens
    try {
        NodeTree::build(root_item(), menus, engine);
    } catch (const ConfigurationError& e) {
        ERROR_LOG("Invalid menu structure: " << e.what());
        return false;
    }

    return true;
}
