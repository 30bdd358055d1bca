#include "color_theme.hpp"
#include "debug.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <sstream>

Color Color::from_hex(const std::string& hex) {
    Color c;

    std::string h = hex;
    if (!h.empty() && h[0] == '#') {
        h = h.substr(1);
    }

    if (h.length() != 6 && h.length() != 8) {
        return c;
    }
    if (!std::all_of(h.begin(), h.end(), [](unsigned char ch) { return std::isxdigit(ch); })) {
        return c;
    }

    auto channel = [&h](std::size_t offset) {
        unsigned int value = 0;
        std::stringstream ss;
        ss << std::hex << h.substr(offset, 2);
        ss >> value;
        return value / 255.0;
    };

    c.r = channel(0);
    c.g = channel(2);
    c.b = channel(4);
    c.a = h.length() == 8 ? channel(6) : 1.0;
    return c;
}

Theme Theme::from_yaml(const YAML::Node& node) {
    Theme theme;

    auto read_color = [&node](const char* key, Color& target) {
        if (!node[key]) {
            return;
        }
        Color parsed = Color::from_hex(node[key].as<std::string>());
        if (parsed.is_set()) {
            target = parsed;
        } else {
            WARN_LOG("Ignoring invalid color '" << node[key].as<std::string>()
                     << "' for " << key);
        }
    };

    read_color("active-color", theme.active_color);
    read_color("parent-color", theme.parent_color);
    read_color("child-color", theme.child_color);
    read_color("grandchild-color", theme.grandchild_color);
    read_color("hover-color", theme.hover_color);
    read_color("drag-color", theme.drag_color);
    read_color("border-color", theme.border_color);
    read_color("font-color", theme.font_color);

    if (node["font-size"]) {
        theme.font_size = std::clamp(node["font-size"].as<int>(), 6, 48);
    }

    return theme;
}
