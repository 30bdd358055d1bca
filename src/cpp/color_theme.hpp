#pragma once

#include <string>

// Forward declaration for YAML
namespace YAML {
    class Node;
}

struct Color {
    double r, g, b, a;

    // Default: transparent black (unset state)
    Color() : r(0), g(0), b(0), a(0) {}

    // From RGB values (0-255)
    static Color from_rgb(int red, int green, int blue, int alpha = 255) {
        Color c;
        c.r = red / 255.0;
        c.g = green / 255.0;
        c.b = blue / 255.0;
        c.a = alpha / 255.0;
        return c;
    }

    // From hex string (#RRGGBB or #RRGGBBAA); unset on malformed input
    static Color from_hex(const std::string& hex);

    Color with_alpha(double alpha) const {
        Color c = *this;
        c.a = alpha;
        return c;
    }

    bool is_set() const { return a > 0.0; }
};

// Colors of the menu rings, one per node role
struct Theme {
    Color active_color;         // Active node disc
    Color parent_color;         // Nodes along the selection chain
    Color child_color;          // Ring around the active node
    Color grandchild_color;     // Small dots around children
    Color hover_color;          // Hovered node
    Color drag_color;           // Node being dragged
    Color border_color;         // Disc outlines and connectors
    Color font_color;           // Labels and fallback glyphs
    int font_size = 14;

    Theme()
        : font_size(14)
    {
        active_color = Color::from_rgb(38, 38, 38, 230);
        parent_color = Color::from_rgb(60, 60, 60, 200);
        child_color = Color::from_rgb(34, 34, 34, 217);
        grandchild_color = Color::from_rgb(200, 200, 200, 180);
        hover_color = Color::from_rgb(76, 128, 204, 230);
        drag_color = Color::from_rgb(230, 140, 50, 230);
        border_color = Color::from_rgb(230, 230, 230, 230);
        font_color = Color::from_rgb(255, 255, 255);
    }

    // Parse from YAML node; keys missing from the node keep their defaults
    static Theme from_yaml(const YAML::Node& node);
};
