#pragma once

#include <cstddef>
#include <vector>

// Fixed engine constants, set once when the engine is constructed
struct EngineConfig {
    // Hover inside this radius around the active node resolves to its parent
    double center_radius = 50.0;

    // Placement radii of child and grandchild rings
    double child_distance = 100.0;
    double grandchild_distance = 25.0;

    // Pointer travel after a press before a drag is confirmed
    double drag_threshold = 5.0;

    // Maximum children per level; deeper levels reuse the last entry
    std::vector<std::size_t> children_per_level = {8, 5, 5};

    // Hard limits on the built tree
    int max_depth = 10;
    std::size_t max_total_nodes = 500;

    std::size_t children_cap(int depth) const {
        if (children_per_level.empty()) {
            return 0;
        }
        std::size_t level = static_cast<std::size_t>(depth);
        if (level >= children_per_level.size()) {
            return children_per_level.back();
        }
        return children_per_level[level];
    }
};
