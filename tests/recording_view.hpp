#pragma once

#include <string>
#include <vector>
#include "menu_item.hpp"
#include "view_adapter.hpp"

// ViewAdapter that remembers everything the engine sent it
class RecordingView : public ViewAdapter {
public:
    int build_count = 0;
    int teardown_count = 0;
    int frame_count = 0;
    std::size_t built_size = 0;
    std::vector<NodeId> selected;
    std::vector<NodeVisual> visuals;
    std::vector<Transform> transforms;

    void build_nodes(const NodeTree& tree) override {
        ++build_count;
        built_size = tree.size();
        visuals.assign(tree.size(), NodeVisual());
        transforms.assign(tree.size(), Transform());
    }

    void update_node(NodeId id, const NodeVisual& visual, const Transform& transform) override {
        visuals.at(id) = visual;
        transforms.at(id) = transform;
    }

    void frame_finished() override {
        ++frame_count;
    }

    void node_selected(NodeId id) override {
        selected.push_back(id);
    }

    void teardown() override {
        ++teardown_count;
        visuals.clear();
        transforms.clear();
    }
};

// Menu with counts[level] items on each level, labelled "Item <level>.<i>"
inline std::vector<MenuItem> make_items(const std::vector<std::size_t>& counts, std::size_t level = 0) {
    std::vector<MenuItem> items;
    if (level >= counts.size()) {
        return items;
    }
    for (std::size_t i = 0; i < counts[level]; ++i) {
        MenuItem item;
        item.label = "Item " + std::to_string(level) + "." + std::to_string(i);
        item.command = "true";
        item.submenu = make_items(counts, level + 1);
        items.push_back(item);
    }
    return items;
}

inline MenuItem make_menu(const std::vector<std::size_t>& counts) {
    return MenuItem("Root", make_items(counts));
}
