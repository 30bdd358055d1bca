#include "node_tree.hpp"
#include "configuration_error.hpp"
#include "debug.hpp"
#include <algorithm>
#include <sstream>

NodeTree NodeTree::build(const MenuItem& root_item,
                         const MenuLibrary& library,
                         const EngineConfig& config) {
    NodeTree tree;

    if (config.max_total_nodes == 0) {
        throw ConfigurationError("Menu node limit must be at least 1");
    }

    tree.add_node(root_item, std::nullopt, 0);

    std::vector<std::string> menu_path;
    tree.add_children(ROOT, root_item, library, config, menu_path);

    tree.assign_angles(ROOT);

    DEBUG_LOGLN << "Built menu tree '" << root_item.label << "' with "
                << tree.size() << " nodes";
    return tree;
}

NodeId NodeTree::add_node(const MenuItem& item, std::optional<NodeId> parent, int depth) {
    MenuNode node;
    node.name = item.label;
    node.icon = item.icon.value_or("");
    node.description = item.description;
    node.command = item.command;
    node.parent = parent;
    node.depth = depth;

    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
}

void NodeTree::add_children(NodeId parent_id,
                            const MenuItem& item,
                            const MenuLibrary& library,
                            const EngineConfig& config,
                            std::vector<std::string>& menu_path) {
    const std::vector<MenuItem>* children = &item.submenu;
    bool entered_menu = false;

    if (item.has_menu_ref()) {
        const std::string& name = *item.menu_ref;

        // A named menu that is already being expanded further up would
        // expand forever
        if (std::find(menu_path.begin(), menu_path.end(), name) != menu_path.end()) {
            std::ostringstream msg;
            msg << "Cyclic menu reference: ";
            for (const auto& entry : menu_path) {
                msg << entry << " -> ";
            }
            msg << name;
            throw ConfigurationError(msg.str());
        }

        auto it = library.find(name);
        if (it == library.end()) {
            throw ConfigurationError("Unknown menu '" + name + "' referenced by item '" +
                                     item.label + "'");
        }

        children = &it->second;
        menu_path.push_back(name);
        entered_menu = true;
    }

    if (!children->empty()) {
        int depth = nodes_[parent_id].depth + 1;
        if (depth > config.max_depth) {
            throw ConfigurationError("Menu nesting below item '" + item.label +
                                     "' exceeds the maximum depth of " +
                                     std::to_string(config.max_depth));
        }

        std::size_t count = children->size();
        std::size_t cap = config.children_cap(depth - 1);
        if (count > cap) {
            WARN_LOG("Item '" << item.label << "' has " << count << " children, only the first "
                     << cap << " are shown at level " << depth);
            count = cap;
        }

        for (std::size_t i = 0; i < count; ++i) {
            const MenuItem& child = (*children)[i];

            if (nodes_.size() >= config.max_total_nodes) {
                throw ConfigurationError("Menu exceeds the maximum of " +
                                         std::to_string(config.max_total_nodes) + " items");
            }

            NodeId child_id = add_node(child, parent_id, depth);
            nodes_[parent_id].children.push_back(child_id);

            add_children(child_id, child, library, config, menu_path);
        }
    }

    if (entered_menu) {
        menu_path.pop_back();
    }
}

void NodeTree::assign_angles(NodeId id) {
    const std::vector<NodeId> children = nodes_.at(id).children;
    if (children.empty()) {
        return;
    }

    // Direction back towards our own parent; the root has none
    std::optional<double> parent_angle;
    if (nodes_[id].angle) {
        parent_angle = geometry::normalize_angle(*nodes_[id].angle + 180.0);
    }

    std::vector<double> angles = geometry::compute_item_angles(children.size(), parent_angle);
    std::vector<Wedge> wedges = geometry::compute_item_wedges(angles, parent_angle);

    for (std::size_t i = 0; i < children.size(); ++i) {
        MenuNode& child = nodes_[children[i]];
        child.angle = angles[i];
        child.start_angle = wedges[i].start;
        child.end_angle = wedges[i].end;

        assign_angles(children[i]);
    }
}
