#include "pie_menu_window.hpp"
#include "debug.hpp"
#include <algorithm>
#include <cmath>

// Static CSS for transparent background
static const char* CSS_DATA = R"(
    window {
        background-color: transparent;
    }
)";

static constexpr double PARENT_RADIUS = 14.0;
static constexpr double CHILD_RADIUS = 26.0;
static constexpr double GRANDCHILD_RADIUS = 5.0;

PieMenuWindow::PieMenuWindow(const MenuConfig& config)
    : config_(config)
    , engine_(*this, config_.engine)
{
    setup_css();
    setup_window();
    setup_controllers();
}

PieMenuWindow::~PieMenuWindow() {
    engine_.hide();
}

void PieMenuWindow::setup_window() {
    set_title("Spoke Menu");
    set_decorated(false);
    fullscreen();

    area_.set_hexpand(true);
    area_.set_vexpand(true);
    area_.set_draw_func(sigc::mem_fun(*this, &PieMenuWindow::on_draw));
    set_child(area_);

    signal_close_request().connect([this]() {
        engine_.hide();
        return false;
    }, false);
}

void PieMenuWindow::setup_css() {
    auto css = Gtk::CssProvider::create();
    css->load_from_data(CSS_DATA);
    Gtk::StyleContext::add_provider_for_display(
        get_display(),
        css,
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION
    );
}

void PieMenuWindow::setup_controllers() {
    auto motion = Gtk::EventControllerMotion::create();
    motion->signal_motion().connect(sigc::mem_fun(*this, &PieMenuWindow::on_motion));
    area_.add_controller(motion);

    auto click = Gtk::GestureClick::create();
    click->signal_pressed().connect(sigc::mem_fun(*this, &PieMenuWindow::on_pressed));
    click->signal_released().connect(sigc::mem_fun(*this, &PieMenuWindow::on_released));
    area_.add_controller(click);

    // Escape closes the menu
    auto key = Gtk::EventControllerKey::create();
    key->signal_key_pressed().connect(sigc::mem_fun(*this, &PieMenuWindow::on_key_press), false);
    add_controller(key);
}

void PieMenuWindow::present_at(int x, int y) {
    engine_.show(config_.root_item(), Vec2(x, y), config_.menus);
    present();
}

// ViewAdapter

void PieMenuWindow::build_nodes(const NodeTree& tree) {
    nodes_.assign(tree.size(), RenderedNode());

    for (NodeId id = 0; id < tree.size(); ++id) {
        const std::string& icon = tree.node(id).icon;
        if (!icon.empty()) {
            nodes_[id].icon = load_icon_from_file(icon);
        }
    }
}

void PieMenuWindow::update_node(NodeId id, const NodeVisual& visual, const Transform& transform) {
    if (id >= nodes_.size()) {
        return;
    }
    nodes_[id].visual = visual;
    nodes_[id].transform = transform;
}

void PieMenuWindow::frame_finished() {
    area_.queue_draw();
}

void PieMenuWindow::node_selected(NodeId id) {
    const MenuNode& node = engine_.tree().node(id);

    // Leaves without a command simply become the active item
    if (node.is_leaf() && !node.command.empty()) {
        execute_command(node);
        close_later();
    }
}

void PieMenuWindow::teardown() {
    nodes_.clear();
    area_.queue_draw();
}

// Input

void PieMenuWindow::on_motion(double x, double y) {
    if (closing_) {
        return;
    }
    engine_.on_pointer_move(x, y);
}

void PieMenuWindow::on_pressed(int n_press, double x, double y) {
    if (closing_) {
        return;
    }
    engine_.on_pointer_down(x, y);
}

void PieMenuWindow::on_released(int n_press, double x, double y) {
    if (closing_) {
        return;
    }
    engine_.on_pointer_move(x, y);
    engine_.on_pointer_up();
}

bool PieMenuWindow::on_key_press(guint keyval, guint keycode, Gdk::ModifierType state) {
    if (keyval == GDK_KEY_Escape) {
        close_later();
        return true;
    }
    return false;
}

// Drawing

void PieMenuWindow::on_draw(const Cairo::RefPtr<Cairo::Context>& cr, int width, int height) {
    // Clear fully transparent
    cr->set_operator(Cairo::Context::Operator::SOURCE);
    cr->set_source_rgba(0, 0, 0, 0);
    cr->paint();
    cr->set_operator(Cairo::Context::Operator::OVER);

    if (!engine_.is_shown() || nodes_.size() != engine_.tree().size()) {
        return;
    }

    std::vector<Vec2> positions = absolute_positions(engine_.tree(), engine_.transforms());

    draw_connectors(cr, positions);

    // Paint back to front so the active disc and hovered children stay on top
    static const NodeState ORDER[] = {
        NodeState::GRANDCHILD, NodeState::PARENT, NodeState::CHILD, NodeState::ACTIVE,
    };
    for (NodeState state : ORDER) {
        for (NodeId id = 0; id < nodes_.size(); ++id) {
            if (nodes_[id].visual.state == state) {
                draw_node(cr, id, positions[id]);
            }
        }
    }

    // Label of the hovered item, or of the active item, below the active disc
    NodeId active = engine_.active_node();
    NodeId labelled = engine_.hovered_node().value_or(active);
    const Vec2& anchor = positions[active];
    draw_text(cr, anchor.x, anchor.y + config_.engine.center_radius + config_.theme.font_size,
              engine_.tree().node(labelled).name, config_.theme.font_size);
}

void PieMenuWindow::draw_connectors(const Cairo::RefPtr<Cairo::Context>& cr,
                                    const std::vector<Vec2>& positions) {
    const NodeTree& tree = engine_.tree();

    set_source(cr, config_.theme.border_color.with_alpha(0.4));

    for (NodeId id = 0; id < nodes_.size(); ++id) {
        const NodeVisual& visual = nodes_[id].visual;
        auto parent = tree.parent_of(id);
        if (!visual.is_visible() || !parent) {
            continue;
        }

        cr->set_line_width(visual.state == NodeState::GRANDCHILD ? 1.0 : 3.0);
        cr->move_to(positions[*parent].x, positions[*parent].y);
        cr->line_to(positions[id].x, positions[id].y);
        cr->stroke();
    }
}

double PieMenuWindow::node_radius(const NodeVisual& visual) const {
    switch (visual.state) {
        case NodeState::ACTIVE:     return config_.engine.center_radius * 0.8;
        case NodeState::PARENT:     return PARENT_RADIUS;
        case NodeState::CHILD:      return CHILD_RADIUS;
        case NodeState::GRANDCHILD: return GRANDCHILD_RADIUS;
        case NodeState::HIDDEN:     return 0.0;
    }
    return 0.0;
}

void PieMenuWindow::draw_node(const Cairo::RefPtr<Cairo::Context>& cr, NodeId id, const Vec2& position) {
    const RenderedNode& rendered = nodes_[id];
    const NodeVisual& visual = rendered.visual;
    const Theme& theme = config_.theme;

    double radius = node_radius(visual) * rendered.transform.scale;

    Color fill;
    switch (visual.state) {
        case NodeState::ACTIVE:     fill = theme.active_color; break;
        case NodeState::PARENT:     fill = theme.parent_color; break;
        case NodeState::CHILD:      fill = theme.child_color; break;
        case NodeState::GRANDCHILD: fill = theme.grandchild_color; break;
        case NodeState::HIDDEN:     return;
    }
    if (visual.dragged) {
        fill = theme.drag_color;
    } else if (visual.hovered) {
        fill = theme.hover_color;
    }

    cr->begin_new_path();
    cr->arc(position.x, position.y, radius, 0, 2 * M_PI);
    set_source(cr, fill);
    cr->fill_preserve();

    set_source(cr, theme.border_color);
    cr->set_line_width(visual.state == NodeState::GRANDCHILD ? 1.0 : 2.0);
    cr->stroke();

    // Grandchildren and parents are too small for content
    if (visual.state != NodeState::ACTIVE && visual.state != NodeState::CHILD) {
        return;
    }

    double content_size = radius * 1.1;
    if (!draw_icon(cr, rendered.icon, position.x, position.y, content_size)) {
        const std::string& name = engine_.tree().node(id).name;
        std::string glyph = name.empty() ? "?" : name.substr(0, 1);
        draw_text(cr, position.x, position.y, glyph, static_cast<int>(content_size * 0.6));
    }
}

void PieMenuWindow::draw_text(const Cairo::RefPtr<Cairo::Context>& cr,
                              double x, double y, const std::string& text,
                              int font_size, bool bold) {
    set_source(cr, config_.theme.font_color);
    cr->select_font_face("Sans",
                         Cairo::ToyFontFace::Slant::NORMAL,
                         bold ? Cairo::ToyFontFace::Weight::BOLD : Cairo::ToyFontFace::Weight::NORMAL);
    cr->set_font_size(font_size);

    Cairo::TextExtents extents;
    cr->get_text_extents(text, extents);
    cr->move_to(x - extents.width / 2 - extents.x_bearing, y - extents.height / 2 - extents.y_bearing);
    cr->show_text(text);
}

Glib::RefPtr<Gdk::Pixbuf> PieMenuWindow::load_icon_from_file(const std::string& icon_path) {
    std::string expanded_path = PathValidator::expand_home(icon_path);

    if (!Glib::file_test(expanded_path, Glib::FileTest::IS_REGULAR)) {
        return {};
    }

    try {
        return Gdk::Pixbuf::create_from_file(expanded_path);
    } catch (const Glib::Error& e) {
        DEBUG_LOGLN << "Could not load icon '" << expanded_path << "': " << e.what();
        return {};
    }
}

bool PieMenuWindow::draw_icon(const Cairo::RefPtr<Cairo::Context>& cr,
                              const Glib::RefPtr<Gdk::Pixbuf>& pixbuf,
                              double x, double y, double size) {
    if (!pixbuf) {
        return false;
    }

    // Calculate scaled size maintaining aspect ratio
    int pw = pixbuf->get_width();
    int ph = pixbuf->get_height();
    double scale = std::min(size / pw, size / ph);
    int scaled_width = std::max(1, static_cast<int>(pw * scale));
    int scaled_height = std::max(1, static_cast<int>(ph * scale));

    auto scaled_pixbuf = pixbuf->scale_simple(scaled_width, scaled_height, Gdk::InterpType::BILINEAR);

    Gdk::Cairo::set_source_pixbuf(cr, scaled_pixbuf, x - scaled_width / 2.0, y - scaled_height / 2.0);
    cr->paint();

    return true;
}

void PieMenuWindow::set_source(const Cairo::RefPtr<Cairo::Context>& cr, const Color& color) {
    cr->set_source_rgba(color.r, color.g, color.b, color.a);
}

// Actions

void PieMenuWindow::execute_command(const MenuNode& node) {
    // spawn_command_line_async splits arguments but does not expand ~
    std::string command = PathValidator::expand_home(node.command);
    DEBUG_LOGLN << "Running command of '" << node.name << "': " << command;

    try {
        Glib::spawn_command_line_async(command);
    } catch (const Glib::SpawnError& e) {
        ERROR_LOG("Failed to execute command '" << command << "': " << e.what());
    } catch (const Glib::ShellError& e) {
        ERROR_LOG("Failed to parse command '" << command << "': " << e.what());
    }
}

void PieMenuWindow::close_later() {
    if (closing_) {
        return;
    }
    closing_ = true;

    // Leave the current event handler before tearing the menu down
    Glib::signal_idle().connect_once([this]() {
        close();
    });
}
