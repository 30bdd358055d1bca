#pragma once

#include <gtkmm.h>
#include <vector>
#include "config_loader.hpp"
#include "pie_menu_engine.hpp"
#include "view_adapter.hpp"

// Fullscreen transparent window that renders the menu rings with cairo and
// forwards pointer input to the engine
class PieMenuWindow : public Gtk::Window, public ViewAdapter {
public:
    explicit PieMenuWindow(const MenuConfig& config);
    ~PieMenuWindow() override;

    // Opens the menu centered at screen coordinates.
    // Throws ConfigurationError if the configured menu cannot be built.
    void present_at(int x, int y);

    // ViewAdapter
    void build_nodes(const NodeTree& tree) override;
    void update_node(NodeId id, const NodeVisual& visual, const Transform& transform) override;
    void frame_finished() override;
    void node_selected(NodeId id) override;
    void teardown() override;

private:
    struct RenderedNode {
        NodeVisual visual;
        Transform transform;
        Glib::RefPtr<Gdk::Pixbuf> icon;
    };

    MenuConfig config_;
    PieMenuEngine engine_;

    Gtk::DrawingArea area_;
    std::vector<RenderedNode> nodes_;
    bool closing_ = false;

    // Signal handlers
    void on_draw(const Cairo::RefPtr<Cairo::Context>& cr, int width, int height);
    void on_motion(double x, double y);
    void on_pressed(int n_press, double x, double y);
    void on_released(int n_press, double x, double y);
    bool on_key_press(guint keyval, guint keycode, Gdk::ModifierType state);

    // Drawing helpers
    void draw_connectors(const Cairo::RefPtr<Cairo::Context>& cr, const std::vector<Vec2>& positions);
    void draw_node(const Cairo::RefPtr<Cairo::Context>& cr, NodeId id, const Vec2& position);
    void draw_text(const Cairo::RefPtr<Cairo::Context>& cr,
                   double x, double y, const std::string& text,
                   int font_size, bool bold = true);
    bool draw_icon(const Cairo::RefPtr<Cairo::Context>& cr,
                   const Glib::RefPtr<Gdk::Pixbuf>& pixbuf,
                   double x, double y, double size);
    static Glib::RefPtr<Gdk::Pixbuf> load_icon_from_file(const std::string& icon_path);
    static void set_source(const Cairo::RefPtr<Cairo::Context>& cr, const Color& color);

    double node_radius(const NodeVisual& visual) const;

    // Setup
    void setup_window();
    void setup_css();
    void setup_controllers();

    void execute_command(const MenuNode& node);
    void close_later();
};
