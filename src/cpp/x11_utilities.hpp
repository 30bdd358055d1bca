#pragma once

#include <X11/Xlib.h>
#include <stdexcept>

// Minimal X11 connection used to find where the menu should open
class X11Display {
public:
    X11Display() : display_(XOpenDisplay(nullptr)) {
        if (!display_) {
            throw std::runtime_error("Failed to open X11 display");
        }
    }

    ~X11Display() {
        if (display_) {
            XCloseDisplay(display_);
        }
    }

    X11Display(const X11Display&) = delete;
    X11Display& operator=(const X11Display&) = delete;

    int screen() const { return DefaultScreen(display_); }
    Window root_window() const { return RootWindow(display_, screen()); }

    void get_screen_geometry(int& width, int& height) const {
        width = DisplayWidth(display_, screen());
        height = DisplayHeight(display_, screen());
    }

    // Returns false if the pointer is on another screen
    bool get_pointer_position(int& x, int& y) const {
        Window root, child;
        int root_x, root_y, win_x, win_y;
        unsigned int mask;
        if (!XQueryPointer(display_, root_window(), &root, &child,
                           &root_x, &root_y, &win_x, &win_y, &mask)) {
            return false;
        }
        x = root_x;
        y = root_y;
        return true;
    }

private:
    Display* display_;
};
