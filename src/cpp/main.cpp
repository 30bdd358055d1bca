#include "pie_menu_window.hpp"
#include "config_loader.hpp"
#include "configuration_error.hpp"
#include "debug.hpp"
#include "x11_utilities.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>

// Helper to find config file in standard locations
static std::string find_config_file() {
    const char* home = std::getenv("HOME");
    if (home) {
        std::string primary_config = std::string(home) + "/.config/spoke/config.yaml";
        std::ifstream f(primary_config);
        if (f.good()) {
            return primary_config;
        }
    }

    std::ifstream f2("config.yaml");
    if (f2.good()) {
        return "config.yaml";
    }

    return "";
}

// Pointer position, or the screen center when the pointer is elsewhere
static bool get_menu_position(int& x, int& y) {
    try {
        X11Display display;
        if (display.get_pointer_position(x, y)) {
            return true;
        }
        int width = 0;
        int height = 0;
        display.get_screen_geometry(width, height);
        x = width / 2;
        y = height / 2;
        WARN_LOG("Pointer is not on the default screen, centering the menu");
        return true;
    } catch (const std::runtime_error& e) {
        ERROR_LOG(e.what());
        return false;
    }
}

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [x] [y] [OPTIONS]\n"
              << "\n"
              << "Positional arguments:\n"
              << "  x       X coordinate (default: mouse position)\n"
              << "  y       Y coordinate (default: mouse position)\n"
              << "\n"
              << "Options:\n"
              << "  --cli <items>     Build a flat menu from a CLI string\n"
              << "                    Format: \"title:description:action;title2:desc2:act2;...\"\n"
              << "  --config <file>   Use custom YAML config file\n"
              << "  --demo            Show a generated test menu\n"
              << "  --debug           Print debug output to stderr\n"
              << "  --help, -h        Show this help message\n"
              << "\n"
              << "Config file search order:\n"
              << "  1. ~/.config/spoke/config.yaml\n"
              << "  2. ./config.yaml (current directory)\n";
}

class SpokeApplication : public Gtk::Application {
public:
    SpokeApplication(const MenuConfig& config, int x, int y, bool has_position)
        : Gtk::Application("com.github.spokemenu", Gio::Application::Flags::NON_UNIQUE)
        , config_(config)
        , x_(x)
        , y_(y)
        , has_position_(has_position)
    {}

    int exit_status() const { return exit_status_; }

protected:
    void on_activate() override {
        if (!has_position_) {
            if (get_menu_position(x_, y_)) {
                DEBUG_LOGLN << "Menu position: " << x_ << ", " << y_;
            } else {
                WARN_LOG("Could not get mouse position, using screen origin");
            }
        }

        window_ = std::make_unique<PieMenuWindow>(config_);
        add_window(*window_);

        try {
            window_->present_at(x_, y_);
        } catch (const ConfigurationError& e) {
            ERROR_LOG("Cannot show menu: " << e.what());
            exit_status_ = 1;
            remove_window(*window_);
            quit();
        }
    }

    void on_shutdown() override {
        window_.reset();
        Gtk::Application::on_shutdown();
    }

private:
    MenuConfig config_;
    int x_;
    int y_;
    bool has_position_;
    int exit_status_ = 0;
    std::unique_ptr<PieMenuWindow> window_;
};

int main(int argc, char** argv) {
    std::string config_file;
    std::string cli_config;
    bool demo = false;
    int x = 0;
    int y = 0;
    int positional = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--cli" && i + 1 < argc) {
            cli_config = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--demo") {
            demo = true;
        } else if (arg == "--debug") {
            DebugLog::set_enabled(true);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (positional < 2) {
            try {
                (positional == 0 ? x : y) = std::stoi(arg);
            } catch (const std::exception&) {
                std::cerr << "Invalid " << (positional == 0 ? "x" : "y")
                          << " coordinate: " << arg << "\n";
                return 1;
            }
            ++positional;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (positional == 1) {
        std::cerr << "Both x and y coordinates are required\n";
        return 1;
    }

    MenuConfig config;
    if (demo) {
        config = MenuConfig::demo();
        DEBUG_LOGLN << "Using demo menu";
    } else if (!cli_config.empty()) {
        config = MenuConfig::from_command_line(cli_config);
        DEBUG_LOGLN << "Using CLI configuration";
    } else if (!config_file.empty()) {
        config = MenuConfig::from_yaml(config_file);
        DEBUG_LOGLN << "Using config file: " << config_file;
    } else {
        std::string detected = find_config_file();
        if (detected.empty()) {
            std::cerr << "No config file found. Tried:\n"
                      << "  - ~/.config/spoke/config.yaml\n"
                      << "  - ./config.yaml\n"
                      << "Use --config <file> to specify a config file, or --demo.\n";
            return 1;
        }
        config = MenuConfig::from_yaml(detected);
        DEBUG_LOGLN << "Using config file: " << detected;
    }

    if (!config.validate()) {
        std::cerr << "Invalid configuration\n";
        return 1;
    }

    // GTK would treat our own arguments as files to open
    SpokeApplication app(config, x, y, positional == 2);
    int status = app.run(1, argv);
    return status != 0 ? status : app.exit_status();
}
