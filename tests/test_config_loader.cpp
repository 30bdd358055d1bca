#include <gtest/gtest.h>
#include <cstdlib>
#include "config_loader.hpp"

static const char* FULL_CONFIG = R"(
center-radius: 40
child-distance: 120
grandchild-distance: 30
drag-threshold: 8
children-per-level: [6, 4]
max-depth: 4

root:
  label: Start
  icon: ~/.config/spoke/start.svg

hover-color: "#ff000080"
font-size: 16

items:
  - label: Terminal
    command: xterm
    description: Open a terminal
    icon: terminal
  - label: Web
    submenu:
      - label: Browser
        command: firefox
      - label: Mail
        command: thunderbird
  - label: Tools
    menu: tools
  - label: Broken

menus:
  tools:
    - label: Editor
      command: gedit
)";

TEST(ConfigLoaderTest, ParsesEngineConstants) {
    MenuConfig config = MenuConfig::from_yaml_string(FULL_CONFIG);

    EXPECT_DOUBLE_EQ(config.engine.center_radius, 40.0);
    EXPECT_DOUBLE_EQ(config.engine.child_distance, 120.0);
    EXPECT_DOUBLE_EQ(config.engine.grandchild_distance, 30.0);
    EXPECT_DOUBLE_EQ(config.engine.drag_threshold, 8.0);
    EXPECT_EQ(config.engine.children_per_level, (std::vector<size_t>{6, 4}));
    EXPECT_EQ(config.engine.max_depth, 4);
}

TEST(ConfigLoaderTest, ParsesItems) {
    MenuConfig config = MenuConfig::from_yaml_string(FULL_CONFIG);

    EXPECT_EQ(config.root_label, "Start");
    EXPECT_EQ(config.root_icon, "~/.config/spoke/start.svg");

    // "Broken" has neither command nor submenu
    ASSERT_EQ(config.items.size(), 3u);

    const MenuItem& terminal = config.items[0];
    EXPECT_EQ(terminal.label, "Terminal");
    EXPECT_EQ(terminal.command, "xterm");
    EXPECT_EQ(terminal.description, "Open a terminal");
    ASSERT_TRUE(terminal.has_icon());
    EXPECT_EQ(*terminal.icon, "terminal");

    const MenuItem& web = config.items[1];
    ASSERT_EQ(web.submenu.size(), 2u);
    EXPECT_EQ(web.submenu[1].command, "thunderbird");

    const MenuItem& tools = config.items[2];
    EXPECT_TRUE(tools.has_menu_ref());
    EXPECT_EQ(*tools.menu_ref, "tools");

    ASSERT_EQ(config.menus.count("tools"), 1u);
    EXPECT_EQ(config.menus.at("tools")[0].label, "Editor");

    EXPECT_TRUE(config.validate());
}

TEST(ConfigLoaderTest, ParsesTheme) {
    MenuConfig config = MenuConfig::from_yaml_string(FULL_CONFIG);

    EXPECT_DOUBLE_EQ(config.theme.hover_color.r, 1.0);
    EXPECT_DOUBLE_EQ(config.theme.hover_color.g, 0.0);
    EXPECT_NEAR(config.theme.hover_color.a, 128.0 / 255.0, 1e-9);
    EXPECT_EQ(config.theme.font_size, 16);
    // Untouched colors keep their defaults
    EXPECT_DOUBLE_EQ(config.theme.font_color.r, Theme().font_color.r);
}

TEST(ConfigLoaderTest, ClampsOutOfRangeValues) {
    MenuConfig config = MenuConfig::from_yaml_string(R"(
center-radius: 1
child-distance: 10000
max-depth: 99
children-per-level: [0, 500]
items:
  - label: A
    command: a
)");

    EXPECT_DOUBLE_EQ(config.engine.center_radius, 10.0);
    EXPECT_DOUBLE_EQ(config.engine.child_distance, 500.0);
    EXPECT_EQ(config.engine.max_depth, SecurityLimits::MAX_YAML_DEPTH);
    EXPECT_EQ(config.engine.children_per_level,
              (std::vector<size_t>{1, SecurityLimits::MAX_MENU_ITEMS}));
}

TEST(ConfigLoaderTest, MalformedYamlGivesEmptyConfig) {
    MenuConfig config = MenuConfig::from_yaml_string("items: [label: {");
    EXPECT_TRUE(config.items.empty());
    EXPECT_FALSE(config.validate());
}

TEST(ConfigLoaderTest, NonMapDocumentIsRejected) {
    MenuConfig config = MenuConfig::from_yaml_string("- just\n- a list\n");
    EXPECT_TRUE(config.items.empty());
}

TEST(ConfigLoaderTest, ValidateRejectsCycles) {
    MenuConfig config = MenuConfig::from_yaml_string(R"(
items:
  - label: Loop
    menu: a
menus:
  a:
    - label: Deeper
      menu: b
  b:
    - label: Back
      menu: a
)");

    ASSERT_EQ(config.items.size(), 1u);
    EXPECT_FALSE(config.validate());
}

TEST(ConfigLoaderTest, ValidateRejectsUnknownMenu) {
    MenuConfig config = MenuConfig::from_yaml_string(R"(
items:
  - label: Nowhere
    menu: missing
)");

    EXPECT_FALSE(config.validate());
}

TEST(ConfigLoaderTest, ValidateRejectsInconsistentRadii) {
    MenuConfig config = MenuConfig::from_command_line("A:a");
    ASSERT_TRUE(config.validate());

    config.engine.child_distance = config.engine.center_radius;
    EXPECT_FALSE(config.validate());
}

TEST(ConfigLoaderTest, CommandLineItems) {
    MenuConfig config = MenuConfig::from_command_line(
        "Files:Browse files:nautilus; Shell::xterm ;Clock:date");

    ASSERT_EQ(config.items.size(), 3u);

    EXPECT_EQ(config.items[0].label, "Files");
    EXPECT_EQ(config.items[0].description, "Browse files");
    EXPECT_EQ(config.items[0].command, "nautilus");

    EXPECT_EQ(config.items[1].label, "Shell");
    EXPECT_EQ(config.items[1].description, "Shell");
    EXPECT_EQ(config.items[1].command, "xterm");

    EXPECT_EQ(config.items[2].label, "Clock");
    EXPECT_EQ(config.items[2].command, "date");
    EXPECT_EQ(config.items[2].description, "Clock");
}

TEST(ConfigLoaderTest, DemoMenuFollowsLevels) {
    MenuConfig config = MenuConfig::demo();

    ASSERT_EQ(config.items.size(), 8u);
    EXPECT_EQ(config.items[3].label, "Item 0.3");
    ASSERT_EQ(config.items[0].submenu.size(), 5u);
    ASSERT_EQ(config.items[0].submenu[2].submenu.size(), 5u);
    EXPECT_TRUE(config.items[0].submenu[2].submenu[0].submenu.empty());
    EXPECT_EQ(*config.items[1].icon, "public");

    EXPECT_TRUE(config.validate());

    MenuItem root = config.root_item();
    EXPECT_EQ(root.label, "Root");
    EXPECT_EQ(root.submenu.size(), 8u);
}

TEST(ColorTest, FromHex) {
    Color opaque = Color::from_hex("#336699");
    EXPECT_NEAR(opaque.r, 0x33 / 255.0, 1e-9);
    EXPECT_NEAR(opaque.g, 0x66 / 255.0, 1e-9);
    EXPECT_NEAR(opaque.b, 0x99 / 255.0, 1e-9);
    EXPECT_DOUBLE_EQ(opaque.a, 1.0);

    EXPECT_FALSE(Color::from_hex("#12").is_set());
    EXPECT_FALSE(Color::from_hex("zzzzzz").is_set());
}

TEST(PathValidatorTest, ExpandHome) {
    ASSERT_EQ(setenv("HOME", "/home/tester", 1), 0);

    EXPECT_EQ(PathValidator::expand_home("~"), "/home/tester");
    EXPECT_EQ(PathValidator::expand_home("~/icons/a.png"), "/home/tester/icons/a.png");
    EXPECT_EQ(PathValidator::expand_home("xdg-open ~"), "xdg-open /home/tester");
    EXPECT_EQ(PathValidator::expand_home("cp ~/a ~/b"), "cp /home/tester/a /home/tester/b");

    // Only a leading ~ of a word refers to the home directory
    EXPECT_EQ(PathValidator::expand_home("echo a~b ~user"), "echo a~b ~user");
    EXPECT_EQ(PathValidator::expand_home("firefox"), "firefox");
}
