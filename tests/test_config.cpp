#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "juicebox/config/ConfigParser.hpp"
#include "juicebox/config/KeyNames.hpp"

using namespace juicebox;
namespace mod = juicebox::protocol::modifier;

namespace {

constexpr protocol::Keysym XK_q = 0x71;
constexpr protocol::Keysym XK_Return = 0xff0d;
constexpr protocol::Keysym XK_Right = 0xff53;

const Config::Keybind* findBind(const Config& config, std::uint16_t modifiers, protocol::Keysym keysym) {
    for (const auto& bind : config.keybinds) {
        if (bind.modifiers == modifiers && bind.keysym == keysym) {
            return &bind;
        }
    }
    return nullptr;
}

}

TEST(ConfigParserTest, EmbeddedConfigParsesCleanly) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString(ConfigParser::getEmbeddedConfig()));

    const Config& config = parser.getConfig();
    EXPECT_EQ(config.workspaces, 10u);
    EXPECT_EQ(config.borders.width, 1);
    EXPECT_EQ(config.borders.focused_color, 0x014c82u);
    EXPECT_EQ(config.borders.unfocused_color, 0x34bdebu);
    EXPECT_EQ(config.gaps.getLeftGap(), 4);
    EXPECT_EQ(config.gaps.getBottomGap(), 4);
    EXPECT_EQ(config.keybinds.size(), 28u);

    const auto* close = findBind(config, mod::Mod4 | mod::Shift, XK_q);
    ASSERT_NE(close, nullptr);
    EXPECT_TRUE(std::holds_alternative<action::CloseWindow>(close->action));

    const auto* terminal = findBind(config, mod::Mod4, XK_Return);
    ASSERT_NE(terminal, nullptr);
    ASSERT_TRUE(std::holds_alternative<action::Exec>(terminal->action));
    EXPECT_EQ(std::get<action::Exec>(terminal->action).argv, std::vector<std::string>{"alacritty"});

    const auto* workspace10 = findBind(config, mod::Mod4, 0x30);
    ASSERT_NE(workspace10, nullptr);
    ASSERT_TRUE(std::holds_alternative<action::SwitchWorkspace>(workspace10->action));
    EXPECT_EQ(std::get<action::SwitchWorkspace>(workspace10->action).index, 9u);

    const auto* swap = findBind(config, mod::Mod4 | mod::Shift, XK_Right);
    ASSERT_NE(swap, nullptr);
    ASSERT_TRUE(std::holds_alternative<action::SwapWindow>(swap->action));
    EXPECT_EQ(std::get<action::SwapWindow>(swap->action).direction, Direction::Right);
}

TEST(ConfigParserTest, DefaultsWithoutDirectives) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString("# nothing here\n\n   \n"));

    const Config& config = parser.getConfig();
    EXPECT_EQ(config.workspaces, Config::DEFAULT_WORKSPACES);
    EXPECT_TRUE(config.keybinds.empty());
}

TEST(ConfigParserTest, Modifiers) {
    EXPECT_EQ(ConfigParser::parseModifiers("super"), std::optional<std::uint16_t>(mod::Mod4));
    EXPECT_EQ(ConfigParser::parseModifiers("ctrl,alt"), std::optional<std::uint16_t>(mod::Control | mod::Mod1));
    EXPECT_EQ(ConfigParser::parseModifiers("none"), std::optional<std::uint16_t>(0));
    EXPECT_EQ(ConfigParser::parseModifiers("any"), std::optional<std::uint16_t>(mod::Any));
    EXPECT_FALSE(ConfigParser::parseModifiers("hyper").has_value());
    EXPECT_FALSE(ConfigParser::parseModifiers("super,").has_value());
    EXPECT_FALSE(ConfigParser::parseModifiers("").has_value());
}

TEST(ConfigParserTest, Directions) {
    EXPECT_EQ(ConfigParser::parseDirection("up"), std::optional<Direction>(Direction::Up));
    EXPECT_FALSE(ConfigParser::parseDirection("Up").has_value());
}

TEST(ConfigParserTest, BorderColors) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString(
        "border width 3\n"
        "border focused #ff0000\n"
        "border unfocused 0x00FF00  # green\n"));

    const Config& config = parser.getConfig();
    EXPECT_EQ(config.borders.width, 3);
    EXPECT_EQ(config.borders.focused_color, 0xff0000u);
    EXPECT_EQ(config.borders.unfocused_color, 0x00ff00u);
}

TEST(ConfigParserTest, GapsAreLeftRightTopBottom) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString("gaps 1 2 3 4\n"));

    const GapConfig& gaps = parser.getConfig().gaps;
    EXPECT_EQ(gaps.getLeftGap(), 1);
    EXPECT_EQ(gaps.getRightGap(), 2);
    EXPECT_EQ(gaps.getTopGap(), 3);
    EXPECT_EQ(gaps.getBottomGap(), 4);
}

TEST(ConfigParserTest, WorkspaceCountIsClamped) {
    ConfigParser parser;
    EXPECT_TRUE(parser.loadFromString("workspaces 40\n"));
    EXPECT_EQ(parser.getConfig().workspaces, Config::MAX_WORKSPACES);

    EXPECT_FALSE(parser.loadFromString("workspaces 0\n"));
    EXPECT_EQ(parser.getConfig().workspaces, Config::DEFAULT_WORKSPACES);
}

TEST(ConfigParserTest, ErrorsCarryLineNumbersAndParsingContinues) {
    ConfigParser parser;
    EXPECT_FALSE(parser.loadFromString(
        "workspaces 4\n"
        "frobnicate\n"
        "gaps 1 2 3\n"
        "keybind super q call closeWindow\n"));

    const auto& errors = parser.getErrors();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "line 2: Unknown directive 'frobnicate'");
    EXPECT_EQ(errors[1].rfind("line 3: ", 0), 0u);

    EXPECT_EQ(parser.getConfig().workspaces, 4u);
    EXPECT_EQ(parser.getConfig().keybinds.size(), 1u);
}

TEST(ConfigParserTest, ReloadClearsPreviousState) {
    ConfigParser parser;
    EXPECT_FALSE(parser.loadFromString("bogus\n"));
    EXPECT_TRUE(parser.loadFromString("keybind super q call pinFocus\n"));
    EXPECT_TRUE(parser.getErrors().empty());
    EXPECT_EQ(parser.getConfig().keybinds.size(), 1u);
}

TEST(ConfigParserTest, ExecKeepsArguments) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString("keybind alt t exec xterm -e htop\n"));

    const auto& bind = parser.getConfig().keybinds.at(0);
    EXPECT_EQ(bind.modifiers, mod::Mod1);
    ASSERT_TRUE(std::holds_alternative<action::Exec>(bind.action));
    EXPECT_EQ(std::get<action::Exec>(bind.action).argv, (std::vector<std::string>{"xterm", "-e", "htop"}));
}

TEST(ConfigParserTest, RejectsMalformedKeybinds) {
    const char* lines[] = {
        "keybind super d exec",
        "keybind super d",
        "keybind hyper d exec foo",
        "keybind super NotAKeyName exec foo",
        "keybind super d run foo",
        "keybind super d call launchRocket",
        "keybind super d call switchWorkspace",
        "keybind super d call switchWorkspace 16",
        "keybind super d call moveWindow -1",
        "keybind super d call swapFocus sideways",
        "keybind super d call closeWindow now please",
    };

    for (const char* line : lines) {
        ConfigParser parser;
        EXPECT_FALSE(parser.loadFromString(line)) << line;
        EXPECT_TRUE(parser.getConfig().keybinds.empty()) << line;
    }
}

TEST(ConfigParserTest, AllCallActions) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString(
        "keybind super a call closeWindow\n"
        "keybind super b call toggleFullscreen\n"
        "keybind super c call pinFocus\n"
        "keybind super d call switchWorkspace 15\n"
        "keybind super e call moveWindow 2\n"
        "keybind super f call swapWindow down\n"
        "keybind super g call swapFocus left\n"));

    const auto& binds = parser.getConfig().keybinds;
    ASSERT_EQ(binds.size(), 7u);
    EXPECT_EQ(describeAction(binds[0].action), "closeWindow");
    EXPECT_EQ(describeAction(binds[1].action), "toggleFullscreen");
    EXPECT_EQ(describeAction(binds[2].action), "pinFocus");
    EXPECT_EQ(describeAction(binds[3].action), "switchWorkspace 15");
    EXPECT_EQ(describeAction(binds[4].action), "moveWindow 2");
    EXPECT_EQ(describeAction(binds[5].action), "swapWindow down");
    EXPECT_EQ(describeAction(binds[6].action), "swapFocus left");
}

TEST(ConfigParserTest, DescribeExec) {
    EXPECT_EQ(describeAction(action::Exec{{"dmenu_run", "-b"}}), "exec dmenu_run -b");
}

TEST(KeyNamesTest, NamesRoundTrip) {
    EXPECT_EQ(keysymFromName("Return"), std::optional<std::uint32_t>(XK_Return));
    EXPECT_EQ(keysymFromName("XK_q"), std::optional<std::uint32_t>(XK_q));
    EXPECT_FALSE(keysymFromName("").has_value());
    EXPECT_FALSE(keysymFromName("NotAKeyName").has_value());

    EXPECT_EQ(keysymName(XK_Return), "Return");
    EXPECT_EQ(keysymName(0x7fffff00), "0x7fffff00");
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("juicebox-config-" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
        ::unsetenv("XDG_CONFIG_HOME");
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigFileTest, LoadsFromFile) {
    auto path = dir_ / "config";
    {
        std::ofstream out(path);
        out << "workspaces 3\nkeybind super Return exec st\n";
    }

    ConfigParser parser;
    ASSERT_TRUE(parser.load(path));
    EXPECT_EQ(parser.getConfig().workspaces, 3u);
    EXPECT_EQ(parser.getConfig().keybinds.size(), 1u);
}

TEST_F(ConfigFileTest, MissingFileIsAnError) {
    ConfigParser parser;
    EXPECT_FALSE(parser.load(dir_ / "absent"));
    ASSERT_EQ(parser.getErrors().size(), 1u);
    EXPECT_NE(parser.getErrors()[0].find("not found"), std::string::npos);
}

TEST_F(ConfigFileTest, DefaultPathFollowsXdg) {
    ::setenv("XDG_CONFIG_HOME", dir_.c_str(), 1);
    EXPECT_EQ(ConfigParser::getDefaultConfigPath(), dir_ / "juicebox" / "config");
}
