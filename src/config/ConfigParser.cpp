#include "juicebox/config/ConfigParser.hpp"
#include "juicebox/config/KeyNames.hpp"
#include "juicebox/protocol/Protocol.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace juicebox {

namespace {

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// '#' opens a comment at the start of a token, unless it is a "#rrggbb" color
std::string stripComment(const std::string& line) {
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] != '#') {
            continue;
        }
        bool token_start = i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1]));
        if (!token_start) {
            continue;
        }
        bool color = i > 0 && i + 1 < line.size() && std::isxdigit(static_cast<unsigned char>(line[i + 1]));
        if (!color) {
            return line.substr(0, i);
        }
    }
    return line;
}

template <typename T>
std::optional<T> parseNumber(std::string_view text, int base = 10) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::uint32_t> parseColor(std::string_view text) {
    if (text.size() > 1 && text[0] == '#') {
        return parseNumber<std::uint32_t>(text.substr(1), 16);
    }
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        return parseNumber<std::uint32_t>(text.substr(2), 16);
    }
    return parseNumber<std::uint32_t>(text);
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

bool ConfigParser::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        reportError("Config file not found: " + path.string());
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        reportError("Failed to open config file: " + path.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

bool ConfigParser::loadFromString(const std::string& source) {
    config_ = Config{};
    errors_.clear();
    line_ = 0;

    std::istringstream stream(source);
    std::string line;
    while (std::getline(stream, line)) {
        ++line_;
        auto tokens = tokenize(stripComment(line));
        if (tokens.empty()) {
            continue;
        }
        parseLine(tokens);
    }

    return errors_.empty();
}

std::string ConfigParser::getEmbeddedConfig() {
    return R"(# juicebox default configuration

workspaces 10

border width 1
border focused 0x014c82
border unfocused 0x34bdeb

# left right top bottom
gaps 4 4 4 4

keybind super,shift q call closeWindow
keybind super d exec dmenu_run
keybind super f call toggleFullscreen
keybind super Return exec alacritty

keybind super 1 call switchWorkspace 0
keybind super 2 call switchWorkspace 1
keybind super 3 call switchWorkspace 2
keybind super 4 call switchWorkspace 3
keybind super 5 call switchWorkspace 4
keybind super 6 call switchWorkspace 5
keybind super 7 call switchWorkspace 6
keybind super 8 call switchWorkspace 7
keybind super 9 call switchWorkspace 8
keybind super 0 call switchWorkspace 9

keybind super,shift 1 call moveWindow 0
keybind super,shift 2 call moveWindow 1
keybind super,shift 3 call moveWindow 2
keybind super,shift 4 call moveWindow 3
keybind super,shift 5 call moveWindow 4
keybind super,shift 6 call moveWindow 5
keybind super,shift 7 call moveWindow 6
keybind super,shift 8 call moveWindow 7
keybind super,shift 9 call moveWindow 8
keybind super,shift 0 call moveWindow 9

keybind super,shift Right call swapWindow right
keybind super,shift Left call swapWindow left
keybind super,shift Up call swapWindow up
keybind super,shift Down call swapWindow down
)";
}

std::filesystem::path ConfigParser::getDefaultConfigPath() {
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "juicebox" / "config";
    }

    auto home = std::getenv("HOME");
    if (!home) return "/etc/juicebox/config";

    return std::filesystem::path(home) / ".config" / "juicebox" / "config";
}

// ============================================================================
// Directives
// ============================================================================

void ConfigParser::parseLine(const std::vector<std::string>& tokens) {
    const std::string& directive = tokens[0];

    if (directive == "workspaces") {
        parseWorkspaces(tokens);
    } else if (directive == "border") {
        parseBorder(tokens);
    } else if (directive == "gaps") {
        parseGaps(tokens);
    } else if (directive == "keybind") {
        parseKeybind(tokens);
    } else {
        reportError("Unknown directive '" + directive + "'");
    }
}

void ConfigParser::parseWorkspaces(const std::vector<std::string>& tokens) {
    if (tokens.size() != 2) {
        reportError("Expected 'workspaces <count>'");
        return;
    }

    auto count = parseNumber<std::size_t>(tokens[1]);
    if (!count || *count == 0) {
        reportError("Invalid workspace count '" + tokens[1] + "'");
        return;
    }

    if (*count > Config::MAX_WORKSPACES) {
        reportWarning("Workspace count " + tokens[1] + " exceeds " +
                      std::to_string(Config::MAX_WORKSPACES) + ", clamping");
        *count = Config::MAX_WORKSPACES;
    }
    config_.workspaces = *count;
}

void ConfigParser::parseBorder(const std::vector<std::string>& tokens) {
    if (tokens.size() != 3) {
        reportError("Expected 'border [width|focused|unfocused] <value>'");
        return;
    }

    const std::string& option = tokens[1];
    if (option == "width") {
        auto width = parseNumber<std::uint16_t>(tokens[2]);
        if (!width) {
            reportError("Invalid border width '" + tokens[2] + "'");
            return;
        }
        config_.borders.width = *width;
        return;
    }

    auto color = parseColor(tokens[2]);
    if (!color) {
        reportError("Invalid border color '" + tokens[2] + "'");
        return;
    }

    if (option == "focused") {
        config_.borders.focused_color = *color;
    } else if (option == "unfocused") {
        config_.borders.unfocused_color = *color;
    } else {
        reportError("Unknown border option '" + option + "'");
    }
}

void ConfigParser::parseGaps(const std::vector<std::string>& tokens) {
    if (tokens.size() != 5) {
        reportError("Expected 'gaps <left> <right> <top> <bottom>'");
        return;
    }

    int values[4];
    for (std::size_t i = 0; i < 4; ++i) {
        auto value = parseNumber<std::uint16_t>(tokens[i + 1]);
        if (!value) {
            reportError("Invalid gap size '" + tokens[i + 1] + "'");
            return;
        }
        values[i] = *value;
    }
    config_.gaps = GapConfig(values[0], values[1], values[2], values[3]);
}

void ConfigParser::parseKeybind(const std::vector<std::string>& tokens) {
    if (tokens.size() < 4) {
        reportError("Expected 'keybind <modifiers> <key> [exec|call] ...'");
        return;
    }

    auto modifiers = parseModifiers(tokens[1]);
    if (!modifiers) {
        reportError("Invalid modifier list '" + tokens[1] + "'");
        return;
    }

    auto keysym = keysymFromName(tokens[2]);
    if (!keysym) {
        reportError("Unknown key '" + tokens[2] + "'");
        return;
    }

    Config::Keybind bind;
    bind.modifiers = *modifiers;
    bind.keysym = *keysym;

    const std::string& kind = tokens[3];
    if (kind == "exec") {
        if (tokens.size() < 5) {
            reportError("Expected a program after 'exec'");
            return;
        }
        bind.action = action::Exec{std::vector<std::string>(tokens.begin() + 4, tokens.end())};
    } else if (kind == "call") {
        auto parsed = parseCall(tokens, 4);
        if (!parsed) {
            return;
        }
        bind.action = std::move(*parsed);
    } else {
        reportError("Expected 'exec' or 'call' but found '" + kind + "'");
        return;
    }

    config_.keybinds.push_back(std::move(bind));
}

std::optional<Action> ConfigParser::parseCall(const std::vector<std::string>& tokens, std::size_t first) {
    if (first >= tokens.size()) {
        reportError("Expected an action name after 'call'");
        return std::nullopt;
    }

    const std::string& name = tokens[first];
    std::optional<std::string> argument;
    if (first + 1 < tokens.size()) {
        argument = tokens[first + 1];
    }
    if (first + 2 < tokens.size()) {
        reportError("Too many arguments for '" + name + "'");
        return std::nullopt;
    }

    if (name == "closeWindow") return action::CloseWindow{};
    if (name == "toggleFullscreen") return action::ToggleFullscreen{};
    if (name == "pinFocus") return action::PinFocus{};

    if (name == "switchWorkspace" || name == "moveWindow") {
        std::optional<std::size_t> index;
        if (argument) {
            index = parseNumber<std::size_t>(*argument);
        }
        if (!index || *index >= Config::MAX_WORKSPACES) {
            reportError("'" + name + "' expects a workspace index between 0 and " +
                        std::to_string(Config::MAX_WORKSPACES - 1));
            return std::nullopt;
        }
        if (name == "switchWorkspace") return action::SwitchWorkspace{*index};
        return action::MoveWindow{*index};
    }

    if (name == "swapWindow" || name == "swapFocus") {
        std::optional<Direction> direction;
        if (argument) {
            direction = parseDirection(*argument);
        }
        if (!direction) {
            reportError("'" + name + "' expects one of left, right, up, down");
            return std::nullopt;
        }
        if (name == "swapWindow") return action::SwapWindow{*direction};
        return action::SwapFocus{*direction};
    }

    reportError("Unknown action '" + name + "'");
    return std::nullopt;
}

// ============================================================================
// Tokens
// ============================================================================

std::optional<std::uint16_t> ConfigParser::parseModifiers(std::string_view text) {
    namespace mod = protocol::modifier;

    std::uint16_t result = 0;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(',', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view token = text.substr(start, end - start);

        if (token == "shift") result |= mod::Shift;
        else if (token == "lock") result |= mod::Lock;
        else if (token == "control" || token == "ctrl") result |= mod::Control;
        else if (token == "mod1" || token == "alt") result |= mod::Mod1;
        else if (token == "mod2") result |= mod::Mod2;
        else if (token == "mod3") result |= mod::Mod3;
        else if (token == "mod4" || token == "super") result |= mod::Mod4;
        else if (token == "mod5") result |= mod::Mod5;
        else if (token == "any") result |= mod::Any;
        else if (token == "none") {}
        else return std::nullopt;

        start = end + 1;
    }
    return result;
}

std::optional<Direction> ConfigParser::parseDirection(std::string_view text) {
    if (text == "left") return Direction::Left;
    if (text == "right") return Direction::Right;
    if (text == "up") return Direction::Up;
    if (text == "down") return Direction::Down;
    return std::nullopt;
}

void ConfigParser::reportError(const std::string& message) {
    std::string located = line_ > 0 ? "line " + std::to_string(line_) + ": " + message : message;
    std::cerr << "[Config] " << located << std::endl;
    errors_.push_back(located);
}

void ConfigParser::reportWarning(const std::string& message) {
    std::cerr << "[Config] Warning: line " << line_ << ": " << message << std::endl;
}

}
