#include "juicebox/display/DisplayName.hpp"
#include "juicebox/display/Connection.hpp"

#include <charconv>
#include <cstdlib>

namespace juicebox {

namespace {

std::optional<unsigned int> parseNumber(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    unsigned int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}

std::string DisplayName::socketPath() const {
    return "/tmp/.X11-unix/X" + std::to_string(display);
}

std::optional<DisplayName> parseDisplayName(std::string_view name) {
    DisplayName result;

    std::string_view rest = name;
    auto slash = rest.rfind('/');
    if (slash != std::string_view::npos) {
        result.protocol = std::string(rest.substr(0, slash));
        rest = rest.substr(slash + 1);
    }

    auto colon = rest.rfind(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    result.host = std::string(rest.substr(0, colon));

    std::string_view numbers = rest.substr(colon + 1);
    std::string_view display_part = numbers;
    auto dot = numbers.find('.');
    if (dot != std::string_view::npos) {
        display_part = numbers.substr(0, dot);
        auto screen = parseNumber(numbers.substr(dot + 1));
        if (!screen) {
            return std::nullopt;
        }
        result.screen = *screen;
    }

    auto display = parseNumber(display_part);
    if (!display) {
        return std::nullopt;
    }
    result.display = *display;

    return result;
}

std::string resolveDisplayName(const std::optional<std::string>& override_name) {
    if (override_name.has_value() && !override_name->empty()) {
        return *override_name;
    }

    const char* display_env = std::getenv("DISPLAY");
    if (display_env != nullptr && display_env[0] != '\0') {
        return display_env;
    }

    throw ConnectionError(ConnectionError::Kind::DisplayNotFound,
                          "no display given and DISPLAY is not set");
}

}
