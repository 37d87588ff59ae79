#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "juicebox/protocol/Protocol.hpp"
#include "juicebox/utils/GapConfig.hpp"

namespace juicebox {

enum class Direction {
    Left,
    Right,
    Up,
    Down,
};

/**
 * @brief Payload types of a key-bound action
 */
namespace action {

/// Spawn an external program; argv[0] is looked up in PATH.
struct Exec {
    std::vector<std::string> argv;
};

struct CloseWindow {};

struct ToggleFullscreen {};

struct SwitchWorkspace {
    std::size_t index;
};

struct MoveWindow {
    std::size_t index;
};

struct SwapWindow {
    Direction direction;
};

struct SwapFocus {
    Direction direction;
};

struct PinFocus {};

}

using Action = std::variant<
    action::Exec,
    action::CloseWindow,
    action::ToggleFullscreen,
    action::SwitchWorkspace,
    action::MoveWindow,
    action::SwapWindow,
    action::SwapFocus,
    action::PinFocus
>;

/// Helper for visiting an Action with a set of lambdas.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string_view toString(Direction direction);

/// Readable form of an action, e.g. "switchWorkspace 3".
std::string describeAction(const Action& action);

class Config {
public:
    struct BordersConfig {
        std::uint16_t width{1};
        std::uint32_t focused_color{0x014c82};
        std::uint32_t unfocused_color{0x34bdeb};
    };

    struct Keybind {
        std::uint16_t modifiers{0};
        protocol::Keysym keysym{protocol::NO_SYMBOL};
        Action action;
    };

    static constexpr std::size_t MAX_WORKSPACES = 16;
    static constexpr std::size_t DEFAULT_WORKSPACES = 10;

    std::size_t workspaces{DEFAULT_WORKSPACES};
    BordersConfig borders;
    GapConfig gaps;
    std::vector<Keybind> keybinds;
};

}
