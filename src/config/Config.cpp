#include "juicebox/config/Config.hpp"

#include <sstream>

namespace juicebox {

std::string_view toString(Direction direction) {
    switch (direction) {
        case Direction::Left:  return "left";
        case Direction::Right: return "right";
        case Direction::Up:    return "up";
        case Direction::Down:  return "down";
    }
    return "unknown";
}

std::string describeAction(const Action& action) {
    std::ostringstream out;
    std::visit(Overloaded{
        [&](const action::Exec& exec) {
            out << "exec";
            for (const auto& arg : exec.argv) {
                out << ' ' << arg;
            }
        },
        [&](const action::CloseWindow&) { out << "closeWindow"; },
        [&](const action::ToggleFullscreen&) { out << "toggleFullscreen"; },
        [&](const action::SwitchWorkspace& a) { out << "switchWorkspace " << a.index; },
        [&](const action::MoveWindow& a) { out << "moveWindow " << a.index; },
        [&](const action::SwapWindow& a) { out << "swapWindow " << toString(a.direction); },
        [&](const action::SwapFocus& a) { out << "swapFocus " << toString(a.direction); },
        [&](const action::PinFocus&) { out << "pinFocus"; },
    }, action);
    return out.str();
}

}
