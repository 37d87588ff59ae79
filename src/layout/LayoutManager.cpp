#include "juicebox/layout/LayoutManager.hpp"

#include <algorithm>
#include <iostream>

namespace juicebox {

namespace {

std::uint32_t wireCoordinate(int value) {
    return static_cast<std::uint32_t>(static_cast<std::int32_t>(value));
}

std::uint32_t wireDimension(int value) {
    return static_cast<std::uint32_t>(std::max(value, layout_constants::MIN_WINDOW_DIMENSION));
}

} // namespace

LayoutManager::LayoutManager(std::uint16_t screen_width, std::uint16_t screen_height, const Config& config)
    : screen_width_(screen_width),
      screen_height_(screen_height),
      borders_(config.borders),
      gaps_(config.gaps) {

    std::size_t count = std::clamp<std::size_t>(config.workspaces, 1, Config::MAX_WORKSPACES);
    workspaces_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workspaces_.emplace_back(i);
    }
}

// ============================================================================
// Geometry
// ============================================================================

std::vector<GapRect> LayoutManager::computeLayout(std::size_t count, int screen_width, int screen_height,
                                                  int border_width, const GapConfig& gaps) {
    std::vector<GapRect> result;
    if (count == 0) {
        return result;
    }

    GapRect area = gaps.apply(screen_width, screen_height);
    if (count == 1) {
        result.push_back(area);
        return result;
    }

    result.reserve(count);

    int master_width = std::max(
        (screen_width - gaps.getLeftGap() - gaps.getRightGap() - 4 * border_width) / 2, 1);
    result.emplace_back(area.x, area.y, master_width, area.height);

    // The stack starts one horizontal gap plus two borders past the master
    int stack_x = master_width + gaps.getHorizontalGap() + gaps.getLeftGap() + 2 * border_width;
    int stack_width = std::max(screen_width - stack_x - gaps.getRightGap() - 2 * border_width, 1);

    int right_count = static_cast<int>(count - 1);
    int spacing = 2 * border_width + gaps.getVerticalGap();
    int stack_height = std::max((area.height - (right_count - 1) * spacing) / right_count, 1);

    for (int k = 0; k < right_count; ++k) {
        int y = area.y + k * (stack_height + spacing);
        result.emplace_back(stack_x, y, stack_width, stack_height);
    }

    return result;
}

std::optional<std::size_t> LayoutManager::neighbourIndex(std::size_t count, std::size_t index,
                                                         Direction direction) {
    if (index >= count) {
        return std::nullopt;
    }

    switch (direction) {
        case Direction::Left:
            if (index != 0) return 0;
            break;
        case Direction::Right:
            if (index == 0 && count >= 2) return 1;
            break;
        case Direction::Up:
            if (index >= 2) return index - 1;
            break;
        case Direction::Down:
            if (index >= 1 && index + 1 < count) return index + 1;
            break;
    }
    return std::nullopt;
}

void LayoutManager::remapWindows(Workspace& workspace) {
    if (workspace.empty()) {
        return;
    }

    if (workspace.getMode() == Workspace::Mode::FullScreen && workspace.getFocused()) {
        workspace.getFocused()->configure({
            {protocol::config_window::X, 0},
            {protocol::config_window::Y, 0},
            {protocol::config_window::Width, screen_width_},
            {protocol::config_window::Height, screen_height_},
            {protocol::config_window::BorderWidth, 0},
            {protocol::config_window::StackMode, 0},  // Above
        });
        return;
    }

    auto rects = computeLayout(workspace.size(), screen_width_, screen_height_, borders_.width, gaps_);
    for (std::size_t i = 0; i < rects.size(); ++i) {
        const GapRect& rect = rects[i];
        workspace.at(i).configure({
            {protocol::config_window::X, wireCoordinate(rect.x)},
            {protocol::config_window::Y, wireCoordinate(rect.y)},
            {protocol::config_window::Width, wireDimension(rect.width)},
            {protocol::config_window::Height, wireDimension(rect.height)},
            {protocol::config_window::BorderWidth, borders_.width},
        });
    }
}

// ============================================================================
// Membership
// ============================================================================

void LayoutManager::mapWindow(const Window& window) {
    Workspace& workspace = active();

    // A window already living on another workspace follows the map request here
    if (!workspace.contains(window)) {
        for (auto& other : workspaces_) {
            if (&other == &workspace || !other.contains(window)) {
                continue;
            }
            bool was_focused = other.isFocused(window);
            other.remove(window);
            if (was_focused) {
                leaveFullscreen(other);
            }
            remapWindows(other);
        }
    }

    if (workspace.add(window)) {
        leaveFullscreen(workspace);
        remapWindows(workspace);
        window.changeAttributes({
            {protocol::window_attribute::EventMask, layout_constants::MANAGED_WINDOW_EVENTS},
        });
        std::cout << "[Layout] Managing window 0x" << std::hex << window.getId() << std::dec
                  << " on workspace " << current_ + 1 << std::endl;
    }

    window.map();
    focusWindow(window);
}

void LayoutManager::closeWindow(const Window& window) {
    for (auto& workspace : workspaces_) {
        if (!workspace.contains(window)) {
            continue;
        }

        bool was_focused = workspace.isFocused(window);
        workspace.remove(window);

        if (was_focused) {
            leaveFullscreen(workspace);
        }
        remapWindows(workspace);

        if (&workspace == &active() && was_focused && workspace.getFocused()) {
            applyFocus(workspace, *workspace.getFocused(), std::nullopt);
        }
    }
}

void LayoutManager::moveWindow(const Window& window, std::size_t index) {
    checkIndex(index);

    Workspace& source = active();
    if (index == current_ || !source.contains(window)) {
        return;
    }

    Workspace& destination = workspaces_[index];

    bool was_focused = source.isFocused(window);
    source.remove(window);
    window.unMap();

    destination.add(window);
    destination.setFocused(window);

    if (was_focused) {
        leaveFullscreen(source);
    }
    leaveFullscreen(destination);

    remapWindows(source);
    remapWindows(destination);

    if (was_focused && source.getFocused()) {
        applyFocus(source, *source.getFocused(), std::nullopt);
    }
}

void LayoutManager::pinFocus() {
    const auto& focused = active().getFocused();
    if (!focused) {
        return;
    }

    Window window = *focused;
    for (std::size_t i = 0; i < workspaces_.size(); ++i) {
        if (i == current_) {
            continue;
        }

        Workspace& workspace = workspaces_[i];
        if (workspace.contains(window)) {
            workspace.remove(window);
        } else {
            workspace.add(window);
            workspace.setFocused(window);
        }
    }
}

// ============================================================================
// Focus and visibility
// ============================================================================

void LayoutManager::focusWindow(const Window& window) {
    Workspace& workspace = active();
    if (!workspace.contains(window)) {
        return;
    }

    std::optional<Window> previous = workspace.getFocused();
    applyFocus(workspace, window, previous);
}

void LayoutManager::applyFocus(Workspace& workspace, const Window& window, const std::optional<Window>& previous) {
    workspace.setFocused(window);
    window.inputFocus();

    if (borders_.width == 0) {
        return;
    }

    window.changeAttributes({{protocol::window_attribute::BorderPixel, borders_.focused_color}});
    if (previous && *previous != window && workspace.contains(*previous)) {
        previous->changeAttributes({{protocol::window_attribute::BorderPixel, borders_.unfocused_color}});
    }
}

void LayoutManager::switchTo(std::size_t index) {
    checkIndex(index);
    if (index == current_) {
        return;
    }

    for (const auto& window : active().getWindows()) {
        window.unMap();
    }

    current_ = index;

    Workspace& workspace = active();
    remapWindows(workspace);
    for (const auto& window : workspace.getWindows()) {
        window.map();
    }

    if (workspace.getFocused()) {
        workspace.getFocused()->inputFocus();
    }
}

void LayoutManager::toggleFullscreen() {
    Workspace& workspace = active();

    if (workspace.getMode() == Workspace::Mode::Tiled && workspace.getFocused()) {
        workspace.setMode(Workspace::Mode::FullScreen);
    } else {
        workspace.setMode(Workspace::Mode::Tiled);
    }
    remapWindows(workspace);
}

void LayoutManager::swapWindow(Direction direction) {
    Workspace& workspace = active();
    auto index = workspace.focusedIndex();
    if (!index) {
        return;
    }

    auto target = neighbourIndex(workspace.size(), *index, direction);
    if (!target) {
        return;
    }

    workspace.swap(*index, *target);
    remapWindows(workspace);
}

void LayoutManager::swapFocus(Direction direction) {
    Workspace& workspace = active();
    auto index = workspace.focusedIndex();
    if (!index) {
        return;
    }

    auto target = neighbourIndex(workspace.size(), *index, direction);
    if (!target) {
        return;
    }

    focusWindow(workspace.at(*target));
}

void LayoutManager::leaveFullscreen(Workspace& workspace) {
    if (workspace.getMode() == Workspace::Mode::FullScreen) {
        workspace.setMode(Workspace::Mode::Tiled);
    }
}

void LayoutManager::checkIndex(std::size_t index) const {
    if (index >= workspaces_.size()) {
        throw OutOfBounds("workspace " + std::to_string(index + 1) + " does not exist (have " +
                          std::to_string(workspaces_.size()) + ")");
    }
}

}
