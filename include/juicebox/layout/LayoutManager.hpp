#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "juicebox/config/Config.hpp"
#include "juicebox/layout/Workspace.hpp"
#include "juicebox/utils/GapConfig.hpp"
#include "juicebox/window/Window.hpp"

namespace juicebox {

/**
 * @brief A workspace index past the configured workspace count
 */
class OutOfBounds : public std::out_of_range {
public:
    explicit OutOfBounds(const std::string& message) : std::out_of_range(message) {}
};

namespace layout_constants {

    /// Events every managed window reports to the manager.
    constexpr std::uint32_t MANAGED_WINDOW_EVENTS =
        protocol::event_mask::EnterWindow | protocol::event_mask::FocusChange;

    constexpr int MIN_WINDOW_DIMENSION = 1;
}

/**
 * @brief Master/stack tiling engine over a fixed set of workspaces
 *
 * Index 0 of a workspace fills the left half of the screen; every other
 * window shares the right half, stacked top to bottom. Only the active
 * workspace is visible; switching toggles visibility without touching
 * membership.
 */
class LayoutManager {
public:
    LayoutManager(std::uint16_t screen_width, std::uint16_t screen_height, const Config& config);

    Workspace& active() { return workspaces_[current_]; }
    const Workspace& active() const { return workspaces_[current_]; }

    std::size_t getCurrent() const { return current_; }
    const std::vector<Workspace>& getWorkspaces() const { return workspaces_; }
    const Workspace& getWorkspace(std::size_t index) const { return workspaces_.at(index); }

    /// Manage a newly mapped window on the active workspace and focus it.
    void mapWindow(const Window& window);

    /// Forget @p window everywhere; unknown windows are ignored.
    void closeWindow(const Window& window);

    /// Focus @p window if it belongs to the active workspace.
    void focusWindow(const Window& window);

    /**
     * @brief Make workspace @p index the visible one
     * @throws OutOfBounds
     */
    void switchTo(std::size_t index);

    /**
     * @brief Move @p window from the active workspace to workspace @p index
     * @throws OutOfBounds
     */
    void moveWindow(const Window& window, std::size_t index);

    void toggleFullscreen();

    /// Exchange the focused window with its neighbour in @p direction.
    void swapWindow(Direction direction);

    /// Focus the neighbour of the focused window in @p direction.
    void swapFocus(Direction direction);

    /// Toggle the focused window's membership in every other workspace.
    void pinFocus();

    /// Apply the workspace's mode and layout to its windows.
    void remapWindows(Workspace& workspace);

    /**
     * @brief Geometry of @p count tiled windows
     *
     * Pure function of its inputs; rectangles are in list order.
     */
    static std::vector<GapRect> computeLayout(std::size_t count, int screen_width, int screen_height,
                                              int border_width, const GapConfig& gaps);

    /// List index of the neighbour of @p index in @p direction, if it exists.
    static std::optional<std::size_t> neighbourIndex(std::size_t count, std::size_t index, Direction direction);

private:
    void applyFocus(Workspace& workspace, const Window& window, const std::optional<Window>& previous);
    void leaveFullscreen(Workspace& workspace);
    void checkIndex(std::size_t index) const;

    std::vector<Workspace> workspaces_;
    std::size_t current_{0};

    std::uint16_t screen_width_;
    std::uint16_t screen_height_;
    Config::BordersConfig borders_;
    GapConfig gaps_;
};

}
