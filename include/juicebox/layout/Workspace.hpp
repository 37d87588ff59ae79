#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "juicebox/window/Window.hpp"

namespace juicebox {

/**
 * @brief Ordered list of windows shown together on the screen
 *
 * List order is the stacking order used by the tiling layout: index 0 is
 * the master pane, the rest form the right-hand stack.
 */
class Workspace {
public:
    enum class Mode {
        Tiled,
        FullScreen,
    };

    explicit Workspace(std::size_t id) : id_(id) {}

    std::size_t getId() const { return id_; }

    /// Append @p window; returns false when it is already present.
    bool add(const Window& window);

    /**
     * @brief Remove @p window, keeping the order of the others
     *
     * A focused window hands focus to its predecessor, or leaves the
     * workspace unfocused when it was first.
     */
    bool remove(const Window& window);

    bool contains(const Window& window) const { return indexOf(window).has_value(); }
    std::optional<std::size_t> indexOf(const Window& window) const;

    /// Window listed right before @p window.
    std::optional<Window> prev(const Window& window) const;

    void swap(std::size_t a, std::size_t b);

    const std::vector<Window>& getWindows() const { return windows_; }
    const Window& at(std::size_t index) const { return windows_.at(index); }
    std::size_t size() const { return windows_.size(); }
    bool empty() const { return windows_.empty(); }

    const std::optional<Window>& getFocused() const { return focused_; }
    void setFocused(std::optional<Window> window) { focused_ = std::move(window); }
    bool isFocused(const Window& window) const { return focused_ && *focused_ == window; }

    /// Index of the focused window in the list.
    std::optional<std::size_t> focusedIndex() const;

    Mode getMode() const { return mode_; }
    void setMode(Mode mode) { mode_ = mode; }

private:
    std::size_t id_;
    std::vector<Window> windows_;
    std::optional<Window> focused_;
    Mode mode_{Mode::Tiled};
};

}
