#include "juicebox/layout/Workspace.hpp"

#include <algorithm>
#include <utility>

namespace juicebox {

bool Workspace::add(const Window& window) {
    if (contains(window)) {
        return false;
    }
    windows_.push_back(window);
    return true;
}

bool Workspace::remove(const Window& window) {
    auto index = indexOf(window);
    if (!index) {
        return false;
    }

    if (isFocused(window)) {
        focused_ = prev(window);
    }

    windows_.erase(windows_.begin() + static_cast<std::ptrdiff_t>(*index));
    return true;
}

std::optional<std::size_t> Workspace::indexOf(const Window& window) const {
    auto it = std::find(windows_.begin(), windows_.end(), window);
    if (it == windows_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - windows_.begin());
}

std::optional<Window> Workspace::prev(const Window& window) const {
    auto index = indexOf(window);
    if (!index || *index == 0) {
        return std::nullopt;
    }
    return windows_[*index - 1];
}

void Workspace::swap(std::size_t a, std::size_t b) {
    std::swap(windows_.at(a), windows_.at(b));
}

std::optional<std::size_t> Workspace::focusedIndex() const {
    if (!focused_) {
        return std::nullopt;
    }
    return indexOf(*focused_);
}

}
