#pragma once

/**
 * @file GapConfig.hpp
 * @brief Per-side gaps around tiled windows
 *
 * The horizontal space between the master and the stack is left + right,
 * the vertical space between stacked windows is top + bottom.
 */

namespace juicebox {

struct GapRect {
    int x, y, width, height;

    GapRect() : x(0), y(0), width(0), height(0) {}
    GapRect(int x_, int y_, int w_, int h_) : x(x_), y(y_), width(w_), height(h_) {}

    void shrink(int left, int top, int right, int bottom) {
        x += left;
        y += top;
        width -= left + right;
        height -= top + bottom;
    }

    bool operator==(const GapRect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

struct GapConfig {
    int left_gap;
    int right_gap;
    int top_gap;
    int bottom_gap;

    static constexpr int DEFAULT_GAP = 4;

    GapConfig() : left_gap(DEFAULT_GAP), right_gap(DEFAULT_GAP),
                  top_gap(DEFAULT_GAP), bottom_gap(DEFAULT_GAP) {}

    GapConfig(int left, int right, int top, int bottom)
        : left_gap(left), right_gap(right), top_gap(top), bottom_gap(bottom) {}

    int getLeftGap() const { return left_gap; }

    int getRightGap() const { return right_gap; }

    int getTopGap() const { return top_gap; }

    int getBottomGap() const { return bottom_gap; }

    int getHorizontalGap() const { return left_gap + right_gap; }

    int getVerticalGap() const { return top_gap + bottom_gap; }

    /// Screen area minus the outer gaps.
    GapRect apply(int screen_width, int screen_height) const;
};

}
