/**
 * @file GapConfig.cpp
 * @brief Outer gap application
 */

#include "juicebox/utils/GapConfig.hpp"
#include <algorithm>

namespace juicebox {

GapRect GapConfig::apply(int screen_width, int screen_height) const {
    GapRect result(0, 0, screen_width, screen_height);
    result.shrink(getLeftGap(), getTopGap(), getRightGap(), getBottomGap());

    result.width = std::max(result.width, 1);
    result.height = std::max(result.height, 1);
    return result;
}

}
