#pragma once

#include <cstdint>

#include "juicebox/protocol/Protocol.hpp"

namespace juicebox {

class Window;

/**
 * @brief Passive key and button grabs on a window
 *
 * Grabs are asynchronous for both pointer and keyboard and report events
 * to their owner.
 */
namespace input {

/// Keycode 0 in a grab means "any key".
constexpr protocol::Keycode ANY_KEY = 0;

/// Button 0 in a grab means "any button".
constexpr std::uint8_t ANY_BUTTON = 0;

void grabKey(const Window& window, std::uint16_t modifiers, protocol::Keycode key);
void ungrabKey(const Window& window, std::uint16_t modifiers, protocol::Keycode key);

void grabButton(const Window& window, std::uint16_t modifiers, std::uint8_t button, std::uint16_t event_mask);
void ungrabButton(const Window& window, std::uint16_t modifiers, std::uint8_t button);

}

}
