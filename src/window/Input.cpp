#include "juicebox/window/Input.hpp"
#include "juicebox/display/Connection.hpp"
#include "juicebox/window/Window.hpp"

namespace juicebox::input {

void grabKey(const Window& window, std::uint16_t modifiers, protocol::Keycode key) {
    protocol::GrabKeyRequest request{};
    request.grab_window = window.getId();
    request.modifiers = modifiers;
    request.key = key;
    window.getConnection().send(request);
}

void ungrabKey(const Window& window, std::uint16_t modifiers, protocol::Keycode key) {
    protocol::UngrabKeyRequest request{};
    request.key = key;
    request.grab_window = window.getId();
    request.modifiers = modifiers;
    window.getConnection().send(request);
}

void grabButton(const Window& window, std::uint16_t modifiers, std::uint8_t button, std::uint16_t event_mask) {
    protocol::GrabButtonRequest request{};
    request.grab_window = window.getId();
    request.event_mask = event_mask;
    request.button = button;
    request.modifiers = modifiers;
    window.getConnection().send(request);
}

void ungrabButton(const Window& window, std::uint16_t modifiers, std::uint8_t button) {
    protocol::UngrabButtonRequest request{};
    request.button = button;
    request.grab_window = window.getId();
    request.modifiers = modifiers;
    window.getConnection().send(request);
}

}
