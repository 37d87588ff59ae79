#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "juicebox/config/Config.hpp"
#include "juicebox/display/Connection.hpp"
#include "juicebox/layout/LayoutManager.hpp"
#include "juicebox/protocol/Events.hpp"
#include "juicebox/window/KeybindManager.hpp"
#include "juicebox/window/KeysymTable.hpp"
#include "juicebox/window/Window.hpp"

namespace juicebox {

/**
 * @brief Raised when the root window is already redirected by another client
 */
class AnotherWindowManager : public std::runtime_error {
public:
    AnotherWindowManager() : std::runtime_error("another window manager is already running") {}
};

namespace wm_constants {

    /// Events selected on the root window.
    constexpr std::uint32_t ROOT_EVENT_MASK =
        protocol::event_mask::SubstructureRedirect |
        protocol::event_mask::SubstructureNotify |
        protocol::event_mask::StructureNotify |
        protocol::event_mask::ButtonPress |
        protocol::event_mask::PropertyChange |
        protocol::event_mask::FocusChange |
        protocol::event_mask::EnterWindow;

    /// Modifier held for click-to-focus.
    constexpr std::uint16_t FOCUS_BUTTON_MODIFIERS = protocol::modifier::Mod4;
    constexpr std::uint8_t FOCUS_BUTTON = 1;
}

/**
 * @brief Top-level event loop
 *
 * Owns the connection, the keyboard mapping and the layout, and routes
 * every frame read from the server to them in arrival order.
 */
class WindowManager {
public:
    WindowManager(std::unique_ptr<Connection> connection, Config config);
    ~WindowManager();

    WindowManager(const WindowManager&) = delete;
    WindowManager& operator=(const WindowManager&) = delete;

    /**
     * @brief Take over the root window and grab the bindings
     * @throws AnotherWindowManager when substructure redirection is refused
     */
    void initialize();

    /// Process frames until exit() is called; blocks on the socket.
    void run();

    void exit() { running_ = false; }

    /// Read and dispatch exactly one frame.
    void processNextEvent();

    void handleEvent(const protocol::Event& event);

    Connection& getConnection() { return *connection_; }
    LayoutManager& getLayout() { return layout_; }
    const KeysymTable& getKeysymTable() const { return keysym_table_; }
    const Window& getRoot() const { return root_; }

private:
    void handleKeyPress(const protocol::InputDeviceEvent& event);
    void handleButtonPress(const protocol::InputDeviceEvent& event);
    void handleConfigureRequest(const protocol::ConfigureRequestEvent& event);
    void handleMapRequest(const protocol::MapRequestEvent& event);
    void handleDestroyNotify(const protocol::DestroyNotifyEvent& event);
    void handleEnterNotify(const protocol::CrossingEvent& event);
    void handleMappingNotify(const protocol::MappingNotifyEvent& event);
    void onXError(const protocol::ErrorRecord& error);

    void grabBindings();

    std::unique_ptr<Connection> connection_;
    Config config_;
    Window root_;
    LayoutManager layout_;
    KeysymTable keysym_table_;
    KeybindManager keybinds_;
    bool running_{false};
};

}
