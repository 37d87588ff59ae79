#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "juicebox/config/Config.hpp"
#include "juicebox/protocol/Protocol.hpp"

namespace juicebox {

class KeysymTable;
class LayoutManager;
class Window;

/**
 * @brief Keybind manager for handling keyboard shortcuts
 *
 * Grabs every configured key combination on the root window, matches
 * incoming key presses against the bindings and runs the bound action on
 * the layout or spawns the bound command via fork/exec.
 */
class KeybindManager {
public:
    /// Modifiers ignored when matching a key press (Caps Lock, Num Lock).
    static constexpr std::uint16_t LOCK_MODIFIERS = protocol::modifier::Lock | protocol::modifier::Mod2;

    KeybindManager() = default;

    void setBindings(std::vector<Config::Keybind> bindings) { keybinds_ = std::move(bindings); }
    const std::vector<Config::Keybind>& getBindings() const { return keybinds_; }

    /**
     * @brief Grab every binding on @p root
     *
     * Existing grabs are released first. Each combination is grabbed with
     * and without the lock modifiers so bindings work regardless of their
     * state.
     */
    void grabKeys(const Window& root, const KeysymTable& table) const;

    /// Binding matching @p keysym under modifier @p state, if any.
    const Config::Keybind* findBinding(protocol::Keysym keysym, std::uint16_t state) const;

    /**
     * @brief Dispatch a KeyPress event
     * @return true when a binding matched
     */
    bool handleKeyPress(const protocol::InputDeviceEvent& event, const KeysymTable& table, LayoutManager& layout) const;

    /// Run @p action; workspace index errors are logged and dropped.
    static void execute(const Action& action, LayoutManager& layout);

    /// Spawn @p argv detached from the manager.
    static void executeCommand(const std::vector<std::string>& argv);

private:
    static void grabKeyWithLocks(const Window& root, protocol::Keycode keycode, std::uint16_t modifiers);

    std::vector<Config::Keybind> keybinds_;
};

}
