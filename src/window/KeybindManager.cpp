#include "juicebox/window/KeybindManager.hpp"
#include "juicebox/config/KeyNames.hpp"
#include "juicebox/layout/LayoutManager.hpp"
#include "juicebox/window/Input.hpp"
#include "juicebox/window/KeysymTable.hpp"
#include "juicebox/window/Window.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

namespace juicebox {

void KeybindManager::grabKeys(const Window& root, const KeysymTable& table) const {
    // Ungrab all keys first to avoid conflicts
    input::ungrabKey(root, protocol::modifier::Any, input::ANY_KEY);

    for (const auto& bind : keybinds_) {
        if (bind.keysym == protocol::NO_SYMBOL) {
            std::cerr << "[Keybind] Skipping keybind with invalid keysym" << std::endl;
            continue;
        }

        protocol::Keycode keycode = table.keysymToKeycode(bind.keysym);
        if (keycode == 0) {
            std::cerr << "[Keybind] Warning: No keycode for keysym " << keysymName(bind.keysym) << std::endl;
            continue;
        }

        if (bind.modifiers & protocol::modifier::Any) {
            input::grabKey(root, protocol::modifier::Any, keycode);
        } else {
            grabKeyWithLocks(root, keycode, bind.modifiers);
        }
    }
}

void KeybindManager::grabKeyWithLocks(const Window& root, protocol::Keycode keycode, std::uint16_t modifiers) {
    const std::uint16_t lock_modifiers[] = {
        0,
        protocol::modifier::Mod2,                              // Num Lock
        protocol::modifier::Lock,                              // Caps Lock
        protocol::modifier::Mod2 | protocol::modifier::Lock,   // Both
    };

    for (std::uint16_t lock_mod : lock_modifiers) {
        input::grabKey(root, modifiers | lock_mod, keycode);
    }
}

const Config::Keybind* KeybindManager::findBinding(protocol::Keysym keysym, std::uint16_t state) const {
    std::uint16_t modifiers = state & static_cast<std::uint16_t>(~LOCK_MODIFIERS);

    for (const auto& bind : keybinds_) {
        if (bind.keysym != keysym) {
            continue;
        }
        if ((bind.modifiers & protocol::modifier::Any) || bind.modifiers == modifiers) {
            return &bind;
        }
    }
    return nullptr;
}

bool KeybindManager::handleKeyPress(const protocol::InputDeviceEvent& event, const KeysymTable& table,
                                    LayoutManager& layout) const {
    protocol::Keysym keysym = table.keycodeToKeysym(event.detail);

    const Config::Keybind* bind = findBinding(keysym, event.state);
    if (!bind) {
        return false;
    }

    execute(bind->action, layout);
    return true;
}

void KeybindManager::execute(const Action& action, LayoutManager& layout) {
    try {
        std::visit(Overloaded{
            [](const action::Exec& exec) { executeCommand(exec.argv); },
            [&](const action::CloseWindow&) {
                // The layout forgets the window once its DestroyNotify arrives
                if (const auto& focused = layout.active().getFocused()) {
                    focused->close();
                }
            },
            [&](const action::ToggleFullscreen&) { layout.toggleFullscreen(); },
            [&](const action::SwitchWorkspace& a) { layout.switchTo(a.index); },
            [&](const action::MoveWindow& a) {
                // Copied: moving rewrites the workspace's focus slot
                if (std::optional<Window> focused = layout.active().getFocused()) {
                    layout.moveWindow(*focused, a.index);
                }
            },
            [&](const action::SwapWindow& a) { layout.swapWindow(a.direction); },
            [&](const action::SwapFocus& a) { layout.swapFocus(a.direction); },
            [&](const action::PinFocus&) { layout.pinFocus(); },
        }, action);
    } catch (const OutOfBounds& e) {
        std::cerr << "[Keybind] Ignoring " << describeAction(action) << ": " << e.what() << std::endl;
    }
}

void KeybindManager::executeCommand(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        std::cerr << "[Keybind] Warning: exec binding without a program" << std::endl;
        return;
    }

    pid_t pid = fork();

    if (pid == -1) {
        std::cerr << "[Keybind] Failed to fork process for command: " << argv.front() << std::endl;
        perror("fork");
        return;
    }

    if (pid == 0) {
        // Create a new session so the child is not killed when the manager exits
        if (setsid() == -1) {
            perror("setsid");
            std::_Exit(1);
        }

        // The X connection and any other descriptor stay with the manager
        for (int fd = 3; fd < 1024; ++fd) {
            close(fd);
        }

        int devnull = open("/dev/null", O_RDWR);
        if (devnull != -1) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > 2) {
                close(devnull);
            }
        }

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        execvp(args[0], args.data());

        perror("execvp");
        std::_Exit(1);
    }

    std::cout << "[Keybind] Spawned " << argv.front() << " (pid " << pid << ")" << std::endl;
}

}
