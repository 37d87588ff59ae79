#include "juicebox/core/WindowManager.hpp"
#include "juicebox/protocol/Errors.hpp"
#include "juicebox/window/Input.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace juicebox {

using namespace protocol;

WindowManager::WindowManager(std::unique_ptr<Connection> connection, Config config)
    : connection_(std::move(connection)),
      config_(std::move(config)),
      root_(connection_->getDefaultScreen().root, *connection_),
      layout_(connection_->getDefaultScreen().width_in_pixels,
              connection_->getDefaultScreen().height_in_pixels,
              config_) {
    keybinds_.setBindings(config_.keybinds);
}

WindowManager::~WindowManager() = default;

void WindowManager::initialize() {
    // Only one client may select SubstructureRedirect on the root
    root_.changeAttributes({{window_attribute::EventMask, wm_constants::ROOT_EVENT_MASK}});
    if (auto error = connection_->checkRequest(connection_->getLastSequence())) {
        if (error->error_code == static_cast<std::uint8_t>(ErrorCode::Access)) {
            throw AnotherWindowManager();
        }
        throw RequestError(*error);
    }

    keysym_table_ = KeysymTable::fetch(*connection_);
    grabBindings();

    input::ungrabButton(root_, modifier::Any, input::ANY_BUTTON);
    input::grabButton(root_, wm_constants::FOCUS_BUTTON_MODIFIERS, wm_constants::FOCUS_BUTTON,
                      static_cast<std::uint16_t>(event_mask::ButtonPress));

    const Screen& screen = connection_->getDefaultScreen();
    std::cout << "[WindowManager] Managing root 0x" << std::hex << screen.root << std::dec
              << " (" << screen.width_in_pixels << "x" << screen.height_in_pixels << ", "
              << layout_.getWorkspaces().size() << " workspaces, "
              << keybinds_.getBindings().size() << " keybinds)" << std::endl;
}

void WindowManager::grabBindings() {
    keybinds_.grabKeys(root_, keysym_table_);
}

// ============================================================================
// Event loop
// ============================================================================

void WindowManager::run() {
    running_ = true;
    while (running_) {
        processNextEvent();
    }
}

void WindowManager::processNextEvent() {
    Frame frame = connection_->readFrame();

    if (isReply(frame)) {
        // Every reply is consumed by the call that asked for it
        std::cerr << "[WindowManager] Unexpected reply (sequence "
                  << frameAs<ReplyHeader>(frame).sequence << "), discarding" << std::endl;
        connection_->discardReply(frame);
        return;
    }

    if (frame[0] == GENERIC_EVENT_CODE) {
        connection_->discardReply(frame);
    }

    handleEvent(decodeEvent(frame));
}

void WindowManager::handleEvent(const Event& event) {
    switch (eventCode(event)) {
        case 0:
            onXError(std::get<ErrorRecord>(event));
            break;

        case static_cast<std::uint8_t>(EventCode::KeyPress):
            handleKeyPress(std::get<InputDeviceEvent>(event));
            break;

        case static_cast<std::uint8_t>(EventCode::ButtonPress):
            handleButtonPress(std::get<InputDeviceEvent>(event));
            break;

        case static_cast<std::uint8_t>(EventCode::ConfigureRequest):
            handleConfigureRequest(std::get<ConfigureRequestEvent>(event));
            break;

        case static_cast<std::uint8_t>(EventCode::MapRequest):
            handleMapRequest(std::get<MapRequestEvent>(event));
            break;

        case static_cast<std::uint8_t>(EventCode::DestroyNotify):
            handleDestroyNotify(std::get<DestroyNotifyEvent>(event));
            break;

        case static_cast<std::uint8_t>(EventCode::EnterNotify):
            handleEnterNotify(std::get<CrossingEvent>(event));
            break;

        case static_cast<std::uint8_t>(EventCode::MappingNotify):
            handleMappingNotify(std::get<MappingNotifyEvent>(event));
            break;

        default:
            break;
    }
}

// ============================================================================
// Handlers
// ============================================================================

void WindowManager::handleKeyPress(const InputDeviceEvent& event) {
    keybinds_.handleKeyPress(event, keysym_table_, layout_);
}

void WindowManager::handleButtonPress(const InputDeviceEvent& event) {
    if (event.child == NONE) {
        return;
    }
    layout_.focusWindow(Window(event.child, *connection_));
}

void WindowManager::handleConfigureRequest(const ConfigureRequestEvent& event) {
    // Grant the request as asked; the layout takes over once the window maps
    std::vector<ValueMask> changes;
    auto requested = [&](std::uint16_t bit) { return (event.value_mask & bit) != 0; };

    if (requested(config_window::X)) {
        changes.push_back({config_window::X, static_cast<std::uint32_t>(static_cast<std::int32_t>(event.x))});
    }
    if (requested(config_window::Y)) {
        changes.push_back({config_window::Y, static_cast<std::uint32_t>(static_cast<std::int32_t>(event.y))});
    }
    if (requested(config_window::Width)) {
        changes.push_back({config_window::Width, event.width});
    }
    if (requested(config_window::Height)) {
        changes.push_back({config_window::Height, event.height});
    }
    if (requested(config_window::BorderWidth)) {
        changes.push_back({config_window::BorderWidth, event.border_width});
    }
    if (requested(config_window::Sibling)) {
        changes.push_back({config_window::Sibling, event.sibling});
    }
    if (requested(config_window::StackMode)) {
        changes.push_back({config_window::StackMode, event.stack_mode});
    }

    Window(event.window, *connection_).configure(std::move(changes));
}

void WindowManager::handleMapRequest(const MapRequestEvent& event) {
    layout_.mapWindow(Window(event.window, *connection_));
}

void WindowManager::handleDestroyNotify(const DestroyNotifyEvent& event) {
    layout_.closeWindow(Window(event.window, *connection_));
}

void WindowManager::handleEnterNotify(const CrossingEvent& event) {
    auto mode = static_cast<NotifyMode>(event.mode);
    if (mode != NotifyMode::Normal && mode != NotifyMode::Ungrab) {
        return;
    }
    if (static_cast<NotifyDetail>(event.detail) == NotifyDetail::Inferior) {
        return;
    }
    layout_.focusWindow(Window(event.event, *connection_));
}

void WindowManager::handleMappingNotify(const MappingNotifyEvent& event) {
    if (static_cast<MappingRequest>(event.request) != MappingRequest::Keyboard) {
        return;
    }

    std::cout << "[WindowManager] Keyboard mapping changed, regrabbing keys" << std::endl;
    keysym_table_ = KeysymTable::fetch(*connection_);
    grabBindings();
}

void WindowManager::onXError(const ErrorRecord& error) {
    std::cerr << "[X Error] " << errorName(error.error_code) << std::endl;
    std::cerr << "  Request: " << static_cast<int>(error.major_opcode) << "."
              << error.minor_opcode << std::endl;
    std::cerr << "  Resource: 0x" << std::hex << error.bad_value << std::dec << std::endl;
    std::cerr << "  Sequence: " << error.sequence << std::endl;
}

}
