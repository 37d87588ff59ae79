#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "juicebox/protocol/Protocol.hpp"

namespace juicebox {

class Connection;
struct Screen;

/**
 * @brief Lightweight handle to an X window
 *
 * Holds the window id and the connection it lives on. Copies refer to the
 * same server-side window; equality compares ids only. Every operation
 * writes one request and returns without waiting for the server.
 */
class Window {
public:
    /// Property payload: text is sent as STRING/8, integers as INTEGER/32.
    using Property = std::variant<std::uint32_t, std::string>;

    struct CreateOptions {
        std::uint16_t width{1};
        std::uint16_t height{1};
        std::int16_t x{0};
        std::int16_t y{0};
        std::uint16_t border_width{0};
        std::uint32_t event_mask{protocol::event_mask::NoEvent};
        std::optional<std::string> title;
    };

    Window(protocol::WindowId id, Connection& connection);

    /**
     * @brief Create, title and map a top-level window on @p screen
     *
     * The window is an InputOutput child of the screen root with the root
     * visual and a black background.
     */
    static Window create(Connection& connection, const Screen& screen, const CreateOptions& options);

    protocol::WindowId getId() const { return id_; }
    Connection& getConnection() const { return *connection_; }

    void changeAttributes(std::vector<protocol::ValueMask> values) const;
    void configure(std::vector<protocol::ValueMask> values) const;

    void map() const;
    void unMap() const;

    /// Give this window the keyboard focus, reverting to PointerRoot.
    void inputFocus() const;

    /// Disconnect the client owning this window.
    void close() const;

    void changeProperty(protocol::PropertyMode mode, protocol::Atom property, const Property& value) const;

    /**
     * @brief Create a graphics context drawing on this window
     * @return The new context id
     */
    protocol::GContext createContext(std::vector<protocol::ValueMask> values) const;

    bool operator==(const Window& other) const { return id_ == other.id_; }
    bool operator!=(const Window& other) const { return id_ != other.id_; }

private:
    protocol::WindowId id_;
    Connection* connection_;
};

}
