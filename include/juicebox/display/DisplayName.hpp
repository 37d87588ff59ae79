#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace juicebox {

/**
 * @brief Parsed form of a display specifier `[protocol/]host:display[.screen]`
 */
struct DisplayName {
    std::string protocol;
    std::string host;
    unsigned int display{0};
    unsigned int screen{0};

    /// An empty host means the local unix-domain socket.
    bool isLocal() const { return host.empty(); }

    /// Path of the local socket, `/tmp/.X11-unix/X<display>`.
    std::string socketPath() const;

    /// TCP port of a remote server, 6000 + display.
    unsigned int tcpPort() const { return 6000 + display; }
};

/**
 * @brief Parse a display specifier
 * @return std::nullopt when the colon or display number is missing or malformed
 */
std::optional<DisplayName> parseDisplayName(std::string_view name);

/**
 * @brief Resolve the specifier to connect to: the override, else $DISPLAY
 * @throws ConnectionError (DisplayNotFound) when neither is set
 */
std::string resolveDisplayName(const std::optional<std::string>& override_name);

}
