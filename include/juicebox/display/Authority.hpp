#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace juicebox {

/**
 * @brief One record of an Xauthority file
 *
 * Strings hold raw bytes; `data` is usually a binary cookie.
 */
struct AuthEntry {
    std::uint16_t family{0};
    std::string address;
    std::string number;
    std::string name;
    std::string data;
};

/**
 * @brief Read the next record from an Xauthority stream
 * @return std::nullopt at end of stream or on a truncated trailing record
 */
std::optional<AuthEntry> readAuthEntry(std::istream& in);

/// First record whose address equals @p hostname, scanning in file order.
std::optional<AuthEntry> findAuthEntry(std::istream& in, std::string_view hostname);

/// $XAUTHORITY, else $HOME/.Xauthority.
std::optional<std::filesystem::path> authorityFilePath();

/**
 * @brief Load the credentials for this host
 * @throws ConnectionError (AuthenticationFailed) when the file is missing
 *         or holds no record for the host name
 */
AuthEntry loadAuthEntry();

}
