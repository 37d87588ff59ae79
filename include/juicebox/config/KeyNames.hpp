#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace juicebox {

/**
 * @brief Resolve a keysym name such as "Return" or "XK_Return"
 *
 * Names are looked up in libX11's keysym database; the "XK_" prefix of
 * the C constant names is accepted. Kept free of the protocol headers so
 * that Xlib's macros never meet them.
 */
std::optional<std::uint32_t> keysymFromName(const std::string& name);

/// Name of @p keysym, or a hex literal when the database has none.
std::string keysymName(std::uint32_t keysym);

}
