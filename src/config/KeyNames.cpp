#include "juicebox/config/KeyNames.hpp"

// Only translation unit that sees Xlib; macros such as None and KeyPress
// collide with the protocol headers.
#include <X11/Xlib.h>

#include <cstdio>

namespace juicebox {

std::optional<std::uint32_t> keysymFromName(const std::string& name) {
    std::string lookup = name;
    if (lookup.rfind("XK_", 0) == 0) {
        lookup.erase(0, 3);
    }
    if (lookup.empty()) {
        return std::nullopt;
    }

    KeySym keysym = XStringToKeysym(lookup.c_str());
    if (keysym == NoSymbol) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(keysym);
}

std::string keysymName(std::uint32_t keysym) {
    const char* name = XKeysymToString(static_cast<KeySym>(keysym));
    if (name) {
        return name;
    }

    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%x", static_cast<unsigned>(keysym));
    return buffer;
}

}
