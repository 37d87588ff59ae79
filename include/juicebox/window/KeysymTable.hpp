#pragma once

#include <cstdint>
#include <vector>

#include "juicebox/protocol/Protocol.hpp"

namespace juicebox {

class Connection;

/**
 * @brief Lower- and uppercase forms of a keysym
 *
 * Covers the legacy Latin-1..4, Latin-9, Cyrillic and Greek keysym blocks
 * and the Unicode keysyms (0x01000000 | code point). Symbols without case
 * map to themselves.
 */
void convertCase(protocol::Keysym symbol, protocol::Keysym& lower, protocol::Keysym& upper);

/**
 * @brief Cached keyboard mapping of the server
 *
 * Holds keysyms_per_keycode symbols for every keycode between the setup's
 * min and max keycode, as returned by GetKeyboardMapping.
 */
class KeysymTable {
public:
    KeysymTable() = default;
    KeysymTable(protocol::Keycode min_keycode, protocol::Keycode max_keycode,
                std::uint8_t keysyms_per_keycode, std::vector<protocol::Keysym> keysyms);

    /**
     * @brief Fetch the mapping for the full keycode range of @p connection
     * @throws protocol::ProtocolError when the reply length does not match
     */
    static KeysymTable fetch(Connection& connection);

    /// First keycode carrying @p symbol in any column, 0 when none does.
    protocol::Keycode keysymToKeycode(protocol::Keysym symbol) const;

    protocol::Keysym keycodeToKeysym(protocol::Keycode keycode) const { return keysymAtCol(keycode, 0); }

    /**
     * @brief Keysym of @p keycode at @p column with core-protocol folding
     *
     * Columns 0-3 follow the group/shift rules: a group whose second symbol
     * is NoSymbol takes both forms from the case conversion of the first.
     */
    protocol::Keysym keysymAtCol(protocol::Keycode keycode, unsigned int column) const;

    protocol::Keycode getMinKeycode() const { return min_keycode_; }
    protocol::Keycode getMaxKeycode() const { return max_keycode_; }
    std::uint8_t getKeysymsPerKeycode() const { return keysyms_per_keycode_; }
    bool empty() const { return keysyms_.empty(); }

private:
    protocol::Keycode min_keycode_{0};
    protocol::Keycode max_keycode_{0};
    std::uint8_t keysyms_per_keycode_{0};
    std::vector<protocol::Keysym> keysyms_;
};

}
