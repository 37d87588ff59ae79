#include "juicebox/window/KeysymTable.hpp"
#include "juicebox/display/Connection.hpp"
#include "juicebox/protocol/Errors.hpp"
#include "juicebox/protocol/Wire.hpp"

namespace juicebox {

using protocol::Keycode;
using protocol::Keysym;
using protocol::NO_SYMBOL;

KeysymTable::KeysymTable(Keycode min_keycode, Keycode max_keycode,
                         std::uint8_t keysyms_per_keycode, std::vector<Keysym> keysyms)
    : min_keycode_(min_keycode),
      max_keycode_(max_keycode),
      keysyms_per_keycode_(keysyms_per_keycode),
      keysyms_(std::move(keysyms)) {
    std::size_t expected = static_cast<std::size_t>(max_keycode_ - min_keycode_ + 1) * keysyms_per_keycode_;
    if (max_keycode_ < min_keycode_ || keysyms_.size() != expected) {
        throw protocol::ProtocolError("keyboard mapping holds " + std::to_string(keysyms_.size()) +
                                      " keysyms, expected " + std::to_string(expected));
    }
}

KeysymTable KeysymTable::fetch(Connection& connection) {
    const auto& setup = connection.getSetup();

    protocol::GetKeyboardMappingRequest request{};
    request.first_keycode = setup.min_keycode;
    request.count = static_cast<std::uint8_t>(setup.max_keycode - setup.min_keycode + 1);

    auto bytes = connection.awaitReply(connection.send(request));

    protocol::ByteReader reader(bytes);
    auto reply = reader.read<protocol::GetKeyboardMappingReply>();

    std::vector<Keysym> keysyms;
    keysyms.reserve(reply.length);
    for (std::uint32_t i = 0; i < reply.length; ++i) {
        keysyms.push_back(reader.read<Keysym>());
    }

    return KeysymTable(setup.min_keycode, setup.max_keycode, reply.keysyms_per_keycode, std::move(keysyms));
}

Keycode KeysymTable::keysymToKeycode(Keysym symbol) const {
    if (empty() || symbol == NO_SYMBOL) {
        return 0;
    }

    for (unsigned int keycode = min_keycode_; keycode <= max_keycode_; ++keycode) {
        for (unsigned int column = 0; column < keysyms_per_keycode_; ++column) {
            if (keysymAtCol(static_cast<Keycode>(keycode), column) == symbol) {
                return static_cast<Keycode>(keycode);
            }
        }
    }
    return 0;
}

Keysym KeysymTable::keysymAtCol(Keycode keycode, unsigned int column) const {
    int per = keysyms_per_keycode_;
    int col = static_cast<int>(column);

    if (empty() || (col >= per && col > 3) || keycode < min_keycode_ || keycode > max_keycode_) {
        return NO_SYMBOL;
    }

    const Keysym* syms = &keysyms_[static_cast<std::size_t>(keycode - min_keycode_) * per];

    if (col < 4) {
        if (col > 1) {
            // Without a second group, columns 2 and 3 fold onto 0 and 1
            while (per > 2 && syms[per - 1] == NO_SYMBOL) {
                --per;
            }
            if (per < 3) {
                col -= 2;
            }
        }

        if (per <= (col | 1) || syms[col | 1] == NO_SYMBOL) {
            Keysym lower;
            Keysym upper;
            convertCase(syms[col & ~1], lower, upper);
            if (!(col & 1)) {
                return lower;
            }
            return upper == lower ? NO_SYMBOL : upper;
        }
    }

    return syms[col];
}

}
