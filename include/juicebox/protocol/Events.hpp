#pragma once

#include <string_view>
#include <variant>

#include "juicebox/protocol/Protocol.hpp"

namespace juicebox::protocol {

/**
 * @brief A decoded 32-byte frame that is not a reply
 *
 * Key and button events share InputDeviceEvent; callers tell them apart by
 * eventCode().
 */
using Event = std::variant<
    ErrorRecord,
    InputDeviceEvent,
    CrossingEvent,
    FocusEvent,
    DestroyNotifyEvent,
    UnmapNotifyEvent,
    MapRequestEvent,
    ConfigureRequestEvent,
    MappingNotifyEvent,
    GenericEvent
>;

/// Response type with the SendEvent bit cleared.
constexpr std::uint8_t responseCode(const Frame& frame) noexcept {
    return frame[0] & static_cast<std::uint8_t>(~response::SendEventBit);
}

constexpr bool isError(const Frame& frame) noexcept { return frame[0] == response::Error; }
constexpr bool isReply(const Frame& frame) noexcept { return frame[0] == response::Reply; }

/**
 * @brief Decode an error or event frame
 *
 * Codes without a dedicated record, extension events included, decode to
 * GenericEvent.
 * @throws ProtocolError for replies
 */
Event decodeEvent(const Frame& frame);

/// Event code of a decoded event (errors report 0).
std::uint8_t eventCode(const Event& event);

/// Sequence number carried by any decoded frame.
std::uint16_t eventSequence(const Event& event);

std::string_view eventName(std::uint8_t code);

}
