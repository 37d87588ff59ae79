#include "juicebox/protocol/Events.hpp"
#include "juicebox/protocol/Errors.hpp"
#include "juicebox/protocol/Wire.hpp"

#include <algorithm>
#include <array>
#include <sstream>

namespace juicebox::protocol {

// ============================================================================
// Value lists and request lengths
// ============================================================================

ValueList makeValueList(std::vector<ValueMask> entries) {
    std::sort(entries.begin(), entries.end(),
        [](const ValueMask& a, const ValueMask& b) { return a.mask < b.mask; });

    ValueList list;
    list.values.reserve(entries.size());
    for (const auto& entry : entries) {
        list.mask |= entry.mask;
        list.values.push_back(entry.value);
    }
    return list;
}

std::uint16_t requestLength(std::size_t bytes) {
    std::size_t units = (bytes + pad(bytes)) / 4;
    if (units > 0xffff) {
        throw ProtocolError("request of " + std::to_string(bytes) + " bytes exceeds the core length limit");
    }
    return static_cast<std::uint16_t>(units);
}

// ============================================================================
// Errors
// ============================================================================

namespace {

constexpr std::array<std::string_view, 18> kErrorNames = {
    "Success",
    "BadRequest",
    "BadValue",
    "BadWindow",
    "BadPixmap",
    "BadAtom",
    "BadCursor",
    "BadFont",
    "BadMatch",
    "BadDrawable",
    "BadAccess",
    "BadAlloc",
    "BadColor",
    "BadGC",
    "BadIDChoice",
    "BadName",
    "BadLength",
    "BadImplementation",
};

constexpr std::array<std::string_view, 35> kEventNames = {
    "Error",
    "Reply",
    "KeyPress",
    "KeyRelease",
    "ButtonPress",
    "ButtonRelease",
    "MotionNotify",
    "EnterNotify",
    "LeaveNotify",
    "FocusIn",
    "FocusOut",
    "KeymapNotify",
    "Expose",
    "GraphicsExposure",
    "NoExposure",
    "VisibilityNotify",
    "CreateNotify",
    "DestroyNotify",
    "UnmapNotify",
    "MapNotify",
    "MapRequest",
    "ReparentNotify",
    "ConfigureNotify",
    "ConfigureRequest",
    "GravityNotify",
    "ResizeRequest",
    "CirculateNotify",
    "CirculateRequest",
    "PropertyNotify",
    "SelectionClear",
    "SelectionRequest",
    "SelectionNotify",
    "ColormapNotify",
    "ClientMessage",
    "MappingNotify",
};

}

std::string_view errorName(std::uint8_t error_code) {
    if (error_code < kErrorNames.size()) {
        return kErrorNames[error_code];
    }
    return "UnknownError";
}

std::string describeError(const ErrorRecord& record) {
    std::ostringstream oss;
    oss << errorName(record.error_code)
        << " (code " << static_cast<int>(record.error_code) << ")"
        << ", request " << static_cast<int>(record.major_opcode)
        << "." << record.minor_opcode
        << ", resource 0x" << std::hex << record.bad_value << std::dec
        << ", sequence " << record.sequence;
    return oss.str();
}

RequestError::RequestError(const ErrorRecord& record)
    : std::runtime_error("request failed: " + describeError(record)), record_(record) {}

// ============================================================================
// Events
// ============================================================================

Event decodeEvent(const Frame& frame) {
    if (isError(frame)) {
        return frameAs<ErrorRecord>(frame);
    }
    if (isReply(frame)) {
        throw ProtocolError("reply frame where an event was expected");
    }

    std::uint8_t code = responseCode(frame);

    // Decoded records keep the response type with the SendEvent bit stripped
    Frame normalized = frame;
    normalized[0] = code;

    switch (static_cast<EventCode>(code)) {
        case EventCode::KeyPress:
        case EventCode::KeyRelease:
        case EventCode::ButtonPress:
        case EventCode::ButtonRelease:
        case EventCode::MotionNotify:
            return frameAs<InputDeviceEvent>(normalized);

        case EventCode::EnterNotify:
        case EventCode::LeaveNotify:
            return frameAs<CrossingEvent>(normalized);

        case EventCode::FocusIn:
        case EventCode::FocusOut:
            return frameAs<FocusEvent>(normalized);

        case EventCode::DestroyNotify:
            return frameAs<DestroyNotifyEvent>(normalized);

        case EventCode::UnmapNotify:
            return frameAs<UnmapNotifyEvent>(normalized);

        case EventCode::MapRequest:
            return frameAs<MapRequestEvent>(normalized);

        case EventCode::ConfigureRequest:
            return frameAs<ConfigureRequestEvent>(normalized);

        case EventCode::MappingNotify:
            return frameAs<MappingNotifyEvent>(normalized);

        default:
            return frameAs<GenericEvent>(normalized);
    }
}

std::uint8_t eventCode(const Event& event) {
    return std::visit([](const auto& record) { return record.response_type; }, event);
}

std::uint16_t eventSequence(const Event& event) {
    return std::visit([](const auto& record) { return record.sequence; }, event);
}

std::string_view eventName(std::uint8_t code) {
    code &= static_cast<std::uint8_t>(~response::SendEventBit);
    if (code < kEventNames.size()) {
        return kEventNames[code];
    }
    return "UnknownEvent";
}

}
