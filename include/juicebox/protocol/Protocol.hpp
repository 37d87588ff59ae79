#pragma once

/**
 * @file Protocol.hpp
 * @brief X11 core protocol constants and wire records
 *
 * Every record here is laid out exactly as it travels on the wire in the
 * client's native byte order, so requests are built by filling a record and
 * copying its bytes, and replies/events are decoded by copying 32 bytes back
 * into the matching record.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace juicebox::protocol {

using WindowId = std::uint32_t;
using Atom = std::uint32_t;
using VisualId = std::uint32_t;
using Colormap = std::uint32_t;
using GContext = std::uint32_t;
using Timestamp = std::uint32_t;
using Keycode = std::uint8_t;
using Keysym = std::uint32_t;

/// Every event, error and reply header is exactly 32 bytes.
using Frame = std::array<std::uint8_t, 32>;

constexpr std::uint16_t MAJOR_VERSION = 11;
constexpr std::uint16_t MINOR_VERSION = 0;

constexpr std::uint8_t BYTE_ORDER_LSB_FIRST = 0x6c;  // 'l'
constexpr std::uint8_t BYTE_ORDER_MSB_FIRST = 0x42;  // 'B'

constexpr WindowId NONE = 0;
constexpr Keysym NO_SYMBOL = 0;
constexpr Timestamp CURRENT_TIME = 0;

/// Number of bytes needed to bring @p length up to a multiple of four.
constexpr std::size_t pad(std::size_t length) noexcept {
    return (0 - length) & 3u;
}

namespace opcode {
    constexpr std::uint8_t CreateWindow = 1;
    constexpr std::uint8_t ChangeWindowAttributes = 2;
    constexpr std::uint8_t MapWindow = 8;
    constexpr std::uint8_t UnmapWindow = 10;
    constexpr std::uint8_t ConfigureWindow = 12;
    constexpr std::uint8_t InternAtom = 16;
    constexpr std::uint8_t ChangeProperty = 18;
    constexpr std::uint8_t GrabButton = 28;
    constexpr std::uint8_t UngrabButton = 29;
    constexpr std::uint8_t GrabKey = 33;
    constexpr std::uint8_t UngrabKey = 34;
    constexpr std::uint8_t SetInputFocus = 42;
    constexpr std::uint8_t GetInputFocus = 43;
    constexpr std::uint8_t CreateGC = 55;
    constexpr std::uint8_t QueryExtension = 98;
    constexpr std::uint8_t GetKeyboardMapping = 101;
    constexpr std::uint8_t KillClient = 113;

    /// Minor opcode of XC-MISC GetXIDRange; the major one comes from QueryExtension.
    constexpr std::uint8_t XCMiscGetXIDRange = 1;
}

namespace atom {
    constexpr Atom INTEGER = 19;
    constexpr Atom STRING = 31;
    constexpr Atom WM_NAME = 39;
}

/// First byte of every 32-byte frame read from the server.
namespace response {
    constexpr std::uint8_t Error = 0;
    constexpr std::uint8_t Reply = 1;
    constexpr std::uint8_t SendEventBit = 0x80;
}

enum class EventCode : std::uint8_t {
    KeyPress = 2,
    KeyRelease,
    ButtonPress,
    ButtonRelease,
    MotionNotify,
    EnterNotify,
    LeaveNotify,
    FocusIn,
    FocusOut,
    KeymapNotify,
    Expose,
    GraphicsExposure,
    NoExposure,
    VisibilityNotify,
    CreateNotify,
    DestroyNotify,
    UnmapNotify,
    MapNotify,
    MapRequest,
    ReparentNotify,
    ConfigureNotify,
    ConfigureRequest,
    GravityNotify,
    ResizeRequest,
    CirculateNotify,
    CirculateRequest,
    PropertyNotify,
    SelectionClear,
    SelectionRequest,
    SelectionNotify,
    ColormapNotify,
    ClientMessage,
    MappingNotify,
};

constexpr std::uint8_t LAST_EVENT_CODE = 34;

/// X Generic Event; carries 4 * length bytes past the 32-byte frame.
constexpr std::uint8_t GENERIC_EVENT_CODE = 35;

namespace event_mask {
    constexpr std::uint32_t NoEvent = 0;
    constexpr std::uint32_t KeyPress = 1u << 0;
    constexpr std::uint32_t KeyRelease = 1u << 1;
    constexpr std::uint32_t ButtonPress = 1u << 2;
    constexpr std::uint32_t ButtonRelease = 1u << 3;
    constexpr std::uint32_t EnterWindow = 1u << 4;
    constexpr std::uint32_t LeaveWindow = 1u << 5;
    constexpr std::uint32_t PointerMotion = 1u << 6;
    constexpr std::uint32_t Exposure = 1u << 15;
    constexpr std::uint32_t StructureNotify = 1u << 17;
    constexpr std::uint32_t SubstructureNotify = 1u << 19;
    constexpr std::uint32_t SubstructureRedirect = 1u << 20;
    constexpr std::uint32_t FocusChange = 1u << 21;
    constexpr std::uint32_t PropertyChange = 1u << 22;
}

namespace modifier {
    constexpr std::uint16_t Shift = 1u << 0;
    constexpr std::uint16_t Lock = 1u << 1;
    constexpr std::uint16_t Control = 1u << 2;
    constexpr std::uint16_t Mod1 = 1u << 3;
    constexpr std::uint16_t Mod2 = 1u << 4;
    constexpr std::uint16_t Mod3 = 1u << 5;
    constexpr std::uint16_t Mod4 = 1u << 6;
    constexpr std::uint16_t Mod5 = 1u << 7;
    constexpr std::uint16_t Any = 1u << 15;
}

/// Bits of the CreateWindow / ChangeWindowAttributes value mask.
namespace window_attribute {
    constexpr std::uint32_t BackPixmap = 1u << 0;
    constexpr std::uint32_t BackPixel = 1u << 1;
    constexpr std::uint32_t BorderPixmap = 1u << 2;
    constexpr std::uint32_t BorderPixel = 1u << 3;
    constexpr std::uint32_t BitGravity = 1u << 4;
    constexpr std::uint32_t WinGravity = 1u << 5;
    constexpr std::uint32_t BackingStore = 1u << 6;
    constexpr std::uint32_t BackingPlanes = 1u << 7;
    constexpr std::uint32_t BackingPixel = 1u << 8;
    constexpr std::uint32_t OverrideRedirect = 1u << 9;
    constexpr std::uint32_t SaveUnder = 1u << 10;
    constexpr std::uint32_t EventMask = 1u << 11;
    constexpr std::uint32_t DontPropagate = 1u << 12;
    constexpr std::uint32_t Colormap = 1u << 13;
    constexpr std::uint32_t Cursor = 1u << 14;
}

/// Bits of the ConfigureWindow value mask.
namespace config_window {
    constexpr std::uint16_t X = 1u << 0;
    constexpr std::uint16_t Y = 1u << 1;
    constexpr std::uint16_t Width = 1u << 2;
    constexpr std::uint16_t Height = 1u << 3;
    constexpr std::uint16_t BorderWidth = 1u << 4;
    constexpr std::uint16_t Sibling = 1u << 5;
    constexpr std::uint16_t StackMode = 1u << 6;
}

/// Bits of the CreateGC value mask used by the manager.
namespace gc_attribute {
    constexpr std::uint32_t Foreground = 1u << 2;
    constexpr std::uint32_t Background = 1u << 3;
    constexpr std::uint32_t LineWidth = 1u << 4;
}

enum class WindowClass : std::uint16_t {
    CopyFromParent = 0,
    InputOutput = 1,
    InputOnly = 2,
};

enum class PropertyMode : std::uint8_t {
    Replace = 0,
    Prepend = 1,
    Append = 2,
};

enum class GrabMode : std::uint8_t {
    Sync = 0,
    Async = 1,
};

enum class InputFocusRevert : std::uint8_t {
    None = 0,
    PointerRoot = 1,
    Parent = 2,
};

enum class NotifyMode : std::uint8_t {
    Normal = 0,
    Grab = 1,
    Ungrab = 2,
    WhileGrabbed = 3,
};

enum class NotifyDetail : std::uint8_t {
    Ancestor = 0,
    Virtual = 1,
    Inferior = 2,
    Nonlinear = 3,
    NonlinearVirtual = 4,
    Pointer = 5,
    PointerRoot = 6,
    None = 7,
};

enum class MappingRequest : std::uint8_t {
    Modifier = 0,
    Keyboard = 1,
    Pointer = 2,
};

enum class ErrorCode : std::uint8_t {
    Request = 1,
    Value = 2,
    Window = 3,
    Pixmap = 4,
    Atom = 5,
    Cursor = 6,
    Font = 7,
    Match = 8,
    Drawable = 9,
    Access = 10,
    Alloc = 11,
    Colormap = 12,
    GContext = 13,
    IDChoice = 14,
    Name = 15,
    Length = 16,
    Implementation = 17,
};

/**
 * @brief One entry of a request value list
 *
 * The X server expects values in ascending order of their mask bit; see
 * makeValueList().
 */
struct ValueMask {
    std::uint32_t mask;
    std::uint32_t value;
};

struct ValueList {
    std::uint32_t mask{0};
    std::vector<std::uint32_t> values;
};

/// Sort @p entries by mask bit and fold them into a mask plus ordered values.
ValueList makeValueList(std::vector<ValueMask> entries);

// ============================================================================
// Connection setup
// ============================================================================

struct SetupRequest {
    std::uint8_t byte_order;
    std::uint8_t pad0{0};
    std::uint16_t protocol_major_version{MAJOR_VERSION};
    std::uint16_t protocol_minor_version{MINOR_VERSION};
    std::uint16_t authorization_protocol_name_len{0};
    std::uint16_t authorization_protocol_data_len{0};
    std::uint8_t pad1[2]{};
};

enum class SetupStatus : std::uint8_t {
    Failed = 0,
    Ok = 1,
    Authenticate = 2,
};

struct SetupReplyHeader {
    std::uint8_t status;
    std::uint8_t reason_len;
    std::uint16_t protocol_major_version;
    std::uint16_t protocol_minor_version;
    std::uint16_t length;
};

struct SetupRecord {
    std::uint32_t release_number;
    std::uint32_t resource_id_base;
    std::uint32_t resource_id_mask;
    std::uint32_t motion_buffer_size;
    std::uint16_t vendor_len;
    std::uint16_t maximum_request_length;
    std::uint8_t roots_len;
    std::uint8_t pixmap_formats_len;
    std::uint8_t image_byte_order;
    std::uint8_t bitmap_format_bit_order;
    std::uint8_t bitmap_format_scanline_unit;
    std::uint8_t bitmap_format_scanline_pad;
    Keycode min_keycode;
    Keycode max_keycode;
    std::uint8_t pad0[4];
};

struct FormatRecord {
    std::uint8_t depth;
    std::uint8_t bits_per_pixel;
    std::uint8_t scanline_pad;
    std::uint8_t pad0[5];
};

struct ScreenRecord {
    WindowId root;
    Colormap default_colormap;
    std::uint32_t white_pixel;
    std::uint32_t black_pixel;
    std::uint32_t current_input_masks;
    std::uint16_t width_in_pixels;
    std::uint16_t height_in_pixels;
    std::uint16_t width_in_millimeters;
    std::uint16_t height_in_millimeters;
    std::uint16_t min_installed_maps;
    std::uint16_t max_installed_maps;
    VisualId root_visual;
    std::uint8_t backing_stores;
    std::uint8_t save_unders;
    std::uint8_t root_depth;
    std::uint8_t allowed_depths_len;
};

struct DepthRecord {
    std::uint8_t depth;
    std::uint8_t pad0;
    std::uint16_t visuals_len;
    std::uint8_t pad1[4];
};

struct VisualTypeRecord {
    VisualId visual_id;
    std::uint8_t visual_class;
    std::uint8_t bits_per_rgb_value;
    std::uint16_t colormap_entries;
    std::uint32_t red_mask;
    std::uint32_t green_mask;
    std::uint32_t blue_mask;
    std::uint8_t pad0[4];
};

// ============================================================================
// Requests
// ============================================================================

struct CreateWindowRequest {
    std::uint8_t major_opcode{opcode::CreateWindow};
    std::uint8_t depth{0};
    std::uint16_t length{8};
    WindowId wid;
    WindowId parent;
    std::int16_t x{0};
    std::int16_t y{0};
    std::uint16_t width;
    std::uint16_t height;
    std::uint16_t border_width{0};
    std::uint16_t window_class{static_cast<std::uint16_t>(WindowClass::InputOutput)};
    VisualId visual;
    std::uint32_t value_mask{0};
};

struct ChangeWindowAttributesRequest {
    std::uint8_t major_opcode{opcode::ChangeWindowAttributes};
    std::uint8_t pad0{0};
    std::uint16_t length{3};
    WindowId window;
    std::uint32_t value_mask{0};
};

struct MapWindowRequest {
    std::uint8_t major_opcode{opcode::MapWindow};
    std::uint8_t pad0{0};
    std::uint16_t length{2};
    WindowId window;
};

struct UnmapWindowRequest {
    std::uint8_t major_opcode{opcode::UnmapWindow};
    std::uint8_t pad0{0};
    std::uint16_t length{2};
    WindowId window;
};

struct ConfigureWindowRequest {
    std::uint8_t major_opcode{opcode::ConfigureWindow};
    std::uint8_t pad0{0};
    std::uint16_t length{3};
    WindowId window;
    std::uint16_t value_mask{0};
    std::uint8_t pad1[2]{};
};

struct InternAtomRequest {
    std::uint8_t major_opcode{opcode::InternAtom};
    std::uint8_t only_if_exists{0};
    std::uint16_t length{2};
    std::uint16_t name_len{0};
    std::uint8_t pad0[2]{};
};

struct ChangePropertyRequest {
    std::uint8_t major_opcode{opcode::ChangeProperty};
    std::uint8_t mode{static_cast<std::uint8_t>(PropertyMode::Replace)};
    std::uint16_t length{6};
    WindowId window;
    Atom property;
    Atom type;
    std::uint8_t format{8};
    std::uint8_t pad0[3]{};
    std::uint32_t data_len{0};
};

struct GrabButtonRequest {
    std::uint8_t major_opcode{opcode::GrabButton};
    std::uint8_t owner_events{1};
    std::uint16_t length{6};
    WindowId grab_window;
    std::uint16_t event_mask{0};
    std::uint8_t pointer_mode{static_cast<std::uint8_t>(GrabMode::Async)};
    std::uint8_t keyboard_mode{static_cast<std::uint8_t>(GrabMode::Async)};
    WindowId confine_to{NONE};
    std::uint32_t cursor{NONE};
    std::uint8_t button;
    std::uint8_t pad0{0};
    std::uint16_t modifiers;
};

struct UngrabButtonRequest {
    std::uint8_t major_opcode{opcode::UngrabButton};
    std::uint8_t button;
    std::uint16_t length{3};
    WindowId grab_window;
    std::uint16_t modifiers;
    std::uint8_t pad0[2]{};
};

struct GrabKeyRequest {
    std::uint8_t major_opcode{opcode::GrabKey};
    std::uint8_t owner_events{1};
    std::uint16_t length{4};
    WindowId grab_window;
    std::uint16_t modifiers;
    Keycode key;
    std::uint8_t pointer_mode{static_cast<std::uint8_t>(GrabMode::Async)};
    std::uint8_t keyboard_mode{static_cast<std::uint8_t>(GrabMode::Async)};
    std::uint8_t pad0[3]{};
};

struct UngrabKeyRequest {
    std::uint8_t major_opcode{opcode::UngrabKey};
    Keycode key;
    std::uint16_t length{3};
    WindowId grab_window;
    std::uint16_t modifiers;
    std::uint8_t pad0[2]{};
};

struct SetInputFocusRequest {
    std::uint8_t major_opcode{opcode::SetInputFocus};
    std::uint8_t revert_to{static_cast<std::uint8_t>(InputFocusRevert::PointerRoot)};
    std::uint16_t length{3};
    WindowId focus;
    Timestamp time{CURRENT_TIME};
};

struct GetInputFocusRequest {
    std::uint8_t major_opcode{opcode::GetInputFocus};
    std::uint8_t pad0{0};
    std::uint16_t length{1};
};

struct CreateGCRequest {
    std::uint8_t major_opcode{opcode::CreateGC};
    std::uint8_t pad0{0};
    std::uint16_t length{4};
    GContext cid;
    WindowId drawable;
    std::uint32_t value_mask{0};
};

struct QueryExtensionRequest {
    std::uint8_t major_opcode{opcode::QueryExtension};
    std::uint8_t pad0{0};
    std::uint16_t length{2};
    std::uint16_t name_len{0};
    std::uint8_t pad1[2]{};
};

struct GetKeyboardMappingRequest {
    std::uint8_t major_opcode{opcode::GetKeyboardMapping};
    std::uint8_t pad0{0};
    std::uint16_t length{2};
    Keycode first_keycode;
    std::uint8_t count;
    std::uint8_t pad1[2]{};
};

struct KillClientRequest {
    std::uint8_t major_opcode{opcode::KillClient};
    std::uint8_t pad0{0};
    std::uint16_t length{2};
    std::uint32_t resource;
};

struct GetXIDRangeRequest {
    std::uint8_t major_opcode;
    std::uint8_t minor_opcode{opcode::XCMiscGetXIDRange};
    std::uint16_t length{1};
};

// ============================================================================
// Replies
// ============================================================================

struct ReplyHeader {
    std::uint8_t response_type;
    std::uint8_t data;
    std::uint16_t sequence;
    std::uint32_t length;
    std::uint8_t pad0[24];
};

struct QueryExtensionReply {
    std::uint8_t response_type;
    std::uint8_t pad0;
    std::uint16_t sequence;
    std::uint32_t length;
    std::uint8_t present;
    std::uint8_t major_opcode;
    std::uint8_t first_event;
    std::uint8_t first_error;
    std::uint8_t pad1[20];
};

struct InternAtomReply {
    std::uint8_t response_type;
    std::uint8_t pad0;
    std::uint16_t sequence;
    std::uint32_t length;
    Atom atom;
    std::uint8_t pad1[20];
};

struct GetInputFocusReply {
    std::uint8_t response_type;
    std::uint8_t revert_to;
    std::uint16_t sequence;
    std::uint32_t length;
    WindowId focus;
    std::uint8_t pad0[20];
};

struct GetKeyboardMappingReply {
    std::uint8_t response_type;
    std::uint8_t keysyms_per_keycode;
    std::uint16_t sequence;
    std::uint32_t length;
    std::uint8_t pad0[24];
};

struct GetXIDRangeReply {
    std::uint8_t response_type;
    std::uint8_t pad0;
    std::uint16_t sequence;
    std::uint32_t length;
    std::uint32_t start_id;
    std::uint32_t count;
    std::uint8_t pad1[16];
};

// ============================================================================
// Errors and events
// ============================================================================

struct ErrorRecord {
    std::uint8_t response_type;
    std::uint8_t error_code;
    std::uint16_t sequence;
    std::uint32_t bad_value;
    std::uint16_t minor_opcode;
    std::uint8_t major_opcode;
    std::uint8_t pad0[21];
};

/// KeyPress, KeyRelease, ButtonPress, ButtonRelease and MotionNotify.
struct InputDeviceEvent {
    std::uint8_t response_type;
    std::uint8_t detail;
    std::uint16_t sequence;
    Timestamp time;
    WindowId root;
    WindowId event;
    WindowId child;
    std::int16_t root_x;
    std::int16_t root_y;
    std::int16_t event_x;
    std::int16_t event_y;
    std::uint16_t state;
    std::uint8_t same_screen;
    std::uint8_t pad0;
};

/// EnterNotify and LeaveNotify.
struct CrossingEvent {
    std::uint8_t response_type;
    std::uint8_t detail;
    std::uint16_t sequence;
    Timestamp time;
    WindowId root;
    WindowId event;
    WindowId child;
    std::int16_t root_x;
    std::int16_t root_y;
    std::int16_t event_x;
    std::int16_t event_y;
    std::uint16_t state;
    std::uint8_t mode;
    std::uint8_t same_screen_focus;
};

/// FocusIn and FocusOut.
struct FocusEvent {
    std::uint8_t response_type;
    std::uint8_t detail;
    std::uint16_t sequence;
    WindowId event;
    std::uint8_t mode;
    std::uint8_t pad0[23];
};

struct DestroyNotifyEvent {
    std::uint8_t response_type;
    std::uint8_t pad0;
    std::uint16_t sequence;
    WindowId event;
    WindowId window;
    std::uint8_t pad1[20];
};

struct UnmapNotifyEvent {
    std::uint8_t response_type;
    std::uint8_t pad0;
    std::uint16_t sequence;
    WindowId event;
    WindowId window;
    std::uint8_t from_configure;
    std::uint8_t pad1[19];
};

struct MapRequestEvent {
    std::uint8_t response_type;
    std::uint8_t pad0;
    std::uint16_t sequence;
    WindowId parent;
    WindowId window;
    std::uint8_t pad1[20];
};

struct ConfigureRequestEvent {
    std::uint8_t response_type;
    std::uint8_t stack_mode;
    std::uint16_t sequence;
    WindowId parent;
    WindowId window;
    WindowId sibling;
    std::int16_t x;
    std::int16_t y;
    std::uint16_t width;
    std::uint16_t height;
    std::uint16_t border_width;
    std::uint16_t value_mask;
    std::uint8_t pad0[4];
};

struct MappingNotifyEvent {
    std::uint8_t response_type;
    std::uint8_t pad0;
    std::uint16_t sequence;
    std::uint8_t request;
    Keycode first_keycode;
    std::uint8_t count;
    std::uint8_t pad1[25];
};

/// Any event the manager does not decode further.
struct GenericEvent {
    std::uint8_t response_type;
    std::uint8_t detail;
    std::uint16_t sequence;
    std::uint8_t pad0[28];
};

namespace detail {

template <typename T, std::size_t Size>
constexpr bool isWireRecord() {
    return sizeof(T) == Size && std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;
}

}

static_assert(detail::isWireRecord<SetupRequest, 12>());
static_assert(detail::isWireRecord<SetupReplyHeader, 8>());
static_assert(detail::isWireRecord<SetupRecord, 32>());
static_assert(detail::isWireRecord<FormatRecord, 8>());
static_assert(detail::isWireRecord<ScreenRecord, 40>());
static_assert(detail::isWireRecord<DepthRecord, 8>());
static_assert(detail::isWireRecord<VisualTypeRecord, 24>());

static_assert(detail::isWireRecord<CreateWindowRequest, 32>());
static_assert(detail::isWireRecord<ChangeWindowAttributesRequest, 12>());
static_assert(detail::isWireRecord<MapWindowRequest, 8>());
static_assert(detail::isWireRecord<UnmapWindowRequest, 8>());
static_assert(detail::isWireRecord<ConfigureWindowRequest, 12>());
static_assert(detail::isWireRecord<InternAtomRequest, 8>());
static_assert(detail::isWireRecord<ChangePropertyRequest, 24>());
static_assert(detail::isWireRecord<GrabButtonRequest, 24>());
static_assert(detail::isWireRecord<UngrabButtonRequest, 12>());
static_assert(detail::isWireRecord<GrabKeyRequest, 16>());
static_assert(detail::isWireRecord<UngrabKeyRequest, 12>());
static_assert(detail::isWireRecord<SetInputFocusRequest, 12>());
static_assert(detail::isWireRecord<GetInputFocusRequest, 4>());
static_assert(detail::isWireRecord<CreateGCRequest, 16>());
static_assert(detail::isWireRecord<QueryExtensionRequest, 8>());
static_assert(detail::isWireRecord<GetKeyboardMappingRequest, 8>());
static_assert(detail::isWireRecord<KillClientRequest, 8>());
static_assert(detail::isWireRecord<GetXIDRangeRequest, 4>());

static_assert(detail::isWireRecord<ReplyHeader, 32>());
static_assert(detail::isWireRecord<QueryExtensionReply, 32>());
static_assert(detail::isWireRecord<InternAtomReply, 32>());
static_assert(detail::isWireRecord<GetInputFocusReply, 32>());
static_assert(detail::isWireRecord<GetKeyboardMappingReply, 32>());
static_assert(detail::isWireRecord<GetXIDRangeReply, 32>());

static_assert(detail::isWireRecord<ErrorRecord, 32>());
static_assert(detail::isWireRecord<InputDeviceEvent, 32>());
static_assert(detail::isWireRecord<CrossingEvent, 32>());
static_assert(detail::isWireRecord<FocusEvent, 32>());
static_assert(detail::isWireRecord<DestroyNotifyEvent, 32>());
static_assert(detail::isWireRecord<UnmapNotifyEvent, 32>());
static_assert(detail::isWireRecord<MapRequestEvent, 32>());
static_assert(detail::isWireRecord<ConfigureRequestEvent, 32>());
static_assert(detail::isWireRecord<MappingNotifyEvent, 32>());
static_assert(detail::isWireRecord<GenericEvent, 32>());

} // namespace juicebox::protocol
