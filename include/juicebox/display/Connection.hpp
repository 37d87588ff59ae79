#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "juicebox/display/Authority.hpp"
#include "juicebox/protocol/Protocol.hpp"
#include "juicebox/protocol/Wire.hpp"

namespace juicebox {

/**
 * @brief Failure to establish or keep a connection to the X server
 */
class ConnectionError : public std::runtime_error {
public:
    enum class Kind {
        DisplayNotFound,
        InvalidDisplayFormat,
        UnsupportedProtocol,
        AuthenticationFailed,
        ConnectionFailed,
        SetupRejected,
        SetupIntegrity,
        IdsExhausted,
        Io,
    };

    ConnectionError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind getKind() const { return kind_; }

private:
    Kind kind_;
};

const char* toString(ConnectionError::Kind kind);

struct Setup {
    std::uint32_t release_number{0};
    std::uint32_t resource_id_base{0};
    std::uint32_t resource_id_mask{0};
    std::uint32_t motion_buffer_size{0};
    std::uint16_t maximum_request_length{0};
    std::uint8_t image_byte_order{0};
    std::uint8_t bitmap_format_bit_order{0};
    std::uint8_t bitmap_format_scanline_unit{0};
    std::uint8_t bitmap_format_scanline_pad{0};
    protocol::Keycode min_keycode{0};
    protocol::Keycode max_keycode{0};
};

struct Format {
    std::uint8_t depth;
    std::uint8_t bits_per_pixel;
    std::uint8_t scanline_pad;
};

struct VisualType {
    protocol::VisualId visual_id;
    std::uint8_t visual_class;
    std::uint8_t bits_per_rgb_value;
    std::uint16_t colormap_entries;
    std::uint32_t red_mask;
    std::uint32_t green_mask;
    std::uint32_t blue_mask;
};

struct Depth {
    std::uint8_t depth;
    std::vector<VisualType> visual_types;
};

struct Screen {
    protocol::WindowId root;
    protocol::Colormap default_colormap;
    std::uint32_t white_pixel;
    std::uint32_t black_pixel;
    std::uint32_t current_input_masks;
    std::uint16_t width_in_pixels;
    std::uint16_t height_in_pixels;
    std::uint16_t width_in_millimeters;
    std::uint16_t height_in_millimeters;
    std::uint16_t min_installed_maps;
    std::uint16_t max_installed_maps;
    protocol::VisualId root_visual;
    std::uint8_t backing_stores;
    std::uint8_t save_unders;
    std::uint8_t root_depth;
    std::vector<Depth> depths;
};

/**
 * @brief Synchronous connection to an X server
 *
 * Owns the socket, the decoded setup data and the resource-id allocator.
 * Requests are written whole; replies are awaited in the caller. Events and
 * errors that arrive while a reply is awaited are queued and handed out by
 * readFrame() in arrival order.
 */
class Connection {
public:
    enum class Status {
        Authenticating,
        Ok,
        Closed,
    };

    /**
     * @brief Resolve, connect and handshake
     * @param display_name Specifier to use instead of $DISPLAY
     * @throws ConnectionError
     */
    static std::unique_ptr<Connection> open(const std::optional<std::string>& display_name = std::nullopt);

    /**
     * @brief Handshake over an already connected socket
     *
     * Takes ownership of @p fd; it is closed by the destructor, or before
     * the exception leaves when the handshake fails.
     */
    Connection(int fd, const AuthEntry& auth);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Allocate a fresh resource id
     *
     * Walks the range granted at setup, then asks XC-MISC for more.
     * @throws ConnectionError (IdsExhausted)
     */
    std::uint32_t generateId();

    /// Write a complete request and return the sequence number it was given.
    std::uint16_t send(const protocol::RequestBuffer& request);

    template <typename T>
    std::uint16_t send(const T& record) {
        protocol::RequestBuffer buffer;
        buffer.put(record);
        return send(buffer);
    }

    /**
     * @brief Next event or error, queued ones first
     *
     * Replies are returned too; the caller is expected to discard them with
     * discardReply().
     */
    protocol::Frame readFrame();

    /// Skip the body of a reply, or of a generic event, that nobody is waiting for.
    void discardReply(const protocol::Frame& frame);

    /**
     * @brief Block until the reply to @p sequence arrives
     * @return Full reply: the 32-byte header followed by its extra data
     * @throws protocol::RequestError when the request failed
     */
    std::vector<std::uint8_t> awaitReply(std::uint16_t sequence);

    template <typename Reply>
    Reply awaitReply(std::uint16_t sequence) {
        auto bytes = awaitReply(sequence);
        protocol::ByteReader reader(bytes);
        return reader.read<Reply>();
    }

    /**
     * @brief Round-trip and report whether @p sequence failed
     *
     * Uses GetInputFocus as a barrier; any error for an earlier request is
     * then already in the queue.
     */
    std::optional<protocol::ErrorRecord> checkRequest(std::uint16_t sequence);

    /// Round-trip to the server, leaving events in the queue.
    void sync();

    /// QueryExtension, cached by name.
    const protocol::QueryExtensionReply& queryExtension(std::string_view name);
    bool hasExtension(std::string_view name) { return queryExtension(name).present != 0; }

    protocol::Atom internAtom(std::string_view name, bool only_if_exists = false);

    const Setup& getSetup() const { return setup_; }
    const std::string& getVendor() const { return vendor_; }
    const std::vector<Format>& getFormats() const { return formats_; }
    const std::vector<Screen>& getScreens() const { return screens_; }
    const Screen& getDefaultScreen() const;
    Status getStatus() const { return status_; }
    int getFd() const { return fd_; }
    std::uint16_t getLastSequence() const { return sequence_; }

    bool hasPendingFrames() const { return !pending_.empty(); }

private:
    struct XidAllocator {
        std::uint32_t base{0};
        std::uint32_t inc{0};
        std::uint32_t last{0};
        std::uint32_t max{0};
        bool opened{false};
    };

    void handshake(const AuthEntry& auth);
    void parseSetup(const std::vector<std::uint8_t>& body);
    void requestIdRange();

    protocol::Frame readRawFrame();
    void readExact(void* buffer, std::size_t size);
    void writeAll(const void* buffer, std::size_t size);
    void closeSocket();

    int fd_{-1};
    Status status_{Status::Authenticating};

    Setup setup_;
    std::string vendor_;
    std::vector<Format> formats_;
    std::vector<Screen> screens_;

    XidAllocator xid_;
    std::uint16_t sequence_{0};
    std::deque<protocol::Frame> pending_;
    std::unordered_map<std::string, protocol::QueryExtensionReply> extensions_;
};

}
