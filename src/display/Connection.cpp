#include "juicebox/display/Connection.hpp"
#include "juicebox/display/DisplayName.hpp"
#include "juicebox/protocol/Events.hpp"

#include <algorithm>
#include <bit>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace juicebox {

using namespace protocol;

const char* toString(ConnectionError::Kind kind) {
    switch (kind) {
        case ConnectionError::Kind::DisplayNotFound: return "DisplayNotFound";
        case ConnectionError::Kind::InvalidDisplayFormat: return "InvalidDisplayFormat";
        case ConnectionError::Kind::UnsupportedProtocol: return "UnsupportedProtocol";
        case ConnectionError::Kind::AuthenticationFailed: return "AuthenticationFailed";
        case ConnectionError::Kind::ConnectionFailed: return "ConnectionFailed";
        case ConnectionError::Kind::SetupRejected: return "SetupRejected";
        case ConnectionError::Kind::SetupIntegrity: return "SetupIntegrity";
        case ConnectionError::Kind::IdsExhausted: return "IdsExhausted";
        case ConnectionError::Kind::Io: return "Io";
    }
    return "Unknown";
}

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const {
        if (info) freeaddrinfo(info);
    }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

int connectUnix(const std::string& path) {
    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        throw ConnectionError(ConnectionError::Kind::ConnectionFailed, "socket path too long: " + path);
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw ConnectionError(ConnectionError::Kind::ConnectionFailed,
                              std::string("failed to create socket: ") + std::strerror(errno));
    }

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int saved = errno;
        close(fd);
        throw ConnectionError(ConnectionError::Kind::ConnectionFailed,
                              "failed to connect to " + path + ": " + std::strerror(saved));
    }
    return fd;
}

int connectTcp(const std::string& host, unsigned int port) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    std::string service = std::to_string(port);
    int status = getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    if (status != 0) {
        throw ConnectionError(ConnectionError::Kind::ConnectionFailed,
                              "failed to resolve " + host + ": " + gai_strerror(status));
    }
    AddrInfoPtr addresses(raw);

    int last_errno = 0;
    for (addrinfo* info = addresses.get(); info != nullptr; info = info->ai_next) {
        int fd = socket(info->ai_family, info->ai_socktype | SOCK_CLOEXEC, info->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (connect(fd, info->ai_addr, info->ai_addrlen) == 0) {
            return fd;
        }
        last_errno = errno;
        close(fd);
    }

    throw ConnectionError(ConnectionError::Kind::ConnectionFailed,
                          "failed to connect to " + host + ":" + service + ": " + std::strerror(last_errno));
}

}

// ============================================================================
// Lifecycle
// ============================================================================

std::unique_ptr<Connection> Connection::open(const std::optional<std::string>& display_name) {
    std::string name = resolveDisplayName(display_name);

    auto parsed = parseDisplayName(name);
    if (!parsed) {
        throw ConnectionError(ConnectionError::Kind::InvalidDisplayFormat, "invalid display name: " + name);
    }
    if (!parsed->protocol.empty() && parsed->protocol != "unix") {
        throw ConnectionError(ConnectionError::Kind::UnsupportedProtocol,
                              "unsupported display protocol: " + parsed->protocol);
    }

    AuthEntry auth = loadAuthEntry();

    int fd = parsed->isLocal() ? connectUnix(parsed->socketPath())
                               : connectTcp(parsed->host, parsed->tcpPort());

    auto connection = std::make_unique<Connection>(fd, auth);

    std::cout << "[Connection] Connected to " << name
              << " (" << connection->getVendor()
              << ", release " << connection->getSetup().release_number << ")" << std::endl;

    return connection;
}

Connection::Connection(int fd, const AuthEntry& auth) : fd_(fd) {
    try {
        handshake(auth);
    } catch (...) {
        closeSocket();
        throw;
    }
}

Connection::~Connection() {
    closeSocket();
}

void Connection::closeSocket() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
    status_ = Status::Closed;
}

// ============================================================================
// Handshake
// ============================================================================

void Connection::handshake(const AuthEntry& auth) {
    SetupRequest request{};
    request.byte_order = std::endian::native == std::endian::little ? BYTE_ORDER_LSB_FIRST
                                                                    : BYTE_ORDER_MSB_FIRST;
    request.authorization_protocol_name_len = static_cast<std::uint16_t>(auth.name.size());
    request.authorization_protocol_data_len = static_cast<std::uint16_t>(auth.data.size());

    RequestBuffer buffer;
    buffer.put(request);
    buffer.putString(auth.name);
    buffer.align();
    buffer.putString(auth.data);
    buffer.align();
    writeAll(buffer.bytes().data(), buffer.size());

    SetupReplyHeader header;
    readExact(&header, sizeof(header));

    std::vector<std::uint8_t> body(static_cast<std::size_t>(header.length) * 4);
    if (!body.empty()) {
        readExact(body.data(), body.size());
    }

    switch (static_cast<SetupStatus>(header.status)) {
        case SetupStatus::Failed: {
            std::size_t length = std::min<std::size_t>(header.reason_len, body.size());
            std::string reason(body.begin(), body.begin() + length);
            throw ConnectionError(ConnectionError::Kind::SetupRejected,
                                  "server refused the connection: " + reason);
        }

        case SetupStatus::Authenticate: {
            std::string reason(body.begin(), body.end());
            reason = reason.substr(0, reason.find('\0'));
            throw ConnectionError(ConnectionError::Kind::AuthenticationFailed,
                                  "server requested further authentication: " + reason);
        }

        case SetupStatus::Ok:
            parseSetup(body);
            break;

        default:
            throw ConnectionError(ConnectionError::Kind::SetupIntegrity,
                                  "unknown setup status " + std::to_string(header.status));
    }

    xid_.base = setup_.resource_id_base;
    xid_.inc = setup_.resource_id_mask & (~setup_.resource_id_mask + 1);
    status_ = Status::Ok;
}

void Connection::parseSetup(const std::vector<std::uint8_t>& body) {
    ByteReader reader(body);

    try {
        auto record = reader.read<SetupRecord>();
        setup_.release_number = record.release_number;
        setup_.resource_id_base = record.resource_id_base;
        setup_.resource_id_mask = record.resource_id_mask;
        setup_.motion_buffer_size = record.motion_buffer_size;
        setup_.maximum_request_length = record.maximum_request_length;
        setup_.image_byte_order = record.image_byte_order;
        setup_.bitmap_format_bit_order = record.bitmap_format_bit_order;
        setup_.bitmap_format_scanline_unit = record.bitmap_format_scanline_unit;
        setup_.bitmap_format_scanline_pad = record.bitmap_format_scanline_pad;
        setup_.min_keycode = record.min_keycode;
        setup_.max_keycode = record.max_keycode;

        vendor_ = reader.readString(record.vendor_len);
        reader.skip(pad(record.vendor_len));

        formats_.clear();
        for (std::uint8_t i = 0; i < record.pixmap_formats_len; ++i) {
            auto format = reader.read<FormatRecord>();
            formats_.push_back({format.depth, format.bits_per_pixel, format.scanline_pad});
        }

        screens_.clear();
        for (std::uint8_t i = 0; i < record.roots_len; ++i) {
            auto root = reader.read<ScreenRecord>();

            Screen screen{
                root.root,
                root.default_colormap,
                root.white_pixel,
                root.black_pixel,
                root.current_input_masks,
                root.width_in_pixels,
                root.height_in_pixels,
                root.width_in_millimeters,
                root.height_in_millimeters,
                root.min_installed_maps,
                root.max_installed_maps,
                root.root_visual,
                root.backing_stores,
                root.save_unders,
                root.root_depth,
                {},
            };

            for (std::uint8_t d = 0; d < root.allowed_depths_len; ++d) {
                auto depth_record = reader.read<DepthRecord>();
                Depth depth{depth_record.depth, {}};
                depth.visual_types.reserve(depth_record.visuals_len);

                for (std::uint16_t v = 0; v < depth_record.visuals_len; ++v) {
                    auto visual = reader.read<VisualTypeRecord>();
                    depth.visual_types.push_back({
                        visual.visual_id,
                        visual.visual_class,
                        visual.bits_per_rgb_value,
                        visual.colormap_entries,
                        visual.red_mask,
                        visual.green_mask,
                        visual.blue_mask,
                    });
                }
                screen.depths.push_back(std::move(depth));
            }
            screens_.push_back(std::move(screen));
        }
    } catch (const ProtocolError& e) {
        throw ConnectionError(ConnectionError::Kind::SetupIntegrity,
                              std::string("malformed setup data: ") + e.what());
    }

    if (!reader.atEnd()) {
        throw ConnectionError(ConnectionError::Kind::SetupIntegrity,
                              "setup data has " + std::to_string(reader.remaining()) +
                              " unexpected trailing bytes");
    }
}

const Screen& Connection::getDefaultScreen() const {
    if (screens_.empty()) {
        throw ConnectionError(ConnectionError::Kind::SetupIntegrity, "server reported no screens");
    }
    return screens_.front();
}

// ============================================================================
// Resource ids
// ============================================================================

std::uint32_t Connection::generateId() {
    if (status_ != Status::Ok) {
        throw ConnectionError(ConnectionError::Kind::Io, "connection is not established");
    }
    if (xid_.inc == 0) {
        throw ConnectionError(ConnectionError::Kind::IdsExhausted, "server granted an empty resource id mask");
    }

    if (!xid_.opened) {
        // The first id handed out is the base itself
        xid_.opened = true;
        xid_.last = 0;
        xid_.max = setup_.resource_id_mask;
    } else if (xid_.last > xid_.max - xid_.inc) {
        requestIdRange();
    } else {
        xid_.last += xid_.inc;
    }

    return xid_.last | xid_.base;
}

void Connection::requestIdRange() {
    const auto& extension = queryExtension("XC-MISC");
    if (!extension.present) {
        throw ConnectionError(ConnectionError::Kind::IdsExhausted,
                              "resource ids exhausted and XC-MISC is not available");
    }

    GetXIDRangeRequest request{};
    request.major_opcode = extension.major_opcode;
    auto reply = awaitReply<GetXIDRangeReply>(send(request));

    if (reply.count == 0 || (reply.start_id == 0 && reply.count == 1)) {
        throw ConnectionError(ConnectionError::Kind::IdsExhausted, "server has no resource ids left");
    }

    xid_.last = reply.start_id;
    xid_.max = reply.start_id + (reply.count - 1) * xid_.inc;
}

// ============================================================================
// Requests and replies
// ============================================================================

std::uint16_t Connection::send(const RequestBuffer& request) {
    if (status_ != Status::Ok) {
        throw ConnectionError(ConnectionError::Kind::Io, "connection is not established");
    }
    writeAll(request.bytes().data(), request.size());
    return ++sequence_;
}

Frame Connection::readFrame() {
    if (!pending_.empty()) {
        Frame frame = pending_.front();
        pending_.pop_front();
        return frame;
    }
    return readRawFrame();
}

void Connection::discardReply(const Frame& frame) {
    auto header = frameAs<ReplyHeader>(frame);
    std::vector<std::uint8_t> extra(static_cast<std::size_t>(header.length) * 4);
    if (!extra.empty()) {
        readExact(extra.data(), extra.size());
    }
}

std::vector<std::uint8_t> Connection::awaitReply(std::uint16_t sequence) {
    for (;;) {
        Frame frame = readRawFrame();

        if (isReply(frame)) {
            auto header = frameAs<ReplyHeader>(frame);
            std::vector<std::uint8_t> reply(frame.begin(), frame.end());
            std::size_t extra = static_cast<std::size_t>(header.length) * 4;
            if (extra > 0) {
                reply.resize(frame.size() + extra);
                readExact(reply.data() + frame.size(), extra);
            }
            return reply;
        }

        if (isError(frame)) {
            auto error = frameAs<ErrorRecord>(frame);
            if (error.sequence == sequence) {
                throw RequestError(error);
            }
        }

        pending_.push_back(frame);
    }
}

std::optional<ErrorRecord> Connection::checkRequest(std::uint16_t sequence) {
    sync();

    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (!isError(*it)) {
            continue;
        }
        auto error = frameAs<ErrorRecord>(*it);
        if (error.sequence == sequence) {
            pending_.erase(it);
            return error;
        }
    }
    return std::nullopt;
}

void Connection::sync() {
    GetInputFocusRequest request{};
    awaitReply(send(request));
}

const QueryExtensionReply& Connection::queryExtension(std::string_view name) {
    std::string key(name);
    auto cached = extensions_.find(key);
    if (cached != extensions_.end()) {
        return cached->second;
    }

    QueryExtensionRequest request{};
    request.name_len = static_cast<std::uint16_t>(name.size());
    request.length = requestLength(sizeof(request) + name.size());

    RequestBuffer buffer;
    buffer.put(request);
    buffer.putString(name);
    buffer.align();

    auto reply = awaitReply<QueryExtensionReply>(send(buffer));
    return extensions_.emplace(std::move(key), reply).first->second;
}

Atom Connection::internAtom(std::string_view name, bool only_if_exists) {
    InternAtomRequest request{};
    request.only_if_exists = only_if_exists ? 1 : 0;
    request.name_len = static_cast<std::uint16_t>(name.size());
    request.length = requestLength(sizeof(request) + name.size());

    RequestBuffer buffer;
    buffer.put(request);
    buffer.putString(name);
    buffer.align();

    return awaitReply<InternAtomReply>(send(buffer)).atom;
}

// ============================================================================
// Socket I/O
// ============================================================================

Frame Connection::readRawFrame() {
    Frame frame;
    readExact(frame.data(), frame.size());
    return frame;
}

void Connection::readExact(void* buffer, std::size_t size) {
    auto* out = static_cast<std::uint8_t*>(buffer);
    std::size_t done = 0;

    while (done < size) {
        ssize_t got = read(fd_, out + done, size - done);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ConnectionError(ConnectionError::Kind::Io,
                                  std::string("read from X server failed: ") + std::strerror(errno));
        }
        if (got == 0) {
            status_ = Status::Closed;
            throw ConnectionError(ConnectionError::Kind::Io, "X server closed the connection");
        }
        done += static_cast<std::size_t>(got);
    }
}

void Connection::writeAll(const void* buffer, std::size_t size) {
    const auto* in = static_cast<const std::uint8_t*>(buffer);
    std::size_t done = 0;

    while (done < size) {
        ssize_t sent = ::send(fd_, in + done, size - done, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ConnectionError(ConnectionError::Kind::Io,
                                  std::string("write to X server failed: ") + std::strerror(errno));
        }
        done += static_cast<std::size_t>(sent);
    }
}

}
