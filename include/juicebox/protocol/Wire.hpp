#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "juicebox/protocol/Errors.hpp"
#include "juicebox/protocol/Protocol.hpp"

namespace juicebox::protocol {

/**
 * @brief Growable byte buffer a single request is assembled into
 *
 * Records are appended by raw copy. Variable-length tails (names, value
 * lists, property data) are appended afterwards and padded with align().
 */
class RequestBuffer {
public:
    RequestBuffer() = default;

    template <typename T>
    void put(const T& record) {
        static_assert(std::is_trivially_copyable_v<T>, "wire records must be trivially copyable");
        putBytes(&record, sizeof(T));
    }

    void putBytes(const void* data, std::size_t size) {
        const auto* bytes = static_cast<const std::uint8_t*>(data);
        bytes_.insert(bytes_.end(), bytes, bytes + size);
    }

    void putString(std::string_view text) { putBytes(text.data(), text.size()); }

    void putValues(const std::vector<std::uint32_t>& values) {
        for (std::uint32_t value : values) {
            put(value);
        }
    }

    /// Zero-fill up to the next four-byte boundary.
    void align() { bytes_.resize(bytes_.size() + pad(bytes_.size()), 0); }

    const std::vector<std::uint8_t>& bytes() const { return bytes_; }
    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

private:
    std::vector<std::uint8_t> bytes_;
};

/**
 * @brief Bounds-checked cursor over bytes received from the server
 */
class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    explicit ByteReader(const std::vector<std::uint8_t>& bytes)
        : data_(bytes.data()), size_(bytes.size()) {}

    template <typename T>
    T read() {
        static_assert(std::is_trivially_copyable_v<T>, "wire records must be trivially copyable");
        T value;
        std::memcpy(&value, take(sizeof(T)), sizeof(T));
        return value;
    }

    std::string readString(std::size_t length) {
        const auto* bytes = take(length);
        return std::string(reinterpret_cast<const char*>(bytes), length);
    }

    void skip(std::size_t length) { take(length); }

    std::size_t offset() const { return offset_; }
    std::size_t remaining() const { return size_ - offset_; }
    bool atEnd() const { return offset_ == size_; }

private:
    const std::uint8_t* take(std::size_t length) {
        if (length > remaining()) {
            throw ProtocolError("truncated data: wanted " + std::to_string(length) +
                                " bytes at offset " + std::to_string(offset_) +
                                ", " + std::to_string(remaining()) + " left");
        }
        const std::uint8_t* at = data_ + offset_;
        offset_ += length;
        return at;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t offset_{0};
};

/// Request length field (in four-byte units) for a request of @p bytes.
std::uint16_t requestLength(std::size_t bytes);

/// Copy a 32-byte frame into the record it starts.
template <typename T>
T frameAs(const Frame& frame) {
    static_assert(sizeof(T) == sizeof(Frame), "frame records are 32 bytes");
    T record;
    std::memcpy(&record, frame.data(), sizeof(T));
    return record;
}

}
