#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "juicebox/protocol/Protocol.hpp"

namespace juicebox::protocol {

/**
 * @brief Raised when bytes from the server cannot be decoded
 *
 * Short buffers, lengths that overflow the request length field and
 * response codes outside the core protocol all end up here.
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The server answered a request we were waiting on with an error
 */
class RequestError : public std::runtime_error {
public:
    explicit RequestError(const ErrorRecord& record);

    const ErrorRecord& getRecord() const { return record_; }
    ErrorCode getCode() const { return static_cast<ErrorCode>(record_.error_code); }

private:
    ErrorRecord record_;
};

/// Symbolic name of a core error code, e.g. "BadWindow".
std::string_view errorName(std::uint8_t error_code);

/// One-line description of an error record for the log.
std::string describeError(const ErrorRecord& record);

}
