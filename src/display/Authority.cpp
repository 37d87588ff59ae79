#include "juicebox/display/Authority.hpp"
#include "juicebox/display/Connection.hpp"

#include <cstdlib>
#include <fstream>
#include <climits>
#include <unistd.h>

namespace juicebox {

namespace {

// Xauthority integers are big-endian regardless of the host
std::optional<std::uint16_t> readBigEndian16(std::istream& in) {
    unsigned char bytes[2];
    if (!in.read(reinterpret_cast<char*>(bytes), sizeof(bytes))) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>((bytes[0] << 8) | bytes[1]);
}

std::optional<std::string> readCountedString(std::istream& in) {
    auto length = readBigEndian16(in);
    if (!length) {
        return std::nullopt;
    }
    std::string value(*length, '\0');
    if (*length > 0 && !in.read(value.data(), *length)) {
        return std::nullopt;
    }
    return value;
}

std::string localHostname() {
    char buffer[HOST_NAME_MAX + 1] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        throw ConnectionError(ConnectionError::Kind::AuthenticationFailed,
                              "could not determine the local host name");
    }
    return buffer;
}

}

std::optional<AuthEntry> readAuthEntry(std::istream& in) {
    auto family = readBigEndian16(in);
    if (!family) {
        return std::nullopt;
    }

    AuthEntry entry;
    entry.family = *family;

    for (std::string* field : {&entry.address, &entry.number, &entry.name, &entry.data}) {
        auto value = readCountedString(in);
        if (!value) {
            return std::nullopt;
        }
        *field = std::move(*value);
    }
    return entry;
}

std::optional<AuthEntry> findAuthEntry(std::istream& in, std::string_view hostname) {
    while (auto entry = readAuthEntry(in)) {
        if (entry->address == hostname) {
            return entry;
        }
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> authorityFilePath() {
    const char* xauthority = std::getenv("XAUTHORITY");
    if (xauthority != nullptr && xauthority[0] != '\0') {
        return std::filesystem::path(xauthority);
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return std::filesystem::path(home) / ".Xauthority";
}

AuthEntry loadAuthEntry() {
    auto path = authorityFilePath();
    if (!path) {
        throw ConnectionError(ConnectionError::Kind::AuthenticationFailed,
                              "neither XAUTHORITY nor HOME is set");
    }

    std::ifstream file(*path, std::ios::binary);
    if (!file.is_open()) {
        throw ConnectionError(ConnectionError::Kind::AuthenticationFailed,
                              "failed to open authority file: " + path->string());
    }

    std::string hostname = localHostname();
    auto entry = findAuthEntry(file, hostname);
    if (!entry) {
        throw ConnectionError(ConnectionError::Kind::AuthenticationFailed,
                              "no authority entry for host " + hostname + " in " + path->string());
    }
    return *entry;
}

}
