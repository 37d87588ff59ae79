#include <gtest/gtest.h>

#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

#include <unistd.h>

#include "juicebox/display/Authority.hpp"
#include "juicebox/display/Connection.hpp"

using namespace juicebox;

namespace {

void putCounted(std::string& out, const std::string& value) {
    out.push_back(static_cast<char>((value.size() >> 8) & 0xff));
    out.push_back(static_cast<char>(value.size() & 0xff));
    out += value;
}

std::string encodeEntry(std::uint16_t family, const std::string& address, const std::string& number,
                        const std::string& name, const std::string& data) {
    std::string out;
    out.push_back(static_cast<char>(family >> 8));
    out.push_back(static_cast<char>(family & 0xff));
    putCounted(out, address);
    putCounted(out, number);
    putCounted(out, name);
    putCounted(out, data);
    return out;
}

std::string hostname() {
    char buffer[HOST_NAME_MAX + 1] = {};
    gethostname(buffer, sizeof(buffer) - 1);
    return buffer;
}

class AuthorityFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("juicebox-xauth-" + std::to_string(::getpid()));
        if (const char* home = std::getenv("HOME")) {
            home_ = home;
        }
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        ::unsetenv("XAUTHORITY");
        if (home_) {
            ::setenv("HOME", home_->c_str(), 1);
        }
    }

    void writeFile(const std::string& contents) {
        std::ofstream out(path_, std::ios::binary);
        out << contents;
    }

    std::filesystem::path path_;
    std::optional<std::string> home_;
};

}

TEST(AuthorityTest, ReadsBigEndianRecord) {
    std::string cookie("\x01\x02\x03\x04", 4);
    std::istringstream in(encodeEntry(256, "box", "0", "MIT-MAGIC-COOKIE-1", cookie));

    auto entry = readAuthEntry(in);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->family, 256);
    EXPECT_EQ(entry->address, "box");
    EXPECT_EQ(entry->number, "0");
    EXPECT_EQ(entry->name, "MIT-MAGIC-COOKIE-1");
    EXPECT_EQ(entry->data, cookie);

    EXPECT_FALSE(readAuthEntry(in).has_value());
}

TEST(AuthorityTest, TruncatedRecordIsDropped) {
    std::string bytes = encodeEntry(256, "box", "0", "MIT-MAGIC-COOKIE-1", "abcd");
    bytes.resize(bytes.size() - 2);
    std::istringstream in(bytes);

    EXPECT_FALSE(readAuthEntry(in).has_value());
}

TEST(AuthorityTest, FirstMatchingHostWins) {
    std::string bytes = encodeEntry(256, "other", "0", "MIT-MAGIC-COOKIE-1", "1111") +
                        encodeEntry(256, "box", "0", "MIT-MAGIC-COOKIE-1", "2222") +
                        encodeEntry(256, "box", "1", "MIT-MAGIC-COOKIE-1", "3333");
    std::istringstream in(bytes);

    auto entry = findAuthEntry(in, "box");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->data, "2222");
}

TEST(AuthorityTest, NoMatchingHost) {
    std::istringstream in(encodeEntry(256, "other", "0", "MIT-MAGIC-COOKIE-1", "1111"));
    EXPECT_FALSE(findAuthEntry(in, "box").has_value());
}

TEST_F(AuthorityFileTest, PathFromEnvironment) {
    ::setenv("XAUTHORITY", path_.c_str(), 1);
    auto path = authorityFilePath();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, path_);

    ::unsetenv("XAUTHORITY");
    ::setenv("HOME", "/home/someone", 1);
    path = authorityFilePath();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, std::filesystem::path("/home/someone/.Xauthority"));
}

TEST_F(AuthorityFileTest, LoadsEntryForThisHost) {
    writeFile(encodeEntry(256, "not-this-host", "0", "MIT-MAGIC-COOKIE-1", "aaaa") +
              encodeEntry(256, hostname(), "0", "MIT-MAGIC-COOKIE-1", "bbbb"));
    ::setenv("XAUTHORITY", path_.c_str(), 1);

    AuthEntry entry = loadAuthEntry();
    EXPECT_EQ(entry.address, hostname());
    EXPECT_EQ(entry.data, "bbbb");
}

TEST_F(AuthorityFileTest, MissingEntryFailsAuthentication) {
    writeFile(encodeEntry(256, "not-this-host", "0", "MIT-MAGIC-COOKIE-1", "aaaa"));
    ::setenv("XAUTHORITY", path_.c_str(), 1);

    try {
        loadAuthEntry();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.getKind(), ConnectionError::Kind::AuthenticationFailed);
    }
}

TEST_F(AuthorityFileTest, MissingFileFailsAuthentication) {
    ::setenv("XAUTHORITY", path_.c_str(), 1);

    try {
        loadAuthEntry();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.getKind(), ConnectionError::Kind::AuthenticationFailed);
    }
}
