#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "juicebox/config/Config.hpp"

namespace juicebox {

/**
 * @brief Line-oriented configuration reader
 *
 * Each non-empty line is one directive:
 *
 *     workspaces 10
 *     border width 1
 *     border focused 0x014c82
 *     gaps 4 4 4 4
 *     keybind super,shift q call closeWindow
 *     keybind super Return exec alacritty
 *
 * Invalid lines are reported and skipped; parsing never stops early.
 */
class ConfigParser {
public:
    ConfigParser() = default;

    bool load(const std::filesystem::path& path = getDefaultConfigPath());
    bool loadFromString(const std::string& source);

    /// Built-in configuration used when no file is available.
    static std::string getEmbeddedConfig();

    static std::filesystem::path getDefaultConfigPath();

    const Config& getConfig() const { return config_; }
    const std::vector<std::string>& getErrors() const { return errors_; }

    /// Parse a comma-separated modifier list such as "super,shift".
    static std::optional<std::uint16_t> parseModifiers(std::string_view text);

    static std::optional<Direction> parseDirection(std::string_view text);

private:
    void parseLine(const std::vector<std::string>& tokens);
    void parseWorkspaces(const std::vector<std::string>& tokens);
    void parseBorder(const std::vector<std::string>& tokens);
    void parseGaps(const std::vector<std::string>& tokens);
    void parseKeybind(const std::vector<std::string>& tokens);
    std::optional<Action> parseCall(const std::vector<std::string>& tokens, std::size_t first);

    void reportError(const std::string& message);
    void reportWarning(const std::string& message);

    Config config_;
    std::vector<std::string> errors_;
    int line_{0};
};

}
