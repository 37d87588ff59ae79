#include "juicebox/config/ConfigParser.hpp"
#include "juicebox/core/WindowManager.hpp"
#include "juicebox/display/Connection.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

using namespace juicebox;

namespace {

struct CommandLine {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> display;
};

void onTerminate(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\n[juicebox] Caught signal " << signal << ", shutting down" << std::endl;
        std::exit(0);
    }
}

void showHelp(const char* argv0) {
    std::cout << "juicebox - tiling window manager for X11\n"
              << "usage: " << argv0 << " [-h] [-v] [-c <file>] [-d <display>]\n"
              << "\n"
              << "  -h, --help             print this text and exit\n"
              << "  -v, --version          print the version and exit\n"
              << "  -c, --config <file>    read bindings and layout settings from <file>\n"
              << "  -d, --display <name>   connect to <name> instead of $DISPLAY\n"
              << std::endl;
}

void showVersion() {
    std::cout << "juicebox 0.1.0 (X11 core protocol, C++20)" << std::endl;
}

/**
 * @brief Parse argv into @p out
 * @return Exit status when the program should stop right away
 */
std::optional<int> parseCommandLine(int argc, char* argv[], CommandLine& out) {
    auto valueFor = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "[juicebox] " << flag << " needs an argument" << std::endl;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];

        if (flag == "-h" || flag == "--help") {
            showHelp(argv[0]);
            return 0;
        } else if (flag == "-v" || flag == "--version") {
            showVersion();
            return 0;
        } else if (flag == "-c" || flag == "--config") {
            auto value = valueFor(i, flag);
            if (!value) return 1;
            out.config_path = *value;
        } else if (flag == "-d" || flag == "--display") {
            auto value = valueFor(i, flag);
            if (!value) return 1;
            out.display = *value;
        } else {
            std::cerr << "[juicebox] Unrecognised option '" << flag << "'" << std::endl;
            showHelp(argv[0]);
            return 1;
        }
    }
    return std::nullopt;
}

/**
 * @brief Load the configuration, falling back to the embedded one
 */
Config loadConfig(const std::optional<std::filesystem::path>& requested) {
    ConfigParser parser;
    std::filesystem::path path = requested.value_or(ConfigParser::getDefaultConfigPath());

    if (parser.load(path)) {
        std::cout << "[Config] Loaded " << path << std::endl;
        return parser.getConfig();
    }

    if (std::filesystem::exists(path)) {
        std::cerr << "[Config] " << path << " has " << parser.getErrors().size()
                  << " error(s), using the embedded configuration" << std::endl;
    } else {
        std::cout << "[Config] No config at " << path << ", using the embedded configuration" << std::endl;
    }

    ConfigParser embedded;
    if (!embedded.loadFromString(ConfigParser::getEmbeddedConfig())) {
        std::cerr << "[Config] Embedded configuration has errors" << std::endl;
    }
    return embedded.getConfig();
}

}

int main(int argc, char* argv[]) {
    CommandLine options;
    if (auto status = parseCommandLine(argc, argv, options)) {
        return *status;
    }

    std::signal(SIGINT, onTerminate);
    std::signal(SIGTERM, onTerminate);

    // Spawned commands are never waited on
    std::signal(SIGCHLD, SIG_IGN);

    try {
        WindowManager wm(Connection::open(options.display), loadConfig(options.config_path));
        wm.initialize();
        wm.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
