#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dp::config {

inline constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/dendrite/dendrite.yaml";
inline constexpr const auto* ENV_PREFIX = "DENDRITE_";

struct MainConfig {
    std::string listen = "127.0.0.1";
    int port = 3000;
    unsigned int worker_threads = 4;
    unsigned int request_timeout_ms = 30000;
};

struct LogConfig {
    std::string file{};         // "" disables logging, "-" is stdout
    std::string level = "info";
    std::string format = "text";
    std::unordered_map<std::string, std::string> subsystem_levels{};
};

struct FileRootConfig {
    std::string virtual_root, source;
};

struct Config {
    MainConfig main;
    LogConfig log;
    std::vector<FileRootConfig> file_roots;
};

// Missing file yields defaults; a malformed one throws.
Config loadConfig(const std::filesystem::path& path);

Config parseConfig(const std::string& yaml);

using EnvLookup = std::function<const char*(const char*)>;

// DENDRITE_MAIN_LISTEN, DENDRITE_MAIN_PORT, DENDRITE_LOG_FILE, DENDRITE_LOG_LEVEL,
// DENDRITE_LOG_FORMAT, DENDRITE_FILE_ROOT
void applyEnvironment(Config& cfg, const EnvLookup& lookup);

/// Parses "virtual:source" definitions; each element may hold several, comma-separated.
std::vector<FileRootConfig> parseFileRootDefinitions(const std::vector<std::string>& defs);

/// Throws std::invalid_argument describing the first violation.
void validate(const Config& cfg);

}
