#pragma once

#include "config/Config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dp::cli {

struct Options {
    std::string command{};
    std::string configPath = config::DEFAULT_CONFIG_PATH;
    std::optional<std::string> listen{}, logLevel{}, logFile{}, logFormat{};
    std::optional<int> port{};
    std::vector<std::string> fileRoots{};
    bool configCheck = false;
    bool help = false;
};

/// Accepts "--flag value" and "--flag=value". Throws std::invalid_argument on unknown or
/// incomplete flags. Arguments exclude argv[0].
Options parseArgs(const std::vector<std::string>& args);

/// Flags override whatever the file and the environment set. File roots from flags replace the list.
void applyOptions(config::Config& cfg, const Options& opts);

/// Defaults < config file < environment < flags, then validated.
config::Config resolveConfig(const Options& opts, const config::EnvLookup& env);

std::string usage();

}
