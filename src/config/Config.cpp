#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <boost/asio/ip/address.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace dp::config {

namespace {

std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string& str) {
    const auto strBegin = str.find_first_not_of(" \t\n\r");
    if (strBegin == std::string::npos) return "";
    const auto strEnd = str.find_last_not_of(" \t\n\r");
    return str.substr(strBegin, strEnd - strBegin + 1);
}

std::vector<std::string> split(const std::string& s, const char delim) {
    std::vector<std::string> out;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, delim)) out.push_back(part);
    if (!s.empty() && s.back() == delim) out.emplace_back();
    return out;
}

Config fromNode(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("config root must be a mapping");

    if (const auto node = root["main"]) {
        if (!YAML::convert<MainConfig>::decode(node, cfg.main)) throw std::runtime_error("config: 'main' must be a mapping");
    }
    if (const auto node = root["log"]) {
        if (!YAML::convert<LogConfig>::decode(node, cfg.log)) throw std::runtime_error("config: 'log' must be a mapping");
    }

    auto roots = root["file_roots"];
    if (!roots) roots = root["file-root"];
    if (roots) {
        if (roots.IsScalar()) cfg.file_roots = parseFileRootDefinitions({roots.as<std::string>()});
        else if (roots.IsSequence())
            for (const auto& entry : roots) {
                if (entry.IsScalar()) {
                    const auto parsed = parseFileRootDefinitions({entry.as<std::string>()});
                    cfg.file_roots.insert(cfg.file_roots.end(), parsed.begin(), parsed.end());
                    continue;
                }
                FileRootConfig fr;
                if (!YAML::convert<FileRootConfig>::decode(entry, fr))
                    throw std::runtime_error("config: file root entries must be mappings or 'virtual:source' strings");
                cfg.file_roots.push_back(fr);
            }
        else throw std::runtime_error("config: 'file_roots' must be a list");
    }

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return {};

    try {
        return fromNode(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("read config {}: {}", path.string(), e.what()));
    }
}

Config parseConfig(const std::string& yaml) {
    try {
        return fromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("parse config: {}", e.what()));
    }
}

void applyEnvironment(Config& cfg, const EnvLookup& lookup) {
    const auto env = [&lookup](const std::string& key) -> std::optional<std::string> {
        const auto name = std::string(ENV_PREFIX) + key;
        if (const char* v = lookup(name.c_str()); v && *v) return std::string(v);
        return std::nullopt;
    };

    if (const auto v = env("MAIN_LISTEN")) cfg.main.listen = *v;
    if (const auto v = env("MAIN_PORT")) {
        int port = 0;
        const auto [ptr, err] = std::from_chars(v->data(), v->data() + v->size(), port);
        if (err != std::errc{} || ptr != v->data() + v->size())
            throw std::invalid_argument(fmt::format("invalid {}MAIN_PORT: {}", ENV_PREFIX, *v));
        cfg.main.port = port;
    }
    if (const auto v = env("LOG_FILE")) cfg.log.file = *v;
    if (const auto v = env("LOG_LEVEL")) cfg.log.level = *v;
    if (const auto v = env("LOG_FORMAT")) cfg.log.format = *v;
    if (const auto v = env("FILE_ROOT")) cfg.file_roots = parseFileRootDefinitions({*v});
}

std::vector<FileRootConfig> parseFileRootDefinitions(const std::vector<std::string>& defs) {
    std::vector<FileRootConfig> roots;

    for (std::size_t i = 0; i < defs.size(); ++i) {
        if (defs[i].empty()) throw std::invalid_argument(fmt::format("file root {}: empty definition", i));

        const auto entries = split(defs[i], ',');
        for (std::size_t j = 0; j < entries.size(); ++j) {
            const auto& entry = entries[j];
            if (entry.empty())
                throw std::invalid_argument(fmt::format("file root {} entry {}: empty definition", i, j));

            const auto colon = entry.find(':');
            if (colon == std::string::npos)
                throw std::invalid_argument(fmt::format("file root {} entry {}: expected format virtual:source", i, j));

            FileRootConfig root{entry.substr(0, colon), entry.substr(colon + 1)};
            if (root.virtual_root.empty() || root.source.empty())
                throw std::invalid_argument(
                    fmt::format("file root {} entry {}: virtual and source must be non-empty", i, j));

            roots.push_back(std::move(root));
        }
    }

    return roots;
}

static void validateFileRoots(const std::vector<FileRootConfig>& roots) {
    if (roots.empty()) throw std::invalid_argument("no file roots configured");

    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < roots.size(); ++i) {
        const auto& r = roots[i];
        const auto fail = [i](const std::string& msg) {
            throw std::invalid_argument(fmt::format("file root {}: {}", i, msg));
        };

        if (trim(r.virtual_root) != r.virtual_root || trim(r.source) != r.source)
            fail("leading or trailing whitespace is not allowed");
        if (r.virtual_root.empty()) fail("virtual cannot be empty");
        if (r.source.empty()) fail("source cannot be empty");
        if (!r.virtual_root.starts_with('/')) fail("virtual must start with '/'");
        if (r.virtual_root != "/" && std::ranges::count(r.virtual_root, '/') != 1)
            fail("virtual must be '/' or a single folder (e.g. '/public')");
        if (r.virtual_root.find(':') != std::string::npos) fail("virtual path cannot contain a colon");
        if (r.source.find(':') != std::string::npos) fail("source path cannot contain a colon");
        if (!std::filesystem::path(r.source).is_absolute())
            fail("source must be an absolute path starting with '/': " + r.source);

        std::error_code ec;
        const auto status = std::filesystem::status(r.source, ec);
        if (ec || !std::filesystem::exists(status)) fail("stat source " + r.source + ": no such directory");
        if (!std::filesystem::is_directory(status)) fail("source is not a directory: " + r.source);

        if (!seen.insert(r.virtual_root).second) fail("duplicate virtual path: " + r.virtual_root);
    }
}

void validate(const Config& cfg) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(cfg.main.listen, ec);
    if (ec) throw std::invalid_argument("invalid listen address: " + cfg.main.listen);

    if (cfg.main.port < 1 || cfg.main.port > 65535)
        throw std::invalid_argument(fmt::format("invalid port: {}", cfg.main.port));

    if (const auto level = toLower(cfg.log.level);
        level != "debug" && level != "info" && level != "warn" && level != "error")
        throw std::invalid_argument("invalid log level: " + cfg.log.level);

    if (const auto format = toLower(cfg.log.format); format != "text" && format != "json")
        throw std::invalid_argument("invalid log format: " + cfg.log.format);

    validateFileRoots(cfg.file_roots);
}

}
