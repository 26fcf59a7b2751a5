#include "cli/Args.hpp"

#include <charconv>
#include <fmt/format.h>
#include <stdexcept>
#include <string_view>

using namespace dp::config;

namespace dp::cli {

namespace {

std::optional<int> parseInt(const std::string& s) {
    int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

}

std::string usage() {
    return "Usage: dendrite run [options]\n"
           "\n"
           "Options:\n"
           "  --config PATH        config file (default " + std::string(DEFAULT_CONFIG_PATH) + ")\n"
           "  --listen ADDR        listen address (default 127.0.0.1)\n"
           "  --port N             port to listen on (default 3000)\n"
           "  --log-level LEVEL    debug, info, warn, error\n"
           "  --log-file FILE      log file path, or '-' for stdout\n"
           "  --log-format FORMAT  text or json\n"
           "  --file-root DEF      /virtual:/source mapping (repeatable or comma-separated)\n"
           "  --config-check       validate configuration and exit\n"
           "  -h, --help           show this help\n";
}

Options parseArgs(const std::vector<std::string>& args) {
    Options opts;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            continue;
        }

        if (!arg.starts_with("--")) {
            if (!opts.command.empty())
                throw std::invalid_argument(fmt::format("unexpected argument: {}", arg));
            opts.command = std::string(arg);
            continue;
        }

        std::string name(arg.substr(2));
        std::optional<std::string> inlineValue;
        if (const auto eq = name.find('='); eq != std::string::npos) {
            inlineValue = name.substr(eq + 1);
            name.erase(eq);
        }

        if (name == "config-check") {
            if (inlineValue) throw std::invalid_argument("--config-check takes no value");
            opts.configCheck = true;
            continue;
        }

        const auto value = [&]() -> std::string {
            if (inlineValue) return *inlineValue;
            if (i + 1 >= args.size()) throw std::invalid_argument(fmt::format("--{} requires a value", name));
            return args[++i];
        };

        if (name == "config") opts.configPath = value();
        else if (name == "listen") opts.listen = value();
        else if (name == "port") {
            const auto raw = value();
            opts.port = parseInt(raw);
            if (!opts.port) throw std::invalid_argument(fmt::format("invalid --port: {}", raw));
        }
        else if (name == "log-level") opts.logLevel = value();
        else if (name == "log-file") opts.logFile = value();
        else if (name == "log-format") opts.logFormat = value();
        else if (name == "file-root") opts.fileRoots.push_back(value());
        else throw std::invalid_argument(fmt::format("unknown flag: --{}", name));
    }

    return opts;
}

void applyOptions(Config& cfg, const Options& opts) {
    if (opts.listen) cfg.main.listen = *opts.listen;
    if (opts.port) cfg.main.port = *opts.port;
    if (opts.logLevel) cfg.log.level = *opts.logLevel;
    if (opts.logFile) cfg.log.file = *opts.logFile;
    if (opts.logFormat) cfg.log.format = *opts.logFormat;
    if (!opts.fileRoots.empty()) cfg.file_roots = parseFileRootDefinitions(opts.fileRoots);
}

Config resolveConfig(const Options& opts, const EnvLookup& env) {
    auto cfg = loadConfig(opts.configPath);
    applyEnvironment(cfg, env);
    applyOptions(cfg, opts);
    validate(cfg);
    return cfg;
}

}
