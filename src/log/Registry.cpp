#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <fmt/format.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace dp::log {

namespace {

constexpr std::array<const char*, 4> LOGGER_NAMES{"dendrite", "fs", "http", "config"};

// %* : log payload escaped for embedding in a JSON string.
class JsonEscapedMessage final : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const auto append = [&dest](const std::string_view s) { dest.append(s.data(), s.data() + s.size()); };
        for (const char c : msg.payload) {
            switch (c) {
            case '"':  append("\\\""); break;
            case '\\': append("\\\\"); break;
            case '\n': append("\\n"); break;
            case '\r': append("\\r"); break;
            case '\t': append("\\t"); break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) append(fmt::format("\\u{:04x}", static_cast<unsigned int>(c)));
                else dest.push_back(c);
            }
        }
    }

    [[nodiscard]] std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonEscapedMessage>();
    }
};

std::unique_ptr<spdlog::formatter> makeFormatter(const std::string& pattern) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<JsonEscapedMessage>('*').set_pattern(pattern);
    return formatter;
}

std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

}

spdlog::level::level_enum Registry::parseLevel(const std::string& level) {
    const auto l = toLower(level);
    if (l.empty() || l == "info") return spdlog::level::info;
    if (l == "debug") return spdlog::level::debug;
    if (l == "warn" || l == "warning") return spdlog::level::warn;
    if (l == "error") return spdlog::level::err;
    throw std::invalid_argument("invalid log level: " + level);
}

void Registry::init(const config::LogConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto format = toLower(cfg.format);
    if (format != "text" && format != "json") throw std::invalid_argument("invalid log format: " + cfg.format);
    const bool json = format == "json";

    spdlog::sink_ptr sink;
    if (cfg.file.empty()) {
        sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    } else if (cfg.file == "-") {
        // stdout: timestamps are left to whoever collects the stream
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_color_mode(json ? spdlog::color_mode::never : spdlog::color_mode::automatic);
        console->set_formatter(makeFormatter(json ? JSON_FORMAT_NO_TIME : TEXT_FORMAT_NO_TIME));
        sink = console;
    } else {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, false);
        sink->set_formatter(makeFormatter(json ? JSON_FORMAT : TEXT_FORMAT));
    }

    registerLoggers(sink, parseLevel(cfg.level), &cfg);
    initialized_ = true;
}

void Registry::initForTesting() {
    if (initialized_) return;
    registerLoggers(std::make_shared<spdlog::sinks::null_sink_mt>(), spdlog::level::debug, nullptr);
    initialized_ = true;
}

void Registry::registerLoggers(const spdlog::sink_ptr& sink,
                               const spdlog::level::level_enum defaultLevel,
                               const config::LogConfig* cfg) {
    for (const auto* name : LOGGER_NAMES) {
        auto lvl = defaultLevel;
        if (cfg)
            if (const auto it = cfg->subsystem_levels.find(name); it != cfg->subsystem_levels.end())
                lvl = parseLevel(it->second);

        const auto logger = std::make_shared<spdlog::logger>(name, sink);
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    for (const auto* name : LOGGER_NAMES)
        if (const auto logger = spdlog::get(name)) logger->flush();
    spdlog::drop_all();
    initialized_ = false;
}

}
