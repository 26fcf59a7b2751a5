#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>

namespace dp::config { struct LogConfig; }

namespace dp::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LogConfig& cfg);

    // Null sinks at debug level, for unit tests.
    static void initForTesting();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> dendrite() { return get("dendrite"); }
    static std::shared_ptr<spdlog::logger> fs()       { return get("fs"); }
    static std::shared_ptr<spdlog::logger> http()     { return get("http"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }

    [[nodiscard]] static bool isInitialized();

    static void shutdown();

    [[nodiscard]] static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static constexpr const auto* TEXT_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* TEXT_FORMAT_NO_TIME = "[%^%l%$] [%n] %v";
    static constexpr const auto* JSON_FORMAT =
        R"({"time":"%Y-%m-%dT%H:%M:%S.%f%z","level":"%l","logger":"%n","msg":"%*"})";
    static constexpr const auto* JSON_FORMAT_NO_TIME = R"({"level":"%l","logger":"%n","msg":"%*"})";

    static inline bool initialized_ = false;

    static void registerLoggers(const spdlog::sink_ptr& sink,
                                spdlog::level::level_enum defaultLevel,
                                const config::LogConfig* cfg);
};

}
