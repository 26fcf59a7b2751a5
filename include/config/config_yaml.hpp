#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace dp::config;

template<>
struct convert<MainConfig> {
    static Node encode(const MainConfig& rhs) {
        Node node;
        node["listen"] = rhs.listen;
        node["port"] = rhs.port;
        node["worker_threads"] = rhs.worker_threads;
        node["request_timeout_ms"] = rhs.request_timeout_ms;
        return node;
    }

    static bool decode(const Node& node, MainConfig& rhs) {
        if (!node.IsMap()) return false;
        const MainConfig def;
        rhs.listen = node["listen"].as<std::string>(def.listen);
        rhs.port = node["port"].as<int>(def.port);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(def.worker_threads);
        rhs.request_timeout_ms = node["request_timeout_ms"].as<unsigned int>(def.request_timeout_ms);
        return true;
    }
};

template<>
struct convert<LogConfig> {
    static Node encode(const LogConfig& rhs) {
        Node node;
        node["file"] = rhs.file;
        node["level"] = rhs.level;
        node["format"] = rhs.format;
        for (const auto& [name, level] : rhs.subsystem_levels) node["subsystem_levels"][name] = level;
        return node;
    }

    static bool decode(const Node& node, LogConfig& rhs) {
        if (!node.IsMap()) return false;
        const LogConfig def;
        rhs.file = node["file"].as<std::string>(def.file);
        rhs.level = node["level"].as<std::string>(def.level);
        rhs.format = node["format"].as<std::string>(def.format);
        if (const auto levels = node["subsystem_levels"]; levels && levels.IsMap())
            for (const auto& it : levels)
                rhs.subsystem_levels[it.first.as<std::string>()] = it.second.as<std::string>();
        return true;
    }
};

template<>
struct convert<FileRootConfig> {
    static Node encode(const FileRootConfig& rhs) {
        Node node;
        node["virtual"] = rhs.virtual_root;
        node["source"] = rhs.source;
        return node;
    }

    static bool decode(const Node& node, FileRootConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.virtual_root = node["virtual"].as<std::string>("");
        rhs.source = node["source"].as<std::string>("");
        return true;
    }
};

}
