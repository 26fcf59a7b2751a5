#pragma once

#include "fs/model/Kind.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace dp::fs::model {

using Timestamp = std::chrono::system_clock::time_point;

struct Metadata {
    std::string name, virtualPath;
    Kind resourceKind{Kind::File};

    // Only set for Kind::File. Folders and symlinks never carry a size.
    std::optional<uintmax_t> sizeBytes{};

    std::string permissionMode{};   // 4-digit octal, e.g. "0644"
    std::string user{}, group{};
    unsigned int userId{0}, groupId{0};
    std::string mimeType{};

    std::optional<Timestamp> accessedAt{}, modifiedAt{}, changedAt{}, bornAt{};
};

}
