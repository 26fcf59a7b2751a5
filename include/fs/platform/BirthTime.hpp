#pragma once

#include "fs/model/Metadata.hpp"

#include <filesystem>
#include <optional>

namespace dp::fs::platform {

/// Creation time of the file at path, following links. std::nullopt when the platform or the
/// filesystem does not record one; never a synthetic zero.
std::optional<model::Timestamp> birthTime(const std::filesystem::path& path);

/// Whether this build can ever report a creation time.
constexpr bool supportsBirthTime() {
#if defined(__linux__) || defined(__APPLE__) || defined(__FreeBSD__) || defined(__NetBSD__)
    return true;
#else
    return false;
#endif
}

}
