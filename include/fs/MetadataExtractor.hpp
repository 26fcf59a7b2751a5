#pragma once

#include "fs/model/Descriptor.hpp"
#include "fs/model/Metadata.hpp"

#include <string>
#include <sys/stat.h>

namespace dp::fs {

inline constexpr const auto* MIME_DIRECTORY = "inode/directory";
inline constexpr const auto* MIME_SYMLINK = "inode/symlink";

struct MetadataExtractor {
    /// Derives the attribute set from the target's raw attributes and the descriptor's own kind.
    /// Content sniffing failures degrade to an empty MIME type.
    static model::Metadata extract(const model::Descriptor& desc, const struct stat& targetInfo);

    /// "0644" style, permission bits only.
    static std::string formatPermissionMode(mode_t mode);

    /// Name for a uid/gid. Lookup failures fall back to the decimal id, except 0 which becomes "".
    static std::string userName(uid_t uid);
    static std::string groupName(gid_t gid);

    /// Sniffed content type of a regular file, or "" if it cannot be read.
    static std::string sniffMimeType(const std::filesystem::path& path);
};

}
