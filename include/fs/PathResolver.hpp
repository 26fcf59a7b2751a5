#pragma once

#include "fs/model/Descriptor.hpp"
#include "fs/model/Root.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace dp::fs {

/// Root-relative form of a requested path. Any literal ".." segment is rejected with
/// Error(OutsideRoot), even one a lexical clean would cancel out. A segment holding a NUL byte is
/// Error(NotFound). "" denotes the root itself.
[[nodiscard]] std::string cleanRelativePath(std::string_view rel);

/// "/" + "a/b" -> "/a/b", "/docs" + "" -> "/docs"
[[nodiscard]] std::string joinVirtual(std::string_view virtualName, std::string_view rel);

/// Display name of an entry: the basename, or the root's own name when rel is empty.
[[nodiscard]] std::string entryName(const model::Root& root, std::string_view rel);

/// True when candidate equals source or lies beneath it, without ascending.
[[nodiscard]] bool isWithinRoot(const std::filesystem::path& source, const std::filesystem::path& candidate);

class PathResolver {
public:
    /// Classifies root.source/rel and verifies containment after following any link chain.
    /// Throws Error(OutsideRoot | NotFound | PermissionDenied | StatFailure).
    [[nodiscard]] model::Descriptor describe(const model::Root& root, std::string_view rel) const;
};

}
