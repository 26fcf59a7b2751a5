#pragma once

#include "fs/model/Kind.hpp"
#include "fs/model/Metadata.hpp"
#include "fs/model/Root.hpp"

#include <filesystem>
#include <string>

namespace dp::fs::model {

/// A resolved, classified view of one entry beneath a Root. Built per request and never cached.
struct Descriptor {
    Root root;
    std::string virtualPath, relPath, name;
    Kind kind{Kind::File};
    TargetKind targetKind{TargetKind::File};

    // Always equal to or beneath root.source, checked after link resolution.
    std::filesystem::path absolutePath;

    // The path as addressed, before resolution. Equals absolutePath unless kind is Symlink.
    std::filesystem::path linkPath;

    Metadata metadata;

    [[nodiscard]] bool isFolder() const { return targetKind == TargetKind::Folder; }
};

}
