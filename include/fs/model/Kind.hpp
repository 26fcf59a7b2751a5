#pragma once

#include <string_view>

namespace dp::fs::model {

// Classification of the path itself, before any link is followed.
enum class Kind { File, Folder, Symlink };

// Classification after following a link. A link always lands on one of these.
enum class TargetKind { File, Folder };

constexpr std::string_view to_string(const Kind kind) {
    switch (kind) {
    case Kind::File:    return "file";
    case Kind::Folder:  return "folder";
    case Kind::Symlink: return "symlink";
    }
    return "file";
}

constexpr std::string_view to_string(const TargetKind kind) {
    switch (kind) {
    case TargetKind::File:   return "file";
    case TargetKind::Folder: return "folder";
    }
    return "file";
}

}
