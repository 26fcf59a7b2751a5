#include "fs/PathResolver.hpp"
#include "fs/Error.hpp"
#include "fs/MetadataExtractor.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <sys/stat.h>

using namespace dp::fs;
using namespace dp::fs::model;

namespace {

std::error_code lastError() { return {errno, std::generic_category()}; }

}

std::string dp::fs::cleanRelativePath(const std::string_view rel) {
    std::string cleaned;
    std::size_t pos = 0;
    while (pos <= rel.size()) {
        auto next = rel.find('/', pos);
        if (next == std::string_view::npos) next = rel.size();
        const auto segment = rel.substr(pos, next - pos);
        pos = next + 1;

        if (segment == "..") throw Error(ErrorCode::OutsideRoot, "path escapes configured root", std::string(rel));
        // The syscalls would stop at the NUL and resolve a different name.
        if (segment.find('\0') != std::string_view::npos)
            throw Error(ErrorCode::NotFound, "path contains a NUL byte");
        if (segment.empty() || segment == ".") continue;

        if (!cleaned.empty()) cleaned += '/';
        cleaned += segment;
    }
    return cleaned;
}

std::string dp::fs::joinVirtual(const std::string_view virtualName, const std::string_view rel) {
    std::string out(virtualName);
    if (rel.empty()) return out.empty() ? "/" : out;
    if (!out.ends_with('/')) out += '/';
    out += rel;
    return out;
}

std::string dp::fs::entryName(const Root& root, const std::string_view rel) {
    if (rel.empty()) {
        if (root.virtualName == "/") return "/";
        return root.virtualName.starts_with('/') ? root.virtualName.substr(1) : root.virtualName;
    }
    const auto slash = rel.rfind('/');
    return std::string(slash == std::string_view::npos ? rel : rel.substr(slash + 1));
}

bool dp::fs::isWithinRoot(const std::filesystem::path& source, const std::filesystem::path& candidate) {
    const auto relative = candidate.lexically_normal().lexically_relative(source.lexically_normal());
    if (relative.empty()) return false;
    const auto first = *relative.begin();
    return first != "..";
}

Descriptor PathResolver::describe(const Root& root, const std::string_view rel) const {
    Descriptor d;
    d.root = root;
    d.relPath = cleanRelativePath(rel);
    d.virtualPath = joinVirtual(root.virtualName, d.relPath);
    d.name = entryName(root, d.relPath);

    const auto candidate = d.relPath.empty() ? root.source : root.source / d.relPath;
    d.linkPath = candidate;

    struct stat linkInfo{};
    if (::lstat(candidate.c_str(), &linkInfo) != 0)
        throw errorFromSystem(lastError(), "lstat", d.virtualPath);

    if (S_ISDIR(linkInfo.st_mode)) d.kind = Kind::Folder;
    else if (S_ISLNK(linkInfo.st_mode)) d.kind = Kind::Symlink;
    else d.kind = Kind::File;

    // Resolving every kind catches symlinked intermediate directories as well as links at the leaf.
    std::error_code ec;
    auto resolved = std::filesystem::canonical(candidate, ec);
    if (ec) throw errorFromSystem(ec, "resolve", d.virtualPath);

    if (!isWithinRoot(root.source, resolved)) {
        log::Registry::fs()->warn("[PathResolver] {} resolves outside {}", d.virtualPath, root.virtualName);
        throw Error(ErrorCode::OutsideRoot, "path escapes configured root", d.virtualPath);
    }

    struct stat targetInfo = linkInfo;
    if (d.kind == Kind::Symlink) {
        if (::stat(resolved.c_str(), &targetInfo) != 0)
            throw errorFromSystem(lastError(), "stat", d.virtualPath);
        d.absolutePath = resolved;
        d.targetKind = S_ISDIR(targetInfo.st_mode) ? TargetKind::Folder : TargetKind::File;
    } else {
        d.absolutePath = candidate;
        d.targetKind = d.kind == Kind::Folder ? TargetKind::Folder : TargetKind::File;
    }

    d.metadata = MetadataExtractor::extract(d, targetInfo);
    return d;
}
