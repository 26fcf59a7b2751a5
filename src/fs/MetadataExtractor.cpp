#include "fs/MetadataExtractor.hpp"
#include "fs/platform/BirthTime.hpp"
#include "util/Magic.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <vector>

using namespace dp::fs;
using namespace dp::fs::model;

namespace {

Timestamp fromTimespec(const timespec& ts) {
    using namespace std::chrono;
    return Timestamp(duration_cast<Timestamp::duration>(seconds(ts.tv_sec) + nanoseconds(ts.tv_nsec)));
}

std::string idOrEmpty(const unsigned int id) { return id == 0 ? "" : std::to_string(id); }

std::size_t lookupBufferSize(const int name) {
    const auto n = ::sysconf(name);
    return n > 0 ? static_cast<std::size_t>(n) : 16384;
}

}

std::string MetadataExtractor::formatPermissionMode(const mode_t mode) {
    return fmt::format("{:04o}", static_cast<unsigned int>(mode & 0777));
}

std::string MetadataExtractor::userName(const uid_t uid) {
    std::vector<char> buf(lookupBufferSize(_SC_GETPW_R_SIZE_MAX));
    passwd pw{};
    passwd* result = nullptr;
    if (::getpwuid_r(uid, &pw, buf.data(), buf.size(), &result) == 0 && result) return result->pw_name;
    return idOrEmpty(uid);
}

std::string MetadataExtractor::groupName(const gid_t gid) {
    std::vector<char> buf(lookupBufferSize(_SC_GETGR_R_SIZE_MAX));
    group gr{};
    group* result = nullptr;
    if (::getgrgid_r(gid, &gr, buf.data(), buf.size(), &result) == 0 && result) return result->gr_name;
    return idOrEmpty(gid);
}

std::string MetadataExtractor::sniffMimeType(const std::filesystem::path& path) {
    try {
        return util::Magic::sniff_file(path);
    } catch (const std::exception& e) {
        log::Registry::fs()->debug("[MetadataExtractor] MIME sniff failed for {}: {}", path.string(), e.what());
        return "";
    }
}

Metadata MetadataExtractor::extract(const Descriptor& desc, const struct stat& targetInfo) {
    Metadata m;
    m.name = desc.name;
    m.virtualPath = desc.virtualPath;
    m.resourceKind = desc.kind;

    // A link never reports a size, whatever it points at.
    if (desc.kind == Kind::File) m.sizeBytes = static_cast<uintmax_t>(targetInfo.st_size);

    m.permissionMode = formatPermissionMode(targetInfo.st_mode);
    m.userId = targetInfo.st_uid;
    m.groupId = targetInfo.st_gid;
    m.user = userName(targetInfo.st_uid);
    m.group = groupName(targetInfo.st_gid);

    switch (desc.kind) {
    case Kind::Folder:  m.mimeType = MIME_DIRECTORY; break;
    case Kind::Symlink: m.mimeType = MIME_SYMLINK; break;
    case Kind::File:    m.mimeType = sniffMimeType(desc.absolutePath); break;
    }

    m.accessedAt = fromTimespec(targetInfo.st_atim);
    m.modifiedAt = fromTimespec(targetInfo.st_mtim);
    m.changedAt = fromTimespec(targetInfo.st_ctim);
    m.bornAt = platform::birthTime(desc.absolutePath);

    return m;
}
