#include "fs/platform/BirthTime.hpp"

#include <fcntl.h>
#include <sys/stat.h>

namespace dp::fs::platform {

namespace {

model::Timestamp fromTimespec(const long long sec, const long long nsec) {
    using namespace std::chrono;
    return model::Timestamp(duration_cast<model::Timestamp::duration>(seconds(sec) + nanoseconds(nsec)));
}

}

#if defined(__linux__)

std::optional<model::Timestamp> birthTime(const std::filesystem::path& path) {
    struct statx stx{};
    if (::statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME, &stx) != 0) return std::nullopt;
    if ((stx.stx_mask & STATX_BTIME) == 0) return std::nullopt;
    return fromTimespec(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec);
}

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__NetBSD__)

std::optional<model::Timestamp> birthTime(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return std::nullopt;
    return fromTimespec(st.st_birthtimespec.tv_sec, st.st_birthtimespec.tv_nsec);
}

#else

std::optional<model::Timestamp> birthTime(const std::filesystem::path&) { return std::nullopt; }

#endif

}
