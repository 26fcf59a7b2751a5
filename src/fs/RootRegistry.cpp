#include "fs/RootRegistry.hpp"
#include "fs/Error.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <fmt/format.h>

using namespace dp::fs;
using namespace dp::fs::model;

bool dp::fs::isValidVirtualName(const std::string_view virtualName) {
    if (virtualName == "/") return true;
    if (virtualName.size() < 2 || virtualName.front() != '/') return false;
    const auto segment = virtualName.substr(1);
    return segment.find('/') == std::string_view::npos && segment != "." && segment != "..";
}

RootRegistry::RootRegistry(const std::vector<Root>& roots) {
    if (roots.empty()) throw Error(ErrorCode::InvalidRoot, "no file roots provided");

    ordered_.reserve(roots.size());
    for (const auto& r : roots) {
        if (!isValidVirtualName(r.virtualName))
            throw Error(ErrorCode::InvalidRoot,
                        fmt::format("invalid virtual root '{}': must be '/' or a single folder", r.virtualName));

        if (index_.contains(r.virtualName))
            throw Error(ErrorCode::InvalidRoot, fmt::format("duplicate file root: {}", r.virtualName));

        std::error_code ec;
        auto resolved = std::filesystem::canonical(r.source, ec);
        if (ec)
            throw Error(ErrorCode::InvalidRoot,
                        fmt::format("resolve file root {}: {}", r.virtualName, ec.message()));

        log::Registry::fs()->debug("[RootRegistry] {} -> {}", r.virtualName, resolved.string());

        index_.emplace(r.virtualName, ordered_.size());
        ordered_.push_back(Root{r.virtualName, resolved.lexically_normal()});
    }
}

std::optional<Root> RootRegistry::lookup(const std::string_view virtualName) const {
    std::string key(virtualName);
    if (!key.starts_with('/')) key.insert(key.begin(), '/');

    const auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return ordered_[it->second];
}

bool RootRegistry::isSingleSlashRoot() const noexcept {
    return ordered_.size() == 1 && ordered_.front().virtualName == "/";
}
