#pragma once

#include "fs/model/Root.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dp::fs {

/// Immutable virtual-name -> source mapping, built once at startup and owned by the Service.
/// Construction throws Error(InvalidRoot) on an empty list, a repeated or malformed virtual
/// name, or a source that cannot be canonicalized.
class RootRegistry {
public:
    explicit RootRegistry(const std::vector<model::Root>& roots);

    /// Accepts the virtual name with or without its leading slash.
    [[nodiscard]] std::optional<model::Root> lookup(std::string_view virtualName) const;

    /// Roots in configuration order.
    [[nodiscard]] const std::vector<model::Root>& all() const noexcept { return ordered_; }

    [[nodiscard]] bool isSingleSlashRoot() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return ordered_.size(); }

private:
    std::vector<model::Root> ordered_;
    std::unordered_map<std::string, std::size_t> index_;
};

[[nodiscard]] bool isValidVirtualName(std::string_view virtualName);

}
