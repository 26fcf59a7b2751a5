#pragma once

#include "fs/DirectoryLister.hpp"
#include "fs/PathResolver.hpp"
#include "fs/RootRegistry.hpp"
#include "concurrency/RequestContext.hpp"

#include <string_view>
#include <vector>

namespace dp::fs {

/// Entry point for transports. Owns its root registry, so independently configured
/// instances can coexist in one process.
class Service {
public:
    explicit Service(const std::vector<model::Root>& roots);

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    /// Throws Error(RootNotFound | OutsideRoot | NotFound | PermissionDenied | StatFailure).
    [[nodiscard]] model::Descriptor resolve(std::string_view virtualName, std::string_view rel) const;

    /// Throws Error(RootNotFound | OutsideRoot | NotADirectory | Canceled) and the resolve errors.
    [[nodiscard]] std::vector<model::Descriptor> list(std::string_view virtualName,
                                                      std::string_view rel,
                                                      const concurrency::RequestContext& ctx = {}) const;

    /// One folder descriptor per configured root, in configuration order.
    [[nodiscard]] std::vector<model::Descriptor> listRoots(const concurrency::RequestContext& ctx = {}) const;

    [[nodiscard]] const std::vector<model::Root>& roots() const noexcept { return registry_.all(); }

    [[nodiscard]] bool hasSingleSlashRoot() const noexcept { return registry_.isSingleSlashRoot(); }

private:
    RootRegistry registry_;
    PathResolver resolver_;
    DirectoryLister lister_;

    [[nodiscard]] model::Root requireRoot(std::string_view virtualName) const;
};

}
