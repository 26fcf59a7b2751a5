#pragma once

#include "fs/PathResolver.hpp"
#include "concurrency/RequestContext.hpp"

#include <string_view>
#include <vector>

namespace dp::fs {

class DirectoryLister {
public:
    explicit DirectoryLister(const PathResolver& resolver) : resolver_(resolver) {}

    /// Children of a folder in directory-read order. Throws Error(NotADirectory) when the target is a
    /// file, and Error(Canceled) when ctx is cancelled between two children; no partial result is returned.
    [[nodiscard]] std::vector<model::Descriptor> list(const model::Root& root,
                                                      std::string_view rel,
                                                      const concurrency::RequestContext& ctx = {}) const;

    /// Same, for a descriptor already resolved as a folder.
    [[nodiscard]] std::vector<model::Descriptor> children(const model::Descriptor& folder,
                                                          const concurrency::RequestContext& ctx = {}) const;

private:
    const PathResolver& resolver_;
};

}
