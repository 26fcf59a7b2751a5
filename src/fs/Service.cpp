#include "fs/Service.hpp"
#include "fs/Error.hpp"
#include "log/Registry.hpp"

using namespace dp::fs;
using namespace dp::fs::model;
using namespace dp::concurrency;

Service::Service(const std::vector<Root>& roots)
    : registry_(roots), resolver_(), lister_(resolver_) {
    log::Registry::fs()->info("[Service] serving {} file root(s)", registry_.size());
}

Root Service::requireRoot(const std::string_view virtualName) const {
    auto root = registry_.lookup(virtualName);
    if (!root) throw Error(ErrorCode::RootNotFound, "file root not found: " + std::string(virtualName),
                           std::string(virtualName));
    return *root;
}

Descriptor Service::resolve(const std::string_view virtualName, const std::string_view rel) const {
    return resolver_.describe(requireRoot(virtualName), rel);
}

std::vector<Descriptor> Service::list(const std::string_view virtualName,
                                      const std::string_view rel,
                                      const RequestContext& ctx) const {
    return lister_.list(requireRoot(virtualName), rel, ctx);
}

std::vector<Descriptor> Service::listRoots(const RequestContext& ctx) const {
    std::vector<Descriptor> out;
    out.reserve(registry_.size());
    for (const auto& root : registry_.all()) {
        if (ctx.cancelled()) throw Error(ErrorCode::Canceled, "request canceled", "/");
        out.push_back(resolver_.describe(root, ""));
    }
    return out;
}
