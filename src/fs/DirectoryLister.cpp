#include "fs/DirectoryLister.hpp"
#include "fs/Error.hpp"
#include "log/Registry.hpp"

#include <filesystem>

using namespace dp::fs;
using namespace dp::fs::model;
using namespace dp::concurrency;

std::vector<Descriptor> DirectoryLister::list(const Root& root, const std::string_view rel, const RequestContext& ctx) const {
    return children(resolver_.describe(root, rel), ctx);
}

std::vector<Descriptor> DirectoryLister::children(const Descriptor& folder, const RequestContext& ctx) const {
    if (!folder.isFolder())
        throw Error(ErrorCode::NotADirectory, "not a directory: " + folder.virtualPath, folder.virtualPath);

    std::error_code ec;
    std::filesystem::directory_iterator it(folder.absolutePath, ec);
    if (ec) throw errorFromSystem(ec, "read directory", folder.virtualPath);

    std::vector<Descriptor> out;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {

        if (ctx.cancelled()) {
            log::Registry::fs()->debug("[DirectoryLister] listing of {} cancelled after {} entries",
                                       folder.virtualPath, out.size());
            throw Error(ErrorCode::Canceled, "request canceled", folder.virtualPath);
        }

        const auto childName = it->path().filename().string();
        const auto childRel = folder.relPath.empty() ? childName : folder.relPath + "/" + childName;
        out.push_back(resolver_.describe(folder.root, childRel));
    }
    if (ec) throw errorFromSystem(ec, "read directory", folder.virtualPath);

    return out;
}
