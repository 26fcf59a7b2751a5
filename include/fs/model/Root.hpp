#pragma once

#include <filesystem>
#include <string>

namespace dp::fs::model {

struct Root {
    std::string virtualName;        // "/" or "/<segment>"
    std::filesystem::path source;   // canonical once held by a RootRegistry
};

}
