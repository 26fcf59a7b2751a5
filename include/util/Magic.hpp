#pragma once

#include <cstddef>
#include <filesystem>
#include <magic.h>
#include <string>
#include <string_view>

namespace dp::util {

// Signature-based content-type detection over libmagic. Cookies are not thread-safe,
// so the static helpers keep one per thread.
class Magic {
public:
    static constexpr std::size_t SNIFF_LEN = 512;

    Magic();
    ~Magic();

    Magic(const Magic&) = delete;
    Magic& operator=(const Magic&) = delete;

    [[nodiscard]] std::string mime_type_buffer(std::string_view buffer) const;

    static std::string get_mime_type_from_buffer(std::string_view buffer);

    /// Reads at most SNIFF_LEN bytes from the head of the file. Throws on open/read failure.
    static std::string sniff_file(const std::filesystem::path& path);

private:
    magic_t cookie;
};

}
