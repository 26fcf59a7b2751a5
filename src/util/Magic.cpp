#include "util/Magic.hpp"

#include <array>
#include <fstream>
#include <stdexcept>

using namespace dp::util;

Magic::Magic() {
    cookie = magic_open(MAGIC_MIME_TYPE);
    if (!cookie) throw std::runtime_error("Failed to create magic cookie");
    if (magic_load(cookie, nullptr) != 0) {
        const std::string err = magic_error(cookie);
        magic_close(cookie);
        throw std::runtime_error("Failed to load magic database: " + err);
    }
}

Magic::~Magic() { if (cookie) magic_close(cookie); }

std::string Magic::mime_type_buffer(const std::string_view buffer) const {
    const char* result = magic_buffer(cookie, buffer.data(), buffer.size());
    if (!result) throw std::runtime_error("magic_buffer failed: " + std::string(magic_error(cookie)));
    return {result};
}

std::string Magic::get_mime_type_from_buffer(const std::string_view buffer) {
    thread_local Magic instance;
    return instance.mime_type_buffer(buffer);
}

std::string Magic::sniff_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file for sniffing");

    std::array<char, SNIFF_LEN> buf{};
    in.read(buf.data(), buf.size());
    if (in.bad()) throw std::runtime_error("Failed to read file for sniffing");

    return get_mime_type_from_buffer({buf.data(), static_cast<std::size_t>(in.gcount())});
}
