#include "util/parse.hpp"

#include <stdexcept>

namespace dp::util {

static int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string_view value, const bool plusAsSpace) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%') {
            if (i + 2 >= value.length())
                throw std::invalid_argument("Invalid percent-encoding in URL");
            const int hi = hexValue(value[i + 1]), lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) throw std::invalid_argument("Invalid percent-encoding in URL");
            result += static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        else if (plusAsSpace && value[i] == '+') result += ' ';
        else result += value[i];
    }
    return result;
}

std::unordered_map<std::string, std::string> parse_query_params(const std::string_view target) {
    std::unordered_map<std::string, std::string> params;

    const auto pos = target.find('?');
    if (pos == std::string_view::npos) return params;

    auto query = target.substr(pos + 1);
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) continue;

        const auto eq = pair.find('=');
        auto key = url_decode(pair.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
        params.try_emplace(std::move(key), std::move(value));
    }

    return params;
}

}
