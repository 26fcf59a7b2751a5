#pragma once

#include <chrono>
#include <ctime>
#include <fmt/format.h>
#include <string>

namespace dp::util {

/// RFC 3339 in UTC with nanosecond precision, trailing zeros of the fraction dropped.
/// e.g. 2024-05-01T12:00:00.5Z, 2024-05-01T12:00:00Z
inline std::string formatRfc3339Nano(const std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto ns = duration_cast<nanoseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(ns);
    auto frac = (ns - secs).count();
    if (frac < 0) {
        frac += 1'000'000'000;
        secs -= seconds(1);
    }

    const std::time_t t = secs.count();
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buffer);

    if (frac > 0) {
        auto digits = fmt::format("{:09d}", frac);
        digits.erase(digits.find_last_not_of('0') + 1);
        out += '.' + digits;
    }
    out += 'Z';
    return out;
}

}
