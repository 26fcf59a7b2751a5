#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace dp::util {

/// Query string of a request target, split into decoded pairs. When a key repeats, the first value wins.
/// Throws std::invalid_argument on malformed percent-encoding.
std::unordered_map<std::string, std::string> parse_query_params(std::string_view target);

/// Percent-decoding. plusAsSpace applies to query components, not to paths.
std::string url_decode(std::string_view value, bool plusAsSpace = true);

}
