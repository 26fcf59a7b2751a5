#pragma once

#include <boost/beast/http.hpp>
#include <variant>

namespace dp::protocols::http::model {

namespace http = boost::beast::http;

using Response = std::variant<
    http::response<http::string_body>,
    http::response<http::file_body>
>;

}
