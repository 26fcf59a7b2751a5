#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace dp::protocols::http {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

class Router;

// One connection: read, route, write, repeat while keep-alive holds.
class Session : public std::enable_shared_from_this<Session> {
public:
    static constexpr auto READ_TIMEOUT = std::chrono::seconds(30);
    static constexpr std::size_t MAX_HEADER_BYTES = 8192;

    Session(tcp::socket socket, const Router& router);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::string remoteIp_;
    const Router& router_;
};

}
