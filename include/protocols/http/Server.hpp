#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <memory>

namespace dp::protocols::http {

namespace net = boost::asio;
using tcp = net::ip::tcp;

class Router;

// Listening socket. Each accepted connection gets its own strand and Session.
class Server : public std::enable_shared_from_this<Server> {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint, const Router& router);

    void run();

    // Closes the acceptor; pending accepts complete with operation_aborted.
    void stop();

private:
    void doAccept();

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    const Router& router_;
};

}
