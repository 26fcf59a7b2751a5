#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "protocols/TcpAcceptor.hpp"
#include "log/Registry.hpp"

using namespace dp::protocols::http;

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint, const Router& router)
    : ioc_(ioc), acceptor_(ioc), router_(router) {
    init_acceptor(acceptor_, endpoint);
}

void Server::run() {
    log::Registry::http()->info("[HttpServer] Listening on {}", endpointToString(acceptor_.local_endpoint()));
    doAccept();
}

void Server::stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
        boost::system::error_code ec;
        self->acceptor_.close(ec);
        if (ec) log::Registry::http()->warn("[HttpServer] close acceptor: {}", ec.message());
    });
}

void Server::doAccept() {
    acceptor_.async_accept(net::make_strand(ioc_),
        [self = shared_from_this()](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted || !self->acceptor_.is_open()) return;

            self->doAccept();

            if (ec) {
                log::Registry::http()->debug("[HttpServer] accept error: {}", ec.message());
                return;
            }

            std::make_shared<Session>(std::move(socket), self->router_)->run();
        });
}
