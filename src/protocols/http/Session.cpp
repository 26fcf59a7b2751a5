#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "log/Registry.hpp"

#include <variant>

namespace dp::protocols::http {

Session::Session(tcp::socket socket, const Router& router)
    : stream_(std::move(socket)), router_(router) {
    beast::error_code ec;
    const auto ep = stream_.socket().remote_endpoint(ec);
    if (!ec) remoteIp_ = ep.address().to_string();
}

void Session::run() {
    // Start on the socket's strand.
    boost::asio::dispatch(stream_.get_executor(), [self = shared_from_this()] { self->do_read(); });
}

void Session::do_read() {
    parser_.emplace();
    parser_->header_limit(MAX_HEADER_BYTES);
    stream_.expires_after(READ_TIMEOUT);

    http::async_read(stream_, buffer_, *parser_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec) {
        if (ec != beast::error::timeout)
            log::Registry::http()->debug("[Session] Read error from {}: {}", remoteIp_, ec.message());
        return do_close();
    }

    log::Registry::http()->trace("[Session] Read {} bytes from {}", bytes, remoteIp_);

    stream_.expires_never();

    const auto version = parser_->get().version();
    std::optional<model::Response> res;
    try {
        res = router_.route(parser_->release(), remoteIp_);
    } catch (const std::exception& e) {
        log::Registry::http()->error("[Session] Exception during request handling: {}", e.what());
        res = Router::makeInternalErrorResponse(version);
    }

    std::visit([self = shared_from_this()](auto&& response) {
        using T = std::decay_t<decltype(response)>;
        auto msg = std::make_shared<T>(std::forward<decltype(response)>(response));
        const bool close = msg->need_eof();
        http::async_write(self->stream_, *msg,
                          [self, msg, close](beast::error_code ec, std::size_t bytes) {
                              self->on_write(close, ec, bytes);
                          });
    }, std::move(*res));
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes;

    if (ec) {
        log::Registry::http()->debug("[Session] Write error to {}: {}", remoteIp_, ec.message());
        return do_close();
    }

    if (close) return do_close();

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

}
