#include <respkv/net/server.hpp>
#include <respkv/net/session.hpp>
#include <respkv/util/log.hpp>
#include <asio/error.hpp>
#include <asio/ip/address.hpp>

using asio::ip::tcp;

namespace respkv {

    tcp::acceptor make_listener(asio::io_context& io, const std::string& bind_addr, std::uint16_t port) {
        tcp::endpoint ep(asio::ip::make_address(bind_addr), port);
        tcp::acceptor acceptor(io);
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        return acceptor;
    }

    Server::Server(tcp::acceptor listener, std::shared_ptr<Store> store)
        : acceptor_(std::move(listener))
        , retry_(acceptor_.get_executor())
        , router_(std::make_shared<const Router>(std::move(store))) {
        accept();
    }

    std::uint16_t Server::port() const {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept() {
        acceptor_.async_accept([this](std::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) return;
            if (ec) {
                log(LogLevel::Warn, "accept failed: " + ec.message());
                retry_accept();
                return;
            }
            std::make_shared<Session>(std::move(socket), router_)->start();
            accept();
            });
    }

    // e.g. EMFILE: wait for descriptors to free up instead of spinning.
    void Server::retry_accept() {
        retry_.expires_after(accept_backoff);
        retry_.async_wait([this](std::error_code ec) {
            if (ec == asio::error::operation_aborted) return;
            accept();
            });
    }

} // namespace respkv
