#pragma once
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <respkv/core/router.hpp>
#include <respkv/core/store.hpp>

namespace respkv {

	// Open, bind and listen on bind_addr:port. Port 0 picks an ephemeral port.
	asio::ip::tcp::acceptor make_listener(asio::io_context& io, const std::string& bind_addr, std::uint16_t port);

	// Accepts connections on the listener for as long as its io_context runs
	// and hands each one to a Session sharing `store`. A failed accept is
	// retried after accept_backoff.
	class Server {
	public:
		static constexpr std::chrono::milliseconds accept_backoff{ 100 };

		Server(asio::ip::tcp::acceptor listener, std::shared_ptr<Store> store);
		std::uint16_t port() const;

	private:
		void accept();
		void retry_accept();

		asio::ip::tcp::acceptor acceptor_;
		asio::steady_timer retry_;
		std::shared_ptr<const Router> router_;
	};

} // namespace respkv
