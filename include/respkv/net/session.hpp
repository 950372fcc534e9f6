#pragma once
#include <asio/ip/tcp.hpp>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <respkv/core/router.hpp>
#include <respkv/net/connection.hpp>

namespace respkv {

	// One accepted client, driven by completions on the socket's io_context.
	// Requests are answered in arrival order. A protocol error gets one last
	// "-ERR" reply and closes this connection only. Pending handlers own the
	// session, so it goes away with its io_context.
	class Session : public std::enable_shared_from_this<Session> {
	public:
		Session(asio::ip::tcp::socket sock, std::shared_ptr<const Router> router);
		void start();

	private:
		void do_read();
		void do_write();
		void enqueue_write(const Frame& frame);

		// Dispatch every complete buffered frame; false once the connection
		// is closing.
		bool drain();

		// Close after the queued replies are written.
		void finish();
		void close();

		std::shared_ptr<const Router> router_;
		Connection<asio::ip::tcp::socket> conn_;
		std::vector<char> inbuf_;
		std::deque<std::string> outq_;
		bool closing_ = false;
		std::string peer_;
	};

} // namespace respkv
