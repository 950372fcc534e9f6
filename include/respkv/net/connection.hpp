#pragma once
#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/write.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <respkv/error.hpp>
#include <respkv/proto/frame.hpp>

namespace respkv {

	// Frame-level reader/writer over an Asio stream (tcp::socket,
	// local::stream_protocol::socket, or anything with read_some/write_some).
	// read_frame/write_frame block; an async owner reads on its own and calls
	// feed() then parse_frame().
	// Bytes are accumulated in pending_ until a whole frame is present; bytes
	// that belong to the next frame stay buffered for the following call.
	template <class Stream>
	class Connection {
	public:
		explicit Connection(Stream stream, std::size_t read_chunk = 4 * 1024)
			: stream_(std::move(stream)) {
			inbuf_.resize(read_chunk == 0 ? 1 : read_chunk);
		}

		// Next frame; std::nullopt when the peer closed with nothing buffered.
		// Throws ConnectionReset if it closed mid-frame, ProtocolError on a
		// malformed frame, std::system_error on transport failure.
		std::optional<Frame> read_frame() {
			for (;;) {
				if (auto frame = parse_frame()) return frame;

				std::error_code ec;
				std::size_t n = stream_.read_some(asio::buffer(inbuf_), ec);
				if (ec == asio::error::eof || (!ec && n == 0)) {
					if (pending_.empty()) return std::nullopt;
					throw ConnectionReset();
				}
				if (ec) throw std::system_error(ec);
				feed(inbuf_.data(), n);
			}
		}

		// Serialize and write the whole frame before returning.
		void write_frame(const Frame& frame) {
			outbuf_.clear();
			encode_to(outbuf_, frame);
			asio::write(stream_, asio::buffer(outbuf_));
		}

		// Complete frame at the front of the buffer, if any; consumes exactly
		// its bytes.
		std::optional<Frame> parse_frame() {
			Cursor probe(pending_.data(), pending_.size());
			if (check(probe) == CheckResult::Incomplete) return std::nullopt;

			Cursor cur(pending_.data(), pending_.size());
			Frame frame = parse(cur);
			pending_.erase(0, cur.pos);
			return frame;
		}

		// Bytes read elsewhere (an async read completion) join the buffer here.
		void feed(const char* data, std::size_t n) { pending_.append(data, n); }

		std::size_t buffered() const { return pending_.size(); }
		Stream& stream() { return stream_; }

	private:
		Stream stream_;
		std::vector<char> inbuf_;
		std::string pending_;
		std::string outbuf_;
	};

} // namespace respkv
