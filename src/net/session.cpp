#include <respkv/net/session.hpp>
#include <respkv/error.hpp>
#include <respkv/util/log.hpp>
#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/write.hpp>

using asio::ip::tcp;

namespace respkv {

    namespace {
        std::string describe(tcp::socket& s) {
            std::error_code ec;
            auto ep = s.remote_endpoint(ec);
            if (ec) return "<unknown peer>";
            return ep.address().to_string() + ":" + std::to_string(ep.port());
        }
    } // namespace

    Session::Session(tcp::socket sock, std::shared_ptr<const Router> router)
        : router_(std::move(router))
        , conn_(std::move(sock)) {
        inbuf_.resize(4 * 1024);
        peer_ = describe(conn_.stream());
    }

    void Session::start() {
        log(LogLevel::Debug, "connection from " + peer_);
        do_read();
    }

    void Session::do_read() {
        auto self = shared_from_this();
        conn_.stream().async_read_some(asio::buffer(inbuf_),
            [this, self](std::error_code ec, std::size_t n) {
                if (ec == asio::error::operation_aborted) return;
                if (ec == asio::error::eof) {
                    if (conn_.buffered() == 0) log(LogLevel::Debug, "connection closed by " + peer_);
                    else log(LogLevel::Warn, peer_ + ": " + ConnectionReset().what());
                    finish();
                    return;
                }
                if (ec) {
                    log(LogLevel::Warn, peer_ + ": " + ec.message());
                    close();
                    return;
                }
                conn_.feed(inbuf_.data(), n);
                if (drain()) do_read();
            });
    }

    bool Session::drain() {
        try {
            while (auto frame = conn_.parse_frame()) {
                enqueue_write(router_->dispatch(std::move(*frame)));
            }
            return true;
        }
        catch (const ProtocolError& e) {
            log(LogLevel::Warn, peer_ + ": " + e.what());
            enqueue_write(Frame::error(std::string("ERR ") + e.what()));
        }
        catch (const std::exception& e) {
            log(LogLevel::Error, peer_ + ": server error: " + e.what());
        }
        finish();
        return false;
    }

    void Session::enqueue_write(const Frame& frame) {
        bool writing = !outq_.empty();
        outq_.push_back(encode(frame));
        if (!writing) do_write();
    }

    void Session::do_write() {
        auto self = shared_from_this();
        asio::async_write(conn_.stream(), asio::buffer(outq_.front()),
            [this, self](std::error_code ec, std::size_t) {
                if (ec) {
                    if (ec != asio::error::operation_aborted)
                        log(LogLevel::Debug, peer_ + ": write failed: " + ec.message());
                    close();
                    return;
                }
                outq_.pop_front();
                if (!outq_.empty()) do_write();
                else if (closing_) close();
            });
    }

    void Session::finish() {
        closing_ = true;
        if (outq_.empty()) close();
    }

    void Session::close() {
        std::error_code ec;
        conn_.stream().shutdown(tcp::socket::shutdown_both, ec);
        conn_.stream().close(ec);
    }

} // namespace respkv
