#pragma once
#include <stdexcept>
#include <string>

namespace respkv {

    // Malformed frame, or a request that is not an array. Ends the connection.
    class ProtocolError : public std::runtime_error {
    public:
        explicit ProtocolError(const std::string& what) : std::runtime_error("protocol error: " + what) {}
    };

    // Peer closed the stream while a frame was only partially buffered.
    class ConnectionReset : public std::runtime_error {
    public:
        ConnectionReset() : std::runtime_error("connection reset by peer") {}
    };

    // Bad arguments to a known command. Reported to the client as an error
    // reply; the connection stays open.
    class CommandError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace respkv
