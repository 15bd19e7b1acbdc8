#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>

namespace core {
namespace network {

    enum class SocketError {
        Ok,
        WouldBlock,
        Disconnected,
        Fatal
    };

    class INetworkSocket {
    public:
        virtual ~INetworkSocket() = default;

        // Configuration
        virtual bool set_no_delay(bool enable) = 0;

        // IO Operations
        // Returns number of bytes sent or error
        virtual std::pair<size_t, SocketError> send(const uint8_t* data, size_t size) = 0;

        // Returns number of bytes received
        virtual std::pair<size_t, SocketError> recv(uint8_t* buffer, size_t max_size) = 0;

        // Loop until every byte is written or the connection fails
        virtual bool send_all(const uint8_t* data, size_t size) = 0;

        // Loop until `size` bytes are read; false on EOF or error
        virtual bool recv_exact(uint8_t* buffer, size_t size) = 0;

        // Non-blocking probe: true once the peer has closed or the socket failed
        virtual bool peer_closed() = 0;

        // Utilities
        // Unblocks any thread inside recv() without releasing the descriptor
        virtual void shutdown_io() = 0;
        virtual void close_socket() = 0;
        virtual bool is_valid() const = 0;
    };

} // namespace network
} // namespace core
