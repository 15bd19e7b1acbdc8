#pragma once
#include "interfaces/INetworkSocket.hpp"
#include "core/NetworkDefs.hpp" // For native types like socket_t

namespace core {
namespace network {

    // Blocking TCP stream owning its descriptor
    class TcpSocket : public INetworkSocket {
    public:
        explicit TcpSocket(socket_t fd);
        ~TcpSocket() override;

        TcpSocket(const TcpSocket&) = delete;
        TcpSocket& operator=(const TcpSocket&) = delete;

        bool set_no_delay(bool enable) override;

        std::pair<size_t, SocketError> send(const uint8_t* data, size_t size) override;
        std::pair<size_t, SocketError> recv(uint8_t* buffer, size_t max_size) override;

        bool send_all(const uint8_t* data, size_t size) override;
        bool recv_exact(uint8_t* buffer, size_t size) override;
        bool peer_closed() override;

        void shutdown_io() override;
        void close_socket() override;
        bool is_valid() const override;

    private:
        socket_t fd_;
    };

} // namespace network
} // namespace core
