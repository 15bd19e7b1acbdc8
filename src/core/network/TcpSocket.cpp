#include "TcpSocket.hpp"
#include <cerrno>

namespace core {
namespace network {

    TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {}

    TcpSocket::~TcpSocket() {
        close_socket();
    }

    bool TcpSocket::set_no_delay(bool enable) {
        if (fd_ < 0) return false;
        int flag = enable ? 1 : 0;
        return setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, (const char*)&flag, sizeof(flag)) == 0;
    }

    std::pair<size_t, SocketError> TcpSocket::send(const uint8_t* data, size_t size) {
        if (fd_ < 0) return {0, SocketError::Fatal};

        ssize_t sent = ::send(fd_, (const SOCK_BUF_TYPE)data, size, MSG_NOSIGNAL);

        if (sent < 0) {
            if (errno == EINTR) return {0, SocketError::WouldBlock};
            if (errno == EAGAIN || errno == EWOULDBLOCK) return {0, SocketError::WouldBlock};
            if (errno == EPIPE || errno == ECONNRESET) return {0, SocketError::Disconnected};
            return {0, SocketError::Fatal};
        }
        return {(size_t)sent, SocketError::Ok};
    }

    std::pair<size_t, SocketError> TcpSocket::recv(uint8_t* buffer, size_t max_size) {
        if (fd_ < 0) return {0, SocketError::Fatal};

        ssize_t received = ::recv(fd_, (SOCK_BUF_TYPE)buffer, max_size, 0);

        if (received > 0) {
            return {(size_t)received, SocketError::Ok};
        } else if (received == 0) {
            return {0, SocketError::Disconnected}; // EOF
        } else {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return {0, SocketError::WouldBlock};
            if (errno == ECONNRESET) return {0, SocketError::Disconnected};
            return {0, SocketError::Fatal};
        }
    }

    bool TcpSocket::send_all(const uint8_t* data, size_t size) {
        size_t sent = 0;
        while (sent < size) {
            auto [n, err] = send(data + sent, size - sent);
            if (err == SocketError::Ok) sent += n;
            else if (err == SocketError::WouldBlock) continue;
            else return false;
        }
        return true;
    }

    bool TcpSocket::recv_exact(uint8_t* buffer, size_t size) {
        size_t got = 0;
        while (got < size) {
            auto [n, err] = recv(buffer + got, size - got);
            if (err == SocketError::Ok) got += n;
            else if (err == SocketError::WouldBlock) continue;
            else return false;
        }
        return true;
    }

    bool TcpSocket::peer_closed() {
        if (fd_ < 0) return true;

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, 0);
        if (ready < 0) return errno != EINTR;
        if (ready == 0) return false;
        if (pfd.revents & (POLLERR | POLLNVAL)) return true;

        // Readable: either pipelined data or EOF
        uint8_t probe;
        ssize_t n = ::recv(fd_, (SOCK_BUF_TYPE)&probe, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n == 0) return true;
        if (n < 0) return !(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR);
        return false;
    }

    void TcpSocket::shutdown_io() {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

    void TcpSocket::close_socket() {
        if (fd_ >= 0) {
            CLOSE_SOCKET(fd_);
            fd_ = INVALID_SOCKET;
        }
    }

    bool TcpSocket::is_valid() const {
        return IS_VALID_SOCKET(fd_);
    }

} // namespace network
} // namespace core
