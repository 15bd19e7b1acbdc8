#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "common/Result.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/NetworkDefs.hpp"
#include "interfaces/ILogger.hpp"

namespace core {

namespace network { class TcpSocket; }

// ============================================================================
// BridgeServer - TCP transport in front of the dispatcher
// ============================================================================
// Wire format, both directions:
//   [4 bytes: payload length, big-endian][payload: UTF-8 text]
//
// One thread per client; requests on a connection are answered in order.
// Each request races its future against the configured timeout. A request
// that times out is cancelled and answered with an error envelope; a
// request whose client disconnects is cancelled and not answered.
// ============================================================================

class BridgeServer {
public:
    static constexpr uint32_t kMaxFrameSize = 10 * 1024 * 1024;

    BridgeServer(
        std::string bind_address,
        uint16_t port,
        std::chrono::milliseconds request_timeout,
        std::shared_ptr<command::CommandDispatcher> dispatcher,
        std::shared_ptr<interfaces::ILogger> logger
    );
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    // Bind, listen and start the accept thread. Port 0 picks a free port.
    common::EmptyResult start();

    // Close the listener and every connection, then join all threads. Idempotent.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    // Actual listening port (after start)
    uint16_t bound_port() const { return bound_port_; }

    size_t connection_count() const;

    // Exposed for clients speaking the same framing
    static std::vector<uint8_t> encode_frame(const std::string& text);

private:
    struct Client;

    void accept_loop();
    void handle_client(const std::shared_ptr<Client>& client);
    std::string execute(const std::shared_ptr<Client>& client, const std::string& text, bool& answer);
    void reap_finished_clients();

    bool read_frame(network::TcpSocket& socket, std::string& text);
    bool send_frame(network::TcpSocket& socket, const std::string& text);

    std::string bind_address_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    std::chrono::milliseconds request_timeout_;
    std::shared_ptr<command::CommandDispatcher> dispatcher_;
    std::shared_ptr<interfaces::ILogger> logger_;

    std::atomic<bool> running_{false};
    socket_t listen_fd_ = INVALID_SOCKET;
    std::thread accept_thread_;

    mutable std::mutex clients_mutex_;
    std::map<uint64_t, std::shared_ptr<Client>> clients_;
    uint64_t next_client_id_ = 1;
};

} // namespace core
