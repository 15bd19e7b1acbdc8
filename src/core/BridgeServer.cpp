#include "core/BridgeServer.hpp"
#include "core/Envelope.hpp"
#include "core/network/TcpSocket.hpp"
#include <cerrno>
#include <cstring>

namespace core {

    struct BridgeServer::Client {
        uint64_t id = 0;
        std::string peer;
        std::unique_ptr<network::TcpSocket> socket;
        std::thread thread;
        std::atomic<bool> finished{false};

        // Orders stop()'s shutdown against the client thread's close
        std::mutex io_mutex;
        bool closed = false;
    };

    BridgeServer::BridgeServer(
        std::string bind_address,
        uint16_t port,
        std::chrono::milliseconds request_timeout,
        std::shared_ptr<command::CommandDispatcher> dispatcher,
        std::shared_ptr<interfaces::ILogger> logger
    ) : bind_address_(std::move(bind_address)), port_(port), request_timeout_(request_timeout),
        dispatcher_(std::move(dispatcher)), logger_(std::move(logger)) {}

    BridgeServer::~BridgeServer() {
        stop();
    }

    common::EmptyResult BridgeServer::start() {
        if (running_) return common::EmptyResult::success();

        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (!IS_VALID_SOCKET(listen_fd_)) {
            return common::EmptyResult::err(common::ErrorCode::NetworkError,
                std::string("socket() failed: ") + std::strerror(errno), "BridgeServer::start");
        }

        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&opt, sizeof(opt));

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port_);
        if (inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
            CLOSE_SOCKET(listen_fd_);
            listen_fd_ = INVALID_SOCKET;
            return common::EmptyResult::err(common::ErrorCode::InvalidConfig,
                "Invalid bind address: " + bind_address_, "BridgeServer::start");
        }

        if (bind(listen_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0 || listen(listen_fd_, 16) < 0) {
            const std::string reason = std::strerror(errno);
            CLOSE_SOCKET(listen_fd_);
            listen_fd_ = INVALID_SOCKET;
            return common::EmptyResult::err(common::ErrorCode::NetworkError,
                "Cannot listen on " + bind_address_ + ":" + std::to_string(port_) + ": " + reason,
                "BridgeServer::start");
        }

        struct sockaddr_in bound;
        socklen_t bound_len = sizeof(bound);
        if (getsockname(listen_fd_, (struct sockaddr*)&bound, &bound_len) == 0) {
            bound_port_ = ntohs(bound.sin_port);
        } else {
            bound_port_ = port_;
        }

        running_ = true;
        accept_thread_ = std::thread(&BridgeServer::accept_loop, this);

        logger_->info("[BridgeServer] Listening on " + bind_address_ + ":" + std::to_string(bound_port_));
        return common::EmptyResult::success();
    }

    void BridgeServer::stop() {
        const bool was_running = running_.exchange(false);

        if (IS_VALID_SOCKET(listen_fd_)) {
            shutdown(listen_fd_, SHUT_RDWR);
        }
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        if (IS_VALID_SOCKET(listen_fd_)) {
            CLOSE_SOCKET(listen_fd_);
            listen_fd_ = INVALID_SOCKET;
        }

        std::map<uint64_t, std::shared_ptr<Client>> clients;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            clients.swap(clients_);
        }

        for (auto& entry : clients) {
            auto& client = entry.second;
            {
                std::lock_guard<std::mutex> io_lock(client->io_mutex);
                if (!client->closed) client->socket->shutdown_io();
            }
            if (client->thread.joinable()) {
                client->thread.join();
            }
        }

        if (was_running) {
            logger_->info("[BridgeServer] Stopped");
        }
    }

    size_t BridgeServer::connection_count() const {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        size_t live = 0;
        for (const auto& entry : clients_) {
            if (!entry.second->finished) live++;
        }
        return live;
    }

    std::vector<uint8_t> BridgeServer::encode_frame(const std::string& text) {
        std::vector<uint8_t> frame(4 + text.size());
        uint32_t net_len = htonl(static_cast<uint32_t>(text.size()));
        memcpy(frame.data(), &net_len, 4);
        if (!text.empty()) {
            memcpy(frame.data() + 4, text.data(), text.size());
        }
        return frame;
    }

    void BridgeServer::accept_loop() {
        while (running_) {
            struct sockaddr_in peer;
            socklen_t len = sizeof(peer);
            socket_t fd = accept(listen_fd_, (struct sockaddr*)&peer, &len);
            if (!IS_VALID_SOCKET(fd)) {
                if (running_ && errno == EINTR) continue;
                break;
            }

            if (!running_) {
                CLOSE_SOCKET(fd);
                break;
            }

            reap_finished_clients();

            char ip[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));

            auto client = std::make_shared<Client>();
            client->peer = std::string(ip) + ":" + std::to_string(ntohs(peer.sin_port));
            client->socket = std::make_unique<network::TcpSocket>(fd);

            std::lock_guard<std::mutex> lock(clients_mutex_);
            client->id = next_client_id_++;
            clients_[client->id] = client;
            client->thread = std::thread([this, client]() { handle_client(client); });
        }
    }

    void BridgeServer::reap_finished_clients() {
        std::vector<std::shared_ptr<Client>> finished;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            for (auto it = clients_.begin(); it != clients_.end();) {
                if (it->second->finished) {
                    finished.push_back(it->second);
                    it = clients_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (auto& client : finished) {
            if (client->thread.joinable()) client->thread.join();
        }
    }

    void BridgeServer::handle_client(const std::shared_ptr<Client>& client) {
        logger_->info("[BridgeServer] Client connected: " + client->peer);

        auto& socket = *client->socket;
        socket.set_no_delay(true);

        std::string text;
        while (running_ && read_frame(socket, text)) {
            bool answer = true;
            const std::string response = execute(client, text, answer);
            if (!answer) break;
            if (!send_frame(socket, response)) break;
        }

        {
            std::lock_guard<std::mutex> io_lock(client->io_mutex);
            socket.close_socket();
            client->closed = true;
        }
        client->finished = true;

        logger_->info("[BridgeServer] Client disconnected: " + client->peer);
    }

    std::string BridgeServer::execute(const std::shared_ptr<Client>& client, const std::string& text, bool& answer) {
        common::CancellationSource source;
        std::future<std::string> future;

        try {
            future = dispatcher_->execute_command_async(text, source.get_token());
        } catch (const std::exception& e) {
            logger_->warn(std::string("[BridgeServer] Rejected request: ") + e.what());
            return ResponseEnvelope::serialize(
                ResponseEnvelope::error(std::string("Bridge unavailable: ") + e.what()));
        }

        const auto deadline = std::chrono::steady_clock::now() + request_timeout_;
        const auto slice = std::chrono::milliseconds(25);

        while (future.wait_for(slice) != std::future_status::ready) {
            if (client->socket->peer_closed()) {
                source.cancel();
                answer = false;
                logger_->debug("[BridgeServer] " + client->peer + " went away with a request in flight");
                return "";
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                source.cancel();
                logger_->warn("[BridgeServer] Request from " + client->peer + " timed out after " +
                              std::to_string(request_timeout_.count()) + " ms");
                return ResponseEnvelope::serialize(ResponseEnvelope::error("Request timed out"));
            }
        }

        try {
            return future.get();
        } catch (const common::OperationCancelledException&) {
            return ResponseEnvelope::serialize(ResponseEnvelope::error("Request cancelled"));
        }
    }

    bool BridgeServer::read_frame(network::TcpSocket& socket, std::string& text) {
        uint8_t header[4];
        if (!socket.recv_exact(header, sizeof(header))) return false;

        uint32_t net_len;
        memcpy(&net_len, header, 4);
        const uint32_t len = ntohl(net_len);

        if (len > kMaxFrameSize) {
            logger_->warn("[BridgeServer] Frame of " + std::to_string(len) + " bytes exceeds limit");
            return false;
        }

        text.assign(len, '\0');
        if (len > 0 && !socket.recv_exact(reinterpret_cast<uint8_t*>(&text[0]), len)) return false;
        return true;
    }

    bool BridgeServer::send_frame(network::TcpSocket& socket, const std::string& text) {
        const auto frame = encode_frame(text);
        return socket.send_all(frame.data(), frame.size());
    }

} // namespace core
