// ============================================================================
// Server Test Program
// ============================================================================
// Runs BridgeServer on a loopback port and talks to it with a plain POSIX
// client speaking the length-prefixed framing:
// - ping, tool calls, malformed input, ordering on one connection
// - request timeout and client disconnect (both cancel the request)
// - oversized frames, bad bind address, submission after dispatcher stop
//
// Run with: ./ServerTest
// ============================================================================

#include "TestHarness.hpp"
#include "core/BridgeServer.hpp"
#include "core/TickLoop.hpp"
#include "testing/CapturingLogger.hpp"
#include "testing/ManualTickHost.hpp"

#include <sys/time.h>

#include <chrono>
#include <cstring>
#include <thread>

using namespace std::chrono_literals;
using common::Json;
using core::BridgeServer;
using core::command::CommandDispatcher;
using core::command::CommandRegistry;
using core::command::ToolCatalog;

namespace {

const char* const kPong = R"({"status":"success","result":{"message":"pong"}})";

// Blocking test client with a receive timeout so a broken server fails the
// check instead of hanging the run.
class FrameClient {
public:
    explicit FrameClient(uint16_t port) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (!IS_VALID_SOCKET(fd_)) return;

        struct timeval tv;
        tv.tv_sec = 5;
        tv.tv_usec = 0;
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        if (connect(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            CLOSE_SOCKET(fd_);
            fd_ = INVALID_SOCKET;
        }
    }

    ~FrameClient() { close(); }

    bool connected() const { return IS_VALID_SOCKET(fd_); }

    bool send_raw(const std::vector<uint8_t>& bytes) {
        size_t sent = 0;
        while (sent < bytes.size()) {
            ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    bool send_text(const std::string& text) {
        return send_raw(BridgeServer::encode_frame(text));
    }

    // Empty string on timeout or close
    std::string receive() {
        uint8_t header[4];
        if (!recv_exact(header, 4)) return "";
        uint32_t net_len;
        memcpy(&net_len, header, 4);
        std::string text(ntohl(net_len), '\0');
        if (!text.empty() && !recv_exact(reinterpret_cast<uint8_t*>(&text[0]), text.size())) return "";
        return text;
    }

    std::string request(const std::string& text) {
        if (!send_text(text)) return "";
        return receive();
    }

    // True when the server closed the connection
    bool closed_by_peer() {
        uint8_t byte;
        return ::recv(fd_, &byte, 1, 0) == 0;
    }

    void close() {
        if (IS_VALID_SOCKET(fd_)) {
            CLOSE_SOCKET(fd_);
            fd_ = INVALID_SOCKET;
        }
    }

private:
    bool recv_exact(uint8_t* buf, size_t len) {
        size_t got = 0;
        while (got < len) {
            ssize_t n = ::recv(fd_, buf + got, len - got, 0);
            if (n <= 0) return false;
            got += static_cast<size_t>(n);
        }
        return true;
    }

    socket_t fd_ = INVALID_SOCKET;
};

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

ToolCatalog echo_catalog() {
    ToolCatalog catalog;
    catalog.add_named("echo", "Echo", [](const Json& params) { return params; });
    return catalog;
}

} // namespace

void test_round_trips() {
    test_group("request/response over loopback");

    auto logger = std::make_shared<testing::CapturingLogger>();
    auto loop = std::make_shared<core::TickLoop>(5ms, logger);
    auto registry = std::make_shared<CommandRegistry>(echo_catalog(), logger);
    auto dispatcher = std::make_shared<CommandDispatcher>(registry, loop, logger);

    loop->start();
    dispatcher->start();

    BridgeServer server("127.0.0.1", 0, 5000ms, dispatcher, logger);
    auto started = server.start();
    log_test("starts on an ephemeral port", started.is_ok() && server.bound_port() != 0 && server.is_running());
    if (started.is_err()) {
        dispatcher->stop();
        loop->stop();
        return;
    }

    FrameClient client(server.bound_port());
    log_test("client connects", client.connected());

    log_test("ping answered with pong", client.request("ping") == kPong);

    {
        std::string raw = client.request(R"({"type":"echo","params":{"value":42}})");
        Json r = raw.empty() ? Json() : Json::parse(raw);
        log_test("tool result wrapped in success envelope",
                 r.is_object() && r["status"] == "success" && r["result"]["value"] == 42, raw);
    }

    {
        std::string raw = client.request("{not json");
        Json r = raw.empty() ? Json() : Json::parse(raw);
        log_test("malformed JSON reported",
                 r.is_object() && r["status"] == "error" && r["error"] == "Invalid JSON format" &&
                 r["receivedText"] == "{not json", raw);
    }

    {
        std::string raw = client.request("");
        Json r = raw.empty() ? Json() : Json::parse(raw);
        log_test("empty frame answered", r.is_object() && r["error"] == "Empty command received", raw);
    }

    {
        bool ok = client.send_text(R"({"type":"echo","params":{"n":1}})") &&
                  client.send_text(R"({"type":"echo","params":{"n":2}})") &&
                  client.send_text("ping");
        std::string first = client.receive();
        std::string second = client.receive();
        std::string third = client.receive();
        ok = ok && !first.empty() && !second.empty() &&
             Json::parse(first)["result"]["n"] == 1 &&
             Json::parse(second)["result"]["n"] == 2 &&
             third == kPong;
        log_test("pipelined requests answered in order", ok);
    }

    {
        FrameClient other(server.bound_port());
        log_test("second connection served independently", other.request("ping") == kPong);
        log_test("both connections tracked",
                 wait_until([&]() { return server.connection_count() == 2; }, 1000ms));
    }

    log_test("closed connection no longer counted",
             wait_until([&]() { return server.connection_count() == 1; }, 2000ms));

    server.stop();
    log_test("stop closes the listener", !server.is_running() && !FrameClient(server.bound_port()).connected());
    log_test("open client sees the close", client.closed_by_peer());

    server.stop();
    size_t stop_lines = 0;
    for (const auto& entry : logger->entries()) {
        if (entry.message == "[BridgeServer] Stopped") stop_lines++;
    }
    log_test("stop is idempotent", stop_lines == 1);

    dispatcher->stop();
    loop->stop();
}

void test_timeouts_and_disconnects() {
    test_group("timeout and disconnect");

    // Nothing ticks this host, so every tool request stays queued
    auto logger = std::make_shared<testing::CapturingLogger>();
    auto host = std::make_shared<testing::ManualTickHost>();
    auto registry = std::make_shared<CommandRegistry>(echo_catalog(), logger);
    auto dispatcher = std::make_shared<CommandDispatcher>(registry, host, logger);
    dispatcher->start();

    {
        BridgeServer server("127.0.0.1", 0, 150ms, dispatcher, logger);
        if (server.start().is_err()) {
            log_test("timeout server starts", false);
            return;
        }

        FrameClient client(server.bound_port());
        std::string raw = client.request(R"({"type":"echo","params":{}})");
        Json r = raw.empty() ? Json() : Json::parse(raw);
        log_test("stalled request times out",
                 r.is_object() && r["status"] == "error" && r["error"] == "Request timed out", raw);
        log_test("timed-out request cancelled", dispatcher->pending_count() == 0);
        log_test("timeout logged", logger->contains("WARN", "timed out"));

        // Ping is also served from the host tick, so it stalls the same way
        raw = client.request("ping");
        r = raw.empty() ? Json() : Json::parse(raw);
        log_test("connection survives a timeout",
                 r.is_object() && r["error"] == "Request timed out" && dispatcher->pending_count() == 0, raw);

        server.stop();
    }

    {
        BridgeServer server("127.0.0.1", 0, 10000ms, dispatcher, logger);
        if (server.start().is_err()) {
            log_test("disconnect server starts", false);
            return;
        }

        {
            FrameClient client(server.bound_port());
            client.send_text(R"({"type":"echo","params":{}})");
            log_test("request queued",
                     wait_until([&]() { return dispatcher->pending_count() == 1; }, 1000ms));
        }

        log_test("disconnect cancels the request",
                 wait_until([&]() { return dispatcher->pending_count() == 0; }, 2000ms));
        log_test("cancellation counted", dispatcher->get_stats().cancelled == 3);

        server.stop();
    }

    dispatcher->stop();
}

void test_rejections() {
    test_group("rejections");

    auto logger = std::make_shared<testing::CapturingLogger>();
    auto host = std::make_shared<testing::ManualTickHost>();
    auto registry = std::make_shared<CommandRegistry>(ToolCatalog{}, logger);
    auto dispatcher = std::make_shared<CommandDispatcher>(registry, host, logger);

    {
        BridgeServer server("not-an-address", 0, 1000ms, dispatcher, logger);
        auto result = server.start();
        log_test("bad bind address",
                 result.is_err() && result.error().code == common::ErrorCode::InvalidConfig &&
                 !server.is_running());
    }

    BridgeServer server("127.0.0.1", 0, 1000ms, dispatcher, logger);
    if (server.start().is_err()) {
        log_test("rejection server starts", false);
        return;
    }

    {
        BridgeServer clash("127.0.0.1", server.bound_port(), 1000ms, dispatcher, logger);
        auto result = clash.start();
        log_test("port in use reported as network error",
                 result.is_err() && result.error().code == common::ErrorCode::NetworkError &&
                 std::string(common::error_code_name(result.error().code)) == "NetworkError" &&
                 !clash.is_running());
    }

    {
        // Dispatcher never started
        FrameClient client(server.bound_port());
        std::string raw = client.request("ping");
        Json r = raw.empty() ? Json() : Json::parse(raw);
        log_test("stopped dispatcher reported",
                 r.is_object() && r["status"] == "error" &&
                 r["error"].get<std::string>().rfind("Bridge unavailable", 0) == 0, raw);
    }

    {
        FrameClient client(server.bound_port());
        std::vector<uint8_t> header = {0x7F, 0xFF, 0xFF, 0xFF};
        client.send_raw(header);
        log_test("oversized frame drops the connection", client.closed_by_peer());
        log_test("oversized frame logged",
                 wait_until([&]() { return logger->contains("WARN", "exceeds limit"); }, 1000ms));
    }

    server.stop();
}

int main() {
    std::cout << "Server Test Suite" << std::endl;
    std::cout << "=================" << std::endl;

    init_network();

    test_round_trips();
    test_timeouts_and_disconnects();
    test_rejections();

    cleanup_network();

    print_summary();
    return exit_code();
}
