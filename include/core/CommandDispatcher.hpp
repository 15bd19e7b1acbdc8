#pragma once
#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/Cancellation.hpp"
#include "common/Json.hpp"
#include "core/CommandRegistry.hpp"
#include "interfaces/IHostLoop.hpp"
#include "interfaces/ILogger.hpp"

namespace core {
namespace command {

// ============================================================================
// CommandDispatcher - Runs commands on the host thread
// ============================================================================
// Any thread may submit raw command text. Execution happens only inside
// drain_once(), which the dispatcher attaches to the host loop's per-tick
// callbacks while work is pending and detaches once a tick finds nothing left.
//
// Request lifecycle:
//   Submitted -> Claimed -> {Success | Error | Cancelled}
//   Submitted -> Cancelled            (cancellation won the race)
//
// A request is claimed exactly once, under the lock, by the tick that runs
// it. Cancellation after the claim has no effect. Every returned future is
// resolved exactly once: with a response envelope string, or with
// common::OperationCancelledException.
//
// Thread Safety:
// - execute_command_async(): any thread
// - drain_once(): host thread only (it is the hook callback)
// - start()/stop(): any thread. Stop the host loop before destroying the
//   dispatcher: a tick already running keeps using it.
// ============================================================================

class CommandDispatcher {
public:
    struct Stats {
        uint64_t total_dispatched = 0;  // claimed and processed
        uint64_t succeeded = 0;
        uint64_t failed = 0;
        uint64_t unknown_commands = 0;
        uint64_t cancelled = 0;
        uint64_t deferred = 0;
    };

    CommandDispatcher(
        std::shared_ptr<CommandRegistry> registry,
        std::shared_ptr<interfaces::IHostLoop> host,
        std::shared_ptr<interfaces::ILogger> logger
    );
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    // ========== Lifecycle ==========

    // Accept submissions
    void start();

    // Refuse submissions, detach from the host loop and resolve every
    // request still pending as cancelled. Idempotent.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    // ========== Submission ==========

    // Queue `command_text` for the host thread and return immediately.
    // The future yields the JSON response envelope, or throws
    // common::OperationCancelledException when `cancellation` fired before
    // the request was claimed (or the dispatcher was stopped).
    //
    // Throws std::logic_error when the dispatcher is not running.
    std::future<std::string> execute_command_async(
        const std::string& command_text,
        common::CancellationToken cancellation = common::CancellationToken::none()
    );

    // Throws std::invalid_argument for a null pointer (transport bug).
    std::future<std::string> execute_command_async(
        const char* command_text,
        common::CancellationToken cancellation = common::CancellationToken::none()
    );

    // ========== Host Tick ==========

    // Claim every unclaimed request and run it; finish deferred requests
    // whose inner future is ready; detach when idle. Never throws.
    void drain_once();

    // ========== Diagnostics ==========

    size_t pending_count() const;
    bool is_hooked() const;
    Stats get_stats() const;

private:
    struct PendingCommand;
    using PendingPtr = std::shared_ptr<PendingCommand>;

    void process_command(uint64_t id, const PendingPtr& pending);
    void complete_deferred(uint64_t id, const PendingPtr& pending);

    // Remove bookkeeping and resolve with an envelope
    void resolve(uint64_t id, const PendingPtr& pending, const common::Json& response, bool success);
    void resolve_cancelled(uint64_t id, const PendingPtr& pending);

    void cancel_pending(uint64_t id);
    bool remove_pending(uint64_t id);

    // Caller holds pending_mutex_
    void hook_update_locked();
    void unhook_update_if_idle_locked();

    std::shared_ptr<CommandRegistry> registry_;
    std::shared_ptr<interfaces::IHostLoop> host_;
    std::shared_ptr<interfaces::ILogger> logger_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> next_id_{1};

    mutable std::mutex pending_mutex_;
    std::map<uint64_t, PendingPtr> pending_;   // submission order
    interfaces::IHostLoop::HookId hook_id_ = 0;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

} // namespace command
} // namespace core
