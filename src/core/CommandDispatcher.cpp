#include "core/CommandDispatcher.hpp"
#include "core/Envelope.hpp"
#include <chrono>
#include <stdexcept>

namespace core {
namespace command {

using common::Json;

// ============================================================================
// PendingCommand - Bookkeeping for one submission
// ============================================================================

struct CommandDispatcher::PendingCommand {
    PendingCommand(std::string text, common::CancellationToken token)
        : command_text(std::move(text)), cancellation(std::move(token)) {}

    std::string command_text;
    std::promise<std::string> promise;
    common::CancellationToken cancellation;
    common::CancellationRegistration registration;
    std::atomic<bool> resolved{false};

    // Guarded by pending_mutex_
    bool is_executing = false;
    bool has_deferred = false;
    std::shared_future<Json> deferred;
    std::string command_type;

    bool try_set_result(const std::string& payload) {
        if (resolved.exchange(true)) return false;
        promise.set_value(payload);
        return true;
    }

    bool try_set_cancelled() {
        if (resolved.exchange(true)) return false;
        promise.set_exception(std::make_exception_ptr(common::OperationCancelledException()));
        return true;
    }
};

namespace {

std::string trail(const std::vector<std::string>& stages) {
    std::string out;
    for (const auto& stage : stages) {
        if (!out.empty()) out += " > ";
        out += stage;
    }
    return out;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

CommandDispatcher::CommandDispatcher(
    std::shared_ptr<CommandRegistry> registry,
    std::shared_ptr<interfaces::IHostLoop> host,
    std::shared_ptr<interfaces::ILogger> logger
) : registry_(std::move(registry)), host_(std::move(host)), logger_(std::move(logger)) {
    if (!registry_ || !host_ || !logger_) {
        throw std::invalid_argument("CommandDispatcher requires a registry, a host loop and a logger");
    }
}

CommandDispatcher::~CommandDispatcher() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void CommandDispatcher::start() {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (running_.load(std::memory_order_acquire)) return;
        running_.store(true, std::memory_order_release);
    }
    logger_->info("[Dispatcher] Started");
}

void CommandDispatcher::stop() {
    std::vector<PendingPtr> abandoned;
    interfaces::IHostLoop::HookId hook = 0;
    bool was_running = false;

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        was_running = running_.exchange(false, std::memory_order_acq_rel);

        abandoned.reserve(pending_.size());
        for (auto& entry : pending_) {
            abandoned.push_back(entry.second);
        }
        pending_.clear();

        hook = hook_id_;
        hook_id_ = 0;
    }

    if (hook != 0) {
        host_->remove_update(hook);
    }

    for (auto& pending : abandoned) {
        pending->registration.dispose();
        if (pending->try_set_cancelled()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.cancelled++;
        }
    }

    if (was_running) {
        logger_->info("[Dispatcher] Stopped (" + std::to_string(abandoned.size()) +
                      " pending requests cancelled)");
    }
}

// ============================================================================
// Submission
// ============================================================================

std::future<std::string> CommandDispatcher::execute_command_async(
    const char* command_text,
    common::CancellationToken cancellation
) {
    if (command_text == nullptr) {
        throw std::invalid_argument("command_text must not be null");
    }
    return execute_command_async(std::string(command_text), std::move(cancellation));
}

std::future<std::string> CommandDispatcher::execute_command_async(
    const std::string& command_text,
    common::CancellationToken cancellation
) {
    const uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);

    auto pending = std::make_shared<PendingCommand>(command_text, cancellation);
    auto future = pending->promise.get_future();

    if (cancellation.can_be_cancelled()) {
        // Registered before the request is visible: a signal arriving now
        // finds nothing to remove and is caught by the check below or by the
        // tick's own cancellation check.
        pending->registration = cancellation.register_callback([this, id]() {
            cancel_pending(id);
        });

        if (cancellation.is_cancellation_requested()) {
            pending->registration.dispose();
            if (pending->try_set_cancelled()) {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.cancelled++;
            }
            return future;
        }
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            throw std::logic_error("CommandDispatcher is not running");
        }
        pending_[id] = pending;
        hook_update_locked();
    }

    return future;
}

// ============================================================================
// Host Tick
// ============================================================================

void CommandDispatcher::drain_once() {
    std::vector<std::pair<uint64_t, PendingPtr>> ready;
    std::vector<std::pair<uint64_t, PendingPtr>> finished;

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);

        ready.reserve(pending_.size());
        for (auto& entry : pending_) {
            auto& pending = entry.second;

            if (!pending->is_executing) {
                pending->is_executing = true;
                ready.emplace_back(entry.first, pending);
                continue;
            }

            if (pending->has_deferred &&
                pending->deferred.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                finished.emplace_back(entry.first, pending);
            }
        }

        if (ready.empty() && finished.empty()) {
            unhook_update_if_idle_locked();
            return;
        }
    }

    for (auto& entry : finished) {
        complete_deferred(entry.first, entry.second);
    }

    for (auto& entry : ready) {
        process_command(entry.first, entry.second);
    }
}

void CommandDispatcher::process_command(uint64_t id, const PendingPtr& pending) {
    if (pending->cancellation.is_cancellation_requested()) {
        resolve_cancelled(id, pending);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_dispatched++;
    }

    std::string command_type = "Unknown";
    std::vector<std::string> stages{"parse"};

    try {
        const std::string text = text::trim(pending->command_text);
        if (text.empty()) {
            resolve(id, pending, ResponseEnvelope::error("Empty command received"), false);
            return;
        }

        if (text::is_ping(text)) {
            resolve(id, pending, ResponseEnvelope::pong(), true);
            return;
        }

        if (!text::is_valid_json(text)) {
            resolve(id, pending, ResponseEnvelope::invalid_json(text), false);
            return;
        }

        auto parsed = CommandEnvelope::parse(text);
        if (parsed.is_err()) {
            resolve(id, pending, ResponseEnvelope::error(parsed.error().message), false);
            return;
        }

        const CommandEnvelope& command = parsed.unwrap();
        if (text::is_blank(command.type)) {
            resolve(id, pending, ResponseEnvelope::error("Command type cannot be empty"), false);
            return;
        }

        if (text::is_ping(command.type)) {
            resolve(id, pending, ResponseEnvelope::pong(), true);
            return;
        }

        command_type = command.type;
        stages.push_back("resolve:" + command_type);

        registry_->initialize();
        const CommandHandler& handler = registry_->get_handler(command.type);

        stages.push_back("invoke:" + command_type);
        HandlerResult result = handler(command.params);

        if (result.is_deferred()) {
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                pending->deferred = result.future();
                pending->has_deferred = true;
                pending->command_type = command_type;
            }
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.deferred++;
            }
            logger_->debug("[Dispatcher] " + command_type + " deferred (request " +
                           std::to_string(id) + ")");
            return;
        }

        resolve(id, pending, ResponseEnvelope::success(result.value()), true);
    }
    catch (const UnknownCommandError& ex) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.unknown_commands++;
        }
        logger_->warn(std::string("[Dispatcher] ") + ex.what());
        resolve(id, pending, ResponseEnvelope::error(ex.what(), command_type), false);
    }
    catch (const std::exception& ex) {
        const std::string trace = trail(stages);
        logger_->error(std::string("[Dispatcher] Error processing command: ") + ex.what() +
                       "\n  at " + trace);
        resolve(id, pending,
                ResponseEnvelope::error(ex.what(), "Unknown (error during processing)", trace),
                false);
    }
    catch (...) {
        const std::string trace = trail(stages);
        logger_->error("[Dispatcher] Non-standard exception processing command\n  at " + trace);
        resolve(id, pending,
                ResponseEnvelope::error("Unknown exception", "Unknown (error during processing)", trace),
                false);
    }
}

void CommandDispatcher::complete_deferred(uint64_t id, const PendingPtr& pending) {
    const std::string trace = "invoke:" + pending->command_type + " > deferred";

    try {
        Json value = pending->deferred.get();
        resolve(id, pending, ResponseEnvelope::success(std::move(value)), true);
    }
    catch (const std::exception& ex) {
        logger_->error("[Dispatcher] Deferred command " + pending->command_type +
                       " failed: " + ex.what());
        resolve(id, pending, ResponseEnvelope::error(ex.what(), pending->command_type, trace), false);
    }
    catch (...) {
        logger_->error("[Dispatcher] Deferred command " + pending->command_type +
                       " failed with a non-standard exception");
        resolve(id, pending,
                ResponseEnvelope::error("Unknown exception", pending->command_type, trace), false);
    }
}

// ============================================================================
// Resolution & Cleanup
// ============================================================================

void CommandDispatcher::resolve(
    uint64_t id,
    const PendingPtr& pending,
    const Json& response,
    bool success
) {
    const std::string payload = ResponseEnvelope::serialize(response);

    remove_pending(id);

    if (pending->try_set_result(payload)) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (success) stats_.succeeded++;
        else stats_.failed++;
    }
}

void CommandDispatcher::resolve_cancelled(uint64_t id, const PendingPtr& pending) {
    remove_pending(id);

    if (pending->try_set_cancelled()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.cancelled++;
    }
}

void CommandDispatcher::cancel_pending(uint64_t id) {
    PendingPtr cancelled;

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return;

        // Claimed: already escaped the cancellable window
        if (it->second->is_executing) return;

        cancelled = it->second;
        pending_.erase(it);
        unhook_update_if_idle_locked();
    }

    cancelled->registration.dispose();

    if (cancelled->try_set_cancelled()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.cancelled++;
    }
    logger_->debug("[Dispatcher] Request " + std::to_string(id) + " cancelled before execution");
}

bool CommandDispatcher::remove_pending(uint64_t id) {
    PendingPtr removed;

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return false;

        removed = it->second;
        pending_.erase(it);
        unhook_update_if_idle_locked();
    }

    // Outside the lock: dispose() may wait for a cancel callback that needs it
    removed->registration.dispose();
    return true;
}

void CommandDispatcher::hook_update_locked() {
    if (hook_id_ != 0) return;

    hook_id_ = host_->add_update([this]() { drain_once(); });
    logger_->debug("[Dispatcher] Attached to host update");
}

void CommandDispatcher::unhook_update_if_idle_locked() {
    if (!pending_.empty() || hook_id_ == 0) return;

    host_->remove_update(hook_id_);
    hook_id_ = 0;
    logger_->debug("[Dispatcher] Detached from host update");
}

// ============================================================================
// Diagnostics
// ============================================================================

size_t CommandDispatcher::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

bool CommandDispatcher::is_hooked() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return hook_id_ != 0;
}

CommandDispatcher::Stats CommandDispatcher::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace command
} // namespace core
