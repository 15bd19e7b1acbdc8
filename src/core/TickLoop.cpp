#include "core/TickLoop.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace core {

TickLoop::TickLoop(std::chrono::milliseconds frame_interval,
                   std::shared_ptr<interfaces::ILogger> logger)
    : frame_interval_(frame_interval), logger_(std::move(logger)) {
    if (frame_interval_.count() <= 0) {
        throw std::invalid_argument("TickLoop frame interval must be positive");
    }
}

TickLoop::~TickLoop() {
    stop();
}

void TickLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) return;

    stop_requested_ = false;
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this]() { run(); });
    host_thread_ = thread_.get_id();

    if (logger_) {
        logger_->info("[HostLoop] Started (frame interval " +
                      std::to_string(frame_interval_.count()) + " ms)");
    }
}

void TickLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) return;
        stop_requested_ = true;
    }
    wake_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false, std::memory_order_release);
        host_thread_ = std::thread::id();
        tasks_.clear();
    }

    if (logger_) {
        logger_->info("[HostLoop] Stopped after " + std::to_string(tick_count()) + " ticks");
    }
}

// ============================================================================
// IHostLoop
// ============================================================================

interfaces::IHostLoop::HookId TickLoop::add_update(UpdateFn fn) {
    if (!fn) {
        throw std::invalid_argument("update callback must not be empty");
    }

    HookId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_hook_id_++;
        updates_.emplace(id, std::move(fn));
    }
    wake_.notify_all();
    return id;
}

void TickLoop::remove_update(HookId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    updates_.erase(id);
}

void TickLoop::post(Task task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    wake_.notify_all();
}

bool TickLoop::is_host_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return host_thread_ == std::this_thread::get_id();
}

size_t TickLoop::update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updates_.size();
}

// ============================================================================
// Loop
// ============================================================================

void TickLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        // Idle until there is something to tick for
        wake_.wait(lock, [this]() {
            return stop_requested_ || !updates_.empty() || !tasks_.empty();
        });
        if (stop_requested_) return;

        lock.unlock();
        run_tick();
        lock.lock();

        if (!updates_.empty()) {
            wake_.wait_for(lock, frame_interval_, [this]() { return stop_requested_; });
        }
        if (stop_requested_) return;
    }
}

void TickLoop::run_tick() {
    std::vector<Task> tasks;
    std::vector<HookId> hook_ids;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
        hook_ids.reserve(updates_.size());
        for (const auto& entry : updates_) {
            hook_ids.push_back(entry.first);
        }
    }

    ticks_.fetch_add(1, std::memory_order_relaxed);

    for (auto& task : tasks) {
        try {
            task();
        } catch (const std::exception& e) {
            if (logger_) logger_->error(std::string("[HostLoop] Posted task threw: ") + e.what());
        } catch (...) {
            if (logger_) logger_->error("[HostLoop] Posted task threw a non-standard exception");
        }
    }

    for (HookId id : hook_ids) {
        UpdateFn fn;
        {
            // Skip callbacks detached earlier in this tick
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = updates_.find(id);
            if (it == updates_.end()) continue;
            fn = it->second;
        }

        try {
            fn();
        } catch (const std::exception& e) {
            if (logger_) logger_->error(std::string("[HostLoop] Update callback threw: ") + e.what());
        } catch (...) {
            if (logger_) logger_->error("[HostLoop] Update callback threw a non-standard exception");
        }
    }
}

} // namespace core
