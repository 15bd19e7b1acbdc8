#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "interfaces/IHostLoop.hpp"
#include "interfaces/ILogger.hpp"

namespace core {

// ============================================================================
// TickLoop - Host loop on a dedicated thread
// ============================================================================
// Each tick first runs the tasks posted since the previous tick, then every
// attached update callback in attach order. While callbacks are attached the
// loop ticks once per frame interval; with none attached and nothing posted
// it sleeps on a condition variable.
//
// Exceptions escaping a task or callback are logged and the tick continues.
// ============================================================================

class TickLoop : public interfaces::IHostLoop {
public:
    TickLoop(std::chrono::milliseconds frame_interval,
             std::shared_ptr<interfaces::ILogger> logger);
    ~TickLoop() override;

    TickLoop(const TickLoop&) = delete;
    TickLoop& operator=(const TickLoop&) = delete;

    void start();

    // Wakes the loop and joins its thread. Posted tasks that have not run
    // yet are dropped. Must not be called from the host thread.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    // ========== IHostLoop ==========

    HookId add_update(UpdateFn fn) override;
    void remove_update(HookId id) override;
    void post(Task task) override;
    bool is_host_thread() const override;

    // ========== Diagnostics ==========

    size_t update_count() const;
    uint64_t tick_count() const { return ticks_.load(std::memory_order_relaxed); }

private:
    void run();
    void run_tick();

    const std::chrono::milliseconds frame_interval_;
    std::shared_ptr<interfaces::ILogger> logger_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::thread::id host_thread_;
    HookId next_hook_id_ = 1;
    std::map<HookId, UpdateFn> updates_;   // attach order
    std::vector<Task> tasks_;
};

} // namespace core
