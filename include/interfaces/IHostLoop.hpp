#pragma once
#include <cstdint>
#include <functional>

namespace interfaces {

// ============================================================================
// IHostLoop - The host's single cooperative thread
// ============================================================================
// All mutation of host state happens on this thread. Work reaches it in two
// ways:
//   - update callbacks, invoked once per tick for as long as they stay attached
//   - posted tasks, invoked once on the next tick
//
// Implementations never invoke callbacks reentrantly: a tick runs to
// completion before the next one starts.
// ============================================================================

class IHostLoop {
public:
    using UpdateFn = std::function<void()>;
    using Task = std::function<void()>;
    using HookId = uint64_t;

    virtual ~IHostLoop() = default;

    // Attach a per-tick callback. Returns a non-zero id.
    virtual HookId add_update(UpdateFn fn) = 0;

    // Detach a per-tick callback. Unknown or already removed ids are ignored.
    // Safe to call from inside the callback itself.
    virtual void remove_update(HookId id) = 0;

    // Run `task` once on the host thread during the next tick.
    virtual void post(Task task) = 0;

    // True when called from the thread that runs ticks.
    virtual bool is_host_thread() const = 0;
};

} // namespace interfaces
