#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace common {

    class OperationCancelledException : public std::runtime_error {
    public:
        OperationCancelledException() : std::runtime_error("Operation Cancelled") {}
    };

    namespace detail {
        struct CancellationState {
            std::atomic<bool> requested{false};

            std::mutex mutex;
            std::condition_variable callback_done;
            uint64_t next_id = 1;
            uint64_t running_id = 0;
            std::thread::id running_thread;
            std::map<uint64_t, std::function<void()>> callbacks;
        };
    }

    // ============================================================================
    // CancellationRegistration - Handle for a callback registered on a token
    // ============================================================================
    // dispose() (or destruction) unregisters the callback. If the callback is
    // running on another thread at that moment, dispose() blocks until it
    // returns, so the owner may release whatever the callback touches.
    // ============================================================================

    class CancellationRegistration {
    public:
        CancellationRegistration() = default;
        CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}

        ~CancellationRegistration() { dispose(); }

        CancellationRegistration(const CancellationRegistration&) = delete;
        CancellationRegistration& operator=(const CancellationRegistration&) = delete;

        CancellationRegistration(CancellationRegistration&& other) noexcept
            : state_(std::move(other.state_)), id_(other.id_) {
            other.id_ = 0;
        }

        CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
            if (this != &other) {
                dispose();
                state_ = std::move(other.state_);
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }

        void dispose() {
            if (id_ == 0) return;
            auto state = state_.lock();
            const uint64_t id = id_;
            id_ = 0;
            if (!state) return;

            std::unique_lock<std::mutex> lock(state->mutex);
            state->callbacks.erase(id);
            if (state->running_id == id && state->running_thread != std::this_thread::get_id()) {
                state->callback_done.wait(lock, [&]() { return state->running_id != id; });
            }
        }

        bool is_active() const { return id_ != 0; }

    private:
        std::weak_ptr<detail::CancellationState> state_;
        uint64_t id_ = 0;
    };

    // The Token (View) - Passed to workers
    class CancellationToken {
        std::shared_ptr<detail::CancellationState> state;

        struct NoneTag {};
        explicit CancellationToken(NoneTag) {}

    public:
        CancellationToken() : state(std::make_shared<detail::CancellationState>()) {}

        // A token that can never be cancelled
        static CancellationToken none() { return CancellationToken(NoneTag{}); }

        bool can_be_cancelled() const { return state != nullptr; }

        // Check with ACQUIRE memory order (sees writes from owner)
        bool is_cancellation_requested() const {
            return state && state->requested.load(std::memory_order_acquire);
        }

        void throw_if_cancellation_requested() const {
            if(is_cancellation_requested()) throw OperationCancelledException();
        }

        // Runs `callback` once when cancellation is requested. If the token is
        // already cancelled the callback runs synchronously on this thread and
        // an inactive registration is returned.
        CancellationRegistration register_callback(std::function<void()> callback) const {
            if (!state) return CancellationRegistration();

            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (!state->requested.load(std::memory_order_acquire)) {
                    const uint64_t id = state->next_id++;
                    state->callbacks.emplace(id, std::move(callback));
                    return CancellationRegistration(state, id);
                }
            }

            callback();
            return CancellationRegistration();
        }

        friend class CancellationSource;
    };

    // The Source (Owner) - Held by controller
    class CancellationSource {
        CancellationToken token;

    public:
        CancellationSource() {
            // Token wraps the shared state created in its constructor
        }

        // Set with RELEASE memory order (flushes prior writes), then run the
        // registered callbacks on the calling thread.
        void cancel() {
            auto state = token.state;
            if (!state) return;
            if (state->requested.exchange(true, std::memory_order_acq_rel)) return;

            std::unique_lock<std::mutex> lock(state->mutex);
            while (!state->callbacks.empty()) {
                auto it = state->callbacks.begin();
                const uint64_t id = it->first;
                auto callback = std::move(it->second);
                state->callbacks.erase(it);

                state->running_id = id;
                state->running_thread = std::this_thread::get_id();
                lock.unlock();

                try {
                    callback();
                } catch (...) {
                    lock.lock();
                    state->running_id = 0;
                    state->callback_done.notify_all();
                    throw;
                }

                lock.lock();
                state->running_id = 0;
                state->callback_done.notify_all();
            }
        }

        bool is_cancellation_requested() const { return token.is_cancellation_requested(); }

        CancellationToken get_token() const { return token; }

        void reset() {
            token = CancellationToken(); // Create fresh state
        }
    };

} // namespace common
