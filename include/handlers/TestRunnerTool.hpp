#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/Json.hpp"
#include "common/Result.hpp"
#include "core/ICommand.hpp"
#include "core/ThreadPool.hpp"

namespace handlers {

// ============================================================================
// SelfCheckSuite - Named check cases the run_tests tool executes
// ============================================================================
// A case passes when its body returns and fails when it throws. Bodies run
// on a worker thread and must not touch host-confined state.
// ============================================================================

class SelfCheckSuite {
public:
    enum class Mode { Edit, Play };

    using Body = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    struct CaseResult {
        std::string name;
        bool passed = false;
        bool skipped = false;
        std::string message;
        double duration_ms = 0;
    };

    struct RunResult {
        Mode mode = Mode::Edit;
        size_t total = 0;
        size_t passed = 0;
        size_t failed = 0;
        size_t skipped = 0;
        bool timed_out = false;
        std::vector<CaseResult> cases;

        common::Json to_json() const;
    };

    void add(std::string name, Mode mode, Body body);
    size_t size() const;

    // Runs every case of `mode` in registration order. Cases not started
    // before `deadline` are reported as skipped and the run as timed out.
    RunResult run(Mode mode, Clock::time_point deadline) const;

    // Accepts "edit"/"play" and "EditMode"/"PlayMode", case-insensitive
    static common::Result<Mode> parse_mode(const std::string& text);
    static const char* mode_name(Mode mode);

private:
    struct Case {
        std::string name;
        Mode mode;
        Body body;
    };

    mutable std::mutex mutex_;
    std::vector<Case> cases_;
};

// ============================================================================
// RunTestsTool - Deferred tool running the self-check suite off-thread
// ============================================================================
// Command: run_tests
// Params:  mode (default edit), timeoutSeconds (default 600)
// Returns a deferred result; the dispatcher polls it on later ticks.
// ============================================================================

class RunTestsTool final {
public:
    static constexpr const char* kCommandName = "run_tests";
    static constexpr const char* kTypeName = "RunTests";
    static constexpr int kDefaultTimeoutSeconds = 600;

    RunTestsTool(std::shared_ptr<SelfCheckSuite> suite, std::shared_ptr<core::ThreadPool> pool)
        : suite_(std::move(suite)), pool_(std::move(pool)) {}

    core::command::HandlerResult handle(const common::Json& params);

    // Positive integer (number or numeric string) or the default
    static int parse_timeout(const common::Json& params);

private:
    std::shared_ptr<SelfCheckSuite> suite_;
    std::shared_ptr<core::ThreadPool> pool_;
};

} // namespace handlers
