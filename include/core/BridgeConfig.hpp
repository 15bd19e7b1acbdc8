#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "common/Result.hpp"

namespace core {

// ============================================================================
// BridgeConfig - Runtime settings for the host executable
// ============================================================================
// Precedence (lowest to highest): defaults, HOSTBRIDGE_* environment
// variables, command-line options. A bare positional argument is taken as
// the port.
// ============================================================================

struct BridgeConfig {
    int port = 6400;
    std::string bind_address = "127.0.0.1";
    int frame_interval_ms = 16;
    int request_timeout_ms = 30000;
    size_t worker_threads = 2;
    bool debug_logs = false;
    bool show_help = false;

    // Returns the value of an environment variable, or nullptr when unset
    using EnvLookup = std::function<const char*(const char*)>;

    static common::Result<BridgeConfig> load(int argc, char** argv);

    // `args` excludes the program name
    static common::Result<BridgeConfig> load(const std::vector<std::string>& args,
                                             const EnvLookup& getenv_fn);

    static std::string usage(const std::string& program);

    std::string describe() const;
};

} // namespace core
