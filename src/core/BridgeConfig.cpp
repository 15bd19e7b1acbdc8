#include "core/BridgeConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace core {

namespace {

using ConfigResult = common::Result<BridgeConfig>;

common::Result<long long> parse_integer(const std::string& text, const std::string& name,
                                        long long min_value, long long max_value) {
    if (text.empty()) {
        return common::Result<long long>::err(common::ErrorCode::InvalidConfig,
                                              name + " must not be empty");
    }

    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return common::Result<long long>::err(common::ErrorCode::InvalidConfig,
                                              name + " is not a number: '" + text + "'");
    }

    if (value < min_value || value > max_value) {
        return common::Result<long long>::err(
            common::ErrorCode::InvalidConfig,
            name + " out of range [" + std::to_string(min_value) + ", " +
                std::to_string(max_value) + "]: " + text);
    }
    return common::Result<long long>::ok(value);
}

common::Result<bool> parse_flag(const std::string& text, const std::string& name) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return common::Result<bool>::ok(true);
    }
    if (lowered.empty() || lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return common::Result<bool>::ok(false);
    }
    return common::Result<bool>::err(common::ErrorCode::InvalidConfig,
                                     name + " is not a boolean: '" + text + "'");
}

// Applies one named setting; shared by the environment and CLI passes
common::EmptyResult apply(BridgeConfig& config, const std::string& key,
                          const std::string& value, const std::string& source) {
    if (key == "port") {
        auto r = parse_integer(value, source, 1, 65535);
        if (r.is_err()) return r.error();
        config.port = static_cast<int>(r.unwrap());
    } else if (key == "bind") {
        if (value.empty()) {
            return common::AppError{common::ErrorCode::InvalidConfig, source + " must not be empty", ""};
        }
        config.bind_address = value;
    } else if (key == "frame-ms") {
        auto r = parse_integer(value, source, 1, 1000);
        if (r.is_err()) return r.error();
        config.frame_interval_ms = static_cast<int>(r.unwrap());
    } else if (key == "timeout-ms") {
        auto r = parse_integer(value, source, 1, 24LL * 60 * 60 * 1000);
        if (r.is_err()) return r.error();
        config.request_timeout_ms = static_cast<int>(r.unwrap());
    } else if (key == "workers") {
        auto r = parse_integer(value, source, 1, 256);
        if (r.is_err()) return r.error();
        config.worker_threads = static_cast<size_t>(r.unwrap());
    } else if (key == "debug") {
        auto r = parse_flag(value, source);
        if (r.is_err()) return r.error();
        config.debug_logs = r.unwrap();
    } else {
        return common::AppError{common::ErrorCode::InvalidConfig, "Unknown setting: " + source, ""};
    }
    return common::EmptyResult::success();
}

struct EnvBinding {
    const char* variable;
    const char* key;
};

const EnvBinding kEnvBindings[] = {
    {"HOSTBRIDGE_PORT", "port"},
    {"HOSTBRIDGE_BIND", "bind"},
    {"HOSTBRIDGE_FRAME_MS", "frame-ms"},
    {"HOSTBRIDGE_TIMEOUT_MS", "timeout-ms"},
    {"HOSTBRIDGE_WORKERS", "workers"},
    {"HOSTBRIDGE_DEBUG", "debug"},
};

} // namespace

ConfigResult BridgeConfig::load(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return load(args, [](const char* name) -> const char* { return std::getenv(name); });
}

ConfigResult BridgeConfig::load(const std::vector<std::string>& args, const EnvLookup& getenv_fn) {
    BridgeConfig config;

    // 1. Environment
    if (getenv_fn) {
        for (const auto& binding : kEnvBindings) {
            const char* value = getenv_fn(binding.variable);
            if (value == nullptr) continue;

            auto applied = apply(config, binding.key, value, binding.variable);
            if (applied.is_err()) return applied.error();
        }
    }

    // 2. Command line
    bool positional_port_seen = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            continue;
        }

        if (arg == "--debug") {
            config.debug_logs = true;
            continue;
        }

        if (arg.rfind("--", 0) == 0) {
            std::string key = arg.substr(2);
            std::string value;

            const auto eq = key.find('=');
            if (eq != std::string::npos) {
                value = key.substr(eq + 1);
                key = key.substr(0, eq);
            } else {
                if (i + 1 >= args.size()) {
                    return ConfigResult::err(common::ErrorCode::InvalidConfig,
                                             "Missing value for " + arg);
                }
                value = args[++i];
            }

            if (key == "debug") {
                return ConfigResult::err(common::ErrorCode::InvalidConfig,
                                         "--debug takes no value");
            }

            auto applied = apply(config, key, value, "--" + key);
            if (applied.is_err()) return applied.error();
            continue;
        }

        if (!positional_port_seen) {
            positional_port_seen = true;
            auto applied = apply(config, "port", arg, "port");
            if (applied.is_err()) return applied.error();
            continue;
        }

        return ConfigResult::err(common::ErrorCode::InvalidConfig,
                                 "Unexpected argument: " + arg);
    }

    return ConfigResult::ok(config);
}

std::string BridgeConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [port] [options]\n"
        << "  --port N         TCP port to listen on (default 6400, env HOSTBRIDGE_PORT)\n"
        << "  --bind ADDR      Address to bind (default 127.0.0.1, env HOSTBRIDGE_BIND)\n"
        << "  --frame-ms N     Host tick period in ms (default 16, env HOSTBRIDGE_FRAME_MS)\n"
        << "  --timeout-ms N   Per-request timeout in ms (default 30000, env HOSTBRIDGE_TIMEOUT_MS)\n"
        << "  --workers N      Worker threads for deferred tools (default 2, env HOSTBRIDGE_WORKERS)\n"
        << "  --debug          Enable debug logging (env HOSTBRIDGE_DEBUG)\n"
        << "  -h, --help       Show this help\n";
    return out.str();
}

std::string BridgeConfig::describe() const {
    std::ostringstream out;
    out << "bind=" << bind_address << ":" << port
        << " frame=" << frame_interval_ms << "ms"
        << " timeout=" << request_timeout_ms << "ms"
        << " workers=" << worker_threads
        << " debug=" << (debug_logs ? "on" : "off");
    return out.str();
}

} // namespace core
