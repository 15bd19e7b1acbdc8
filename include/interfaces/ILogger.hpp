#pragma once
#include <string>

namespace interfaces {

/**
 * @brief Interface for logging
 * Single responsibility: Logging operations
 *
 * Messages carry their own "[Component]" prefix, matching the console
 * output of the rest of the bridge.
 */
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
};

} // namespace interfaces
