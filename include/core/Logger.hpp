#pragma once

#include "interfaces/ILogger.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace core {

/**
 * @brief Console logger implementation
 * Implements ILogger with timestamped console output.
 * Debug lines are dropped unless debug logging is switched on.
 */
class ConsoleLogger : public interfaces::ILogger {
public:
    explicit ConsoleLogger(bool debug_enabled = false) : debug_enabled_(debug_enabled) {}

    void info(const std::string& message) override {
        log(std::cout, "INFO", message);
    }

    void warn(const std::string& message) override {
        log(std::cerr, "WARN", message);
    }

    void error(const std::string& message) override {
        log(std::cerr, "ERROR", message);
    }

    void debug(const std::string& message) override {
        if (!debug_enabled_.load(std::memory_order_relaxed)) return;
        log(std::cout, "DEBUG", message);
    }

    void set_debug_enabled(bool enabled) { debug_enabled_ = enabled; }
    bool debug_enabled() const { return debug_enabled_; }

private:
    void log(std::ostream& out, const char* level, const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&time, &local);

        std::lock_guard<std::mutex> lock(mutex_);
        out << "[" << std::put_time(&local, "%H:%M:%S")
            << "] [" << level << "] " << message << "\n";
        out.flush();
    }

    std::atomic<bool> debug_enabled_;
    std::mutex mutex_;
};

/**
 * @brief Null logger for testing or disabled logging
 */
class NullLogger : public interfaces::ILogger {
public:
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
    void debug(const std::string&) override {}
};

} // namespace core
