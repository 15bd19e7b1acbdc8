#pragma once
#include "interfaces/ILogger.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace testing {

    // Records every line so tests can assert on what was logged
    class CapturingLogger : public interfaces::ILogger {
    public:
        struct Entry {
            std::string level;
            std::string message;
        };

        void info(const std::string& message) override { record("INFO", message); }
        void warn(const std::string& message) override { record("WARN", message); }
        void error(const std::string& message) override { record("ERROR", message); }
        void debug(const std::string& message) override { record("DEBUG", message); }

        std::vector<Entry> entries() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_;
        }

        size_t count(const std::string& level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t n = 0;
            for (const auto& e : entries_) {
                if (e.level == level) n++;
            }
            return n;
        }

        bool contains(const std::string& level, const std::string& fragment) const {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& e : entries_) {
                if (e.level == level && e.message.find(fragment) != std::string::npos) return true;
            }
            return false;
        }

        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.clear();
        }

    private:
        void record(const char* level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(Entry{level, message});
        }

        mutable std::mutex mutex_;
        std::vector<Entry> entries_;
    };

} // namespace testing
