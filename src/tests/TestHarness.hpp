#pragma once
// ============================================================================
// Console test harness shared by the test programs
// ============================================================================
// Each check prints [PASS]/[FAIL]; print_summary() lists failures and
// exit_code() is non-zero when anything failed, so CTest sees the result.
// ============================================================================

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

struct TestResult {
    std::string name;
    bool passed;
    std::string details;
    double duration_ms;
};

inline std::vector<TestResult>& test_results() {
    static std::vector<TestResult> results;
    return results;
}

inline void log_test(const std::string& name, bool passed,
                     const std::string& details = "", double duration_ms = 0) {
    test_results().push_back(TestResult{name, passed, details, duration_ms});

    std::cout << (passed ? "[PASS]" : "[FAIL]")
              << " " << name;
    if (duration_ms > 0) {
        std::cout << " (" << std::fixed << std::setprecision(1)
                  << duration_ms << "ms)";
    }
    if (!details.empty()) {
        std::cout << " - " << details;
    }
    std::cout << std::endl;
}

inline void test_group(const std::string& title) {
    std::cout << "\n=== " << title << " ===" << std::endl;
}

inline void print_summary() {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "TEST SUMMARY" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    int passed = 0, failed = 0;
    for (const auto& r : test_results()) {
        if (r.passed) passed++;
        else failed++;
    }

    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "Total:  " << test_results().size() << std::endl;

    if (failed > 0) {
        std::cout << "\nFailed tests:" << std::endl;
        for (const auto& r : test_results()) {
            if (!r.passed) {
                std::cout << "  - " << r.name << ": " << r.details << std::endl;
            }
        }
    }

    std::cout << std::string(60, '=') << std::endl;
}

inline int exit_code() {
    if (test_results().empty()) return 1;
    for (const auto& r : test_results()) {
        if (!r.passed) return 1;
    }
    return 0;
}
