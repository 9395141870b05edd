#pragma once
// ============================================================================
// Test Result Tracking
// ============================================================================
// Shared by the test programs. Each program calls log_test() per check and
// returns print_summary() from main(): non-zero when anything failed.
// ============================================================================

#include <chrono>
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

inline std::vector<TestResult> g_results;

inline void log_test(const std::string& name, bool passed,
                     const std::string& details = "", double duration_ms = 0) {
    TestResult r{name, passed, details, duration_ms};
    g_results.push_back(r);

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

inline void print_section(const std::string& title) {
    std::cout << "\n=== " << title << " ===" << std::endl;
}

// Milliseconds since 'start'
inline double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

inline int print_summary() {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "TEST SUMMARY" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    int passed = 0, failed = 0;
    for (const auto& r : g_results) {
        if (r.passed) passed++;
        else failed++;
    }

    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "Total:  " << g_results.size() << std::endl;

    if (failed > 0) {
        std::cout << "\nFailed tests:" << std::endl;
        for (const auto& r : g_results) {
            if (!r.passed) {
                std::cout << "  - " << r.name << ": " << r.details << std::endl;
            }
        }
    }

    std::cout << std::string(60, '=') << std::endl;
    return (failed > 0 || g_results.empty()) ? 1 : 0;
}
