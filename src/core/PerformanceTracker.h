#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace port_census {

// Wall-clock timing of named operations within one collection pass.
class PerformanceTracker {
public:
    struct Sample { std::string operation; long long duration_ms; };

    void start(const std::string& operation);
    // Returns the elapsed milliseconds, or 0 when start() was never called.
    long long end(const std::string& operation);
    // Completed operations, longest first.
    std::vector<Sample> summary() const;
    void reset();
    // Emits the summary at debug level.
    void log_summary(const std::string& prefix) const;

private:
    struct Op { std::chrono::steady_clock::time_point start; long long duration_ms = -1; };
    mutable std::mutex mutex_;
    std::map<std::string, Op> ops_;
};

}
