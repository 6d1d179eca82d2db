#include "PerformanceTracker.h"
#include "Logging.h"
#include <algorithm>

namespace port_census {

void PerformanceTracker::start(const std::string& operation){
    std::lock_guard<std::mutex> lock(mutex_);
    ops_[operation] = Op{std::chrono::steady_clock::now(), -1};
}

long long PerformanceTracker::end(const std::string& operation){
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ops_.find(operation);
    if(it == ops_.end()){
        Logger::instance().warn("[Performance] No start time found for operation '" + operation + "'");
        return 0;
    }
    it->second.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - it->second.start).count();
    Logger::instance().trace("[Performance] " + operation + ": " + std::to_string(it->second.duration_ms) + "ms");
    return it->second.duration_ms;
}

std::vector<PerformanceTracker::Sample> PerformanceTracker::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Sample> out;
    for(const auto& kv : ops_) out.push_back(Sample{kv.first, kv.second.duration_ms < 0 ? 0 : kv.second.duration_ms});
    std::stable_sort(out.begin(), out.end(), [](const Sample& a, const Sample& b){ return a.duration_ms > b.duration_ms; });
    return out;
}

void PerformanceTracker::reset(){ std::lock_guard<std::mutex> lock(mutex_); ops_.clear(); }

void PerformanceTracker::log_summary(const std::string& prefix) const {
    auto& log = Logger::instance();
    if(!log.enabled(LogLevel::Debug)) return;
    for(const auto& s : summary()) log.debug(prefix + " " + s.operation + ": " + std::to_string(s.duration_ms) + "ms");
}

}
