#pragma once
#include "Collector.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace port_census {

using CollectorFactory = std::function<CollectorPtr(const Config&, CommandRunnerPtr)>;

class CollectorRegistry {
public:
    explicit CollectorRegistry(Config cfg, CommandRunnerPtr runner = nullptr);

    // Adds a variant or replaces the factory of an existing one.
    void register_collector(const std::string& platform, CollectorFactory factory);
    void register_all_default();
    bool has_collector(const std::string& platform) const { return factories_.count(platform) > 0; }

    // Unknown platforms get the base collector.
    CollectorPtr create_collector(const std::string& platform) const;

    // Scores truenas, docker and system in that order; the first strictly highest
    // score wins. A throwing is_compatible() scores 0. When nothing scores above 0 a
    // fresh system collector is returned.
    CollectorPtr detect_collector();
    // Scores from the last detect_collector() call, keyed by platform.
    const nlohmann::json& last_detection() const { return last_detection_; }

    static const std::vector<std::string>& detection_order();

private:
    Config cfg_;
    CommandRunnerPtr runner_;
    std::map<std::string, CollectorFactory> factories_;
    nlohmann::json last_detection_ = nlohmann::json::object();
};

}
