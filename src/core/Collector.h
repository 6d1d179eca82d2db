#pragma once
#include "Models.h"
#include "Config.h"
#include "Command.h"
#include <string>
#include <vector>
#include <memory>

namespace port_census {

// How collect_all() gathers data for a collector.
enum class CollectionStrategy {
    FanOut,  // run the four getters concurrently, settle each independently
    Unified  // the collector's own collect() produces the whole result
};

class Collector {
public:
    Collector(Config cfg, CommandRunnerPtr runner);
    virtual ~Collector() = default;

    virtual std::string platform() const = 0;
    virtual std::string platform_name() const = 0;
    // 0-100 confidence that this collector matches the host.
    virtual int is_compatible() = 0;
    // Human readable evidence gathered by the last is_compatible() call.
    virtual std::vector<std::string> detection_reasons() const { return {}; }

    virtual SystemInfo get_system_info() = 0;
    virtual std::vector<Application> get_applications() = 0;
    virtual std::vector<PortEntry> get_ports() = 0;
    virtual std::vector<VirtualMachine> get_vms() = 0;

    virtual CollectionStrategy strategy() const { return CollectionStrategy::FanOut; }
    // Unified fast path; only called when strategy() is Unified.
    virtual CollectionResult collect();

    // Never throws: failures are recorded in the result's error fields.
    CollectionResult collect_all();

    void set_detection_info(nlohmann::json info){ detection_info_ = std::move(info); }
    const nlohmann::json& detection_info() const { return detection_info_; }

    PortEntry normalize_port_entry(PortEntry e) const;
    const Config& cfg() const { return cfg_; }

protected:
    void log_info(const std::string& m) const;
    void log_warn(const std::string& m) const;
    void log_error(const std::string& m) const;
    void log_debug(const std::string& m) const;
    CommandRunner& runner() const { return *runner_; }
    CollectionResult empty_result() const;

    Config cfg_;
    CommandRunnerPtr runner_;
private:
    nlohmann::json detection_info_ = nlohmann::json::object();
};

using CollectorPtr = std::unique_ptr<Collector>;

// Fills every field of a loosely-typed port record with a safe default. Ports that
// are missing, unparsable or outside 0-65535 become 0.
PortEntry normalize_port_entry(const nlohmann::json& raw, const std::string& default_source);
// Same guarantees for an already typed entry.
PortEntry normalize_port_entry(PortEntry e, const std::string& default_source);

// Collector for an unknown platform string: no capabilities, score 0.
class BaseCollector : public Collector {
public:
    using Collector::Collector;
    std::string platform() const override { return "base"; }
    std::string platform_name() const override { return "Base Platform"; }
    int is_compatible() override { return 0; }
    SystemInfo get_system_info() override;
    std::vector<Application> get_applications() override;
    std::vector<PortEntry> get_ports() override;
    std::vector<VirtualMachine> get_vms() override;
};

}
