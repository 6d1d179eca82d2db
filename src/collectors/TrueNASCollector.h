#pragma once
#include "../core/Collector.h"
#include "../core/PerformanceTracker.h"
#include "../core/TtlCache.h"
#include "../truenas/TrueNasClient.h"
#include "PortParsers.h"
#include <map>
#include <memory>
#include <optional>

namespace port_census {

struct KnownPort {
    const char* service;
    const char* protocol;
};

// VPN, DNS and DHCP ports that get attributed to a matching container when a
// system process owns them.
const std::map<int, KnownPort>& known_ports();
bool is_important_udp_port(int port);

// Applications from a `docker inspect` JSON array.
std::vector<Application> containers_from_inspect(const nlohmann::json& inspect);
// Applications from `app.query` / VMs from `virt.instance.query`.
std::vector<Application> apps_from_query(const nlohmann::json& apps);
std::vector<VirtualMachine> vms_from_query(const nlohmann::json& vms);
nlohmann::json extract_app_ports(const nlohmann::json& app);

class TrueNASCollector : public Collector {
public:
    // A null client builds one from cfg.truenas_api_key.
    TrueNASCollector(Config cfg, CommandRunnerPtr runner, std::shared_ptr<TrueNasClient> client = nullptr,
                     TtlCache::NowFn now = TtlCache::NowFn());
    ~TrueNASCollector() override;

    std::string platform() const override { return "truenas"; }
    std::string platform_name() const override { return "TrueNAS"; }
    int is_compatible() override;
    std::vector<std::string> detection_reasons() const override { return reasons_; }

    CollectionStrategy strategy() const override { return CollectionStrategy::Unified; }
    CollectionResult collect() override;

    SystemInfo get_system_info() override;
    std::vector<Application> get_applications() override;
    std::vector<PortEntry> get_ports() override;
    std::vector<VirtualMachine> get_vms() override;

    void clear_cache(const std::string& key);
    void clear_all_cache();
    const TtlCache& cache() const { return cache_; }

private:
    struct EnhancedData {
        std::optional<nlohmann::json> system_info;
        nlohmann::json apps = nlohmann::json::array();
        nlohmann::json vms = nlohmann::json::array();
    };

    bool api_key_configured() const { return !cfg_.truenas_api_key.empty(); }

    SystemInfo cached_system_info();
    SystemInfo basic_system_info();
    SystemInfo fallback_system_info() const;
    std::vector<Application> docker_containers();
    std::vector<Application> docker_containers_with_ps();
    std::vector<PortEntry> system_ports();
    std::map<int, parsers::PidContainer> pid_container_map();
    std::map<int, parsers::PidContainer> host_network_pid_map();
    std::map<int, std::string> process_start_times(const std::vector<PortEntry>& ports);
    std::vector<PortEntry> reconcile_ports(const std::vector<Application>& containers, PerformanceTracker& perf);
    void attribute_self(PortEntry& port, const std::map<std::string, std::string>& created_by_id);
    void enhance_known_port(PortEntry& port, const std::vector<Application>& apps) const;
    bool keep_port(const PortEntry& port) const;
    EnhancedData collect_enhanced();
    void merge_enhanced(CollectionResult& result, const EnhancedData& data) const;
    void log_cache_status() const;

    std::shared_ptr<TrueNasClient> client_;
    TtlCache cache_;
    std::vector<std::string> reasons_;
};

}
