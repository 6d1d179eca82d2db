#pragma once
#include "../core/Collector.h"
#include "SystemCollector.h"
#include <map>
#include <optional>

namespace port_census {

struct ContainerRef { std::string id; std::string name; std::string image; };

struct RunningContainer {
    std::string id;
    std::string name;
    std::string image;
    std::string network_mode;
    nlohmann::json exposed_ports; // null when none
    std::vector<int> pids;
};

// Container attribution chosen for an OS level listener.
struct DockerAttribution {
    std::string container_name;
    std::string container_id;
    std::string target;
};

class DockerCollector : public Collector {
public:
    DockerCollector(Config cfg, CommandRunnerPtr runner, HostFamily family = native_host_family())
        : Collector(std::move(cfg), std::move(runner)), family_(family) {}
    std::string platform() const override { return "docker"; }
    std::string platform_name() const override { return "Docker"; }
    int is_compatible() override;
    SystemInfo get_system_info() override;
    std::vector<Application> get_applications() override;
    std::vector<PortEntry> get_ports() override;
    std::vector<VirtualMachine> get_vms() override { return {}; }

    // Running containers with network mode and in-container PIDs, inspected in parallel.
    std::vector<RunningContainer> inspect_running_containers(std::vector<ContainerRef>* listing = nullptr);

    // Name/image heuristic for a process owning an unattributed port.
    std::optional<DockerAttribution> match_container_by_process(const std::string& process, int port, const std::vector<ContainerRef>& containers) const;

private:
    std::optional<DockerAttribution> attribute_by_publish(const PortEntry& port);
    HostFamily family_;
};

}
