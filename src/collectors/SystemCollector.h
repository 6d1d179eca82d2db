#pragma once
#include "../core/Collector.h"

namespace port_census {

enum class HostFamily { Linux, Windows };
HostFamily native_host_family();

// Generic OS collector; always available as the detection fallback.
class SystemCollector : public Collector {
public:
    SystemCollector(Config cfg, CommandRunnerPtr runner, HostFamily family = native_host_family())
        : Collector(std::move(cfg), std::move(runner)), family_(family) {}
    std::string platform() const override { return "system"; }
    std::string platform_name() const override { return "Local System"; }
    int is_compatible() override;
    SystemInfo get_system_info() override;
    std::vector<Application> get_applications() override;
    std::vector<PortEntry> get_ports() override;
    std::vector<VirtualMachine> get_vms() override;

    static constexpr size_t kMaxProcesses = 50;
private:
    HostFamily family_;
};

// Listening sockets via the primary command and its fallback for the host family.
// Throws CollectorError(CommandExecution) when every command fails.
std::vector<PortEntry> collect_listening_sockets(CommandRunner& runner, HostFamily family, const std::vector<std::string>& linux_cmds);

}
