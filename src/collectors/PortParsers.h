#pragma once
#include "../core/Models.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace port_census {
namespace parsers {

// Pure parsers for the text output of the host tools the collectors shell out to.
// None of them throw; malformed lines are skipped.

enum class ListenerTool { Ss, Netstat };

// `ss -tulnp` / `netstat -tulpn` listener tables. Header lines are recognised by the
// first column not naming a tcp/udp protocol. Records are source "system".
std::vector<PortEntry> parse_linux_listeners(const std::string& output, ListenerTool tool);

// `netstat -ano` / `netstat -an` (Windows); only LISTENING rows are kept.
std::vector<PortEntry> parse_windows_netstat(const std::string& output);

// Splits "ip:port", "[v6]:port" and "*:port" (scope suffix "%if" removed).
// Returns false when no valid port in 1-65535 is present.
bool split_host_port(const std::string& addr, std::string& host, int& port);

// `docker ps --format "{{.Names}}:::{{.Ports}}:::{{.ID}}"` lines to docker PortEntry records.
std::vector<PortEntry> parse_docker_ps_ports(const std::string& output);

struct DockerPortMapping {
    std::string host_ip; // "*" for wildcard, empty for exposed-only ports
    std::optional<int> host_port;
    int container_port = 0;
    std::string protocol = "tcp";
};
nlohmann::json to_json_value(const DockerPortMapping& m);

// A single `{{.Ports}}` column, e.g. "0.0.0.0:8080->80/tcp, 443/tcp".
std::vector<DockerPortMapping> parse_docker_port_string(const std::string& ports);

// Wildcard and loopback aware host IP mapping for docker published ports.
std::string resolve_host_ip(const std::string& host_ip);

// `docker ps -a --no-trunc --format "{{.Names}}|{{.Ports}}|{{.ID}}"`; broadcast
// addresses are skipped and the target is the container port.
std::vector<PortEntry> parse_docker_ps_pipe_ports(const std::string& output);

std::string extract_docker_server_version(const std::string& docker_version_output);

struct DockerInfo {
    std::string name;
    int containers = 0;
    int containers_running = 0;
    int images = 0;
    std::string kernel_version;
    std::string operating_system;
    std::string os_type;
    std::string architecture;
    int cpus = 0;
    long long memory = 0; // bytes
    std::string storage_driver;
    std::string logging_driver;
    std::string cgroup_driver;
    std::string swarm_status = "inactive";
};
DockerInfo parse_docker_info(const std::string& output);
// "15.5GiB", "512 MB", "2048" -> bytes
long long parse_memory_size(const std::string& text);

struct PidContainer { int pid = 0; std::string id; std::string name; };
// `{{.State.Pid}}::{{.Id}}::{{.Name}}` lines; pid 0 (stopped) rows are skipped.
std::vector<PidContainer> parse_pid_container_lines(const std::string& output);

// `docker top <id> -o pid`: first column after the header.
std::vector<int> parse_docker_top_pids(const std::string& output);
// `docker top <id> -eo pid,comm`: shell wrappers (sh, bash) are excluded.
std::vector<std::pair<int,std::string>> parse_docker_top_pid_comm(const std::string& output);

// `ps -o pid,lstart --no-headers -p ...` -> pid to ISO-8601 start time (UTC).
std::map<int,std::string> parse_process_start_times(const std::string& output);

std::optional<long long> parse_meminfo_total(const std::string& meminfo); // bytes
std::string parse_cpu_model(const std::string& cpuinfo);
std::optional<double> parse_uptime_seconds(const std::string& proc_uptime);
// "3 days, 4:05" style
std::string format_uptime(double seconds);
// "truenas-24.04.2" style kernel tag
std::optional<std::string> truenas_version_from_kernel(const std::string& kernel);

struct ProcessRow { int pid = 0; std::string name; std::string command; };
// `ps -e -o pid,ppid,cmd`
std::vector<ProcessRow> parse_ps_processes(const std::string& output, size_t limit);
// `tasklist /FO CSV`
std::vector<ProcessRow> parse_tasklist_csv(const std::string& output, size_t limit);

std::string map_docker_status(const std::string& status);
std::string map_app_status(const std::string& status);
std::string map_vm_status(const std::string& status);

}
}
