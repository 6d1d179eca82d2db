#include "SystemCollector.h"
#include "PortParsers.h"
#include "../core/Errors.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <cmath>
#include <sys/utsname.h>
#include <sys/sysinfo.h>
#include <unistd.h>

namespace port_census {

HostFamily native_host_family(){
#ifdef _WIN32
    return HostFamily::Windows;
#else
    return HostFamily::Linux;
#endif
}

int SystemCollector::is_compatible(){
    log_info("System collector is always available as fallback.");
    return 10;
}

SystemInfo SystemCollector::get_system_info(){
    log_debug("Collecting system info");
    SystemInfo si; si.platform = "system"; si.type = "system";
    struct utsname un{};
    if(uname(&un) != 0) throw CollectorError(ErrorKind::CommandExecution, "uname(2) failed");
    si.hostname = un.nodename;
    std::string os_type = un.sysname, release = un.release, arch = un.machine;
    si.version = release;
    auto ver = runner().run(family_ == HostFamily::Windows ? "ver" : "uname -r");
    if(ver.ok() && !utils::trim(ver.output).empty()) si.version = utils::trim(ver.output);
    else log_warn("Could not get detailed OS version info: " + ver.describe());

    if(auto cpuinfo = utils::read_file(host_path(cfg_, "/proc/cpuinfo"))) si.cpu_model = parsers::parse_cpu_model(*cpuinfo);
    else si.cpu_model = "Unknown";
    long cores = sysconf(_SC_NPROCESSORS_ONLN);
    si.cpu_cores = cores > 0 ? static_cast<int>(cores) : 0;

    struct sysinfo sys{};
    if(sysinfo(&sys) == 0){
        si.memory_total = static_cast<long long>(sys.totalram) * sys.mem_unit;
        si.memory_free = static_cast<long long>(sys.freeram) * sys.mem_unit;
        si.uptime_seconds = sys.uptime;
    }
    if(si.memory_total > 0) si.memory_usage = std::round(100.0 * static_cast<double>(si.memory_total - si.memory_free) / static_cast<double>(si.memory_total));
    si.details["os"] = {{"type", os_type}, {"release", release}, {"arch", arch}};
    si.platform_data = {
        {"description", os_type + " " + release + " (" + arch + ")"},
        {"uptime_days", si.uptime_seconds / 86400},
        {"memory_gb", std::llround(static_cast<double>(si.memory_total) / (1024.0*1024*1024))}};
    return si;
}

std::vector<Application> SystemCollector::get_applications(){
    log_debug("Collecting system processes");
    const bool win = family_ == HostFamily::Windows;
    auto res = runner().run(win ? "tasklist /FO CSV" : "ps -e -o pid,ppid,cmd");
    if(!res.ok()) throw CollectorError(ErrorKind::CommandExecution, "Process listing failed: " + res.describe());
    auto rows = win ? parsers::parse_tasklist_csv(res.output, kMaxProcesses) : parsers::parse_ps_processes(res.output, kMaxProcesses);
    std::vector<Application> apps;
    for(const auto& r : rows){
        Application a; a.id = std::to_string(r.pid); a.name = r.name; a.status = "running";
        a.command = r.command; a.platform = "system";
        a.platform_data = {{"type", "process"}, {"pid", r.pid}, {"command", r.command}};
        apps.push_back(std::move(a));
    }
    return apps;
}

std::vector<PortEntry> collect_listening_sockets(CommandRunner& runner, HostFamily family, const std::vector<std::string>& linux_cmds){
    if(family == HostFamily::Windows){
        auto r = run_first_success(runner, {"netstat -ano", "netstat -an"});
        if(r.ok()) return parsers::parse_windows_netstat(r.output);
        Logger::instance().warn("Windows port detection failed: " + r.describe());
        throw CollectorError(ErrorKind::CommandExecution, "All Windows port detection methods failed");
    }
    auto r = run_first_success(runner, linux_cmds);
    if(!r.ok()){
        Logger::instance().warn("Linux port detection failed: " + r.describe());
        throw CollectorError(ErrorKind::CommandExecution, "Both ss and netstat commands failed on Linux");
    }
    auto tool = utils::starts_with(r.command, "netstat") ? parsers::ListenerTool::Netstat : parsers::ListenerTool::Ss;
    return parsers::parse_linux_listeners(r.output, tool);
}

std::vector<PortEntry> SystemCollector::get_ports(){
    log_debug("Collecting system ports");
    auto ports = collect_listening_sockets(runner(), family_, {"ss -tunlp", "netstat -tulpn"});
    std::vector<PortEntry> out; out.reserve(ports.size());
    for(auto& p : ports) out.push_back(normalize_port_entry(std::move(p)));
    return out;
}

std::vector<VirtualMachine> SystemCollector::get_vms(){ return {}; }

}
