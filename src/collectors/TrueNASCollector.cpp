#include "TrueNASCollector.h"
#include "DockerCollector.h"
#include "../core/Errors.h"
#include "../core/Utils.h"
#include "../truenas/AutoDiscover.h"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <set>

namespace port_census {

using nlohmann::json;
using std::chrono::milliseconds;

namespace {

const milliseconds kSystemInfoTtl{30000};
const milliseconds kContainersTtl{45000};
const milliseconds kSystemPortsTtl{30000};
const milliseconds kHostNetworkTtl{120000};

const char* const kTrueNasDirs[] = {"/usr/local/etc/ix", "/etc/netcli", "/data/truenas-config"};

std::string string_field(const json& j, const char* key, const std::string& fallback = ""){
    if(!j.is_object()) return fallback;
    auto it = j.find(key);
    if(it == j.end() || !it->is_string() || it->get<std::string>().empty()) return fallback;
    return it->get<std::string>();
}

std::string id_field(const json& j, const char* key){
    if(!j.is_object()) return "";
    auto it = j.find(key);
    if(it == j.end() || it->is_null()) return "";
    if(it->is_string()) return it->get<std::string>();
    if(it->is_number_integer()) return std::to_string(it->get<long long>());
    return it->dump();
}

long long int_field(const json& j, const char* key){
    if(!j.is_object()) return 0;
    auto it = j.find(key);
    if(it == j.end()) return 0;
    if(it->is_number_integer()) return it->get<long long>();
    if(it->is_number()) return static_cast<long long>(it->get<double>());
    if(it->is_string()) return utils::parse_int(it->get<std::string>()).value_or(0);
    return 0;
}

bool bool_field(const json& j, const char* key){
    if(!j.is_object()) return false;
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

json field(const json& j, const char* key){
    if(!j.is_object()) return json();
    auto it = j.find(key);
    return it == j.end() ? json() : *it;
}

std::string truncated(const std::string& s, size_t n){ return s.size() <= n ? s : s.substr(0, n) + "..."; }

struct ServiceMatcher {
    std::vector<std::string> keywords;
    std::vector<std::string> preferred;
};

const ServiceMatcher* matcher_for(const std::string& service){
    static const ServiceMatcher wireguard{{"wireguard", "wg-", "wg_", "wg-easy"}, {"wg-easy", "wireguard"}};
    static const ServiceMatcher openvpn{{"openvpn", "ovpn"}, {"openvpn"}};
    static const ServiceMatcher ipsec{{"ipsec", "strongswan", "libreswan"}, {}};
    static const ServiceMatcher dns{{"pihole", "pi-hole", "adguard", "dnsmasq", "unbound", "coredns", "bind"}, {"pihole", "adguardhome"}};
    static const ServiceMatcher dhcp{{"dhcp", "kea", "dnsmasq", "pihole"}, {}};
    if(service == "WireGuard" || service == "WireGuard-UI") return &wireguard;
    if(service == "OpenVPN") return &openvpn;
    if(utils::starts_with(service, "IPsec")) return &ipsec;
    if(service == "DNS") return &dns;
    if(service == "DHCP") return &dhcp;
    return nullptr;
}

}

const std::map<int, KnownPort>& known_ports(){
    static const std::map<int, KnownPort> ports = {
        {51820, {"WireGuard", "udp"}},
        {51821, {"WireGuard-UI", "tcp"}},
        {51822, {"WireGuard", "udp"}},
        {500, {"IPsec IKE", "udp"}},
        {4500, {"IPsec NAT-T", "udp"}},
        {1194, {"OpenVPN", "udp"}},
        {1198, {"OpenVPN", "udp"}},
        {53, {"DNS", "udp"}},
        {67, {"DHCP", "udp"}},
        {68, {"DHCP", "udp"}},
    };
    return ports;
}

bool is_important_udp_port(int port){
    auto it = known_ports().find(port);
    return it != known_ports().end() && std::string(it->second.protocol) == "udp";
}

std::vector<Application> containers_from_inspect(const json& inspect){
    std::vector<Application> out;
    if(!inspect.is_array()) return out;
    for(const auto& c : inspect){
        if(!c.is_object()) continue;
        Application a;
        a.id = string_field(c, "Id");
        if(a.id.empty()) continue;
        std::string name = string_field(c, "Name");
        a.name = !name.empty() && name[0] == '/' ? name.substr(1) : name;
        a.status = parsers::map_docker_status(string_field(field(c, "State"), "Status"));
        a.image = string_field(field(c, "Config"), "Image");
        a.command = string_field(c, "Path");
        for(const auto& arg : field(c, "Args")) if(arg.is_string()) a.command += " " + arg.get<std::string>();
        std::string created = string_field(c, "Created");
        if(!created.empty()) a.created = created;
        a.version = "N/A";
        a.platform = "docker";

        std::string networks;
        json nets = field(field(c, "NetworkSettings"), "Networks");
        if(nets.is_object())
            for(auto it = nets.begin(); it != nets.end(); ++it) networks += (networks.empty() ? "" : ", ") + it.key();

        json ports = json::array();
        json bindings = field(field(c, "HostConfig"), "PortBindings");
        if(bindings.is_object()){
            for(auto it = bindings.begin(); it != bindings.end(); ++it){
                auto spec = utils::split(it.key(), "/");
                auto container_port = utils::parse_int(spec[0]);
                if(!container_port) continue;
                std::string proto = spec.size() > 1 && !spec[1].empty() ? spec[1] : "tcp";
                if(!it.value().is_array()) continue;
                for(const auto& b : it.value()){
                    std::string ip = string_field(b, "HostIp");
                    auto host_port = utils::parse_int(string_field(b, "HostPort"));
                    json m = {{"host_ip", ip.empty() || ip == "0.0.0.0" || ip == "::" ? "*" : ip},
                              {"container_port", *container_port}, {"protocol", proto}};
                    m["host_port"] = host_port ? json(*host_port) : json();
                    ports.push_back(m);
                }
            }
        }
        a.platform_data = {{"type", "container"}, {"size", "N/A"}, {"mounts", "N/A"},
                           {"networks", networks.empty() ? "N/A" : networks}, {"ports", ports}};
        out.push_back(std::move(a));
    }
    return out;
}

json extract_app_ports(const json& app){
    json out = json::array();
    auto add = [&out](const json& list){
        if(!list.is_array()) return;
        for(const auto& m : list){
            if(!m.is_object()) continue;
            out.push_back({{"host_ip", string_field(m, "host_ip", "*")}, {"host_port", field(m, "host_port")},
                           {"container_port", field(m, "container_port")}, {"protocol", string_field(m, "protocol", "tcp")}});
        }
    };
    add(field(app, "port_mappings"));
    add(field(field(app, "config"), "port_mappings"));
    return out;
}

std::vector<Application> apps_from_query(const json& apps){
    std::vector<Application> out;
    if(!apps.is_array()) return out;
    for(const auto& app : apps){
        if(!app.is_object()) continue;
        Application a;
        a.id = id_field(app, "id");
        a.name = string_field(app, "name", a.id);
        a.status = parsers::map_app_status(string_field(app, "status", string_field(app, "state")));
        a.version = string_field(app, "version", "N/A");
        a.image = string_field(app, "image", "N/A");
        a.command = "N/A";
        std::string started = string_field(app, "started");
        if(!started.empty()) a.created = started;
        a.platform = "truenas";
        a.platform_data = {{"type", "truenas_app"}, {"app_type", string_field(app, "catalog", "unknown")},
                           {"catalog", field(app, "catalog")}, {"ports", extract_app_ports(app)}, {"orig_data", app}};
        out.push_back(std::move(a));
    }
    return out;
}

std::vector<VirtualMachine> vms_from_query(const json& vms){
    std::vector<VirtualMachine> out;
    if(!vms.is_array()) return out;
    for(const auto& vm : vms){
        if(!vm.is_object()) continue;
        VirtualMachine v;
        v.id = id_field(vm, "id");
        v.name = string_field(vm, "name", v.id);
        v.status = parsers::map_vm_status(string_field(vm, "status"));
        v.vcpus = static_cast<int>(int_field(vm, "cpu"));
        v.memory = int_field(vm, "memory");
        v.autostart = bool_field(vm, "autostart");
        v.platform = "truenas";
        json image = field(vm, "image");
        v.platform_data = {{"aliases", field(vm, "aliases")}, {"image", image},
                           {"os", string_field(image, "os", "unknown")}, {"vnc_enabled", field(vm, "vnc_enabled")},
                           {"storage_pool", field(vm, "storage_pool")}, {"orig_data", vm}};
        out.push_back(std::move(v));
    }
    return out;
}

TrueNASCollector::TrueNASCollector(Config cfg, CommandRunnerPtr runner, std::shared_ptr<TrueNasClient> client, TtlCache::NowFn now)
    : Collector(std::move(cfg), std::move(runner)), client_(std::move(client)),
      cache_(milliseconds(cfg_.cache_timeout_ms), cfg_.disable_cache, std::move(now)) {
    if(!client_) client_ = std::make_shared<TrueNasClient>(cfg_.truenas_api_key, websocket_connector(cfg_));
    if(cache_.disabled()) log_warn("Caching is globally disabled via DISABLE_CACHE.");
}

TrueNASCollector::~TrueNASCollector() = default;

int TrueNASCollector::is_compatible(){
    int score = 0;
    reasons_.clear();
    log_info("Checking TrueNAS compatibility...");

    auto uname = runner().run("uname -a");
    if(!uname.ok()) log_warn("Error checking kernel for TrueNAS compatibility: " + uname.describe());
    else if(utils::contains_ci(uname.output, "truenas")){
        score += 60;
        reasons_.push_back("TrueNAS kernel signature found");
        log_debug("Found TrueNAS kernel signature (+60)");
    }

    auto os_release = utils::read_file(host_path(cfg_, "/etc/os-release"));
    if(os_release && utils::contains_ci(*os_release, "truenas")){
        score += 40;
        reasons_.push_back("TrueNAS OS release identifier found");
        log_debug("Found TrueNAS in OS release (+40)");
    }

    std::error_code ec;
    for(const auto& path : middleware_socket_paths()){
        if(std::filesystem::exists(host_path(cfg_, path), ec)){
            score += 10;
            reasons_.push_back("Found middleware socket at " + path);
            log_debug("Found middleware socket at " + path + " (+10)");
            break;
        }
    }
    for(const char* dir : kTrueNasDirs){
        if(std::filesystem::exists(host_path(cfg_, dir), ec)){
            score += 10;
            reasons_.push_back(std::string("TrueNAS directory found: ") + dir);
            log_debug(std::string("Found TrueNAS directory: ") + dir + " (+10)");
            break;
        }
    }
    if(api_key_configured() || client_->has_api_key()){
        score += 20;
        reasons_.push_back("TrueNAS API key provided");
        log_debug("Found TrueNAS API key (+20)");
    }

    std::string joined;
    for(const auto& r : reasons_) joined += (joined.empty() ? "" : "; ") + r;
    if(score > 0) log_info("TrueNAS detector final score: " + std::to_string(score) + ". Reasons: " + joined);
    else log_debug("TrueNAS detector final score: 0");
    return score;
}

SystemInfo TrueNASCollector::cached_system_info(){
    try {
        return cache_.get_or_fresh("systemInfo", [this]{ return basic_system_info(); }, kSystemInfoTtl);
    } catch(const CollectorError& e){
        log_warn(std::string("Basic system info collection failed, using fallback data: ") + e.what());
        return fallback_system_info();
    }
}

SystemInfo TrueNASCollector::basic_system_info(){
    log_debug("Collecting TrueNAS system info via Docker host information");
    auto version = runner().run("docker version");
    auto info_out = runner().run("docker info");
    if(!version.ok()) throw CollectorError(ErrorKind::CommandExecution, "docker version failed: " + version.describe());
    if(!info_out.ok()) throw CollectorError(ErrorKind::CommandExecution, "docker info failed: " + info_out.describe());
    std::string docker_version = parsers::extract_docker_server_version(version.output);
    auto info = parsers::parse_docker_info(info_out.output);

    long long memory = info.memory;
    if(auto meminfo = utils::read_file(host_path(cfg_, "/proc/meminfo"))){
        if(auto total = parsers::parse_meminfo_total(*meminfo)) memory = *total;
    } else log_warn("Failed to read /proc/meminfo; using docker info memory");

    std::string cpu_model = "Unknown";
    if(auto cpuinfo = utils::read_file(host_path(cfg_, "/proc/cpuinfo"))) cpu_model = parsers::parse_cpu_model(*cpuinfo);
    else log_warn("Failed to read /proc/cpuinfo");

    double uptime_seconds = 0;
    std::string uptime = "N/A";
    auto proc_uptime = utils::read_file(host_path(cfg_, "/proc/uptime"));
    if(auto secs = proc_uptime ? parsers::parse_uptime_seconds(*proc_uptime) : std::nullopt){
        uptime_seconds = *secs;
        uptime = parsers::format_uptime(*secs);
    } else log_warn("Failed to read /proc/uptime");

    std::string product = "TrueNAS SCALE";
    auto dmi = runner().run("dmidecode -s system-product-name");
    if(dmi.ok() && !utils::trim(dmi.output).empty()) product = utils::trim(dmi.output);

    std::string truenas_version;
    if(auto v = utils::read_file_trim(host_path(cfg_, "/etc/version")); v && !v->empty()) truenas_version = *v;
    else if(auto k = parsers::truenas_version_from_kernel(info.kernel_version)) truenas_version = *k;
    if(truenas_version.empty())
        if(auto r = utils::read_file_trim(host_path(cfg_, "/etc/truenas-release"))) truenas_version = *r;

    const std::string description = "TrueNAS SCALE" + (truenas_version.empty() ? std::string() : " " + truenas_version);
    SystemInfo si;
    si.type = "system";
    si.hostname = info.name.empty() ? "truenas-system" : info.name;
    si.platform = "truenas";
    si.version = truenas_version;
    si.cpu_model = cpu_model;
    si.cpu_cores = info.cpus;
    si.memory_total = memory;
    si.uptime_seconds = static_cast<long long>(uptime_seconds);
    si.details = {
        {"system_product", product},
        {"kernel_version", info.kernel_version},
        {"operating_system", description},
        {"os_type", info.os_type},
        {"architecture", info.architecture},
        {"uptime_formatted", uptime},
        {"containers_running", info.containers_running},
        {"containers_total", info.containers},
        {"docker_images", info.images},
        {"docker_version", docker_version}};
    si.platform_data = {
        {"description", description},
        {"deployment_method", "native"},
        {"container_runtime", "docker"},
        {"source", "docker-host-info"},
        {"api_key_required_for", {"vms", "native_apps", "detailed_system_info"}}};
    return si;
}

SystemInfo TrueNASCollector::fallback_system_info() const {
    log_warn("Using fallback system information");
    SystemInfo si;
    si.type = "system";
    si.hostname = "truenas-system";
    si.platform = "truenas";
    si.version = "unknown";
    si.cpu_model = "Unknown";
    si.details = {
        {"system_product", "TrueNAS SCALE"},
        {"kernel_version", "unknown"},
        {"operating_system", "unknown"},
        {"os_type", "Linux"},
        {"architecture", "unknown"},
        {"uptime_formatted", "N/A"},
        {"containers_running", 0},
        {"containers_total", 0},
        {"docker_images", 0}};
    si.platform_data = {
        {"description", "TrueNAS SCALE (fallback data)"},
        {"deployment_method", "native"},
        {"container_runtime", "docker"},
        {"source", "fallback"},
        {"api_key_required_for", {"vms", "native_apps", "detailed_system_info"}}};
    return si;
}

std::vector<Application> TrueNASCollector::docker_containers(){
    auto ids = runner().run("docker ps -aq");
    if(!ids.ok()){
        log_error("Error listing Docker containers: " + ids.describe());
        return docker_containers_with_ps();
    }
    auto list = utils::split_ws(ids.output);
    if(list.empty()) return {};
    std::string cmd = "docker inspect";
    for(const auto& id : list) cmd += " " + id;
    auto inspect = runner().run(cmd);
    if(!inspect.ok()){
        log_error("Error getting Docker containers via docker inspect: " + inspect.describe());
        return docker_containers_with_ps();
    }
    json parsed = json::parse(inspect.output, nullptr, false);
    if(parsed.is_discarded() || !parsed.is_array()){
        log_error("Could not parse docker inspect output");
        return docker_containers_with_ps();
    }
    return containers_from_inspect(parsed);
}

std::vector<Application> TrueNASCollector::docker_containers_with_ps(){
    log_warn("Falling back to \"docker ps\" for container collection.");
    try {
        return DockerCollector(cfg_, runner_).get_applications();
    } catch(const CollectorError& e){
        log_error(std::string("Error getting Docker containers via fallback \"docker ps\": ") + e.what());
        return {};
    }
}

std::vector<PortEntry> TrueNASCollector::system_ports(){
    auto r = runner().run("ss -tulpn");
    if(!r.ok()){
        log_error("Error getting system ports via ss: " + r.describe());
        return {};
    }
    std::vector<PortEntry> out;
    for(auto& p : parsers::parse_linux_listeners(r.output, parsers::ListenerTool::Ss)){
        if(p.protocol != "tcp" && !cfg_.include_udp) continue;
        p.host_ip = parsers::resolve_host_ip(p.host_ip);
        if(p.owner == "unknown") p.owner = "system";
        out.push_back(std::move(p));
    }
    return out;
}

std::map<int, parsers::PidContainer> TrueNASCollector::pid_container_map(){
    std::map<int, parsers::PidContainer> out;
    auto r = runner().run("docker ps -q | xargs docker inspect --format '{{.State.Pid}}::{{.Id}}::{{.Name}}'");
    if(!r.ok()){
        log_warn("Could not build PID-to-Container map. Host-networked apps may be misidentified: " + r.describe());
        return out;
    }
    for(auto& pc : parsers::parse_pid_container_lines(r.output)) out[pc.pid] = pc;
    log_debug("Built PID-to-Container map with " + std::to_string(out.size()) + " entries");
    return out;
}

std::map<int, parsers::PidContainer> TrueNASCollector::host_network_pid_map(){
    std::map<int, parsers::PidContainer> out;
    std::vector<std::string> ids;
    try {
        ids = cache_.get_or_fresh("hostNetworkContainers", [this]{
            auto r = runner().run("docker ps --filter network=host --format '{{.ID}}'");
            if(!r.ok()) throw CollectorError(ErrorKind::CommandExecution, r.describe());
            return utils::split_ws(r.output);
        }, kHostNetworkTtl);
    } catch(const CollectorError& e){
        log_warn(std::string("Failed to list host-network containers: ") + e.what());
        return out;
    }
    if(ids.empty()) return out;

    auto containers = cache_.get_or_fresh("dockerContainers", [this]{ return docker_containers(); }, kContainersTtl);
    for(const auto& id : ids){
        auto owner = std::find_if(containers.begin(), containers.end(),
                                  [&id](const Application& a){ return utils::starts_with(a.id, id); });
        if(owner == containers.end()) continue;
        auto top = runner().run("docker top " + id + " -eo pid,comm");
        if(!top.ok()){
            log_warn("Could not run 'docker top' for container " + id.substr(0, 12) + ". It may have stopped.");
            continue;
        }
        for(const auto& pc : parsers::parse_docker_top_pid_comm(top.output))
            out[pc.first] = parsers::PidContainer{pc.first, owner->id, owner->name};
    }
    log_debug("Built host process map with " + std::to_string(out.size()) + " PIDs from " + std::to_string(ids.size()) + " containers");
    return out;
}

std::map<int, std::string> TrueNASCollector::process_start_times(const std::vector<PortEntry>& ports){
    std::set<int> pids;
    for(const auto& p : ports)
        if(p.source == "system" && !p.container_id && p.pid() && *p.pid() > 0) pids.insert(*p.pid());
    if(pids.empty()) return {};
    std::string list;
    for(int pid : pids) list += (list.empty() ? "" : ",") + std::to_string(pid);
    auto r = runner().run("ps -o pid,lstart --no-headers -p " + list);
    if(!r.ok()){
        log_warn("Could not fetch process start times: " + r.describe());
        return {};
    }
    return parsers::parse_process_start_times(r.output);
}

void TrueNASCollector::attribute_self(PortEntry& port, const std::map<std::string, std::string>& created_by_id){
    if(port.host_port != cfg_.self_port || port.source != "system") return;
    if(port.owner != cfg_.self_process_name && port.owner != "system") return;
    auto r = runner().run("docker ps --filter \"name=" + cfg_.self_container_name + "\" --format \"{{.ID}}|{{.Names}}\"");
    if(!r.ok()){
        log_warn("Could not re-classify our own application port " + std::to_string(cfg_.self_port) + ": " + r.describe());
        return;
    }
    auto lines = utils::split_lines(utils::trim(r.output));
    if(lines.empty() || lines[0].empty()) return;
    auto parts = utils::split(lines[0], "|");
    if(parts[0].empty()) return;
    std::string name = parts.size() > 1 && !parts[1].empty() ? parts[1] : cfg_.self_container_name;
    log_debug("Re-classifying our own application port " + std::to_string(port.host_port) + " to " + name);
    port.source = "docker";
    port.owner = name;
    port.container_id = parts[0];
    port.app_id = parts[0];
    port.target = std::to_string(port.host_port);
    for(const auto& kv : created_by_id)
        if(utils::starts_with(kv.first, parts[0])){ port.created = kv.second; break; }
}

void TrueNASCollector::enhance_known_port(PortEntry& port, const std::vector<Application>& apps) const {
    auto known = known_ports().find(port.host_port);
    if(known == known_ports().end()) return;
    const ServiceMatcher* matcher = matcher_for(known->second.service);
    if(!matcher) return;

    std::vector<const Application*> candidates;
    for(const auto& app : apps){
        if(app.platform != "docker") continue;
        std::string name = utils::to_lower(app.name), image = utils::to_lower(app.image);
        for(const auto& kw : matcher->keywords){
            if(name.find(kw) != std::string::npos || image.find(kw) != std::string::npos){ candidates.push_back(&app); break; }
        }
    }
    if(candidates.empty()) return;
    const Application* best = candidates.front();
    if(candidates.size() > 1){
        for(const auto* c : candidates){
            if(std::find(matcher->preferred.begin(), matcher->preferred.end(), utils::to_lower(c->name)) != matcher->preferred.end()){ best = c; break; }
        }
    }
    port.source = "docker";
    port.container_id = best->id;
    port.app_id = best->id;
    port.owner = best->name;
    port.target = std::to_string(port.host_port);
    port.created = best->created;
    log_debug("Enhanced attribution for " + std::string(known->second.service) + " port " + std::to_string(port.host_port) + " to " + best->name);
}

bool TrueNASCollector::keep_port(const PortEntry& port) const {
    if(port.protocol == "tcp") return true;
    if(port.source == "docker") return true;
    if(port.protocol == "udp" && is_important_udp_port(port.host_port)) return true;
    if(port.protocol == "udp" && port.source == "system") return cfg_.include_udp;
    return false;
}

std::vector<PortEntry> TrueNASCollector::reconcile_ports(const std::vector<Application>& containers, PerformanceTracker& perf){
    std::map<std::string, std::string> created_by_id;
    for(const auto& a : containers) if(a.created) created_by_id[a.id] = *a.created;
    auto created_for = [&created_by_id](const std::string& id) -> std::optional<std::string> {
        auto it = created_by_id.find(id);
        if(it == created_by_id.end()) return std::nullopt;
        return it->second;
    };

    perf.start("docker-ports-collection");
    std::vector<PortEntry> docker_ports;
    auto declared = runner().run("docker ps -a --no-trunc --format \"{{.Names}}|{{.Ports}}|{{.ID}}\"");
    if(declared.ok()) docker_ports = parsers::parse_docker_ps_pipe_ports(declared.output);
    else log_error("Error getting Docker port mappings: " + declared.describe());
    perf.end("docker-ports-collection");

    perf.start("system-ports-collection");
    auto sys_ports = cache_.get_or_fresh("systemPorts", [this]{ return system_ports(); }, kSystemPortsTtl);
    perf.end("system-ports-collection");

    perf.start("pid-to-container-mapping");
    auto pid_map = pid_container_map();
    perf.end("pid-to-container-mapping");

    perf.start("host-network-mapping");
    auto host_map = host_network_pid_map();
    perf.end("host-network-mapping");

    perf.start("port-reconciliation");
    std::vector<PortEntry> merged;
    std::map<std::string, size_t> by_key;
    for(auto& p : docker_ports){
        if(by_key.count(p.key())) continue;
        if(p.container_id) p.created = created_for(*p.container_id);
        by_key[p.key()] = merged.size();
        merged.push_back(std::move(p));
    }
    for(auto p : sys_ports){
        auto existing = by_key.find(p.key());
        if(existing != by_key.end()){
            auto& kept = merged[existing->second];
            if(kept.pids.empty()) kept.pids = p.pids;
            continue;
        }
        if(auto pid = p.pid()){
            auto direct = pid_map.find(*pid);
            auto host = host_map.find(*pid);
            const parsers::PidContainer* owner = nullptr;
            if(direct != pid_map.end()) owner = &direct->second;
            else if(host != host_map.end()){
                owner = &host->second;
                p.target = std::to_string(p.host_port);
            }
            if(owner){
                log_debug("Re-classified port " + std::to_string(p.host_port) + " to owner " + owner->name + " via PID map");
                p.source = "docker";
                p.owner = owner->name;
                p.container_id = owner->id;
                p.app_id = owner->id;
                p.created = created_for(owner->id);
            }
        }
        by_key[p.key()] = merged.size();
        merged.push_back(std::move(p));
    }
    perf.end("port-reconciliation");

    perf.start("self-container-attribution");
    for(auto& p : merged) attribute_self(p, created_by_id);
    perf.end("self-container-attribution");

    perf.start("process-start-times-collection");
    auto start_times = process_start_times(merged);
    for(auto& p : merged){
        if(p.source != "system" || p.container_id || !p.pid()) continue;
        auto it = start_times.find(*p.pid());
        if(it != start_times.end()) p.created = it->second;
    }
    perf.end("process-start-times-collection");

    perf.start("port-filtering");
    std::vector<PortEntry> out;
    for(auto& p : merged){
        if(p.source == "system" && !p.container_id){
            auto known = known_ports().find(p.host_port);
            if(known != known_ports().end() && p.protocol == known->second.protocol) enhance_known_port(p, containers);
        }
        if(keep_port(p)) out.push_back(normalize_port_entry(std::move(p)));
    }
    perf.end("port-filtering");

    log_info("Collected " + std::to_string(docker_ports.size()) + " Docker ports and " + std::to_string(sys_ports.size()) +
             " system ports = " + std::to_string(out.size()) + " unique ports after reconciliation.");
    return out;
}

TrueNASCollector::EnhancedData TrueNASCollector::collect_enhanced(){
    EnhancedData data;
    log_info("Attempting enhanced TrueNAS API calls...");
    try {
        json si = client_->call("system.info");
        if(si.is_object() && !si.empty()) data.system_info = si;
    } catch(const CollectorError& e){
        log_warn("Enhanced system info API call failed: " + truncated(e.what(), 50));
    }
    try {
        json apps = client_->call("app.query");
        if(apps.is_array()) data.apps = apps;
        log_info("Found " + std::to_string(data.apps.size()) + " TrueNAS apps via API");
    } catch(const CollectorError& e){
        log_warn("TrueNAS apps API query failed: " + truncated(e.what(), 50));
    }
    try {
        json vms = client_->call("virt.instance.query");
        if(vms.is_array()) data.vms = vms;
        log_info("Found " + std::to_string(data.vms.size()) + " VMs via API");
    } catch(const CollectorError& e){
        log_warn("VM API query failed: " + truncated(e.what(), 50));
    }
    return data;
}

void TrueNASCollector::merge_enhanced(CollectionResult& result, const EnhancedData& data) const {
    if(data.system_info && result.system_info){
        SystemInfo& si = *result.system_info;
        const json& e = *data.system_info;
        si.enhanced = true;
        si.details.update(e);
        si.hostname = string_field(e, "hostname", si.hostname);
        si.version = string_field(e, "version", si.version);
        si.cpu_model = string_field(e, "model", si.cpu_model);
        if(int_field(e, "cores") > 0) si.cpu_cores = static_cast<int>(int_field(e, "cores"));
        if(int_field(e, "physmem") > 0) si.memory_total = int_field(e, "physmem");
        if(int_field(e, "uptime_seconds") > 0) si.uptime_seconds = int_field(e, "uptime_seconds");
    }
    auto apps = apps_from_query(data.apps);
    if(!apps.empty()){
        log_info("Collected " + std::to_string(apps.size()) + " TrueNAS native apps");
        result.applications.insert(result.applications.end(), apps.begin(), apps.end());
    }
    auto vms = vms_from_query(data.vms);
    if(!vms.empty()){
        log_info("Collected " + std::to_string(vms.size()) + " virtual machines");
        result.vms = std::move(vms);
    }
}

void TrueNASCollector::log_cache_status() const {
    auto ages = cache_.ages();
    std::string status;
    for(const char* key : {"systemInfo", "dockerContainers", "systemPorts", "hostNetworkContainers"}){
        auto it = ages.find(key);
        std::string entry = key;
        if(it == ages.end()) entry += ": empty";
        else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), ": %.1fs old", static_cast<double>(it->second.count()) / 1000.0);
            entry += buf;
        }
        status += (status.empty() ? "" : ", ") + entry;
    }
    log_debug("Cache status: " + status);
}

CollectionResult TrueNASCollector::collect(){
    PerformanceTracker perf;
    perf.start("total-collection");
    CollectionResult result = empty_result();
    result.enhanced_features_enabled = api_key_configured();
    try {
        log_info("Starting core functionality collection (Docker + System)");
        perf.start("system-info-collection");
        result.system_info = cached_system_info();
        perf.end("system-info-collection");

        perf.start("docker-containers-collection");
        std::vector<Application> containers = cache_.get_or_fresh("dockerContainers", [this]{ return docker_containers(); }, kContainersTtl);
        result.applications = containers;
        log_info("Collected " + std::to_string(containers.size()) + " Docker containers");
        perf.end("docker-containers-collection");

        perf.start("port-collection-and-reconciliation");
        try {
            result.ports = reconcile_ports(containers, perf);
        } catch(const CollectorError& e){
            log_warn(std::string("Port collection failed: ") + e.what());
        }
        perf.end("port-collection-and-reconciliation");

        perf.start("enhanced-features-collection");
        if(api_key_configured()){
            log_info("API key detected - collecting enhanced TrueNAS features");
            merge_enhanced(result, collect_enhanced());
        } else {
            log_info("No TRUENAS_API_KEY provided - enhanced features disabled");
        }
        perf.end("enhanced-features-collection");
    } catch(const std::exception& e){
        log_error(std::string("Critical collection error: ") + e.what());
        result.error = std::string("Critical error during collection: ") + e.what();
    }
    perf.end("total-collection");
    perf.log_summary("[TrueNAS] ");
    log_cache_status();
    log_info("Collection complete: " + std::to_string(result.applications.size()) + " apps, " +
             std::to_string(result.ports.size()) + " ports, " + std::to_string(result.vms.size()) + " VMs");
    return result;
}

SystemInfo TrueNASCollector::get_system_info(){
    CollectionResult partial = empty_result();
    partial.system_info = cached_system_info();
    if(api_key_configured()){
        EnhancedData data;
        json si = client_->call("system.info");
        if(si.is_object() && !si.empty()) data.system_info = si;
        merge_enhanced(partial, data);
    }
    return *partial.system_info;
}

std::vector<Application> TrueNASCollector::get_applications(){
    auto apps = cache_.get_or_fresh("dockerContainers", [this]{ return docker_containers(); }, kContainersTtl);
    if(api_key_configured()){
        auto native = apps_from_query(client_->call("app.query"));
        apps.insert(apps.end(), native.begin(), native.end());
    }
    return apps;
}

std::vector<PortEntry> TrueNASCollector::get_ports(){
    PerformanceTracker perf;
    auto containers = cache_.get_or_fresh("dockerContainers", [this]{ return docker_containers(); }, kContainersTtl);
    return reconcile_ports(containers, perf);
}

std::vector<VirtualMachine> TrueNASCollector::get_vms(){
    if(!api_key_configured()) return {};
    return vms_from_query(client_->call("virt.instance.query"));
}

void TrueNASCollector::clear_cache(const std::string& key){
    cache_.clear(key);
    log_debug("Cleared cache for: " + key);
}

void TrueNASCollector::clear_all_cache(){
    cache_.clear_all();
    log_debug("Cleared all cache entries");
}

}
