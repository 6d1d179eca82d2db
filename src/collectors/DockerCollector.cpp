#include "DockerCollector.h"
#include "PortParsers.h"
#include "../core/Errors.h"
#include "../core/Utils.h"
#include <future>
#include <set>
#include <cctype>
#include <sys/stat.h>

namespace port_census {

using nlohmann::json;

int DockerCollector::is_compatible(){
    log_info("--- Docker Collector Compatibility Check ---");
    std::string sock = host_path(cfg_, "/var/run/docker.sock");
    struct stat st{};
    if(::stat(sock.c_str(), &st) == 0 && S_ISSOCK(st.st_mode)){
        log_info("Docker socket found at " + sock + ". Assigning compatibility score (50).");
        return 50;
    }
    log_debug("Could not stat " + sock + " as a socket");
    if(runner().run("docker version").ok()){
        log_info("Docker command is available on the host. Assigning compatibility score (40).");
        return 40;
    }
    log_info("No Docker indicators found. Incompatible (score 0).");
    return 0;
}

SystemInfo DockerCollector::get_system_info(){
    auto version = runner().run("docker version");
    if(!version.ok()) throw CollectorError(ErrorKind::CommandExecution, "docker version failed: " + version.describe());
    auto info_out = runner().run("docker info");
    if(!info_out.ok()) throw CollectorError(ErrorKind::CommandExecution, "docker info failed: " + info_out.describe());
    std::string server_version = parsers::extract_docker_server_version(version.output);
    auto info = parsers::parse_docker_info(info_out.output);

    SystemInfo si; si.type = "system"; si.platform = "docker";
    si.hostname = info.name.empty() ? "docker-host" : info.name;
    si.version = server_version;
    si.cpu_cores = info.cpus;
    si.memory_total = info.memory;
    si.details = {
        {"docker_version", server_version},
        {"containers_running", info.containers_running},
        {"containers_total", info.containers},
        {"images", info.images},
        {"kernel_version", info.kernel_version},
        {"operating_system", info.operating_system},
        {"os_type", info.os_type},
        {"architecture", info.architecture}};
    si.platform_data = {
        {"description", "Docker " + server_version},
        {"storage_driver", info.storage_driver},
        {"logging_driver", info.logging_driver},
        {"cgroup_driver", info.cgroup_driver},
        {"swarm_status", info.swarm_status}};
    return si;
}

static std::string json_str(const json& j, const char* key){
    auto it = j.find(key);
    if(it == j.end() || it->is_null()) return "";
    return it->is_string() ? it->get<std::string>() : it->dump();
}

std::vector<Application> DockerCollector::get_applications(){
    auto res = runner().run("docker ps -a --format \"{{json .}}\"");
    if(!res.ok()) throw CollectorError(ErrorKind::CommandExecution, "Error collecting Docker applications: " + res.describe());
    std::vector<Application> apps;
    for(const auto& line : utils::split_lines(res.output)){
        if(utils::trim(line).empty()) continue;
        json c;
        try { c = json::parse(line); }
        catch(const json::parse_error& ex){ log_warn(std::string("Skipping unparsable container line: ") + ex.what()); continue; }
        Application a;
        a.id = json_str(c, "ID"); a.name = json_str(c, "Names");
        a.status = parsers::map_docker_status(json_str(c, "State"));
        a.version = "N/A"; a.image = json_str(c, "Image"); a.command = json_str(c, "Command");
        std::string created = json_str(c, "CreatedAt"); if(!created.empty()) a.created = created;
        a.platform = "docker";
        a.platform_data = {{"type", "container"}, {"size", json_str(c, "Size")},
                           {"mounts", json_str(c, "Mounts")}, {"networks", json_str(c, "Networks")},
                           {"ports", json::array()}};
        for(const auto& m : parsers::parse_docker_port_string(json_str(c, "Ports"))) a.platform_data["ports"].push_back(parsers::to_json_value(m));
        apps.push_back(std::move(a));
    }
    return apps;
}

std::vector<RunningContainer> DockerCollector::inspect_running_containers(std::vector<ContainerRef>* listing){
    auto ps = runner().run("docker ps --format \"{{.ID}}:::{{.Names}}:::{{.Image}}\"");
    if(!ps.ok()){ log_warn("Failed to list running containers: " + ps.describe()); return {}; }
    std::vector<ContainerRef> refs;
    for(const auto& line : utils::split_lines(ps.output)){
        auto parts = utils::split(utils::trim(line), ":::");
        if(parts.size() < 3 || parts[0].empty()) continue;
        refs.push_back(ContainerRef{parts[0], parts[1], parts[2]});
    }
    if(listing) *listing = refs;

    std::vector<std::future<std::optional<RunningContainer>>> tasks;
    for(const auto& ref : refs){
        tasks.push_back(std::async(std::launch::async, [this, ref]() -> std::optional<RunningContainer> {
            auto inspect = std::async(std::launch::async, [this, &ref]{
                return runner().run("docker inspect " + ref.id + " --format \"{{.HostConfig.NetworkMode}}:::{{json .Config.ExposedPorts}}\"");
            });
            auto top = runner().run("docker top " + ref.id + " -o pid");
            auto ins = inspect.get();
            if(!ins.ok()){ log_warn("Failed to inspect container " + ref.id + " (" + ref.name + "): " + ins.describe()); return std::nullopt; }
            RunningContainer rc; rc.id = ref.id; rc.name = ref.name; rc.image = ref.image;
            std::string out = utils::trim(ins.output);
            auto sep = out.find(":::");
            rc.network_mode = out.substr(0, sep);
            std::string exposed = sep == std::string::npos ? "null" : out.substr(sep+3);
            try { rc.exposed_ports = json::parse(exposed); }
            catch(const json::parse_error&){ log_warn("Could not parse ExposedPorts JSON for container " + ref.id + ": " + exposed); }
            if(top.ok()) rc.pids = parsers::parse_docker_top_pids(top.output);
            else log_warn("Failed to get processes for container " + ref.id + ": " + top.describe());
            return rc;
        }));
    }
    std::vector<RunningContainer> out;
    for(auto& t : tasks) if(auto rc = t.get()) out.push_back(std::move(*rc));
    return out;
}

std::optional<DockerAttribution> DockerCollector::attribute_by_publish(const PortEntry& port){
    auto r = runner().run("docker ps --filter \"publish=" + std::to_string(port.host_port) + "\" --format \"{{.Names}}:::{{.ID}}\"");
    if(!r.ok()) return std::nullopt;
    auto lines = utils::split_lines(utils::trim(r.output));
    if(lines.empty() || lines[0].empty()) return std::nullopt;
    auto parts = utils::split(lines[0], ":::");
    if(parts.size() < 2 || parts[1].empty()) return std::nullopt;
    return DockerAttribution{parts[0], parts[1], parts[1].substr(0, 12) + ":" + std::to_string(port.host_port)};
}

std::optional<DockerAttribution> DockerCollector::match_container_by_process(const std::string& process, int port, const std::vector<ContainerRef>& containers) const {
    if(process.empty() || process == "unknown") return std::nullopt;
    const std::string proc = utils::to_lower(process);
    const std::string self = utils::to_lower(cfg_.self_container_name);
    for(const auto& c : containers){
        std::string name = utils::to_lower(c.name), image = utils::to_lower(c.image);
        std::string target = c.id.substr(0, 12) + ":" + std::to_string(port);
        if(!self.empty() && (name.find(self) != std::string::npos || image.find(self) != std::string::npos)
           && proc.find(utils::to_lower(cfg_.self_process_name)) != std::string::npos)
            return DockerAttribution{c.name, c.id, target};
        std::string compact; for(char ch : name) if(std::isalnum(static_cast<unsigned char>(ch))) compact.push_back(ch);
        if(name.find(proc) != std::string::npos || image.find(proc) != std::string::npos
           || (!compact.empty() && proc.find(compact) != std::string::npos))
            return DockerAttribution{c.name, c.id, target};
    }
    return std::nullopt;
}

std::vector<PortEntry> DockerCollector::get_ports(){
    std::vector<PortEntry> all;
    std::set<std::string> seen;
    std::map<std::string, std::string> created_by_id;
    std::map<int, const RunningContainer*> pid_owner;
    std::vector<RunningContainer> running;
    std::vector<ContainerRef> listing;

    try {
        for(const auto& a : get_applications()) if(a.created) created_by_id[a.id] = *a.created;
    } catch(const std::exception& ex){ log_warn(std::string("Failed to collect container creation times: ") + ex.what()); }
    auto created_for = [&](const std::string& id) -> std::optional<std::string> {
        auto it = created_by_id.find(id); if(it == created_by_id.end()) return std::nullopt; return it->second;
    };

    auto declared = runner().run("docker ps --format \"{{.Names}}:::{{.Ports}}:::{{.ID}}\"");
    if(declared.ok()){
        for(auto& p : parsers::parse_docker_ps_ports(declared.output)){
            if(!seen.insert(p.key()).second) continue;
            if(p.container_id) p.created = created_for(*p.container_id);
            all.push_back(normalize_port_entry(std::move(p)));
        }
    } else log_warn("Failed to get Docker container ports: " + declared.describe());

    running = inspect_running_containers(&listing);
    for(const auto& rc : running) for(int pid : rc.pids) pid_owner[pid] = &rc;

    std::vector<PortEntry> system_ports;
    try { system_ports = collect_listening_sockets(runner(), family_, {"ss -tulnp", "netstat -tulnp"}); }
    catch(const CollectorError& ex){ log_warn(std::string("Failed to collect system ports: ") + ex.what()); }

    for(auto& port : system_ports){
        if(seen.count(port.key())) continue; // declared mapping wins
        std::optional<DockerAttribution> attr;
        for(int pid : port.pids){
            auto it = pid_owner.find(pid);
            if(it != pid_owner.end()){
                attr = DockerAttribution{it->second->name, it->second->id, it->second->id.substr(0, 12) + ":internal(host-net)"};
                break;
            }
        }
        if(!attr) attr = attribute_by_publish(port);
        if(!attr) attr = match_container_by_process(port.owner, port.host_port, listing);
        if(attr){
            port.source = "docker";
            port.owner = attr->container_name;
            port.target = attr->target;
            port.container_id = attr->container_id;
            port.app_id = attr->container_name;
            port.created = created_for(attr->container_id);
            log_debug("Attributed port " + std::to_string(port.host_port) + " to container " + attr->container_name);
        }
        seen.insert(port.key());
        all.push_back(normalize_port_entry(std::move(port)));
    }
    log_info("Total unique ports collected: " + std::to_string(all.size()));
    return all;
}

}
