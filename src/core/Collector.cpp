#include "Collector.h"
#include "Errors.h"
#include "Logging.h"
#include "Utils.h"
#include <future>
#include <cctype>

namespace port_census {

using nlohmann::json;

Collector::Collector(Config cfg, CommandRunnerPtr runner) : cfg_(std::move(cfg)), runner_(std::move(runner)) {
    if(!runner_) runner_ = std::make_shared<ShellCommandRunner>();
}

void Collector::log_info(const std::string& m) const { Logger::instance().info("[" + platform_name() + "] " + m); }
void Collector::log_warn(const std::string& m) const { Logger::instance().warn("[" + platform_name() + "] " + m); }
void Collector::log_error(const std::string& m) const { Logger::instance().error("[" + platform_name() + "] " + m); }
void Collector::log_debug(const std::string& m) const { Logger::instance().debug("[" + platform_name() + "] " + m); }

CollectionResult Collector::empty_result() const {
    CollectionResult r;
    r.platform = platform();
    r.platform_name = platform_name();
    r.timestamp = utils::now_iso();
    return r;
}

CollectionResult Collector::collect(){
    throw CollectorError(ErrorKind::NotImplemented, "Method not implemented: collect()");
}

template<typename T>
static std::optional<std::string> settle(std::future<T>& f, T& out){
    try { out = f.get(); return std::nullopt; }
    catch(const std::exception& ex){ return std::string(ex.what()); }
}

CollectionResult Collector::collect_all(){
    if(strategy() == CollectionStrategy::Unified){
        log_debug("Using unified collect() strategy");
        try {
            return collect();
        } catch(const std::exception& ex){
            log_error(std::string("collect() failed: ") + ex.what());
            auto r = empty_result();
            r.error = ex.what();
            return r;
        }
    }

    log_debug("Using fan-out collection strategy");
    auto fsys = std::async(std::launch::async, [this]{ return get_system_info(); });
    auto fapps = std::async(std::launch::async, [this]{ return get_applications(); });
    auto fports = std::async(std::launch::async, [this]{ return get_ports(); });
    auto fvms = std::async(std::launch::async, [this]{ return get_vms(); });

    auto r = empty_result();
    SystemInfo si;
    r.errors["systemInfo"] = settle(fsys, si);
    if(!r.errors["systemInfo"]) r.system_info = std::move(si);
    r.errors["applications"] = settle(fapps, r.applications);
    std::vector<PortEntry> ports;
    r.errors["ports"] = settle(fports, ports);
    for(auto& p : ports) r.ports.push_back(normalize_port_entry(std::move(p)));
    r.errors["vms"] = settle(fvms, r.vms);
    for(const auto& kv : r.errors) if(kv.second) log_warn("Collection of " + kv.first + " failed: " + *kv.second);
    return r;
}

PortEntry Collector::normalize_port_entry(PortEntry e) const {
    return port_census::normalize_port_entry(std::move(e), platform());
}

static std::optional<std::string> json_opt_string(const json& raw, const char* key){
    auto it = raw.find(key);
    if(it == raw.end() || it->is_null()) return std::nullopt;
    if(it->is_string()) return it->get<std::string>();
    if(it->is_number_integer()) return std::to_string(it->get<long long>());
    return it->dump();
}

static int json_port(const json& raw, const char* key){
    auto it = raw.find(key);
    if(it == raw.end()) return 0;
    long long v = 0;
    if(it->is_number_integer()) v = it->get<long long>();
    else if(it->is_number_float()) v = static_cast<long long>(it->get<double>());
    else if(it->is_string()){
        // leading digits, like parseInt
        std::string s = utils::trim(it->get<std::string>()); size_t n = 0;
        while(n<s.size() && std::isdigit(static_cast<unsigned char>(s[n]))) ++n;
        auto p = utils::parse_int(s.substr(0, n)); if(!p) return 0; v = *p;
    }
    return (v < 0 || v > 65535) ? 0 : static_cast<int>(v);
}

PortEntry normalize_port_entry(const json& raw, const std::string& default_source){
    PortEntry e;
    if(!raw.is_object()) return normalize_port_entry(std::move(e), default_source);
    e.source = json_opt_string(raw, "source").value_or("");
    e.owner = json_opt_string(raw, "owner").value_or("");
    e.protocol = json_opt_string(raw, "protocol").value_or("");
    e.host_ip = json_opt_string(raw, "host_ip").value_or("");
    e.host_port = json_port(raw, "host_port");
    e.target = json_opt_string(raw, "target");
    e.container_id = json_opt_string(raw, "container_id");
    e.vm_id = json_opt_string(raw, "vm_id");
    e.app_id = json_opt_string(raw, "app_id");
    e.created = json_opt_string(raw, "created");
    auto pit = raw.find("pid");
    if(pit != raw.end() && pit->is_number_integer()) e.pids.push_back(pit->get<int>());
    return normalize_port_entry(std::move(e), default_source);
}

PortEntry normalize_port_entry(PortEntry e, const std::string& default_source){
    if(e.source.empty()) e.source = default_source;
    if(e.owner.empty()) e.owner = "unknown";
    e.protocol = utils::to_lower(e.protocol);
    if(e.protocol.empty()) e.protocol = "tcp";
    if(e.host_ip.empty()) e.host_ip = "0.0.0.0";
    if(e.host_port < 0 || e.host_port > 65535) e.host_port = 0;
    return e;
}

SystemInfo BaseCollector::get_system_info(){ throw CollectorError(ErrorKind::NotImplemented, "Method not implemented: get_system_info()"); }
std::vector<Application> BaseCollector::get_applications(){ throw CollectorError(ErrorKind::NotImplemented, "Method not implemented: get_applications()"); }
std::vector<PortEntry> BaseCollector::get_ports(){ throw CollectorError(ErrorKind::NotImplemented, "Method not implemented: get_ports()"); }
std::vector<VirtualMachine> BaseCollector::get_vms(){ throw CollectorError(ErrorKind::NotImplemented, "Method not implemented: get_vms()"); }

}
