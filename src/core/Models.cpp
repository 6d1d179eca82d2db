#include "Models.h"
#include "Utils.h"

namespace port_census {

using nlohmann::json;

template<typename T>
static json opt(const std::optional<T>& v){ return v ? json(*v) : json(nullptr); }

void to_json(json& j, const PortEntry& p){
    j = json{{"source", p.source}, {"owner", p.owner}, {"protocol", p.protocol},
             {"host_ip", p.host_ip}, {"host_port", p.host_port}};
    if(p.target){
        auto n = utils::parse_int(*p.target);
        j["target"] = n ? json(*n) : json(*p.target);
    } else j["target"] = nullptr;
    j["container_id"] = opt(p.container_id);
    j["vm_id"] = opt(p.vm_id);
    j["app_id"] = opt(p.app_id);
    j["created"] = opt(p.created);
    if(!p.pids.empty()){ j["pid"] = p.pids.front(); if(p.pids.size()>1) j["pids"] = p.pids; }
}

void to_json(json& j, const Application& a){
    j = json{{"type", a.type}, {"id", a.id}, {"name", a.name}, {"status", a.status},
             {"image", a.image}, {"version", a.version}, {"command", a.command},
             {"created", opt(a.created)}, {"platform", a.platform}, {"platform_data", a.platform_data}};
}

void to_json(json& j, const VirtualMachine& v){
    j = json{{"type", v.type}, {"id", v.id}, {"name", v.name}, {"status", v.status},
             {"vcpus", v.vcpus}, {"memory", v.memory}, {"autostart", v.autostart},
             {"platform", v.platform}, {"platform_data", v.platform_data}};
}

void to_json(json& j, const SystemInfo& s){
    j = s.details.is_object() ? s.details : json::object();
    j["hostname"] = s.hostname;
    j["version"] = s.version;
    j["platform"] = s.platform;
    if(!s.type.empty()) j["type"] = s.type;
    j["cpu"] = json{{"model", s.cpu_model}, {"cores", s.cpu_cores}};
    j["memory"] = json{{"total", s.memory_total}, {"free", s.memory_free}, {"usage", s.memory_usage}};
    j["uptime"] = s.uptime_seconds;
    if(s.enhanced) j["enhanced"] = true;
    j["platform_data"] = s.platform_data;
}

void to_json(json& j, const CollectionResult& r){
    j = json{{"platform", r.platform}, {"platformName", r.platform_name}};
    j["systemInfo"] = r.system_info ? json(*r.system_info) : json(nullptr);
    j["applications"] = r.applications;
    j["ports"] = r.ports;
    j["vms"] = r.vms;
    if(r.error) j["error"] = *r.error;
    if(!r.errors.empty()){
        json e = json::object();
        for(const auto& kv : r.errors) e[kv.first] = opt(kv.second);
        j["errors"] = e;
    }
    j["timestamp"] = r.timestamp;
    j["enhancedFeaturesEnabled"] = r.enhanced_features_enabled;
}

}
