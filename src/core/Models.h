#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace port_census {

struct PortEntry {
    std::string source; // docker | system
    std::string owner = "unknown";
    std::string protocol = "tcp";
    std::string host_ip = "0.0.0.0";
    int host_port = 0;
    std::optional<std::string> target; // container port or descriptor
    std::optional<std::string> container_id;
    std::optional<std::string> vm_id;
    std::optional<std::string> app_id;
    std::optional<std::string> created;
    std::vector<int> pids;

    std::optional<int> pid() const { if(pids.empty()) return std::nullopt; return pids.front(); }
    std::string key() const { return host_ip + ":" + std::to_string(host_port); }
};

struct Application {
    std::string type = "application";
    std::string id;
    std::string name;
    std::string status = "unknown";
    std::string image;
    std::string version;
    std::string command;
    std::optional<std::string> created;
    std::string platform;
    nlohmann::json platform_data = nlohmann::json::object();
};

struct VirtualMachine {
    std::string type = "vm";
    std::string id;
    std::string name;
    std::string status = "unknown";
    int vcpus = 0;
    long long memory = 0;
    bool autostart = false;
    std::string platform;
    nlohmann::json platform_data = nlohmann::json::object();
};

struct SystemInfo {
    std::string hostname;
    std::string version;
    std::string platform;
    std::string type;
    std::string cpu_model;
    int cpu_cores = 0;
    long long memory_total = 0; // bytes
    long long memory_free = 0;
    double memory_usage = 0.0; // percent
    long long uptime_seconds = 0;
    bool enhanced = false;
    nlohmann::json details = nlohmann::json::object(); // platform-specific facts
    nlohmann::json platform_data = nlohmann::json::object();
};

struct CollectionResult {
    std::string platform;
    std::string platform_name;
    std::optional<SystemInfo> system_info;
    std::vector<Application> applications;
    std::vector<PortEntry> ports;
    std::vector<VirtualMachine> vms;
    std::optional<std::string> error;
    // systemInfo/applications/ports/vms -> failure reason (null when the slice succeeded)
    std::map<std::string, std::optional<std::string>> errors;
    std::string timestamp;
    bool enhanced_features_enabled = false;
};

void to_json(nlohmann::json& j, const PortEntry& p);
void to_json(nlohmann::json& j, const Application& a);
void to_json(nlohmann::json& j, const VirtualMachine& v);
void to_json(nlohmann::json& j, const SystemInfo& s);
void to_json(nlohmann::json& j, const CollectionResult& r);

}
