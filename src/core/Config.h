#pragma once
#include <string>
#include <vector>
#include <optional>

namespace port_census {

struct Config {
    std::string platform; // forced collector; empty = auto-detect
    bool detect_only = false;
    std::string output_file;
    bool pretty = false;
    bool compact = false;
    std::string log_level; // empty = info
    bool debug = false;
    // Collection behaviour (environment backed)
    bool include_udp = false; // INCLUDE_UDP
    bool disable_cache = false; // DISABLE_CACHE
    long long cache_timeout_ms = 60000; // CACHE_TIMEOUT_MS
    int self_port = 4999; // PORT; the collector's own listening port
    std::string self_container_name = "port-census";
    std::string self_process_name = "port-census";
    // TrueNAS middleware
    std::string truenas_api_key; // TRUENAS_API_KEY
    std::string truenas_ws_base; // TRUENAS_WS_BASE
    std::string docker_host; // DOCKER_HOST
    // Prefix for host paths (sockets, /etc files, /.dockerenv); empty = real root
    std::string host_root;
};

Config& config();
void set_config(const Config& c);

// Overlays the recognised environment variables onto cfg.
void load_env(Config& cfg);

// Resolves a host path against cfg.host_root.
std::string host_path(const Config& cfg, const std::string& path);

class ConfigValidator {
public:
    // Normalizes conflicting options; returns false (after printing) for invalid values.
    static bool validate(Config& cfg);
};

}
