#include "Config.h"
#include "Utils.h"
#include "Logging.h"
#include <iostream>
#include <cstdlib>

namespace port_census {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }

void load_env(Config& cfg){
    if(const char* v = std::getenv("TRUENAS_API_KEY")) cfg.truenas_api_key = v;
    if(const char* v = std::getenv("TRUENAS_WS_BASE")) cfg.truenas_ws_base = v;
    if(const char* v = std::getenv("DOCKER_HOST")) cfg.docker_host = v;
    if(const char* v = std::getenv("INCLUDE_UDP")) cfg.include_udp = std::string(v)=="true";
    if(const char* v = std::getenv("DISABLE_CACHE")) cfg.disable_cache = std::string(v)=="true";
    if(const char* v = std::getenv("DEBUG")) cfg.debug = std::string(v)=="true";
    if(const char* v = std::getenv("CACHE_TIMEOUT_MS")){
        if(auto n = utils::parse_int(utils::trim(v))) cfg.cache_timeout_ms = *n;
        else Logger::instance().warn(std::string("Ignoring invalid CACHE_TIMEOUT_MS: ") + v);
    }
    if(const char* v = std::getenv("PORT")){
        auto n = utils::parse_int(utils::trim(v));
        if(n && *n > 0 && *n <= 65535) cfg.self_port = static_cast<int>(*n);
        else Logger::instance().warn(std::string("Ignoring invalid PORT: ") + v);
    }
}

std::string host_path(const Config& cfg, const std::string& path){
    if(cfg.host_root.empty()) return path;
    std::string root = cfg.host_root;
    if(!root.empty() && root.back()=='/') root.pop_back();
    return root + path;
}

bool ConfigValidator::validate(Config& cfg){
    // compact wins over pretty
    if(cfg.pretty && cfg.compact) cfg.pretty = false;
    if(cfg.cache_timeout_ms < 0){
        std::cerr << "--cache-timeout must be >= 0\n";
        return false;
    }
    if(cfg.self_port <= 0 || cfg.self_port > 65535){
        std::cerr << "--self-port must be within 1-65535\n";
        return false;
    }
    if(!cfg.log_level.empty()){
        LogLevel lvl;
        if(!parse_log_level(cfg.log_level, lvl)){
            std::cerr << "Invalid --log-level: " << cfg.log_level << "\n";
            return false;
        }
    }
    if(!cfg.truenas_ws_base.empty() && !utils::starts_with(cfg.truenas_ws_base, "http")){
        std::cerr << "--ws-base must start with http:// or https://\n";
        return false;
    }
    if(cfg.detect_only && !cfg.platform.empty()){
        std::cerr << "--detect-only cannot be combined with --platform\n";
        return false;
    }
    return true;
}

}
