#include "ArgumentParser.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <iostream>

namespace port_census {

void ArgumentParser::print_help(){
    std::cout << "port-census options:\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> lines = {
        {"--platform NAME", "Force a collector (truenas|docker|system|base)"},
        {"--detect-only", "Print compatibility scores and exit"},
        {"--output FILE", "Write JSON to FILE (default stdout)"},
        {"--pretty", "Pretty-print JSON"},
        {"--compact", "Minified JSON output"},
        {"--include-udp", "Include UDP listeners"},
        {"--no-cache", "Disable the collector TTL cache"},
        {"--cache-timeout MS", "Default cache lifetime in milliseconds"},
        {"--api-key KEY", "TrueNAS middleware API key"},
        {"--ws-base URL", "TrueNAS base URL (http[s]://host[:port])"},
        {"--self-port N", "Port this service listens on"},
        {"--host-root DIR", "Prefix for host files and sockets"},
        {"--log-level LVL", "error|warn|info|debug|trace"},
        {"--debug", "Shorthand for --log-level debug"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    for(const auto& l : lines){ std::cout << "  " << l.name; if(l.name.size() < 24) for(size_t i=l.name.size(); i<24; ++i) std::cout << ' '; else std::cout<<' '; std::cout << l.help << "\n"; }
}

void ArgumentParser::print_version(){
    std::cout << "port-census " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

std::vector<ArgumentParser::FlagSpec> ArgumentParser::build_specs(Config& cfg){
    auto need_int = [](const std::string& v, const char* flag, long long& out){
        auto n = utils::parse_int(v);
        if(!n){ std::cerr << "Invalid integer for " << flag << "\n"; return false; }
        out = *n; return true;
    };
    return {
        {"--platform", ArgKind::String, [&](const std::string& v){ cfg.platform = utils::to_lower(v); return true; }},
        {"--detect-only", ArgKind::None, [&](const std::string&){ cfg.detect_only = true; return true; }},
        {"--output", ArgKind::String, [&](const std::string& v){ cfg.output_file = v; return true; }},
        {"--pretty", ArgKind::None, [&](const std::string&){ cfg.pretty = true; return true; }},
        {"--compact", ArgKind::None, [&](const std::string&){ cfg.compact = true; return true; }},
        {"--include-udp", ArgKind::None, [&](const std::string&){ cfg.include_udp = true; return true; }},
        {"--no-cache", ArgKind::None, [&](const std::string&){ cfg.disable_cache = true; return true; }},
        {"--cache-timeout", ArgKind::Int, [&, need_int](const std::string& v){ return need_int(v, "--cache-timeout", cfg.cache_timeout_ms); }},
        {"--api-key", ArgKind::String, [&](const std::string& v){ cfg.truenas_api_key = v; return true; }},
        {"--ws-base", ArgKind::String, [&](const std::string& v){ cfg.truenas_ws_base = v; return true; }},
        {"--self-port", ArgKind::Int, [&, need_int](const std::string& v){
            long long n = 0; if(!need_int(v, "--self-port", n)) return false;
            cfg.self_port = static_cast<int>(n); return true; }},
        {"--host-root", ArgKind::String, [&](const std::string& v){ cfg.host_root = v; return true; }},
        {"--log-level", ArgKind::String, [&](const std::string& v){ cfg.log_level = v; return true; }},
        {"--debug", ArgKind::None, [&](const std::string&){ cfg.debug = true; return true; }}
    };
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0;
    auto specs = build_specs(cfg);
    auto find_spec = [&](const std::string& flag)->const FlagSpec*{ for(const auto& s: specs) if(flag==s.name) return &s; return nullptr; };
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; print_help(); exit_code_ = 2; return false; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1>=argc){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        if(!spec->apply(val)){ exit_code_ = 2; return false; }
    }
    if(cfg.debug && cfg.log_level.empty()) cfg.log_level = "debug";
    return true;
}

}
