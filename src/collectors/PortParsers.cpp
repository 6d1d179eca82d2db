#include "PortParsers.h"
#include "../core/Utils.h"
#include <regex>
#include <cctype>
#include <cmath>
#include <ctime>

namespace port_census {
namespace parsers {

using utils::split_ws;
using utils::split_lines;
using utils::trim;
using utils::parse_int;

static std::optional<std::string> proto_of(const std::string& col){
    std::string p = utils::to_lower(col);
    if(p.find("tcp") != std::string::npos) return std::string("tcp");
    if(p.find("udp") != std::string::npos) return std::string("udp");
    return std::nullopt;
}

static int leading_int(const std::string& s, int fallback){
    size_t n = 0; while(n<s.size() && std::isdigit(static_cast<unsigned char>(s[n]))) ++n;
    auto v = parse_int(s.substr(0, n));
    if(!v || *v > 0x7fffffff) return fallback;
    return static_cast<int>(*v);
}

bool split_host_port(const std::string& addr, std::string& host, int& port){
    std::string a = trim(addr); std::string port_str;
    if(!a.empty() && a[0]=='['){
        auto close = a.find("]:"); if(close == std::string::npos) return false;
        host = a.substr(1, close-1); port_str = a.substr(close+2);
    } else {
        auto idx = a.rfind(':'); if(idx == std::string::npos) return false;
        host = a.substr(0, idx); port_str = a.substr(idx+1);
    }
    auto pct = host.find('%'); if(pct != std::string::npos) host = host.substr(0, pct);
    if(host == "*") host = "0.0.0.0";
    auto p = parse_int(port_str);
    if(!p || *p <= 0 || *p > 65535) return false;
    port = static_cast<int>(*p);
    return true;
}

std::vector<PortEntry> parse_linux_listeners(const std::string& output, ListenerTool tool){
    static const std::regex ss_users(R"re(\("([^"]+)",pid=(\d+))re");
    static const std::regex netstat_proc(R"(^(\d+)/(.+)$)");
    std::vector<PortEntry> out;
    const size_t local_col = tool == ListenerTool::Ss ? 4 : 3;
    for(const auto& raw : split_lines(output)){
        std::string line = trim(raw); if(line.empty()) continue;
        auto cols = split_ws(line);
        if(cols.size() <= local_col) continue;
        auto proto = proto_of(cols[0]); if(!proto) continue; // header or unrelated row
        PortEntry e; e.source = "system"; e.protocol = *proto;
        if(!split_host_port(cols[local_col], e.host_ip, e.host_port)) continue;
        if(tool == ListenerTool::Ss){
            std::smatch m;
            if(std::regex_search(line, m, ss_users)){ e.owner = m[1].str(); e.pids.push_back(leading_int(m[2].str(), 0)); }
        } else if(cols.size() >= 7){
            const std::string& last = cols.back(); std::smatch m;
            if(std::regex_match(last, m, netstat_proc)){ e.pids.push_back(leading_int(m[1].str(), 0)); e.owner = m[2].str(); }
            else if(auto pid = parse_int(last)){ e.pids.push_back(static_cast<int>(*pid)); e.owner = "Process (pid " + last + ")"; }
        }
        if(e.owner.empty()) e.owner = "unknown";
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<PortEntry> parse_windows_netstat(const std::string& output){
    std::vector<PortEntry> out;
    for(const auto& raw : split_lines(output)){
        auto cols = split_ws(raw);
        if(cols.size() < 4) continue;
        auto proto = proto_of(cols[0]); if(!proto) continue;
        bool listening = false; for(const auto& c : cols) if(c == "LISTENING"){ listening = true; break; }
        if(!listening) continue;
        PortEntry e; e.source = "system"; e.protocol = *proto;
        if(!split_host_port(cols[1], e.host_ip, e.host_port)) continue;
        if(cols.size() >= 5){
            if(auto pid = parse_int(cols.back())){ e.pids.push_back(static_cast<int>(*pid)); e.owner = "Process (pid " + cols.back() + ")"; }
        }
        if(e.owner.empty()) e.owner = "unknown";
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<PortEntry> parse_docker_ps_ports(const std::string& output){
    static const std::regex target_re(R"((\d+)/(tcp|udp))");
    std::vector<PortEntry> out;
    for(const auto& raw : split_lines(output)){
        std::string line = trim(raw); if(line.empty()) continue;
        auto first = line.find(":::"); auto last = line.rfind(":::");
        if(first == std::string::npos || last == first) continue;
        std::string name = line.substr(0, first);
        std::string ports = line.substr(first+3, last-first-3);
        std::string id = line.substr(last+3);
        if(ports.empty()) continue;
        for(const auto& mapping : utils::split(ports, ", ")){
            auto arrow = mapping.find("->"); if(arrow == std::string::npos) continue;
            std::string host_part = mapping.substr(0, arrow), target_part = mapping.substr(arrow+2);
            std::smatch m; if(!std::regex_search(target_part, m, target_re)) continue;
            auto colon = host_part.rfind(':'); if(colon == std::string::npos) continue;
            std::string ip = host_part.substr(0, colon);
            if(ip.size() >= 2 && ip.front()=='[' && ip.back()==']') ip = ip.substr(1, ip.size()-2);
            auto hp = parse_int(host_part.substr(colon+1));
            if(ip.empty() || !hp || *hp > 65535) continue;
            PortEntry e; e.source = "docker"; e.owner = name; e.protocol = m[2].str();
            e.host_ip = ip; e.host_port = static_cast<int>(*hp);
            e.target = m[1].str();
            if(!id.empty()){ e.container_id = id; e.app_id = id; }
            out.push_back(std::move(e));
        }
    }
    return out;
}

nlohmann::json to_json_value(const DockerPortMapping& m){
    nlohmann::json j{{"container_port", m.container_port}, {"protocol", m.protocol}};
    if(m.host_port){ j["host_ip"] = m.host_ip; j["host_port"] = *m.host_port; }
    return j;
}

std::vector<DockerPortMapping> parse_docker_port_string(const std::string& ports){
    std::vector<DockerPortMapping> out;
    if(trim(ports).empty()) return out;
    for(const auto& raw : utils::split(ports, ", ")){
        std::string mapping = trim(raw); if(mapping.empty()) continue;
        DockerPortMapping m;
        std::string internal = mapping;
        auto arrow = mapping.find("->");
        if(arrow != std::string::npos){
            std::string external = mapping.substr(0, arrow); internal = mapping.substr(arrow+2);
            std::string ip = "0.0.0.0", port_str = external;
            auto colon = external.rfind(':');
            if(colon != std::string::npos){ ip = external.substr(0, colon); port_str = external.substr(colon+1); }
            if(ip.size() >= 2 && ip.front()=='[' && ip.back()==']') ip = ip.substr(1, ip.size()-2);
            auto hp = parse_int(port_str); if(!hp || *hp > 65535) continue;
            m.host_ip = (ip == "0.0.0.0" || ip == "::") ? "*" : ip;
            m.host_port = static_cast<int>(*hp);
        }
        auto slash = internal.find('/');
        auto cp = parse_int(internal.substr(0, slash)); if(!cp || *cp > 65535) continue;
        m.container_port = static_cast<int>(*cp);
        if(slash != std::string::npos && slash+1 < internal.size()) m.protocol = internal.substr(slash+1);
        out.push_back(std::move(m));
    }
    return out;
}

std::string resolve_host_ip(const std::string& host_ip){
    if(host_ip == "*" || host_ip == "0.0.0.0" || host_ip == "::" || host_ip.empty()) return "0.0.0.0";
    if(host_ip == "127.0.0.1" || host_ip == "localhost" || host_ip == "::1") return "127.0.0.1";
    return host_ip;
}

std::vector<PortEntry> parse_docker_ps_pipe_ports(const std::string& output){
    std::vector<PortEntry> out;
    for(const auto& raw : split_lines(output)){
        std::string line = trim(raw); if(line.empty()) continue;
        auto fields = utils::split(line, "|");
        if(fields.size() < 3 || fields[1].empty()) continue;
        const std::string& name = fields[0]; const std::string& id = fields[2];
        for(const auto& mapping : utils::split(fields[1], ", ")){
            auto arrow = mapping.find("->"); if(arrow == std::string::npos) continue;
            std::string external = mapping.substr(0, arrow), internal = mapping.substr(arrow+2);
            std::string ip = "0.0.0.0", port_str = external;
            auto colon = external.rfind(':');
            if(colon != std::string::npos){ ip = external.substr(0, colon); port_str = external.substr(colon+1); }
            if(ip.size() >= 2 && ip.front()=='[' && ip.back()==']') ip = ip.substr(1, ip.size()-2);
            ip = resolve_host_ip(ip);
            if(utils::ends_with(ip, ".255")) continue; // broadcast
            auto hp = parse_int(port_str); if(!hp || *hp > 65535) continue;
            auto slash = internal.find('/');
            PortEntry e; e.source = "docker"; e.owner = name;
            e.protocol = (slash != std::string::npos && slash+1 < internal.size()) ? internal.substr(slash+1) : "tcp";
            e.host_ip = ip; e.host_port = static_cast<int>(*hp);
            e.target = internal.substr(0, slash);
            e.container_id = id; e.app_id = id;
            out.push_back(std::move(e));
        }
    }
    return out;
}

std::string extract_docker_server_version(const std::string& output){
    bool in_server = false;
    for(const auto& raw : split_lines(output)){
        std::string line = trim(raw);
        if(utils::starts_with(line, "Server:")){ in_server = true; continue; }
        if(in_server && utils::starts_with(line, "Version:")) return trim(line.substr(8));
    }
    return "unknown";
}

long long parse_memory_size(const std::string& text){
    static const std::regex num_re(R"(([\d.]+))");
    static const std::regex unit_re(R"([a-zA-Z]+)");
    std::smatch m; if(!std::regex_search(text, m, num_re)) return 0;
    double value = 0; try { value = std::stod(m[1].str()); } catch(const std::exception&) { return 0; }
    std::smatch u; std::string unit;
    if(std::regex_search(text, u, unit_re)){ unit = u[0].str(); for(auto& c : unit) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }
    static const std::map<std::string,double> units = {
        {"GIB", 1024.0*1024*1024}, {"GB", 1e9}, {"MIB", 1024.0*1024}, {"MB", 1e6}, {"KIB", 1024.0}, {"KB", 1e3}, {"B", 1.0}};
    auto it = units.find(unit);
    if(it != units.end()) return std::llround(value * it->second);
    // unit-less values under 1024 are GiB
    return value < 1024 ? std::llround(value * 1024.0*1024*1024) : std::llround(value);
}

DockerInfo parse_docker_info(const std::string& output){
    DockerInfo info;
    auto value_of = [](const std::string& line){ auto c = line.find(':'); return c == std::string::npos ? std::string() : trim(line.substr(c+1)); };
    auto as_int = [](const std::string& v){ return leading_int(v, 0); };
    for(const auto& raw : split_lines(output)){
        std::string line = trim(raw);
        if(utils::starts_with(line, "Name:")){ if(info.name.empty()) info.name = value_of(line); }
        else if(utils::starts_with(line, "Containers:")) info.containers = as_int(value_of(line));
        else if(utils::starts_with(line, "Running:")) info.containers_running = as_int(value_of(line));
        else if(utils::starts_with(line, "Images:")) info.images = as_int(value_of(line));
        else if(utils::starts_with(line, "Kernel Version:")) info.kernel_version = value_of(line);
        else if(utils::starts_with(line, "Operating System:")) info.operating_system = value_of(line);
        else if(utils::starts_with(line, "OSType:")) info.os_type = value_of(line);
        else if(utils::starts_with(line, "Architecture:")) info.architecture = value_of(line);
        else if(utils::starts_with(line, "CPUs:")) info.cpus = as_int(value_of(line));
        else if(utils::starts_with(line, "Total Memory:")) info.memory = parse_memory_size(value_of(line));
        else if(utils::starts_with(line, "Storage Driver:")) info.storage_driver = value_of(line);
        else if(utils::starts_with(line, "Logging Driver:")) info.logging_driver = value_of(line);
        else if(utils::starts_with(line, "Cgroup Driver:")) info.cgroup_driver = value_of(line);
        else if(utils::starts_with(line, "Swarm:")) info.swarm_status = value_of(line);
    }
    return info;
}

std::vector<PidContainer> parse_pid_container_lines(const std::string& output){
    std::vector<PidContainer> out;
    for(const auto& raw : split_lines(output)){
        std::string line = trim(raw); if(line.empty()) continue;
        auto parts = utils::split(line, "::");
        if(parts.size() < 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) continue;
        auto pid = parse_int(parts[0]); if(!pid || *pid == 0) continue;
        PidContainer pc; pc.pid = static_cast<int>(*pid); pc.id = parts[1];
        pc.name = parts[2][0] == '/' ? parts[2].substr(1) : parts[2];
        out.push_back(std::move(pc));
    }
    return out;
}

std::vector<int> parse_docker_top_pids(const std::string& output){
    std::vector<int> out; auto lines = split_lines(output);
    for(size_t i=1; i<lines.size(); ++i){
        auto cols = split_ws(lines[i]); if(cols.empty()) continue;
        if(auto pid = parse_int(cols[0])) out.push_back(static_cast<int>(*pid));
    }
    return out;
}

std::vector<std::pair<int,std::string>> parse_docker_top_pid_comm(const std::string& output){
    std::vector<std::pair<int,std::string>> out; auto lines = split_lines(output);
    for(size_t i=1; i<lines.size(); ++i){
        auto cols = split_ws(lines[i]); if(cols.empty()) continue;
        auto pid = parse_int(cols[0]); if(!pid || *pid <= 0) continue;
        std::string comm;
        for(size_t c=1; c<cols.size(); ++c){ if(c>1) comm += " "; comm += cols[c]; }
        if(comm == "sh" || comm == "bash") continue;
        out.emplace_back(static_cast<int>(*pid), comm);
    }
    return out;
}

std::map<int,std::string> parse_process_start_times(const std::string& output){
    std::map<int,std::string> out;
    for(const auto& raw : split_lines(output)){
        auto cols = split_ws(raw); if(cols.size() < 6) continue;
        auto pid = parse_int(cols[0]); if(!pid) continue;
        std::string stamp = cols[1] + " " + cols[2] + " " + cols[3] + " " + cols[4] + " " + cols[5];
        std::tm tm{};
        if(!strptime(stamp.c_str(), "%a %b %d %H:%M:%S %Y", &tm)) continue;
        tm.tm_isdst = -1;
        std::time_t t = std::mktime(&tm); if(t == static_cast<std::time_t>(-1)) continue;
        out[static_cast<int>(*pid)] = utils::time_to_iso(std::chrono::system_clock::from_time_t(t));
    }
    return out;
}

std::optional<long long> parse_meminfo_total(const std::string& meminfo){
    for(const auto& raw : split_lines(meminfo)){
        if(!utils::starts_with(raw, "MemTotal:")) continue;
        auto cols = split_ws(raw);
        if(cols.size() >= 2) if(auto kb = parse_int(cols[1])) return *kb * 1024;
    }
    return std::nullopt;
}

std::string parse_cpu_model(const std::string& cpuinfo){
    for(const auto& raw : split_lines(cpuinfo)){
        if(!utils::starts_with(raw, "model name")) continue;
        auto c = raw.find(':'); if(c == std::string::npos) continue;
        auto v = trim(raw.substr(c+1)); if(!v.empty()) return v;
    }
    return "Unknown";
}

std::optional<double> parse_uptime_seconds(const std::string& proc_uptime){
    auto cols = split_ws(proc_uptime); if(cols.empty()) return std::nullopt;
    try { size_t used = 0; double v = std::stod(cols[0], &used); if(used != cols[0].size() || v < 0) return std::nullopt; return v; }
    catch(const std::exception&) { return std::nullopt; }
}

std::string format_uptime(double seconds){
    long long s = static_cast<long long>(seconds);
    long long days = s / 86400, hours = (s % 86400) / 3600, minutes = (s % 3600) / 60;
    std::string out;
    if(days > 0) out = std::to_string(days) + (days == 1 ? " day, " : " days, ");
    out += std::to_string(hours) + ":" + (minutes < 10 ? "0" : "") + std::to_string(minutes);
    return out;
}

std::optional<std::string> truenas_version_from_kernel(const std::string& kernel){
    static const std::regex re(R"(truenas-(\d+\.\d+\.\d+))", std::regex::icase);
    std::smatch m; if(std::regex_search(kernel, m, re)) return m[1].str();
    return std::nullopt;
}

static std::string process_name(const std::string& first_token){
    auto slash = first_token.rfind('/');
    return slash == std::string::npos || slash+1 == first_token.size() ? first_token : first_token.substr(slash+1);
}

std::vector<ProcessRow> parse_ps_processes(const std::string& output, size_t limit){
    std::vector<ProcessRow> out; auto lines = split_lines(output);
    for(size_t i=1; i<lines.size() && out.size()<limit; ++i){
        auto cols = split_ws(lines[i]); if(cols.size() < 3) continue;
        auto pid = parse_int(cols[0]); if(!pid) continue;
        ProcessRow r; r.pid = static_cast<int>(*pid);
        for(size_t c=2; c<cols.size(); ++c){ if(c>2) r.command += " "; r.command += cols[c]; }
        r.name = process_name(cols[2]);
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<ProcessRow> parse_tasklist_csv(const std::string& output, size_t limit){
    std::vector<ProcessRow> out; auto lines = split_lines(output);
    for(size_t i=1; i<lines.size() && out.size()<limit; ++i){
        if(trim(lines[i]).empty()) continue;
        auto parts = utils::split(lines[i], ",");
        if(parts.size() < 2) continue;
        for(auto& p : parts){ p = trim(p); if(p.size()>=2 && p.front()=='"' && p.back()=='"') p = p.substr(1, p.size()-2); }
        auto pid = parse_int(parts[1]); if(!pid) continue;
        ProcessRow r; r.pid = static_cast<int>(*pid); r.name = parts[0]; r.command = parts[0];
        out.push_back(std::move(r));
    }
    return out;
}

std::string map_docker_status(const std::string& status){
    std::string s = utils::to_lower(status);
    if(s.find("up") != std::string::npos || s.find("running") != std::string::npos) return "running";
    if(s.find("exited") != std::string::npos || s.find("stopped") != std::string::npos) return "stopped";
    if(s.find("restarting") != std::string::npos) return "restarting";
    if(s.find("created") != std::string::npos) return "created";
    if(s.find("paused") != std::string::npos) return "paused";
    return "unknown";
}

std::string map_app_status(const std::string& status){
    std::string s = utils::to_lower(status);
    if(s == "running" || s == "stopped" || s == "error") return s;
    if(s == "deploying" || s == "starting") return "running";
    if(s == "crashed") return "error";
    return "unknown";
}

std::string map_vm_status(const std::string& status){
    std::string s = utils::to_lower(status);
    if(s == "running" || s == "stopped" || s == "paused") return s;
    return "unknown";
}

}
}
