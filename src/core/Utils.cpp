#include "Utils.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <cstdio>

namespace port_census {
namespace utils {

std::optional<std::string> read_file(const std::string& path, size_t max_bytes){
    std::ifstream ifs(path, std::ios::binary); if(!ifs) return std::nullopt;
    std::string out; out.resize(max_bytes);
    ifs.read(&out[0], static_cast<std::streamsize>(max_bytes));
    out.resize(static_cast<size_t>(ifs.gcount()));
    return out;
}

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b<e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e>b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e-b);
}

std::optional<std::string> read_file_trim(const std::string& path){
    auto c = read_file(path); if(!c) return std::nullopt; return trim(*c);
}

std::vector<std::string> split_ws(const std::string& s){
    std::vector<std::string> out; std::istringstream iss(s); std::string tok;
    while(iss >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> split(const std::string& s, const std::string& delim){
    std::vector<std::string> out; if(delim.empty()){ out.push_back(s); return out; }
    size_t start = 0, pos;
    while((pos = s.find(delim, start)) != std::string::npos){ out.push_back(s.substr(start, pos-start)); start = pos + delim.size(); }
    out.push_back(s.substr(start));
    return out;
}

std::vector<std::string> split_lines(const std::string& s){
    std::vector<std::string> out; std::istringstream iss(s); std::string line;
    while(std::getline(iss, line)){ if(!line.empty() && line.back()=='\r') line.pop_back(); out.push_back(line); }
    return out;
}

std::string to_lower(std::string s){ std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); }); return s; }

bool contains_ci(const std::string& haystack, const std::string& needle){
    if(needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool starts_with(const std::string& s, const std::string& prefix){ return s.size()>=prefix.size() && s.compare(0, prefix.size(), prefix)==0; }
bool ends_with(const std::string& s, const std::string& suffix){ return s.size()>=suffix.size() && s.compare(s.size()-suffix.size(), suffix.size(), suffix)==0; }

std::optional<long long> parse_int(const std::string& s){
    if(s.empty() || s.size() > 18) return std::nullopt;
    long long v = 0;
    for(char c: s){ if(c<'0' || c>'9') return std::nullopt; v = v*10 + (c-'0'); }
    return v;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t t = static_cast<std::time_t>(ms / 1000);
    std::tm tm{}; gmtime_r(&t, &tm);
    char buf[32]; std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40]; std::snprintf(out, sizeof(out), "%s.%03lldZ", buf, static_cast<long long>(ms % 1000));
    return out;
}

std::string now_iso(){ return time_to_iso(std::chrono::system_clock::now()); }

std::string env_or(const char* name, const std::string& fallback){
    const char* v = std::getenv(name); return v ? std::string(v) : fallback;
}

}
}
