#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace port_census {
namespace utils {

std::optional<std::string> read_file(const std::string& path, size_t max_bytes = 1024*1024);
std::string trim(const std::string& s);
std::optional<std::string> read_file_trim(const std::string& path);

// Whitespace tokenizer used by the columnar command parsers.
std::vector<std::string> split_ws(const std::string& s);
// Splits on every occurrence of `delim` (multi-char allowed); keeps empty fields.
std::vector<std::string> split(const std::string& s, const std::string& delim);
std::vector<std::string> split_lines(const std::string& s);

std::string to_lower(std::string s);
bool contains_ci(const std::string& haystack, const std::string& needle);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Strict decimal parse; nullopt on empty input, sign or trailing garbage.
std::optional<long long> parse_int(const std::string& s);

std::string time_to_iso(std::chrono::system_clock::time_point tp);
std::string now_iso();

std::string env_or(const char* name, const std::string& fallback = "");

}
}
