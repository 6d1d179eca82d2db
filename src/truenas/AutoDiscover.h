#pragma once
#include "../core/Config.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace port_census {

// Web UI listener settings reported by system.general.config.
struct UiConfig {
    int https_port = 0;
    int http_port = 0;
    bool https_enabled = false;
    std::string address = "127.0.0.1";
    nlohmann::json certificate;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

// Middleware control sockets, in the order they are tried.
const std::vector<std::string>& middleware_socket_paths();

// Splits a raw HTTP/1.1 response; chunked bodies are decoded. nullopt while the
// response is incomplete or malformed. Without framing headers the body runs to EOF.
std::optional<HttpResponse> parse_http_response(const std::string& raw, bool at_eof = true);

// POSTs {"id":1,"msg":"method",...} to /_middleware over a UNIX socket and returns the
// result member. Throws CollectorError on socket errors, timeouts, non-200 statuses,
// unparsable bodies and middleware errors.
nlohmann::json call_socket_method(const std::string& socket_path, const std::string& method,
                                  std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

UiConfig ui_config_from_result(const nlohmann::json& result);

// First socket that answers wins; nullopt when none does.
std::optional<UiConfig> discover_ui_config(const Config& cfg,
                                           std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

bool running_in_container(const Config& cfg);
std::vector<std::string> detect_host_addresses(const Config& cfg);

// Candidate endpoints in try order. A non-empty ws_base replaces everything else.
std::vector<std::string> generate_websocket_urls(const std::optional<UiConfig>& ui,
                                                 const std::vector<std::string>& hosts,
                                                 const std::string& ws_base = "");

// Discovery followed by URL generation for this host.
std::vector<std::string> websocket_urls(const Config& cfg);

}
