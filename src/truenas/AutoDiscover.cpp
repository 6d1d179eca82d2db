#include "AutoDiscover.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace port_census {

using nlohmann::json;

namespace {

struct FdGuard {
    int fd;
    ~FdGuard(){ if(fd >= 0) ::close(fd); }
};

std::optional<std::string> decode_chunked(const std::string& s){
    std::string out;
    size_t pos = 0;
    for(;;){
        auto eol = s.find("\r\n", pos);
        if(eol == std::string::npos) return std::nullopt;
        std::string size_line = s.substr(pos, eol - pos);
        auto semi = size_line.find(';');
        if(semi != std::string::npos) size_line.resize(semi);
        size_line = utils::trim(size_line);
        if(size_line.empty()) return std::nullopt;
        char* end = nullptr;
        unsigned long size = std::strtoul(size_line.c_str(), &end, 16);
        if(end == nullptr || *end != '\0') return std::nullopt;
        pos = eol + 2;
        if(size == 0) return out;
        if(s.size() < pos + size) return std::nullopt;
        out.append(s, pos, size);
        pos += size + 2;
    }
}

bool truthy(const json& j){
    if(j.is_boolean()) return j.get<bool>();
    if(j.is_number()) return j.get<double>() != 0;
    if(j.is_string()) return !j.get<std::string>().empty();
    return !j.is_null();
}

int port_value(const json& j){
    if(j.is_number_integer()) return j.get<int>();
    if(j.is_string()){
        auto v = utils::parse_int(j.get<std::string>());
        if(v && *v > 0 && *v <= 65535) return static_cast<int>(*v);
    }
    return 0;
}

}

const std::vector<std::string>& middleware_socket_paths(){
    static const std::vector<std::string> paths = {
        "/var/run/middlewared.sock",
        "/run/middlewared.sock",
        "/run/middleware/middlewared.sock",
    };
    return paths;
}

std::optional<HttpResponse> parse_http_response(const std::string& raw, bool at_eof){
    auto end = raw.find("\r\n\r\n");
    if(end == std::string::npos) return std::nullopt;
    auto lines = utils::split_lines(raw.substr(0, end));
    if(lines.empty()) return std::nullopt;
    auto status_cols = utils::split_ws(lines[0]);
    if(status_cols.size() < 2 || !utils::starts_with(status_cols[0], "HTTP/")) return std::nullopt;
    auto code = utils::parse_int(status_cols[1]);
    if(!code) return std::nullopt;

    bool chunked = false;
    std::optional<long long> content_length;
    for(size_t i = 1; i < lines.size(); ++i){
        auto colon = lines[i].find(':');
        if(colon == std::string::npos) continue;
        std::string name = utils::to_lower(utils::trim(lines[i].substr(0, colon)));
        std::string value = utils::trim(lines[i].substr(colon + 1));
        if(name == "transfer-encoding" && utils::contains_ci(value, "chunked")) chunked = true;
        else if(name == "content-length") content_length = utils::parse_int(value);
    }

    HttpResponse resp;
    resp.status = static_cast<int>(*code);
    std::string body = raw.substr(end + 4);
    if(chunked){
        auto decoded = decode_chunked(body);
        if(!decoded) return std::nullopt;
        resp.body = std::move(*decoded);
    } else if(content_length){
        if(body.size() < static_cast<size_t>(*content_length)) return std::nullopt;
        resp.body = body.substr(0, static_cast<size_t>(*content_length));
    } else {
        if(!at_eof) return std::nullopt;
        resp.body = std::move(body);
    }
    return resp;
}

json call_socket_method(const std::string& socket_path, const std::string& method, std::chrono::milliseconds timeout){
    const std::string body = json{{"id", 1}, {"msg", "method"}, {"method", method}, {"params", json::array()}}.dump() + "\n";
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if(socket_path.size() >= sizeof(addr.sun_path))
        throw CollectorError(ErrorKind::Connection, "Socket path too long: " + socket_path);
    std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size() + 1);

    FdGuard sock{::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)};
    if(sock.fd < 0) throw CollectorError(ErrorKind::Connection, std::string("socket() failed: ") + std::strerror(errno));
    if(::connect(sock.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
        throw CollectorError(ErrorKind::Connection, "Cannot connect to " + socket_path + ": " + std::strerror(errno));

    std::string request = "POST /_middleware HTTP/1.1\r\n"
                          "Host: localhost\r\n"
                          "Content-Type: application/json\r\n"
                          "Content-Length: " + std::to_string(body.size()) + "\r\n"
                          "Connection: close\r\n\r\n" + body;
    size_t off = 0;
    while(off < request.size()){
        ssize_t n = ::send(sock.fd, request.data() + off, request.size() - off, MSG_NOSIGNAL);
        if(n < 0){
            if(errno == EINTR) continue;
            throw CollectorError(ErrorKind::Connection, "Write to " + socket_path + " failed: " + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }

    std::string raw;
    std::optional<HttpResponse> resp;
    char buf[8192];
    for(;;){
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if(left.count() <= 0) throw CollectorError(ErrorKind::Timeout, "Socket timeout");
        pollfd p{sock.fd, POLLIN, 0};
        int r = ::poll(&p, 1, static_cast<int>(left.count()));
        if(r == 0) throw CollectorError(ErrorKind::Timeout, "Socket timeout");
        if(r < 0){
            if(errno == EINTR) continue;
            throw CollectorError(ErrorKind::Connection, std::string("poll failed: ") + std::strerror(errno));
        }
        ssize_t n = ::recv(sock.fd, buf, sizeof(buf), 0);
        if(n < 0){
            if(errno == EINTR || errno == EAGAIN) continue;
            throw CollectorError(ErrorKind::Connection, "Read from " + socket_path + " failed: " + std::strerror(errno));
        }
        if(n == 0){ resp = parse_http_response(raw, true); break; }
        raw.append(buf, static_cast<size_t>(n));
        if((resp = parse_http_response(raw, false))) break;
    }

    if(!resp) throw CollectorError(ErrorKind::Parse, "Failed to parse response from " + socket_path + " for " + method);
    Logger::instance().debug("HTTP " + std::to_string(resp->status) + " from " + socket_path + " for " + method);
    if(resp->status != 200)
        throw CollectorError(ErrorKind::Connection, "HTTP " + std::to_string(resp->status) + ": " + resp->body);
    json reply = json::parse(resp->body, nullptr, false);
    if(reply.is_discarded() || !reply.is_object())
        throw CollectorError(ErrorKind::Parse, "Failed to parse response from " + socket_path + " for " + method);
    if(reply.contains("error") && !reply["error"].is_null()) throw RpcError(reply["error"]);
    return reply.contains("result") ? reply["result"] : json();
}

UiConfig ui_config_from_result(const json& result){
    UiConfig ui;
    if(!result.is_object()) return ui;
    ui.https_port = port_value(result.value("ui_httpsport", json()));
    ui.http_port = port_value(result.value("ui_port", json()));
    if(!ui.http_port) ui.http_port = port_value(result.value("ui_httpport", json()));
    ui.https_enabled = truthy(result.value("ui_https", json())) || truthy(result.value("ui_httpsredirect", json()));
    json address = result.value("ui_address", json());
    if(address.is_string() && !address.get<std::string>().empty()) ui.address = address.get<std::string>();
    else if(address.is_array() && !address.empty() && address[0].is_string()) ui.address = address[0].get<std::string>();
    ui.certificate = result.value("ui_certificate", json());
    return ui;
}

std::optional<UiConfig> discover_ui_config(const Config& cfg, std::chrono::milliseconds timeout){
    std::error_code ec;
    for(const auto& path : middleware_socket_paths()){
        std::string resolved = host_path(cfg, path);
        if(!std::filesystem::exists(resolved, ec)) continue;
        try {
            json result = call_socket_method(resolved, "system.general.config", timeout);
            if(result.is_null()) continue;
            UiConfig ui = ui_config_from_result(result);
            Logger::instance().debug("Discovered UI config via " + resolved + ": http=" + std::to_string(ui.http_port) +
                                     " https=" + std::to_string(ui.https_port) + (ui.https_enabled ? " (https enabled)" : ""));
            return ui;
        } catch(const CollectorError& e){
            Logger::instance().debug("UI config discovery failed for " + resolved + ": " + e.what());
        }
    }
    Logger::instance().debug("No middleware socket answered system.general.config");
    return std::nullopt;
}

bool running_in_container(const Config& cfg){
    std::error_code ec;
    return !cfg.docker_host.empty() || std::filesystem::exists(host_path(cfg, "/.dockerenv"), ec);
}

std::vector<std::string> detect_host_addresses(const Config& cfg){
    std::vector<std::string> hosts = {"127.0.0.1", "localhost"};
    if(running_in_container(cfg)){
        hosts.push_back("host.docker.internal");
        hosts.push_back("172.17.0.1");
    }
    return hosts;
}

std::vector<std::string> generate_websocket_urls(const std::optional<UiConfig>& ui, const std::vector<std::string>& hosts, const std::string& ws_base){
    std::vector<std::string> urls;
    if(!ws_base.empty()){
        std::string base = utils::starts_with(ws_base, "http") ? "ws" + ws_base.substr(4) : ws_base;
        urls.push_back(base + "/websocket");
        return urls;
    }
    auto add = [&urls](const std::string& url){
        if(std::find(urls.begin(), urls.end(), url) == urls.end()) urls.push_back(url);
    };
    if(ui){
        for(const auto& host : hosts){
            if(ui->https_enabled && ui->https_port) add("wss://" + host + ":" + std::to_string(ui->https_port) + "/websocket");
            if(ui->http_port) add("ws://" + host + ":" + std::to_string(ui->http_port) + "/websocket");
        }
        return urls;
    }
    static const std::pair<int, const char*> common[] = {{443, "wss"}, {80, "ws"}, {8443, "wss"}, {8080, "ws"}};
    for(const auto& host : hosts)
        for(const auto& c : common) add(std::string(c.second) + "://" + host + ":" + std::to_string(c.first) + "/websocket");
    return urls;
}

std::vector<std::string> websocket_urls(const Config& cfg){
    if(!cfg.truenas_ws_base.empty()) return generate_websocket_urls(std::nullopt, {}, cfg.truenas_ws_base);
    auto ui = discover_ui_config(cfg);
    auto urls = generate_websocket_urls(ui, detect_host_addresses(cfg));
    if(urls.empty()){
        Logger::instance().debug("Discovered UI config produced no endpoints; using common ports");
        urls = generate_websocket_urls(std::nullopt, detect_host_addresses(cfg));
    }
    return urls;
}

}
