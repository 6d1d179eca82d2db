#include "TrueNasClient.h"
#include "AutoDiscover.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"

namespace port_census {

using nlohmann::json;

namespace {

std::string resolve_api_key(const std::string& explicit_key){
    std::string env = utils::env_or("TRUENAS_API_KEY");
    return env.empty() ? explicit_key : env;
}

}

json DegradedRpcBackend::call(const std::string& method, const json&){
    Logger::instance().debug("Degraded TrueNAS client answering " + method);
    if(method == "system.info") return json::object();
    if(method == "app.query" || method == "virt.instance.query") return json::array();
    return json();
}

json SessionRpcBackend::call(const std::string& method, const json& params){
    return session_->request(method, params).get();
}

RpcConnector websocket_connector(const Config& cfg){
    return [cfg](const std::string& api_key) -> RpcBackendPtr {
        auto urls = websocket_urls(cfg);
        Logger::instance().debug("Trying " + std::to_string(urls.size()) + " WebSocket endpoint(s)");
        auto session = std::make_unique<WsRpcSession>(urls, api_key, []() -> WebSocketChannelPtr { return std::make_unique<SocketWebSocketChannel>(); });
        session->start().get();
        return std::make_unique<SessionRpcBackend>(std::move(session));
    };
}

TrueNasClient::TrueNasClient(std::string api_key, RpcConnector connector)
    : api_key_(resolve_api_key(api_key)),
      connector_(connector ? std::move(connector) : websocket_connector(config())) {}

TrueNasClient::~TrueNasClient(){ close(); }

void TrueNasClient::connect(){
    std::lock_guard<std::mutex> lock(mutex_);
    connect_locked();
}

void TrueNasClient::connect_locked(){
    if(backend_) return;
    if(api_key_.empty()){
        Logger::instance().info("No TrueNAS API key configured; enhanced features disabled");
        backend_ = std::make_shared<DegradedRpcBackend>();
        return;
    }
    try {
        backend_ = connector_(api_key_);
    } catch(const CollectorError& e){
        Logger::instance().error(std::string("TrueNAS WebSocket connection failed: ") + e.what());
        backend_ = std::make_shared<DegradedRpcBackend>();
    }
}

json TrueNasClient::call(const std::string& method, const json& params){
    std::shared_ptr<RpcBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_locked();
        backend = backend_;
    }
    try {
        return backend->call(method, params);
    } catch(const CollectorError& e){
        Logger::instance().error("TrueNAS call " + method + " failed: " + e.what());
        throw;
    }
}

void TrueNasClient::close(){
    std::shared_ptr<RpcBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend.swap(backend_);
    }
    if(backend) backend->close();
}

bool TrueNasClient::connected() const { std::lock_guard<std::mutex> lock(mutex_); return backend_ != nullptr; }
bool TrueNasClient::is_degraded() const { std::lock_guard<std::mutex> lock(mutex_); return backend_ && backend_->degraded(); }

}
