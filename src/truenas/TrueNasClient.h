#pragma once
#include "WsRpcSession.h"
#include "../core/Config.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace port_census {

class RpcBackend {
public:
    virtual ~RpcBackend() = default;
    virtual nlohmann::json call(const std::string& method, const nlohmann::json& params) = 0;
    virtual void close() = 0;
    virtual bool degraded() const { return false; }
};

using RpcBackendPtr = std::unique_ptr<RpcBackend>;

// Stand-in when no authenticated session is available: empty collections for the
// queries the collectors make, null for everything else.
class DegradedRpcBackend : public RpcBackend {
public:
    nlohmann::json call(const std::string& method, const nlohmann::json& params) override;
    void close() override {}
    bool degraded() const override { return true; }
};

class SessionRpcBackend : public RpcBackend {
public:
    explicit SessionRpcBackend(std::unique_ptr<WsRpcSession> session) : session_(std::move(session)) {}
    nlohmann::json call(const std::string& method, const nlohmann::json& params) override;
    void close() override { session_->close(); }
private:
    std::unique_ptr<WsRpcSession> session_;
};

// Opens an authenticated backend for an API key. Throws CollectorError on failure.
using RpcConnector = std::function<RpcBackendPtr(const std::string& api_key)>;

// Discovers the endpoints for cfg and connects over WebSocket.
RpcConnector websocket_connector(const Config& cfg);

// Lazily connected middleware client. A missing key or a failed connection leaves the
// client in degraded mode rather than failing the caller. Calls run outside the lock so
// concurrent callers share one session.
class TrueNasClient {
public:
    // TRUENAS_API_KEY, when set, takes precedence over api_key. An empty connector means
    // websocket_connector(config()).
    explicit TrueNasClient(std::string api_key = "", RpcConnector connector = RpcConnector());
    ~TrueNasClient();
    TrueNasClient(const TrueNasClient&) = delete;
    TrueNasClient& operator=(const TrueNasClient&) = delete;

    void connect();
    // Rethrows genuine call failures after logging them.
    nlohmann::json call(const std::string& method, const nlohmann::json& params = nlohmann::json::array());
    void close();

    bool connected() const;
    bool is_degraded() const;
    bool has_api_key() const { return !api_key_.empty(); }

private:
    void connect_locked();

    std::string api_key_;
    RpcConnector connector_;
    std::shared_ptr<RpcBackend> backend_;
    mutable std::mutex mutex_;
};

}
