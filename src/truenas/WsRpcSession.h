#pragma once
#include "WebSocketChannel.h"
#include "../core/Errors.h"
#include <chrono>
#include <deque>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace port_census {

enum class SessionState { Idle, Connecting, HandshakeSent, Authenticating, Authenticated, Closed };

const char* session_state_name(SessionState s);

struct SessionTimeouts {
    std::chrono::milliseconds connect{10000};
    std::chrono::milliseconds auth{10000};
    std::chrono::milliseconds request{30000};
    std::chrono::milliseconds ping{20000};
    // Upper bound on how long the I/O thread blocks in a read before servicing the outbox.
    std::chrono::milliseconds poll{50};
};

// Authenticated JSON-RPC session with the middleware. A single I/O thread walks the
// candidate URLs in order until one authenticates, then multiplexes calls by id and
// keeps the connection alive with pings. Calls submitted before authentication wait
// in the outbox and go out in submission order.
class WsRpcSession {
public:
    WsRpcSession(std::vector<std::string> urls, std::string api_key, ChannelFactory factory, SessionTimeouts timeouts = {});
    ~WsRpcSession();
    WsRpcSession(const WsRpcSession&) = delete;
    WsRpcSession& operator=(const WsRpcSession&) = delete;

    // Starts the URL walk on first use. The future is ready once authenticated and
    // holds a CollectorError when every endpoint failed or the key was rejected.
    std::shared_future<void> start();
    std::future<nlohmann::json> request(const std::string& method, nlohmann::json params = nlohmann::json::array());
    // Stops the I/O thread; every queued and in-flight call fails.
    void close();

    SessionState state() const;
    std::string active_url() const;

private:
    using Deadline = std::chrono::steady_clock::time_point;

    struct Call {
        long long id = 0;
        std::string method;
        nlohmann::json params;
        std::promise<nlohmann::json> promise;
        Deadline deadline{};
    };

    void run();
    void attempt(const std::string& url);
    bool await_message(Deadline deadline, nlohmann::json& msg);
    void serve();
    void flush_outbox();
    void dispatch(const std::string& text);
    void expire_calls();
    void fail_all(const std::string& queued_reason, const std::string& inflight_reason);
    void settle_ready(std::exception_ptr error);
    void set_state(SessionState s);
    bool stopping() const;
    long long next_id();

    std::vector<std::string> urls_;
    std::string api_key_;
    ChannelFactory factory_;
    SessionTimeouts timeouts_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Idle;
    std::string active_url_;
    std::deque<Call> outbox_;
    std::map<long long, Call> inflight_;
    long long next_id_ = 1;
    bool stop_ = false;
    bool started_ = false;
    bool ready_settled_ = false;
    std::promise<void> ready_;
    std::shared_future<void> ready_future_;

    // Touched only by the I/O thread.
    WebSocketChannelPtr channel_;
    std::thread io_;
};

}
