#include "WsRpcSession.h"
#include "../core/Logging.h"
#include <algorithm>
#include <optional>

namespace port_census {

using nlohmann::json;

namespace {

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline){
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

std::exception_ptr connection_error(const std::string& what){
    return std::make_exception_ptr(CollectorError(ErrorKind::Connection, what));
}

// Peers may send any JSON; a non-string "msg" reads as empty.
std::string message_kind(const json& msg){
    auto it = msg.find("msg");
    return it != msg.end() && it->is_string() ? it->get<std::string>() : std::string();
}

}

const char* session_state_name(SessionState s){
    switch(s){
        case SessionState::Idle: return "idle";
        case SessionState::Connecting: return "connecting";
        case SessionState::HandshakeSent: return "handshake-sent";
        case SessionState::Authenticating: return "authenticating";
        case SessionState::Authenticated: return "authenticated";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

WsRpcSession::WsRpcSession(std::vector<std::string> urls, std::string api_key, ChannelFactory factory, SessionTimeouts timeouts)
    : urls_(std::move(urls)), api_key_(std::move(api_key)), factory_(std::move(factory)), timeouts_(timeouts),
      ready_future_(ready_.get_future().share()) {}

WsRpcSession::~WsRpcSession(){ close(); }

std::shared_future<void> WsRpcSession::start(){
    std::lock_guard<std::mutex> lock(mutex_);
    if(!started_ && !stop_){
        started_ = true;
        io_ = std::thread(&WsRpcSession::run, this);
    }
    return ready_future_;
}

std::future<json> WsRpcSession::request(const std::string& method, json params){
    std::promise<json> promise;
    auto fut = promise.get_future();
    std::lock_guard<std::mutex> lock(mutex_);
    if(stop_ || state_ == SessionState::Closed){
        promise.set_exception(connection_error("WebSocket not connected"));
        return fut;
    }
    Call call;
    call.id = next_id_++;
    call.method = method;
    call.params = std::move(params);
    call.promise = std::move(promise);
    outbox_.push_back(std::move(call));
    return fut;
}

void WsRpcSession::close(){
    std::thread io;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        io.swap(io_);
    }
    if(io.joinable()) io.join();
    set_state(SessionState::Closed);
    settle_ready(connection_error("WebSocket closed"));
    fail_all("WebSocket closed while request was queued", "WebSocket closed");
}

SessionState WsRpcSession::state() const { std::lock_guard<std::mutex> lock(mutex_); return state_; }
std::string WsRpcSession::active_url() const { std::lock_guard<std::mutex> lock(mutex_); return active_url_; }

bool WsRpcSession::stopping() const { std::lock_guard<std::mutex> lock(mutex_); return stop_; }

void WsRpcSession::set_state(SessionState s){
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = s;
}

long long WsRpcSession::next_id(){ std::lock_guard<std::mutex> lock(mutex_); return next_id_++; }

void WsRpcSession::settle_ready(std::exception_ptr error){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(ready_settled_) return;
        ready_settled_ = true;
    }
    if(error) ready_.set_exception(error);
    else ready_.set_value();
}

void WsRpcSession::run(){
    std::exception_ptr failure;
    bool authenticated = false;
    for(const auto& url : urls_){
        if(stopping()) break;
        try {
            attempt(url);
            authenticated = true;
            break;
        } catch(const CollectorError& e){
            if(channel_){ channel_->close(); channel_.reset(); }
            if(e.kind() == ErrorKind::Authentication){
                Logger::instance().error(std::string("WebSocket authentication rejected at ") + url + ": " + e.what());
                failure = std::current_exception();
                continue;
            }
            Logger::instance().debug(std::string("WebSocket attempt failed for ") + url + " (" + error_kind_name(e.kind()) + "): " + e.what());
        }
    }

    if(!authenticated){
        set_state(SessionState::Closed);
        std::string reason = stopping() ? "WebSocket closed" : "WebSocket connection failed for all endpoints";
        if(!failure) failure = connection_error(reason);
        settle_ready(failure);
        fail_all(stopping() ? "WebSocket closed while request was queued" : reason, reason);
        return;
    }

    Logger::instance().info("WebSocket authenticated via " + active_url());
    settle_ready(nullptr);
    serve();
}

void WsRpcSession::attempt(const std::string& url){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Connecting;
        active_url_ = url;
    }
    Logger::instance().debug("WebSocket connecting: " + url);
    channel_ = factory_();
    channel_->open(url, timeouts_.connect);

    json connect = {{"msg", "connect"}, {"version", "1"}, {"support", json::array({"1"})}};
    channel_->send_text(connect.dump());
    set_state(SessionState::HandshakeSent);

    json msg;
    auto deadline = std::chrono::steady_clock::now() + timeouts_.connect;
    for(;;){
        if(!await_message(deadline, msg)) throw CollectorError(ErrorKind::Timeout, "WebSocket handshake timeout for " + url);
        std::string kind = message_kind(msg);
        if(kind == "connected") break;
        if(kind == "failed") throw CollectorError(ErrorKind::Connection, "Middleware refused protocol version at " + url);
    }

    set_state(SessionState::Authenticating);
    const long long auth_id = next_id();
    json auth = {{"id", auth_id}, {"msg", "method"}, {"method", "auth.login_with_api_key"}, {"params", json::array({api_key_})}};
    channel_->send_text(auth.dump());

    deadline = std::chrono::steady_clock::now() + timeouts_.auth;
    for(;;){
        if(!await_message(deadline, msg)) throw CollectorError(ErrorKind::Timeout, "Authentication timeout for " + url);
        if(message_kind(msg) != "result" || !msg.contains("id") || msg["id"] != json(auth_id)) continue;
        if(msg.contains("error") && !msg["error"].is_null()){
            const json& err = msg["error"];
            throw CollectorError(ErrorKind::Authentication, "Authentication failed: " + (err.is_string() ? err.get<std::string>() : err.dump()));
        }
        // login_with_api_key answers false for an unknown key
        if(msg.contains("result") && msg["result"] == json(false))
            throw CollectorError(ErrorKind::Authentication, "Authentication failed: API key rejected");
        break;
    }
    set_state(SessionState::Authenticated);
}

bool WsRpcSession::await_message(Deadline deadline, json& msg){
    for(;;){
        if(stopping()) throw CollectorError(ErrorKind::Connection, "WebSocket closed");
        auto left = remaining(deadline);
        if(left.count() == 0) return false;
        ReadResult r = channel_->read(std::min(left, timeouts_.poll));
        if(r.status == ReadStatus::Closed) throw CollectorError(ErrorKind::Connection, "WebSocket closed by peer");
        if(r.status == ReadStatus::Timeout) continue;
        msg = json::parse(r.text, nullptr, false);
        if(msg.is_discarded() || !msg.is_object()){
            Logger::instance().debug("Ignoring malformed WebSocket message");
            continue;
        }
        return true;
    }
}

void WsRpcSession::serve(){
    std::string reason = "WebSocket closed";
    auto next_ping = std::chrono::steady_clock::now() + timeouts_.ping;
    try {
        while(!stopping()){
            flush_outbox();
            ReadResult r = channel_->read(timeouts_.poll);
            if(r.status == ReadStatus::Closed){
                reason = "WebSocket connection closed";
                Logger::instance().warn("WebSocket connection to " + active_url() + " closed");
                break;
            }
            if(r.status == ReadStatus::Message) dispatch(r.text);
            expire_calls();
            auto now = std::chrono::steady_clock::now();
            if(now >= next_ping){
                channel_->send_text(json{{"msg", "ping"}}.dump());
                next_ping = now + timeouts_.ping;
            }
        }
    } catch(const CollectorError& e){
        reason = e.what();
        Logger::instance().error(std::string("WebSocket session error: ") + e.what());
    }
    set_state(SessionState::Closed);
    if(channel_){ channel_->close(); channel_.reset(); }
    fail_all("WebSocket closed while request was queued", reason);
}

void WsRpcSession::flush_outbox(){
    std::deque<Call> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(outbox_);
    }
    while(!pending.empty()){
        const long long id = pending.front().id;
        json envelope = {{"id", id}, {"msg", "method"}, {"method", pending.front().method}, {"params", pending.front().params}};
        pending.front().deadline = std::chrono::steady_clock::now() + timeouts_.request;
        Logger::instance().trace("WebSocket call " + pending.front().method + " (" + std::to_string(id) + ")");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inflight_.emplace(id, std::move(pending.front()));
        }
        pending.pop_front();
        try {
            channel_->send_text(envelope.dump());
        } catch(const CollectorError&){
            std::lock_guard<std::mutex> lock(mutex_);
            while(!pending.empty()){ outbox_.push_front(std::move(pending.back())); pending.pop_back(); }
            throw;
        }
    }
}

void WsRpcSession::dispatch(const std::string& text){
    json msg = json::parse(text, nullptr, false);
    if(msg.is_discarded() || !msg.is_object()) return;
    if(message_kind(msg) != "result" || !msg.contains("id") || !msg["id"].is_number_integer()) return;
    const long long id = msg["id"].get<long long>();
    std::optional<Call> call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = inflight_.find(id);
        if(it == inflight_.end()) return;
        call.emplace(std::move(it->second));
        inflight_.erase(it);
    }
    if(msg.contains("error") && !msg["error"].is_null())
        call->promise.set_exception(std::make_exception_ptr(RpcError(msg["error"])));
    else
        call->promise.set_value(msg.contains("result") ? msg["result"] : json());
}

void WsRpcSession::expire_calls(){
    auto now = std::chrono::steady_clock::now();
    std::vector<Call> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for(auto it = inflight_.begin(); it != inflight_.end();){
            if(it->second.deadline <= now){ expired.push_back(std::move(it->second)); it = inflight_.erase(it); }
            else ++it;
        }
    }
    for(auto& c : expired)
        c.promise.set_exception(std::make_exception_ptr(CollectorError(ErrorKind::Timeout, "Request timeout for method " + c.method)));
}

void WsRpcSession::fail_all(const std::string& queued_reason, const std::string& inflight_reason){
    std::deque<Call> queued;
    std::map<long long, Call> inflight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queued.swap(outbox_);
        inflight.swap(inflight_);
    }
    for(auto& c : queued) c.promise.set_exception(connection_error(queued_reason));
    for(auto& kv : inflight) kv.second.promise.set_exception(connection_error(inflight_reason));
}

}
