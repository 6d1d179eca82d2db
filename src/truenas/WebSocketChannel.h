#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct ssl_st;
struct ssl_ctx_st;

namespace port_census {

struct WsUrl {
    bool secure = false;
    std::string host;
    int port = 0;
    std::string path = "/";
};

// ws://host[:port]/path or wss://...; [v6] hosts are accepted.
std::optional<WsUrl> parse_ws_url(const std::string& url);

namespace ws {

enum class Opcode : uint8_t { Continuation = 0x0, Text = 0x1, Binary = 0x2, Close = 0x8, Ping = 0x9, Pong = 0xA };

struct Frame {
    bool fin = true;
    Opcode opcode = Opcode::Text;
    std::string payload;
};

std::string base64(const unsigned char* data, size_t len);
// Expected Sec-WebSocket-Accept for a given Sec-WebSocket-Key.
std::string accept_key(const std::string& client_key);
// Client frames are always masked.
std::string encode_frame(Opcode op, const std::string& payload, const uint8_t mask[4]);
// Decodes one frame from the front of buf. Returns the number of bytes consumed,
// 0 while the frame is still incomplete.
size_t decode_frame(const std::string& buf, Frame& out);

}

enum class ReadStatus { Message, Timeout, Closed };

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    std::string text;
};

// A single WebSocket connection carrying text messages.
class WebSocketChannel {
public:
    virtual ~WebSocketChannel() = default;
    // Connects and completes the HTTP upgrade. Throws CollectorError (Connection or Timeout).
    virtual void open(const std::string& url, std::chrono::milliseconds timeout) = 0;
    virtual void send_text(const std::string& payload) = 0;
    // Waits up to timeout for the next complete text message.
    virtual ReadResult read(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
};

using WebSocketChannelPtr = std::unique_ptr<WebSocketChannel>;
using ChannelFactory = std::function<WebSocketChannelPtr()>;

// POSIX TCP socket, OpenSSL for wss://. Peer certificates are not verified since the
// middleware serves a self-signed certificate by default.
class SocketWebSocketChannel : public WebSocketChannel {
public:
    SocketWebSocketChannel() = default;
    ~SocketWebSocketChannel() override;
    SocketWebSocketChannel(const SocketWebSocketChannel&) = delete;
    SocketWebSocketChannel& operator=(const SocketWebSocketChannel&) = delete;

    void open(const std::string& url, std::chrono::milliseconds timeout) override;
    void send_text(const std::string& payload) override;
    ReadResult read(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    enum class Fill { Data, Timeout, Eof };
    using Deadline = std::chrono::steady_clock::time_point;

    void connect_tcp(const WsUrl& u, Deadline deadline);
    void start_tls(const WsUrl& u, Deadline deadline);
    void upgrade(const WsUrl& u, Deadline deadline);
    void send_frame(ws::Opcode op, const std::string& payload);
    void write_all(const std::string& data);
    Fill fill(std::chrono::milliseconds timeout);
    void set_io_timeout(std::chrono::milliseconds timeout);
    void release();

    int fd_ = -1;
    ssl_ctx_st* ctx_ = nullptr;
    ssl_st* ssl_ = nullptr;
    bool open_ = false;
    std::string rx_;
    std::string fragments_;
};

}
