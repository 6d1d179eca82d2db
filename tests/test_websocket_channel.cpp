#include <gtest/gtest.h>
#include "../src/truenas/WebSocketChannel.h"
#include "../src/core/Errors.h"
#include "../src/core/Utils.h"
#include <functional>
#include <string>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace port_census {

using std::chrono::milliseconds;

TEST(WsUrlTest, ParsesSchemesAndDefaultPorts) {
    auto a = parse_ws_url("ws://127.0.0.1/websocket");
    ASSERT_TRUE(a.has_value());
    EXPECT_FALSE(a->secure);
    EXPECT_EQ(a->host, "127.0.0.1");
    EXPECT_EQ(a->port, 80);
    EXPECT_EQ(a->path, "/websocket");

    auto b = parse_ws_url("wss://nas.local");
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(b->secure);
    EXPECT_EQ(b->port, 443);
    EXPECT_EQ(b->path, "/");
}

TEST(WsUrlTest, ParsesExplicitPortAndIpv6Host) {
    auto a = parse_ws_url("wss://localhost:8443/websocket");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->port, 8443);

    auto b = parse_ws_url("ws://[fe80::1]:8080/api");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->host, "fe80::1");
    EXPECT_EQ(b->port, 8080);
    EXPECT_EQ(b->path, "/api");
}

TEST(WsUrlTest, RejectsMalformedUrls) {
    EXPECT_FALSE(parse_ws_url("http://host/websocket").has_value());
    EXPECT_FALSE(parse_ws_url("ws:///websocket").has_value());
    EXPECT_FALSE(parse_ws_url("ws://host:0/").has_value());
    EXPECT_FALSE(parse_ws_url("ws://host:70000/").has_value());
    EXPECT_FALSE(parse_ws_url("ws://host:abc/").has_value());
    EXPECT_FALSE(parse_ws_url("ws://[::1/").has_value());
}

TEST(WsFrameTest, AcceptKeyMatchesHandshakeExample) {
    EXPECT_EQ(ws::accept_key("dGhlIHNhbXBsZSBub25jZQ=="), "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST(WsFrameTest, Base64PadsShortInput) {
    const unsigned char in[] = {'f', 'o'};
    EXPECT_EQ(ws::base64(in, 2), "Zm8=");
    EXPECT_EQ(ws::base64(in, 0), "");
}

TEST(WsFrameTest, ClientFramesAreMasked) {
    const uint8_t mask[4] = {0x01, 0x02, 0x03, 0x04};
    std::string f = ws::encode_frame(ws::Opcode::Text, "hi", mask);
    ASSERT_EQ(f.size(), 8u);
    EXPECT_EQ(static_cast<uint8_t>(f[0]), 0x81);
    EXPECT_EQ(static_cast<uint8_t>(f[1]), 0x82);
    EXPECT_EQ(static_cast<uint8_t>(f[6]), static_cast<uint8_t>('h' ^ 0x01));
    EXPECT_EQ(static_cast<uint8_t>(f[7]), static_cast<uint8_t>('i' ^ 0x02));

    ws::Frame out;
    EXPECT_EQ(ws::decode_frame(f, out), f.size());
    EXPECT_EQ(out.opcode, ws::Opcode::Text);
    EXPECT_TRUE(out.fin);
    EXPECT_EQ(out.payload, "hi");
}

TEST(WsFrameTest, UsesExtendedLengthAbove125Bytes) {
    const uint8_t mask[4] = {0xAA, 0x00, 0x55, 0x11};
    std::string payload(300, 'x');
    std::string f = ws::encode_frame(ws::Opcode::Binary, payload, mask);
    EXPECT_EQ(static_cast<uint8_t>(f[1]), 0x80 | 126);
    EXPECT_EQ(static_cast<uint8_t>(f[2]), 0x01);
    EXPECT_EQ(static_cast<uint8_t>(f[3]), 0x2C);
    ws::Frame out;
    EXPECT_EQ(ws::decode_frame(f, out), 4 + 4 + 300u);
    EXPECT_EQ(out.payload, payload);
}

TEST(WsFrameTest, IncompleteBufferConsumesNothing) {
    const uint8_t mask[4] = {1, 2, 3, 4};
    std::string f = ws::encode_frame(ws::Opcode::Text, "{\"msg\":\"connected\"}", mask);
    ws::Frame out;
    EXPECT_EQ(ws::decode_frame(f.substr(0, 1), out), 0u);
    EXPECT_EQ(ws::decode_frame(f.substr(0, f.size() - 1), out), 0u);
}

TEST(WsFrameTest, DecodesUnmaskedServerFrameFollowedByAnother) {
    std::string buf = std::string("\x81\x02", 2) + "ok" + std::string("\x89\x00", 2);
    ws::Frame first;
    size_t used = ws::decode_frame(buf, first);
    EXPECT_EQ(used, 4u);
    EXPECT_EQ(first.payload, "ok");
    ws::Frame second;
    EXPECT_EQ(ws::decode_frame(buf.substr(used), second), 2u);
    EXPECT_EQ(second.opcode, ws::Opcode::Ping);
    EXPECT_TRUE(second.payload.empty());
}

TEST(WsFrameTest, ContinuationFrameKeepsFinBit) {
    std::string buf = std::string("\x01\x03", 2) + "abc";
    ws::Frame out;
    EXPECT_EQ(ws::decode_frame(buf, out), 5u);
    EXPECT_FALSE(out.fin);
    EXPECT_EQ(out.opcode, ws::Opcode::Text);
}

TEST(WsFrameTest, RejectsOversizedFrame) {
    std::string buf("\x82\x7F\x00\x00\x00\x01\x00\x00\x00\x00", 10);
    ws::Frame out;
    try {
        ws::decode_frame(buf, out);
        FAIL() << "expected CollectorError";
    } catch(const CollectorError& e){
        EXPECT_EQ(e.kind(), ErrorKind::Parse);
    }
}

// Single-connection TCP peer on 127.0.0.1 driven by a script running on its own thread.
class LoopbackServer {
public:
    using Script = std::function<void(int fd)>;

    LoopbackServer(){
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 1);
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~LoopbackServer(){
        if(thread_.joinable()) thread_.join();
        if(listen_fd_ >= 0) ::close(listen_fd_);
    }

    void serve(Script script){
        thread_ = std::thread([this, script]{
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if(fd < 0) return;
            timeval tv{2, 0};
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            script(fd);
            ::close(fd);
        });
    }
    void join(){ if(thread_.joinable()) thread_.join(); }
    int port() const { return port_; }
    std::string url() const { return "ws://127.0.0.1:" + std::to_string(port_) + "/websocket"; }

    static std::string read_head(int fd){
        std::string buf;
        char c[512];
        while(buf.find("\r\n\r\n") == std::string::npos){
            ssize_t n = ::recv(fd, c, sizeof(c), 0);
            if(n <= 0) break;
            buf.append(c, static_cast<size_t>(n));
        }
        return buf;
    }
    static std::string client_key(const std::string& head){
        for(const auto& line : utils::split_lines(head)){
            auto colon = line.find(':');
            if(colon != std::string::npos && utils::to_lower(line.substr(0, colon)) == "sec-websocket-key")
                return utils::trim(line.substr(colon + 1));
        }
        return "";
    }
    static void send_all(int fd, const std::string& data){ ::send(fd, data.data(), data.size(), MSG_NOSIGNAL); }
    // Reads client frames until a text frame arrives.
    static std::string read_text(int fd){
        std::string buf;
        char c[512];
        for(;;){
            ws::Frame f;
            size_t used = ws::decode_frame(buf, f);
            if(used > 0){
                buf.erase(0, used);
                if(f.opcode == ws::Opcode::Text) return f.payload;
                continue;
            }
            ssize_t n = ::recv(fd, c, sizeof(c), 0);
            if(n <= 0) return "";
            buf.append(c, static_cast<size_t>(n));
        }
    }

private:
    int listen_fd_ = -1;
    int port_ = 0;
    std::thread thread_;
};

std::string server_frame(uint8_t first_byte, const std::string& payload){
    std::string f;
    f.push_back(static_cast<char>(first_byte));
    f.push_back(static_cast<char>(payload.size()));
    return f + payload;
}

TEST(SocketWebSocketChannelTest, CompletesUpgradeAndExchangesMessages) {
    LoopbackServer server;
    std::string received;
    server.serve([&](int fd){
        std::string head = LoopbackServer::read_head(fd);
        std::string resp = "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
                           "Sec-WebSocket-Accept: " + ws::accept_key(LoopbackServer::client_key(head)) + "\r\n\r\n";
        // ping first; the channel answers it and delivers only the text message
        resp += server_frame(0x89, "");
        resp += server_frame(0x81, "{\"msg\":\"connected\"}");
        LoopbackServer::send_all(fd, resp);
        received = LoopbackServer::read_text(fd);
        LoopbackServer::send_all(fd, server_frame(0x88, std::string("\x03\xE8", 2)));
    });

    SocketWebSocketChannel channel;
    channel.open(server.url(), milliseconds(2000));
    auto first = channel.read(milliseconds(2000));
    EXPECT_EQ(first.status, ReadStatus::Message);
    EXPECT_EQ(first.text, "{\"msg\":\"connected\"}");

    channel.send_text("{\"msg\":\"ping\"}");
    auto closed = channel.read(milliseconds(2000));
    EXPECT_EQ(closed.status, ReadStatus::Closed);
    server.join();
    EXPECT_EQ(received, "{\"msg\":\"ping\"}");
    EXPECT_THROW(channel.send_text("late"), CollectorError);
}

TEST(SocketWebSocketChannelTest, ReassemblesFragmentedMessage) {
    LoopbackServer server;
    server.serve([&](int fd){
        std::string head = LoopbackServer::read_head(fd);
        std::string resp = "HTTP/1.1 101 Switching Protocols\r\nSec-WebSocket-Accept: " +
                           ws::accept_key(LoopbackServer::client_key(head)) + "\r\n\r\n";
        resp += server_frame(0x01, "{\"a\":");
        resp += server_frame(0x80, "1}");
        LoopbackServer::send_all(fd, resp);
        LoopbackServer::read_text(fd);
    });
    SocketWebSocketChannel channel;
    channel.open(server.url(), milliseconds(2000));
    auto r = channel.read(milliseconds(2000));
    EXPECT_EQ(r.status, ReadStatus::Message);
    EXPECT_EQ(r.text, "{\"a\":1}");
    channel.send_text("done");
    server.join();
    channel.close();
}

TEST(SocketWebSocketChannelTest, ReadTimesOutWithoutTraffic) {
    LoopbackServer server;
    server.serve([&](int fd){
        std::string head = LoopbackServer::read_head(fd);
        LoopbackServer::send_all(fd, "HTTP/1.1 101 Switching Protocols\r\nSec-WebSocket-Accept: " +
                                     ws::accept_key(LoopbackServer::client_key(head)) + "\r\n\r\n");
        LoopbackServer::read_text(fd);
    });
    SocketWebSocketChannel channel;
    channel.open(server.url(), milliseconds(2000));
    EXPECT_EQ(channel.read(milliseconds(50)).status, ReadStatus::Timeout);
    channel.send_text("bye");
    server.join();
}

TEST(SocketWebSocketChannelTest, RejectedUpgradeThrowsConnectionError) {
    LoopbackServer server;
    server.serve([&](int fd){
        LoopbackServer::read_head(fd);
        LoopbackServer::send_all(fd, "HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\n\r\n");
    });
    SocketWebSocketChannel channel;
    try {
        channel.open(server.url(), milliseconds(2000));
        FAIL() << "expected CollectorError";
    } catch(const CollectorError& e){
        EXPECT_EQ(e.kind(), ErrorKind::Connection);
        EXPECT_NE(std::string(e.what()).find("403"), std::string::npos);
    }
    EXPECT_EQ(channel.read(milliseconds(10)).status, ReadStatus::Closed);
}

TEST(SocketWebSocketChannelTest, WrongAcceptKeyIsRejected) {
    LoopbackServer server;
    server.serve([&](int fd){
        LoopbackServer::read_head(fd);
        LoopbackServer::send_all(fd, "HTTP/1.1 101 Switching Protocols\r\nSec-WebSocket-Accept: bogus\r\n\r\n");
    });
    SocketWebSocketChannel channel;
    EXPECT_THROW(channel.open(server.url(), milliseconds(2000)), CollectorError);
}

TEST(SocketWebSocketChannelTest, InvalidUrlThrows) {
    SocketWebSocketChannel channel;
    try {
        channel.open("http://127.0.0.1/websocket", milliseconds(100));
        FAIL() << "expected CollectorError";
    } catch(const CollectorError& e){
        EXPECT_EQ(e.kind(), ErrorKind::Connection);
    }
}

}
