#include "WebSocketChannel.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <cerrno>
#include <cstring>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>

namespace port_census {

namespace {

constexpr const char* kWsGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr uint64_t kMaxFramePayload = 64ull * 1024 * 1024;
constexpr size_t kMaxUpgradeResponse = 16 * 1024;

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline){
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

std::string openssl_error(){
    char buf[256] = {0};
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return buf;
}

}

std::optional<WsUrl> parse_ws_url(const std::string& url){
    WsUrl u;
    std::string rest;
    if(utils::starts_with(url, "wss://")){ u.secure = true; rest = url.substr(6); }
    else if(utils::starts_with(url, "ws://")) rest = url.substr(5);
    else return std::nullopt;

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if(slash != std::string::npos) u.path = rest.substr(slash);

    std::string port_str;
    if(!authority.empty() && authority[0] == '['){
        auto close = authority.find(']');
        if(close == std::string::npos) return std::nullopt;
        u.host = authority.substr(1, close - 1);
        if(close + 1 < authority.size()){
            if(authority[close + 1] != ':') return std::nullopt;
            port_str = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if(colon != std::string::npos){ u.host = authority.substr(0, colon); port_str = authority.substr(colon + 1); }
        else u.host = authority;
    }
    if(u.host.empty()) return std::nullopt;
    if(port_str.empty()){ u.port = u.secure ? 443 : 80; return u; }
    auto p = utils::parse_int(port_str);
    if(!p || *p < 1 || *p > 65535) return std::nullopt;
    u.port = static_cast<int>(*p);
    return u;
}

namespace ws {

std::string base64(const unsigned char* data, size_t len){
    std::vector<unsigned char> out(4 * ((len + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), data, static_cast<int>(len));
    return std::string(out.begin(), out.begin() + (n > 0 ? n : 0));
}

std::string accept_key(const std::string& client_key){
    std::string in = client_key + kWsGuid;
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if(EVP_Digest(in.data(), in.size(), md, &md_len, EVP_sha1(), nullptr) != 1)
        throw CollectorError(ErrorKind::Connection, "SHA-1 digest failed: " + openssl_error());
    return base64(md, md_len);
}

std::string encode_frame(Opcode op, const std::string& payload, const uint8_t mask[4]){
    std::string f;
    const uint64_t len = payload.size();
    f.reserve(payload.size() + 14);
    f.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(op)));
    if(len < 126){
        f.push_back(static_cast<char>(0x80 | len));
    } else if(len <= 0xFFFF){
        f.push_back(static_cast<char>(0x80 | 126));
        f.push_back(static_cast<char>((len >> 8) & 0xFF));
        f.push_back(static_cast<char>(len & 0xFF));
    } else {
        f.push_back(static_cast<char>(0x80 | 127));
        for(int i = 7; i >= 0; --i) f.push_back(static_cast<char>((len >> (8 * i)) & 0xFF));
    }
    f.append(mask, mask + 4);
    for(size_t i = 0; i < payload.size(); ++i)
        f.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]));
    return f;
}

size_t decode_frame(const std::string& buf, Frame& out){
    auto b = [&](size_t i){ return static_cast<uint8_t>(buf[i]); };
    if(buf.size() < 2) return 0;
    const bool fin = (b(0) & 0x80) != 0;
    const auto opcode = static_cast<Opcode>(b(0) & 0x0F);
    const bool masked = (b(1) & 0x80) != 0;
    uint64_t len = b(1) & 0x7F;
    size_t pos = 2;
    if(len == 126){
        if(buf.size() < 4) return 0;
        len = (static_cast<uint64_t>(b(2)) << 8) | b(3);
        pos = 4;
    } else if(len == 127){
        if(buf.size() < 10) return 0;
        len = 0;
        for(size_t i = 0; i < 8; ++i) len = (len << 8) | b(2 + i);
        pos = 10;
    }
    if(len > kMaxFramePayload) throw CollectorError(ErrorKind::Parse, "WebSocket frame too large: " + std::to_string(len) + " bytes");
    uint8_t mask[4] = {0, 0, 0, 0};
    if(masked){
        if(buf.size() < pos + 4) return 0;
        for(size_t i = 0; i < 4; ++i) mask[i] = b(pos + i);
        pos += 4;
    }
    if(buf.size() - pos < len) return 0;
    out.fin = fin;
    out.opcode = opcode;
    out.payload.assign(buf, pos, static_cast<size_t>(len));
    if(masked)
        for(size_t i = 0; i < out.payload.size(); ++i)
            out.payload[i] = static_cast<char>(static_cast<uint8_t>(out.payload[i]) ^ mask[i % 4]);
    return pos + static_cast<size_t>(len);
}

}

SocketWebSocketChannel::~SocketWebSocketChannel(){ release(); }

void SocketWebSocketChannel::open(const std::string& url, std::chrono::milliseconds timeout){
    auto u = parse_ws_url(url);
    if(!u) throw CollectorError(ErrorKind::Connection, "Invalid WebSocket URL: " + url);
    release();
    auto deadline = std::chrono::steady_clock::now() + timeout;
    try {
        connect_tcp(*u, deadline);
        if(u->secure) start_tls(*u, deadline);
        upgrade(*u, deadline);
    } catch(const CollectorError&){
        release();
        throw;
    }
    open_ = true;
    Logger::instance().debug("WebSocket open: " + url);
}

void SocketWebSocketChannel::connect_tcp(const WsUrl& u, Deadline deadline){
    const std::string endpoint = u.host + ":" + std::to_string(u.port);
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(u.host.c_str(), std::to_string(u.port).c_str(), &hints, &res);
    if(rc != 0) throw CollectorError(ErrorKind::Connection, "Cannot resolve " + u.host + ": " + gai_strerror(rc));
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(res, freeaddrinfo);

    std::string last_error = "no usable address";
    for(addrinfo* ai = res; ai; ai = ai->ai_next){
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if(fd < 0){ last_error = std::strerror(errno); continue; }
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        int r = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if(r != 0 && errno == EINPROGRESS){
            pollfd p{fd, POLLOUT, 0};
            auto left = remaining(deadline);
            r = left.count() > 0 ? ::poll(&p, 1, static_cast<int>(left.count())) : 0;
            if(r == 0){
                ::close(fd);
                throw CollectorError(ErrorKind::Timeout, "Connection timeout to " + endpoint);
            }
            int err = 0;
            socklen_t len = sizeof(err);
            if(r < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0){
                last_error = std::strerror(err ? err : errno);
                ::close(fd);
                continue;
            }
            r = 0;
        }
        if(r != 0){ last_error = std::strerror(errno); ::close(fd); continue; }
        fcntl(fd, F_SETFL, flags);
        fd_ = fd;
        return;
    }
    throw CollectorError(ErrorKind::Connection, "Cannot connect to " + endpoint + ": " + last_error);
}

void SocketWebSocketChannel::start_tls(const WsUrl& u, Deadline deadline){
    ctx_ = SSL_CTX_new(TLS_client_method());
    if(!ctx_) throw CollectorError(ErrorKind::Connection, "Failed to create TLS context: " + openssl_error());
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
    ssl_ = SSL_new(ctx_);
    if(!ssl_) throw CollectorError(ErrorKind::Connection, "Failed to create TLS session: " + openssl_error());
    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, u.host.c_str());
    set_io_timeout(remaining(deadline));
    if(SSL_connect(ssl_) != 1)
        throw CollectorError(ErrorKind::Connection, "TLS handshake with " + u.host + " failed: " + openssl_error());
}

void SocketWebSocketChannel::upgrade(const WsUrl& u, Deadline deadline){
    unsigned char nonce[16];
    if(RAND_bytes(nonce, sizeof(nonce)) != 1)
        throw CollectorError(ErrorKind::Connection, "RAND_bytes failed: " + openssl_error());
    const std::string key = ws::base64(nonce, sizeof(nonce));
    std::string host = u.host.find(':') != std::string::npos ? "[" + u.host + "]" : u.host;

    std::ostringstream req;
    req << "GET " << u.path << " HTTP/1.1\r\n"
        << "Host: " << host << ":" << u.port << "\r\n"
        << "Upgrade: websocket\r\n"
        << "Connection: Upgrade\r\n"
        << "Sec-WebSocket-Key: " << key << "\r\n"
        << "Sec-WebSocket-Version: 13\r\n\r\n";
    set_io_timeout(remaining(deadline));
    write_all(req.str());

    size_t end;
    while((end = rx_.find("\r\n\r\n")) == std::string::npos){
        if(rx_.size() > kMaxUpgradeResponse) throw CollectorError(ErrorKind::Connection, "Oversized upgrade response from " + u.host);
        auto left = remaining(deadline);
        Fill f = left.count() > 0 ? fill(left) : Fill::Timeout;
        if(f == Fill::Eof) throw CollectorError(ErrorKind::Connection, "Connection closed during WebSocket handshake with " + u.host);
        if(f == Fill::Timeout && remaining(deadline).count() == 0)
            throw CollectorError(ErrorKind::Timeout, "WebSocket handshake timeout for " + u.host);
    }
    std::string head = rx_.substr(0, end);
    rx_.erase(0, end + 4);

    auto lines = utils::split_lines(head);
    if(lines.empty() || lines[0].find(" 101") == std::string::npos)
        throw CollectorError(ErrorKind::Connection, "WebSocket upgrade rejected: " + (lines.empty() ? std::string("empty response") : lines[0]));
    std::string accept;
    for(size_t i = 1; i < lines.size(); ++i){
        auto colon = lines[i].find(':');
        if(colon == std::string::npos) continue;
        if(utils::to_lower(utils::trim(lines[i].substr(0, colon))) == "sec-websocket-accept")
            accept = utils::trim(lines[i].substr(colon + 1));
    }
    if(accept != ws::accept_key(key))
        throw CollectorError(ErrorKind::Connection, "Invalid Sec-WebSocket-Accept from " + u.host);
}

void SocketWebSocketChannel::set_io_timeout(std::chrono::milliseconds timeout){
    if(fd_ < 0) return;
    if(timeout.count() <= 0) timeout = std::chrono::milliseconds(1);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void SocketWebSocketChannel::write_all(const std::string& data){
    size_t off = 0;
    while(off < data.size()){
        int n;
        if(ssl_) n = SSL_write(ssl_, data.data() + off, static_cast<int>(data.size() - off));
        else n = static_cast<int>(::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL));
        if(n <= 0){
            if(!ssl_ && n < 0 && errno == EINTR) continue;
            throw CollectorError(ErrorKind::Connection, std::string("WebSocket write failed: ") + (ssl_ ? openssl_error() : std::strerror(errno)));
        }
        off += static_cast<size_t>(n);
    }
}

SocketWebSocketChannel::Fill SocketWebSocketChannel::fill(std::chrono::milliseconds timeout){
    if(!(ssl_ && SSL_pending(ssl_) > 0)){
        pollfd p{fd_, POLLIN, 0};
        int r = ::poll(&p, 1, static_cast<int>(timeout.count()));
        if(r == 0) return Fill::Timeout;
        if(r < 0){
            if(errno == EINTR) return Fill::Timeout;
            throw CollectorError(ErrorKind::Connection, std::string("poll failed: ") + std::strerror(errno));
        }
    }
    char buf[8192];
    int n;
    if(ssl_){
        n = SSL_read(ssl_, buf, sizeof(buf));
        if(n <= 0){
            int e = SSL_get_error(ssl_, n);
            if(e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) return Fill::Timeout;
            if(e == SSL_ERROR_ZERO_RETURN) return Fill::Eof;
            if(e == SSL_ERROR_SYSCALL){
                if(errno == EAGAIN || errno == EWOULDBLOCK) return Fill::Timeout;
                return Fill::Eof;
            }
            throw CollectorError(ErrorKind::Connection, "TLS read failed: " + openssl_error());
        }
    } else {
        n = static_cast<int>(::recv(fd_, buf, sizeof(buf), 0));
        if(n == 0) return Fill::Eof;
        if(n < 0){
            if(errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return Fill::Timeout;
            throw CollectorError(ErrorKind::Connection, std::string("recv failed: ") + std::strerror(errno));
        }
    }
    rx_.append(buf, static_cast<size_t>(n));
    return Fill::Data;
}

void SocketWebSocketChannel::send_frame(ws::Opcode op, const std::string& payload){
    uint8_t mask[4];
    if(RAND_bytes(mask, sizeof(mask)) != 1)
        throw CollectorError(ErrorKind::Connection, "RAND_bytes failed: " + openssl_error());
    write_all(ws::encode_frame(op, payload, mask));
}

void SocketWebSocketChannel::send_text(const std::string& payload){
    if(!open_) throw CollectorError(ErrorKind::Connection, "WebSocket not connected");
    send_frame(ws::Opcode::Text, payload);
}

ReadResult SocketWebSocketChannel::read(std::chrono::milliseconds timeout){
    ReadResult result;
    if(!open_){ result.status = ReadStatus::Closed; return result; }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for(;;){
        ws::Frame frame;
        size_t used = ws::decode_frame(rx_, frame);
        if(used > 0){
            rx_.erase(0, used);
            switch(frame.opcode){
                case ws::Opcode::Text:
                case ws::Opcode::Binary:
                    fragments_ = std::move(frame.payload);
                    break;
                case ws::Opcode::Continuation:
                    fragments_ += frame.payload;
                    break;
                case ws::Opcode::Ping:
                    send_frame(ws::Opcode::Pong, frame.payload);
                    continue;
                case ws::Opcode::Pong:
                    continue;
                case ws::Opcode::Close:
                    Logger::instance().debug("WebSocket close frame received");
                    try { send_frame(ws::Opcode::Close, frame.payload.substr(0, 2)); }
                    catch(const CollectorError& e){ Logger::instance().debug(std::string("Close echo failed: ") + e.what()); }
                    release();
                    result.status = ReadStatus::Closed;
                    return result;
                default:
                    continue;
            }
            if(frame.fin){
                result.status = ReadStatus::Message;
                result.text.swap(fragments_);
                fragments_.clear();
                return result;
            }
            continue;
        }
        auto left = remaining(deadline);
        if(left.count() == 0) return result;
        set_io_timeout(left);
        if(fill(left) == Fill::Eof){
            release();
            result.status = ReadStatus::Closed;
            return result;
        }
    }
}

void SocketWebSocketChannel::close(){
    if(open_){
        // 1000 normal closure
        try { send_frame(ws::Opcode::Close, std::string("\x03\xE8", 2)); }
        catch(const CollectorError& e){ Logger::instance().debug(std::string("WebSocket close frame not sent: ") + e.what()); }
        if(ssl_) SSL_shutdown(ssl_);
    }
    release();
}

void SocketWebSocketChannel::release(){
    if(ssl_){ SSL_free(ssl_); ssl_ = nullptr; }
    if(ctx_){ SSL_CTX_free(ctx_); ctx_ = nullptr; }
    if(fd_ >= 0){ ::close(fd_); fd_ = -1; }
    open_ = false;
    rx_.clear();
    fragments_.clear();
}

}
