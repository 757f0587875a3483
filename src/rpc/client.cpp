// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/client.h"
#include "core/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <memory>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

namespace rpc {

namespace {

// ---------------------------------------------------------------------------
// RAII handles
// ---------------------------------------------------------------------------

class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { if (fd_ >= 0) ::close(fd_); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    [[nodiscard]] int fd() const { return fd_; }

private:
    int fd_;
};

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const { freeaddrinfo(ai); }
};
struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};
struct SslDeleter {
    void operator()(SSL* ssl) const { SSL_free(ssl); }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;
using SslCtxPtr   = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr      = std::unique_ptr<SSL, SslDeleter>;

bool is_timeout_errno(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINPROGRESS ||
           err == ETIMEDOUT;
}

core::Error transport_error(const std::string& what, int err) {
    if (is_timeout_errno(err)) {
        return core::Error(core::ErrorCode::NETWORK_TIMEOUT,
                           what + ": timed out");
    }
    std::string msg = what;
    if (err != 0) msg += std::string(": ") + std::strerror(err);
    return core::Error(core::ErrorCode::NETWORK_ERROR, msg);
}

std::string openssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

// ---------------------------------------------------------------------------
// Connection setup
// ---------------------------------------------------------------------------

core::Result<int> connect_tcp(const Url& url,
                              std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* raw = nullptr;
    std::string port_str = std::to_string(url.port);
    int rc = getaddrinfo(url.host.c_str(), port_str.c_str(), &hints, &raw);
    if (rc != 0) {
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "cannot resolve " + url.host + ": " +
                               gai_strerror(rc));
    }
    AddrInfoPtr result(raw);

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    int last_errno = 0;
    for (addrinfo* ai = result.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        // SO_SNDTIMEO also bounds connect() on Linux.
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            return fd;
        }
        last_errno = errno;
        ::close(fd);
    }
    return transport_error("cannot connect to " + url.host + ":" + port_str,
                           last_errno);
}

// ---------------------------------------------------------------------------
// Stream -- plain socket or TLS session over it
// ---------------------------------------------------------------------------

class Stream {
public:
    explicit Stream(int fd) : sock_(fd) {}

    core::Result<void> start_tls(const std::string& host) {
        ctx_.reset(SSL_CTX_new(TLS_client_method()));
        if (!ctx_) {
            return core::Error(core::ErrorCode::NETWORK_ERROR,
                               "SSL_CTX_new: " + openssl_error_string());
        }
        SSL_CTX_set_min_proto_version(ctx_.get(), TLS1_2_VERSION);
        SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ctx_.get()) != 1) {
            return core::Error(core::ErrorCode::NETWORK_ERROR,
                               "cannot load trust store: " +
                                   openssl_error_string());
        }

        ssl_.reset(SSL_new(ctx_.get()));
        if (!ssl_) {
            return core::Error(core::ErrorCode::NETWORK_ERROR,
                               "SSL_new: " + openssl_error_string());
        }
        SSL_set_fd(ssl_.get(), sock_.fd());
        SSL_set_tlsext_host_name(ssl_.get(), host.c_str());
        SSL_set1_host(ssl_.get(), host.c_str());

        if (SSL_connect(ssl_.get()) != 1) {
            int saved = errno;
            std::string detail = openssl_error_string();
            if (is_timeout_errno(saved)) {
                return transport_error("TLS handshake with " + host, saved);
            }
            return core::Error(core::ErrorCode::NETWORK_ERROR,
                               "TLS handshake with " + host + " failed: " +
                                   detail);
        }
        return core::make_ok();
    }

    core::Result<void> write_all(std::string_view data) {
        size_t sent = 0;
        while (sent < data.size()) {
            int chunk = static_cast<int>(
                std::min<size_t>(data.size() - sent, 1 << 20));
            int n;
            if (ssl_) {
                n = SSL_write(ssl_.get(), data.data() + sent, chunk);
            } else {
                n = static_cast<int>(::send(sock_.fd(), data.data() + sent,
                                            static_cast<size_t>(chunk),
                                            MSG_NOSIGNAL));
            }
            if (n <= 0) return transport_error("send failed", errno);
            sent += static_cast<size_t>(n);
        }
        return core::make_ok();
    }

    /// Reads until the peer closes the connection.
    core::Result<std::string> read_all() {
        std::string out;
        char buf[4096];
        for (;;) {
            int n;
            if (ssl_) {
                n = SSL_read(ssl_.get(), buf, sizeof(buf));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_.get(), n);
                    if (err == SSL_ERROR_ZERO_RETURN) break;
                    // Peers commonly drop the socket without close_notify.
                    if (err == SSL_ERROR_SYSCALL && errno == 0) break;
                    if (err == SSL_ERROR_SYSCALL ||
                        err == SSL_ERROR_WANT_READ) {
                        return transport_error("recv failed", errno);
                    }
                    return core::Error(core::ErrorCode::NETWORK_ERROR,
                                       "TLS read failed: " +
                                           openssl_error_string());
                }
            } else {
                n = static_cast<int>(::recv(sock_.fd(), buf, sizeof(buf), 0));
                if (n == 0) break;
                if (n < 0) return transport_error("recv failed", errno);
            }
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

private:
    Socket    sock_;
    SslCtxPtr ctx_;
    SslPtr    ssl_;
};

// ---------------------------------------------------------------------------
// HTTP helpers
// ---------------------------------------------------------------------------

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' ||
                           sv.back() == '\r')) {
        sv.remove_suffix(1);
    }
    return sv;
}

core::Error bad_http(const std::string& what) {
    return core::Error(core::ErrorCode::NETWORK_ERROR,
                       "malformed HTTP response: " + what);
}

core::Result<std::string> decode_chunked(std::string_view data) {
    std::string out;
    for (;;) {
        auto eol = data.find("\r\n");
        if (eol == std::string_view::npos) return bad_http("truncated chunk");
        std::string_view size_line = data.substr(0, eol);
        auto semi = size_line.find(';');
        if (semi != std::string_view::npos) size_line = size_line.substr(0, semi);
        size_line = trim(size_line);

        size_t len = 0;
        auto [ptr, ec] = std::from_chars(
            size_line.data(), size_line.data() + size_line.size(), len, 16);
        if (ec != std::errc() || ptr != size_line.data() + size_line.size()) {
            return bad_http("invalid chunk size");
        }
        data.remove_prefix(eol + 2);
        if (len == 0) break;
        if (len > data.size() || data.size() - len < 2) {
            return bad_http("truncated chunk");
        }
        out.append(data.substr(0, len));
        data.remove_prefix(len + 2);
    }
    return out;
}

} // anonymous namespace

// ===========================================================================
// Url
// ===========================================================================

core::Result<Url> Url::parse(std::string_view text) {
    Url url;
    auto sep = text.find("://");
    if (sep == std::string_view::npos) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "missing scheme in URL: " + std::string(text));
    }
    std::string scheme(text.substr(0, sep));
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (scheme == "http") {
        url.port = 80;
    } else if (scheme == "https") {
        url.port = 443;
    } else {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "unsupported URL scheme: " + scheme);
    }
    url.scheme = scheme;

    std::string_view rest = text.substr(sep + 3);
    auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) url.path = std::string(rest.substr(slash));

    std::string_view port_part;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               "unterminated IPv6 literal in URL");
        }
        url.host = std::string(authority.substr(1, close - 1));
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                                   "unexpected text after host");
            }
            port_part = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        url.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) port_part = authority.substr(colon + 1);
    }

    if (url.host.empty()) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "missing host in URL: " + std::string(text));
    }
    if (!port_part.empty()) {
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(
            port_part.data(), port_part.data() + port_part.size(), port);
        if (ec != std::errc() || ptr != port_part.data() + port_part.size() ||
            port == 0 || port > 65535) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               "invalid port in URL: " + std::string(port_part));
        }
        url.port = static_cast<uint16_t>(port);
    }
    return url;
}

// ===========================================================================
// HTTP response parsing
// ===========================================================================

core::Result<HttpResponse> parse_http_response(std::string_view raw) {
    auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string_view::npos) {
        return bad_http("no header terminator");
    }
    std::string_view head = raw.substr(0, header_end);
    std::string_view body = raw.substr(header_end + 4);

    auto eol = head.find("\r\n");
    std::string_view status_line = head.substr(0, eol);
    if (status_line.substr(0, 5) != "HTTP/") return bad_http("bad status line");
    auto sp = status_line.find(' ');
    if (sp == std::string_view::npos || status_line.size() < sp + 4) {
        return bad_http("bad status line");
    }

    HttpResponse resp;
    std::string_view code = status_line.substr(sp + 1, 3);
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + 3, resp.status);
    if (ec != std::errc() || ptr != code.data() + 3) {
        return bad_http("bad status code");
    }

    bool chunked = false;
    bool have_length = false;
    size_t content_length = 0;

    std::string_view headers =
        (eol == std::string_view::npos) ? std::string_view{} : head.substr(eol + 2);
    while (!headers.empty()) {
        auto line_end = headers.find("\r\n");
        std::string_view line = headers.substr(0, line_end);
        headers = (line_end == std::string_view::npos)
                      ? std::string_view{}
                      : headers.substr(line_end + 2);

        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        std::string_view name = trim(line.substr(0, colon));
        std::string_view value = trim(line.substr(colon + 1));

        if (iequals(name, "Transfer-Encoding") && iequals(value, "chunked")) {
            chunked = true;
        } else if (iequals(name, "Content-Length")) {
            auto [p, e] = std::from_chars(value.data(),
                                          value.data() + value.size(),
                                          content_length);
            if (e != std::errc() || p != value.data() + value.size()) {
                return bad_http("invalid Content-Length");
            }
            have_length = true;
        }
    }

    if (chunked) {
        ZNS_TRY_ASSIGN(decoded, decode_chunked(body));
        resp.body = std::move(decoded);
    } else if (have_length) {
        if (body.size() < content_length) return bad_http("truncated body");
        resp.body = std::string(body.substr(0, content_length));
    } else {
        resp.body = std::string(body);
    }
    return resp;
}

// ===========================================================================
// RpcClient
// ===========================================================================

RpcClient::RpcClient(Url url, std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {}

core::Result<HttpResponse> RpcClient::post(const std::string& body) const {
    ZNS_TRY_ASSIGN(fd, connect_tcp(url_, timeout_));
    Stream stream(fd);

    if (url_.is_tls()) {
        ZNS_TRY_VOID(stream.start_tls(url_.host));
    }

    std::string host_header = url_.host;
    if (host_header.find(':') != std::string::npos) {
        host_header = "[" + host_header + "]";
    }
    bool default_port = (url_.is_tls() && url_.port == 443) ||
                        (!url_.is_tls() && url_.port == 80);
    if (!default_port) host_header += ":" + std::to_string(url_.port);

    std::string request =
        "POST " + url_.path + " HTTP/1.1\r\n"
        "Host: " + host_header + "\r\n"
        "Content-Type: application/json\r\n"
        "Accept: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Connection: close\r\n"
        "\r\n" + body;

    LOG_TRACE(core::LogCategory::NET,
              "POST " + url_.scheme + "://" + host_header + url_.path +
                  " (" + std::to_string(body.size()) + " bytes)");

    ZNS_TRY_VOID(stream.write_all(request));
    ZNS_TRY_ASSIGN(raw, stream.read_all());
    return parse_http_response(raw);
}

core::Result<JsonValue> RpcClient::call(const RpcRequest& request) const {
    std::string payload = request.serialize();
    LOG_DEBUG(core::LogCategory::RPC, "-> " + payload);

    ZNS_TRY_ASSIGN(http, post(payload));
    LOG_DEBUG(core::LogCategory::RPC,
              "<- HTTP " + std::to_string(http.status) + " " + http.body);

    if (http.status < 200 || http.status >= 300) {
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "HTTP status " + std::to_string(http.status) +
                               " from " + url_.host);
    }

    ZNS_TRY_ASSIGN(resp, RpcResponse::parse(http.body));
    return resp.into_result();
}

} // namespace rpc
