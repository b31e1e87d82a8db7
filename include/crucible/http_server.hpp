/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file http_server.hpp
 * @brief Minimal HTTP/1.1 server over RAII POSIX sockets.
 *
 * One accept thread polls the listener and serves each connection to
 * completion (one request per connection, "Connection: close"). Request
 * parsing is exposed as ParseHttpRequest() so it can be tested without a
 * socket.
 *
 * Only what the dispatcher API needs is supported: request line, headers,
 * Content-Length bodies. No chunked encoding, no keep-alive, no TLS.
 */

#ifndef CRUCIBLE_HTTP_SERVER_HPP_
#define CRUCIBLE_HTTP_SERVER_HPP_

#include "crucible/log.hpp"
#include "crucible/platform.hpp"
#include "crucible/vocabulary.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <utility>

namespace crucible {

constexpr int32_t kDefaultBacklog = 128;

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kBindFailed,
  kListenFailed,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kAlreadyRunning,
  kWouldBlock,  ///< EAGAIN/EWOULDBLOCK, caller may retry.
};

// ============================================================================
// SocketAddress
// ============================================================================

class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /**
   * @brief IPv4 address from dotted-decimal text and a host-order port.
   * @return kInvalidAddress if @p ip does not parse.
   */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief RAII connected TCP stream. Movable, not copyable.
 */
class TcpSocket {
 public:
  TcpSocket() noexcept : fd_(-1) {}

  ~TcpSocket() { Close(); }

  TcpSocket(TcpSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  TcpSocket& operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;

  static expected<TcpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(fd));
  }

  expected<void, SocketError> Connect(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::connect(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kSendFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<int32_t, SocketError> Send(const void* data, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::send(fd_, data, len, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      return expected<int32_t, SocketError>::error(SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  /** @brief Send the whole buffer, retrying short writes. */
  expected<void, SocketError> SendAll(const std::string& data) noexcept {
    size_t off = 0;
    while (off < data.size()) {
      auto r = Send(data.data() + off, data.size() - off);
      if (!r.has_value()) {
        if (r.get_error() == SocketError::kWouldBlock) continue;
        return expected<void, SocketError>::error(r.get_error());
      }
      off += static_cast<size_t>(r.value());
    }
    return expected<void, SocketError>::success();
  }

  /** @return Bytes read; 0 means the peer closed. */
  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    ssize_t n;
    do {
      n = ::recv(fd_, buf, len, 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      return expected<int32_t, SocketError>::error(SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<void, SocketError> SetRecvTimeout(uint32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_ms / 1000U);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000U) * 1000U);
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv,
                     static_cast<socklen_t>(sizeof(tv))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /** @brief Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  friend class TcpListener;

  explicit TcpSocket(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

// ============================================================================
// TcpListener
// ============================================================================

class TcpListener {
 public:
  TcpListener() noexcept : fd_(-1) {}

  ~TcpListener() { Close(); }

  TcpListener(TcpListener&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  TcpListener& operator=(TcpListener&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  static expected<TcpListener, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpListener, SocketError>::success(TcpListener(fd));
  }

  expected<void, SocketError> SetReuseAddr(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t opt = enable ? 1 : 0;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt,
                     static_cast<socklen_t>(sizeof(opt))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kBindFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> Listen(int32_t backlog = kDefaultBacklog) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::listen(fd_, backlog) < 0) {
      return expected<void, SocketError>::error(SocketError::kListenFailed);
    }
    return expected<void, SocketError>::success();
  }

  /**
   * @brief Wait up to @p timeout_ms for a connection.
   * @return kWouldBlock if none arrived in time.
   */
  expected<TcpSocket, SocketError> Accept(int32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready == 0 || (ready < 0 && errno == EINTR)) {
      return expected<TcpSocket, SocketError>::error(SocketError::kWouldBlock);
    }
    if (ready < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kAcceptFailed);
    }
    int32_t client_fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(client_fd));
  }

  /** @brief Port actually bound (useful after binding port 0). */
  uint16_t LocalPort() const noexcept {
    SocketAddress sa;
    socklen_t len = sa.Size();
    if (fd_ < 0 || ::getsockname(fd_, sa.RawMut(), &len) != 0) return 0;
    return sa.Port();
  }

  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  explicit TcpListener(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

// ============================================================================
// HTTP Messages
// ============================================================================

struct HttpRequest {
  std::string method;
  std::string path;   ///< Without the query string.
  std::string query;  ///< Text after '?', undecoded.
  std::map<std::string, std::string> headers;  ///< Lower-cased names.
  std::string body;

  const char* Header(const char* name) const {
    auto it = headers.find(name);
    return (it != headers.end()) ? it->second.c_str() : nullptr;
  }
};

struct HttpResponse {
  int32_t status = 200;
  std::string content_type = "application/json";
  std::string body;
};

inline const char* HttpStatusText(int32_t status) noexcept {
  switch (status) {
    case 200:
      return "OK";
    case 202:
      return "Accepted";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 409:
      return "Conflict";
    case 413:
      return "Payload Too Large";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

inline std::string SerializeResponse(const HttpResponse& rsp) {
  char head[256];
  const int n = std::snprintf(
      head, sizeof(head),
      "HTTP/1.1 %d %s\r\nContent-Type: %s\r\nContent-Length: %zu\r\n"
      "Connection: close\r\n\r\n",
      rsp.status, HttpStatusText(rsp.status), rsp.content_type.c_str(),
      rsp.body.size());
  std::string out(head, (n > 0) ? static_cast<size_t>(n) : 0U);
  out += rsp.body;
  return out;
}

enum class HttpParseResult : uint8_t {
  kComplete = 0,
  kIncomplete,
  kMalformed,
  kTooLarge,
};

/**
 * @brief Parse one request from @p raw.
 *
 * Returns kIncomplete until the header block and the Content-Length body
 * are fully present.
 */
inline HttpParseResult ParseHttpRequest(const std::string& raw,
                                        size_t max_body_bytes,
                                        HttpRequest& out) {
  const size_t head_end = raw.find("\r\n\r\n");
  if (head_end == std::string::npos) {
    return (raw.size() > 16384U) ? HttpParseResult::kTooLarge
                                 : HttpParseResult::kIncomplete;
  }

  const size_t line_end = raw.find("\r\n");
  const std::string line = raw.substr(0, line_end);
  const size_t sp1 = line.find(' ');
  const size_t sp2 = (sp1 == std::string::npos) ? std::string::npos
                                                : line.find(' ', sp1 + 1);
  if (sp1 == std::string::npos || sp2 == std::string::npos || sp1 == 0) {
    return HttpParseResult::kMalformed;
  }
  if (line.compare(sp2 + 1, 5, "HTTP/") != 0) return HttpParseResult::kMalformed;

  out = HttpRequest{};
  out.method = line.substr(0, sp1);
  std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
  if (target.empty() || target[0] != '/') return HttpParseResult::kMalformed;
  const size_t q = target.find('?');
  if (q != std::string::npos) {
    out.query = target.substr(q + 1);
    target.resize(q);
  }
  out.path = target;

  size_t pos = line_end + 2;
  while (pos < head_end) {
    size_t eol = raw.find("\r\n", pos);
    if (eol == std::string::npos || eol > head_end) eol = head_end;
    const std::string h = raw.substr(pos, eol - pos);
    pos = eol + 2;
    const size_t colon = h.find(':');
    if (colon == std::string::npos || colon == 0) {
      return HttpParseResult::kMalformed;
    }
    std::string name = h.substr(0, colon);
    for (char& c : name) {
      if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 32);
    }
    size_t vstart = colon + 1;
    while (vstart < h.size() && (h[vstart] == ' ' || h[vstart] == '\t')) {
      ++vstart;
    }
    size_t vend = h.size();
    while (vend > vstart && (h[vend - 1] == ' ' || h[vend - 1] == '\t')) --vend;
    out.headers[name] = h.substr(vstart, vend - vstart);
  }

  size_t content_length = 0;
  const char* cl = out.Header("content-length");
  if (cl != nullptr) {
    char* end = nullptr;
    const unsigned long long v = std::strtoull(cl, &end, 10);
    if (end == cl || *end != '\0') return HttpParseResult::kMalformed;
    if (v > max_body_bytes) return HttpParseResult::kTooLarge;
    content_length = static_cast<size_t>(v);
  }
  const size_t body_start = head_end + 4;
  if (raw.size() < body_start + content_length) {
    return HttpParseResult::kIncomplete;
  }
  out.body = raw.substr(body_start, content_length);
  return HttpParseResult::kComplete;
}

// ============================================================================
// HttpServer
// ============================================================================

struct HttpServerConfig {
  std::string bind = "127.0.0.1";
  uint16_t port = 8081;  ///< 0 picks an ephemeral port.
  size_t max_body_bytes = 2U * 1024U * 1024U;
  uint32_t recv_timeout_ms = 5000;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Accept-loop HTTP server.
 *
 * @code
 *   crucible::HttpServer server(cfg, [&api](const HttpRequest& r) {
 *     return api.Handle(r);
 *   });
 *   server.Start();
 * @endcode
 */
class HttpServer final {
 public:
  HttpServer(const HttpServerConfig& cfg, HttpHandler handler)
      : cfg_(cfg), handler_(std::move(handler)) {}

  ~HttpServer() { Stop(); }

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  expected<void, SocketError> Start() {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, SocketError>::error(SocketError::kAlreadyRunning);
    }
    auto addr = SocketAddress::FromIpv4(cfg_.bind.c_str(), cfg_.port);
    if (!addr) return expected<void, SocketError>::error(addr.get_error());
    auto listener = TcpListener::Create();
    if (!listener) return expected<void, SocketError>::error(listener.get_error());

    TcpListener l = std::move(listener.value());
    auto r = l.SetReuseAddr(true);
    if (!r) return r;
    r = l.Bind(addr.value());
    if (!r) {
      CRUCIBLE_LOG_ERROR("Http", "bind %s:%u failed: %s", cfg_.bind.c_str(),
                         cfg_.port, std::strerror(errno));
      return r;
    }
    r = l.Listen();
    if (!r) return r;

    listener_ = std::move(l);
    port_ = listener_.LocalPort();
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&HttpServer::AcceptLoop, this);
    CRUCIBLE_LOG_INFO("Http", "listening on %s:%u", cfg_.bind.c_str(), port_);
    return expected<void, SocketError>::success();
  }

  void Stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) thread_.join();
    listener_.Close();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint16_t Port() const noexcept { return port_; }

  uint64_t RequestCount() const noexcept {
    return requests_.load(std::memory_order_relaxed);
  }

 private:
  void AcceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
      auto conn = listener_.Accept(100);
      if (!conn) {
        if (conn.get_error() != SocketError::kWouldBlock) {
          CRUCIBLE_LOG_WARN("Http", "accept failed: %s", std::strerror(errno));
        }
        continue;
      }
      Serve(conn.value());
    }
  }

  void Serve(TcpSocket& sock) {
    (void)sock.SetRecvTimeout(cfg_.recv_timeout_ms);
    std::string raw;
    HttpRequest req;
    HttpResponse rsp;
    char buf[4096];
    HttpParseResult pr = HttpParseResult::kIncomplete;
    while (pr == HttpParseResult::kIncomplete) {
      auto n = sock.Recv(buf, sizeof(buf));
      if (!n || n.value() == 0) {
        CRUCIBLE_LOG_DEBUG("Http", "connection closed before full request");
        return;
      }
      raw.append(buf, static_cast<size_t>(n.value()));
      pr = ParseHttpRequest(raw, cfg_.max_body_bytes, req);
    }

    requests_.fetch_add(1, std::memory_order_relaxed);
    if (pr == HttpParseResult::kMalformed) {
      rsp.status = 400;
      rsp.body = "{\"error\":\"malformed request\"}";
    } else if (pr == HttpParseResult::kTooLarge) {
      rsp.status = 413;
      rsp.body = "{\"error\":\"request too large\"}";
    } else {
      rsp = handler_(req);
      CRUCIBLE_LOG_DEBUG("Http", "%s %s -> %d", req.method.c_str(),
                         req.path.c_str(), rsp.status);
    }
    auto sent = sock.SendAll(SerializeResponse(rsp));
    if (!sent) {
      CRUCIBLE_LOG_DEBUG("Http", "response send failed");
    }
  }

  HttpServerConfig cfg_;
  HttpHandler handler_;
  TcpListener listener_;
  uint16_t port_ = 0;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> requests_{0};
  std::thread thread_;
};

}  // namespace crucible

#endif  // CRUCIBLE_HTTP_SERVER_HPP_
