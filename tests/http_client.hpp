/**
 * @file http_client.hpp
 * @brief Blocking one-shot HTTP client for server tests.
 */

#ifndef CRUCIBLE_TESTS_HTTP_CLIENT_HPP_
#define CRUCIBLE_TESTS_HTTP_CLIENT_HPP_

#include "crucible/http_server.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

namespace crucible_test {

struct ClientResponse {
  int32_t status = 0;
  std::string body;
};

/// Send @p raw to 127.0.0.1:@p port and read until the server closes.
inline ClientResponse SendRaw(uint16_t port, const std::string& raw) {
  ClientResponse out;
  auto addr = crucible::SocketAddress::FromIpv4("127.0.0.1", port);
  if (!addr) return out;
  auto sock = crucible::TcpSocket::Create();
  if (!sock) return out;
  crucible::TcpSocket s = std::move(sock.value());
  if (!s.Connect(addr.value())) return out;
  (void)s.SetRecvTimeout(5000);
  if (!s.SendAll(raw)) return out;

  std::string reply;
  char buf[4096];
  for (;;) {
    auto n = s.Recv(buf, sizeof(buf));
    if (!n || n.value() == 0) break;
    reply.append(buf, static_cast<size_t>(n.value()));
  }
  // "HTTP/1.1 200 OK\r\n..."
  if (reply.size() > 12U) out.status = std::atoi(reply.c_str() + 9);
  const size_t body = reply.find("\r\n\r\n");
  if (body != std::string::npos) out.body = reply.substr(body + 4);
  return out;
}

inline ClientResponse Request(uint16_t port, const std::string& method,
                              const std::string& target,
                              const std::string& body = std::string()) {
  std::string raw = method + " " + target + " HTTP/1.1\r\nHost: localhost\r\n";
  if (!body.empty()) {
    raw += "Content-Type: application/json\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\n";
  }
  raw += "\r\n" + body;
  return SendRaw(port, raw);
}

}  // namespace crucible_test

#endif  // CRUCIBLE_TESTS_HTTP_CLIENT_HPP_
