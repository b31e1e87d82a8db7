/**
 * @file test_http_server.cpp
 * @brief Tests for http_server.hpp
 */

#include "crucible/http_server.hpp"
#include "http_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using crucible::HttpParseResult;
using crucible::HttpRequest;

// ============================================================================
// ParseHttpRequest
// ============================================================================

TEST_CASE("ParseHttpRequest reads a GET", "[http]") {
  HttpRequest req;
  const std::string raw =
      "GET /status/abc?tail_lines=5 HTTP/1.1\r\nHost: x\r\n"
      "X-Trace:  t1  \r\n\r\n";
  REQUIRE(crucible::ParseHttpRequest(raw, 1024, req) ==
          HttpParseResult::kComplete);
  REQUIRE(req.method == "GET");
  REQUIRE(req.path == "/status/abc");
  REQUIRE(req.query == "tail_lines=5");
  REQUIRE(std::string(req.Header("host")) == "x");
  REQUIRE(std::string(req.Header("x-trace")) == "t1");
  REQUIRE(req.Header("missing") == nullptr);
  REQUIRE(req.body.empty());
}

TEST_CASE("ParseHttpRequest waits for the body", "[http]") {
  HttpRequest req;
  std::string raw =
      "POST /execute HTTP/1.1\r\nContent-Length: 10\r\n\r\n{\"a\":";
  REQUIRE(crucible::ParseHttpRequest(raw, 1024, req) ==
          HttpParseResult::kIncomplete);
  raw += "123}";
  REQUIRE(crucible::ParseHttpRequest(raw, 1024, req) ==
          HttpParseResult::kComplete);
  REQUIRE(req.body == "{\"a\":123}");

  REQUIRE(crucible::ParseHttpRequest("GET / HTTP/1.1\r\nHost:", 1024, req) ==
          HttpParseResult::kIncomplete);
}

TEST_CASE("ParseHttpRequest rejects malformed input", "[http]") {
  HttpRequest req;
  REQUIRE(crucible::ParseHttpRequest("GARBAGE\r\n\r\n", 1024, req) ==
          HttpParseResult::kMalformed);
  REQUIRE(crucible::ParseHttpRequest("GET nopath HTTP/1.1\r\n\r\n", 1024,
                                     req) == HttpParseResult::kMalformed);
  REQUIRE(crucible::ParseHttpRequest("GET / FTP/1.0\r\n\r\n", 1024, req) ==
          HttpParseResult::kMalformed);
  REQUIRE(crucible::ParseHttpRequest("GET / HTTP/1.1\r\nNoColon\r\n\r\n", 1024,
                                     req) == HttpParseResult::kMalformed);
  REQUIRE(crucible::ParseHttpRequest(
              "POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n", 1024, req) ==
          HttpParseResult::kMalformed);
}

TEST_CASE("ParseHttpRequest enforces size limits", "[http]") {
  HttpRequest req;
  REQUIRE(crucible::ParseHttpRequest(
              "POST / HTTP/1.1\r\nContent-Length: 4096\r\n\r\n", 1024, req) ==
          HttpParseResult::kTooLarge);
  const std::string endless = "GET / HTTP/1.1\r\nX: " + std::string(20000, 'a');
  REQUIRE(crucible::ParseHttpRequest(endless, 1024, req) ==
          HttpParseResult::kTooLarge);
}

TEST_CASE("SerializeResponse writes status line and length", "[http]") {
  crucible::HttpResponse rsp;
  rsp.status = 404;
  rsp.body = "{}";
  const std::string out = crucible::SerializeResponse(rsp);
  REQUIRE(out.find("HTTP/1.1 404 Not Found\r\n") == 0U);
  REQUIRE(out.find("Content-Length: 2\r\n") != std::string::npos);
  REQUIRE(out.find("Connection: close\r\n") != std::string::npos);
  REQUIRE(out.substr(out.size() - 2) == "{}");
}

// ============================================================================
// HttpServer
// ============================================================================

TEST_CASE("HttpServer serves requests on an ephemeral port", "[http]") {
  crucible::HttpServerConfig cfg;
  cfg.port = 0;
  crucible::HttpServer server(cfg, [](const HttpRequest& req) {
    crucible::HttpResponse rsp;
    rsp.status = (req.path == "/echo") ? 200 : 404;
    rsp.body = req.method + ":" + req.body;
    return rsp;
  });
  REQUIRE(server.Start().has_value());
  REQUIRE(server.IsRunning());
  REQUIRE(server.Port() != 0U);
  REQUIRE(server.Start().get_error() == crucible::SocketError::kAlreadyRunning);

  auto r = crucible_test::Request(server.Port(), "POST", "/echo", "hello");
  REQUIRE(r.status == 200);
  REQUIRE(r.body == "POST:hello");

  r = crucible_test::Request(server.Port(), "GET", "/other");
  REQUIRE(r.status == 404);

  r = crucible_test::SendRaw(server.Port(), "BROKEN\r\n\r\n");
  REQUIRE(r.status == 400);

  REQUIRE(server.RequestCount() == 3U);
  server.Stop();
  REQUIRE(!server.IsRunning());
}

TEST_CASE("HttpServer rejects an oversized body", "[http]") {
  crucible::HttpServerConfig cfg;
  cfg.port = 0;
  cfg.max_body_bytes = 8;
  crucible::HttpServer server(cfg, [](const HttpRequest&) {
    return crucible::HttpResponse{};
  });
  REQUIRE(server.Start().has_value());
  auto r = crucible_test::Request(server.Port(), "POST", "/x",
                                  "0123456789abcdef");
  REQUIRE(r.status == 413);
}

TEST_CASE("HttpServer reports a bad bind address", "[http]") {
  crucible::HttpServerConfig cfg;
  cfg.bind = "not-an-ip";
  crucible::HttpServer server(cfg, [](const HttpRequest&) {
    return crucible::HttpResponse{};
  });
  auto r = server.Start();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == crucible::SocketError::kInvalidAddress);
}
