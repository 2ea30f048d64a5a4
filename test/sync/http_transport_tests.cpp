// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "sync/http_transport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <catch2/catch.hpp>
#include <mutex>
#include <thread>

using namespace offsync::sync;
using json = nlohmann::json;

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

// Serves exactly one HTTP request with a canned response
class OneShotServer {
public:
  OneShotServer(int status, std::string body)
      : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this, status, body = std::move(body)]() {
      beast::error_code ec;
      tcp::socket socket(io_);
      acceptor_.accept(socket, ec);
      if (ec) {
        return;
      }

      beast::flat_buffer buffer;
      http::request<http::string_body> req;
      http::read(socket, buffer, req, ec);
      if (ec) {
        return;
      }
      {
        std::lock_guard<std::mutex> lock(mutex_);
        target_ = std::string(req.target());
        authorization_ = std::string(req[http::field::authorization]);
        user_agent_ = std::string(req[http::field::user_agent]);
        request_body_ = req.body();
      }

      http::response<http::string_body> res{static_cast<http::status>(status), 11};
      res.set(http::field::content_type, "application/json");
      res.body() = body;
      res.prepare_payload();
      http::write(socket, res, ec);
      socket.shutdown(tcp::socket::shutdown_both, ec);
    });
  }

  ~OneShotServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  HttpTransport::Config Config() const {
    HttpTransport::Config config;
    config.host = "127.0.0.1";
    config.port = port_;
    config.timeout = std::chrono::seconds(5);
    return config;
  }

  std::string target() {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_;
  }
  std::string authorization() {
    std::lock_guard<std::mutex> lock(mutex_);
    return authorization_;
  }
  std::string user_agent() {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_agent_;
  }
  json request_body() {
    std::lock_guard<std::mutex> lock(mutex_);
    return json::parse(request_body_);
  }

  void Join() { thread_.join(); }

private:
  asio::io_context io_;
  tcp::acceptor acceptor_;
  uint16_t port_{0};
  std::thread thread_;

  std::mutex mutex_;
  std::string target_;
  std::string authorization_;
  std::string user_agent_;
  std::string request_body_;
};

HttpTransport::TokenProvider StaticToken(std::string token) {
  return [token]() -> std::optional<std::string> { return token; };
}

} // namespace

TEST_CASE("HttpTransport - pull", "[sync][http]") {
  OneShotServer server(200, R"({"changes": {"patients": {"created": [{"id": "p1"}],
                                                         "updated": [], "deleted": ["p0"]}},
                               "timestamp": 5000})");
  auto config = server.Config();
  config.base_path = "/v1";
  config.user_agent = "offsync/test";
  HttpTransport transport(config, StaticToken("secret"));

  PullResponse response = transport.Pull(int64_t{1234});
  server.Join();

  REQUIRE(response.timestamp == 5000);
  REQUIRE(response.changes["patients"].created.size() == 1);
  REQUIRE(response.changes["patients"].deleted == std::vector<RecordId>{"p0"});
  REQUIRE_FALSE(response.has_more);

  CHECK(server.target() == "/v1/api/sync/pull");
  CHECK(server.authorization() == "Bearer secret");
  CHECK(server.user_agent() == "offsync/test");
  CHECK(server.request_body()["last_pulled_at"] == 1234);
}

TEST_CASE("HttpTransport - first pull sends a null cursor without a token", "[sync][http]") {
  OneShotServer server(200, R"({"changes": {}, "timestamp": 1})");
  HttpTransport transport(server.Config(),
                          []() -> std::optional<std::string> { return std::nullopt; });

  transport.Pull(std::nullopt);
  server.Join();

  CHECK(server.request_body()["last_pulled_at"].is_null());
  CHECK(server.authorization().empty());
}

TEST_CASE("HttpTransport - batched pull", "[sync][http]") {
  OneShotServer server(200, R"({"changes": {}, "timestamp": 7000, "has_more": true,
                               "next_skip_patients": 500, "next_skip_notes": 20})");
  HttpTransport transport(server.Config());

  PullPage page;
  page.batch_size = 500;
  page.skip["patients"] = 0;
  PullResponse response = transport.PullBatch(std::nullopt, page);
  server.Join();

  CHECK(server.target() == "/api/sync/pull/batched?batch_size=500&skip_patients=0");
  REQUIRE(response.has_more);
  REQUIRE(response.next_skip.at("patients") == 500);
  REQUIRE(response.next_skip.at("notes") == 20);
}

TEST_CASE("HttpTransport - push", "[sync][http]") {
  OneShotServer server(200, "");
  HttpTransport transport(server.Config());

  ChangeSetMap changes;
  changes["patients"].updated.push_back(json{{"id", "p1"}, {"name", "Ada"}});
  REQUIRE_NOTHROW(transport.Push(changes, 5000));
  server.Join();

  CHECK(server.target() == "/api/sync/push");
  json body = server.request_body();
  CHECK(body["last_pulled_at"] == 5000);
  CHECK(body["changes"]["patients"]["updated"][0]["name"] == "Ada");
}

TEST_CASE("HttpTransport - HTTP errors are classified", "[sync][http]") {
  struct Case {
    int status;
    SyncErrorKind kind;
  };
  for (const Case &c : {Case{401, SyncErrorKind::Unauthorized},
                        Case{422, SyncErrorKind::ServerRejected},
                        Case{503, SyncErrorKind::TransientNetwork}}) {
    OneShotServer server(c.status, R"({"error": "nope"})");
    HttpTransport transport(server.Config());
    try {
      transport.Push(ChangeSetMap{}, 1);
      FAIL("Push should have thrown");
    } catch (const TransportError &e) {
      CHECK(e.kind() == c.kind);
      CHECK(e.http_status() == c.status);
    }
    server.Join();
  }
}

TEST_CASE("HttpTransport - bad response bodies", "[sync][http]") {
  SECTION("non-JSON body is transient") {
    OneShotServer server(200, "<html>captive portal</html>");
    HttpTransport transport(server.Config());
    try {
      transport.PostJson("/api/google-contacts/sync", json{{"incremental", true}});
      FAIL("PostJson should have thrown");
    } catch (const TransportError &e) {
      CHECK(e.kind() == SyncErrorKind::TransientNetwork);
    }
    server.Join();
  }

  SECTION("pull without timestamp is rejected") {
    OneShotServer server(200, R"({"changes": {}})");
    HttpTransport transport(server.Config());
    try {
      transport.Pull(int64_t{1});
      FAIL("Pull should have thrown");
    } catch (const TransportError &e) {
      CHECK(e.kind() == SyncErrorKind::ServerRejected);
    }
    server.Join();
  }
}

TEST_CASE("HttpTransport - network failures", "[sync][http]") {
  SECTION("connection refused") {
    uint16_t port = 0;
    {
      // Grab a free port, then release it
      asio::io_context io;
      tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
      port = acceptor.local_endpoint().port();
    }
    HttpTransport::Config config;
    config.host = "127.0.0.1";
    config.port = port;
    config.timeout = std::chrono::seconds(5);
    HttpTransport transport(config);

    try {
      transport.Pull(int64_t{1});
      FAIL("Pull should have thrown");
    } catch (const TransportError &e) {
      CHECK(e.kind() == SyncErrorKind::TransientNetwork);
      CHECK(e.http_status() == 0);
    }
  }

  SECTION("server that never answers times out") {
    // Listening but never accepting: connect succeeds via the backlog
    asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));

    HttpTransport::Config config;
    config.host = "127.0.0.1";
    config.port = acceptor.local_endpoint().port();
    config.timeout = std::chrono::milliseconds(200);
    HttpTransport transport(config);

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(transport.Push(ChangeSetMap{}, 1), TransportError);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
  }
}
