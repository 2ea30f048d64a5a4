// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "sync/http_transport.hpp"
#include "util/logging.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace offsync {
namespace sync {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

namespace {

constexpr const char *kPullTarget = "/api/sync/pull";
constexpr const char *kPullBatchedTarget = "/api/sync/pull/batched";
constexpr const char *kPushTarget = "/api/sync/push";
constexpr const char *kNextSkipPrefix = "next_skip_";

json CursorToJson(SyncCursor cursor) {
  return cursor ? json(*cursor) : json(nullptr);
}

PullResponse ParsePullResponse(const json &body, const std::string &target) {
  if (!body.is_object() || !body.contains("timestamp") ||
      !body["timestamp"].is_number_integer()) {
    throw TransportError(SyncErrorKind::ServerRejected, 200,
                         target + ": response has no integer timestamp");
  }

  PullResponse response;
  response.timestamp = body["timestamp"].get<int64_t>();
  try {
    response.changes = ChangeSetMapFromJson(body.value("changes", json::object()));
  } catch (const std::invalid_argument &e) {
    throw TransportError(SyncErrorKind::ServerRejected, 200,
                         target + ": malformed changes: " + e.what());
  }

  auto has_more = body.find("has_more");
  if (has_more != body.end() && has_more->is_boolean()) {
    response.has_more = has_more->get<bool>();
  }

  const std::string prefix = kNextSkipPrefix;
  for (const auto &[key, value] : body.items()) {
    if (key.compare(0, prefix.size(), prefix) == 0 && value.is_number_integer()) {
      response.next_skip[key.substr(prefix.size())] = value.get<int64_t>();
    }
  }
  return response;
}

} // namespace

HttpTransport::HttpTransport(Config config, TokenProvider token_provider)
    : config_(std::move(config)), token_provider_(std::move(token_provider)) {}

PullResponse HttpTransport::Pull(SyncCursor last_pulled_at) {
  json body{{"last_pulled_at", CursorToJson(last_pulled_at)}, {"changes", json::object()}};
  return ParsePullResponse(Post(kPullTarget, body), kPullTarget);
}

PullResponse HttpTransport::PullBatch(SyncCursor last_pulled_at, const PullPage &page) {
  std::string target = std::string(kPullBatchedTarget) +
                       "?batch_size=" + std::to_string(page.batch_size);
  for (const auto &[collection, skip] : page.skip) {
    target += "&skip_" + collection + "=" + std::to_string(skip);
  }

  json body{{"last_pulled_at", CursorToJson(last_pulled_at)}, {"changes", json::object()}};
  return ParsePullResponse(Post(target, body), kPullBatchedTarget);
}

void HttpTransport::Push(const ChangeSetMap &changes, int64_t last_pulled_at) {
  json body{{"changes", ChangeSetMapToJson(changes)}, {"last_pulled_at", last_pulled_at}};
  Post(kPushTarget, body);
}

json HttpTransport::PostJson(const std::string &path, const json &body) {
  return Post(path, body);
}

json HttpTransport::Post(const std::string &target, const json &body) {
  asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::flat_buffer buffer;
  http::response<http::string_body> res;

  http::request<http::string_body> req{http::verb::post, config_.base_path + target, 11};
  req.set(http::field::host, config_.host);
  req.set(http::field::user_agent, config_.user_agent);
  req.set(http::field::content_type, "application/json");
  req.set(http::field::accept, "application/json");
  if (token_provider_) {
    auto token = token_provider_();
    if (token && !token->empty()) {
      req.set(http::field::authorization, "Bearer " + *token);
    }
  }
  req.body() = body.dump();
  req.prepare_payload();

  beast::error_code error;
  const char *failed_step = nullptr;
  auto fail = [&](beast::error_code ec, const char *step) {
    error = ec;
    failed_step = step;
  };

  resolver.async_resolve(
      config_.host, std::to_string(config_.port),
      [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec)
          return fail(ec, "resolve");
        stream.async_connect(results, [&](beast::error_code ec, tcp::endpoint) {
          if (ec)
            return fail(ec, "connect");
          http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
            if (ec)
              return fail(ec, "write");
            http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
              if (ec)
                return fail(ec, "read");
            });
          });
        });
      });

  ioc.run_for(config_.timeout);
  if (!ioc.stopped()) {
    // Deadline hit with work outstanding: abort and let the handlers unwind
    resolver.cancel();
    stream.close();
    ioc.run();
    LOG_NET_WARN("POST {} timed out after {}ms", target, config_.timeout.count());
    throw TransportError(SyncErrorKind::TransientNetwork, 0, "POST " + target + " timed out");
  }

  if (failed_step) {
    LOG_NET_DEBUG("POST {} failed at {}: {}", target, failed_step, error.message());
    throw TransportError(SyncErrorKind::TransientNetwork, 0,
                         "POST " + target + " failed at " + failed_step + ": " +
                             error.message());
  }

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  const int status = static_cast<int>(res.result_int());
  if (status < 200 || status >= 300) {
    LOG_NET_DEBUG("POST {} returned HTTP {}", target, status);
    throw TransportError(ClassifyHttpStatus(status), status,
                         "POST " + target + " returned HTTP " + std::to_string(status));
  }

  if (res.body().empty()) {
    return json::object();
  }

  json parsed = json::parse(res.body(), nullptr, false);
  if (parsed.is_discarded()) {
    // Captive portals answer 200 with HTML; try again later
    throw TransportError(SyncErrorKind::TransientNetwork, status,
                         "POST " + target + " returned a non-JSON body");
  }
  return parsed;
}

} // namespace sync
} // namespace offsync
