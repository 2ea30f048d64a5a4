// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "sync/transport.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace offsync {
namespace sync {

/**
 * HttpTransport - SyncTransport speaking JSON over HTTP/1.1 (Boost.Beast)
 *
 * Each request runs to completion on a private io_context owned by the
 * calling thread, so the transport can be used from the sync worker without
 * touching the scheduler's reactor. Every request is bounded by
 * Config::timeout; an expired request is a TransientNetwork error.
 *
 * A fresh bearer token is fetched from the TokenProvider for every request.
 */
class HttpTransport : public SyncTransport {
public:
  // Returns the current access token, or std::nullopt when signed out
  using TokenProvider = std::function<std::optional<std::string>()>;

  struct Config {
    std::string host{"127.0.0.1"};
    uint16_t port{8000};
    std::string base_path;  // Prefix for every target, e.g. "/v1"
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    std::string user_agent{"offsync"};
  };

  explicit HttpTransport(Config config, TokenProvider token_provider = {});

  PullResponse Pull(SyncCursor last_pulled_at) override;
  PullResponse PullBatch(SyncCursor last_pulled_at, const PullPage &page) override;
  void Push(const ChangeSetMap &changes, int64_t last_pulled_at) override;
  nlohmann::json PostJson(const std::string &path, const nlohmann::json &body) override;

  const Config &config() const { return config_; }

private:
  // Throws TransportError on network failure, timeout, non-2xx or bad JSON
  nlohmann::json Post(const std::string &target, const nlohmann::json &body);

  Config config_;
  TokenProvider token_provider_;
};

} // namespace sync
} // namespace offsync
