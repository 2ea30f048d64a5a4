// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "sync/types.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace offsync {
namespace sync {

// Abstract remote endpoint for the sync protocol
// Allows dependency injection of different implementations:
// - HttpTransport: JSON over HTTP/1.1 via Boost.Beast
// - MockSyncTransport: scripted responses for testing (in test/infra)

/**
 * Error raised by a SyncTransport. Carries the error class and the HTTP
 * status (0 when no response was received).
 */
class TransportError : public std::runtime_error {
public:
  TransportError(SyncErrorKind kind, int http_status, const std::string &what)
      : std::runtime_error(what), kind_(kind), http_status_(http_status) {}

  SyncErrorKind kind() const { return kind_; }
  int http_status() const { return http_status_; }

  SyncError ToSyncError() const { return SyncError{kind_, http_status_, what()}; }

private:
  SyncErrorKind kind_;
  int http_status_;
};

/**
 * Map an HTTP status to an error class:
 * 401 -> Unauthorized; 408, 429, 5xx -> TransientNetwork;
 * other 4xx -> ServerRejected
 */
SyncErrorKind ClassifyHttpStatus(int status);

struct PullResponse {
  ChangeSetMap changes;
  int64_t timestamp{0};
  // Batched pulls only
  bool has_more{false};
  std::map<std::string, int64_t> next_skip;  // collection -> records to skip
};

/**
 * One page of a batched pull
 */
struct PullPage {
  size_t batch_size{500};
  std::map<std::string, int64_t> skip;  // collection -> records already received
};

class SyncTransport {
public:
  virtual ~SyncTransport() = default;

  // POST /api/sync/pull
  virtual PullResponse Pull(SyncCursor last_pulled_at) = 0;

  // POST /api/sync/pull/batched
  virtual PullResponse PullBatch(SyncCursor last_pulled_at, const PullPage &page) = 0;

  // POST /api/sync/push. Returns normally only if the server acknowledged.
  virtual void Push(const ChangeSetMap &changes, int64_t last_pulled_at) = 0;

  // Generic authenticated JSON POST for job handlers
  virtual nlohmann::json PostJson(const std::string &path, const nlohmann::json &body) = 0;
};

} // namespace sync
} // namespace offsync
