// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "sync/transport.hpp"

namespace offsync {
namespace sync {

SyncErrorKind ClassifyHttpStatus(int status) {
  if (status == 401) {
    return SyncErrorKind::Unauthorized;
  }
  // Request timeout and rate limiting are worth retrying
  if (status == 408 || status == 429) {
    return SyncErrorKind::TransientNetwork;
  }
  if (status >= 400 && status < 500) {
    return SyncErrorKind::ServerRejected;
  }
  return SyncErrorKind::TransientNetwork;
}

} // namespace sync
} // namespace offsync
