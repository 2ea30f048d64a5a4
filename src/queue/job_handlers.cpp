// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "queue/job_handlers.hpp"
#include "queue/offline_queue.hpp"
#include "sync/sync_client.hpp"
#include "sync/transport.hpp"
#include "util/logging.hpp"

namespace offsync {
namespace queue {

JobHandler MakeContactsImportHandler(sync::SyncTransport &transport) {
  return [&transport](const OfflineJob &job) -> JobResult {
    bool incremental = true;
    if (const auto *payload = std::get_if<ContactsImportPayload>(&job.payload)) {
      incremental = payload->incremental;
    }

    try {
      nlohmann::json response =
          transport.PostJson(kContactsImportPath, nlohmann::json{{"incremental", incremental}});
      LOG_QUEUE_INFO("Contacts import for job {} accepted (incremental={})", job.id, incremental);
      LOG_QUEUE_TRACE("Contacts import response: {}", response.dump());
      return JobResult::Ok();
    } catch (const sync::TransportError &e) {
      std::string error = std::string(sync::SyncErrorKindName(e.kind())) + ": " + e.what();
      if (e.kind() == sync::SyncErrorKind::Unauthorized) {
        // Retrying cannot help until the user signs in again
        return JobResult::Terminal(error);
      }
      return JobResult::Fail(error);
    }
  };
}

JobHandler MakeRecordSyncHandler(sync::SyncClient &client, OfflineQueue &queue) {
  return [&client, &queue](const OfflineJob &job) -> JobResult {
    if (const auto *payload = std::get_if<RecordSyncPayload>(&job.payload)) {
      LOG_QUEUE_DEBUG("Record sync job {} for collection {}", job.id, payload->collection);
    }

    sync::SyncRound round = client.RunSyncRound();
    // Picked up by the next drain
    for (const auto &request : round.deferred_jobs) {
      queue.Enqueue(request.type, request.payload, request.max_attempts);
    }

    if (round.ok()) {
      return JobResult::Ok();
    }
    std::string error = sync::SyncOutcomeName(round.outcome);
    if (round.error) {
      error += ": " + round.error->message;
    }
    if (round.outcome == sync::SyncOutcome::AuthFailure) {
      return JobResult::Terminal(error);
    }
    return JobResult::Fail(error);
  };
}

} // namespace queue
} // namespace offsync
