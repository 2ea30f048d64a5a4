// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "infra/memory_change_log.hpp"
#include "infra/mock_sync_transport.hpp"
#include "sync/sync_client.hpp"
#include <catch2/catch.hpp>

using namespace offsync;
using namespace offsync::sync;
using namespace offsync::test;

namespace {

ChangeSetMap OneCreated(const std::string &collection, const std::string &id) {
  ChangeSetMap changes;
  changes[collection].created.push_back(MakeRecord(id));
  return changes;
}

PullResponse Response(ChangeSetMap changes, int64_t timestamp, bool has_more = false) {
  PullResponse response;
  response.changes = std::move(changes);
  response.timestamp = timestamp;
  response.has_more = has_more;
  return response;
}

} // namespace

TEST_CASE("SyncClient - successful round", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient client(log, transport);

  log.SetCursor(1000);
  log.StageLocalChanges(OneCreated("patients", "local1"));
  transport.QueuePullResponse(Response(OneCreated("patients", "remote1"), 2000));

  SyncRound round = client.RunSyncRound();

  REQUIRE(round.outcome == SyncOutcome::Success);
  REQUIRE(round.cursor_used == int64_t{1000});
  REQUIRE(round.cursor_returned == int64_t{2000});
  REQUIRE(CountChanges(round.pulled) == 1);
  REQUIRE(CountChanges(round.pushed) == 1);
  REQUIRE(round.push_attempted);
  REQUIRE(round.local_changes_acknowledged);
  REQUIRE_FALSE(round.error.has_value());

  // Pull happened with the stored cursor, push carried the new one
  REQUIRE(transport.pull_cursors() == std::vector<SyncCursor>{int64_t{1000}});
  auto pushes = transport.push_calls();
  REQUIRE(pushes.size() == 1);
  REQUIRE(pushes[0].last_pulled_at == 2000);

  REQUIRE(log.cursor() == int64_t{2000});
  REQUIRE(log.applied().size() == 1);
  REQUIRE(log.CountPendingChanges() == 0);
}

TEST_CASE("SyncClient - nothing to push", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient client(log, transport);
  log.SetCursor(1000);
  transport.SetDefaultTimestamp(1500);

  SyncRound round = client.RunSyncRound();

  REQUIRE(round.ok());
  REQUIRE_FALSE(round.push_attempted);
  REQUIRE(round.local_changes_acknowledged);
  REQUIRE(transport.push_count() == 0);
  REQUIRE(log.cursor() == int64_t{1500});
}

TEST_CASE("SyncClient - pull failure degrades gracefully", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient client(log, transport);
  log.SetCursor(1000);
  log.StageLocalChanges(OneCreated("patients", "local1"));
  transport.QueuePullError(TransientError("timeout"));

  SyncRound round = client.RunSyncRound();

  REQUIRE(round.outcome == SyncOutcome::PartialPullFailure);
  REQUIRE(round.error.has_value());
  REQUIRE(round.error->kind == SyncErrorKind::TransientNetwork);
  REQUIRE(round.pulled.empty());
  // Cursor unchanged, push still went out with it
  REQUIRE(round.cursor_returned == int64_t{1000});
  REQUIRE(log.cursor() == int64_t{1000});
  REQUIRE(log.applied().empty());
  REQUIRE(round.push_attempted);
  REQUIRE(transport.push_calls().at(0).last_pulled_at == 1000);
  REQUIRE(round.local_changes_acknowledged);
}

TEST_CASE("SyncClient - server rejection on pull is partial", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient client(log, transport);
  log.SetCursor(1000);
  transport.QueuePullError(HttpError(400));

  SyncRound round = client.RunSyncRound();
  REQUIRE(round.outcome == SyncOutcome::PartialPullFailure);
  REQUIRE(round.error->http_status == 400);
  REQUIRE(round.error->kind == SyncErrorKind::ServerRejected);
}

TEST_CASE("SyncClient - unauthorized pull fails the round", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient client(log, transport);
  log.SetCursor(1000);
  log.StageLocalChanges(OneCreated("patients", "local1"));
  transport.QueuePullError(HttpError(401, "token expired"));

  SyncRound round = client.RunSyncRound();

  REQUIRE(round.outcome == SyncOutcome::AuthFailure);
  REQUIRE(round.error->kind == SyncErrorKind::Unauthorized);
  REQUIRE(transport.push_count() == 0);
  REQUIRE_FALSE(round.local_changes_acknowledged);
  REQUIRE(log.CountPendingChanges() == 1);
}

TEST_CASE("SyncClient - push failure keeps local changes", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient client(log, transport);
  log.SetCursor(1000);
  log.StageLocalChanges(OneCreated("patients", "local1"));

  SECTION("transient") {
    transport.QueuePushResult(TransientError());
    SyncRound round = client.RunSyncRound();
    REQUIRE(round.outcome == SyncOutcome::PushFailure);
    REQUIRE(round.push_attempted);
    REQUIRE_FALSE(round.local_changes_acknowledged);
    REQUIRE(round.pushed.empty());
    REQUIRE(log.CountPendingChanges() == 1);
  }

  SECTION("unauthorized") {
    transport.QueuePushResult(HttpError(401));
    SyncRound round = client.RunSyncRound();
    REQUIRE(round.outcome == SyncOutcome::AuthFailure);
    REQUIRE(log.CountPendingChanges() == 1);
  }

  SECTION("next round pushes again") {
    transport.QueuePushResult(HttpError(503));
    REQUIRE(client.RunSyncRound().outcome == SyncOutcome::PushFailure);
    REQUIRE(client.RunSyncRound().ok());
    REQUIRE(transport.push_count() == 2);
    REQUIRE(log.CountPendingChanges() == 0);
  }
}

TEST_CASE("SyncClient - storage failures", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient client(log, transport);
  log.SetCursor(1000);

  SECTION("apply failure keeps the old cursor") {
    log.set_fail_apply(true);
    transport.QueuePullResponse(Response(OneCreated("patients", "r1"), 2000));
    SyncRound round = client.RunSyncRound();
    REQUIRE(round.outcome == SyncOutcome::StorageFailure);
    REQUIRE(round.error->kind == SyncErrorKind::LocalStorage);
    REQUIRE(log.cursor() == int64_t{1000});
    REQUIRE(transport.push_count() == 0);
  }

  SECTION("cursor read failure") {
    log.set_fail_cursor(true);
    SyncRound round = client.RunSyncRound();
    REQUIRE(round.outcome == SyncOutcome::StorageFailure);
    REQUIRE(transport.pull_count() == 0);
  }

  SECTION("acknowledge failure after a successful push") {
    log.StageLocalChanges(OneCreated("patients", "local1"));
    log.set_fail_mark(true);
    SyncRound round = client.RunSyncRound();
    REQUIRE(round.outcome == SyncOutcome::StorageFailure);
    REQUIRE(transport.push_count() == 1);
    REQUIRE_FALSE(round.local_changes_acknowledged);
  }
}

TEST_CASE("SyncClient - first sync", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;

  SECTION("batched pull pages through the server") {
    SyncClient client(log, transport);

    PullResponse page1 = Response(OneCreated("patients", "p1"), 5000, true);
    page1.changes["patients"].deleted.push_back("gone");
    page1.next_skip["patients"] = 1;
    PullResponse page2 = Response(OneCreated("patients", "p2"), 5200, false);
    page2.changes["patients"].deleted.push_back("gone");
    transport.QueuePullResponse(page1);
    transport.QueuePullResponse(page2);

    SyncRound round = client.RunSyncRound();

    REQUIRE(round.ok());
    REQUIRE(transport.pull_count() == 0);
    REQUIRE(transport.batch_count() == 2);
    auto pages = transport.batch_pages();
    REQUIRE(pages[0].skip.empty());
    REQUIRE(pages[1].skip.at("patients") == 1);

    REQUIRE(round.pulled["patients"].created.size() == 2);
    // Deletions only taken from the first page
    REQUIRE(round.pulled["patients"].deleted.size() == 1);
    // Earliest page timestamp becomes the cursor
    REQUIRE(log.cursor() == int64_t{5000});
  }

  SECTION("single pull when batching is disabled") {
    SyncClient::Config config;
    config.batched_initial_pull = false;
    SyncClient client(log, transport, config);

    transport.QueuePullResponse(Response(OneCreated("patients", "p1"), 5000));
    REQUIRE(client.RunSyncRound().ok());
    REQUIRE(transport.pull_count() == 1);
    REQUIRE(transport.pull_cursors()[0] == std::nullopt);
    REQUIRE(transport.batch_count() == 0);
  }

  SECTION("batch limit stops paging") {
    SyncClient::Config config;
    config.max_batches = 2;
    SyncClient client(log, transport, config);

    transport.QueuePullResponse(Response(OneCreated("patients", "p1"), 100, true));
    transport.QueuePullResponse(Response(OneCreated("patients", "p2"), 200, true));
    transport.QueuePullResponse(Response(OneCreated("patients", "p3"), 300, true));

    SyncRound round = client.RunSyncRound();
    REQUIRE(round.ok());
    REQUIRE(transport.batch_count() == 2);
    REQUIRE(round.pulled["patients"].created.size() == 2);
  }

  SECTION("failed first pull skips the push") {
    SyncClient client(log, transport);
    log.StageLocalChanges(OneCreated("patients", "local1"));
    transport.QueuePullError(TransientError());

    SyncRound round = client.RunSyncRound();
    REQUIRE(round.outcome == SyncOutcome::PartialPullFailure);
    REQUIRE_FALSE(round.cursor_returned.has_value());
    REQUIRE_FALSE(round.push_attempted);
    REQUIRE_FALSE(round.local_changes_acknowledged);
    REQUIRE(transport.push_count() == 0);
    REQUIRE(log.CountPendingChanges() == 1);
  }
}

TEST_CASE("SyncClient - pulling twice from the same cursor", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient client(log, transport);
  log.SetCursor(1000);

  // Server state does not change between the two pulls
  ChangeSetMap server_changes = OneCreated("patients", "p1");
  server_changes["notes"].deleted.push_back("n9");
  transport.QueuePullResponse(Response(server_changes, 2000));
  transport.QueuePullResponse(Response(server_changes, 2000));

  auto first = client.Pull(int64_t{1000});
  auto second = client.Pull(int64_t{1000});

  REQUIRE_FALSE(first.error.has_value());
  REQUIRE_FALSE(second.error.has_value());
  REQUIRE(ChangeSetMapToJson(first.changes) == ChangeSetMapToJson(second.changes));
  REQUIRE(first.cursor == second.cursor);
  REQUIRE(transport.pull_cursors() == std::vector<SyncCursor>{int64_t{1000}, int64_t{1000}});

  // Pulling alone neither applies changes nor moves the stored cursor
  REQUIRE(log.cursor() == int64_t{1000});
  REQUIRE(log.applied().empty());
}

TEST_CASE("SyncClient - deferred work hook", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient client(log, transport);
  log.SetCursor(1000);

  int hook_calls = 0;
  client.SetDeferredWorkHook([&](const ChangeSetMap &pulled) {
    ++hook_calls;
    std::vector<queue::JobRequest> jobs;
    if (pulled.count("accounts")) {
      queue::JobRequest request;
      request.type = queue::JobType::ContactsImport;
      request.payload = queue::ContactsImportPayload{false};
      jobs.push_back(request);
    }
    return jobs;
  });

  SECTION("runs when changes were pulled") {
    transport.QueuePullResponse(Response(OneCreated("accounts", "a1"), 2000));
    SyncRound round = client.RunSyncRound();
    REQUIRE(hook_calls == 1);
    REQUIRE(round.deferred_jobs.size() == 1);
    REQUIRE(round.deferred_jobs[0].type == queue::JobType::ContactsImport);
  }

  SECTION("skipped when nothing was pulled") {
    SyncRound round = client.RunSyncRound();
    REQUIRE(hook_calls == 0);
    REQUIRE(round.deferred_jobs.empty());
  }
}

TEST_CASE("SyncClient - Pull and Push helpers never throw", "[sync][client]") {
  MemoryChangeLog log;
  MockSyncTransport transport;
  SyncClient::Config config;
  config.batched_initial_pull = false;
  SyncClient client(log, transport, config);

  transport.QueuePullError(HttpError(500));
  auto result = client.Pull(int64_t{42});
  REQUIRE(result.error.has_value());
  REQUIRE(result.cursor == int64_t{42});
  REQUIRE(result.changes.empty());

  transport.QueuePushResult(HttpError(422));
  auto push_error = client.Push(OneCreated("patients", "p1"), 42);
  REQUIRE(push_error.has_value());
  REQUIRE(push_error->kind == SyncErrorKind::ServerRejected);

  REQUIRE_FALSE(client.Push(OneCreated("patients", "p1"), 42).has_value());
}
