// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "queue/offline_job.hpp"

namespace offsync {
namespace sync {
class SyncClient;
class SyncTransport;
} // namespace sync

namespace queue {

class OfflineQueue;

constexpr const char *kContactsImportPath = "/api/google-contacts/sync";

/**
 * ContactsImport: POST {"incremental": bool} to kContactsImportPath.
 * Any 2xx completes the job; transport errors become a failed attempt,
 * except Unauthorized, which fails the job without retry.
 */
JobHandler MakeContactsImportHandler(sync::SyncTransport &transport);

/**
 * RecordSync: run one sync round directly. Only a fully successful round
 * completes the job; an AuthFailure round fails it without retry. Jobs the
 * round names are enqueued on `queue`.
 *
 * Safe only when invoked from a queue drain started by the SyncScheduler,
 * which never runs a drain and a round at the same time.
 */
JobHandler MakeRecordSyncHandler(sync::SyncClient &client, OfflineQueue &queue);

} // namespace queue
} // namespace offsync
