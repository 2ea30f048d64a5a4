// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "queue/offline_job.hpp"

namespace offsync {
namespace queue {

using json = nlohmann::json;

const char *JobTypeToString(JobType type) {
  switch (type) {
  case JobType::ContactsImport:
    return "google_contacts_sync";
  case JobType::RecordSync:
    return "patient_sync";
  case JobType::Other:
    return "other";
  }
  return "other";
}

std::optional<JobType> JobTypeFromString(const std::string &str) {
  if (str == "google_contacts_sync")
    return JobType::ContactsImport;
  if (str == "patient_sync")
    return JobType::RecordSync;
  if (str == "other")
    return JobType::Other;
  return std::nullopt;
}

const char *JobStatusToString(JobStatus status) {
  switch (status) {
  case JobStatus::Pending:
    return "pending";
  case JobStatus::Processing:
    return "processing";
  case JobStatus::Completed:
    return "completed";
  case JobStatus::Failed:
    return "failed";
  case JobStatus::Cancelled:
    return "cancelled";
  }
  return "pending";
}

std::optional<JobStatus> JobStatusFromString(const std::string &str) {
  if (str == "pending")
    return JobStatus::Pending;
  if (str == "processing")
    return JobStatus::Processing;
  if (str == "completed")
    return JobStatus::Completed;
  if (str == "failed")
    return JobStatus::Failed;
  if (str == "cancelled")
    return JobStatus::Cancelled;
  return std::nullopt;
}

namespace {

struct PayloadEncoder {
  json operator()(const ContactsImportPayload &p) const {
    return json{{"incremental", p.incremental}};
  }
  json operator()(const RecordSyncPayload &p) const {
    return json{{"collection", p.collection}};
  }
  json operator()(const json &raw) const { return raw; }
};

} // namespace

json PayloadToJson(const JobPayload &payload) {
  return std::visit(PayloadEncoder{}, payload);
}

JobPayload PayloadFromJson(JobType type, const json &j) {
  const JobPayload raw{std::in_place_type<json>, j};
  if (!j.is_object()) {
    return raw;
  }

  switch (type) {
  case JobType::ContactsImport: {
    ContactsImportPayload p;
    auto it = j.find("incremental");
    if (it != j.end()) {
      if (!it->is_boolean()) {
        return raw;
      }
      p.incremental = it->get<bool>();
    }
    return p;
  }
  case JobType::RecordSync: {
    auto it = j.find("collection");
    if (it == j.end() || !it->is_string()) {
      return raw;
    }
    return RecordSyncPayload{it->get<std::string>()};
  }
  case JobType::Other:
    break;
  }
  return raw;
}

json JobToJson(const OfflineJob &job) {
  json j;
  j["id"] = job.id;
  j["type"] = job.foreign_type.empty() ? std::string(JobTypeToString(job.type)) : job.foreign_type;
  j["payload"] = PayloadToJson(job.payload);
  j["status"] = JobStatusToString(job.status);
  j["attempts"] = job.attempts;
  j["max_attempts"] = job.max_attempts;
  j["created_at"] = job.created_at;
  j["updated_at"] = job.updated_at;
  if (job.last_error) {
    j["last_error"] = *job.last_error;
  } else {
    j["last_error"] = nullptr;
  }
  return j;
}

std::optional<OfflineJob> JobFromJson(const json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty() ||
      !j.contains("type") || !j["type"].is_string() ||
      !j.contains("status") || !j["status"].is_string() ||
      !j.contains("attempts") || !j["attempts"].is_number_integer() ||
      !j.contains("max_attempts") || !j["max_attempts"].is_number_integer()) {
    return std::nullopt;
  }

  auto status = JobStatusFromString(j["status"].get<std::string>());
  if (!status) {
    return std::nullopt;
  }

  OfflineJob job;
  job.id = j["id"].get<std::string>();
  const std::string type_name = j["type"].get<std::string>();
  if (auto type = JobTypeFromString(type_name)) {
    job.type = *type;
  } else {
    job.type = JobType::Other;
    job.foreign_type = type_name;
  }
  job.status = *status;
  job.attempts = j["attempts"].get<int>();
  job.max_attempts = j["max_attempts"].get<int>();
  if (job.attempts < 0 || job.max_attempts < 1) {
    return std::nullopt;
  }

  job.payload = PayloadFromJson(job.type, j.value("payload", json::object()));

  if (j.contains("created_at") && j["created_at"].is_number_integer()) {
    job.created_at = j["created_at"].get<int64_t>();
  }
  job.updated_at = job.created_at;
  if (j.contains("updated_at") && j["updated_at"].is_number_integer()) {
    job.updated_at = j["updated_at"].get<int64_t>();
  }
  if (j.contains("last_error") && j["last_error"].is_string()) {
    job.last_error = j["last_error"].get<std::string>();
  }

  return job;
}

} // namespace queue
} // namespace offsync
