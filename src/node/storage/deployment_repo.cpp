#include "storage/deployment_repo.hpp"

#include <algorithm>
#include <iostream>

#include "util/json_file.hpp"
#include "util/uuid.hpp"

namespace rollout::storage {

namespace {

constexpr int kRepoFileVersion = 1;

}  // namespace

DeploymentRepo::DeploymentRepo(std::filesystem::path path, queue::WorkQueue& queue)
    : path_(std::move(path)), queue_(queue) {}

bool DeploymentRepo::Load(StoreError* error) {
  if (path_.empty()) {
    return true;
  }
  nlohmann::json document;
  bool missing = false;
  std::string read_error;
  if (!util::ReadJsonFile(path_, &document, &missing, &read_error)) {
    return Fail(error, StoreErrorKind::kIo, read_error);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  deployments_.clear();
  if (missing) {
    return true;
  }
  try {
    if (document.value("version", 0) != kRepoFileVersion) {
      return Fail(error, StoreErrorKind::kCorrupt,
                  "unsupported deployments file version in " + path_.string());
    }
    for (const auto& entry : document.at("deployments")) {
      auto deployment = controller::DeploymentFromJson(entry);
      deployments_[deployment.id] = std::move(deployment);
    }
  } catch (const std::exception& ex) {
    deployments_.clear();
    return Fail(error, StoreErrorKind::kCorrupt, path_.string() + ": " + ex.what());
  }
  return true;
}

bool DeploymentRepo::Add(controller::Deployment* deployment, StoreError* error) {
  if (!deployment) {
    return Fail(error, StoreErrorKind::kInvalid, "deployment required");
  }
  if (deployment->app_id.empty()) {
    return Fail(error, StoreErrorKind::kInvalid, "app id required");
  }
  if (deployment->old_release_id.empty() || deployment->new_release_id.empty()) {
    return Fail(error, StoreErrorKind::kInvalid, "old and new release ids required");
  }
  if (deployment->old_release_id == deployment->new_release_id) {
    return Fail(error, StoreErrorKind::kInvalid, "old and new release are the same");
  }
  controller::Deployment record = *deployment;
  if (record.id.empty()) {
    try {
      record.id = util::NewUuid();
    } catch (const std::exception& ex) {
      return Fail(error, StoreErrorKind::kIo, ex.what());
    }
  } else {
    const auto cleaned = util::CleanUuid(record.id);
    if (cleaned.empty()) {
      return Fail(error, StoreErrorKind::kInvalid, "deployment id is not a UUID");
    }
    record.id = cleaned;
  }
  record.created_at = util::NowMillis();
  record.finished_at.reset();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (deployments_.count(record.id) != 0) {
      return Fail(error, StoreErrorKind::kConflict, "deployment " + record.id + " already exists");
    }
    deployments_[record.id] = record;
    std::string persist_error;
    if (!PersistLocked(&persist_error)) {
      deployments_.erase(record.id);
      return Fail(error, StoreErrorKind::kIo, persist_error);
    }
  }
  *deployment = record;

  StoreError enqueue_error;
  if (!queue_.Enqueue(kDeploymentJobType, nlohmann::json{{"id", record.id}}, nullptr,
                      &enqueue_error)) {
    std::cerr << "[deployments] warn: deployment " << record.id
              << " stored but not queued: " << enqueue_error.message << "\n";
    return Fail(error, StoreErrorKind::kEnqueue,
                "deployment " + record.id + " stored but not queued: " + enqueue_error.message);
  }
  return true;
}

bool DeploymentRepo::Get(const std::string& id, controller::Deployment* out,
                         StoreError* error) const {
  const auto cleaned = util::CleanUuid(id);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = deployments_.find(cleaned.empty() ? id : cleaned);
  if (it == deployments_.end()) {
    return Fail(error, StoreErrorKind::kNotFound, "deployment " + id + " not found");
  }
  if (out) {
    *out = it->second;
  }
  return true;
}

std::vector<controller::Deployment> DeploymentRepo::List(const std::string& app_id) const {
  std::vector<controller::Deployment> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, deployment] : deployments_) {
      if (app_id.empty() || deployment.app_id == app_id) {
        out.push_back(deployment);
      }
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at != b.created_at) {
      return a.created_at > b.created_at;
    }
    return a.id < b.id;
  });
  return out;
}

bool DeploymentRepo::MarkFinished(const std::string& id, util::Timestamp when,
                                  StoreError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = deployments_.find(id);
  if (it == deployments_.end()) {
    return Fail(error, StoreErrorKind::kNotFound, "deployment " + id + " not found");
  }
  if (it->second.finished_at) {
    return Fail(error, StoreErrorKind::kConflict, "deployment " + id + " already finished");
  }
  it->second.finished_at = when;
  std::string persist_error;
  if (!PersistLocked(&persist_error)) {
    it->second.finished_at.reset();
    return Fail(error, StoreErrorKind::kIo, persist_error);
  }
  return true;
}

bool DeploymentRepo::FindUnfinished(const std::string& app_id,
                                    controller::Deployment* out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, deployment] : deployments_) {
    if (deployment.app_id == app_id && !deployment.finished_at) {
      if (out) {
        *out = deployment;
      }
      return true;
    }
  }
  return false;
}

bool DeploymentRepo::PersistLocked(std::string* error) const {
  if (path_.empty()) {
    return true;
  }
  nlohmann::json document;
  document["version"] = kRepoFileVersion;
  document["deployments"] = nlohmann::json::array();
  for (const auto& [id, deployment] : deployments_) {
    document["deployments"].push_back(controller::DeploymentToJson(deployment));
  }
  return util::AtomicWriteJson(path_, document, error);
}

}  // namespace rollout::storage
