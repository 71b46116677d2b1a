#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "controller/types.hpp"
#include "queue/work_queue.hpp"
#include "storage/store_error.hpp"

namespace rollout::storage {

inline constexpr const char* kDeploymentJobType = "Deployment";

// Deployment records plus admission into the work queue. Records are kept
// in one JSON document rewritten atomically on every change.
class DeploymentRepo {
 public:
  DeploymentRepo(std::filesystem::path path, queue::WorkQueue& queue);

  bool Load(StoreError* error);

  // Validates the request, assigns an id when none is set, stamps
  // created_at and stores the record, then enqueues one Deployment job.
  // When only the enqueue fails the record stays and kEnqueue is reported;
  // `deployment` then still carries the stored fields.
  bool Add(controller::Deployment* deployment, StoreError* error);

  bool Get(const std::string& id, controller::Deployment* out, StoreError* error) const;

  // Newest first. An empty app id lists every app.
  std::vector<controller::Deployment> List(const std::string& app_id) const;

  // Fails with kConflict when finished_at is already set.
  bool MarkFinished(const std::string& id, util::Timestamp when, StoreError* error);

  // Returns true and fills `out` when `app_id` has a deployment without
  // finished_at.
  bool FindUnfinished(const std::string& app_id, controller::Deployment* out) const;

 private:
  bool PersistLocked(std::string* error) const;

  std::filesystem::path path_;
  queue::WorkQueue& queue_;
  mutable std::mutex mutex_;
  std::map<std::string, controller::Deployment> deployments_;
};

}  // namespace rollout::storage
