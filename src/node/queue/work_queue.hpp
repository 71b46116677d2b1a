#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "storage/store_error.hpp"
#include "util/time.hpp"

namespace rollout::queue {

struct WorkJob {
  std::uint64_t id{0};
  std::string type;
  nlohmann::json args;
  util::Timestamp run_at{};
  int error_count{0};
  std::string last_error;
  std::optional<util::Timestamp> leased_until;
  // Parked after a failure without retry; kept for operators to inspect.
  bool dead{false};
};

// Durable at-least-once job queue. A leased job is held by this process
// until it is completed, failed or released; a released job becomes
// runnable again once its lease runs out, so handlers must tolerate
// redelivery. The whole queue file is rewritten atomically on
// every mutation; an empty path keeps the queue in memory.
class WorkQueue {
 public:
  enum class LeaseStatus {
    kLeased,
    kStopped,
    kClosed,
  };

  explicit WorkQueue(std::filesystem::path path = {});

  // Leases held by a previous process are dropped on load: their owner is
  // gone.
  bool Load(storage::StoreError* error);

  bool Enqueue(const std::string& type, nlohmann::json args, std::uint64_t* out_id,
               storage::StoreError* error);

  // Blocks until a runnable job of `type` exists, the queue is closed, or
  // `stop` is requested.
  LeaseStatus Lease(const std::string& type, std::chrono::milliseconds lease, std::stop_token stop,
                    WorkJob* out);

  // Pushes the lease of a held job `lease` past now. Long-running holders
  // call this periodically.
  bool Extend(std::uint64_t id, std::chrono::milliseconds lease, storage::StoreError* error);

  // Drops this process's hold without a verdict. The job is handed out
  // again once its lease expires.
  void Release(std::uint64_t id);

  bool Complete(std::uint64_t id, storage::StoreError* error);

  // Records the failure. With `retry_after` the job runs again after the
  // delay; without it the job is parked as dead.
  bool Fail(std::uint64_t id, const std::string& message,
            std::optional<std::chrono::milliseconds> retry_after, storage::StoreError* error);

  // Wakes every blocked Lease() with kClosed.
  void Close();

  std::vector<WorkJob> Snapshot() const;

 private:
  bool PersistLocked(std::string* error) const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  std::map<std::uint64_t, WorkJob> jobs_;
  // Jobs leased and not yet completed, failed or released by this process.
  std::set<std::uint64_t> held_;
  std::uint64_t next_id_{1};
  bool closed_{false};
};

nlohmann::json WorkJobToJson(const WorkJob& job);
WorkJob WorkJobFromJson(const nlohmann::json& json);

}  // namespace rollout::queue
