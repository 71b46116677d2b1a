#include "queue/work_queue.hpp"

#include <iostream>
#include <stdexcept>

#include "util/json_file.hpp"

namespace rollout::queue {

namespace {

constexpr int kQueueFileVersion = 1;
// Upper bound on a single idle wait so wall-clock jumps cannot strand a
// waiter past a job's run_at.
constexpr auto kMaxIdleWait = std::chrono::seconds(1);

bool Runnable(const WorkJob& job, const std::string& type, util::Timestamp now) {
  if (job.dead || job.type != type || job.run_at > now) {
    return false;
  }
  return !job.leased_until || *job.leased_until <= now;
}

}  // namespace

nlohmann::json WorkJobToJson(const WorkJob& job) {
  nlohmann::json json;
  json["id"] = job.id;
  json["type"] = job.type;
  json["args"] = job.args;
  json["run_at"] = util::FormatRfc3339(job.run_at);
  json["error_count"] = job.error_count;
  json["last_error"] = job.last_error;
  json["leased_until"] =
      job.leased_until ? nlohmann::json(util::FormatRfc3339(*job.leased_until)) : nlohmann::json();
  json["dead"] = job.dead;
  return json;
}

WorkJob WorkJobFromJson(const nlohmann::json& json) {
  WorkJob job;
  job.id = json.at("id").get<std::uint64_t>();
  job.type = json.at("type").get<std::string>();
  job.args = json.value("args", nlohmann::json::object());
  const auto run_at = util::ParseRfc3339(json.at("run_at").get<std::string>());
  if (!run_at) {
    throw std::invalid_argument("invalid run_at for job " + std::to_string(job.id));
  }
  job.run_at = *run_at;
  job.error_count = json.value("error_count", 0);
  job.last_error = json.value("last_error", std::string{});
  if (json.contains("leased_until") && !json.at("leased_until").is_null()) {
    job.leased_until = util::ParseRfc3339(json.at("leased_until").get<std::string>());
  }
  job.dead = json.value("dead", false);
  return job;
}

WorkQueue::WorkQueue(std::filesystem::path path) : path_(std::move(path)) {}

bool WorkQueue::Load(storage::StoreError* error) {
  if (path_.empty()) {
    return true;
  }
  nlohmann::json document;
  bool missing = false;
  std::string read_error;
  if (!util::ReadJsonFile(path_, &document, &missing, &read_error)) {
    return storage::Fail(error, storage::StoreErrorKind::kIo, read_error);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  jobs_.clear();
  held_.clear();
  next_id_ = 1;
  if (missing) {
    return true;
  }
  try {
    if (document.value("version", 0) != kQueueFileVersion) {
      return storage::Fail(error, storage::StoreErrorKind::kCorrupt,
                           "unsupported work queue version in " + path_.string());
    }
    next_id_ = document.value("next_id", std::uint64_t{1});
    for (const auto& entry : document.at("jobs")) {
      auto job = WorkJobFromJson(entry);
      job.leased_until.reset();
      if (job.id >= next_id_) {
        next_id_ = job.id + 1;
      }
      jobs_[job.id] = std::move(job);
    }
  } catch (const std::exception& ex) {
    jobs_.clear();
    return storage::Fail(error, storage::StoreErrorKind::kCorrupt,
                         path_.string() + ": " + ex.what());
  }
  return true;
}

bool WorkQueue::Enqueue(const std::string& type, nlohmann::json args, std::uint64_t* out_id,
                        storage::StoreError* error) {
  if (type.empty()) {
    return storage::Fail(error, storage::StoreErrorKind::kInvalid, "job type required");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return storage::Fail(error, storage::StoreErrorKind::kIo, "work queue is closed");
    }
    WorkJob job;
    job.id = next_id_++;
    job.type = type;
    job.args = std::move(args);
    job.run_at = util::NowMillis();
    const auto id = job.id;
    jobs_[id] = std::move(job);
    std::string persist_error;
    if (!PersistLocked(&persist_error)) {
      jobs_.erase(id);
      --next_id_;
      return storage::Fail(error, storage::StoreErrorKind::kIo, persist_error);
    }
    if (out_id) {
      *out_id = id;
    }
  }
  cv_.notify_all();
  return true;
}

WorkQueue::LeaseStatus WorkQueue::Lease(const std::string& type,
                                        std::chrono::milliseconds lease, std::stop_token stop,
                                        WorkJob* out) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (closed_) {
      return LeaseStatus::kClosed;
    }
    if (stop.stop_requested()) {
      return LeaseStatus::kStopped;
    }
    const auto now = std::chrono::system_clock::now();
    WorkJob* chosen = nullptr;
    auto wake_at = now + kMaxIdleWait;
    for (auto& [id, job] : jobs_) {
      if (held_.count(id) != 0) {
        continue;
      }
      if (Runnable(job, type, now)) {
        if (!chosen || job.run_at < chosen->run_at) {
          chosen = &job;
        }
        continue;
      }
      if (job.dead || job.type != type) {
        continue;
      }
      auto ready_at = job.run_at;
      if (job.leased_until && *job.leased_until > ready_at) {
        ready_at = *job.leased_until;
      }
      if (ready_at < wake_at) {
        wake_at = ready_at;
      }
    }
    if (chosen) {
      chosen->leased_until = util::NowMillis() + lease;
      held_.insert(chosen->id);
      std::string persist_error;
      if (!PersistLocked(&persist_error)) {
        // The lease still holds in memory; a restart drops leases anyway.
        std::cerr << "[queue] warn: failed to persist lease for job " << chosen->id << ": "
                  << persist_error << "\n";
      }
      if (out) {
        *out = *chosen;
      }
      return LeaseStatus::kLeased;
    }
    cv_.wait_until(lock, stop, wake_at, [&] { return closed_; });
  }
}

bool WorkQueue::Extend(std::uint64_t id, std::chrono::milliseconds lease,
                       storage::StoreError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() || held_.count(id) == 0) {
    return storage::Fail(error, storage::StoreErrorKind::kNotFound,
                         "job " + std::to_string(id) + " is not held");
  }
  it->second.leased_until = util::NowMillis() + lease;
  std::string persist_error;
  if (!PersistLocked(&persist_error)) {
    // The in-memory lease is what Lease() consults.
    return storage::Fail(error, storage::StoreErrorKind::kIo, persist_error);
  }
  return true;
}

void WorkQueue::Release(std::uint64_t id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(id);
  }
  cv_.notify_all();
}

bool WorkQueue::Complete(std::uint64_t id, storage::StoreError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  held_.erase(id);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return storage::Fail(error, storage::StoreErrorKind::kNotFound,
                         "job " + std::to_string(id) + " not found");
  }
  WorkJob removed = std::move(it->second);
  jobs_.erase(it);
  std::string persist_error;
  if (!PersistLocked(&persist_error)) {
    jobs_[id] = std::move(removed);
    return storage::Fail(error, storage::StoreErrorKind::kIo, persist_error);
  }
  return true;
}

bool WorkQueue::Fail(std::uint64_t id, const std::string& message,
                     std::optional<std::chrono::milliseconds> retry_after,
                     storage::StoreError* error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(id);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      return storage::Fail(error, storage::StoreErrorKind::kNotFound,
                           "job " + std::to_string(id) + " not found");
    }
    const WorkJob previous = it->second;
    auto& job = it->second;
    ++job.error_count;
    job.last_error = message;
    job.leased_until.reset();
    if (retry_after) {
      job.run_at = util::NowMillis() + *retry_after;
    } else {
      job.dead = true;
    }
    std::string persist_error;
    if (!PersistLocked(&persist_error)) {
      job = previous;
      return storage::Fail(error, storage::StoreErrorKind::kIo, persist_error);
    }
  }
  cv_.notify_all();
  return true;
}

void WorkQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::vector<WorkJob> WorkQueue::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<WorkJob> out;
  out.reserve(jobs_.size());
  for (const auto& [id, job] : jobs_) {
    out.push_back(job);
  }
  return out;
}

bool WorkQueue::PersistLocked(std::string* error) const {
  if (path_.empty()) {
    return true;
  }
  nlohmann::json document;
  document["version"] = kQueueFileVersion;
  document["next_id"] = next_id_;
  document["jobs"] = nlohmann::json::array();
  for (const auto& [id, job] : jobs_) {
    document["jobs"].push_back(WorkJobToJson(job));
  }
  return util::AtomicWriteJson(path_, document, error);
}

}  // namespace rollout::queue
