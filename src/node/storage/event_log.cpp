#include "storage/event_log.hpp"

#include <algorithm>
#include <iostream>

namespace rollout::storage {

DeploymentEventLog::DeploymentEventLog(std::filesystem::path path,
                                       std::shared_ptr<notify::WakeupBus> bus)
    : file_(std::move(path)), bus_(std::move(bus)) {}

std::string DeploymentEventLog::ChannelFor(const std::string& deployment_id) {
  return "deployment_events:" + deployment_id;
}

bool DeploymentEventLog::Open(StoreError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  offsets_.clear();
  by_deployment_.clear();
  last_id_ = 0;

  std::string decode_error;
  std::uint64_t valid_bytes = 0;
  std::string scan_error;
  const auto status = file_.Scan(
      [&](const nlohmann::json& record, std::uint64_t offset) {
        controller::DeploymentEvent event;
        try {
          event = controller::DeploymentEventFromJson(record);
        } catch (const std::exception& ex) {
          decode_error = "event at offset " + std::to_string(offset) + ": " + ex.what();
          return false;
        }
        if (event.id <= last_id_) {
          decode_error = "event id " + std::to_string(event.id) + " out of sequence at offset " +
                         std::to_string(offset);
          return false;
        }
        last_id_ = event.id;
        offsets_[event.id] = offset;
        by_deployment_[event.deployment_id].push_back(event.id);
        return true;
      },
      &valid_bytes, &scan_error);
  if (status == RecordFile::ScanStatus::kIoError) {
    return Fail(error, StoreErrorKind::kIo, scan_error);
  }
  if (status == RecordFile::ScanStatus::kCorrupt) {
    return Fail(error, StoreErrorKind::kCorrupt, scan_error);
  }
  if (!decode_error.empty()) {
    return Fail(error, StoreErrorKind::kCorrupt, file_.Path().string() + ": " + decode_error);
  }
  std::string truncate_error;
  if (!file_.TruncateTo(valid_bytes, &truncate_error)) {
    return Fail(error, StoreErrorKind::kIo, truncate_error);
  }
  open_ = true;
  std::cerr << "[eventlog] opened " << file_.Path().string() << " events=" << offsets_.size()
            << " last_id=" << last_id_ << "\n";
  return true;
}

bool DeploymentEventLog::Append(controller::DeploymentEvent* event, StoreError* error) {
  if (!event) {
    return Fail(error, StoreErrorKind::kInvalid, "event required");
  }
  if (event->deployment_id.empty()) {
    return Fail(error, StoreErrorKind::kInvalid, "deployment id required");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      return Fail(error, StoreErrorKind::kIo, "event log is not open");
    }
    controller::DeploymentEvent stamped = *event;
    stamped.id = last_id_ + 1;
    stamped.created_at = util::NowMillis();
    std::uint64_t offset = 0;
    std::string write_error;
    if (!file_.Append(controller::DeploymentEventToJson(stamped), &offset, &write_error)) {
      if (file_.TailDirty()) {
        // Garbage at the tail; only a reopen can repair it.
        open_ = false;
        std::cerr << "[eventlog] warn: closing " << file_.Path().string()
                  << " after an unrepaired failed append\n";
      }
      return Fail(error, StoreErrorKind::kIo, write_error);
    }
    last_id_ = stamped.id;
    offsets_[stamped.id] = offset;
    by_deployment_[stamped.deployment_id].push_back(stamped.id);
    *event = std::move(stamped);
  }
  if (bus_) {
    bus_->Publish(ChannelFor(event->deployment_id), std::to_string(event->id));
  }
  return true;
}

bool DeploymentEventLog::ListSince(const std::string& deployment_id, std::uint64_t since_id,
                                   std::vector<controller::DeploymentEvent>* out,
                                   StoreError* error) const {
  if (!out) {
    return Fail(error, StoreErrorKind::kInvalid, "output required");
  }
  out->clear();
  std::vector<std::uint64_t> offsets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      return Fail(error, StoreErrorKind::kIo, "event log is not open");
    }
    auto it = by_deployment_.find(deployment_id);
    if (it == by_deployment_.end()) {
      return true;
    }
    const auto& ids = it->second;
    for (auto id_it = std::upper_bound(ids.begin(), ids.end(), since_id); id_it != ids.end();
         ++id_it) {
      offsets.push_back(offsets_.at(*id_it));
    }
  }
  out->reserve(offsets.size());
  for (const auto offset : offsets) {
    controller::DeploymentEvent event;
    if (!ReadEvent(offset, &event, error)) {
      out->clear();
      return false;
    }
    out->push_back(std::move(event));
  }
  return true;
}

bool DeploymentEventLog::GetByID(std::uint64_t id, controller::DeploymentEvent* out,
                                 StoreError* error) const {
  std::uint64_t offset = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      return Fail(error, StoreErrorKind::kIo, "event log is not open");
    }
    auto it = offsets_.find(id);
    if (it == offsets_.end()) {
      return Fail(error, StoreErrorKind::kNotFound,
                  "deployment event " + std::to_string(id) + " not found");
    }
    offset = it->second;
  }
  return ReadEvent(offset, out, error);
}

bool DeploymentEventLog::HasEvents(const std::string& deployment_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_deployment_.find(deployment_id);
  return it != by_deployment_.end() && !it->second.empty();
}

std::uint64_t DeploymentEventLog::LastId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_id_;
}

bool DeploymentEventLog::ReadEvent(std::uint64_t offset, controller::DeploymentEvent* out,
                                   StoreError* error) const {
  nlohmann::json record;
  std::string read_error;
  if (!file_.ReadAt(offset, &record, &read_error)) {
    return Fail(error, StoreErrorKind::kIo, read_error);
  }
  try {
    if (out) {
      *out = controller::DeploymentEventFromJson(record);
    }
  } catch (const std::exception& ex) {
    return Fail(error, StoreErrorKind::kCorrupt, ex.what());
  }
  return true;
}

}  // namespace rollout::storage
