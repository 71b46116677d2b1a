#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "controller/types.hpp"
#include "notify/wakeup_bus.hpp"
#include "storage/record_file.hpp"
#include "storage/store_error.hpp"

namespace rollout::storage {

// Durable, append-only log of deployment progress events. Ids form one
// global sequence that is never reused, also across restarts. Every append
// publishes the new id on the deployment's wake-up channel; the payload is a
// hint only, readers always fetch the event back from the log.
class DeploymentEventLog {
 public:
  DeploymentEventLog(std::filesystem::path path, std::shared_ptr<notify::WakeupBus> bus);

  static std::string ChannelFor(const std::string& deployment_id);

  // Rebuilds the index from disk. A torn record at the tail is cut off; a
  // checksum mismatch anywhere else is reported as kCorrupt.
  bool Open(StoreError* error);

  // Assigns event->id and event->created_at, persists the record and wakes
  // subscribers of the deployment's channel.
  bool Append(controller::DeploymentEvent* event, StoreError* error);

  // Events of `deployment_id` with id > since_id, ascending.
  bool ListSince(const std::string& deployment_id, std::uint64_t since_id,
                 std::vector<controller::DeploymentEvent>* out, StoreError* error) const;

  bool GetByID(std::uint64_t id, controller::DeploymentEvent* out, StoreError* error) const;

  bool HasEvents(const std::string& deployment_id) const;
  std::uint64_t LastId() const;

 private:
  bool ReadEvent(std::uint64_t offset, controller::DeploymentEvent* out, StoreError* error) const;

  RecordFile file_;
  std::shared_ptr<notify::WakeupBus> bus_;
  mutable std::mutex mutex_;
  bool open_{false};
  std::uint64_t last_id_{0};
  std::map<std::uint64_t, std::uint64_t> offsets_;
  std::map<std::string, std::vector<std::uint64_t>> by_deployment_;
};

}  // namespace rollout::storage
