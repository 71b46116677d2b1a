#include "controller/job_event_hub.hpp"

#include <algorithm>
#include <iostream>

namespace rollout::controller {

JobEventHub::JobEventHub(std::size_t history_per_app)
    : history_per_app_(history_per_app == 0 ? 1 : history_per_app) {}

std::uint64_t JobEventHub::Publish(JobEvent event) {
  std::vector<std::shared_ptr<JobEventStream>> targets;
  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    event.id = id;
    auto& channel = channels_[event.app_id];
    channel.history.push_back(event);
    while (channel.history.size() > history_per_app_) {
      channel.history.pop_front();
    }
    auto& streams = channel.streams;
    for (auto it = streams.begin(); it != streams.end();) {
      auto stream = it->lock();
      if (!stream || !stream->IsOpen()) {
        it = streams.erase(it);
        continue;
      }
      targets.push_back(std::move(stream));
      ++it;
    }
    ++stats_.events_published;
  }

  // Delivery happens outside the hub lock so a slow consumer cannot stall
  // other publishers.
  std::uint64_t delivered = 0;
  std::uint64_t dropped = 0;
  for (const auto& stream : targets) {
    if (stream->Push(event)) {
      ++delivered;
    } else {
      ++dropped;
      std::cerr << "[jobevents] warn: dropped stream for app " << stream->AppId() << ": "
                << stream->Error() << "\n";
    }
  }
  if (delivered > 0 || dropped > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.deliveries += delivered;
    stats_.dropped_streams += dropped;
  }
  return id;
}

std::shared_ptr<JobEventStream> JobEventHub::Subscribe(const std::string& app_id,
                                                       std::uint64_t since_id,
                                                       std::string* error) {
  if (app_id.empty()) {
    if (error) {
      *error = "app id required";
    }
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_) {
    if (error) {
      *error = "job event hub is shut down";
    }
    return nullptr;
  }
  auto stream = std::make_shared<JobEventStream>(app_id);
  auto& channel = channels_[app_id];
  if (since_id > 0) {
    // Hub ids are global, so the oldest retained id for this app says
    // nothing about gaps unless the history has been trimmed.
    if (channel.history.size() == history_per_app_ && !channel.history.empty() &&
        channel.history.front().id > since_id + 1) {
      if (error) {
        *error = "job event history for app " + app_id + " no longer reaches event " +
                 std::to_string(since_id);
      }
      return nullptr;
    }
    for (const auto& event : channel.history) {
      if (event.id > since_id && !stream->Push(event)) {
        if (error) {
          *error = "job event replay for app " + app_id + " failed: " + stream->Error();
        }
        return nullptr;
      }
    }
  }
  channel.streams.push_back(stream);
  return stream;
}

void JobEventHub::Shutdown() {
  std::vector<std::shared_ptr<JobEventStream>> open;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
    for (auto& [app_id, channel] : channels_) {
      for (auto& weak : channel.streams) {
        if (auto stream = weak.lock()) {
          open.push_back(std::move(stream));
        }
      }
      channel.streams.clear();
    }
  }
  for (const auto& stream : open) {
    stream->Fail("job event hub shutting down");
  }
}

JobEventHub::Stats JobEventHub::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Stats stats = stats_;
  stats.open_streams = 0;
  for (const auto& [app_id, channel] : channels_) {
    stats.open_streams += static_cast<std::size_t>(std::count_if(
        channel.streams.begin(), channel.streams.end(), [](const auto& weak) {
          auto stream = weak.lock();
          return stream && stream->IsOpen();
        }));
  }
  return stats;
}

}  // namespace rollout::controller
