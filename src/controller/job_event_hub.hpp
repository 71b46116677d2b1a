#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "controller/job_event_stream.hpp"
#include "controller/types.hpp"

namespace rollout::controller {

// Receives job lifecycle events reported by the scheduler and fans them out
// to every open stream for the same app. A bounded per-app history lets a
// stream resume from a previously seen event id.
class JobEventHub {
 public:
  struct Stats {
    std::uint64_t events_published{0};
    std::uint64_t deliveries{0};
    std::uint64_t dropped_streams{0};
    std::size_t open_streams{0};
  };

  explicit JobEventHub(std::size_t history_per_app = 1024);

  // Assigns the event id and delivers the event. Returns the assigned id.
  std::uint64_t Publish(JobEvent event);

  // Opens a stream for `app_id`. A non-zero since_id replays retained events
  // with a larger id; if history no longer reaches back that far the call
  // fails rather than silently skipping events.
  std::shared_ptr<JobEventStream> Subscribe(const std::string& app_id, std::uint64_t since_id,
                                            std::string* error);

  // Fails every open stream; subsequent subscriptions are refused.
  void Shutdown();

  Stats GetStats() const;

 private:
  struct AppChannel {
    std::deque<JobEvent> history;
    std::vector<std::weak_ptr<JobEventStream>> streams;
  };

  const std::size_t history_per_app_;
  mutable std::mutex mutex_;
  std::map<std::string, AppChannel> channels_;
  std::uint64_t next_id_{1};
  bool shut_down_{false};
  Stats stats_;
};

}  // namespace rollout::controller
