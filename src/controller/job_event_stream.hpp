#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stop_token>
#include <string>

#include "controller/types.hpp"

namespace rollout::controller {

// Single-consumer queue of job events for one app. Producers (the event hub
// or a test) push events; the consumer blocks in Next(). Once closed or
// failed, already queued events are still drained before the terminal
// status is reported.
class JobEventStream {
 public:
  enum class NextStatus {
    kEvent,
    kClosed,
    kError,
    kCancelled,
  };

  explicit JobEventStream(std::string app_id, std::size_t max_pending = 4096);

  JobEventStream(const JobEventStream&) = delete;
  JobEventStream& operator=(const JobEventStream&) = delete;

  const std::string& AppId() const noexcept { return app_id_; }

  // Returns false when the stream is already terminal. Overflowing the
  // pending queue fails the stream: a dropped event could be the one a
  // waiter is blocked on.
  bool Push(JobEvent event);

  // Terminates the stream with an error visible to the consumer.
  void Fail(std::string error);

  // Consumer-side close; also used by producers on orderly shutdown.
  void Close();

  // Blocks until an event is available, the stream terminates, or `stop`
  // is requested.
  NextStatus Next(JobEvent* out, std::stop_token stop = {});

  bool IsOpen() const;
  std::string Error() const;

 private:
  const std::string app_id_;
  const std::size_t max_pending_;
  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  std::deque<JobEvent> pending_;
  bool closed_{false};
  std::string error_;
};

}  // namespace rollout::controller
