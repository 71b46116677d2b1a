#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "controller/types.hpp"
#include "notify/wakeup_bus.hpp"
#include "storage/event_log.hpp"

namespace rollout::stream {

// Where a tail delivers to. Either call returning false means the
// subscriber went away.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual bool SendEvent(const controller::DeploymentEvent& event) = 0;
  virtual bool SendKeepAlive() = 0;
};

enum class TailState {
  kConnecting,
  kReady,
  kTailing,
  kClosed,
};

enum class TailEnd {
  kSubscriberGone,
  kStopped,
  kChannelClosed,
  kSubscribeFailed,
  kFetchError,
};

std::string_view TailStateName(TailState state);
std::string_view TailEndName(TailEnd end);

struct LiveTailOptions {
  std::chrono::milliseconds keep_alive{std::chrono::seconds(30)};
  // How long to wait for the wake-up subscription to become ready.
  std::chrono::milliseconds ready_timeout{std::chrono::seconds(10)};
  std::size_t queue_capacity{1024};
};

// Delivers one deployment's events after `since_id` exactly once and in id
// order: a catch-up read from the log, then live events driven by wake-ups.
// Wake-ups are treated as hints; every emitted event is read back from the
// log, and gaps between the cursor and a wake-up are filled from the log.
// There is no internal reconnect: after Run returns, Cursor() is the id to
// resume from.
class LiveTail {
 public:
  LiveTail(storage::DeploymentEventLog& log, std::shared_ptr<notify::WakeupBus> bus,
           std::string deployment_id, std::uint64_t since_id, LiveTailOptions options = {});

  TailEnd Run(EventSink& sink, std::stop_token stop, std::string* error);

  TailState State() const noexcept { return state_.load(); }
  std::uint64_t Cursor() const noexcept { return cursor_.load(); }

 private:
  enum class EmitResult {
    kOk,
    kSinkClosed,
    kFetchError,
  };

  EmitResult EmitSince(EventSink& sink, std::string* error);
  EmitResult HandleWakeup(EventSink& sink, const std::string& payload, std::string* error);

  storage::DeploymentEventLog& log_;
  std::shared_ptr<notify::WakeupBus> bus_;
  const std::string deployment_id_;
  const LiveTailOptions options_;
  std::atomic<TailState> state_{TailState::kConnecting};
  std::atomic<std::uint64_t> cursor_;
};

}  // namespace rollout::stream
