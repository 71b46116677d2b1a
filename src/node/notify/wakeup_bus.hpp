#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace rollout::notify {

class WakeupBus;

// One subscriber's view of a channel. Lifecycle changes and notifications
// arrive as messages on the same queue, in the order the bus produced them:
// kReady first, then any number of kNotify, and at most one terminal
// kDisconnected or kError.
class Subscription {
 public:
  enum class Kind {
    kReady,
    kNotify,
    kDisconnected,
    kError,
  };

  struct Message {
    Kind kind{Kind::kNotify};
    std::string payload;
  };

  enum class WaitStatus {
    kMessage,
    kTimeout,
    kStopped,
  };

  Subscription(std::string channel, std::size_t capacity);
  ~Subscription();

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  const std::string& Channel() const noexcept { return channel_; }

  // Waits up to `timeout` for the next message.
  WaitStatus Next(Message* out, std::chrono::milliseconds timeout, std::stop_token stop = {});

  // Detaches from the bus; no further messages are queued.
  void Close();

  bool IsClosed() const;

 private:
  friend class WakeupBus;

  // Called by the bus. Returns false once the subscription is terminal;
  // `*overflowed` is set when this delivery is what cut it off.
  bool Deliver(Message message, bool* overflowed);
  void Terminate(Kind kind, std::string reason);

  const std::string channel_;
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  std::deque<Message> queue_;
  bool terminal_{false};
  std::weak_ptr<WakeupBus> bus_;
};

// In-process publish/subscribe channel for small wake-up payloads. Publish
// never blocks on subscribers: a subscriber whose queue is full is cut off
// with kError and must resume from its own cursor.
class WakeupBus : public std::enable_shared_from_this<WakeupBus> {
 public:
  struct Stats {
    std::uint64_t published{0};
    std::uint64_t delivered{0};
    std::uint64_t overflowed{0};
    std::size_t subscribers{0};
  };

  static std::shared_ptr<WakeupBus> Create();

  // Returns nullptr and sets `error` once the bus is shut down.
  std::shared_ptr<Subscription> Subscribe(const std::string& channel, std::size_t capacity,
                                          std::string* error);

  void Publish(const std::string& channel, const std::string& payload);

  // Sends kDisconnected to every subscriber and refuses new ones.
  void Shutdown();

  Stats GetStats() const;

 private:
  WakeupBus() = default;

  friend class Subscription;
  void Remove(const Subscription* subscription);

  struct Entry {
    const Subscription* raw;
    std::weak_ptr<Subscription> weak;
  };

  mutable std::mutex mutex_;
  std::map<std::string, std::vector<Entry>> channels_;
  bool shut_down_{false};
  Stats stats_;
};

}  // namespace rollout::notify
