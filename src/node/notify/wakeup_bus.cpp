#include "notify/wakeup_bus.hpp"

#include <algorithm>
#include <iostream>

namespace rollout::notify {

Subscription::Subscription(std::string channel, std::size_t capacity)
    : channel_(std::move(channel)), capacity_(capacity == 0 ? 1 : capacity) {}

Subscription::~Subscription() { Close(); }

Subscription::WaitStatus Subscription::Next(Message* out, std::chrono::milliseconds timeout,
                                            std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool ready = cv_.wait_for(lock, stop, timeout, [&] { return !queue_.empty(); });
  if (!ready) {
    return stop.stop_requested() ? WaitStatus::kStopped : WaitStatus::kTimeout;
  }
  if (out) {
    *out = std::move(queue_.front());
  }
  queue_.pop_front();
  return WaitStatus::kMessage;
}

void Subscription::Close() {
  std::shared_ptr<WakeupBus> bus;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    terminal_ = true;
    bus = bus_.lock();
    bus_.reset();
  }
  if (bus) {
    bus->Remove(this);
  }
  cv_.notify_all();
}

bool Subscription::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return terminal_;
}

bool Subscription::Deliver(Message message, bool* overflowed) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_) {
      return false;
    }
    if (queue_.size() >= capacity_) {
      terminal_ = true;
      if (overflowed) *overflowed = true;
      queue_.push_back(Message{Kind::kError, "subscriber queue overflow on " + channel_});
      cv_.notify_all();
      return false;
    }
    queue_.push_back(std::move(message));
  }
  cv_.notify_all();
  return true;
}

void Subscription::Terminate(Kind kind, std::string reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_) {
      return;
    }
    terminal_ = true;
    queue_.push_back(Message{kind, std::move(reason)});
  }
  cv_.notify_all();
}

std::shared_ptr<WakeupBus> WakeupBus::Create() {
  return std::shared_ptr<WakeupBus>(new WakeupBus());
}

std::shared_ptr<Subscription> WakeupBus::Subscribe(const std::string& channel,
                                                   std::size_t capacity, std::string* error) {
  if (channel.empty()) {
    if (error) *error = "channel name required";
    return nullptr;
  }
  auto subscription = std::make_shared<Subscription>(channel, capacity);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      if (error) *error = "wake-up bus is shut down";
      return nullptr;
    }
    subscription->bus_ = weak_from_this();
    channels_[channel].push_back(Entry{subscription.get(), subscription});
    // Queued under the bus lock so kReady always precedes the first kNotify.
    subscription->Deliver(Subscription::Message{Subscription::Kind::kReady, {}}, nullptr);
  }
  return subscription;
}

void WakeupBus::Publish(const std::string& channel, const std::string& payload) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.published;
    auto it = channels_.find(channel);
    if (it == channels_.end()) {
      return;
    }
    auto& subscribers = it->second;
    for (auto sub_it = subscribers.begin(); sub_it != subscribers.end();) {
      if (auto subscription = sub_it->weak.lock()) {
        targets.push_back(std::move(subscription));
        ++sub_it;
      } else {
        sub_it = subscribers.erase(sub_it);
      }
    }
    if (subscribers.empty()) {
      channels_.erase(it);
    }
  }

  std::uint64_t delivered = 0;
  std::uint64_t overflowed = 0;
  for (const auto& subscription : targets) {
    bool cut_off = false;
    if (subscription->Deliver(Subscription::Message{Subscription::Kind::kNotify, payload},
                              &cut_off)) {
      ++delivered;
      continue;
    }
    if (cut_off) {
      ++overflowed;
      std::cerr << "[notify] warn: subscriber on " << channel << " cut off (queue full)\n";
    }
    Remove(subscription.get());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.delivered += delivered;
  stats_.overflowed += overflowed;
}

void WakeupBus::Shutdown() {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
    for (auto& [channel, subscribers] : channels_) {
      for (auto& entry : subscribers) {
        if (auto subscription = entry.weak.lock()) {
          targets.push_back(std::move(subscription));
        }
      }
    }
    channels_.clear();
  }
  for (const auto& subscription : targets) {
    subscription->Terminate(Subscription::Kind::kDisconnected, "wake-up bus shutting down");
  }
}

WakeupBus::Stats WakeupBus::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Stats stats = stats_;
  stats.subscribers = 0;
  for (const auto& [channel, subscribers] : channels_) {
    stats.subscribers += static_cast<std::size_t>(std::count_if(
        subscribers.begin(), subscribers.end(),
        [](const Entry& entry) { return !entry.weak.expired(); }));
  }
  return stats;
}

void WakeupBus::Remove(const Subscription* subscription) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(subscription->Channel());
  if (it == channels_.end()) {
    return;
  }
  auto& subscribers = it->second;
  // Compares raw pointers: locking here could drop the last reference and
  // re-enter Remove from ~Subscription while the bus lock is held.
  subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(),
                                   [subscription](const Entry& entry) {
                                     return entry.raw == subscription || entry.weak.expired();
                                   }),
                    subscribers.end());
  if (subscribers.empty()) {
    channels_.erase(it);
  }
}

}  // namespace rollout::notify
