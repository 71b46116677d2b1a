#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include "controller/client.hpp"
#include "controller/job_event_hub.hpp"
#include "controller/local_controller.hpp"

namespace rollout::testing {

// ControllerClient that behaves like a scheduler: every formation write is
// stored, then the difference to the previous counts is reported to the
// hub as one up/down job event per instance, from a background thread.
class SimulatedScheduler : public controller::ControllerClient {
 public:
  SimulatedScheduler(controller::FormationStore& formations, controller::JobEventHub& hub)
      : formations_(formations), hub_(hub), inner_(formations, hub) {
    thread_ = std::jthread([this](std::stop_token stop) { Run(stop); });
  }

  ~SimulatedScheduler() override { thread_.request_stop(); }

  // Instances of `type` crash instead of coming up.
  void CrashType(const std::string& type) {
    std::lock_guard<std::mutex> lock(mutex_);
    crash_type_ = type;
  }

  void FailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
  }

  // Delay before each job event is reported.
  void SetEventDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    event_delay_ = delay;
  }

  std::size_t Streams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_;
  }

  std::size_t Writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
  }

  bool GetFormation(const std::string& app_id, const std::string& release_id,
                    controller::Formation* out, std::string* error) override {
    return inner_.GetFormation(app_id, release_id, out, error);
  }

  bool PutFormation(const controller::Formation& formation, std::string* error) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (fail_writes_) {
        if (error) {
          *error = "scheduler unavailable";
        }
        return false;
      }
    }
    controller::Formation previous;
    if (!formations_.Get(formation.app_id, formation.release_id, &previous)) {
      previous.processes.clear();
    }
    if (!inner_.PutFormation(formation, error)) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++writes_;
    for (const auto& [type, count] : formation.processes) {
      const auto it = previous.processes.find(type);
      const int before = it == previous.processes.end() ? 0 : it->second;
      for (int i = before; i < count; ++i) {
        Queue(formation, type, type == crash_type_ ? controller::JobState::kCrashed
                                                   : controller::JobState::kUp);
      }
      for (int i = count; i < before; ++i) {
        Queue(formation, type, controller::JobState::kDown);
      }
    }
    cv_.notify_all();
    return true;
  }

  std::shared_ptr<controller::JobEventStream> StreamJobEvents(const std::string& app_id,
                                                              std::uint64_t since_id,
                                                              std::string* error) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++streams_;
    }
    return inner_.StreamJobEvents(app_id, since_id, error);
  }

 private:
  void Queue(const controller::Formation& formation, const std::string& type,
             controller::JobState state) {
    controller::JobEvent event;
    event.app_id = formation.app_id;
    event.release_id = formation.release_id;
    event.process_type = type;
    event.state = state;
    event.job_id = formation.release_id + "-" + type + "-" + std::to_string(++job_counter_);
    pending_.push_back(std::move(event));
  }

  void Run(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop.stop_requested()) {
      if (!cv_.wait(lock, stop, [this] { return !pending_.empty(); })) {
        return;
      }
      while (!pending_.empty()) {
        auto event = std::move(pending_.front());
        pending_.pop_front();
        const auto delay = event_delay_;
        lock.unlock();
        std::this_thread::sleep_for(delay);
        hub_.Publish(std::move(event));
        lock.lock();
      }
    }
  }

  controller::FormationStore& formations_;
  controller::JobEventHub& hub_;
  controller::LocalController inner_;
  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  std::deque<controller::JobEvent> pending_;
  std::string crash_type_;
  bool fail_writes_{false};
  std::chrono::milliseconds event_delay_{2};
  std::size_t writes_{0};
  std::size_t streams_{0};
  std::uint64_t job_counter_{0};
  std::jthread thread_;
};

}  // namespace rollout::testing
