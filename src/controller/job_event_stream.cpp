#include "controller/job_event_stream.hpp"

#include <utility>

namespace rollout::controller {

JobEventStream::JobEventStream(std::string app_id, std::size_t max_pending)
    : app_id_(std::move(app_id)), max_pending_(max_pending == 0 ? 1 : max_pending) {}

bool JobEventStream::Push(JobEvent event) {
  bool accepted = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (pending_.size() >= max_pending_) {
      closed_ = true;
      error_ = "job event stream overflow (" + std::to_string(max_pending_) + " pending)";
    } else {
      pending_.push_back(std::move(event));
      accepted = true;
    }
  }
  cv_.notify_all();
  return accepted;
}

void JobEventStream::Fail(std::string error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    error_ = error.empty() ? std::string("job event stream failed") : std::move(error);
  }
  cv_.notify_all();
}

void JobEventStream::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

JobEventStream::NextStatus JobEventStream::Next(JobEvent* out, std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool ready =
      cv_.wait(lock, stop, [this] { return !pending_.empty() || closed_; });
  if (!ready) {
    return NextStatus::kCancelled;
  }
  if (!pending_.empty()) {
    if (out) {
      *out = std::move(pending_.front());
    }
    pending_.pop_front();
    return NextStatus::kEvent;
  }
  return error_.empty() ? NextStatus::kClosed : NextStatus::kError;
}

bool JobEventStream::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !closed_;
}

std::string JobEventStream::Error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

}  // namespace rollout::controller
