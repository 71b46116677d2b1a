#include "stream/live_tail.hpp"

#include <charconv>
#include <iostream>

namespace rollout::stream {

namespace {

bool ParseEventId(const std::string& text, std::uint64_t* out) {
  if (text.empty()) {
    return false;
  }
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, *out);
  return ec == std::errc() && ptr == end;
}

}  // namespace

std::string_view TailStateName(TailState state) {
  switch (state) {
    case TailState::kConnecting:
      return "connecting";
    case TailState::kReady:
      return "ready";
    case TailState::kTailing:
      return "tailing";
    case TailState::kClosed:
      return "closed";
  }
  return "unknown";
}

std::string_view TailEndName(TailEnd end) {
  switch (end) {
    case TailEnd::kSubscriberGone:
      return "subscriber gone";
    case TailEnd::kStopped:
      return "stopped";
    case TailEnd::kChannelClosed:
      return "wake-up channel closed";
    case TailEnd::kSubscribeFailed:
      return "subscribe failed";
    case TailEnd::kFetchError:
      return "fetch error";
  }
  return "unknown";
}

LiveTail::LiveTail(storage::DeploymentEventLog& log, std::shared_ptr<notify::WakeupBus> bus,
                   std::string deployment_id, std::uint64_t since_id, LiveTailOptions options)
    : log_(log),
      bus_(std::move(bus)),
      deployment_id_(std::move(deployment_id)),
      options_(options),
      cursor_(since_id) {}

TailEnd LiveTail::Run(EventSink& sink, std::stop_token stop, std::string* error) {
  struct CloseOnExit {
    LiveTail* tail;
    std::shared_ptr<notify::Subscription> subscription;
    ~CloseOnExit() {
      if (subscription) {
        subscription->Close();
      }
      tail->state_ = TailState::kClosed;
    }
  } exit_guard{this, nullptr};

  state_ = TailState::kConnecting;
  // Subscribe before the catch-up read: an append landing between the two
  // then shows up either in the read or as a wake-up.
  if (!bus_) {
    if (error) *error = "no wake-up bus";
    return TailEnd::kSubscribeFailed;
  }
  std::string subscribe_error;
  auto subscription = bus_->Subscribe(storage::DeploymentEventLog::ChannelFor(deployment_id_),
                                      options_.queue_capacity, &subscribe_error);
  if (!subscription) {
    if (error) *error = subscribe_error;
    return TailEnd::kSubscribeFailed;
  }
  exit_guard.subscription = subscription;

  switch (EmitSince(sink, error)) {
    case EmitResult::kSinkClosed:
      return TailEnd::kSubscriberGone;
    case EmitResult::kFetchError:
      return TailEnd::kFetchError;
    case EmitResult::kOk:
      break;
  }

  // Not safe to tail until the subscription reports ready.
  const auto ready_deadline = std::chrono::steady_clock::now() + options_.ready_timeout;
  while (state_ == TailState::kConnecting) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        ready_deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      if (error) *error = "wake-up subscription did not become ready";
      return TailEnd::kSubscribeFailed;
    }
    notify::Subscription::Message message;
    const auto status = subscription->Next(&message, remaining, stop);
    if (status == notify::Subscription::WaitStatus::kStopped) {
      return TailEnd::kStopped;
    }
    if (status == notify::Subscription::WaitStatus::kTimeout) {
      continue;
    }
    switch (message.kind) {
      case notify::Subscription::Kind::kReady:
        state_ = TailState::kReady;
        break;
      case notify::Subscription::Kind::kNotify:
        // Covered by the re-poll once ready.
        break;
      case notify::Subscription::Kind::kDisconnected:
      case notify::Subscription::Kind::kError:
        if (error) *error = "wake-up subscription failed: " + message.payload;
        return TailEnd::kSubscribeFailed;
    }
  }

  switch (EmitSince(sink, error)) {
    case EmitResult::kSinkClosed:
      return TailEnd::kSubscriberGone;
    case EmitResult::kFetchError:
      return TailEnd::kFetchError;
    case EmitResult::kOk:
      break;
  }
  if (!sink.SendKeepAlive()) {
    return TailEnd::kSubscriberGone;
  }
  state_ = TailState::kTailing;

  while (true) {
    notify::Subscription::Message message;
    const auto status = subscription->Next(&message, options_.keep_alive, stop);
    if (status == notify::Subscription::WaitStatus::kStopped) {
      return TailEnd::kStopped;
    }
    if (status == notify::Subscription::WaitStatus::kTimeout) {
      if (!sink.SendKeepAlive()) {
        return TailEnd::kSubscriberGone;
      }
      continue;
    }
    switch (message.kind) {
      case notify::Subscription::Kind::kReady:
        break;
      case notify::Subscription::Kind::kNotify:
        switch (HandleWakeup(sink, message.payload, error)) {
          case EmitResult::kSinkClosed:
            return TailEnd::kSubscriberGone;
          case EmitResult::kFetchError:
            return TailEnd::kFetchError;
          case EmitResult::kOk:
            break;
        }
        break;
      case notify::Subscription::Kind::kDisconnected:
      case notify::Subscription::Kind::kError:
        if (error) *error = message.payload;
        return TailEnd::kChannelClosed;
    }
  }
}

LiveTail::EmitResult LiveTail::EmitSince(EventSink& sink, std::string* error) {
  std::vector<controller::DeploymentEvent> events;
  storage::StoreError store_error;
  if (!log_.ListSince(deployment_id_, cursor_.load(), &events, &store_error)) {
    if (error) *error = store_error.message;
    return EmitResult::kFetchError;
  }
  for (const auto& event : events) {
    if (event.id <= cursor_.load()) {
      continue;
    }
    if (!sink.SendEvent(event)) {
      return EmitResult::kSinkClosed;
    }
    cursor_ = event.id;
  }
  return EmitResult::kOk;
}

LiveTail::EmitResult LiveTail::HandleWakeup(EventSink& sink, const std::string& payload,
                                            std::string* error) {
  std::uint64_t candidate = 0;
  if (!ParseEventId(payload, &candidate)) {
    std::cerr << "[tail] warn: ignoring malformed wake-up '" << payload << "' for "
              << deployment_id_ << "\n";
    return EmitResult::kOk;
  }
  if (candidate <= cursor_.load()) {
    return EmitResult::kOk;  // stale or duplicate
  }
  controller::DeploymentEvent event;
  storage::StoreError store_error;
  if (!log_.GetByID(candidate, &event, &store_error)) {
    if (store_error.kind == storage::StoreErrorKind::kNotFound) {
      std::cerr << "[tail] warn: wake-up for unknown event " << candidate << "\n";
      return EmitResult::kOk;
    }
    if (error) *error = store_error.message;
    return EmitResult::kFetchError;
  }
  if (event.deployment_id != deployment_id_) {
    return EmitResult::kOk;
  }
  if (candidate == cursor_.load() + 1) {
    if (!sink.SendEvent(event)) {
      return EmitResult::kSinkClosed;
    }
    cursor_ = event.id;
    return EmitResult::kOk;
  }
  // Wake-ups may overtake each other; read everything after the cursor so
  // ids reach the subscriber in order and without holes.
  return EmitSince(sink, error);
}

}  // namespace rollout::stream
