#include "deployer/job_event_matcher.hpp"

#include <sstream>
#include <utility>

namespace rollout::deployer {

namespace {

void DropSatisfied(ExpectedEvents* expected) {
  for (auto type_it = expected->begin(); type_it != expected->end();) {
    auto& states = type_it->second;
    for (auto state_it = states.begin(); state_it != states.end();) {
      if (state_it->second <= 0) {
        state_it = states.erase(state_it);
      } else {
        ++state_it;
      }
    }
    if (states.empty()) {
      type_it = expected->erase(type_it);
    } else {
      ++type_it;
    }
  }
}

void RecordUnmet(WaitResult* result) {
  if (result->remaining.empty()) {
    return;
  }
  const auto& [type, states] = *result->remaining.begin();
  result->unmet_type = type;
  result->unmet_state = states.begin()->first;
}

}  // namespace

std::string_view WaitFailureName(WaitFailure failure) {
  switch (failure) {
    case WaitFailure::kNone:
      return "none";
    case WaitFailure::kStreamClosed:
      return "stream closed";
    case WaitFailure::kStreamError:
      return "stream error";
    case WaitFailure::kCrashed:
      return "job crashed";
    case WaitFailure::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string DescribeExpected(const ExpectedEvents& expected) {
  std::ostringstream oss;
  bool first = true;
  for (const auto& [type, states] : expected) {
    for (const auto& [state, count] : states) {
      if (!first) {
        oss << ", ";
      }
      first = false;
      oss << type << ":" << controller::JobStateName(state) << "=" << count;
    }
  }
  return first ? std::string("{}") : oss.str();
}

WaitResult WaitForJobEvents(controller::JobEventStream& stream, ExpectedEvents expected,
                            const WaitOptions& options, std::stop_token stop) {
  WaitResult result;
  DropSatisfied(&expected);

  while (!expected.empty()) {
    controller::JobEvent event;
    const auto status = stream.Next(&event, stop);
    if (status != controller::JobEventStream::NextStatus::kEvent) {
      result.remaining = std::move(expected);
      RecordUnmet(&result);
      switch (status) {
        case controller::JobEventStream::NextStatus::kCancelled:
          result.failure = WaitFailure::kCancelled;
          result.message = "wait cancelled";
          break;
        case controller::JobEventStream::NextStatus::kError:
          result.failure = WaitFailure::kStreamError;
          result.message = "job event stream error: " + stream.Error();
          break;
        default:
          result.failure = WaitFailure::kStreamClosed;
          result.message = "job event stream closed";
          break;
      }
      result.message += " while waiting for " + DescribeExpected(result.remaining);
      return result;
    }
    ++result.consumed;

    if (event.state == controller::JobState::kCrashed) {
      result.failure = WaitFailure::kCrashed;
      result.remaining = std::move(expected);
      RecordUnmet(&result);
      result.message = "job " + (event.job_id.empty() ? std::string("<unknown>") : event.job_id) +
                       " of type " + event.process_type + " crashed while waiting for " +
                       DescribeExpected(result.remaining);
      result.crash = std::move(event);
      return result;
    }
    if (!options.release_id.empty() && event.release_id != options.release_id) {
      continue;
    }
    auto type_it = expected.find(event.process_type);
    if (type_it == expected.end()) {
      continue;
    }
    auto state_it = type_it->second.find(event.state);
    if (state_it == type_it->second.end() || state_it->second <= 0) {
      continue;
    }
    if (--state_it->second == 0) {
      type_it->second.erase(state_it);
      if (type_it->second.empty()) {
        expected.erase(type_it);
      }
    }
    result.matched.push_back(std::move(event));
  }

  result.ok = true;
  return result;
}

}  // namespace rollout::deployer
