#pragma once

#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "controller/job_event_stream.hpp"
#include "controller/types.hpp"

namespace rollout::deployer {

// process type -> job state -> number of events still required.
using ExpectedEvents = std::map<std::string, std::map<controller::JobState, int>>;

enum class WaitFailure {
  kNone,
  kStreamClosed,
  kStreamError,
  kCrashed,
  kCancelled,
};

std::string_view WaitFailureName(WaitFailure failure);

struct WaitOptions {
  // When set, only events from this release count towards the expectation.
  // Crashes abort the wait regardless of release.
  std::string release_id;
};

struct WaitResult {
  bool ok{false};
  WaitFailure failure{WaitFailure::kNone};
  // Matching events in the order they were consumed.
  std::vector<controller::JobEvent> matched;
  // Expectations still outstanding when the wait ended (empty on success).
  ExpectedEvents remaining;
  // First unmet (type, state) pair, when the wait failed.
  std::string unmet_type;
  std::optional<controller::JobState> unmet_state;
  // The crash that aborted the wait, for kCrashed.
  std::optional<controller::JobEvent> crash;
  std::string message;
  std::size_t consumed{0};
};

// Consumes events from `stream` until every count in `expected` reaches
// zero. Unrelated and surplus events are ignored; a crashed job of any type
// fails the wait at once. There is no timeout: callers bound the wait
// through `stop`.
WaitResult WaitForJobEvents(controller::JobEventStream& stream, ExpectedEvents expected,
                            const WaitOptions& options = {}, std::stop_token stop = {});

std::string DescribeExpected(const ExpectedEvents& expected);

}  // namespace rollout::deployer
