#include "deployer/engine.hpp"

#include <iostream>
#include <memory>

#include "deployer/job_event_matcher.hpp"
#include "deployer/strategy.hpp"

namespace rollout::deployer {

namespace {

bool SetError(DeployError* error, DeployErrorKind kind, std::string message) {
  if (error) {
    error->kind = kind;
    error->message = std::move(message);
  }
  return false;
}

DeployErrorKind KindForWait(WaitFailure failure) {
  switch (failure) {
    case WaitFailure::kCrashed:
      return DeployErrorKind::kCrashed;
    case WaitFailure::kCancelled:
      return DeployErrorKind::kCancelled;
    case WaitFailure::kStreamError:
      return DeployErrorKind::kStream;
    case WaitFailure::kStreamClosed:
    case WaitFailure::kNone:
      break;
  }
  return DeployErrorKind::kUnsatisfied;
}

// Closes the job event stream on every exit path.
class StreamGuard {
 public:
  explicit StreamGuard(std::shared_ptr<controller::JobEventStream> stream)
      : stream_(std::move(stream)) {}
  ~StreamGuard() {
    if (stream_) {
      stream_->Close();
    }
  }
  StreamGuard(const StreamGuard&) = delete;
  StreamGuard& operator=(const StreamGuard&) = delete;

 private:
  std::shared_ptr<controller::JobEventStream> stream_;
};

}  // namespace

std::string_view DeployErrorKindName(DeployErrorKind kind) {
  switch (kind) {
    case DeployErrorKind::kNone:
      return "none";
    case DeployErrorKind::kController:
      return "controller";
    case DeployErrorKind::kStream:
      return "stream";
    case DeployErrorKind::kCrashed:
      return "crashed";
    case DeployErrorKind::kUnsatisfied:
      return "unsatisfied";
    case DeployErrorKind::kLog:
      return "log";
    case DeployErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

StrategyEngine::StrategyEngine(controller::ControllerClient& controller,
                               storage::DeploymentEventLog& log, storage::DeploymentRepo& repo)
    : controller_(controller), log_(log), repo_(repo) {}

bool StrategyEngine::Execute(const controller::Deployment& deployment, std::stop_token stop,
                             DeployError* error) {
  DeployError failure;
  std::string controller_error;

  // Subscribe before the first mutation so no confirmation can be missed.
  auto stream = controller_.StreamJobEvents(deployment.app_id, 0, &controller_error);
  if (!stream) {
    failure = {DeployErrorKind::kController, "open job event stream: " + controller_error};
    RecordFailure(deployment, deployment.new_release_id, {}, controller::JobState::kUp, failure);
    return SetError(error, failure.kind, failure.message);
  }
  StreamGuard guard(stream);

  controller::Formation current;
  if (!controller_.GetFormation(deployment.app_id, deployment.old_release_id, &current,
                                &controller_error)) {
    failure = {DeployErrorKind::kController, "read old formation: " + controller_error};
    RecordFailure(deployment, deployment.old_release_id, {}, controller::JobState::kUp, failure);
    return SetError(error, failure.kind, failure.message);
  }

  const Plan plan = BuildPlan(MakeStrategy(deployment.strategy), deployment, current);
  std::cerr << "[deployer] deployment " << deployment.id << " app=" << deployment.app_id
            << " strategy=" << controller::StrategyName(deployment.strategy)
            << " steps=" << plan.size() << "\n";

  for (std::size_t i = 0; i < plan.size(); ++i) {
    const auto& step = plan[i];
    const bool last_step = i + 1 == plan.size();
    if (stop.stop_requested()) {
      return SetError(error, DeployErrorKind::kCancelled, "deployment cancelled");
    }
    if (!controller_.PutFormation(step.formation, &controller_error)) {
      failure = {DeployErrorKind::kController, "write formation for release " +
                                                    step.release_id + ": " + controller_error};
      const auto& [type, states] = *step.expected.begin();
      RecordFailure(deployment, step.release_id, type, states.begin()->first, failure);
      return SetError(error, failure.kind, failure.message);
    }

    WaitOptions options;
    options.release_id = step.release_id;
    auto result = WaitForJobEvents(*stream, step.expected, options, stop);
    if (!result.ok) {
      failure = {KindForWait(result.failure), result.message};
      if (failure.kind == DeployErrorKind::kCancelled) {
        return SetError(error, failure.kind, failure.message);
      }
      if (failure.kind == DeployErrorKind::kCrashed && result.crash) {
        const auto& crash = *result.crash;
        RecordFailure(deployment, crash.release_id, crash.process_type, crash.state, failure);
        DeployError finish_error;
        if (!Finish(deployment, &finish_error)) {
          std::cerr << "[deployer] warn: deployment " << deployment.id
                    << " crashed but could not be marked finished: " << finish_error.message
                    << "\n";
        }
      } else {
        RecordFailure(deployment, step.release_id, result.unmet_type,
                      result.unmet_state.value_or(controller::JobState::kUp), failure);
      }
      return SetError(error, failure.kind, failure.message);
    }

    for (std::size_t m = 0; m < result.matched.size(); ++m) {
      const bool final_event = last_step && m + 1 == result.matched.size();
      if (!Emit(deployment, result.matched[m],
                final_event ? controller::DeploymentStatus::kComplete
                            : controller::DeploymentStatus::kRunning,
                error)) {
        return false;
      }
    }
  }

  if (!Finish(deployment, error)) {
    return false;
  }
  std::cerr << "[deployer] deployment " << deployment.id << " complete\n";
  return true;
}

bool StrategyEngine::Emit(const controller::Deployment& deployment,
                          const controller::JobEvent& confirmed,
                          controller::DeploymentStatus status, DeployError* error) {
  controller::DeploymentEvent event;
  event.deployment_id = deployment.id;
  event.release_id = confirmed.release_id;
  event.job_type = confirmed.process_type;
  event.job_state = confirmed.state;
  event.status = status;
  storage::StoreError store_error;
  if (!log_.Append(&event, &store_error)) {
    return SetError(error, DeployErrorKind::kLog,
                    "append deployment event: " + store_error.message);
  }
  return true;
}

void StrategyEngine::RecordFailure(const controller::Deployment& deployment,
                                   const std::string& release_id, const std::string& job_type,
                                   controller::JobState job_state, const DeployError& failure) {
  std::cerr << "[deployer] warn: deployment " << deployment.id << " failed ("
            << DeployErrorKindName(failure.kind) << "): " << failure.message << "\n";
  controller::DeploymentEvent event;
  event.deployment_id = deployment.id;
  event.release_id = release_id;
  event.job_type = job_type;
  event.job_state = job_state;
  event.status = controller::DeploymentStatus::kFailed;
  event.error = failure.message;
  storage::StoreError store_error;
  if (!log_.Append(&event, &store_error)) {
    std::cerr << "[deployer] warn: could not record failure of deployment " << deployment.id
              << ": " << store_error.message << "\n";
  }
}

bool StrategyEngine::Finish(const controller::Deployment& deployment, DeployError* error) {
  storage::StoreError store_error;
  if (!repo_.MarkFinished(deployment.id, util::NowMillis(), &store_error)) {
    return SetError(error, DeployErrorKind::kLog,
                    "mark deployment finished: " + store_error.message);
  }
  return true;
}

}  // namespace rollout::deployer
