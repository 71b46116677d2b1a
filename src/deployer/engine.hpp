#pragma once

#include <stop_token>
#include <string>
#include <string_view>

#include "controller/client.hpp"
#include "controller/types.hpp"
#include "storage/deployment_repo.hpp"
#include "storage/event_log.hpp"

namespace rollout::deployer {

enum class DeployErrorKind {
  kNone,
  kController,   // formation read/write or stream open failed
  kStream,       // job event stream reported an error
  kCrashed,      // the scheduler reported a crashed job
  kUnsatisfied,  // stream closed before the expected events arrived
  kLog,          // deployment event or record could not be written
  kCancelled,
};

std::string_view DeployErrorKindName(DeployErrorKind kind);

struct DeployError {
  DeployErrorKind kind{DeployErrorKind::kNone};
  std::string message;
};

// Runs one deployment: opens the app's job event stream, reads the old
// release's formation, builds the strategy's plan and executes it step by
// step (write formation, wait for confirmations, append one event per
// confirmation). Nothing is rolled back on failure.
//
// finished_at is set on success and on a crash. Other failures leave it
// unset so the deployment stays visibly unfinished; cancellation writes
// nothing at all.
class StrategyEngine {
 public:
  StrategyEngine(controller::ControllerClient& controller, storage::DeploymentEventLog& log,
                 storage::DeploymentRepo& repo);

  bool Execute(const controller::Deployment& deployment, std::stop_token stop,
               DeployError* error);

 private:
  bool Emit(const controller::Deployment& deployment, const controller::JobEvent& confirmed,
            controller::DeploymentStatus status, DeployError* error);
  void RecordFailure(const controller::Deployment& deployment, const std::string& release_id,
                     const std::string& job_type, controller::JobState job_state,
                     const DeployError& failure);
  bool Finish(const controller::Deployment& deployment, DeployError* error);

  controller::ControllerClient& controller_;
  storage::DeploymentEventLog& log_;
  storage::DeploymentRepo& repo_;
};

}  // namespace rollout::deployer
