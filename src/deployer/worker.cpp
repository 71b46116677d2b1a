#include "deployer/worker.hpp"

#include <condition_variable>
#include <iostream>
#include <mutex>

#include "deployer/engine.hpp"

namespace rollout::deployer {

DeploymentWorker::DeploymentWorker(queue::WorkQueue& queue, storage::DeploymentRepo& repo,
                                   storage::DeploymentEventLog& log,
                                   controller::ControllerClient& controller,
                                   WorkerOptions options)
    : queue_(queue), repo_(repo), log_(log), controller_(controller), options_(options) {
  if (options_.threads == 0) {
    options_.threads = 1;
  }
}

DeploymentWorker::~DeploymentWorker() { Stop(); }

void DeploymentWorker::Start() {
  if (!threads_.empty()) {
    return;
  }
  threads_.reserve(options_.threads);
  for (std::size_t i = 0; i < options_.threads; ++i) {
    threads_.emplace_back([this](std::stop_token stop) { Loop(stop); });
  }
}

void DeploymentWorker::Stop() {
  for (auto& thread : threads_) {
    thread.request_stop();
  }
  threads_.clear();  // joins
}

void DeploymentWorker::Loop(std::stop_token stop) {
  while (!stop.stop_requested()) {
    queue::WorkJob job;
    const auto status = queue_.Lease(storage::kDeploymentJobType, options_.lease, stop, &job);
    if (status != queue::WorkQueue::LeaseStatus::kLeased) {
      return;
    }
    RunJob(job, stop);
  }
}

void DeploymentWorker::RunJob(const queue::WorkJob& job, std::stop_token stop) {
  storage::StoreError store_error;
  std::string id;
  if (job.args.is_object() && job.args.contains("id") && job.args.at("id").is_string()) {
    id = job.args.at("id").get<std::string>();
  }
  if (id.empty()) {
    FailJob(job, "job args carry no deployment id");
    return;
  }

  controller::Deployment deployment;
  if (!repo_.Get(id, &deployment, &store_error)) {
    FailJob(job, store_error.message);
    return;
  }
  if (deployment.finished_at) {
    // Redelivered after the deployment already ran to completion.
    ++skipped_;
    if (!queue_.Complete(job.id, &store_error)) {
      std::cerr << "[worker] warn: failed to complete job " << job.id << ": "
                << store_error.message << "\n";
    }
    return;
  }
  if (log_.HasEvents(deployment.id)) {
    FailJob(job, "deployment " + deployment.id +
                     " was interrupted mid-run; formations may be mixed, not retrying");
    return;
  }

  StrategyEngine engine(controller_, log_, repo_);
  DeployError deploy_error;
  bool executed = false;
  {
    // The confirmation wait is unbounded; keep the lease alive meanwhile.
    std::jthread heartbeat([this, job_id = job.id](std::stop_token beat) {
      Heartbeat(job_id, beat);
    });
    executed = engine.Execute(deployment, stop, &deploy_error);
  }
  if (executed) {
    ++completed_;
    if (!queue_.Complete(job.id, &store_error)) {
      std::cerr << "[worker] warn: failed to complete job " << job.id << ": "
                << store_error.message << "\n";
    }
    return;
  }
  if (deploy_error.kind == DeployErrorKind::kCancelled) {
    // Leave the lease to expire; on restart the job is redelivered and
    // parked by the interrupted-run check above if it had progressed.
    std::cerr << "[worker] deployment " << deployment.id << " cancelled\n";
    queue_.Release(job.id);
    return;
  }
  FailJob(job, std::string(DeployErrorKindName(deploy_error.kind)) + ": " + deploy_error.message);
}

void DeploymentWorker::Heartbeat(std::uint64_t job_id, std::stop_token stop) {
  auto interval = options_.lease / 3;
  if (interval < std::chrono::milliseconds(10)) {
    interval = std::chrono::milliseconds(10);
  }
  std::mutex mutex;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(mutex);
  while (true) {
    cv.wait_for(lock, stop, interval, [] { return false; });
    if (stop.stop_requested()) {
      return;
    }
    storage::StoreError error;
    if (!queue_.Extend(job_id, options_.lease, &error)) {
      std::cerr << "[worker] warn: failed to extend lease of job " << job_id << ": "
                << error.message << "\n";
    }
  }
}

void DeploymentWorker::FailJob(const queue::WorkJob& job, const std::string& message) {
  ++failed_;
  std::cerr << "[worker] warn: job " << job.id << " failed: " << message << "\n";
  storage::StoreError store_error;
  if (!queue_.Fail(job.id, message, std::nullopt, &store_error)) {
    std::cerr << "[worker] warn: failed to record failure of job " << job.id << ": "
              << store_error.message << "\n";
  }
}

DeploymentWorker::Stats DeploymentWorker::GetStats() const {
  Stats stats;
  stats.completed = completed_.load();
  stats.failed = failed_.load();
  stats.skipped = skipped_.load();
  return stats;
}

}  // namespace rollout::deployer
