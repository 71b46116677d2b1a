#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "controller/client.hpp"
#include "queue/work_queue.hpp"
#include "storage/deployment_repo.hpp"
#include "storage/event_log.hpp"

namespace rollout::deployer {

struct WorkerOptions {
  std::size_t threads{2};
  std::chrono::milliseconds lease{std::chrono::minutes(10)};
};

// Pool of threads that lease Deployment jobs and run them through the
// StrategyEngine. Each deployment runs entirely on the thread that leased
// it, which renews the job lease until the run ends; stopping the pool
// cancels in-flight waits.
class DeploymentWorker {
 public:
  struct Stats {
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t skipped{0};
  };

  DeploymentWorker(queue::WorkQueue& queue, storage::DeploymentRepo& repo,
                   storage::DeploymentEventLog& log, controller::ControllerClient& controller,
                   WorkerOptions options);
  ~DeploymentWorker();

  DeploymentWorker(const DeploymentWorker&) = delete;
  DeploymentWorker& operator=(const DeploymentWorker&) = delete;

  void Start();
  void Stop();

  // Handles one leased job. Exposed for tests that drive the queue by hand.
  void RunJob(const queue::WorkJob& job, std::stop_token stop);

  Stats GetStats() const;

 private:
  void Loop(std::stop_token stop);
  void Heartbeat(std::uint64_t job_id, std::stop_token stop);
  void FailJob(const queue::WorkJob& job, const std::string& message);

  queue::WorkQueue& queue_;
  storage::DeploymentRepo& repo_;
  storage::DeploymentEventLog& log_;
  controller::ControllerClient& controller_;
  WorkerOptions options_;
  std::vector<std::jthread> threads_;
  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> skipped_{0};
};

}  // namespace rollout::deployer
