#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "controller/formation_store.hpp"
#include "controller/job_event_hub.hpp"
#include "controller/local_controller.hpp"
#include "deployer/engine.hpp"
#include "notify/wakeup_bus.hpp"
#include "queue/work_queue.hpp"
#include "storage/deployment_repo.hpp"
#include "storage/event_log.hpp"
#include "tests/unit/deployer/simulated_scheduler.hpp"

using rollout::controller::Deployment;
using rollout::controller::DeploymentEvent;
using rollout::controller::DeploymentStatus;
using rollout::controller::Formation;
using rollout::controller::JobState;
using rollout::controller::StrategyKind;
using rollout::deployer::DeployError;
using rollout::deployer::DeployErrorKind;
using rollout::deployer::StrategyEngine;

namespace {

std::filesystem::path MakeTempDir(const std::string& name) {
  const auto base = std::filesystem::temp_directory_path();
  const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
  const auto dir = base / ("rollout_engine_tests_" + name + "_" + std::to_string(suffix));
  std::filesystem::create_directories(dir);
  return dir;
}

struct Fixture {
  explicit Fixture(const std::string& name)
      : dir(MakeTempDir(name)),
        bus(rollout::notify::WakeupBus::Create()),
        log(dir / "events.log", bus),
        repo(dir / "deployments.json", queue),
        scheduler(formations, hub) {}

  ~Fixture() {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  bool Open() {
    rollout::storage::StoreError error;
    if (!log.Open(&error) || !repo.Load(&error)) {
      std::cerr << "fixture open failed: " << error.message << "\n";
      return false;
    }
    return true;
  }

  bool Seed(const std::string& release, int web) {
    std::string error;
    if (!formations.Put(Formation{"app", release, {{"web", web}}}, &error)) {
      std::cerr << "seed formation failed: " << error << "\n";
      return false;
    }
    return true;
  }

  bool AddDeployment(StrategyKind strategy, Deployment* out) {
    Deployment deployment;
    deployment.app_id = "app";
    deployment.old_release_id = "old";
    deployment.new_release_id = "new";
    deployment.strategy = strategy;
    rollout::storage::StoreError error;
    if (!repo.Add(&deployment, &error)) {
      std::cerr << "add deployment failed: " << error.message << "\n";
      return false;
    }
    *out = deployment;
    return true;
  }

  std::vector<DeploymentEvent> Events(const std::string& id) {
    std::vector<DeploymentEvent> events;
    rollout::storage::StoreError error;
    if (!log.ListSince(id, 0, &events, &error)) {
      std::cerr << "list events failed: " << error.message << "\n";
    }
    return events;
  }

  bool Finished(const std::string& id) {
    Deployment stored;
    rollout::storage::StoreError error;
    return repo.Get(id, &stored, &error) && stored.finished_at.has_value();
  }

  int WebCount(const std::string& release) {
    Formation formation;
    if (!formations.Get("app", release, &formation)) {
      return -1;
    }
    const auto it = formation.processes.find("web");
    return it == formation.processes.end() ? 0 : it->second;
  }

  std::filesystem::path dir;
  std::shared_ptr<rollout::notify::WakeupBus> bus;
  rollout::storage::DeploymentEventLog log;
  rollout::queue::WorkQueue queue;
  rollout::storage::DeploymentRepo repo;
  rollout::controller::FormationStore formations;
  rollout::controller::JobEventHub hub;
  rollout::testing::SimulatedScheduler scheduler;
};

bool TestOneByOneSuccess() {
  Fixture fx("one_by_one");
  Deployment deployment;
  if (!fx.Open() || !fx.Seed("old", 3) || !fx.AddDeployment(StrategyKind::kOneByOne, &deployment)) {
    return false;
  }
  StrategyEngine engine(fx.scheduler, fx.log, fx.repo);
  DeployError error;
  if (!engine.Execute(deployment, {}, &error)) {
    std::cerr << "deployment failed: " << error.message << "\n";
    return false;
  }
  const auto events = fx.Events(deployment.id);
  if (events.size() != 6) {
    std::cerr << "expected 6 deployment events, got " << events.size() << "\n";
    return false;
  }
  for (std::size_t i = 0; i < events.size(); ++i) {
    const bool start = i % 2 == 0;
    const auto& event = events[i];
    if (event.release_id != (start ? "new" : "old") || event.job_type != "web" ||
        event.job_state != (start ? JobState::kUp : JobState::kDown)) {
      std::cerr << "event " << i << " out of order\n";
      return false;
    }
    const auto want = i + 1 == events.size() ? DeploymentStatus::kComplete
                                             : DeploymentStatus::kRunning;
    if (event.status != want) {
      std::cerr << "event " << i << " has the wrong status\n";
      return false;
    }
    if (i > 0 && event.id <= events[i - 1].id) {
      std::cerr << "event ids not increasing\n";
      return false;
    }
  }
  if (!fx.Finished(deployment.id)) {
    std::cerr << "finished_at not set on success\n";
    return false;
  }
  if (fx.WebCount("new") != 3 || fx.WebCount("old") != 0) {
    std::cerr << "final formations are new=" << fx.WebCount("new")
              << " old=" << fx.WebCount("old") << "\n";
    return false;
  }
  return true;
}

bool TestAllAtOnceSuccess() {
  Fixture fx("all_at_once");
  Deployment deployment;
  if (!fx.Open() || !fx.Seed("old", 2) ||
      !fx.AddDeployment(StrategyKind::kAllAtOnce, &deployment)) {
    return false;
  }
  StrategyEngine engine(fx.scheduler, fx.log, fx.repo);
  DeployError error;
  if (!engine.Execute(deployment, {}, &error)) {
    std::cerr << "all-at-once deployment failed: " << error.message << "\n";
    return false;
  }
  const auto events = fx.Events(deployment.id);
  if (events.size() != 4 || events[0].job_state != JobState::kUp ||
      events[1].job_state != JobState::kUp || events[2].job_state != JobState::kDown ||
      events.back().status != DeploymentStatus::kComplete) {
    std::cerr << "unexpected all-at-once event sequence\n";
    return false;
  }
  if (fx.scheduler.Writes() != 2) {
    std::cerr << "all-at-once should write two formations\n";
    return false;
  }
  return true;
}

bool TestCrashFinishesWithFailure() {
  Fixture fx("crash");
  Deployment deployment;
  if (!fx.Open() || !fx.Seed("old", 2) || !fx.AddDeployment(StrategyKind::kOneByOne, &deployment)) {
    return false;
  }
  fx.scheduler.CrashType("web");
  StrategyEngine engine(fx.scheduler, fx.log, fx.repo);
  DeployError error;
  if (engine.Execute(deployment, {}, &error) || error.kind != DeployErrorKind::kCrashed) {
    std::cerr << "expected a crash failure\n";
    return false;
  }
  const auto events = fx.Events(deployment.id);
  if (events.size() != 1) {
    std::cerr << "expected exactly one failed event, got " << events.size() << "\n";
    return false;
  }
  const auto& failed = events[0];
  if (failed.status != DeploymentStatus::kFailed || failed.job_state != JobState::kCrashed ||
      failed.release_id != "new" || failed.job_type != "web" || failed.error.empty()) {
    std::cerr << "failed event does not describe the crash\n";
    return false;
  }
  if (!fx.Finished(deployment.id)) {
    std::cerr << "crash should set finished_at\n";
    return false;
  }
  // No rollback: the new formation keeps the instance that was requested.
  if (fx.WebCount("new") != 1 || fx.WebCount("old") != 2) {
    std::cerr << "formations changed after the crash\n";
    return false;
  }
  return true;
}

bool TestWriteFailureLeavesUnfinished() {
  Fixture fx("write_failure");
  Deployment deployment;
  if (!fx.Open() || !fx.Seed("old", 1) || !fx.AddDeployment(StrategyKind::kOneByOne, &deployment)) {
    return false;
  }
  fx.scheduler.FailWrites(true);
  StrategyEngine engine(fx.scheduler, fx.log, fx.repo);
  DeployError error;
  if (engine.Execute(deployment, {}, &error) || error.kind != DeployErrorKind::kController) {
    std::cerr << "expected a controller failure\n";
    return false;
  }
  const auto events = fx.Events(deployment.id);
  if (events.size() != 1 || events[0].status != DeploymentStatus::kFailed) {
    std::cerr << "write failure was not recorded\n";
    return false;
  }
  if (fx.Finished(deployment.id)) {
    std::cerr << "write failure must not set finished_at\n";
    return false;
  }
  return true;
}

bool TestMissingOldFormation() {
  Fixture fx("missing_formation");
  Deployment deployment;
  if (!fx.Open() || !fx.AddDeployment(StrategyKind::kOneByOne, &deployment)) {
    return false;
  }
  StrategyEngine engine(fx.scheduler, fx.log, fx.repo);
  DeployError error;
  if (engine.Execute(deployment, {}, &error) || error.kind != DeployErrorKind::kController) {
    std::cerr << "expected failure for a missing old formation\n";
    return false;
  }
  if (fx.scheduler.Writes() != 0) {
    std::cerr << "no formation should be written\n";
    return false;
  }
  return true;
}

bool TestEmptyPlanFinishes() {
  Fixture fx("empty_plan");
  Deployment deployment;
  if (!fx.Open() || !fx.Seed("old", 0) || !fx.AddDeployment(StrategyKind::kOneByOne, &deployment)) {
    return false;
  }
  StrategyEngine engine(fx.scheduler, fx.log, fx.repo);
  DeployError error;
  if (!engine.Execute(deployment, {}, &error)) {
    std::cerr << "empty deployment failed: " << error.message << "\n";
    return false;
  }
  if (!fx.Events(deployment.id).empty() || !fx.Finished(deployment.id)) {
    std::cerr << "empty deployment should finish without events\n";
    return false;
  }
  return true;
}

bool TestCancellationWritesNothing() {
  Fixture fx("cancel");
  Deployment deployment;
  if (!fx.Open() || !fx.Seed("old", 1) || !fx.AddDeployment(StrategyKind::kOneByOne, &deployment)) {
    return false;
  }
  // A controller that never reports job events.
  rollout::controller::LocalController silent(fx.formations, fx.hub);
  StrategyEngine engine(silent, fx.log, fx.repo);
  std::stop_source source;
  std::jthread canceller([&source] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    source.request_stop();
  });
  DeployError error;
  if (engine.Execute(deployment, source.get_token(), &error) ||
      error.kind != DeployErrorKind::kCancelled) {
    std::cerr << "expected cancellation\n";
    return false;
  }
  if (!fx.Events(deployment.id).empty() || fx.Finished(deployment.id)) {
    std::cerr << "cancellation must not write events or finish the deployment\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestOneByOneSuccess()) {
    return EXIT_FAILURE;
  }
  if (!TestAllAtOnceSuccess()) {
    return EXIT_FAILURE;
  }
  if (!TestCrashFinishesWithFailure()) {
    return EXIT_FAILURE;
  }
  if (!TestWriteFailureLeavesUnfinished()) {
    return EXIT_FAILURE;
  }
  if (!TestMissingOldFormation()) {
    return EXIT_FAILURE;
  }
  if (!TestEmptyPlanFinishes()) {
    return EXIT_FAILURE;
  }
  if (!TestCancellationWritesNothing()) {
    return EXIT_FAILURE;
  }
  std::cout << "engine_tests: OK\n";
  return EXIT_SUCCESS;
}
