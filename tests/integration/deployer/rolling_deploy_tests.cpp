#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "controller/formation_store.hpp"
#include "controller/job_event_hub.hpp"
#include "deployer/worker.hpp"
#include "nlohmann/json.hpp"
#include "notify/wakeup_bus.hpp"
#include "queue/work_queue.hpp"
#include "rpc/server.hpp"
#include "storage/deployment_repo.hpp"
#include "storage/event_log.hpp"
#include "stream/live_tail.hpp"
#include "tests/unit/deployer/simulated_scheduler.hpp"

using rollout::controller::DeploymentEvent;
using rollout::controller::DeploymentStatus;
using rollout::controller::Formation;
using rollout::controller::JobState;
using namespace std::chrono_literals;

namespace {

std::filesystem::path MakeTempDir(const std::string& name) {
  const auto base = std::filesystem::temp_directory_path();
  const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
  const auto dir = base / ("rollout_rolling_deploy_" + name + "_" + std::to_string(suffix));
  std::filesystem::create_directories(dir);
  return dir;
}

// Collects a tail's events and stops it on the first terminal status.
class TerminalSink : public rollout::stream::EventSink {
 public:
  explicit TerminalSink(std::stop_source* stop) : stop_(stop) {}

  bool SendEvent(const DeploymentEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    if (event.status == DeploymentStatus::kComplete || event.status == DeploymentStatus::kFailed) {
      stop_->request_stop();
    }
    return true;
  }

  bool SendKeepAlive() override { return true; }

  std::vector<DeploymentEvent> Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

 private:
  std::stop_source* stop_;
  mutable std::mutex mutex_;
  std::vector<DeploymentEvent> events_;
};

struct Service {
  explicit Service(const std::string& name)
      : dir(MakeTempDir(name)),
        bus(rollout::notify::WakeupBus::Create()),
        log(dir / "deployment_events.log", bus),
        queue(dir / "queue.json"),
        repo(dir / "deployments.json", queue),
        formations(dir / "formations.json"),
        scheduler(formations, hub),
        rpc(repo, log, scheduler, hub, queue, bus, {}),
        worker(queue, repo, log, scheduler, DefaultWorkerOptions()) {}

  ~Service() {
    worker.Stop();
    queue.Close();
    bus->Shutdown();
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  static rollout::deployer::WorkerOptions DefaultWorkerOptions() {
    rollout::deployer::WorkerOptions options;
    options.threads = 2;
    options.lease = 30s;
    return options;
  }

  bool Open() {
    rollout::storage::StoreError error;
    std::string load_error;
    if (!log.Open(&error) || !queue.Load(&error) || !repo.Load(&error)) {
      std::cerr << "store open failed: " << error.message << "\n";
      return false;
    }
    if (!formations.Load(&load_error)) {
      std::cerr << "formation load failed: " << load_error << "\n";
      return false;
    }
    worker.Start();
    return true;
  }

  nlohmann::json Call(const std::string& method, const nlohmann::json& params) {
    return rpc.Handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}, {"params", params}});
  }

  // Creates a deployment through the RPC surface and follows its events
  // until a terminal status arrives.
  bool Deploy(const std::string& old_release, const std::string& new_release,
              const std::string& strategy, std::string* id, std::vector<DeploymentEvent>* out) {
    const auto created = Call("createdeployment", {{"app_id", "shop"},
                                                   {"old_release_id", old_release},
                                                   {"new_release_id", new_release},
                                                   {"strategy", strategy}});
    if (!created.contains("result")) {
      std::cerr << "createdeployment failed: " << created.dump() << "\n";
      return false;
    }
    *id = created["result"].value("id", std::string{});
    std::stop_source stop;
    TerminalSink sink(&stop);
    rollout::stream::LiveTail tail(log, bus, *id, 0);
    std::jthread watchdog([&stop](std::stop_token cancelled) {
      const auto deadline = std::chrono::steady_clock::now() + 15s;
      while (!cancelled.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
      }
      stop.request_stop();
    });
    std::string error;
    tail.Run(sink, stop.get_token(), &error);
    *out = sink.Events();
    if (out->empty() || (out->back().status != DeploymentStatus::kComplete &&
                         out->back().status != DeploymentStatus::kFailed)) {
      std::cerr << "deployment " << *id << " did not reach a terminal status\n";
      return false;
    }
    return true;
  }

  // The terminal event is appended just before the record is marked
  // finished.
  nlohmann::json WaitFinished(const std::string& id) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    nlohmann::json result;
    while (std::chrono::steady_clock::now() < deadline) {
      result = Call("getdeployment", {{"id", id}}).value("result", nlohmann::json::object());
      if (result.contains("finished_at") && !result.at("finished_at").is_null()) {
        break;
      }
      std::this_thread::sleep_for(10ms);
    }
    return result;
  }

  int Count(const std::string& release, const std::string& type) {
    Formation formation;
    if (!formations.Get("shop", release, &formation)) {
      return -1;
    }
    const auto it = formation.processes.find(type);
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
  rollout::rpc::RpcServer rpc;
  rollout::deployer::DeploymentWorker worker;
};

bool TestOneByOneRollout() {
  Service service("one_by_one");
  if (!service.Open()) {
    return false;
  }
  if (!service.Call("putformation", {{"app_id", "shop"},
                                     {"release_id", "v1"},
                                     {"processes", {{"web", 3}}}})
           .contains("result")) {
    return false;
  }
  std::string id;
  std::vector<DeploymentEvent> events;
  if (!service.Deploy("v1", "v2", "one-by-one", &id, &events)) {
    return false;
  }
  if (events.size() != 6) {
    std::cerr << "expected 6 events for web=3, got " << events.size() << "\n";
    return false;
  }
  for (std::size_t i = 0; i < events.size(); ++i) {
    const bool up = i % 2 == 0;
    if (events[i].release_id != (up ? "v2" : "v1") ||
        events[i].job_state != (up ? JobState::kUp : JobState::kDown)) {
      std::cerr << "event " << i << " breaks the one-by-one alternation\n";
      return false;
    }
  }
  if (events.back().status != DeploymentStatus::kComplete) {
    std::cerr << "last event should be complete\n";
    return false;
  }
  if (service.Count("v2", "web") != 3 || service.Count("v1", "web") != 0) {
    std::cerr << "final formations should be v2=3 v1=0\n";
    return false;
  }
  const auto fetched = service.WaitFinished(id);
  if (fetched.value("status", "") != "complete" || !fetched.contains("finished_at") ||
      fetched.at("finished_at").is_null()) {
    std::cerr << "deployment record not finished: " << fetched.dump() << "\n";
    return false;
  }
  return true;
}

bool TestAllAtOnceWithCrash() {
  Service service("crash");
  if (!service.Open()) {
    return false;
  }
  if (!service.Call("putformation", {{"app_id", "shop"},
                                     {"release_id", "v1"},
                                     {"processes", {{"web", 2}, {"worker", 1}}}})
           .contains("result")) {
    return false;
  }
  service.scheduler.CrashType("worker");
  std::string id;
  std::vector<DeploymentEvent> events;
  if (!service.Deploy("v1", "v2", "all-at-once", &id, &events)) {
    return false;
  }
  const auto& last = events.back();
  if (last.status != DeploymentStatus::kFailed || last.job_state != JobState::kCrashed ||
      last.job_type != "worker" || last.error.empty()) {
    std::cerr << "crash should end the deployment with a failed event\n";
    return false;
  }
  // Nothing is rolled back; the old release is never scaled down.
  if (service.Count("v1", "web") != 2) {
    std::cerr << "old release should be untouched after the crash\n";
    return false;
  }
  const auto fetched = service.WaitFinished(id);
  if (fetched.value("status", "") != "failed" || !fetched.contains("finished_at") ||
      fetched.at("finished_at").is_null()) {
    std::cerr << "crashed deployment should be failed and finished\n";
    return false;
  }
  // The worker parks the job once the engine reports the crash.
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (std::chrono::steady_clock::now() < deadline) {
    const auto jobs = service.queue.Snapshot();
    if (jobs.size() == 1 && jobs[0].dead) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  std::cerr << "failed deployment job should be parked\n";
  return false;
}

}  // namespace

int main() {
  if (!TestOneByOneRollout()) {
    return EXIT_FAILURE;
  }
  if (!TestAllAtOnceWithCrash()) {
    return EXIT_FAILURE;
  }
  std::cout << "rolling_deploy_tests: OK\n";
  return EXIT_SUCCESS;
}
