#include <sys/resource.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "notify/wakeup_bus.hpp"
#include "storage/event_log.hpp"

using rollout::controller::DeploymentEvent;
using rollout::controller::DeploymentStatus;
using rollout::controller::JobState;
using rollout::storage::DeploymentEventLog;
using rollout::storage::StoreError;
using rollout::storage::StoreErrorKind;

namespace {

std::filesystem::path MakeTempDir(const std::string& name) {
  const auto base = std::filesystem::temp_directory_path();
  const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
  const auto dir = base / ("rollout_event_log_tests_" + name + "_" + std::to_string(suffix));
  std::filesystem::create_directories(dir);
  return dir;
}

DeploymentEvent MakeEvent(const std::string& deployment_id, JobState state) {
  DeploymentEvent event;
  event.deployment_id = deployment_id;
  event.release_id = "release";
  event.job_type = "web";
  event.job_state = state;
  event.status = DeploymentStatus::kRunning;
  return event;
}

bool AppendOrFail(DeploymentEventLog& log, DeploymentEvent event, std::uint64_t* id = nullptr) {
  StoreError error;
  if (!log.Append(&event, &error)) {
    std::cerr << "append failed: " << error.message << "\n";
    return false;
  }
  if (id) {
    *id = event.id;
  }
  return true;
}

bool TestConcurrentAppendsGetUniqueIds() {
  const auto dir = MakeTempDir("concurrent");
  DeploymentEventLog log(dir / "events.log", rollout::notify::WakeupBus::Create());
  StoreError error;
  if (!log.Open(&error)) {
    std::cerr << "open failed: " << error.message << "\n";
    return false;
  }
  constexpr int kThreads = 4;
  constexpr int kPerThread = 25;
  std::vector<std::vector<std::uint64_t>> ids(kThreads);
  {
    std::vector<std::jthread> writers;
    for (int t = 0; t < kThreads; ++t) {
      writers.emplace_back([&log, &ids, t] {
        for (int i = 0; i < kPerThread; ++i) {
          DeploymentEvent event = MakeEvent("deployment-" + std::to_string(t), JobState::kUp);
          StoreError append_error;
          if (log.Append(&event, &append_error)) {
            ids[t].push_back(event.id);
          }
        }
      });
    }
  }
  std::set<std::uint64_t> all;
  for (const auto& per_thread : ids) {
    for (std::size_t i = 1; i < per_thread.size(); ++i) {
      if (per_thread[i] <= per_thread[i - 1]) {
        std::cerr << "ids from one writer are not increasing\n";
        return false;
      }
    }
    all.insert(per_thread.begin(), per_thread.end());
  }
  if (all.size() != kThreads * kPerThread || *all.begin() != 1 ||
      *all.rbegin() != kThreads * kPerThread) {
    std::cerr << "expected ids 1.." << kThreads * kPerThread << " without duplicates\n";
    return false;
  }
  std::vector<DeploymentEvent> events;
  if (!log.ListSince("deployment-2", 0, &events, &error) || events.size() != kPerThread) {
    std::cerr << "per-deployment listing incomplete\n";
    return false;
  }
  std::filesystem::remove_all(dir);
  return true;
}

bool TestReopenContinuesSequence() {
  const auto dir = MakeTempDir("reopen");
  const auto path = dir / "events.log";
  {
    DeploymentEventLog log(path, nullptr);
    StoreError error;
    if (!log.Open(&error) || !AppendOrFail(log, MakeEvent("a", JobState::kUp)) ||
        !AppendOrFail(log, MakeEvent("b", JobState::kDown))) {
      return false;
    }
  }
  DeploymentEventLog reopened(path, nullptr);
  StoreError error;
  if (!reopened.Open(&error)) {
    std::cerr << "reopen failed: " << error.message << "\n";
    return false;
  }
  if (reopened.LastId() != 2 || !reopened.HasEvents("a") || reopened.HasEvents("c")) {
    std::cerr << "index not rebuilt on reopen\n";
    return false;
  }
  std::uint64_t id = 0;
  if (!AppendOrFail(reopened, MakeEvent("a", JobState::kDown), &id) || id != 3) {
    std::cerr << "ids must not be reused after reopen\n";
    return false;
  }
  std::vector<DeploymentEvent> events;
  if (!reopened.ListSince("a", 0, &events, &error) || events.size() != 2 ||
      events[0].id != 1 || events[1].id != 3 || events[1].job_state != JobState::kDown) {
    std::cerr << "unexpected listing after reopen\n";
    return false;
  }
  std::filesystem::remove_all(dir);
  return true;
}

bool TestTornTailIsCut() {
  const auto dir = MakeTempDir("torn");
  const auto path = dir / "events.log";
  {
    DeploymentEventLog log(path, nullptr);
    StoreError error;
    if (!log.Open(&error) || !AppendOrFail(log, MakeEvent("a", JobState::kUp))) {
      return false;
    }
  }
  const auto intact = std::filesystem::file_size(path);
  {
    // Half a record header, as left by a crash mid-append.
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out.write("RVE1\x10", 5);
  }
  DeploymentEventLog log(path, nullptr);
  StoreError error;
  if (!log.Open(&error)) {
    std::cerr << "torn tail should not fail open: " << error.message << "\n";
    return false;
  }
  if (std::filesystem::file_size(path) != intact) {
    std::cerr << "torn tail was not truncated\n";
    return false;
  }
  std::uint64_t id = 0;
  if (!AppendOrFail(log, MakeEvent("a", JobState::kDown), &id) || id != 2) {
    return false;
  }
  DeploymentEvent read_back;
  if (!log.GetByID(2, &read_back, &error) || read_back.job_state != JobState::kDown) {
    std::cerr << "append after truncation not readable\n";
    return false;
  }
  std::filesystem::remove_all(dir);
  return true;
}

bool TestCorruptRecordIsReported() {
  const auto dir = MakeTempDir("corrupt");
  const auto path = dir / "events.log";
  {
    DeploymentEventLog log(path, nullptr);
    StoreError error;
    if (!log.Open(&error) || !AppendOrFail(log, MakeEvent("a", JobState::kUp)) ||
        !AppendOrFail(log, MakeEvent("a", JobState::kDown))) {
      return false;
    }
  }
  {
    // Flip one payload byte of the first record.
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    file.seekg(8 + 32 + 2);
    char byte = 0;
    file.read(&byte, 1);
    byte = static_cast<char>(byte ^ 0x01);
    file.seekp(8 + 32 + 2);
    file.write(&byte, 1);
  }
  DeploymentEventLog log(path, nullptr);
  StoreError error;
  if (log.Open(&error) || error.kind != StoreErrorKind::kCorrupt) {
    std::cerr << "checksum mismatch should be reported as corrupt\n";
    return false;
  }
  std::filesystem::remove_all(dir);
  return true;
}

bool TestLookupsAndWakeups() {
  const auto dir = MakeTempDir("lookup");
  auto bus = rollout::notify::WakeupBus::Create();
  DeploymentEventLog log(dir / "events.log", bus);
  StoreError error;
  if (!log.Open(&error)) {
    return false;
  }
  std::string subscribe_error;
  auto subscription =
      bus->Subscribe(DeploymentEventLog::ChannelFor("a"), 16, &subscribe_error);
  if (!subscription) {
    std::cerr << "subscribe failed: " << subscribe_error << "\n";
    return false;
  }
  std::uint64_t first = 0;
  if (!AppendOrFail(log, MakeEvent("a", JobState::kUp), &first) ||
      !AppendOrFail(log, MakeEvent("b", JobState::kUp)) ||
      !AppendOrFail(log, MakeEvent("a", JobState::kDown))) {
    return false;
  }
  DeploymentEvent missing;
  if (log.GetByID(42, &missing, &error) || error.kind != StoreErrorKind::kNotFound) {
    std::cerr << "GetByID should report kNotFound for unknown ids\n";
    return false;
  }
  std::vector<DeploymentEvent> events;
  if (!log.ListSince("a", first, &events, &error) || events.size() != 1 || events[0].id != 3) {
    std::cerr << "ListSince should return only later events of the deployment\n";
    return false;
  }
  if (!log.ListSince("nobody", 0, &events, &error) || !events.empty()) {
    std::cerr << "unknown deployment should list nothing\n";
    return false;
  }

  using Kind = rollout::notify::Subscription::Kind;
  std::vector<std::string> payloads;
  rollout::notify::Subscription::Message message;
  while (subscription->Next(&message, std::chrono::milliseconds(50)) ==
         rollout::notify::Subscription::WaitStatus::kMessage) {
    if (message.kind == Kind::kNotify) {
      payloads.push_back(message.payload);
    }
  }
  if (payloads != std::vector<std::string>{"1", "3"}) {
    std::cerr << "wake-ups should carry the ids of the deployment's events\n";
    return false;
  }
  subscription->Close();
  std::filesystem::remove_all(dir);
  return true;
}

bool TestAppendRequiresOpenLog() {
  DeploymentEventLog log(std::filesystem::temp_directory_path() / "rollout_never_opened.log",
                         nullptr);
  DeploymentEvent event = MakeEvent("a", JobState::kUp);
  StoreError error;
  if (log.Append(&event, &error)) {
    std::cerr << "append before open should fail\n";
    return false;
  }
  event.deployment_id.clear();
  if (log.Append(&event, &error) || error.kind != StoreErrorKind::kInvalid) {
    std::cerr << "event without deployment id should be rejected\n";
    return false;
  }
  return true;
}

bool TestFailedAppendIsRolledBack() {
  const auto dir = MakeTempDir("rollback");
  const auto path = dir / "events.log";
  std::uint64_t first = 0;
  std::uint64_t second = 0;
  {
    DeploymentEventLog log(path, nullptr);
    StoreError error;
    if (!log.Open(&error) || !AppendOrFail(log, MakeEvent("a", JobState::kUp), &first)) {
      return false;
    }
    // Cap the file size partway into the next frame so the write is short.
    std::signal(SIGXFSZ, SIG_IGN);
    rlimit saved{};
    if (getrlimit(RLIMIT_FSIZE, &saved) != 0) {
      std::cerr << "getrlimit failed\n";
      return false;
    }
    rlimit capped = saved;
    capped.rlim_cur = static_cast<rlim_t>(std::filesystem::file_size(path) + 60);
    if (setrlimit(RLIMIT_FSIZE, &capped) != 0) {
      std::cerr << "setrlimit failed\n";
      return false;
    }
    DeploymentEvent event = MakeEvent("a", JobState::kDown);
    const bool appended = log.Append(&event, &error);
    setrlimit(RLIMIT_FSIZE, &saved);
    if (appended || error.kind != StoreErrorKind::kIo) {
      std::cerr << "append past the file size limit should fail\n";
      return false;
    }
    if (!AppendOrFail(log, MakeEvent("a", JobState::kDown), &second) || second != first + 1) {
      std::cerr << "append after a failed one should take the next id\n";
      return false;
    }
  }
  DeploymentEventLog reopened(path, nullptr);
  StoreError error;
  if (!reopened.Open(&error)) {
    std::cerr << "reopen after a failed append: " << error.message << "\n";
    return false;
  }
  std::vector<DeploymentEvent> events;
  if (!reopened.ListSince("a", 0, &events, &error) || events.size() != 2 ||
      events[0].id != first || events[1].id != second ||
      events[1].job_state != JobState::kDown) {
    std::cerr << "log should hold exactly the two successful appends\n";
    return false;
  }
  std::filesystem::remove_all(dir);
  return true;
}

}  // namespace

int main() {
  if (!TestConcurrentAppendsGetUniqueIds()) {
    return EXIT_FAILURE;
  }
  if (!TestReopenContinuesSequence()) {
    return EXIT_FAILURE;
  }
  if (!TestTornTailIsCut()) {
    return EXIT_FAILURE;
  }
  if (!TestCorruptRecordIsReported()) {
    return EXIT_FAILURE;
  }
  if (!TestLookupsAndWakeups()) {
    return EXIT_FAILURE;
  }
  if (!TestAppendRequiresOpenLog()) {
    return EXIT_FAILURE;
  }
  if (!TestFailedAppendIsRolledBack()) {
    return EXIT_FAILURE;
  }
  std::cout << "event_log_tests: OK\n";
  return EXIT_SUCCESS;
}
