#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"
#include "util/time.hpp"

namespace rollout::controller {

// Desired instance count per process type. Ordered so that iteration (and
// therefore every plan built from it) is lexicographic by type.
using ProcessCounts = std::map<std::string, int>;

struct Formation {
  std::string app_id;
  std::string release_id;
  ProcessCounts processes;
};

enum class JobState {
  kStarting,
  kUp,
  kDown,
  kCrashed,
};

struct JobEvent {
  std::uint64_t id{0};  // assigned by the event hub
  std::string app_id;
  std::string release_id;
  std::string process_type;
  JobState state{JobState::kStarting};
  std::string job_id;
};

enum class StrategyKind {
  kOneByOne,
  kAllAtOnce,
};

struct Deployment {
  std::string id;
  std::string app_id;
  std::string old_release_id;
  std::string new_release_id;
  StrategyKind strategy{StrategyKind::kOneByOne};
  util::Timestamp created_at{};
  std::optional<util::Timestamp> finished_at;
};

enum class DeploymentStatus {
  kPending,
  kRunning,
  kComplete,
  kFailed,
};

struct DeploymentEvent {
  std::uint64_t id{0};  // global log sequence, assigned on append
  std::string deployment_id;
  std::string release_id;
  std::string job_type;
  JobState job_state{JobState::kUp};
  DeploymentStatus status{DeploymentStatus::kRunning};
  util::Timestamp created_at{};
  std::string error;
};

std::string_view JobStateName(JobState state);
std::optional<JobState> ParseJobState(std::string_view name);

std::string_view StrategyName(StrategyKind kind);
std::optional<StrategyKind> ParseStrategy(std::string_view name);

std::string_view DeploymentStatusName(DeploymentStatus status);
std::optional<DeploymentStatus> ParseDeploymentStatus(std::string_view name);

// Validation shared by the stores and the RPC layer. Returns false and sets
// `error` for negative counts or empty type names.
bool ValidateProcessCounts(const ProcessCounts& processes, std::string* error);

// JSON codecs. The *FromJson variants throw std::invalid_argument (or a
// nlohmann::json::exception for structurally wrong input) on malformed data.
nlohmann::json FormationToJson(const Formation& formation);
Formation FormationFromJson(const nlohmann::json& json);

nlohmann::json JobEventToJson(const JobEvent& event);
JobEvent JobEventFromJson(const nlohmann::json& json);

nlohmann::json DeploymentToJson(const Deployment& deployment);
Deployment DeploymentFromJson(const nlohmann::json& json);

nlohmann::json DeploymentEventToJson(const DeploymentEvent& event);
DeploymentEvent DeploymentEventFromJson(const nlohmann::json& json);

}  // namespace rollout::controller
