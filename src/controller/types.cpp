#include "controller/types.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace rollout::controller {

namespace {

util::Timestamp TimestampFromJson(const nlohmann::json& value, const char* field) {
  const auto text = value.get<std::string>();
  auto parsed = util::ParseRfc3339(text);
  if (!parsed) {
    throw std::invalid_argument(std::string("invalid timestamp for ") + field + ": " + text);
  }
  return *parsed;
}

JobState RequireJobState(const nlohmann::json& value) {
  const auto name = value.get<std::string>();
  auto state = ParseJobState(name);
  if (!state) {
    throw std::invalid_argument("unknown job state: " + name);
  }
  return *state;
}

}  // namespace

std::string_view JobStateName(JobState state) {
  switch (state) {
    case JobState::kStarting:
      return "starting";
    case JobState::kUp:
      return "up";
    case JobState::kDown:
      return "down";
    case JobState::kCrashed:
      return "crashed";
  }
  return "unknown";
}

std::optional<JobState> ParseJobState(std::string_view name) {
  if (name == "starting") return JobState::kStarting;
  if (name == "up") return JobState::kUp;
  if (name == "down") return JobState::kDown;
  if (name == "crashed") return JobState::kCrashed;
  return std::nullopt;
}

std::string_view StrategyName(StrategyKind kind) {
  switch (kind) {
    case StrategyKind::kOneByOne:
      return "one-by-one";
    case StrategyKind::kAllAtOnce:
      return "all-at-once";
  }
  return "unknown";
}

std::optional<StrategyKind> ParseStrategy(std::string_view name) {
  if (name == "one-by-one" || name.empty()) return StrategyKind::kOneByOne;
  if (name == "all-at-once") return StrategyKind::kAllAtOnce;
  return std::nullopt;
}

std::string_view DeploymentStatusName(DeploymentStatus status) {
  switch (status) {
    case DeploymentStatus::kPending:
      return "pending";
    case DeploymentStatus::kRunning:
      return "running";
    case DeploymentStatus::kComplete:
      return "complete";
    case DeploymentStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::optional<DeploymentStatus> ParseDeploymentStatus(std::string_view name) {
  if (name == "pending") return DeploymentStatus::kPending;
  if (name == "running") return DeploymentStatus::kRunning;
  if (name == "complete") return DeploymentStatus::kComplete;
  if (name == "failed") return DeploymentStatus::kFailed;
  return std::nullopt;
}

bool ValidateProcessCounts(const ProcessCounts& processes, std::string* error) {
  for (const auto& [type, count] : processes) {
    if (type.empty()) {
      if (error) {
        *error = "process type must not be empty";
      }
      return false;
    }
    if (count < 0) {
      if (error) {
        *error = "negative count for process type " + type;
      }
      return false;
    }
  }
  return true;
}

nlohmann::json FormationToJson(const Formation& formation) {
  nlohmann::json processes = nlohmann::json::object();
  for (const auto& [type, count] : formation.processes) {
    processes[type] = count;
  }
  return {
      {"app_id", formation.app_id},
      {"release_id", formation.release_id},
      {"processes", std::move(processes)},
  };
}

namespace {

int ProcessCountFromJson(const std::string& type, const nlohmann::json& count) {
  constexpr auto kMax = std::numeric_limits<int>::max();
  if (count.is_number_unsigned()) {
    if (count.get<std::uint64_t>() <= static_cast<std::uint64_t>(kMax)) {
      return static_cast<int>(count.get<std::uint64_t>());
    }
  } else if (count.is_number_integer()) {
    const auto value = count.get<std::int64_t>();
    if (value >= std::numeric_limits<int>::min() && value <= kMax) {
      return static_cast<int>(value);
    }
  } else {
    throw std::invalid_argument("process count for " + type + " must be an integer");
  }
  throw std::invalid_argument("process count for " + type + " is out of range");
}

}  // namespace

Formation FormationFromJson(const nlohmann::json& json) {
  Formation formation;
  formation.app_id = json.at("app_id").get<std::string>();
  formation.release_id = json.at("release_id").get<std::string>();
  if (json.contains("processes")) {
    for (const auto& [type, count] : json.at("processes").items()) {
      formation.processes[type] = ProcessCountFromJson(type, count);
    }
  }
  std::string error;
  if (!ValidateProcessCounts(formation.processes, &error)) {
    throw std::invalid_argument(error);
  }
  return formation;
}

nlohmann::json JobEventToJson(const JobEvent& event) {
  return {
      {"id", event.id},
      {"app_id", event.app_id},
      {"release_id", event.release_id},
      {"type", event.process_type},
      {"state", std::string(JobStateName(event.state))},
      {"job_id", event.job_id},
  };
}

JobEvent JobEventFromJson(const nlohmann::json& json) {
  JobEvent event;
  event.id = json.value("id", std::uint64_t{0});
  event.app_id = json.at("app_id").get<std::string>();
  event.release_id = json.value("release_id", std::string{});
  event.process_type = json.at("type").get<std::string>();
  event.state = RequireJobState(json.at("state"));
  event.job_id = json.value("job_id", std::string{});
  return event;
}

nlohmann::json DeploymentToJson(const Deployment& deployment) {
  nlohmann::json json = {
      {"id", deployment.id},
      {"app_id", deployment.app_id},
      {"old_release_id", deployment.old_release_id},
      {"new_release_id", deployment.new_release_id},
      {"strategy", std::string(StrategyName(deployment.strategy))},
      {"created_at", util::FormatRfc3339(deployment.created_at)},
  };
  if (deployment.finished_at) {
    json["finished_at"] = util::FormatRfc3339(*deployment.finished_at);
  } else {
    json["finished_at"] = nullptr;
  }
  return json;
}

Deployment DeploymentFromJson(const nlohmann::json& json) {
  Deployment deployment;
  deployment.id = json.value("id", std::string{});
  deployment.app_id = json.at("app_id").get<std::string>();
  deployment.old_release_id = json.at("old_release_id").get<std::string>();
  deployment.new_release_id = json.at("new_release_id").get<std::string>();
  const auto strategy_name = json.value("strategy", std::string{});
  auto strategy = ParseStrategy(strategy_name);
  if (!strategy) {
    throw std::invalid_argument("unknown deployment strategy: " + strategy_name);
  }
  deployment.strategy = *strategy;
  if (json.contains("created_at") && !json.at("created_at").is_null()) {
    deployment.created_at = TimestampFromJson(json.at("created_at"), "created_at");
  }
  if (json.contains("finished_at") && !json.at("finished_at").is_null()) {
    deployment.finished_at = TimestampFromJson(json.at("finished_at"), "finished_at");
  }
  return deployment;
}

nlohmann::json DeploymentEventToJson(const DeploymentEvent& event) {
  nlohmann::json json = {
      {"id", event.id},
      {"deployment_id", event.deployment_id},
      {"release_id", event.release_id},
      {"job_type", event.job_type},
      {"job_state", std::string(JobStateName(event.job_state))},
      {"status", std::string(DeploymentStatusName(event.status))},
      {"created_at", util::FormatRfc3339(event.created_at)},
  };
  if (!event.error.empty()) {
    json["error"] = event.error;
  }
  return json;
}

DeploymentEvent DeploymentEventFromJson(const nlohmann::json& json) {
  DeploymentEvent event;
  event.id = json.at("id").get<std::uint64_t>();
  event.deployment_id = json.at("deployment_id").get<std::string>();
  event.release_id = json.value("release_id", std::string{});
  event.job_type = json.value("job_type", std::string{});
  event.job_state = RequireJobState(json.at("job_state"));
  const auto status_name = json.at("status").get<std::string>();
  auto status = ParseDeploymentStatus(status_name);
  if (!status) {
    throw std::invalid_argument("unknown deployment status: " + status_name);
  }
  event.status = *status;
  event.created_at = TimestampFromJson(json.at("created_at"), "created_at");
  event.error = json.value("error", std::string{});
  return event;
}

}  // namespace rollout::controller
