#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace rollout::config {

inline constexpr std::uint16_t kDefaultRpcPort = 7480;

struct ServiceConfig {
  // Base directory for formations, deployments, the event log and the job
  // queue. Empty means the platform default (see DefaultDataDir).
  std::string data_dir;
  std::string rpc_bind{"127.0.0.1"};
  std::uint16_t rpc_port{kDefaultRpcPort};
  std::string rpc_user;
  std::string rpc_pass;
  std::string rpc_pass_env;
  std::vector<std::string> rpc_allow;
  bool rpc_require_auth{true};
  std::size_t workers{2};
  std::uint64_t job_lease_seconds{600};
  std::uint64_t keep_alive_seconds{30};
  std::size_t max_stream_clients{32};
  std::size_t job_event_history{1024};
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  std::string config_path;
  bool disable_config_file{false};
  bool show_help{false};

  std::filesystem::path FormationsPath() const;
  std::filesystem::path DeploymentsPath() const;
  std::filesystem::path EventLogPath() const;
  std::filesystem::path QueuePath() const;
};

// Accepts 1/0, true/false, yes/no, on/off; an empty value is true.
// Throws std::runtime_error on anything else.
bool ParseBool(const std::string& value);

// Applies one key=value setting. Keys are matched case-insensitively with
// '-' and '_' ignored, so "rpc-port", "rpc_port" and "rpcport" are the same.
// Unknown keys are reported on stderr and skipped.
void ApplyConfigOption(const std::string& raw_key, const std::string& value, ServiceConfig* cfg);

// Reads a rollout.conf file. A missing file is not an error.
void LoadConfigFile(const std::filesystem::path& path, ServiceConfig* cfg);

// ROLLOUT_* environment variables.
void ApplyEnvironmentOverrides(ServiceConfig* cfg);

std::filesystem::path DefaultDataDir();

// Builds the effective configuration from defaults, the config file, the
// environment and finally argv. Throws std::runtime_error on bad input.
ServiceConfig ParseServiceConfig(int argc, char** argv);

}  // namespace rollout::config
