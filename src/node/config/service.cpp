#include "config/service.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace rollout::config {

namespace {

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

std::string NormalizeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::uint16_t ParsePort(const std::string& value) {
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid port '" + value + "' (expected 1-65535)");
  }
  if (parsed == 0 || parsed > 65535) {
    throw std::runtime_error("invalid port '" + value + "' (out of range)");
  }
  return static_cast<std::uint16_t>(parsed);
}

std::uint64_t ParseCount(const std::string& value, const char* what) {
  try {
    std::size_t consumed = 0;
    const auto parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception&) {
    throw std::runtime_error(std::string("invalid ") + what + " '" + value + "'");
  }
}

void PrintUsage() {
  std::cout << "rolloutd options:\n"
            << "  --data-dir <path>            Base data directory (default: ~/.rollout)\n"
            << "  --rpc-bind <addr>            RPC bind address (default: 127.0.0.1)\n"
            << "  --rpc-port <port>            RPC port (default: 7480)\n"
            << "  --rpc-user <name>            RPC basic auth user\n"
            << "  --rpc-pass <secret>          RPC basic auth password\n"
            << "  --rpc-pass-env <name>        Env var containing the RPC password\n"
            << "  --rpc-allow-ip <addr>        Allow specific client IP (repeatable). Default: loopback only\n"
            << "  --rpc-require-auth <0|1>     Require HTTP basic auth (default: 1)\n"
            << "  --workers <n>                Deployment worker threads (default: 2)\n"
            << "  --job-lease-seconds <sec>    Lease held on a running deployment job (default: 600)\n"
            << "  --keep-alive-seconds <sec>   Event stream keep-alive interval (default: 30)\n"
            << "  --max-stream-clients <n>     Concurrent event stream connections (default: 32)\n"
            << "  --job-event-history <n>      Job events retained per app for resume (default: 1024)\n"
            << "  --debug-log <path>           Append structured logs to the given file\n"
            << "  --log-level <lvl>            Log level: debug, info, warn, error (default: info)\n"
            << "  --log-max-size-mb <mb>       Rotate debug log after approximately <mb> megabytes (0=disable)\n"
            << "  --log-max-files <n>          Number of rotated debug log files to keep (default: 0)\n"
            << "  --conf <path>                Load options from rollout.conf (default: ./rollout.conf)\n"
            << "  --no-conf                    Disable config file loading\n";
}

}  // namespace

std::filesystem::path ServiceConfig::FormationsPath() const {
  return std::filesystem::path(data_dir) / "formations.json";
}

std::filesystem::path ServiceConfig::DeploymentsPath() const {
  return std::filesystem::path(data_dir) / "deployments.json";
}

std::filesystem::path ServiceConfig::EventLogPath() const {
  return std::filesystem::path(data_dir) / "deployment_events.log";
}

std::filesystem::path ServiceConfig::QueuePath() const {
  return std::filesystem::path(data_dir) / "queue.json";
}

bool ParseBool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value, ServiceConfig* cfg) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "datadir" || key == "datadirectory") {
    cfg->data_dir = value;
  } else if (key == "rpcbind") {
    cfg->rpc_bind = value;
  } else if (key == "rpcport") {
    cfg->rpc_port = ParsePort(value);
  } else if (key == "rpcuser") {
    cfg->rpc_user = value;
  } else if (key == "rpcpassword" || key == "rpcpass") {
    cfg->rpc_pass = value;
  } else if (key == "rpcpassenv") {
    cfg->rpc_pass_env = value;
  } else if (key == "rpcallowip") {
    cfg->rpc_allow.push_back(value);
  } else if (key == "rpcrequireauth") {
    cfg->rpc_require_auth = ParseBool(value);
  } else if (key == "workers") {
    cfg->workers = static_cast<std::size_t>(ParseCount(value, "worker count"));
  } else if (key == "jobleaseseconds") {
    cfg->job_lease_seconds = ParseCount(value, "job lease");
  } else if (key == "keepaliveseconds") {
    cfg->keep_alive_seconds = ParseCount(value, "keep-alive interval");
  } else if (key == "maxstreamclients") {
    cfg->max_stream_clients = static_cast<std::size_t>(ParseCount(value, "stream client limit"));
  } else if (key == "jobeventhistory") {
    cfg->job_event_history = static_cast<std::size_t>(ParseCount(value, "job event history"));
  } else if (key == "debuglog") {
    cfg->debug_log_path = value;
  } else if (key == "loglevel") {
    cfg->log_level = value;
  } else if (key == "logmaxsizemb") {
    cfg->log_max_size_mb = static_cast<std::size_t>(ParseCount(value, "log size"));
  } else if (key == "logmaxfiles") {
    cfg->log_max_files = static_cast<std::size_t>(ParseCount(value, "log file count"));
  } else if (key == "config" || key == "conf") {
    cfg->config_path = value;
  } else {
    std::cerr << "[rolloutd] warn: unknown config key '" << raw_key << "'\n";
  }
}

void LoadConfigFile(const std::filesystem::path& path, ServiceConfig* cfg) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplyConfigOption(key, value, cfg);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(ServiceConfig* cfg) {
  // Each variable maps onto the config key of the same name, so the parsing
  // rules match the config file exactly.
  static constexpr std::pair<const char*, const char*> kVariables[] = {
      {"ROLLOUT_DATA_DIR", "datadir"},
      {"ROLLOUT_RPC_BIND", "rpcbind"},
      {"ROLLOUT_RPC_PORT", "rpcport"},
      {"ROLLOUT_RPC_USER", "rpcuser"},
      {"ROLLOUT_RPC_PASS", "rpcpass"},
      {"ROLLOUT_RPC_PASS_ENV", "rpcpassenv"},
      {"ROLLOUT_RPC_REQUIRE_AUTH", "rpcrequireauth"},
      {"ROLLOUT_WORKERS", "workers"},
      {"ROLLOUT_JOB_LEASE_SECONDS", "jobleaseseconds"},
      {"ROLLOUT_KEEP_ALIVE_SECONDS", "keepaliveseconds"},
      {"ROLLOUT_MAX_STREAM_CLIENTS", "maxstreamclients"},
      {"ROLLOUT_JOB_EVENT_HISTORY", "jobeventhistory"},
      {"ROLLOUT_DEBUG_LOG", "debuglog"},
      {"ROLLOUT_LOG_LEVEL", "loglevel"},
      {"ROLLOUT_LOG_MAX_SIZE_MB", "logmaxsizemb"},
      {"ROLLOUT_LOG_MAX_FILES", "logmaxfiles"},
  };
  for (const auto& [variable, key] : kVariables) {
    if (auto value = GetEnvValue(variable)) {
      try {
        ApplyConfigOption(key, *value, cfg);
      } catch (const std::exception& ex) {
        throw std::runtime_error(std::string(variable) + ": " + ex.what());
      }
    }
  }
  // Comma-separated list; replaces nothing, only adds.
  if (auto value = GetEnvValue("ROLLOUT_RPC_ALLOW_IP")) {
    std::string_view list = *value;
    while (!list.empty()) {
      const auto sep = list.find(',');
      const auto token = Trim(std::string(list.substr(0, sep)));
      if (!token.empty()) {
        cfg->rpc_allow.push_back(token);
      }
      if (sep == std::string_view::npos) {
        break;
      }
      list.remove_prefix(sep + 1);
    }
  }
}

std::filesystem::path DefaultDataDir() {
  if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
    if (xdg_data[0] != '\0') {
      return std::filesystem::path(xdg_data) / "rollout";
    }
  }
  if (const char* home = std::getenv("HOME")) {
    if (home[0] != '\0') {
      return std::filesystem::path(home) / ".rollout";
    }
  }
  return std::filesystem::path("data");
}

ServiceConfig ParseServiceConfig(int argc, char** argv) {
  ServiceConfig cfg;
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(std::move(token));
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for " + args[idx]);
    }
    return args[++idx];
  };

  // The config file location has to be known before anything else.
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      cfg.show_help = true;
      return cfg;
    }
    if (arg == "--conf") {
      cfg.config_path = ensure_value(i);
    } else if (arg == "--no-conf") {
      cfg.disable_config_file = true;
    }
  }

  if (!cfg.disable_config_file) {
    const std::filesystem::path config_path = cfg.config_path.empty()
                                                  ? std::filesystem::path("rollout.conf")
                                                  : std::filesystem::path(cfg.config_path);
    LoadConfigFile(config_path, &cfg);
  }

  ApplyEnvironmentOverrides(&cfg);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string arg = args[i];
    if (arg == "--conf") {
      ++i;
      continue;
    }
    if (arg == "--no-conf") {
      continue;
    }
    if (arg == "--rpc-allow-ip") {
      cfg.rpc_allow.push_back(ensure_value(i));
      continue;
    }
    if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
      throw std::runtime_error("unknown option: " + arg);
    }
    // Every remaining flag is the config key spelled with dashes.
    const std::string key = NormalizeKey(arg.substr(2));
    static const char* const kFlagKeys[] = {
        "datadir",          "rpcbind",         "rpcport",        "rpcuser",
        "rpcpass",          "rpcpassenv",      "rpcrequireauth", "workers",
        "jobleaseseconds",  "keepaliveseconds", "maxstreamclients", "jobeventhistory",
        "debuglog",         "loglevel",        "logmaxsizemb",   "logmaxfiles",
    };
    bool known = false;
    for (const char* candidate : kFlagKeys) {
      if (key == candidate) {
        known = true;
        break;
      }
    }
    if (!known) {
      throw std::runtime_error("unknown option: " + arg);
    }
    ApplyConfigOption(key, ensure_value(i), &cfg);
  }

  if (cfg.data_dir.empty()) {
    cfg.data_dir = DefaultDataDir().string();
  }
  if (cfg.rpc_pass.empty() && !cfg.rpc_pass_env.empty()) {
    if (const char* env = std::getenv(cfg.rpc_pass_env.c_str())) {
      cfg.rpc_pass = env;
    }
  }
  if (cfg.workers == 0) {
    throw std::runtime_error("workers must be at least 1");
  }
  if (cfg.job_lease_seconds == 0) {
    throw std::runtime_error("job lease must be at least 1 second");
  }
  if (cfg.keep_alive_seconds == 0) {
    throw std::runtime_error("keep-alive interval must be at least 1 second");
  }
  return cfg;
}

}  // namespace rollout::config
